#include "chunkstitch/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>

namespace chunkstitch::client
{

    namespace
    {
        spdlog::sink_ptr make_sink(const std::optional<std::filesystem::path> &path)
        {
            if (path)
            {
                try
                {
                    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true);
                }
                catch (const spdlog::spdlog_ex &ex)
                {
                    std::cerr << "[warning] logging disabled: " << ex.what() << std::endl;
                }
            }
            return std::make_shared<spdlog::sinks::null_sink_mt>();
        }
    } // namespace

    Logger::Logger(const std::optional<std::filesystem::path> &path)
        : logger_(std::make_shared<spdlog::logger>("client", make_sink(path)))
    {
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(spdlog::level::info);
    }

} // namespace chunkstitch::client
