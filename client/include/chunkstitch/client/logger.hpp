#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace chunkstitch::client
{

    // Upload trace written to --log; silent when no path was given.
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        template <typename... Args>
        void info(spdlog::format_string_t<Args...> fmt, Args &&...args)
        {
            logger_->info(fmt, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(spdlog::format_string_t<Args...> fmt, Args &&...args)
        {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(spdlog::format_string_t<Args...> fmt, Args &&...args)
        {
            logger_->error(fmt, std::forward<Args>(args)...);
        }

        void flush() { logger_->flush(); }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace chunkstitch::client
