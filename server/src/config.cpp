#include "chunkstitch/server/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace chunkstitch::server
{

    namespace
    {
        constexpr auto kDefaultDataDir = ".chunkstitch-data";
        constexpr auto kChunksDir = "chunks";
        constexpr auto kCompletedDir = "completed";

        std::filesystem::path default_root()
        {
            const char *home = std::getenv("HOME");
            if (home == nullptr || *home == '\0')
            {
                throw std::runtime_error("HOME is not set; pass --root");
            }
            return std::filesystem::path(home) / kDefaultDataDir;
        }
    } // namespace

    void apply_config_file(ServerConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }

        config.address = json.value("address", config.address);
        config.port = json.value("port", config.port);
        if (auto it = json.find("root"); it != json.end())
        {
            config.root = it->get<std::string>();
        }
        config.worker_threads = json.value("worker_threads", config.worker_threads);
        if (auto it = json.find("upload_timeout"); it != json.end())
        {
            config.upload_timeout = std::chrono::seconds(it->get<std::int64_t>());
        }
        if (auto it = json.find("max_artifact_size"); it != json.end() && !it->is_null())
        {
            config.max_artifact_size = it->get<std::uint64_t>();
        }
        if (auto it = json.find("log_file"); it != json.end() && !it->is_null())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
        config.log_level = json.value("log_level", config.log_level);

        auto &assembler = config.assembler;
        if (auto it = json.find("chunks_dir"); it != json.end())
        {
            assembler.chunks_dir = it->get<std::string>();
        }
        if (auto it = json.find("completed_dir"); it != json.end())
        {
            assembler.completed_dir = it->get<std::string>();
        }
        assembler.keep_completed_chunks = json.value("keep_completed_chunks", assembler.keep_completed_chunks);
        assembler.cleanup_threads = json.value("cleanup_threads", assembler.cleanup_threads);

        try
        {
            validate_config(config);
        }
        catch (const std::invalid_argument &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }
    }

    void validate_config(const ServerConfig &config)
    {
        // The idle sweep drops everything older than this, so it must leave room for a live upload.
        if (config.upload_timeout <= std::chrono::seconds::zero())
        {
            throw std::invalid_argument("upload_timeout must be positive, got " +
                                        std::to_string(config.upload_timeout.count()));
        }
    }

    void provision_directories(ServerConfig &config)
    {
        if (config.root.empty())
        {
            config.root = default_root();
        }
        if (config.assembler.chunks_dir.empty())
        {
            config.assembler.chunks_dir = config.root / kChunksDir;
        }
        if (config.assembler.completed_dir.empty())
        {
            config.assembler.completed_dir = config.root / kCompletedDir;
        }
        std::filesystem::create_directories(config.assembler.chunks_dir);
        std::filesystem::create_directories(config.assembler.completed_dir);
    }

} // namespace chunkstitch::server
