#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkstitch::server
{

    struct AssemblerConfig
    {
        std::filesystem::path chunks_dir;
        std::filesystem::path completed_dir;
        // Leave staged chunks in place after combining (e.g. an external job removes them).
        bool keep_completed_chunks{false};
        std::size_t cleanup_threads{1};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::optional<std::uint64_t> max_artifact_size;
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        AssemblerConfig assembler;
    };

    // Overlays the keys present in a JSON config file onto `config`.
    void apply_config_file(ServerConfig &config, const std::filesystem::path &path);

    // Throws std::invalid_argument for settings the server cannot run with.
    void validate_config(const ServerConfig &config);

    // Fills empty directories with defaults ($HOME/.chunkstitch-data, <root>/chunks,
    // <root>/completed) and creates them.
    void provision_directories(ServerConfig &config);

} // namespace chunkstitch::server
