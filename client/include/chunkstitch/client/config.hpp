#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkstitch::client
{

    inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::filesystem::path file;
        std::size_t chunk_size{kDefaultChunkSize};
        std::optional<std::string> content_type;
        std::optional<std::string> upload_id;
        bool shuffle{false};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace chunkstitch::client
