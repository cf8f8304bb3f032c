#include "chunkstitch/client/config.hpp"

#include <stdexcept>
#include <string>

#include "chunkstitch/framing.hpp"

namespace chunkstitch::client
{

    namespace
    {
        constexpr auto kUsage =
            "Usage: client <server>:<port> <file> [--chunk-size <bytes>] [--content-type <type>] "
            "[--upload-id <id>] [--shuffle] [--log <file>]";

        // Base64 grows a chunk by 4/3 and the JSON envelope needs some room on top.
        constexpr std::size_t kMaxChunkSize = (chunkstitch::protocol::kMaxFramePayload / 4) * 3 - 4096;

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }
    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];
        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        config.port = static_cast<std::uint16_t>(std::stoi(endpoint.substr(colon_pos + 1)));
        config.file = std::filesystem::path(argv[index++]);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--chunk-size")
            {
                config.chunk_size = static_cast<std::size_t>(std::stoull(require_value(index, argc, argv, arg)));
                if (config.chunk_size == 0 || config.chunk_size > kMaxChunkSize)
                {
                    throw std::runtime_error("--chunk-size must be between 1 and " + std::to_string(kMaxChunkSize));
                }
            }
            else if (arg == "--content-type")
            {
                config.content_type = require_value(index, argc, argv, arg);
            }
            else if (arg == "--upload-id")
            {
                config.upload_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--shuffle")
            {
                config.shuffle = true;
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg + "\n" + kUsage);
            }
        }

        return config;
    }

} // namespace chunkstitch::client
