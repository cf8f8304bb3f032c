#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkstitch/client/config.hpp"
#include "chunkstitch/client/logger.hpp"
#include "chunkstitch/protocol.hpp"

namespace chunkstitch::client
{

    // Splits one local file into chunks and submits them over a single connection.
    class Uploader
    {
    public:
        Uploader(ClientConfig config, Logger logger);

        // 0 on success, 1 on error, 2 when the server rejected the assembled file.
        int run();

    private:
        void connect();
        std::string start_upload(std::uint64_t file_size, std::uint64_t chunk_total);
        std::vector<std::uint64_t> submission_order(std::uint64_t chunk_total) const;
        std::vector<std::byte> read_chunk(std::ifstream &in, std::uint64_t sequence, std::uint64_t file_size) const;

        chunkstitch::protocol::ResponseEnvelope rpc(chunkstitch::protocol::Command command,
                                                    const nlohmann::json &payload);
        static void print_error(const chunkstitch::protocol::ResponseEnvelope &response);
        std::string next_request_id();

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

} // namespace chunkstitch::client
