#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunkstitch/error_codes.hpp"
#include "chunkstitch/framing.hpp"
#include "chunkstitch/protocol.hpp"
#include "chunkstitch/server/assembler.hpp"

namespace chunkstitch::server
{

    struct ServerServices
    {
        ChunkAssembler &assembler;
        std::chrono::seconds upload_timeout;
    };

    // One client connection. Requests are answered in order; handlers block on
    // chunk I/O, other connections keep running on the remaining workers.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const chunkstitch::protocol::ResponseEnvelope &envelope);
        void send_error(chunkstitch::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);

        void handle_upload_start(const chunkstitch::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const chunkstitch::protocol::RequestEnvelope &envelope);
        void handle_ping(const chunkstitch::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, chunkstitch::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
    };

} // namespace chunkstitch::server
