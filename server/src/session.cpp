#include "chunkstitch/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace chunkstitch::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = chunkstitch::protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(chunkstitch::ErrorCode::InvalidRequest, ex.what());
                                 return;
                             }
                             process_message(json);
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        chunkstitch::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkstitch::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkstitch::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), chunkstitch::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case chunkstitch::protocol::Command::UploadStart:
            handle_upload_start(envelope);
            break;
        case chunkstitch::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case chunkstitch::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        default:
            send_error(chunkstitch::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    // Every request gets exactly one response; the next request is read once it is sent.
    void Session::send_response(const chunkstitch::protocol::ResponseEnvelope &envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(
                chunkstitch::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cannot encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              read_frame_header();
                          });
    }

    void Session::send_error(chunkstitch::ErrorCode code, std::string message,
                             std::optional<std::string> request_id)
    {
        chunkstitch::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkstitch::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkstitch::server
