#include "chunkstitch/client/uploader.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>

#include "chunkstitch/encoding/base64.hpp"
#include "chunkstitch/error_codes.hpp"
#include "chunkstitch/framing.hpp"

namespace chunkstitch::client
{

    Uploader::Uploader(ClientConfig config, Logger logger)
        : config_(std::move(config)), logger_(std::move(logger)), socket_(io_context_) {}

    int Uploader::run()
    {
        try
        {
            if (!std::filesystem::is_regular_file(config_.file))
            {
                std::cerr << "ERROR: " << config_.file.string() << " is not a regular file" << std::endl;
                return 1;
            }
            const auto file_size = std::filesystem::file_size(config_.file);
            if (file_size == 0)
            {
                std::cerr << "ERROR: empty files cannot be uploaded in chunks" << std::endl;
                return 1;
            }
            const auto chunk_total = (file_size + config_.chunk_size - 1) / config_.chunk_size;

            std::ifstream in(config_.file, std::ios::binary);
            if (!in.is_open())
            {
                std::cerr << "ERROR: cannot open " << config_.file.string() << std::endl;
                return 1;
            }

            connect();
            const auto upload_id = start_upload(file_size, chunk_total);
            if (upload_id.empty())
            {
                return 1;
            }

            for (const auto sequence : submission_order(chunk_total))
            {
                chunkstitch::protocol::UploadChunkRequest request{
                    .upload_id = upload_id,
                    .sequence = sequence,
                    .total = chunk_total,
                    .data_base64 = chunkstitch::encoding::encode_base64(read_chunk(in, sequence, file_size)),
                    .content_type = config_.content_type,
                };
                const auto response = rpc(chunkstitch::protocol::Command::UploadChunk, request);
                if (response.kind == chunkstitch::protocol::ResponseKind::Error)
                {
                    print_error(response);
                    return 1;
                }
                const auto progress = response.payload.get<chunkstitch::protocol::ProgressResponse>();
                std::cout << "\r" << progress.have << "/" << progress.want << " chunks" << std::flush;
                if (progress.complete)
                {
                    std::cout << std::endl;
                    if (progress.error)
                    {
                        std::cout << "REJECTED " << progress.status.value_or(0) << ": " << *progress.error
                                  << std::endl;
                        logger_.warn("Upload {} rejected with {}: {}", upload_id, progress.status.value_or(0),
                                     *progress.error);
                        return 2;
                    }
                    std::cout << "Upload " << upload_id << " complete" << std::endl;
                    logger_.info("Upload {} complete ({} bytes)", upload_id, file_size);
                }
            }
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.error("Upload aborted: {}", ex.what());
            return 1;
        }
        return 0;
    }

    void Uploader::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.info("Connected to {}:{}", config_.host, config_.port);
    }

    std::string Uploader::start_upload(std::uint64_t file_size, std::uint64_t chunk_total)
    {
        chunkstitch::protocol::UploadStartRequest request{
            .upload_id = config_.upload_id,
            .total = chunk_total,
            .metadata = {
                {"filename", config_.file.filename().string()},
                {"size", std::to_string(file_size)},
            },
        };
        if (config_.content_type)
        {
            request.metadata["content_type"] = *config_.content_type;
        }

        const auto response = rpc(chunkstitch::protocol::Command::UploadStart, request);
        if (response.kind == chunkstitch::protocol::ResponseKind::Error)
        {
            print_error(response);
            return {};
        }
        const auto started = response.payload.get<chunkstitch::protocol::UploadStartResponse>();
        logger_.info("Upload {} started with {} chunks", started.upload_id, started.total);
        return started.upload_id;
    }

    std::vector<std::uint64_t> Uploader::submission_order(std::uint64_t chunk_total) const
    {
        std::vector<std::uint64_t> order(chunk_total);
        std::iota(order.begin(), order.end(), std::uint64_t{0});
        if (config_.shuffle)
        {
            std::mt19937_64 rng{std::random_device{}()};
            std::shuffle(order.begin(), order.end(), rng);
        }
        return order;
    }

    std::vector<std::byte> Uploader::read_chunk(std::ifstream &in, std::uint64_t sequence,
                                                std::uint64_t file_size) const
    {
        const auto offset = sequence * config_.chunk_size;
        const auto length = std::min<std::uint64_t>(config_.chunk_size, file_size - offset);
        std::vector<std::byte> data(static_cast<std::size_t>(length));
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(length));
        if (!in)
        {
            throw std::runtime_error("Failed to read chunk " + std::to_string(sequence) + " of local file");
        }
        return data;
    }

    chunkstitch::protocol::ResponseEnvelope Uploader::rpc(chunkstitch::protocol::Command command,
                                                          const nlohmann::json &payload)
    {
        chunkstitch::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = chunkstitch::protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, chunkstitch::protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = chunkstitch::protocol::decode_frame_length(header);
        std::vector<char> buffer(size);
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(buffer.begin(), buffer.end());
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.error("Unreadable {} byte response: {}", size, ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<chunkstitch::protocol::ResponseEnvelope>();
        if (response.kind == chunkstitch::protocol::ResponseKind::Error)
        {
            logger_.warn("{} failed: {} {}", chunkstitch::protocol::to_string(command), chunkstitch::to_string(response.error),
                         response.message);
        }
        else
        {
            logger_.info("{} ok", chunkstitch::protocol::to_string(command));
        }
        return response;
    }

    void Uploader::print_error(const chunkstitch::protocol::ResponseEnvelope &response)
    {
        std::cerr << "ERROR: " << chunkstitch::to_string(response.error) << std::endl;
        if (!response.message.empty())
        {
            std::cerr << response.message << std::endl;
        }
    }

    std::string Uploader::next_request_id()
    {
        return "req-" + std::to_string(++request_counter_);
    }

} // namespace chunkstitch::client
