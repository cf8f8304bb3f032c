#include "chunkstitch/server/server.hpp"

#include <asio/ip/address.hpp>

#include <algorithm>
#include <csignal>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkstitch/server/artifact_consumer.hpp"
#include "chunkstitch/server/session.hpp"

namespace chunkstitch::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        // Idle uploads are swept a few times per timeout period, but at most once a minute.
        std::chrono::seconds expiry_interval(std::chrono::seconds upload_timeout)
        {
            return std::clamp(upload_timeout / 4, std::chrono::seconds{1}, std::chrono::seconds{60});
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          assembler_(config_.assembler, make_logging_consumer(config_.max_artifact_size)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          expiry_timer_(io_context_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with data under {}", config_.address, config_.port, config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_expiry();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        assembler_.wait_for_cleanup();
        spdlog::info("Server stopped with {} uploads in progress", assembler_.active_uploads());
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{assembler_, config_.upload_timeout};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
        }
        if (!acceptor_.is_open())
        {
            return;
        }
        if (ec && ec != asio::error::operation_aborted)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

    void Server::schedule_expiry()
    {
        expiry_timer_.expires_after(expiry_interval(config_.upload_timeout));
        expiry_timer_.async_wait([this](const std::error_code &ec)
                                 {
            if (ec)
            {
                return;
            }
            const auto expired = assembler_.expire_stale(config_.upload_timeout);
            if (expired > 0)
            {
                spdlog::info("Expired {} idle uploads", expired);
            }
            schedule_expiry(); });
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        expiry_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkstitch::server
