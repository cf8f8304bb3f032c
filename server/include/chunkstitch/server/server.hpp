#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <thread>
#include <vector>

#include "chunkstitch/server/assembler.hpp"
#include "chunkstitch/server/config.hpp"

namespace chunkstitch::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_expiry();
        void handle_signal();

        ServerConfig config_;
        ChunkAssembler assembler_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer expiry_timer_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkstitch::server
