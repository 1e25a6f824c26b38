#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>

#include "sftpbridge/server/config.hpp"
#include "sftpbridge/server/filesystem.hpp"
#include "sftpbridge/server/session_registry.hpp"
#include "sftpbridge/server/staging.hpp"

namespace sftpbridge::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        LocalFilesystem filesystem_;
        StagingArea staging_;
        SessionRegistry registry_;
    };

} // namespace sftpbridge::server
