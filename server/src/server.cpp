#include "sftpbridge/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "sftpbridge/server/gateway_connection.hpp"
#include "sftpbridge/server/ssh_transport.hpp"

namespace sftpbridge::server
{

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(1),
          acceptor_(io_context_),
          signals_(io_context_),
          staging_(config_.staging_dir.empty() ? default_staging_dir() : config_.staging_dir),
          registry_(ServerServices{
              .filesystem = filesystem_,
              .staging = staging_,
              .transport_factory = make_ssh_transport_factory(io_context_.get_executor(), config_.transport),
              .log_capacity = config_.log_capacity,
          })
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with staging directory {}", config_.address, config_.port,
                     staging_.root().string());

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
        spdlog::info("Server event loop running");
        io_context_.run();
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
            auto connection = std::make_shared<GatewayConnection>(std::move(socket), registry_, config_.max_frame_size);
            connection->start();
            spdlog::debug("Accepted new connection, {} sessions active", registry_.size());
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace sftpbridge::server
