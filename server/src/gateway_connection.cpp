#include "sftpbridge/server/gateway_connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <utility>

#include <spdlog/spdlog.h>

#include "sftpbridge/protocol.hpp"

namespace sftpbridge::server
{

    namespace
    {

        std::optional<std::string> request_id_of(const nlohmann::json &json)
        {
            if (!json.is_object())
            {
                return std::nullopt;
            }
            const auto it = json.find("id");
            if (it == json.end() || !it->is_string())
            {
                return std::nullopt;
            }
            return it->get<std::string>();
        }

    } // namespace

    GatewayConnection::GatewayConnection(asio::ip::tcp::socket socket, SessionRegistry &registry,
                                         std::size_t max_frame_size)
        : socket_(std::move(socket)), registry_(registry), max_frame_size_(max_frame_size) {}

    GatewayConnection::~GatewayConnection()
    {
        std::error_code ec;
        socket_.close(ec);
    }

    void GatewayConnection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        auto session = registry_.create(weak_from_this());
        session_id_ = session->id();
        session->open();
        read_frame_header();
    }

    void GatewayConnection::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        outbox_.clear();
        if (!session_id_.empty())
        {
            registry_.destroy(session_id_);
        }
    }

    void GatewayConnection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                                 {
                                     spdlog::debug("Read from {} failed: {}", remote_endpoint(), ec.message());
                                 }
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = sftpbridge::protocol::read_frame_length(header_buffer_, max_frame_size_);
                             }
                             catch (const sftpbridge::protocol::FrameTooLarge &ex)
                             {
                                 spdlog::warn("Dropping {}: {}", remote_endpoint(), ex.what());
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

    void GatewayConnection::read_frame_payload(std::size_t size)
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
                             const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                             buffer_.clear();
                             buffer_.shrink_to_fit();
                             process_message(payload);
                             if (!stopped_)
                             {
                                 read_frame_header();
                             }
                         });
    }

    void GatewayConnection::process_message(const std::string &payload)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(payload);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            send_error(sftpbridge::ErrorCode::InvalidPayload, ex.what());
            return;
        }

        const auto request_id = request_id_of(json);
        if (!json.is_object() || !json.contains("cmd") || !json.at("cmd").is_string())
        {
            send_error(sftpbridge::ErrorCode::InvalidPayload, "Request is missing 'cmd'", request_id);
            return;
        }
        const auto label = json.at("cmd").get<std::string>();
        if (!sftpbridge::protocol::command_from_string(label))
        {
            send_error(sftpbridge::ErrorCode::InvalidCommand, "Unknown command: " + label, request_id);
            return;
        }

        sftpbridge::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<sftpbridge::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(sftpbridge::ErrorCode::InvalidPayload, ex.what(), request_id);
            return;
        }

        auto session = registry_.find(session_id_);
        if (!session)
        {
            send_error(sftpbridge::ErrorCode::InternalError, "Session is gone", request_id);
            return;
        }
        session->dispatch(envelope);
    }

    void GatewayConnection::emit(const sftpbridge::protocol::EventEnvelope &event)
    {
        if (stopped_)
        {
            return;
        }
        try
        {
            outbox_.push_back(sftpbridge::protocol::encode_frame(nlohmann::json(event)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode {} event: {}", sftpbridge::protocol::to_string(event.kind), ex.what());
            return;
        }
        if (!writing_)
        {
            write_next();
        }
    }

    void GatewayConnection::write_next()
    {
        writing_ = true;
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbox_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  writing_ = false;
                                  stop();
                                  return;
                              }
                              if (!outbox_.empty())
                              {
                                  outbox_.pop_front();
                              }
                              if (outbox_.empty() || stopped_)
                              {
                                  writing_ = false;
                                  return;
                              }
                              write_next();
                          });
    }

    void GatewayConnection::send_error(sftpbridge::ErrorCode code, std::string message,
                                       std::optional<std::string> request_id)
    {
        emit(sftpbridge::protocol::EventEnvelope{
            .kind = sftpbridge::protocol::EventKind::Error,
            .payload = sftpbridge::protocol::ErrorEvent{.code = code, .message = std::move(message)},
            .request_id = std::move(request_id),
        });
    }

    std::string GatewayConnection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace sftpbridge::server
