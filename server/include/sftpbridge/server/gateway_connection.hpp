#pragma once

#include <asio/ip/tcp.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sftpbridge/error_codes.hpp"
#include "sftpbridge/framing.hpp"
#include "sftpbridge/server/event_sink.hpp"
#include "sftpbridge/server/session_registry.hpp"

namespace sftpbridge::server
{

    // One client socket of the event gateway. Reads request frames, hands them to the
    // session registered for this connection, and writes that session's events back in order.
    class GatewayConnection : public EventSink, public std::enable_shared_from_this<GatewayConnection>
    {
    public:
        GatewayConnection(asio::ip::tcp::socket socket, SessionRegistry &registry, std::size_t max_frame_size);
        ~GatewayConnection() override;

        void start();

        void stop();

        void emit(const sftpbridge::protocol::EventEnvelope &event) override;

        const std::string &session_id() const noexcept { return session_id_; }

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const std::string &payload);
        void write_next();
        void send_error(sftpbridge::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        SessionRegistry &registry_;
        std::size_t max_frame_size_;
        std::string session_id_;

        std::array<std::uint8_t, sftpbridge::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbox_;
        bool writing_{false};
        bool stopped_{false};
    };

} // namespace sftpbridge::server
