#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "sftpbridge/error_codes.hpp"
#include "sftpbridge/protocol.hpp"
#include "sftpbridge/server/connection_state.hpp"
#include "sftpbridge/server/directory_listing.hpp"
#include "sftpbridge/server/event_sink.hpp"
#include "sftpbridge/server/filesystem.hpp"
#include "sftpbridge/server/log_buffer.hpp"
#include "sftpbridge/server/remote_transport.hpp"
#include "sftpbridge/server/staging.hpp"

namespace sftpbridge::server
{

    struct ServerServices
    {
        LocalFilesystem &filesystem;
        StagingArea &staging;
        TransportFactory transport_factory;
        std::size_t log_capacity;
    };

    // Server-side state of one gateway connection: its log, its connection state and
    // the remote transport it holds while connected.
    class BridgeSession : public std::enable_shared_from_this<BridgeSession>
    {
    public:
        BridgeSession(std::string id, std::weak_ptr<EventSink> sink, ServerServices services);
        ~BridgeSession();

        BridgeSession(const BridgeSession &) = delete;
        BridgeSession &operator=(const BridgeSession &) = delete;

        const std::string &id() const noexcept { return id_; }
        ConnectionState state() const noexcept { return connection_.state(); }
        const LogBuffer &logs() const noexcept { return logs_; }
        std::chrono::system_clock::time_point created_at() const noexcept { return created_at_; }

        // Emits initial-setup followed by a listing of the default local path.
        void open();

        void dispatch(const sftpbridge::protocol::RequestEnvelope &envelope);

        // Ends the transport, if any. The session emits nothing afterwards.
        void close();

        void log(sftpbridge::protocol::LogLevel level, std::string message);

    private:
        void handle_connect(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_disconnect(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_list_local(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_list_remote(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_local_roots(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_download(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_upload(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_create_dir(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_delete(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_exec(const sftpbridge::protocol::RequestEnvelope &envelope);
        void handle_clear_log(const sftpbridge::protocol::RequestEnvelope &envelope);

        void list_local(const std::string &path, const std::optional<std::string> &request_id);
        void list_remote(const std::string &path, const std::optional<std::string> &request_id);

        void on_authenticated();
        void on_auth_challenge(const std::string &instruction, std::size_t prompt_count);
        void on_ready(const std::optional<std::string> &request_id);
        void on_transport_error(const sftpbridge::Status &status, const std::optional<std::string> &request_id);
        void on_transport_end();
        void detach_transport();

        // Null unless the connection is established.
        std::shared_ptr<SftpChannel> sftp_channel() const;
        bool require_connection(const std::optional<std::string> &request_id);

        void emit(sftpbridge::protocol::EventKind kind, nlohmann::json payload,
                  const std::optional<std::string> &request_id = std::nullopt);
        void emit_error(sftpbridge::ErrorCode code, std::string message,
                        const std::optional<std::string> &request_id = std::nullopt);

        std::string id_;
        std::weak_ptr<EventSink> sink_;
        ServerServices services_;
        DirectoryListingUnifier listings_;
        LogBuffer logs_;
        ConnectionStateMachine connection_;
        std::shared_ptr<RemoteTransport> transport_;
        sftpbridge::protocol::ConnectRequest target_{};
        std::chrono::system_clock::time_point created_at_;
        bool closed_{false};
    };

} // namespace sftpbridge::server
