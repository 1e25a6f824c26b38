#include "sftpbridge/server/session.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace sftpbridge::server
{

    namespace
    {

        spdlog::level::level_enum to_spdlog_level(sftpbridge::protocol::LogLevel level)
        {
            switch (level)
            {
            case sftpbridge::protocol::LogLevel::Warning:
                return spdlog::level::warn;
            case sftpbridge::protocol::LogLevel::Error:
                return spdlog::level::err;
            case sftpbridge::protocol::LogLevel::Info:
            case sftpbridge::protocol::LogLevel::Success:
            default:
                return spdlog::level::info;
            }
        }

    } // namespace

    BridgeSession::BridgeSession(std::string id, std::weak_ptr<EventSink> sink, ServerServices services)
        : id_(std::move(id)),
          sink_(std::move(sink)),
          services_(std::move(services)),
          listings_(services_.filesystem),
          logs_(services_.log_capacity),
          created_at_(std::chrono::system_clock::now()) {}

    BridgeSession::~BridgeSession()
    {
        close();
    }

    void BridgeSession::open()
    {
        const auto default_path = services_.filesystem.default_path().string();
        emit(sftpbridge::protocol::EventKind::InitialSetup,
             sftpbridge::protocol::InitialSetup{
                 .platform = LocalFilesystem::platform(),
                 .default_path = default_path,
             });
        list_local(default_path, std::nullopt);
    }

    void BridgeSession::close()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        if (connection_.apply(ConnectionEvent::DisconnectRequested))
        {
            detach_transport();
            connection_.apply(ConnectionEvent::Closed);
        }
        spdlog::debug("[{}] Session closed", id_);
    }

    void BridgeSession::dispatch(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        auto self = shared_from_this();
        spdlog::debug("[{}] -> command {}", id_, sftpbridge::protocol::to_string(envelope.command));

        try
        {
            switch (envelope.command)
            {
            case sftpbridge::protocol::Command::Connect:
                handle_connect(envelope);
                break;
            case sftpbridge::protocol::Command::ListLocal:
                handle_list_local(envelope);
                break;
            case sftpbridge::protocol::Command::ListRemote:
                handle_list_remote(envelope);
                break;
            case sftpbridge::protocol::Command::GetLocalRoots:
                handle_local_roots(envelope);
                break;
            case sftpbridge::protocol::Command::Download:
                handle_download(envelope);
                break;
            case sftpbridge::protocol::Command::Upload:
                handle_upload(envelope);
                break;
            case sftpbridge::protocol::Command::CreateDir:
                handle_create_dir(envelope);
                break;
            case sftpbridge::protocol::Command::Delete:
                handle_delete(envelope);
                break;
            case sftpbridge::protocol::Command::Exec:
                handle_exec(envelope);
                break;
            case sftpbridge::protocol::Command::ClearLog:
                handle_clear_log(envelope);
                break;
            case sftpbridge::protocol::Command::Disconnect:
                handle_disconnect(envelope);
                break;
            case sftpbridge::protocol::Command::Ping:
                emit(sftpbridge::protocol::EventKind::Pong, nlohmann::json::object(), envelope.request_id);
                break;
            default:
                emit_error(sftpbridge::ErrorCode::InvalidCommand, "Command not supported", envelope.request_id);
                break;
            }
        }
        catch (const FilesystemError &fs)
        {
            emit_error(fs.code(), fs.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            emit_error(sftpbridge::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void BridgeSession::log(sftpbridge::protocol::LogLevel level, std::string message)
    {
        spdlog::log(to_spdlog_level(level), "[{}] {}", id_, message);
        const auto &entry = logs_.append(level, std::move(message));
        emit(sftpbridge::protocol::EventKind::LogEntry, entry);
    }

    void BridgeSession::handle_connect(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        auto request = envelope.payload.get<sftpbridge::protocol::ConnectRequest>();
        if (request.host.empty() || request.username.empty() || request.private_key.empty())
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, "host, username and privateKey are required",
                       envelope.request_id);
            return;
        }
        if (connection_.state() != ConnectionState::Disconnected)
        {
            emit_error(sftpbridge::ErrorCode::AlreadyConnected, "A connection is already open, disconnect first",
                       envelope.request_id);
            return;
        }
        if (!services_.transport_factory)
        {
            emit_error(sftpbridge::ErrorCode::InternalError, "No remote transport available", envelope.request_id);
            return;
        }

        log(sftpbridge::protocol::LogLevel::Info,
            fmt::format("Initiating SSH connection to {}@{}:{}", request.username, request.host, request.port));
        connection_.apply(ConnectionEvent::ConnectRequested);
        target_ = request;
        transport_ = services_.transport_factory();

        std::weak_ptr<BridgeSession> weak = weak_from_this();
        const auto request_id = envelope.request_id;
        TransportEvents events{
            .on_authenticated = [weak]
            {
                if (auto self = weak.lock())
                {
                    self->on_authenticated();
                }
            },
            .on_ready = [weak, request_id]
            {
                if (auto self = weak.lock())
                {
                    self->on_ready(request_id);
                }
            },
            .on_error = [weak, request_id](const sftpbridge::Status &status)
            {
                if (auto self = weak.lock())
                {
                    self->on_transport_error(status, request_id);
                }
            },
            .on_end = [weak]
            {
                if (auto self = weak.lock())
                {
                    self->on_transport_end();
                }
            },
            .on_auth_challenge = [weak](const std::string &instruction, std::size_t prompt_count)
            {
                if (auto self = weak.lock())
                {
                    self->on_auth_challenge(instruction, prompt_count);
                }
            },
        };

        log(sftpbridge::protocol::LogLevel::Info, "Attempting to connect...");
        try
        {
            transport_->connect(
                ConnectOptions{
                    .host = request.host,
                    .port = request.port,
                    .username = request.username,
                    .private_key = request.private_key,
                    .passphrase = request.passphrase,
                },
                std::move(events));
        }
        catch (const std::exception &ex)
        {
            on_transport_error(sftpbridge::Status::failure(sftpbridge::ErrorCode::InternalError, ex.what()),
                               request_id);
        }
    }

    void BridgeSession::on_authenticated()
    {
        if (!connection_.apply(ConnectionEvent::Authenticated))
        {
            return;
        }
        log(sftpbridge::protocol::LogLevel::Info, "Authenticated as " + target_.username);
    }

    void BridgeSession::on_auth_challenge(const std::string &instruction, std::size_t prompt_count)
    {
        if (!connection_.apply(ConnectionEvent::AuthChallenge))
        {
            return;
        }
        spdlog::debug("[{}] Keyboard-interactive challenge with {} prompt(s): {}", id_, prompt_count, instruction);
        log(sftpbridge::protocol::LogLevel::Warning, "Keyboard-interactive authentication requested");
    }

    void BridgeSession::on_ready(const std::optional<std::string> &request_id)
    {
        if (!connection_.apply(ConnectionEvent::Ready))
        {
            spdlog::debug("[{}] Ignoring ready in state {}", id_, to_string(connection_.state()));
            return;
        }
        log(sftpbridge::protocol::LogLevel::Success, "SSH connection established successfully");
        log(sftpbridge::protocol::LogLevel::Success, "SFTP session initialized");
        emit(sftpbridge::protocol::EventKind::Connected,
             sftpbridge::protocol::ConnectedEvent{
                 .host = target_.host,
                 .username = target_.username,
                 .message = "Connected successfully",
             },
             request_id);

        const auto initial_path = "/home/" + target_.username;
        log(sftpbridge::protocol::LogLevel::Info, "Loading initial directory: " + initial_path);
        list_remote(initial_path, request_id);
    }

    void BridgeSession::on_transport_error(const sftpbridge::Status &status,
                                           const std::optional<std::string> &request_id)
    {
        const auto previous = connection_.state();
        if (!connection_.apply(ConnectionEvent::Error))
        {
            return;
        }
        detach_transport();

        if (previous == ConnectionState::Connecting)
        {
            log(sftpbridge::protocol::LogLevel::Error, "SSH connection failed: " + status.message);
            emit(sftpbridge::protocol::EventKind::ConnectError,
                 sftpbridge::protocol::ErrorEvent{.code = status.code, .message = status.message}, request_id);
            return;
        }
        log(sftpbridge::protocol::LogLevel::Error, "SSH connection error: " + status.message);
        emit_error(status.code, status.message);
        emit(sftpbridge::protocol::EventKind::Disconnected, nlohmann::json::object());
    }

    void BridgeSession::on_transport_end()
    {
        const auto previous = connection_.state();
        if (!connection_.apply(ConnectionEvent::End))
        {
            return;
        }
        detach_transport();
        log(sftpbridge::protocol::LogLevel::Info, "SSH connection closed");
        if (previous == ConnectionState::Connecting)
        {
            emit(sftpbridge::protocol::EventKind::ConnectError,
                 sftpbridge::protocol::ErrorEvent{.code = sftpbridge::ErrorCode::SshConnectFailed,
                                                  .message = "Connection closed during setup"});
            return;
        }
        emit(sftpbridge::protocol::EventKind::Disconnected, nlohmann::json::object());
    }

    void BridgeSession::detach_transport()
    {
        if (!transport_)
        {
            return;
        }
        auto transport = std::move(transport_);
        transport->disconnect();
    }

    void BridgeSession::handle_disconnect(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        if (!connection_.apply(ConnectionEvent::DisconnectRequested))
        {
            spdlog::debug("[{}] Disconnect ignored in state {}", id_, to_string(connection_.state()));
            return;
        }
        detach_transport();
        connection_.apply(ConnectionEvent::Closed);
        log(sftpbridge::protocol::LogLevel::Info, "SSH connection closed");
        emit(sftpbridge::protocol::EventKind::Disconnected, nlohmann::json::object(), envelope.request_id);
    }

    void BridgeSession::handle_exec(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpbridge::protocol::ExecRequest>();
        if (request.command.empty())
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, "command is required", envelope.request_id);
            return;
        }
        if (!require_connection(envelope.request_id))
        {
            return;
        }

        log(sftpbridge::protocol::LogLevel::Info, "Executing: " + request.command);
        std::weak_ptr<BridgeSession> weak = weak_from_this();
        const auto request_id = envelope.request_id;
        auto output = std::make_shared<std::string>();
        ExecHandlers handlers{
            .on_stdout = [weak, output, request_id](std::string chunk)
            {
                output->append(chunk);
                if (auto self = weak.lock())
                {
                    self->emit(sftpbridge::protocol::EventKind::CommandOutput, {{"data", std::move(chunk)}},
                               request_id);
                }
            },
            .on_stderr = [weak, request_id](std::string chunk)
            {
                if (auto self = weak.lock())
                {
                    self->emit(sftpbridge::protocol::EventKind::CommandError, {{"error", std::move(chunk)}},
                               request_id);
                }
            },
            .on_exit = [weak, output, request_id](int exit_code)
            {
                if (auto self = weak.lock())
                {
                    self->log(exit_code == 0 ? sftpbridge::protocol::LogLevel::Success
                                             : sftpbridge::protocol::LogLevel::Warning,
                              fmt::format("Command exited with code {}", exit_code));
                    self->emit(sftpbridge::protocol::EventKind::CommandComplete,
                               sftpbridge::protocol::CommandComplete{.exit_code = exit_code, .output = *output},
                               request_id);
                }
            },
            .on_error = [weak, request_id](const sftpbridge::Status &status)
            {
                if (auto self = weak.lock())
                {
                    self->log(sftpbridge::protocol::LogLevel::Error, "Command failed: " + status.message);
                    self->emit(sftpbridge::protocol::EventKind::CommandError,
                               {{"error", status.message}, {"code", std::string(sftpbridge::to_string(status.code))}}, request_id);
                }
            },
        };
        transport_->exec(request.command, std::move(handlers));
    }

    void BridgeSession::handle_clear_log(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        logs_.clear();
        emit(sftpbridge::protocol::EventKind::LogsCleared, nlohmann::json::object(), envelope.request_id);
    }

    std::shared_ptr<SftpChannel> BridgeSession::sftp_channel() const
    {
        if (!connection_.permits_remote_operations() || !transport_)
        {
            return nullptr;
        }
        return transport_->sftp();
    }

    bool BridgeSession::require_connection(const std::optional<std::string> &request_id)
    {
        if (connection_.permits_remote_operations() && transport_)
        {
            return true;
        }
        emit_error(sftpbridge::ErrorCode::NotConnected, "Not connected to SSH", request_id);
        return false;
    }

    void BridgeSession::emit(sftpbridge::protocol::EventKind kind, nlohmann::json payload,
                             const std::optional<std::string> &request_id)
    {
        if (closed_)
        {
            return;
        }
        auto sink = sink_.lock();
        if (!sink)
        {
            return;
        }
        sink->emit(sftpbridge::protocol::EventEnvelope{
            .kind = kind,
            .payload = std::move(payload),
            .request_id = request_id,
        });
    }

    void BridgeSession::emit_error(sftpbridge::ErrorCode code, std::string message,
                                   const std::optional<std::string> &request_id)
    {
        spdlog::debug("[{}] error {}: {}", id_, sftpbridge::to_string(code), message);
        emit(sftpbridge::protocol::EventKind::Error,
             sftpbridge::protocol::ErrorEvent{.code = code, .message = std::move(message)}, request_id);
    }

} // namespace sftpbridge::server
