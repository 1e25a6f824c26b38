/**
 * SFTP Bridge - Event gateway schema and serialization helpers.
 *
 * Clients send request envelopes ({"cmd", "payload", "id"}) and receive event
 * envelopes ({"event", "payload", "id"}). Both travel as length-prefixed frames.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "sftpbridge/error_codes.hpp"

namespace sftpbridge::protocol
{

    enum class Command : std::uint8_t
    {
        Connect,
        ListLocal,
        ListRemote,
        GetLocalRoots,
        Download,
        Upload,
        CreateDir,
        Delete,
        Exec,
        ClearLog,
        Disconnect,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class EventKind : std::uint8_t
    {
        InitialSetup,
        LocalListing,
        RemoteListing,
        LocalRoots,
        Connected,
        Disconnected,
        ConnectError,
        Error,
        TransferProgress,
        DownloadComplete,
        UploadComplete,
        DirCreated,
        FileDeleted,
        LogEntry,
        LogsCleared,
        CommandOutput,
        CommandError,
        CommandComplete,
        Pong
    };

    std::string_view to_string(EventKind kind) noexcept;
    std::optional<EventKind> event_kind_from_string(std::string_view value) noexcept;

    enum class Origin : std::uint8_t
    {
        Local,
        Remote
    };

    std::string_view to_string(Origin origin) noexcept;
    std::optional<Origin> origin_from_string(std::string_view value) noexcept;

    enum class EntryType : std::uint8_t
    {
        File,
        Directory
    };

    std::string_view to_string(EntryType type) noexcept;
    std::optional<EntryType> entry_type_from_string(std::string_view value) noexcept;

    enum class TransferDirection : std::uint8_t
    {
        Upload,
        Download
    };

    std::string_view to_string(TransferDirection direction) noexcept;
    std::optional<TransferDirection> transfer_direction_from_string(std::string_view value) noexcept;

    enum class LogLevel : std::uint8_t
    {
        Info,
        Success,
        Warning,
        Error
    };

    std::string_view to_string(LogLevel level) noexcept;
    std::optional<LogLevel> log_level_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct EventEnvelope
    {
        EventKind kind{EventKind::Pong};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const EventEnvelope &envelope);
    void from_json(const nlohmann::json &json, EventEnvelope &envelope);

    // One directory entry, local or remote. `path` is unique within its origin.
    struct FileEntry
    {
        std::string name;
        EntryType type{EntryType::File};
        std::uint64_t size{};
        std::uint64_t modified_time{};
        std::uint32_t permissions{};
        std::string path;
    };

    void to_json(nlohmann::json &json, const FileEntry &entry);
    void from_json(const nlohmann::json &json, FileEntry &entry);

    struct DirectoryListing
    {
        Origin origin{Origin::Local};
        std::string path;
        std::string parent;
        std::vector<FileEntry> entries;
    };

    void to_json(nlohmann::json &json, const DirectoryListing &listing);
    void from_json(const nlohmann::json &json, DirectoryListing &listing);

    struct LogEntry
    {
        std::string timestamp;
        std::string message;
        LogLevel level{LogLevel::Info};
    };

    void to_json(nlohmann::json &json, const LogEntry &entry);
    void from_json(const nlohmann::json &json, LogEntry &entry);

    struct ConnectRequest
    {
        std::string host;
        std::uint16_t port{22};
        std::string username;
        std::string private_key;
        std::optional<std::string> passphrase{};
    };

    void to_json(nlohmann::json &json, const ConnectRequest &request);
    void from_json(const nlohmann::json &json, ConnectRequest &request);

    struct PathRequest
    {
        std::string path;
    };

    void to_json(nlohmann::json &json, const PathRequest &request);
    void from_json(const nlohmann::json &json, PathRequest &request);

    struct DownloadRequest
    {
        std::string remote_path;
        std::string local_path;
    };

    void to_json(nlohmann::json &json, const DownloadRequest &request);
    void from_json(const nlohmann::json &json, DownloadRequest &request);

    // Either local_path or file_content (base64) + file_name.
    struct UploadRequest
    {
        std::string remote_path;
        std::optional<std::string> local_path{};
        std::optional<std::string> file_content{};
        std::optional<std::string> file_name{};
    };

    void to_json(nlohmann::json &json, const UploadRequest &request);
    void from_json(const nlohmann::json &json, UploadRequest &request);

    struct CreateDirRequest
    {
        Origin origin{Origin::Local};
        std::string path;
    };

    void to_json(nlohmann::json &json, const CreateDirRequest &request);
    void from_json(const nlohmann::json &json, CreateDirRequest &request);

    struct DeleteRequest
    {
        Origin origin{Origin::Local};
        std::string path;
        EntryType type{EntryType::File};
    };

    void to_json(nlohmann::json &json, const DeleteRequest &request);
    void from_json(const nlohmann::json &json, DeleteRequest &request);

    struct ExecRequest
    {
        std::string command;
    };

    void to_json(nlohmann::json &json, const ExecRequest &request);
    void from_json(const nlohmann::json &json, ExecRequest &request);

    struct InitialSetup
    {
        std::string platform;
        std::string default_path;
    };

    void to_json(nlohmann::json &json, const InitialSetup &setup);
    void from_json(const nlohmann::json &json, InitialSetup &setup);

    struct ConnectedEvent
    {
        std::string host;
        std::string username;
        std::string message;
    };

    void to_json(nlohmann::json &json, const ConnectedEvent &event);
    void from_json(const nlohmann::json &json, ConnectedEvent &event);

    struct ErrorEvent
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
        std::optional<std::string> file{};
        std::optional<TransferDirection> direction{};
    };

    void to_json(nlohmann::json &json, const ErrorEvent &event);
    void from_json(const nlohmann::json &json, ErrorEvent &event);

    struct TransferProgress
    {
        std::string file;
        std::uint32_t percent{};
        TransferDirection direction{TransferDirection::Download};
        std::uint64_t bytes_transferred{};
        std::uint64_t total_bytes{};
    };

    void to_json(nlohmann::json &json, const TransferProgress &progress);
    void from_json(const nlohmann::json &json, TransferProgress &progress);

    struct DownloadComplete
    {
        std::string file;
        std::string local_path;
    };

    void to_json(nlohmann::json &json, const DownloadComplete &event);
    void from_json(const nlohmann::json &json, DownloadComplete &event);

    struct UploadComplete
    {
        std::string file;
        std::string remote_path;
    };

    void to_json(nlohmann::json &json, const UploadComplete &event);
    void from_json(const nlohmann::json &json, UploadComplete &event);

    struct CommandComplete
    {
        int exit_code{};
        std::string output;
    };

    void to_json(nlohmann::json &json, const CommandComplete &event);
    void from_json(const nlohmann::json &json, CommandComplete &event);

} // namespace sftpbridge::protocol
