#include "sftpbridge/protocol.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace sftpbridge::protocol
{

    namespace
    {

        template <typename Enum>
        struct LabelMapping
        {
            Enum value;
            std::string_view label;
        };

        template <typename Enum, std::size_t N>
        std::string_view label_of(const std::array<LabelMapping<Enum>, N> &mappings, Enum value) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.value == value)
                {
                    return mapping.label;
                }
            }
            return "UNKNOWN";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_of(const std::array<LabelMapping<Enum>, N> &mappings, std::string_view label) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.label == label)
                {
                    return mapping.value;
                }
            }
            return std::nullopt;
        }

        constexpr std::array<LabelMapping<Command>, 12> kCommandMappings{{
            {Command::Connect, "CONNECT"},
            {Command::ListLocal, "LIST_LOCAL"},
            {Command::ListRemote, "LIST_REMOTE"},
            {Command::GetLocalRoots, "GET_LOCAL_ROOTS"},
            {Command::Download, "DOWNLOAD"},
            {Command::Upload, "UPLOAD"},
            {Command::CreateDir, "CREATE_DIR"},
            {Command::Delete, "DELETE"},
            {Command::Exec, "EXEC"},
            {Command::ClearLog, "CLEAR_LOG"},
            {Command::Disconnect, "DISCONNECT"},
            {Command::Ping, "PING"},
        }};

        constexpr std::array<LabelMapping<EventKind>, 19> kEventMappings{{
            {EventKind::InitialSetup, "initial-setup"},
            {EventKind::LocalListing, "local-listing"},
            {EventKind::RemoteListing, "remote-listing"},
            {EventKind::LocalRoots, "local-roots"},
            {EventKind::Connected, "connected"},
            {EventKind::Disconnected, "disconnected"},
            {EventKind::ConnectError, "connect-error"},
            {EventKind::Error, "error"},
            {EventKind::TransferProgress, "transfer-progress"},
            {EventKind::DownloadComplete, "download-complete"},
            {EventKind::UploadComplete, "upload-complete"},
            {EventKind::DirCreated, "dir-created"},
            {EventKind::FileDeleted, "file-deleted"},
            {EventKind::LogEntry, "log-entry"},
            {EventKind::LogsCleared, "logs-cleared"},
            {EventKind::CommandOutput, "command-output"},
            {EventKind::CommandError, "command-error"},
            {EventKind::CommandComplete, "command-complete"},
            {EventKind::Pong, "pong"},
        }};

        constexpr std::array<LabelMapping<Origin>, 2> kOriginMappings{{
            {Origin::Local, "local"},
            {Origin::Remote, "remote"},
        }};

        constexpr std::array<LabelMapping<EntryType>, 2> kEntryTypeMappings{{
            {EntryType::File, "file"},
            {EntryType::Directory, "directory"},
        }};

        constexpr std::array<LabelMapping<TransferDirection>, 2> kDirectionMappings{{
            {TransferDirection::Upload, "upload"},
            {TransferDirection::Download, "download"},
        }};

        constexpr std::array<LabelMapping<LogLevel>, 4> kLogLevelMappings{{
            {LogLevel::Info, "info"},
            {LogLevel::Success, "success"},
            {LogLevel::Warning, "warning"},
            {LogLevel::Error, "error"},
        }};

        template <typename Enum, std::size_t N>
        Enum required_enum(const nlohmann::json &json, const char *key,
                           const std::array<LabelMapping<Enum>, N> &mappings)
        {
            const auto label = json.at(key).get<std::string>();
            auto value = value_of(mappings, label);
            if (!value)
            {
                throw std::invalid_argument(std::string("Invalid value for '") + key + "': " + label);
            }
            return *value;
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

        std::optional<std::string> optional_request_id(const nlohmann::json &json)
        {
            return optional_string(json, "id");
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        return label_of(kCommandMappings, command);
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        return value_of(kCommandMappings, value);
    }

    std::string_view to_string(EventKind kind) noexcept
    {
        return label_of(kEventMappings, kind);
    }

    std::optional<EventKind> event_kind_from_string(std::string_view value) noexcept
    {
        return value_of(kEventMappings, value);
    }

    std::string_view to_string(Origin origin) noexcept
    {
        return label_of(kOriginMappings, origin);
    }

    std::optional<Origin> origin_from_string(std::string_view value) noexcept
    {
        return value_of(kOriginMappings, value);
    }

    std::string_view to_string(EntryType type) noexcept
    {
        return label_of(kEntryTypeMappings, type);
    }

    std::optional<EntryType> entry_type_from_string(std::string_view value) noexcept
    {
        return value_of(kEntryTypeMappings, value);
    }

    std::string_view to_string(TransferDirection direction) noexcept
    {
        return label_of(kDirectionMappings, direction);
    }

    std::optional<TransferDirection> transfer_direction_from_string(std::string_view value) noexcept
    {
        return value_of(kDirectionMappings, value);
    }

    std::string_view to_string(LogLevel level) noexcept
    {
        return label_of(kLogLevelMappings, level);
    }

    std::optional<LogLevel> log_level_from_string(std::string_view value) noexcept
    {
        return value_of(kLogLevelMappings, value);
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::invalid_argument("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_request_id(json);
    }

    void to_json(nlohmann::json &json, const EventEnvelope &envelope)
    {
        json = {
            {"event", to_string(envelope.kind)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, EventEnvelope &envelope)
    {
        envelope.kind = required_enum(json, "event", kEventMappings);
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_request_id(json);
    }

    void to_json(nlohmann::json &json, const FileEntry &entry)
    {
        json = {
            {"name", entry.name},
            {"type", to_string(entry.type)},
            {"size", entry.size},
            {"mtime", entry.modified_time},
            {"permissions", entry.permissions},
            {"path", entry.path},
        };
    }

    void from_json(const nlohmann::json &json, FileEntry &entry)
    {
        entry.name = json.at("name").get<std::string>();
        entry.type = required_enum(json, "type", kEntryTypeMappings);
        entry.size = json.value("size", 0ULL);
        entry.modified_time = json.value("mtime", 0ULL);
        entry.permissions = json.value("permissions", 0U);
        entry.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DirectoryListing &listing)
    {
        json = {
            {"origin", to_string(listing.origin)},
            {"path", listing.path},
            {"parent", listing.parent},
            {"files", listing.entries},
        };
    }

    void from_json(const nlohmann::json &json, DirectoryListing &listing)
    {
        listing.origin = required_enum(json, "origin", kOriginMappings);
        listing.path = json.at("path").get<std::string>();
        listing.parent = json.value("parent", std::string{});
        listing.entries = json.value("files", std::vector<FileEntry>{});
    }

    void to_json(nlohmann::json &json, const LogEntry &entry)
    {
        json = {
            {"timestamp", entry.timestamp},
            {"message", entry.message},
            {"type", to_string(entry.level)},
        };
    }

    void from_json(const nlohmann::json &json, LogEntry &entry)
    {
        entry.timestamp = json.value("timestamp", std::string{});
        entry.message = json.at("message").get<std::string>();
        entry.level = required_enum(json, "type", kLogLevelMappings);
    }

    void to_json(nlohmann::json &json, const ConnectRequest &request)
    {
        json = {
            {"host", request.host},
            {"port", request.port},
            {"username", request.username},
            {"privateKey", request.private_key},
        };
        if (request.passphrase)
        {
            json["passphrase"] = *request.passphrase;
        }
    }

    void from_json(const nlohmann::json &json, ConnectRequest &request)
    {
        request.host = json.at("host").get<std::string>();
        const auto port = json.value("port", std::int64_t{22});
        if (port < 1 || port > 65535)
        {
            throw std::invalid_argument("Invalid value for 'port': " + std::to_string(port));
        }
        request.port = static_cast<std::uint16_t>(port);
        request.username = json.at("username").get<std::string>();
        request.private_key = json.at("privateKey").get<std::string>();
        request.passphrase = optional_string(json, "passphrase");
    }

    void to_json(nlohmann::json &json, const PathRequest &request)
    {
        json = {{"path", request.path}};
    }

    void from_json(const nlohmann::json &json, PathRequest &request)
    {
        request.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DownloadRequest &request)
    {
        json = {
            {"remotePath", request.remote_path},
            {"localPath", request.local_path},
        };
    }

    void from_json(const nlohmann::json &json, DownloadRequest &request)
    {
        request.remote_path = json.at("remotePath").get<std::string>();
        request.local_path = json.value("localPath", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadRequest &request)
    {
        json = {{"remotePath", request.remote_path}};
        if (request.local_path)
        {
            json["localPath"] = *request.local_path;
        }
        if (request.file_content)
        {
            json["fileContent"] = *request.file_content;
        }
        if (request.file_name)
        {
            json["fileName"] = *request.file_name;
        }
    }

    void from_json(const nlohmann::json &json, UploadRequest &request)
    {
        request.remote_path = json.at("remotePath").get<std::string>();
        request.local_path = optional_string(json, "localPath");
        request.file_content = optional_string(json, "fileContent");
        request.file_name = optional_string(json, "fileName");
        if (!request.local_path && !request.file_content)
        {
            throw std::invalid_argument("Upload requires localPath or fileContent");
        }
    }

    void to_json(nlohmann::json &json, const CreateDirRequest &request)
    {
        json = {
            {"origin", to_string(request.origin)},
            {"path", request.path},
        };
    }

    void from_json(const nlohmann::json &json, CreateDirRequest &request)
    {
        request.origin = required_enum(json, "origin", kOriginMappings);
        request.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DeleteRequest &request)
    {
        json = {
            {"origin", to_string(request.origin)},
            {"path", request.path},
            {"type", to_string(request.type)},
        };
    }

    void from_json(const nlohmann::json &json, DeleteRequest &request)
    {
        request.origin = required_enum(json, "origin", kOriginMappings);
        request.path = json.at("path").get<std::string>();
        request.type = required_enum(json, "type", kEntryTypeMappings);
    }

    void to_json(nlohmann::json &json, const ExecRequest &request)
    {
        json = {{"command", request.command}};
    }

    void from_json(const nlohmann::json &json, ExecRequest &request)
    {
        request.command = json.at("command").get<std::string>();
    }

    void to_json(nlohmann::json &json, const InitialSetup &setup)
    {
        json = {
            {"platform", setup.platform},
            {"defaultPath", setup.default_path},
        };
    }

    void from_json(const nlohmann::json &json, InitialSetup &setup)
    {
        setup.platform = json.at("platform").get<std::string>();
        setup.default_path = json.at("defaultPath").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ConnectedEvent &event)
    {
        json = {
            {"host", event.host},
            {"username", event.username},
            {"message", event.message},
        };
    }

    void from_json(const nlohmann::json &json, ConnectedEvent &event)
    {
        event.host = json.at("host").get<std::string>();
        event.username = json.at("username").get<std::string>();
        event.message = json.value("message", std::string{});
    }

    void to_json(nlohmann::json &json, const ErrorEvent &event)
    {
        json = {
            {"code", to_string(event.code)},
            {"message", event.message},
        };
        if (event.file)
        {
            json["file"] = *event.file;
        }
        if (event.direction)
        {
            json["direction"] = to_string(*event.direction);
        }
    }

    void from_json(const nlohmann::json &json, ErrorEvent &event)
    {
        const auto code_label = json.at("code").get<std::string>();
        event.code = error_code_from_string(code_label).value_or(ErrorCode::InternalError);
        event.message = json.value("message", std::string{});
        event.file = optional_string(json, "file");
        if (auto direction = optional_string(json, "direction"))
        {
            event.direction = transfer_direction_from_string(*direction);
        }
        else
        {
            event.direction.reset();
        }
    }

    void to_json(nlohmann::json &json, const TransferProgress &progress)
    {
        json = {
            {"file", progress.file},
            {"progress", progress.percent},
            {"type", to_string(progress.direction)},
            {"bytesSoFar", progress.bytes_transferred},
            {"total", progress.total_bytes},
        };
    }

    void from_json(const nlohmann::json &json, TransferProgress &progress)
    {
        progress.file = json.at("file").get<std::string>();
        progress.percent = json.at("progress").get<std::uint32_t>();
        progress.direction = required_enum(json, "type", kDirectionMappings);
        progress.bytes_transferred = json.value("bytesSoFar", 0ULL);
        progress.total_bytes = json.value("total", 0ULL);
    }

    void to_json(nlohmann::json &json, const DownloadComplete &event)
    {
        json = {
            {"file", event.file},
            {"localPath", event.local_path},
        };
    }

    void from_json(const nlohmann::json &json, DownloadComplete &event)
    {
        event.file = json.at("file").get<std::string>();
        event.local_path = json.at("localPath").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadComplete &event)
    {
        json = {
            {"file", event.file},
            {"remotePath", event.remote_path},
        };
    }

    void from_json(const nlohmann::json &json, UploadComplete &event)
    {
        event.file = json.at("file").get<std::string>();
        event.remote_path = json.value("remotePath", std::string{});
    }

    void to_json(nlohmann::json &json, const CommandComplete &event)
    {
        json = {
            {"code", event.exit_code},
            {"output", event.output},
        };
    }

    void from_json(const nlohmann::json &json, CommandComplete &event)
    {
        event.exit_code = json.at("code").get<int>();
        event.output = json.value("output", std::string{});
    }

} // namespace sftpbridge::protocol
