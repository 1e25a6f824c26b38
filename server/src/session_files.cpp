#include "sftpbridge/server/session.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "sftpbridge/server/remote_path.hpp"

namespace sftpbridge::server
{

    namespace
    {

        std::string local_parent_of(const std::string &path)
        {
            auto normalized = std::filesystem::path(path).lexically_normal();
            if (!normalized.has_filename() && normalized.has_relative_path())
            {
                normalized = normalized.parent_path();
            }
            const auto parent = normalized.parent_path();
            if (!parent.empty())
            {
                return parent.string();
            }
            // A bare relative name lives in the working directory.
            std::error_code ec;
            const auto cwd = std::filesystem::current_path(ec);
            return ec ? normalized.string() : cwd.string();
        }

    } // namespace

    void BridgeSession::handle_list_local(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpbridge::protocol::PathRequest>();
        list_local(request.path, envelope.request_id);
    }

    void BridgeSession::handle_list_remote(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpbridge::protocol::PathRequest>();
        list_remote(request.path, envelope.request_id);
    }

    void BridgeSession::handle_local_roots(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload;
        payload["roots"] = services_.filesystem.roots();
        emit(sftpbridge::protocol::EventKind::LocalRoots, std::move(payload), envelope.request_id);
    }

    void BridgeSession::list_local(const std::string &path, const std::optional<std::string> &request_id)
    {
        try
        {
            auto result = listings_.list_local(path);
            for (auto &warning : result.warnings)
            {
                log(sftpbridge::protocol::LogLevel::Warning, std::move(warning));
            }
            spdlog::debug("[{}] Found {} items in {}", id_, result.listing.entries.size(), result.listing.path);
            emit(sftpbridge::protocol::EventKind::LocalListing, result.listing, request_id);
        }
        catch (const FilesystemError &error)
        {
            log(sftpbridge::protocol::LogLevel::Error, error.what());
            emit_error(error.code(), error.what(), request_id);
        }
    }

    void BridgeSession::list_remote(const std::string &path, const std::optional<std::string> &request_id)
    {
        auto channel = sftp_channel();
        if (!channel)
        {
            emit_error(sftpbridge::ErrorCode::NotConnected, "Not connected to SSH", request_id);
            return;
        }

        log(sftpbridge::protocol::LogLevel::Info, "Reading directory: " + path);
        std::weak_ptr<BridgeSession> weak = weak_from_this();
        listings_.list_remote(
            channel, path,
            [weak, request_id](const sftpbridge::Status &status, sftpbridge::protocol::DirectoryListing listing)
            {
                auto self = weak.lock();
                if (!self)
                {
                    return;
                }
                if (!status)
                {
                    self->log(sftpbridge::protocol::LogLevel::Error, status.message);
                    self->emit_error(status.code, status.message, request_id);
                    return;
                }
                self->log(sftpbridge::protocol::LogLevel::Success,
                          fmt::format("Found {} items in {}", listing.entries.size(), listing.path));
                self->emit(sftpbridge::protocol::EventKind::RemoteListing, listing, request_id);
            });
    }

    void BridgeSession::handle_create_dir(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpbridge::protocol::CreateDirRequest>();
        if (request.path.empty())
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, "path is required", envelope.request_id);
            return;
        }

        if (request.origin == sftpbridge::protocol::Origin::Local)
        {
            try
            {
                services_.filesystem.create_directory(request.path);
            }
            catch (const FilesystemError &error)
            {
                log(sftpbridge::protocol::LogLevel::Error, error.what());
                emit_error(error.code(), error.what(), envelope.request_id);
                return;
            }
            log(sftpbridge::protocol::LogLevel::Success, "Created local directory: " + request.path);
            emit(sftpbridge::protocol::EventKind::DirCreated, {{"path", request.path}}, envelope.request_id);
            list_local(local_parent_of(request.path), envelope.request_id);
            return;
        }

        auto channel = sftp_channel();
        if (!channel)
        {
            emit_error(sftpbridge::ErrorCode::NotConnected, "Not connected to SSH", envelope.request_id);
            return;
        }
        const auto target = remote_path::normalize(request.path);
        std::weak_ptr<BridgeSession> weak = weak_from_this();
        const auto request_id = envelope.request_id;
        channel->make_directory(target, [weak, target, request_id](const sftpbridge::Status &status)
                                {
            auto self = weak.lock();
            if (!self)
            {
                return;
            }
            if (!status)
            {
                const auto message = "Failed to create directory: " + status.message;
                self->log(sftpbridge::protocol::LogLevel::Error, message);
                self->emit_error(sftpbridge::ErrorCode::MutationFailed, message, request_id);
                return;
            }
            self->log(sftpbridge::protocol::LogLevel::Success, "Created remote directory: " + target);
            self->emit(sftpbridge::protocol::EventKind::DirCreated, {{"path", target}}, request_id);
            self->list_remote(remote_path::parent(target), request_id); });
    }

    void BridgeSession::handle_delete(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpbridge::protocol::DeleteRequest>();
        if (request.path.empty())
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, "path is required", envelope.request_id);
            return;
        }

        if (request.origin == sftpbridge::protocol::Origin::Local)
        {
            try
            {
                services_.filesystem.remove(request.path, request.type);
            }
            catch (const FilesystemError &error)
            {
                log(sftpbridge::protocol::LogLevel::Error, error.what());
                emit_error(error.code(), error.what(), envelope.request_id);
                return;
            }
            log(sftpbridge::protocol::LogLevel::Success, "Deleted " + request.path);
            emit(sftpbridge::protocol::EventKind::FileDeleted, {{"path", request.path}}, envelope.request_id);
            list_local(local_parent_of(request.path), envelope.request_id);
            return;
        }

        auto channel = sftp_channel();
        if (!channel)
        {
            emit_error(sftpbridge::ErrorCode::NotConnected, "Not connected to SSH", envelope.request_id);
            return;
        }
        const auto target = remote_path::normalize(request.path);
        std::weak_ptr<BridgeSession> weak = weak_from_this();
        const auto request_id = envelope.request_id;
        auto on_removed = [weak, target, request_id](const sftpbridge::Status &status)
        {
            auto self = weak.lock();
            if (!self)
            {
                return;
            }
            if (!status)
            {
                const auto message = "Failed to delete: " + status.message;
                self->log(sftpbridge::protocol::LogLevel::Error, message);
                self->emit_error(sftpbridge::ErrorCode::MutationFailed, message, request_id);
                return;
            }
            self->log(sftpbridge::protocol::LogLevel::Success, "Deleted " + target);
            self->emit(sftpbridge::protocol::EventKind::FileDeleted, {{"path", target}}, request_id);
            self->list_remote(remote_path::parent(target), request_id);
        };

        if (request.type == sftpbridge::protocol::EntryType::Directory)
        {
            channel->remove_directory(target, std::move(on_removed));
        }
        else
        {
            channel->remove_file(target, std::move(on_removed));
        }
    }

} // namespace sftpbridge::server
