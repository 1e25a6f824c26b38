#include "sftpbridge/server/session.hpp"

#include <filesystem>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "sftpbridge/encoding/base64.hpp"
#include "sftpbridge/server/remote_path.hpp"
#include "sftpbridge/server/transfer.hpp"

namespace sftpbridge::server
{

    void BridgeSession::handle_download(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpbridge::protocol::DownloadRequest>();
        if (request.remote_path.empty())
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, "remotePath is required", envelope.request_id);
            return;
        }
        auto channel = sftp_channel();
        if (!channel)
        {
            emit_error(sftpbridge::ErrorCode::NotConnected, "Not connected to SSH", envelope.request_id);
            return;
        }

        const auto source = remote_path::normalize(request.remote_path);
        const auto file_name = remote_path::basename(source);
        const auto destination = request.local_path.empty()
                                     ? services_.filesystem.default_path() / file_name
                                     : std::filesystem::path(request.local_path).lexically_normal();
        log(sftpbridge::protocol::LogLevel::Info, fmt::format("Downloading {} to {}", source, destination.string()));

        std::weak_ptr<BridgeSession> weak = weak_from_this();
        const auto request_id = envelope.request_id;
        TransferObserver observer{
            .on_progress = [weak, request_id](const sftpbridge::protocol::TransferProgress &progress)
            {
                if (auto self = weak.lock())
                {
                    self->emit(sftpbridge::protocol::EventKind::TransferProgress, progress, request_id);
                }
            },
            .on_complete = [weak, request_id, file_name, local_path = destination.string()]
            {
                if (auto self = weak.lock())
                {
                    self->log(sftpbridge::protocol::LogLevel::Success, "Download complete: " + local_path);
                    self->emit(sftpbridge::protocol::EventKind::DownloadComplete,
                               sftpbridge::protocol::DownloadComplete{.file = file_name, .local_path = local_path},
                               request_id);
                }
            },
            .on_error = [weak, request_id](const sftpbridge::protocol::ErrorEvent &error)
            {
                if (auto self = weak.lock())
                {
                    self->log(sftpbridge::protocol::LogLevel::Error, error.message);
                    self->emit(sftpbridge::protocol::EventKind::Error, error, request_id);
                }
            },
        };

        auto job = std::make_shared<DownloadJob>(std::move(channel), source, destination, std::move(observer));
        job->start();
    }

    void BridgeSession::handle_upload(const sftpbridge::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpbridge::protocol::UploadRequest>();
        if (request.remote_path.empty())
        {
            emit_error(sftpbridge::ErrorCode::InvalidPayload, "remotePath is required", envelope.request_id);
            return;
        }
        auto channel = sftp_channel();
        if (!channel)
        {
            emit_error(sftpbridge::ErrorCode::NotConnected, "Not connected to SSH", envelope.request_id);
            return;
        }

        const auto destination = remote_path::normalize(request.remote_path);
        const auto file_name = request.file_name.value_or(remote_path::basename(destination));

        StagedFile staged;
        std::filesystem::path source;
        if (request.file_content)
        {
            auto content = sftpbridge::encoding::decode_base64(*request.file_content);
            if (!content)
            {
                emit_error(sftpbridge::ErrorCode::InvalidPayload, "fileContent is not valid base64",
                           envelope.request_id);
                return;
            }
            staged = services_.staging.stage(file_name, *content);
            source = staged.path();
        }
        else
        {
            source = std::filesystem::path(*request.local_path).lexically_normal();
        }
        log(sftpbridge::protocol::LogLevel::Info, fmt::format("Uploading {} to {}", file_name, destination));

        std::weak_ptr<BridgeSession> weak = weak_from_this();
        const auto request_id = envelope.request_id;
        TransferObserver observer{
            .on_progress = [weak, request_id](const sftpbridge::protocol::TransferProgress &progress)
            {
                if (auto self = weak.lock())
                {
                    self->emit(sftpbridge::protocol::EventKind::TransferProgress, progress, request_id);
                }
            },
            .on_complete = [weak, request_id, file_name, destination]
            {
                auto self = weak.lock();
                if (!self)
                {
                    return;
                }
                self->log(sftpbridge::protocol::LogLevel::Success, "Upload complete: " + destination);
                self->emit(sftpbridge::protocol::EventKind::UploadComplete,
                           sftpbridge::protocol::UploadComplete{.file = file_name, .remote_path = destination},
                           request_id);
                self->list_remote(remote_path::parent(destination), request_id);
            },
            .on_error = [weak, request_id](const sftpbridge::protocol::ErrorEvent &error)
            {
                if (auto self = weak.lock())
                {
                    self->log(sftpbridge::protocol::LogLevel::Error, error.message);
                    self->emit(sftpbridge::protocol::EventKind::Error, error, request_id);
                }
            },
        };

        auto job = std::make_shared<UploadJob>(std::move(channel), source, destination, file_name, std::move(staged),
                                               std::move(observer));
        job->start();
    }

} // namespace sftpbridge::server
