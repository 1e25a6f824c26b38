#include "sftpbridge/server/transfer.hpp"

#include <algorithm>
#include <span>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "sftpbridge/server/remote_path.hpp"

namespace sftpbridge::server
{

    namespace
    {
        constexpr std::uint32_t kStreamingCeiling = 99;

        sftpbridge::protocol::ErrorEvent make_transfer_error(const sftpbridge::Status &status, const std::string &file,
                                                             sftpbridge::protocol::TransferDirection direction)
        {
            const char *prefix = direction == sftpbridge::protocol::TransferDirection::Download ? "Download failed: "
                                                                                                : "Upload failed: ";
            sftpbridge::protocol::ErrorEvent event{};
            event.code = status.code;
            event.message = status.code == sftpbridge::ErrorCode::RemoteFileNotFound ||
                                    status.code == sftpbridge::ErrorCode::LocalFileNotFound
                                ? status.message
                                : prefix + status.message;
            event.file = file;
            event.direction = direction;
            return event;
        }
    } // namespace

    std::uint32_t ProgressTracker::percent_of(std::uint64_t transferred, std::uint64_t total) noexcept
    {
        if (total == 0)
        {
            return transferred == 0 ? 0 : 100;
        }
        // round(transferred * 100 / total) without floating point
        const auto scaled = (transferred * 200 + total) / (2 * total);
        return static_cast<std::uint32_t>(std::min<std::uint64_t>(scaled, 100));
    }

    std::optional<std::uint32_t> ProgressTracker::advance(std::uint64_t bytes)
    {
        transferred_ += bytes;
        const auto percent = std::min(percent_of(transferred_, total_bytes_), kStreamingCeiling);
        if (last_percent_ && percent <= *last_percent_)
        {
            return std::nullopt;
        }
        last_percent_ = percent;
        return percent;
    }

    std::uint32_t ProgressTracker::complete() noexcept
    {
        last_percent_ = 100;
        return 100;
    }

    DownloadJob::DownloadJob(std::shared_ptr<SftpChannel> channel, std::string remote_path,
                             std::filesystem::path local_path, TransferObserver observer)
        : channel_(std::move(channel)),
          remote_path_(std::move(remote_path)),
          local_path_(std::move(local_path)),
          file_label_(remote_path::basename(remote_path_)),
          observer_(std::move(observer)) {}

    void DownloadJob::start()
    {
        spdlog::debug("Download {} -> {}", remote_path_, local_path_.string());
        auto self = shared_from_this();
        channel_->stat(remote_path_, [self](const sftpbridge::Status &status, RemoteAttributes attributes)
                       {
            if (!status)
            {
                self->finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::RemoteFileNotFound,
                                                         "File not found: " + status.message));
                return;
            }
            self->open_streams(attributes); });
    }

    void DownloadJob::open_streams(const RemoteAttributes &attributes)
    {
        progress_ = ProgressTracker(attributes.size);

        const auto parent = local_path_.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                spdlog::debug("Could not create {}: {}", parent.string(), ec.message());
            }
        }

        output_.open(local_path_, std::ios::binary | std::ios::trunc);
        if (!output_)
        {
            finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                               "Cannot open " + local_path_.string() + " for writing"));
            return;
        }

        auto self = shared_from_this();
        channel_->open(remote_path_, OpenMode::Read,
                       [self](const sftpbridge::Status &status, std::shared_ptr<RemoteFile> file)
                       {
                           if (!status)
                           {
                               self->output_.close();
                               self->finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                                        status.message));
                               return;
                           }
                           self->file_ = std::move(file);
                           self->buffer_.resize(kTransferChunkSize);
                           self->read_next();
                       });
    }

    void DownloadJob::read_next()
    {
        auto self = shared_from_this();
        file_->read(std::span<std::byte>(buffer_), [self](const sftpbridge::Status &status, std::size_t count)
                    { self->on_read(status, count); });
    }

    void DownloadJob::on_read(const sftpbridge::Status &status, std::size_t count)
    {
        if (!status)
        {
            output_.close();
            close_remote(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError, status.message));
            return;
        }
        if (count == 0)
        {
            output_.close();
            if (!output_)
            {
                close_remote(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                         "Failed to flush " + local_path_.string()));
                return;
            }
            close_remote(sftpbridge::Status{});
            return;
        }

        output_.write(reinterpret_cast<const char *>(buffer_.data()), static_cast<std::streamsize>(count));
        if (!output_)
        {
            output_.close();
            close_remote(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                     "Failed to write " + local_path_.string()));
            return;
        }
        if (const auto percent = progress_.advance(count))
        {
            emit_progress(*percent);
        }
        read_next();
    }

    void DownloadJob::close_remote(sftpbridge::Status outcome)
    {
        if (!file_)
        {
            finish(outcome);
            return;
        }
        auto file = std::move(file_);
        auto self = shared_from_this();
        file->close([self, file, outcome = std::move(outcome)](const sftpbridge::Status &close_status)
                    {
            if (outcome && !close_status)
            {
                self->finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                         close_status.message));
                return;
            }
            self->finish(outcome); });
    }

    void DownloadJob::finish(const sftpbridge::Status &outcome)
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;
        if (!outcome)
        {
            spdlog::warn("Download of {} failed: {}", remote_path_, outcome.message);
            if (observer_.on_error)
            {
                observer_.on_error(
                    make_transfer_error(outcome, file_label_, sftpbridge::protocol::TransferDirection::Download));
            }
            return;
        }
        emit_progress(progress_.complete());
        spdlog::info("Download complete: {}", local_path_.string());
        if (observer_.on_complete)
        {
            observer_.on_complete();
        }
    }

    void DownloadJob::emit_progress(std::uint32_t percent)
    {
        if (!observer_.on_progress)
        {
            return;
        }
        observer_.on_progress(sftpbridge::protocol::TransferProgress{
            .file = file_label_,
            .percent = percent,
            .direction = sftpbridge::protocol::TransferDirection::Download,
            .bytes_transferred = progress_.transferred(),
            .total_bytes = progress_.total(),
        });
    }

    UploadJob::UploadJob(std::shared_ptr<SftpChannel> channel, std::filesystem::path source, std::string remote_path,
                         std::string file_label, StagedFile staged, TransferObserver observer)
        : channel_(std::move(channel)),
          source_(std::move(source)),
          remote_path_(std::move(remote_path)),
          file_label_(file_label.empty() ? remote_path::basename(remote_path_) : std::move(file_label)),
          staged_(std::move(staged)),
          observer_(std::move(observer)) {}

    void UploadJob::start()
    {
        spdlog::debug("Upload {} -> {}", source_.string(), remote_path_);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source_, ec))
        {
            finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::LocalFileNotFound, "Local file not found"));
            return;
        }
        const auto size = std::filesystem::file_size(source_, ec);
        if (ec)
        {
            finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::LocalFileNotFound,
                                               "Local file not found: " + ec.message()));
            return;
        }
        progress_ = ProgressTracker(size);

        input_.open(source_, std::ios::binary);
        if (!input_)
        {
            finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::LocalFileNotFound,
                                               "Cannot open " + source_.string() + " for reading"));
            return;
        }

        auto self = shared_from_this();
        channel_->open(remote_path_, OpenMode::Write,
                       [self](const sftpbridge::Status &status, std::shared_ptr<RemoteFile> file)
                       {
                           if (!status)
                           {
                               self->finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                                        status.message));
                               return;
                           }
                           self->file_ = std::move(file);
                           self->buffer_.resize(kTransferChunkSize);
                           self->read_next();
                       });
    }

    void UploadJob::read_next()
    {
        input_.read(reinterpret_cast<char *>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
        const auto count = static_cast<std::size_t>(input_.gcount());
        if (input_.bad())
        {
            close_remote(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                     "Failed to read " + source_.string()));
            return;
        }
        if (count == 0)
        {
            close_remote(sftpbridge::Status{});
            return;
        }
        write_pending(0, count);
    }

    void UploadJob::write_pending(std::size_t offset, std::size_t length)
    {
        auto self = shared_from_this();
        const std::span<const std::byte> pending(buffer_.data() + offset, length - offset);
        file_->write(pending, [self, offset, length](const sftpbridge::Status &status, std::size_t written)
                     {
            if (!status)
            {
                self->close_remote(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                               status.message));
                return;
            }
            if (written == 0)
            {
                self->close_remote(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                               "Remote write made no progress"));
                return;
            }
            if (const auto percent = self->progress_.advance(written))
            {
                self->emit_progress(*percent);
            }
            const auto next = offset + written;
            if (next < length)
            {
                self->write_pending(next, length);
                return;
            }
            self->read_next(); });
    }

    void UploadJob::close_remote(sftpbridge::Status outcome)
    {
        input_.close();
        if (!file_)
        {
            finish(outcome);
            return;
        }
        auto file = std::move(file_);
        auto self = shared_from_this();
        file->close([self, file, outcome = std::move(outcome)](const sftpbridge::Status &close_status)
                    {
            if (outcome && !close_status)
            {
                self->finish(sftpbridge::Status::failure(sftpbridge::ErrorCode::TransferStreamError,
                                                         close_status.message));
                return;
            }
            self->finish(outcome); });
    }

    void UploadJob::finish(const sftpbridge::Status &outcome)
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;
        staged_.reset();
        if (!outcome)
        {
            spdlog::warn("Upload to {} failed: {}", remote_path_, outcome.message);
            if (observer_.on_error)
            {
                observer_.on_error(
                    make_transfer_error(outcome, file_label_, sftpbridge::protocol::TransferDirection::Upload));
            }
            return;
        }
        emit_progress(progress_.complete());
        spdlog::info("Upload complete: {}", remote_path_);
        if (observer_.on_complete)
        {
            observer_.on_complete();
        }
    }

    void UploadJob::emit_progress(std::uint32_t percent)
    {
        if (!observer_.on_progress)
        {
            return;
        }
        observer_.on_progress(sftpbridge::protocol::TransferProgress{
            .file = file_label_,
            .percent = percent,
            .direction = sftpbridge::protocol::TransferDirection::Upload,
            .bytes_transferred = progress_.transferred(),
            .total_bytes = progress_.total(),
        });
    }

} // namespace sftpbridge::server
