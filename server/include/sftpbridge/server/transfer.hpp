#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sftpbridge/error_codes.hpp"
#include "sftpbridge/protocol.hpp"
#include "sftpbridge/server/remote_transport.hpp"
#include "sftpbridge/server/staging.hpp"

namespace sftpbridge::server
{

    inline constexpr std::size_t kTransferChunkSize = 32 * 1024;

    // Integer percentage of one job. Values never decrease, stay below 100 while
    // bytes are still moving, and reach 100 only through complete().
    class ProgressTracker
    {
    public:
        explicit ProgressTracker(std::uint64_t total_bytes) : total_bytes_(total_bytes) {}

        // Returns the new percentage when it rose, nullopt otherwise.
        std::optional<std::uint32_t> advance(std::uint64_t bytes);

        std::uint32_t complete() noexcept;

        std::uint64_t transferred() const noexcept { return transferred_; }
        std::uint64_t total() const noexcept { return total_bytes_; }

        static std::uint32_t percent_of(std::uint64_t transferred, std::uint64_t total) noexcept;

    private:
        std::uint64_t total_bytes_;
        std::uint64_t transferred_{};
        std::optional<std::uint32_t> last_percent_{};
    };

    // Exactly one of on_complete / on_error fires per job.
    struct TransferObserver
    {
        std::function<void(const sftpbridge::protocol::TransferProgress &)> on_progress;
        std::function<void()> on_complete;
        std::function<void(const sftpbridge::protocol::ErrorEvent &)> on_error;
    };

    // Remote -> local. A failed download leaves the partial local file in place.
    class DownloadJob : public std::enable_shared_from_this<DownloadJob>
    {
    public:
        DownloadJob(std::shared_ptr<SftpChannel> channel, std::string remote_path, std::filesystem::path local_path,
                    TransferObserver observer);

        void start();

        const std::string &file_label() const noexcept { return file_label_; }

    private:
        void open_streams(const RemoteAttributes &attributes);
        void read_next();
        void on_read(const sftpbridge::Status &status, std::size_t count);
        void close_remote(sftpbridge::Status outcome);
        void finish(const sftpbridge::Status &outcome);
        void emit_progress(std::uint32_t percent);

        std::shared_ptr<SftpChannel> channel_;
        std::string remote_path_;
        std::filesystem::path local_path_;
        std::string file_label_;
        TransferObserver observer_;

        std::shared_ptr<RemoteFile> file_;
        std::ofstream output_;
        std::vector<std::byte> buffer_;
        ProgressTracker progress_{0};
        bool finished_{false};
    };

    // Local -> remote. The staged source, when there is one, is deleted on every exit path.
    class UploadJob : public std::enable_shared_from_this<UploadJob>
    {
    public:
        UploadJob(std::shared_ptr<SftpChannel> channel, std::filesystem::path source, std::string remote_path,
                  std::string file_label, StagedFile staged, TransferObserver observer);

        void start();

        const std::string &file_label() const noexcept { return file_label_; }

    private:
        void read_next();
        void write_pending(std::size_t offset, std::size_t length);
        void close_remote(sftpbridge::Status outcome);
        void finish(const sftpbridge::Status &outcome);
        void emit_progress(std::uint32_t percent);

        std::shared_ptr<SftpChannel> channel_;
        std::filesystem::path source_;
        std::string remote_path_;
        std::string file_label_;
        StagedFile staged_;
        TransferObserver observer_;

        std::shared_ptr<RemoteFile> file_;
        std::ifstream input_;
        std::vector<std::byte> buffer_;
        ProgressTracker progress_{0};
        bool finished_{false};
    };

} // namespace sftpbridge::server
