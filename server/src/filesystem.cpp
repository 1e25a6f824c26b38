#include "sftpbridge/server/filesystem.hpp"

#include <chrono>
#include <cstdlib>
#include <system_error>

#include <spdlog/spdlog.h>

namespace sftpbridge::server
{

    FilesystemError::FilesystemError(sftpbridge::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr std::uint32_t kPermissionMask = 07777;

        std::uint64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto sctp = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                       std::chrono::system_clock::now());
            const auto count = sctp.time_since_epoch().count();
            return count < 0 ? 0 : static_cast<std::uint64_t>(count);
        }

        std::filesystem::path home_directory()
        {
#ifdef _WIN32
            const char *home = std::getenv("USERPROFILE");
#else
            const char *home = std::getenv("HOME");
#endif
            if (home != nullptr && *home != '\0')
            {
                return std::filesystem::path(home);
            }
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            return ec ? std::filesystem::path("/") : cwd;
        }

        std::filesystem::path platform_default_path()
        {
#ifdef _WIN32
            return home_directory() / "Downloads";
#else
            return home_directory();
#endif
        }

    } // namespace

    LocalFilesystem::LocalFilesystem() : default_path_(platform_default_path()) {}

    LocalFilesystem::LocalFilesystem(std::filesystem::path default_path) : default_path_(std::move(default_path)) {}

    std::string LocalFilesystem::platform()
    {
#if defined(_WIN32)
        return "win32";
#elif defined(__APPLE__)
        return "darwin";
#elif defined(__linux__)
        return "linux";
#else
        return "unknown";
#endif
    }

    std::filesystem::path LocalFilesystem::default_path() const
    {
        return default_path_;
    }

    std::vector<std::string> LocalFilesystem::roots() const
    {
#ifdef _WIN32
        std::vector<std::string> drives;
        for (char letter = 'A'; letter <= 'Z'; ++letter)
        {
            const std::string drive = std::string(1, letter) + ":\\";
            std::error_code ec;
            if (std::filesystem::exists(drive, ec))
            {
                drives.push_back(drive);
            }
        }
        return drives;
#else
        return {"/"};
#endif
    }

    bool LocalFilesystem::is_hidden(const std::string &name) noexcept
    {
        return !name.empty() && (name.front() == '.' || name.front() == '$');
    }

    std::vector<sftpbridge::protocol::FileEntry> LocalFilesystem::list_directory(
        const std::filesystem::path &directory) const
    {
        std::error_code ec;
        std::filesystem::directory_iterator it(directory, ec);
        if (ec)
        {
            throw FilesystemError(sftpbridge::ErrorCode::LocalListingFailed,
                                  "Failed to list directory: " + ec.message());
        }

        std::vector<sftpbridge::protocol::FileEntry> entries;
        for (const std::filesystem::directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
            {
                throw FilesystemError(sftpbridge::ErrorCode::LocalListingFailed,
                                      "Failed to list directory: " + ec.message());
            }
            const auto &entry = *it;
            const auto name = entry.path().filename().string();
            if (is_hidden(name))
            {
                continue;
            }

            std::error_code stat_ec;
            const auto status = entry.status(stat_ec);
            if (stat_ec || !std::filesystem::exists(status))
            {
                spdlog::debug("Skipping {}: {}", entry.path().string(),
                              stat_ec ? stat_ec.message() : std::string("dangling entry"));
                continue;
            }

            sftpbridge::protocol::FileEntry record{};
            record.name = name;
            record.path = entry.path().string();
            record.type = std::filesystem::is_directory(status) ? sftpbridge::protocol::EntryType::Directory
                                                                 : sftpbridge::protocol::EntryType::File;
            record.permissions = static_cast<std::uint32_t>(status.permissions()) & kPermissionMask;
            if (std::filesystem::is_regular_file(status))
            {
                const auto size = entry.file_size(stat_ec);
                record.size = stat_ec ? 0 : size;
            }
            const auto modified = entry.last_write_time(stat_ec);
            record.modified_time = stat_ec ? 0 : to_unix_time(modified);
            entries.push_back(std::move(record));
        }
        return entries;
    }

    void LocalFilesystem::create_directory(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw FilesystemError(sftpbridge::ErrorCode::MutationFailed,
                                  "Failed to create directory: " + ec.message());
        }
    }

    void LocalFilesystem::remove(const std::filesystem::path &path, sftpbridge::protocol::EntryType type) const
    {
        std::error_code ec;
        if (type == sftpbridge::protocol::EntryType::Directory)
        {
            if (!std::filesystem::is_directory(path, ec))
            {
                throw FilesystemError(sftpbridge::ErrorCode::MutationFailed, "Failed to delete: not a directory");
            }
            std::filesystem::remove_all(path, ec);
        }
        else
        {
            if (std::filesystem::is_directory(path, ec))
            {
                throw FilesystemError(sftpbridge::ErrorCode::MutationFailed, "Failed to delete: target is a directory");
            }
            if (!std::filesystem::remove(path, ec) && !ec)
            {
                throw FilesystemError(sftpbridge::ErrorCode::MutationFailed,
                                      "Failed to delete: no such file or directory");
            }
        }
        if (ec)
        {
            throw FilesystemError(sftpbridge::ErrorCode::MutationFailed, "Failed to delete: " + ec.message());
        }
    }

} // namespace sftpbridge::server
