#include "sftpbridge/server/directory_listing.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "sftpbridge/server/remote_path.hpp"

namespace sftpbridge::server
{

    namespace
    {
        constexpr std::uint32_t kPermissionMask = 07777;

        std::string local_parent(const std::filesystem::path &directory)
        {
            const auto parent = directory.parent_path();
            return parent.empty() ? directory.string() : parent.string();
        }
    } // namespace

    DirectoryListingUnifier::DirectoryListingUnifier(const LocalFilesystem &local) : local_(local) {}

    sftpbridge::protocol::DirectoryListing DirectoryListingUnifier::local_listing(
        const std::filesystem::path &directory) const
    {
        sftpbridge::protocol::DirectoryListing listing{};
        listing.origin = sftpbridge::protocol::Origin::Local;
        listing.path = directory.string();
        listing.parent = local_parent(directory);
        listing.entries = local_.list_directory(directory);
        return listing;
    }

    LocalListingResult DirectoryListingUnifier::list_local(const std::string &requested) const
    {
        LocalListingResult result{};
        const auto fallback = local_.default_path();

        std::filesystem::path target = requested.empty() ? fallback : std::filesystem::path(requested).lexically_normal();
        if (target.has_relative_path() && !target.has_filename())
        {
            target = target.parent_path();
        }

        std::error_code ec;
        if (!std::filesystem::exists(target, ec))
        {
            result.warnings.push_back("Path not found: " + target.string() + ", using default " + fallback.string());
            target = fallback;
        }

        try
        {
            result.listing = local_listing(target);
            return result;
        }
        catch (const FilesystemError &error)
        {
            if (target == fallback)
            {
                throw;
            }
            spdlog::warn("Listing {} failed, falling back to {}: {}", target.string(), fallback.string(), error.what());
            result.warnings.push_back(std::string(error.what()) + " (" + target.string() + "), using default " +
                                      fallback.string());
        }

        result.listing = local_listing(fallback);
        return result;
    }

    void DirectoryListingUnifier::list_remote(const std::shared_ptr<SftpChannel> &channel, const std::string &requested,
                                              ResultHandler<sftpbridge::protocol::DirectoryListing> handler) const
    {
        if (!channel)
        {
            handler(sftpbridge::Status::failure(sftpbridge::ErrorCode::NotConnected, "Not connected to SSH"), {});
            return;
        }

        auto directory = remote_path::normalize(requested.empty() ? std::string("/") : requested);
        channel->read_directory(
            directory, [directory, handler = std::move(handler)](const sftpbridge::Status &status,
                                                                 std::vector<RemoteDirEntry> records)
            {
                if (!status)
                {
                    handler(sftpbridge::Status::failure(sftpbridge::ErrorCode::RemoteListingFailed,
                                                        "Failed to list directory: " + status.message),
                            {});
                    return;
                }
                sftpbridge::protocol::DirectoryListing listing{};
                listing.origin = sftpbridge::protocol::Origin::Remote;
                listing.path = directory;
                listing.parent = remote_path::parent(directory);
                listing.entries = to_entries(directory, records);
                handler(sftpbridge::Status{}, std::move(listing));
            });
    }

    std::vector<sftpbridge::protocol::FileEntry> DirectoryListingUnifier::to_entries(
        const std::string &directory, const std::vector<RemoteDirEntry> &records)
    {
        std::vector<sftpbridge::protocol::FileEntry> entries;
        entries.reserve(records.size());
        for (const auto &record : records)
        {
            if (record.filename.empty() || record.filename == "." || record.filename == "..")
            {
                continue;
            }
            sftpbridge::protocol::FileEntry entry{};
            entry.name = record.filename;
            // The long form follows ls -l, so its first character is the type.
            entry.type = !record.longname.empty() && record.longname.front() == 'd'
                             ? sftpbridge::protocol::EntryType::Directory
                             : sftpbridge::protocol::EntryType::File;
            entry.size = record.attributes.size;
            entry.modified_time = record.attributes.modified_time;
            entry.permissions = record.attributes.permissions & kPermissionMask;
            entry.path = remote_path::join(directory, record.filename);
            entries.push_back(std::move(entry));
        }
        return entries;
    }

} // namespace sftpbridge::server
