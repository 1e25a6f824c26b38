#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sftpbridge/protocol.hpp"
#include "sftpbridge/server/filesystem.hpp"
#include "sftpbridge/server/remote_transport.hpp"

namespace sftpbridge::server
{

    struct LocalListingResult
    {
        sftpbridge::protocol::DirectoryListing listing;
        // Fallbacks taken on the way to the listing, worded for the connection log.
        std::vector<std::string> warnings;
    };

    // Produces one listing shape for both origins.
    class DirectoryListingUnifier
    {
    public:
        explicit DirectoryListingUnifier(const LocalFilesystem &local);

        // Falls back to the default path when the requested one is missing or unreadable.
        // Throws FilesystemError(LocalListingFailed) only when the default path fails too.
        LocalListingResult list_local(const std::string &requested) const;

        // Completes with NotConnected when `channel` is null. No fallback on failure.
        void list_remote(const std::shared_ptr<SftpChannel> &channel, const std::string &requested,
                         ResultHandler<sftpbridge::protocol::DirectoryListing> handler) const;

        static std::vector<sftpbridge::protocol::FileEntry> to_entries(const std::string &directory,
                                                                       const std::vector<RemoteDirEntry> &records);

    private:
        sftpbridge::protocol::DirectoryListing local_listing(const std::filesystem::path &directory) const;

        const LocalFilesystem &local_;
    };

} // namespace sftpbridge::server
