#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "sftpbridge/error_codes.hpp"
#include "sftpbridge/protocol.hpp"

namespace sftpbridge::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(sftpbridge::ErrorCode code, std::string message);

        sftpbridge::ErrorCode code() const noexcept { return code_; }

    private:
        sftpbridge::ErrorCode code_;
    };

    // Adapter over the filesystem of the machine running the service.
    class LocalFilesystem
    {
    public:
        LocalFilesystem();
        explicit LocalFilesystem(std::filesystem::path default_path);

        static std::string platform();

        std::filesystem::path default_path() const;

        std::vector<std::string> roots() const;

        static bool is_hidden(const std::string &name) noexcept;

        // Lists `directory`, skipping hidden entries and entries that cannot be stat'ed.
        // Throws FilesystemError(LocalListingFailed) when the directory itself cannot be read.
        std::vector<sftpbridge::protocol::FileEntry> list_directory(const std::filesystem::path &directory) const;

        void create_directory(const std::filesystem::path &path) const;

        void remove(const std::filesystem::path &path, sftpbridge::protocol::EntryType type) const;

    private:
        std::filesystem::path default_path_;
    };

} // namespace sftpbridge::server
