#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>

namespace sftpbridge::server
{

    // Owns one staged upload source. The file is removed when the owner goes away.
    class StagedFile
    {
    public:
        StagedFile() = default;
        explicit StagedFile(std::filesystem::path path);
        ~StagedFile();

        StagedFile(const StagedFile &) = delete;
        StagedFile &operator=(const StagedFile &) = delete;
        StagedFile(StagedFile &&other) noexcept;
        StagedFile &operator=(StagedFile &&other) noexcept;

        const std::filesystem::path &path() const noexcept { return path_; }
        bool empty() const noexcept { return path_.empty(); }

        void reset() noexcept;

    private:
        std::filesystem::path path_;
    };

    // Directory where client-supplied content is materialized before it is streamed.
    class StagingArea
    {
    public:
        explicit StagingArea(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        // Writes `content` to a uniquely named file. Throws FilesystemError on I/O failure.
        StagedFile stage(std::string_view file_name, std::span<const std::byte> content) const;

        // <epoch-millis>-<random-hex>-<basename>
        std::filesystem::path unique_path(std::string_view file_name) const;

    private:
        std::filesystem::path root_;
    };

} // namespace sftpbridge::server
