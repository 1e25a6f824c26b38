#include "sftpbridge/server/staging.hpp"

#include <chrono>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "sftpbridge/crypto.hpp"
#include "sftpbridge/server/filesystem.hpp"

namespace sftpbridge::server
{

    namespace
    {
        constexpr std::size_t kNameEntropyBytes = 4;

        std::string safe_basename(std::string_view file_name)
        {
            auto name = std::filesystem::path(std::string(file_name)).filename().string();
            if (name.empty() || name == "." || name == "..")
            {
                return "upload";
            }
            return name;
        }
    } // namespace

    StagedFile::StagedFile(std::filesystem::path path) : path_(std::move(path)) {}

    StagedFile::~StagedFile()
    {
        reset();
    }

    StagedFile::StagedFile(StagedFile &&other) noexcept : path_(std::exchange(other.path_, {})) {}

    StagedFile &StagedFile::operator=(StagedFile &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            path_ = std::exchange(other.path_, {});
        }
        return *this;
    }

    void StagedFile::reset() noexcept
    {
        if (path_.empty())
        {
            return;
        }
        std::error_code ec;
        if (!std::filesystem::remove(path_, ec) && ec)
        {
            spdlog::warn("Failed to remove staged file {}: {}", path_.string(), ec.message());
        }
        path_.clear();
    }

    StagingArea::StagingArea(std::filesystem::path root) : root_(std::move(root))
    {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            spdlog::warn("Staging directory {} is not available yet: {}", root_.string(), ec.message());
        }
    }

    std::filesystem::path StagingArea::unique_path(std::string_view file_name) const
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        return root_ / (std::to_string(millis) + "-" + sftpbridge::crypto::random_hex(kNameEntropyBytes) + "-" +
                        safe_basename(file_name));
    }

    StagedFile StagingArea::stage(std::string_view file_name, std::span<const std::byte> content) const
    {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            throw FilesystemError(sftpbridge::ErrorCode::InternalError,
                                  "Failed to create staging directory: " + ec.message());
        }

        StagedFile staged(unique_path(file_name));
        std::ofstream output(staged.path(), std::ios::binary | std::ios::trunc);
        if (!output)
        {
            throw FilesystemError(sftpbridge::ErrorCode::InternalError, "Failed to create staged file");
        }
        output.write(reinterpret_cast<const char *>(content.data()), static_cast<std::streamsize>(content.size()));
        output.close();
        if (!output)
        {
            throw FilesystemError(sftpbridge::ErrorCode::InternalError, "Failed to write staged file");
        }
        spdlog::debug("Staged {} bytes at {}", content.size(), staged.path().string());
        return staged;
    }

} // namespace sftpbridge::server
