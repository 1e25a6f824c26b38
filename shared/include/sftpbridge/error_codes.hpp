/**
 * SFTP Bridge - Error codes shared by the engine and the gateway wire format.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sftpbridge
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotConnected = 3,
        AlreadyConnected = 4,
        SshConnectFailed = 5,
        SftpInitFailed = 6,
        RemoteListingFailed = 7,
        LocalListingFailed = 8,
        RemoteFileNotFound = 9,
        LocalFileNotFound = 10,
        TransferStreamError = 11,
        MutationFailed = 12,
        CommandExecFailed = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    // Outcome of an asynchronous operation. Default-constructed means success.
    struct Status
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message{};

        bool ok() const noexcept { return code == ErrorCode::Ok; }
        explicit operator bool() const noexcept { return ok(); }

        static Status failure(ErrorCode code, std::string message)
        {
            return Status{code, std::move(message)};
        }
    };

} // namespace sftpbridge
