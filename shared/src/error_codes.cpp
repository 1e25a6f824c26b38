#include "sftpbridge/error_codes.hpp"

#include <array>

namespace sftpbridge
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::NotConnected, "not_connected"},
            {ErrorCode::AlreadyConnected, "already_connected"},
            {ErrorCode::SshConnectFailed, "ssh_connect_failed"},
            {ErrorCode::SftpInitFailed, "sftp_init_failed"},
            {ErrorCode::RemoteListingFailed, "remote_listing_failed"},
            {ErrorCode::LocalListingFailed, "local_listing_failed"},
            {ErrorCode::RemoteFileNotFound, "remote_file_not_found"},
            {ErrorCode::LocalFileNotFound, "local_file_not_found"},
            {ErrorCode::TransferStreamError, "transfer_stream_error"},
            {ErrorCode::MutationFailed, "mutation_failed"},
            {ErrorCode::CommandExecFailed, "command_exec_failed"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace sftpbridge
