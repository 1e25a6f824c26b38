/**
 * SFTP Bridge - Length-prefixed JSON framing used by the event gateway.
 *
 * A frame is a 4-byte big-endian payload length followed by a UTF-8 JSON document.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace sftpbridge::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    class FrameTooLarge : public std::length_error
    {
    public:
        explicit FrameTooLarge(std::size_t size);
    };

    // Payload length announced by a frame header.
    // Throws FrameTooLarge when it exceeds max_payload.
    std::uint32_t read_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header, std::size_t max_payload);

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

} // namespace sftpbridge::protocol
