#include "sftpbridge/framing.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace sftpbridge::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }
    } // namespace

    FrameTooLarge::FrameTooLarge(std::size_t size)
        : std::length_error("Frame of " + std::to_string(size) + " bytes exceeds the configured limit") {}

    std::uint32_t read_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header, std::size_t max_payload)
    {
        const auto payload_size = read_u32_be(header);
        if (payload_size > max_payload)
        {
            throw FrameTooLarge(payload_size);
        }
        return payload_size;
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (text.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw FrameTooLarge(text.size());
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()),
                     std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

} // namespace sftpbridge::protocol
