#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sftpbridge::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Standard alphabet with padding; whitespace is ignored. Returns nullopt on malformed input.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace sftpbridge::encoding
