#pragma once

#include <string>
#include <string_view>

// Remote paths are always POSIX, whatever platform the service runs on.
namespace sftpbridge::server::remote_path
{

    std::string normalize(std::string_view path);

    std::string join(std::string_view directory, std::string_view name);

    // "/tmp/a.txt" -> "/tmp", "/tmp" -> "/", "/" -> "/", "a" -> "."
    std::string parent(std::string_view path);

    std::string basename(std::string_view path);

} // namespace sftpbridge::server::remote_path
