#include "sftpbridge/server/config.hpp"

#include <cstdlib>
#include <system_error>

namespace sftpbridge::server
{

    std::filesystem::path default_staging_dir()
    {
#ifdef _WIN32
        const char *home = std::getenv("USERPROFILE");
#else
        const char *home = std::getenv("HOME");
#endif
        if (home != nullptr && *home != '\0')
        {
            return std::filesystem::path(home) / "SFTP-Bridge" / "temp";
        }
        std::error_code ec;
        const auto temp = std::filesystem::temp_directory_path(ec);
        return (ec ? std::filesystem::path("/tmp") : temp) / "sftp-bridge";
    }

} // namespace sftpbridge::server
