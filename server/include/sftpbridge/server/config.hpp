#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace sftpbridge::server
{

    // Per-connection settings handed to every remote transport.
    struct TransportSettings
    {
        std::chrono::seconds keepalive_interval{std::chrono::seconds{10}};
        std::chrono::seconds connect_timeout{std::chrono::seconds{30}};
        // Unanswered keep-alive messages tolerated before the link counts as dead.
        int keepalive_count_max{3};
        // Upper bound on the graceful SSH shutdown before the session is dropped.
        std::chrono::milliseconds shutdown_timeout{std::chrono::milliseconds{1000}};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{3000};
        std::filesystem::path staging_dir;
        TransportSettings transport{};
        std::size_t log_capacity{500};
        std::size_t max_frame_size{128 * 1024 * 1024};
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::info};
    };

    std::filesystem::path default_staging_dir();

} // namespace sftpbridge::server
