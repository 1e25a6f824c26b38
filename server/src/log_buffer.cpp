#include "sftpbridge/server/log_buffer.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

#include <spdlog/fmt/fmt.h>

namespace sftpbridge::server
{

    LogBuffer::LogBuffer(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

    const sftpbridge::protocol::LogEntry &LogBuffer::append(sftpbridge::protocol::LogLevel level, std::string message)
    {
        while (entries_.size() >= capacity_)
        {
            entries_.pop_front();
        }
        entries_.push_back(sftpbridge::protocol::LogEntry{
            .timestamp = iso8601_now(),
            .message = std::move(message),
            .level = level,
        });
        return entries_.back();
    }

    void LogBuffer::clear() noexcept
    {
        entries_.clear();
    }

    std::vector<sftpbridge::protocol::LogEntry> LogBuffer::entries() const
    {
        return {entries_.begin(), entries_.end()};
    }

    std::string iso8601_now()
    {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        const std::time_t seconds_since_epoch = system_clock::to_time_t(now);
        std::tm utc{};
#ifdef _WIN32
        gmtime_s(&utc, &seconds_since_epoch);
#else
        gmtime_r(&seconds_since_epoch, &utc);
#endif
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900, utc.tm_mon + 1,
                           utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    }

} // namespace sftpbridge::server
