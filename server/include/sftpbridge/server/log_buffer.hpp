#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "sftpbridge/protocol.hpp"

namespace sftpbridge::server
{

    // Append-only connection log of one session, capped at `capacity` entries (oldest evicted first).
    class LogBuffer
    {
    public:
        explicit LogBuffer(std::size_t capacity);

        const sftpbridge::protocol::LogEntry &append(sftpbridge::protocol::LogLevel level, std::string message);

        void clear() noexcept;

        std::vector<sftpbridge::protocol::LogEntry> entries() const;

        std::size_t size() const noexcept { return entries_.size(); }
        std::size_t capacity() const noexcept { return capacity_; }

    private:
        std::size_t capacity_;
        std::deque<sftpbridge::protocol::LogEntry> entries_;
    };

    // Current UTC time as ISO-8601 with millisecond precision, e.g. 2024-01-31T12:00:00.000Z.
    std::string iso8601_now();

} // namespace sftpbridge::server
