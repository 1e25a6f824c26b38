#pragma once

#include "sftpbridge/protocol.hpp"

namespace sftpbridge::server
{

    // Outbound side of one gateway connection. Events are delivered in emission order.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual void emit(const sftpbridge::protocol::EventEnvelope &event) = 0;
    };

} // namespace sftpbridge::server
