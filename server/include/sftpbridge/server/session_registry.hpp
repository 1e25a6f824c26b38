#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

#include "sftpbridge/server/event_sink.hpp"
#include "sftpbridge/server/session.hpp"

namespace sftpbridge::server
{

    // Owns every live session. Constructed once by the server and handed to each gateway
    // connection; only the event loop thread touches it.
    class SessionRegistry
    {
    public:
        explicit SessionRegistry(ServerServices services);
        ~SessionRegistry();

        SessionRegistry(const SessionRegistry &) = delete;
        SessionRegistry &operator=(const SessionRegistry &) = delete;

        std::shared_ptr<BridgeSession> create(std::weak_ptr<EventSink> sink);

        std::shared_ptr<BridgeSession> find(const std::string &id) const;

        // Closes the session, ending any transport it holds. Returns false for unknown ids.
        bool destroy(const std::string &id);

        std::size_t size() const noexcept { return sessions_.size(); }

    private:
        std::string generate_id() const;

        ServerServices services_;
        std::unordered_map<std::string, std::shared_ptr<BridgeSession>> sessions_;
    };

} // namespace sftpbridge::server
