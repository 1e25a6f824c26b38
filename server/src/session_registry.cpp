#include "sftpbridge/server/session_registry.hpp"

#include <spdlog/spdlog.h>

#include "sftpbridge/crypto.hpp"

namespace sftpbridge::server
{

    namespace
    {
        constexpr std::size_t kSessionIdBytes = 8;
    } // namespace

    SessionRegistry::SessionRegistry(ServerServices services) : services_(std::move(services)) {}

    SessionRegistry::~SessionRegistry()
    {
        for (auto &[id, session] : sessions_)
        {
            session->close();
        }
    }

    std::shared_ptr<BridgeSession> SessionRegistry::create(std::weak_ptr<EventSink> sink)
    {
        auto id = generate_id();
        auto session = std::make_shared<BridgeSession>(id, std::move(sink), services_);
        sessions_.emplace(std::move(id), session);
        spdlog::info("Session {} created ({} active)", session->id(), sessions_.size());
        return session;
    }

    std::shared_ptr<BridgeSession> SessionRegistry::find(const std::string &id) const
    {
        const auto it = sessions_.find(id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    bool SessionRegistry::destroy(const std::string &id)
    {
        const auto it = sessions_.find(id);
        if (it == sessions_.end())
        {
            return false;
        }
        auto session = std::move(it->second);
        sessions_.erase(it);
        session->close();
        spdlog::info("Session {} destroyed ({} active)", id, sessions_.size());
        return true;
    }

    std::string SessionRegistry::generate_id() const
    {
        for (;;)
        {
            auto candidate = sftpbridge::crypto::random_hex(kSessionIdBytes);
            if (!sessions_.contains(candidate))
            {
                return candidate;
            }
        }
    }

} // namespace sftpbridge::server
