#include "sftpbridge/server/connection_state.hpp"

#include <array>

namespace sftpbridge::server
{

    namespace
    {
        constexpr std::array<std::string_view, 4> kStateLabels{"disconnected", "connecting", "connected",
                                                               "disconnecting"};

        constexpr std::array<std::string_view, 8> kEventLabels{
            "connect-requested", "authenticated", "auth-challenge", "ready",
            "error", "end", "disconnect-requested", "closed"};
    } // namespace

    std::string_view to_string(ConnectionState state) noexcept
    {
        const auto index = static_cast<std::size_t>(state);
        return index < kStateLabels.size() ? kStateLabels[index] : "unknown";
    }

    std::string_view to_string(ConnectionEvent event) noexcept
    {
        const auto index = static_cast<std::size_t>(event);
        return index < kEventLabels.size() ? kEventLabels[index] : "unknown";
    }

    std::optional<ConnectionState> next_state(ConnectionState current, ConnectionEvent event) noexcept
    {
        switch (current)
        {
        case ConnectionState::Disconnected:
            if (event == ConnectionEvent::ConnectRequested)
            {
                return ConnectionState::Connecting;
            }
            break;
        case ConnectionState::Connecting:
            switch (event)
            {
            case ConnectionEvent::Authenticated:
            case ConnectionEvent::AuthChallenge:
                return ConnectionState::Connecting;
            case ConnectionEvent::Ready:
                return ConnectionState::Connected;
            case ConnectionEvent::Error:
            case ConnectionEvent::End:
                return ConnectionState::Disconnected;
            case ConnectionEvent::DisconnectRequested:
                return ConnectionState::Disconnecting;
            default:
                break;
            }
            break;
        case ConnectionState::Connected:
            switch (event)
            {
            case ConnectionEvent::Error:
            case ConnectionEvent::End:
                return ConnectionState::Disconnected;
            case ConnectionEvent::DisconnectRequested:
                return ConnectionState::Disconnecting;
            default:
                break;
            }
            break;
        case ConnectionState::Disconnecting:
            if (event == ConnectionEvent::Closed)
            {
                return ConnectionState::Disconnected;
            }
            break;
        }
        return std::nullopt;
    }

    bool ConnectionStateMachine::apply(ConnectionEvent event) noexcept
    {
        const auto next = next_state(state_, event);
        if (!next)
        {
            return false;
        }
        state_ = *next;
        return true;
    }

} // namespace sftpbridge::server
