#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sftpbridge::server
{

    enum class ConnectionState : std::uint8_t
    {
        Disconnected,
        Connecting,
        Connected,
        Disconnecting
    };

    enum class ConnectionEvent : std::uint8_t
    {
        ConnectRequested,
        Authenticated,
        AuthChallenge,
        Ready,
        Error,
        End,
        DisconnectRequested,
        Closed
    };

    std::string_view to_string(ConnectionState state) noexcept;
    std::string_view to_string(ConnectionEvent event) noexcept;

    // Transition table of a session's remote connection:
    //
    //   Disconnected --ConnectRequested--> Connecting
    //   Connecting   --Authenticated / AuthChallenge--> Connecting
    //   Connecting   --Ready--> Connected
    //   Connecting, Connected --Error / End--> Disconnected
    //   Connecting, Connected --DisconnectRequested--> Disconnecting
    //   Disconnecting --Closed--> Disconnected
    //
    // Every other pair is rejected.
    std::optional<ConnectionState> next_state(ConnectionState current, ConnectionEvent event) noexcept;

    class ConnectionStateMachine
    {
    public:
        ConnectionState state() const noexcept { return state_; }

        // Applies the event; returns false and leaves the state untouched when the transition is invalid.
        bool apply(ConnectionEvent event) noexcept;

        bool permits_remote_operations() const noexcept { return state_ == ConnectionState::Connected; }

    private:
        ConnectionState state_{ConnectionState::Disconnected};
    };

} // namespace sftpbridge::server
