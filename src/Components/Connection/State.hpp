//----------------------------------------------------------------------------------------------------------------------
// File: State.hpp
// Description: The lifecycle states of a connection and the causes of its closure.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Connection {
//----------------------------------------------------------------------------------------------------------------------

enum class State : std::uint32_t { Connecting, Open, Draining, Closed };

// Note: The connection level errors are Refused, Timeout, HeartbeatLost, and ProtocolViolation. The remaining causes
// describe deliberate closures.
enum class Cause : std::uint32_t
{
    TransportClosed,
    Refused,
    Timeout,
    HeartbeatLost,
    ProtocolViolation,
    Rejected,
    Superseded,
    Unpaired,
    Shutdown
};

enum class Role : std::uint32_t { Acceptor, Initiator };

// The per connection toggles a peer may change with a client_setting message.
enum class Setting : std::uint32_t { ClipboardSync, NotificationMirroring };

using Key = std::uint64_t;

[[nodiscard]] std::string_view StateToString(State state);
[[nodiscard]] std::string_view CauseToString(Cause cause);

[[nodiscard]] std::optional<Setting> StringToSetting(std::string_view value);

// Recoverable causes are answered with a reconnect attempt when the local side initiated the connection.
[[nodiscard]] bool IsRecoverable(Cause cause);

//----------------------------------------------------------------------------------------------------------------------
} // Connection namespace
//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Connection::StateToString(State state)
{
    switch (state) {
        case State::Connecting: return "connecting";
        case State::Open: return "open";
        case State::Draining: return "draining";
        case State::Closed: return "closed";
        default: return "unknown";
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Connection::CauseToString(Cause cause)
{
    switch (cause) {
        case Cause::TransportClosed: return "transport closed";
        case Cause::Refused: return "refused";
        case Cause::Timeout: return "timeout";
        case Cause::HeartbeatLost: return "heartbeat lost";
        case Cause::ProtocolViolation: return "protocol violation";
        case Cause::Rejected: return "rejected";
        case Cause::Superseded: return "superseded";
        case Cause::Unpaired: return "unpaired";
        case Cause::Shutdown: return "shutdown";
        default: return "unknown";
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<Connection::Setting> Connection::StringToSetting(std::string_view value)
{
    if (value == "clipboard_sync") { return Setting::ClipboardSync; }
    if (value == "notification_mirroring") { return Setting::NotificationMirroring; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

inline bool Connection::IsRecoverable(Cause cause)
{
    switch (cause) {
        case Cause::TransportClosed:
        case Cause::Refused:
        case Cause::Timeout:
        case Cause::HeartbeatLost:
        case Cause::ProtocolViolation: return true;
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------
