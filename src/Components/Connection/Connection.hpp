//----------------------------------------------------------------------------------------------------------------------
// File: Connection.hpp
// Description: The state of one live duplex session with a device. A connection is exclusively owned by the
// connection manager; other components address peers by device identifier and never hold a connection.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "State.hpp"
#include "Components/Device/Device.hpp"
#include "Interfaces/Transport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Connection {
//----------------------------------------------------------------------------------------------------------------------

using Clock = std::chrono::steady_clock;

class Connection;

//----------------------------------------------------------------------------------------------------------------------
} // Connection namespace
//----------------------------------------------------------------------------------------------------------------------

class Connection::Connection
{
public:
    Connection(Key key, Role role, SharedTransport const& spTransport, Clock::time_point const& now);

    Connection(Connection const&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection const&) = delete;
    Connection& operator=(Connection&&) = delete;

    [[nodiscard]] Key GetKey() const;
    [[nodiscard]] Role GetRole() const;
    [[nodiscard]] State GetState() const;
    [[nodiscard]] std::optional<Cause> GetCause() const;
    [[nodiscard]] Network::RemoteAddress const& GetAddress() const;

    // The peer is only known once the handshake has completed.
    [[nodiscard]] Device::Identifier const& GetPeer() const;
    [[nodiscard]] Device::Details const& GetPeerDetails() const;

    // The reconnect target of connections opened by the local side.
    [[nodiscard]] std::optional<std::string> const& GetTarget() const;
    void SetTarget(std::string const& target);

    [[nodiscard]] Clock::time_point GetCreated() const;
    [[nodiscard]] Clock::time_point GetLastActivity() const;
    [[nodiscard]] Clock::time_point GetLastTransition() const;
    [[nodiscard]] Clock::time_point GetLastHeartbeat() const;
    [[nodiscard]] std::uint32_t GetMissedHeartbeats() const;

    [[nodiscard]] bool IsEnabled(Setting setting) const;
    void SetEnabled(Setting setting, bool enabled);

    [[nodiscard]] bool Open(Device::Details const& peer, Clock::time_point const& now);
    [[nodiscard]] bool Drain(Cause cause, Clock::time_point const& now);
    [[nodiscard]] bool Close(Cause cause, Clock::time_point const& now);

    void OnActivity(Clock::time_point const& now);
    void OnHeartbeatSent(Clock::time_point const& now);
    void OnHeartbeatMissed();

    [[nodiscard]] bool SendText(std::string&& frame);
    [[nodiscard]] bool SendBinary(std::vector<std::uint8_t>&& frame);
    void CloseTransport();

    [[nodiscard]] std::uint64_t GetSentBytes() const;
    [[nodiscard]] std::uint64_t GetReceivedBytes() const;
    void OnReceived(std::size_t bytes);

private:
    Key const m_key;
    Role const m_role;
    SharedTransport const m_spTransport;

    State m_state;
    std::optional<Cause> m_optCause;
    Device::Details m_peer;
    std::optional<std::string> m_optTarget;
    std::set<Setting> m_disabled;

    Clock::time_point const m_created;
    Clock::time_point m_lastActivity;
    Clock::time_point m_lastTransition;
    Clock::time_point m_lastHeartbeat;
    std::uint32_t m_missedHeartbeats;

    std::uint64_t m_sent;
    std::uint64_t m_received;
};

//----------------------------------------------------------------------------------------------------------------------
