//----------------------------------------------------------------------------------------------------------------------
// File: Connection.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Connection.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Connection::Connection::Connection(
    Key key, Role role, SharedTransport const& spTransport, Clock::time_point const& now)
    : m_key(key)
    , m_role(role)
    , m_spTransport(spTransport)
    , m_state(State::Connecting)
    , m_optCause()
    , m_peer()
    , m_optTarget()
    , m_disabled()
    , m_created(now)
    , m_lastActivity(now)
    , m_lastTransition(now)
    , m_lastHeartbeat(now)
    , m_missedHeartbeats(0)
    , m_sent(0)
    , m_received(0)
{
    assert(m_spTransport);
}

//----------------------------------------------------------------------------------------------------------------------

Connection::Key Connection::Connection::GetKey() const { return m_key; }

//----------------------------------------------------------------------------------------------------------------------

Connection::Role Connection::Connection::GetRole() const { return m_role; }

//----------------------------------------------------------------------------------------------------------------------

Connection::State Connection::Connection::GetState() const { return m_state; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Connection::Cause> Connection::Connection::GetCause() const { return m_optCause; }

//----------------------------------------------------------------------------------------------------------------------

Network::RemoteAddress const& Connection::Connection::GetAddress() const { return m_spTransport->GetAddress(); }

//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const& Connection::Connection::GetPeer() const { return m_peer.identifier; }

//----------------------------------------------------------------------------------------------------------------------

Device::Details const& Connection::Connection::GetPeerDetails() const { return m_peer; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Connection::Connection::GetTarget() const { return m_optTarget; }

//----------------------------------------------------------------------------------------------------------------------

void Connection::Connection::SetTarget(std::string const& target) { m_optTarget = target; }

//----------------------------------------------------------------------------------------------------------------------

Connection::Clock::time_point Connection::Connection::GetCreated() const { return m_created; }

//----------------------------------------------------------------------------------------------------------------------

Connection::Clock::time_point Connection::Connection::GetLastActivity() const { return m_lastActivity; }

//----------------------------------------------------------------------------------------------------------------------

Connection::Clock::time_point Connection::Connection::GetLastTransition() const { return m_lastTransition; }

//----------------------------------------------------------------------------------------------------------------------

Connection::Clock::time_point Connection::Connection::GetLastHeartbeat() const { return m_lastHeartbeat; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Connection::Connection::GetMissedHeartbeats() const { return m_missedHeartbeats; }

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Connection::IsEnabled(Setting setting) const
{
    return !m_disabled.contains(setting);
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Connection::SetEnabled(Setting setting, bool enabled)
{
    if (enabled) { m_disabled.erase(setting); } else { m_disabled.emplace(setting); }
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Connection::Open(Device::Details const& peer, Clock::time_point const& now)
{
    if (m_state != State::Connecting) { return false; }
    m_peer = peer;
    m_state = State::Open;
    m_lastActivity = m_lastTransition = m_lastHeartbeat = now;
    m_missedHeartbeats = 0;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Connection::Drain(Cause cause, Clock::time_point const& now)
{
    if (m_state != State::Open) { return false; }
    m_state = State::Draining;
    m_optCause = cause;
    m_lastTransition = now;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Connection::Close(Cause cause, Clock::time_point const& now)
{
    if (m_state == State::Closed) { return false; }
    if (!m_optCause) { m_optCause = cause; } // A drained connection keeps the cause it was drained with.
    m_state = State::Closed;
    m_lastTransition = now;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Connection::OnActivity(Clock::time_point const& now)
{
    m_lastActivity = now;
    m_missedHeartbeats = 0;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Connection::OnHeartbeatSent(Clock::time_point const& now)
{
    m_lastHeartbeat = now;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Connection::OnHeartbeatMissed()
{
    ++m_missedHeartbeats;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Connection::SendText(std::string&& frame)
{
    if (m_state == State::Closed || !m_spTransport->IsActive()) { return false; }
    auto const size = frame.size();
    if (!m_spTransport->SendText(std::move(frame))) { return false; }
    m_sent += size;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Connection::SendBinary(std::vector<std::uint8_t>&& frame)
{
    if (m_state != State::Open || !m_spTransport->IsActive()) { return false; }
    auto const size = frame.size();
    if (!m_spTransport->SendBinary(std::move(frame))) { return false; }
    m_sent += size;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Connection::CloseTransport()
{
    if (m_spTransport->IsActive()) { m_spTransport->Close(); }
}

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Connection::Connection::GetSentBytes() const { return m_sent; }

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Connection::Connection::GetReceivedBytes() const { return m_received; }

//----------------------------------------------------------------------------------------------------------------------

void Connection::Connection::OnReceived(std::size_t bytes) { m_received += bytes; }

//----------------------------------------------------------------------------------------------------------------------
