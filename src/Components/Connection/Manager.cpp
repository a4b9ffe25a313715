//----------------------------------------------------------------------------------------------------------------------
// File: Manager.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Manager.hpp"
#include "Components/Device/Registry.hpp"
#include "Components/Message/Chunk.hpp"
#include "Components/Message/Codec.hpp"
#include "Components/Pairing/Manager.hpp"
#include "Components/Route/MessageHandler.hpp"
#include "Components/Route/Router.hpp"
#include "Interfaces/PeerObserver.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <iterator>
#include <ranges>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using UnpairCause = Event::Message<Event::Type::PeerUnpaired>::Cause;

[[nodiscard]] Device::Details CreateCandidate(
    Device::Identifier const& identifier, std::string const& name, std::string const& kind);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Connection::Manager::Manager(
    Device::Details const& local,
    Device::Registry& registry,
    Pairing::Manager* const pPairingManager,
    Event::SharedPublisher const& spEventPublisher,
    Route::Router const& router,
    ITransportConnector* const pConnector,
    Options const& options,
    TimeSource const& time,
    BackoffPolicy::RandomSource const& random)
    : m_local(local)
    , m_registry(registry)
    , m_pPairingManager(pPairingManager)
    , m_spEventPublisher(spEventPublisher)
    , m_router(router)
    , m_pConnector(pConnector)
    , m_options(options)
    , m_time(time)
    , m_random(random)
    , m_logger(Logger::Get(Logger::Name::Connection))
    , m_nextKey(0)
    , m_connections()
    , m_open()
    , m_targets()
    , m_active(true)
    , m_observers()
{
    assert(Device::IsValidIdentifier(m_local.identifier));
    assert(m_spEventPublisher);
    assert(m_time);

    m_spEventPublisher->Advertise({
        Event::Type::PeerConnected,
        Event::Type::PeerDisconnected,
        Event::Type::PeerPaired,
        Event::Type::PeerReconnecting,
        Event::Type::PeerUnpaired,
        Event::Type::ReconnectExhausted
    });
}

//----------------------------------------------------------------------------------------------------------------------

Connection::Manager::~Manager()
{
    m_observers.clear();
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::RegisterObserver(IPeerObserver* const observer)
{
    assert(observer);
    if (std::ranges::find(m_observers, observer) != m_observers.end()) { return; }
    m_observers.emplace_back(observer);
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::UnregisterObserver(IPeerObserver* const observer)
{
    std::erase(m_observers, observer);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Connection::Key> Connection::Manager::OnTransportAccepted(SharedTransport const& spTransport)
{
    if (!spTransport) { return {}; }
    if (!m_active) {
        spTransport->Close();
        return {};
    }

    auto const key = Adopt(Role::Acceptor, spTransport);
    m_logger->debug("Accepted a connection from {}, awaiting the handshake.", spTransport->GetAddress());
    return key;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Connect(
    Network::RemoteAddress const& address, std::optional<std::string> const& optPairingCode)
{
    if (!m_active || !m_pConnector || !address.IsValid()) { return false; }

    auto const& uri = address.GetUri();
    auto [itr, emplaced] = m_targets.try_emplace(uri, Target{
        .address = address,
        .optPeer = {},
        .optPairingCode = optPairingCode,
        .policy = BackoffPolicy{ m_options.retry, m_random },
        .optKey = {},
        .optDeadline = {}
    });

    auto& target = itr->second;
    if (!emplaced) {
        // A target that is already being connected or is open does not need another attempt.
        if (target.connecting || target.optKey) { return false; }
        if (optPairingCode) { target.optPairingCode = optPairingCode; }
        target.policy.Reset();
    }

    m_logger->info("Connecting to {}.", address);
    ScheduleConnect(target);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Unpair(Device::Identifier const& peer)
{
    bool notified = false;
    if (auto const pConnection = FindOpen(peer); pConnection) {
        notified = Transmit(*pConnection, Message::Unpair{ .deviceId = m_local.identifier });
        Drain(pConnection->GetKey(), Cause::Unpaired);
    }

    CancelTargets(peer);

    bool const revoked = m_registry.Revoke(peer);
    if (!revoked && !notified) { return false; }

    m_logger->info("Unpaired {} at the local request.", peer);
    m_spEventPublisher->Publish<Event::Type::PeerUnpaired>(peer, local::UnpairCause::LocalRequest);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::Shutdown()
{
    if (!m_active) { return; }
    m_active = false;
    m_targets.clear();

    std::vector<Key> keys;
    keys.reserve(m_connections.size());
    std::ranges::transform(m_connections, std::back_inserter(keys), [] (auto const& entry) { return entry.first; });
    for (auto const key : keys) { Drain(key, Cause::Shutdown); }

    m_logger->debug("The connection manager has been shut down.");
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::Tick()
{
    auto const now = m_time();

    std::vector<std::pair<Key, Cause>> expired;
    std::vector<Key> heartbeats;
    for (auto const& [key, upConnection] : m_connections) {
        auto& connection = *upConnection;
        switch (connection.GetState()) {
            case State::Connecting: {
                if (now - connection.GetCreated() >= m_options.handshakeTimeout) {
                    expired.emplace_back(key, Cause::Timeout);
                }
            } break;
            case State::Open: {
                if (now - connection.GetLastHeartbeat() < m_options.heartbeatInterval) { break; }
                // An interval without any inbound frame counts as a missed heartbeat.
                if (connection.GetLastActivity() <= connection.GetLastHeartbeat()) { connection.OnHeartbeatMissed(); }
                if (connection.GetMissedHeartbeats() >= m_options.heartbeatTolerance) {
                    expired.emplace_back(key, Cause::HeartbeatLost);
                } else {
                    heartbeats.emplace_back(key);
                }
            } break;
            case State::Draining: {
                // The transport did not complete its closing handshake in time.
                if (now - connection.GetLastTransition() >= m_options.handshakeTimeout) {
                    expired.emplace_back(key, Cause::TransportClosed);
                }
            } break;
            case State::Closed:
            default: break;
        }
    }

    for (auto const key : heartbeats) {
        if (auto const pConnection = Find(key); pConnection) {
            pConnection->OnHeartbeatSent(now);
            if (!Transmit(*pConnection, Message::Ping{ .timestamp = TimeUtils::GetSystemTimestamp() })) {
                m_logger->debug("Unable to send a heartbeat to {}.", pConnection->GetPeer());
            }
        }
    }

    for (auto const& [key, cause] : expired) {
        if (auto const pConnection = Find(key); pConnection && cause == Cause::HeartbeatLost) {
            m_logger->warn("The connection to {} missed {} heartbeats.", pConnection->GetPeer(), m_options.heartbeatTolerance);
        }
        Close(key, cause);
    }

    std::vector<std::string> due;
    for (auto const& [uri, target] : m_targets) {
        if (!target.connecting && target.optDeadline && now >= *target.optDeadline) { due.emplace_back(uri); }
    }

    for (auto const& uri : due) {
        if (auto const itr = m_targets.find(uri); itr != m_targets.end()) { ScheduleConnect(itr->second); }
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Handle(Route::Context const& context, Message::PairingRequest const&)
{
    // A device that has completed its handshake on this connection is already paired.
    Message::PairingResponse const response{
        .success = false,
        .message = std::string{ Pairing::ErrorToDescription(Pairing::Error::AlreadyPaired) },
        .deviceId = {},
        .deviceName = {}
    };
    return context.Reply(response);
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Handle(Route::Context const& context, Message::Hello const&)
{
    Message::HelloResponse const response{
        .success = false,
        .message = "The connection has already been authenticated.",
        .deviceId = {},
        .deviceName = {}
    };
    return context.Reply(response);
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Handle(Route::Context const& context, Message::Unpair const& unpair)
{
    auto const& peer = context.GetPeer();
    if (unpair.deviceId != peer) {
        m_logger->warn("Ignoring an unpair request from {} for a different device.", peer);
        Message::ProtocolError const error{
            .message = "The unpair request does not identify the sending device.",
            .reference = std::string{ Message::Unpair::Type }
        };
        if (!context.Reply(error)) { m_logger->debug("Unable to report a protocol error to {}.", peer); }
        return false;
    }

    m_logger->info("{} requested to be unpaired.", peer);
    CancelTargets(peer);
    if (!m_registry.Revoke(peer)) { m_logger->warn("Unable to revoke the trust of {}.", peer); }
    m_spEventPublisher->Publish<Event::Type::PeerUnpaired>(peer, local::UnpairCause::PeerRequest);
    Drain(context.GetKey(), Cause::Unpaired);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Handle(Route::Context const& context, Message::Ping const& ping)
{
    return context.Reply(Message::Pong{ .timestamp = ping.timestamp });
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Handle(Route::Context const&, Message::Pong const&)
{
    return true; // Receipt of the frame has already been recorded as activity.
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Handle(Route::Context const& context, Message::ClientSetting const& setting)
{
    auto const pConnection = Find(context.GetKey());
    if (!pConnection) { return false; }

    auto const optSetting = StringToSetting(setting.setting);
    if (!optSetting) {
        Message::ProtocolError const error{
            .message = fmt::format("The setting \"{}\" is not recognized.", setting.setting),
            .reference = std::string{ Message::ClientSetting::Type }
        };
        if (!context.Reply(error)) { m_logger->debug("Unable to report a protocol error to {}.", context.GetPeer()); }
        return false;
    }

    pConnection->SetEnabled(*optSetting, setting.value);
    m_logger->info(
        "{} {} {} on its connection.",
        context.GetPeer(), setting.value ? "enabled" : "disabled", setting.setting);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Handle(Route::Context const& context, Message::ProtocolError const& error)
{
    m_logger->warn(
        "{} reported a protocol error for \"{}\": {}",
        context.GetPeer(), error.reference.value_or("unknown"), error.message);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Send(Device::Identifier const& peer, Message::Variant const& message)
{
    auto const pConnection = FindOpen(peer);
    if (!pConnection) { return false; }
    return Transmit(*pConnection, message);
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Send(Device::Identifier const& peer, Message::Chunk const& chunk)
{
    auto const pConnection = FindOpen(peer);
    if (!pConnection) { return false; }
    return pConnection->SendBinary(Message::EncodeChunk(chunk));
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Reply(
    Key key, Message::Variant const& message, std::optional<std::string> const& correlation)
{
    auto const pConnection = Find(key);
    if (!pConnection) { return false; }
    return Transmit(*pConnection, message, correlation);
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::IsOpen(Device::Identifier const& peer) const
{
    return FindOpen(peer) != nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Device::Identifier> Connection::Manager::GetOpenPeers() const
{
    std::vector<Device::Identifier> peers;
    peers.reserve(m_open.size());
    std::ranges::transform(m_open, std::back_inserter(peers), [] (auto const& entry) { return entry.first; });
    std::ranges::sort(peers);
    return peers;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Device::Identifier> Connection::Manager::GetInterestedPeers(Setting setting) const
{
    std::vector<Device::Identifier> peers;
    for (auto const& [peer, key] : m_open) {
        if (auto const pConnection = Find(key); pConnection && pConnection->IsEnabled(setting)) {
            peers.emplace_back(peer);
        }
    }
    std::ranges::sort(peers);
    return peers;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Connection::State> Connection::Manager::GetState(Key key) const
{
    if (auto const pConnection = Find(key); pConnection) { return pConnection->GetState(); }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Connection::Key> Connection::Manager::GetOpenKey(Device::Identifier const& peer) const
{
    if (auto const itr = m_open.find(peer); itr != m_open.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<bool> Connection::Manager::IsEnabled(Device::Identifier const& peer, Setting setting) const
{
    if (auto const pConnection = FindOpen(peer); pConnection) { return pConnection->IsEnabled(setting); }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Connection::Manager::GetConnectionCount() const
{
    return m_connections.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Connection::Manager::GetTargetCount() const
{
    return m_targets.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint32_t> Connection::Manager::GetReconnectAttempts(Network::RemoteAddress const& address) const
{
    if (auto const itr = m_targets.find(address.GetUri()); itr != m_targets.end()) {
        return itr->second.policy.GetAttempts();
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Connection::Manager::Options const& Connection::Manager::GetOptions() const
{
    return m_options;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FunctionType, typename...Args>
void Connection::Manager::NotifyObservers(FunctionType const& function, Args&&...args)
{
    for (auto itr = m_observers.cbegin(); itr != m_observers.cend();) {
        auto const& observer = *itr;
        if (!observer) { itr = m_observers.erase(itr); continue; }
        auto const binder = std::bind(function, observer, std::forward<Args>(args)...);
        binder();
        ++itr;
    }
}

//----------------------------------------------------------------------------------------------------------------------

Connection::Connection* Connection::Manager::Find(Key key) const
{
    if (auto const itr = m_connections.find(key); itr != m_connections.end()) { return itr->second.get(); }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

Connection::Connection* Connection::Manager::FindOpen(Device::Identifier const& peer) const
{
    auto const itr = m_open.find(peer);
    if (itr == m_open.end()) { return nullptr; }
    auto const pConnection = Find(itr->second);
    return (pConnection && pConnection->GetState() == State::Open) ? pConnection : nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

Connection::Key Connection::Manager::Adopt(Role role, SharedTransport const& spTransport)
{
    auto const key = ++m_nextKey;
    m_connections.emplace(key, std::make_unique<Connection>(key, role, spTransport, m_time()));

    spTransport->Attach(
        [this, key] (std::string_view frame) { OnText(key, frame); },
        [this, key] (std::span<std::uint8_t const> frame) { OnBinary(key, frame); },
        [this, key] (ITransport::StopCause cause) { OnTransportStopped(key, cause); });

    return key;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::ScheduleConnect(Target& target)
{
    assert(m_pConnector);
    target.optDeadline.reset();
    target.connecting = true;

    // The connector may invoke the callback before returning, the target must not be used after scheduling.
    auto const uri = target.address.GetUri();
    bool const scheduled = m_pConnector->ScheduleConnect(target.address,
        [this, uri] (SharedTransport const& spTransport) { OnConnectResult(uri, spTransport); });

    if (!scheduled) {
        if (auto const itr = m_targets.find(uri); itr != m_targets.end()) { itr->second.connecting = false; }
        OnTargetClosed(uri, {}, Cause::Refused);
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::OnConnectResult(std::string const& uri, SharedTransport const& spTransport)
{
    auto const itr = m_targets.find(uri);
    if (itr == m_targets.end() || !m_active) {
        // The target was canceled (e.g. unpaired) while the transport was being established.
        if (spTransport) { spTransport->Close(); }
        return;
    }

    auto& target = itr->second;
    target.connecting = false;

    if (!spTransport) {
        m_logger->warn("Unable to reach {}.", target.address);
        OnTargetClosed(uri, {}, Cause::Refused);
        return;
    }

    auto const key = Adopt(Role::Initiator, spTransport);
    auto const pConnection = Find(key);
    assert(pConnection);
    pConnection->SetTarget(uri);
    target.optKey = key;

    bool sent = false;
    if (target.optPairingCode) {
        m_logger->info("Requesting to pair with {}.", target.address);
        sent = Transmit(*pConnection, Message::PairingRequest{
            .code = *target.optPairingCode,
            .deviceId = m_local.identifier,
            .deviceName = m_local.name,
            .deviceType = std::string{ Device::KindToString(m_local.kind) }
        });
    } else {
        m_logger->debug("Authenticating with {}.", target.address);
        sent = Transmit(*pConnection, Message::Hello{
            .deviceId = m_local.identifier,
            .deviceName = m_local.name,
            .deviceType = std::string{ Device::KindToString(m_local.kind) }
        });
    }

    if (!sent) { Close(key, Cause::TransportClosed); }
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::OnText(Key key, std::string_view frame)
{
    auto const pConnection = Find(key);
    if (!pConnection) { return; }
    pConnection->OnReceived(frame.size());
    pConnection->OnActivity(m_time());

    switch (pConnection->GetState()) {
        case State::Connecting: {
            std::optional<std::string> optType;
            try {
                auto const parsed = Message::ParseFrame(frame);
                optType = parsed.type;
                if (!OnHandshakeFrame(*pConnection, parsed)) {
                    m_logger->debug("The handshake on connection {} did not complete.", key);
                }
            } catch (Message::MalformedPayload const& e) {
                // The connection may have been closed while handling the frame.
                if (auto const pCurrent = Find(key); pCurrent) { Violation(*pCurrent, e.what(), optType); }
            }
        } break;
        case State::Open: {
            // The context refers to the peer, which must remain valid if the handler closes the connection.
            auto const peer = pConnection->GetPeer();
            Route::Context const context{ peer, key, *this };
            m_router.Route(context, frame);
        } break;
        case State::Draining: {
            m_logger->trace("Dropping a frame received on draining connection {}.", key);
        } break;
        case State::Closed:
        default: break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::OnBinary(Key key, std::span<std::uint8_t const> frame)
{
    auto const pConnection = Find(key);
    if (!pConnection) { return; }
    pConnection->OnReceived(frame.size());
    pConnection->OnActivity(m_time());

    switch (pConnection->GetState()) {
        case State::Connecting: {
            Violation(
                *pConnection, "Binary frames are not accepted before the handshake has completed.",
                std::string{ Route::ChunkRoute });
        } break;
        case State::Open: {
            auto const peer = pConnection->GetPeer();
            Route::Context const context{ peer, key, *this };
            m_router.Route(context, frame);
        } break;
        case State::Draining:
        case State::Closed:
        default: break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::OnTransportStopped(Key key, ITransport::StopCause cause)
{
    auto const pConnection = Find(key);
    if (!pConnection) { return; }

    if (cause == ITransport::StopCause::UnexpectedError) {
        m_logger->debug("The transport of connection {} stopped unexpectedly.", key);
    }

    // A draining connection keeps the cause it was drained with.
    Close(key, Cause::TransportClosed);
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::OnHandshakeFrame(Connection& connection, Message::Frame const& frame)
{
    if (connection.GetRole() == Role::Acceptor) {
        if (frame.type == Message::PairingRequest::Type) {
            return OnPairingRequest(connection, Message::Decode<Message::PairingRequest>(frame.payload));
        }
        if (frame.type == Message::Hello::Type) {
            return OnHello(connection, Message::Decode<Message::Hello>(frame.payload));
        }
    } else {
        if (frame.type == Message::PairingResponse::Type) {
            return OnPairingResponse(connection, Message::Decode<Message::PairingResponse>(frame.payload));
        }
        if (frame.type == Message::HelloResponse::Type) {
            return OnHelloResponse(connection, Message::Decode<Message::HelloResponse>(frame.payload));
        }
        if (frame.type == Message::ProtocolError::Type) {
            auto const error = Message::Decode<Message::ProtocolError>(frame.payload);
            m_logger->warn("{} refused the handshake: {}", connection.GetAddress(), error.message);
            Close(connection.GetKey(), Cause::ProtocolViolation);
            return false;
        }
    }

    Violation(connection, fmt::format("A \"{}\" frame is not expected during the handshake.", frame.type), frame.type);
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::OnPairingRequest(Connection& connection, Message::PairingRequest const& request)
{
    if (!Device::IsValidIdentifier(request.deviceId)) {
        Violation(connection, "The device identifier is invalid.", std::string{ Message::PairingRequest::Type });
        return false;
    }

    if (!m_pPairingManager) {
        Reject(connection, Message::PairingResponse{
            .success = false, .message = "Pairing is not available.", .deviceId = {}, .deviceName = {} });
        return false;
    }

    auto const candidate = local::CreateCandidate(request.deviceId, request.deviceName, request.deviceType);
    m_registry.Observe(candidate);
    if (m_registry.MarkPending(candidate.identifier)) {
        m_logger->debug("{} is pending pairing.", candidate.identifier);
    }

    m_logger->trace("{} submitted the pairing code \"{}\".", candidate.identifier, request.code);
    auto const result = m_pPairingManager->SubmitPairingRequest(request.code, candidate);
    if (auto const pRejected = std::get_if<Pairing::Rejected>(&result); pRejected) {
        m_logger->warn(
            "Rejected the pairing request of {}: {}.",
            candidate.identifier, Pairing::ErrorToString(pRejected->reason));
        Reject(connection, Message::PairingResponse{
            .success = false,
            .message = std::string{ Pairing::ErrorToDescription(pRejected->reason) },
            .deviceId = {},
            .deviceName = {}
        });
        return false;
    }

    bool const sent = Transmit(connection, Message::PairingResponse{
        .success = true, .message = {}, .deviceId = m_local.identifier, .deviceName = m_local.name });
    if (!sent) {
        Close(connection.GetKey(), Cause::TransportClosed);
        return false;
    }

    OnOpened(connection, m_registry.Find(candidate.identifier).value_or(candidate));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::OnHello(Connection& connection, Message::Hello const& hello)
{
    if (!Device::IsValidIdentifier(hello.deviceId)) {
        Violation(connection, "The device identifier is invalid.", std::string{ Message::Hello::Type });
        return false;
    }

    if (!m_registry.IsTrusted(hello.deviceId)) {
        m_logger->warn("Rejected the authentication of {}, the device is not paired.", hello.deviceId);
        Reject(connection, Message::HelloResponse{
            .success = false, .message = "The device is not paired.", .deviceId = {}, .deviceName = {} });
        return false;
    }

    auto const candidate = local::CreateCandidate(hello.deviceId, hello.deviceName, hello.deviceType);
    m_registry.Observe(candidate);

    bool const sent = Transmit(connection, Message::HelloResponse{
        .success = true, .message = {}, .deviceId = m_local.identifier, .deviceName = m_local.name });
    if (!sent) {
        Close(connection.GetKey(), Cause::TransportClosed);
        return false;
    }

    OnOpened(connection, m_registry.Find(candidate.identifier).value_or(candidate));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::OnPairingResponse(Connection& connection, Message::PairingResponse const& response)
{
    if (!response.success) {
        m_logger->error(
            "{} rejected the pairing request: {}", connection.GetAddress(), response.message.value_or("no reason"));
        Close(connection.GetKey(), Cause::Rejected);
        return false;
    }

    if (!response.deviceId || !Device::IsValidIdentifier(*response.deviceId)) {
        Violation(connection, "The pairing response does not identify the device.",
            std::string{ Message::PairingResponse::Type });
        return false;
    }

    // Connections are only initiated toward hubs.
    Device::Details const hub{
        .identifier = *response.deviceId, .name = response.deviceName.value_or(""), .kind = Device::Kind::Hub };
    if (!m_registry.Trust(hub)) {
        m_logger->error("Unable to trust {} after a successful pairing.", hub.identifier);
        Close(connection.GetKey(), Cause::Rejected);
        return false;
    }

    if (auto const& optTarget = connection.GetTarget(); optTarget) {
        if (auto const itr = m_targets.find(*optTarget); itr != m_targets.end()) {
            itr->second.optPeer = hub.identifier;
            itr->second.optPairingCode.reset(); // The code has been consumed; reconnects authenticate instead.
        }
    }

    auto const details = m_registry.Find(hub.identifier).value_or(hub);
    m_logger->info("Paired with {} ({}).", details.identifier, details.name);
    m_spEventPublisher->Publish<Event::Type::PeerPaired>(details);

    OnOpened(connection, details);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::OnHelloResponse(Connection& connection, Message::HelloResponse const& response)
{
    if (!response.success) {
        m_logger->error(
            "{} rejected the authentication: {}", connection.GetAddress(), response.message.value_or("no reason"));
        Close(connection.GetKey(), Cause::Rejected);
        return false;
    }

    if (!response.deviceId || !m_registry.IsTrusted(*response.deviceId)) {
        m_logger->error("{} did not authenticate as a paired device.", connection.GetAddress());
        Close(connection.GetKey(), Cause::Rejected);
        return false;
    }

    if (auto const& optTarget = connection.GetTarget(); optTarget) {
        auto const itr = m_targets.find(*optTarget);
        if (itr != m_targets.end() && itr->second.optPeer && itr->second.optPeer != response.deviceId) {
            Violation(connection, "The responding device is not the expected device.",
                std::string{ Message::HelloResponse::Type });
            return false;
        }
    }

    auto const optDetails = m_registry.Find(*response.deviceId);
    assert(optDetails);
    OnOpened(connection, *optDetails);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::OnOpened(Connection& connection, Device::Details const& peer)
{
    auto const key = connection.GetKey();
    if (auto const itr = m_open.find(peer.identifier); itr != m_open.end() && itr->second != key) {
        m_logger->info("A new connection from {} supersedes connection {}.", peer.identifier, itr->second);
        Drain(itr->second, Cause::Superseded);
    }

    if (!connection.Open(peer, m_time())) { return; }
    m_open[peer.identifier] = key;

    if (auto const& optTarget = connection.GetTarget(); optTarget) {
        if (auto const itr = m_targets.find(*optTarget); itr != m_targets.end()) {
            itr->second.optPeer = peer.identifier;
            itr->second.policy.Reset();
        }
    }

    // Idle reconnect attempts toward the device are no longer needed.
    std::erase_if(m_targets, [&] (auto const& entry) {
        auto const& [uri, target] = entry;
        return target.optPeer == peer.identifier && !target.optKey && !target.connecting;
    });

    m_logger->info("Connection {} to {} ({}) is open.", key, peer.identifier, connection.GetAddress());

    auto const identifier = peer.identifier;
    NotifyObservers(&IPeerObserver::OnPeerConnected, identifier);
    m_spEventPublisher->Publish<Event::Type::PeerConnected>(peer, connection.GetAddress());
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::Reject(Connection& connection, Message::Variant const& response)
{
    if (!Transmit(connection, response)) {
        m_logger->debug("Unable to send the handshake rejection over connection {}.", connection.GetKey());
    }
    Close(connection.GetKey(), Cause::Rejected);
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::Violation(
    Connection& connection, std::string const& description, std::optional<std::string> const& reference)
{
    m_logger->warn("Protocol violation on connection {}: {}", connection.GetKey(), description);
    if (!Transmit(connection, Message::ProtocolError{ .message = description, .reference = reference })) {
        m_logger->debug("Unable to report a protocol error over connection {}.", connection.GetKey());
    }
    Close(connection.GetKey(), Cause::ProtocolViolation);
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::Drain(Key key, Cause cause)
{
    auto const pConnection = Find(key);
    if (!pConnection) { return; }

    if (pConnection->GetState() != State::Open) {
        Close(key, cause);
        return;
    }

    if (!pConnection->Drain(cause, m_time())) { return; }
    m_logger->debug("Draining connection {} ({}).", key, CauseToString(cause));
    OnLeftOpen(*pConnection, cause);

    // The transport may report its closure before returning, the connection must not be used afterwards.
    pConnection->CloseTransport();
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::Close(Key key, Cause cause)
{
    auto const itr = m_connections.find(key);
    if (itr == m_connections.end()) { return; }

    // The connection is released from the set before the transport is closed such that any re-entrant notification
    // from the transport is ignored.
    auto const upConnection = std::move(itr->second);
    m_connections.erase(itr);

    bool const open = upConnection->GetState() == State::Open;
    if (!upConnection->Close(cause, m_time())) { return; }

    auto const final = upConnection->GetCause().value_or(cause);
    m_logger->debug("Connection {} has been closed ({}).", key, CauseToString(final));

    if (open) { OnLeftOpen(*upConnection, final); }
    upConnection->CloseTransport();

    if (auto const& optTarget = upConnection->GetTarget(); optTarget) { OnTargetClosed(*optTarget, key, final); }
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::OnLeftOpen(Connection const& connection, Cause cause)
{
    auto const peer = connection.GetPeer();
    if (auto const itr = m_open.find(peer); itr != m_open.end() && itr->second == connection.GetKey()) {
        m_open.erase(itr);
    }

    m_logger->info("Disconnected from {} ({}).", peer, CauseToString(cause));
    NotifyObservers(&IPeerObserver::OnPeerDisconnected, peer, cause);
    m_spEventPublisher->Publish<Event::Type::PeerDisconnected>(peer, cause);
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::OnTargetClosed(std::string const& uri, std::optional<Key> const& optKey, Cause cause)
{
    auto const itr = m_targets.find(uri);
    if (itr == m_targets.end()) { return; }

    auto& target = itr->second;
    if (optKey && target.optKey != optKey) { return; }
    target.optKey.reset();

    if (!m_active || !IsRecoverable(cause)) {
        m_targets.erase(itr);
        return;
    }

    auto const subject = target.optPeer.value_or(uri);
    auto const optDelay = target.policy.Next();
    if (!optDelay) {
        auto const attempts = target.policy.GetAttempts();
        m_logger->error("Giving up on reconnecting to {} after {} attempts.", subject, attempts);
        m_spEventPublisher->Publish<Event::Type::ReconnectExhausted>(subject, attempts);
        m_targets.erase(itr);
        return;
    }

    target.optDeadline = m_time() + *optDelay;
    m_logger->info("Reconnecting to {} in {}ms (attempt {}).", subject, optDelay->count(), target.policy.GetAttempts());
    m_spEventPublisher->Publish<Event::Type::PeerReconnecting>(subject, target.policy.GetAttempts(), *optDelay);
}

//----------------------------------------------------------------------------------------------------------------------

void Connection::Manager::CancelTargets(Device::Identifier const& peer)
{
    std::size_t const canceled = std::erase_if(m_targets, [&peer] (auto const& entry) {
        auto const& [uri, target] = entry;
        return target.optPeer == peer;
    });

    if (canceled != 0) { m_logger->debug("Canceled the reconnect attempts to {}.", peer); }
}

//----------------------------------------------------------------------------------------------------------------------

bool Connection::Manager::Transmit(
    Connection& connection, Message::Variant const& message, std::optional<std::string> const& correlation)
{
    return connection.SendText(Message::Encode(message, correlation));
}

//----------------------------------------------------------------------------------------------------------------------

Device::Details local::CreateCandidate(
    Device::Identifier const& identifier, std::string const& name, std::string const& kind)
{
    return Device::Details{
        .identifier = identifier,
        .name = name.substr(0, std::min(name.size(), Device::MaximumNameSize)),
        .kind = Device::StringToKind(kind),
        .trust = Device::TrustState::Unknown,
        .paired = {},
        .pairings = 0
    };
}

//----------------------------------------------------------------------------------------------------------------------
