//----------------------------------------------------------------------------------------------------------------------
// File: Manager.hpp
// Description: Owns the lifecycle of the connections to the hub's peers. A connection is only opened after the
// transport is established and the peer has paired with a code or authenticated as a trusted device. At most one
// connection is open per device; a successful handshake supersedes any prior connection of the same device.
// Connections initiated by the hub are re-established with an exponential backoff after a recoverable closure until
// the retry budget has been spent or the device is unpaired.
// Notes: All methods are expected to be called on the network thread. Timing is driven by Tick().
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "BackoffPolicy.hpp"
#include "Connection.hpp"
#include "State.hpp"
#include "Components/Device/Device.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Message/Messages.hpp"
#include "Components/Network/Address.hpp"
#include "Interfaces/PeerMessenger.hpp"
#include "Interfaces/Transport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IPeerObserver;

namespace spdlog { class logger; }
namespace Device { class Registry; }
namespace Pairing { class Manager; }
namespace Route { class Context; class Router; }
namespace Message { struct Frame; }

//----------------------------------------------------------------------------------------------------------------------
namespace Connection {
//----------------------------------------------------------------------------------------------------------------------

class Manager;

//----------------------------------------------------------------------------------------------------------------------
} // Connection namespace
//----------------------------------------------------------------------------------------------------------------------

class Connection::Manager : public IPeerMessenger
{
public:
    using TimeSource = std::function<Clock::time_point()>;

    struct Options
    {
        std::chrono::milliseconds handshakeTimeout = std::chrono::seconds{ 5 };
        std::chrono::milliseconds heartbeatInterval = std::chrono::seconds{ 10 };
        std::uint32_t heartbeatTolerance = 3;
        BackoffPolicy::Options retry = {};
    };

    Manager(
        Device::Details const& local,
        Device::Registry& registry,
        Pairing::Manager* const pPairingManager,
        Event::SharedPublisher const& spEventPublisher,
        Route::Router const& router,
        ITransportConnector* const pConnector,
        Options const& options,
        TimeSource const& time = &Clock::now,
        BackoffPolicy::RandomSource const& random = BackoffPolicy::CreateDefaultRandomSource());

    ~Manager();

    Manager(Manager const&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(Manager const&) = delete;
    Manager& operator=(Manager&&) = delete;

    void RegisterObserver(IPeerObserver* const observer);
    void UnregisterObserver(IPeerObserver* const observer);

    // Adopts a transport accepted by a listening endpoint. The peer is expected to open the handshake.
    [[nodiscard]] std::optional<Key> OnTransportAccepted(SharedTransport const& spTransport);

    // Opens a connection to a hub or peer. When a code is supplied the handshake is a pairing request, otherwise the
    // local device authenticates as a previously trusted device.
    [[nodiscard]] bool Connect(
        Network::RemoteAddress const& address, std::optional<std::string> const& optPairingCode = {});

    // Deliberately ends the relationship with a device: the peer is told, the trust is revoked, and any reconnect
    // attempts are canceled.
    [[nodiscard]] bool Unpair(Device::Identifier const& peer);

    // Cancels every reconnect attempt and drains every connection.
    void Shutdown();

    void Tick();

    // Route Handlers {
    [[nodiscard]] bool Handle(Route::Context const& context, Message::PairingRequest const& request);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::Hello const& hello);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::Unpair const& unpair);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::Ping const& ping);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::Pong const& pong);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::ClientSetting const& setting);
    [[nodiscard]] bool Handle(Route::Context const& context, Message::ProtocolError const& error);
    // } Route Handlers

    // IPeerMessenger {
    [[nodiscard]] virtual bool Send(Device::Identifier const& peer, Message::Variant const& message) override;
    [[nodiscard]] virtual bool Send(Device::Identifier const& peer, Message::Chunk const& chunk) override;
    [[nodiscard]] virtual bool Reply(
        Key key, Message::Variant const& message, std::optional<std::string> const& correlation) override;

    [[nodiscard]] virtual bool IsOpen(Device::Identifier const& peer) const override;
    [[nodiscard]] virtual std::vector<Device::Identifier> GetOpenPeers() const override;
    [[nodiscard]] virtual std::vector<Device::Identifier> GetInterestedPeers(Setting setting) const override;
    // } IPeerMessenger

    [[nodiscard]] std::optional<State> GetState(Key key) const;
    [[nodiscard]] std::optional<Key> GetOpenKey(Device::Identifier const& peer) const;
    [[nodiscard]] std::optional<bool> IsEnabled(Device::Identifier const& peer, Setting setting) const;
    [[nodiscard]] std::size_t GetConnectionCount() const;
    [[nodiscard]] std::size_t GetTargetCount() const;
    [[nodiscard]] std::optional<std::uint32_t> GetReconnectAttempts(Network::RemoteAddress const& address) const;
    [[nodiscard]] Options const& GetOptions() const;

private:
    using Connections = std::unordered_map<Key, std::unique_ptr<Connection>>;

    // The record of a connection initiated by the local side. Targets persist across reconnects.
    struct Target
    {
        Network::RemoteAddress address;
        std::optional<Device::Identifier> optPeer;
        std::optional<std::string> optPairingCode;
        BackoffPolicy policy;
        std::optional<Key> optKey;
        std::optional<Clock::time_point> optDeadline;
        bool connecting = false;
    };

    using Targets = std::unordered_map<std::string, Target>;

    template<typename FunctionType, typename...Args>
    void NotifyObservers(FunctionType const& function, Args&&...args);

    [[nodiscard]] Connection* Find(Key key) const;
    [[nodiscard]] Connection* FindOpen(Device::Identifier const& peer) const;
    [[nodiscard]] Key Adopt(Role role, SharedTransport const& spTransport);

    void ScheduleConnect(Target& target);
    void OnConnectResult(std::string const& uri, SharedTransport const& spTransport);

    void OnText(Key key, std::string_view frame);
    void OnBinary(Key key, std::span<std::uint8_t const> frame);
    void OnTransportStopped(Key key, ITransport::StopCause cause);

    [[nodiscard]] bool OnHandshakeFrame(Connection& connection, Message::Frame const& frame);
    [[nodiscard]] bool OnPairingRequest(Connection& connection, Message::PairingRequest const& request);
    [[nodiscard]] bool OnHello(Connection& connection, Message::Hello const& hello);
    [[nodiscard]] bool OnPairingResponse(Connection& connection, Message::PairingResponse const& response);
    [[nodiscard]] bool OnHelloResponse(Connection& connection, Message::HelloResponse const& response);

    void OnOpened(Connection& connection, Device::Details const& peer);
    void Reject(Connection& connection, Message::Variant const& response);
    void Violation(Connection& connection, std::string const& description, std::optional<std::string> const& reference);

    void Drain(Key key, Cause cause);
    void Close(Key key, Cause cause);
    void OnLeftOpen(Connection const& connection, Cause cause);
    void OnTargetClosed(std::string const& uri, std::optional<Key> const& optKey, Cause cause);
    void CancelTargets(Device::Identifier const& peer);

    [[nodiscard]] bool Transmit(Connection& connection, Message::Variant const& message,
        std::optional<std::string> const& correlation = {});

    Device::Details const m_local;
    Device::Registry& m_registry;
    Pairing::Manager* const m_pPairingManager;
    Event::SharedPublisher const m_spEventPublisher;
    Route::Router const& m_router;
    ITransportConnector* const m_pConnector;
    Options const m_options;
    TimeSource const m_time;
    BackoffPolicy::RandomSource const m_random;
    std::shared_ptr<spdlog::logger> m_logger;

    Key m_nextKey;
    Connections m_connections;
    std::unordered_map<Device::Identifier, Key> m_open;
    Targets m_targets;
    bool m_active;

    std::vector<IPeerObserver*> m_observers;
};

//----------------------------------------------------------------------------------------------------------------------
