//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Connection/Manager.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Device/Registry.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Pairing/Manager.hpp"
#include "Components/Route/Delegate.hpp"
#include "Components/Route/Router.hpp"
#include "Interfaces/PeerObserver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class ConnectionFixture;

using UnpairCause = Event::Message<Event::Type::PeerUnpaired>::Cause;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view PairingCode = "7KQ2MX";

Device::Details const Hub{
    .identifier = "hub-0001", .name = "Ferry Hub", .kind = Device::Kind::Hub,
    .trust = Device::TrustState::Unknown, .paired = {}, .pairings = 0 };

Device::Details const Phone{
    .identifier = "phone-0001", .name = "Phone", .kind = Device::Kind::Mobile,
    .trust = Device::TrustState::Unknown, .paired = {}, .pairings = 0 };

Network::RemoteAddress const PhoneAddress{ "192.168.1.20", 41200 };
Network::RemoteAddress const HubAddress{ "192.168.1.10", 8765 };

Connection::Manager::Options CreateOptions(std::uint32_t limit = 8)
{
    return Connection::Manager::Options{
        .handshakeTimeout = std::chrono::seconds{ 5 },
        .heartbeatInterval = std::chrono::seconds{ 10 },
        .heartbeatTolerance = 3,
        .retry = Connection::BackoffPolicy::Options{
            .base = std::chrono::milliseconds{ 500 },
            .ceiling = std::chrono::seconds{ 30 },
            .limit = limit,
            .jitter = 0.2 }
    };
}

Message::Hello CreateHello(Device::Details const& details)
{
    return Message::Hello{
        .deviceId = details.identifier,
        .deviceName = details.name,
        .deviceType = std::string{ Device::KindToString(details.kind) } };
}

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Wires a connection manager to a manual clock, in memory transports, and the routes of the handshake.
//----------------------------------------------------------------------------------------------------------------------
class local::ConnectionFixture : public IPeerObserver
{
public:
    struct Events
    {
        std::vector<Device::Identifier> connected;
        std::vector<std::pair<Device::Identifier, Connection::Cause>> disconnected;
        std::vector<Device::Identifier> paired;
        std::vector<std::pair<std::uint32_t, std::chrono::milliseconds>> reconnecting;
        std::vector<std::pair<Device::Identifier, UnpairCause>> unpaired;
        std::vector<std::uint32_t> exhausted;
    };

    explicit ConnectionFixture(
        Device::Details const& local = test::Hub, Connection::Manager::Options const& options = test::CreateOptions())
        : m_now(Connection::Clock::now())
        , m_spPublisher(std::make_shared<Event::Publisher>())
        , m_registry()
        , m_router()
        , m_connector()
        , m_upPairingManager()
        , m_spManager()
        , m_events()
        , m_observed(0)
    {
        m_spPublisher->Subscribe<Event::Type::PeerConnected>(
            [this] (Device::Details const& details, Network::RemoteAddress const&) {
                m_events.connected.emplace_back(details.identifier);
            });
        m_spPublisher->Subscribe<Event::Type::PeerDisconnected>(
            [this] (Device::Identifier const& peer, Connection::Cause cause) {
                m_events.disconnected.emplace_back(peer, cause);
            });
        m_spPublisher->Subscribe<Event::Type::PeerPaired>(
            [this] (Device::Details const& details) { m_events.paired.emplace_back(details.identifier); });
        m_spPublisher->Subscribe<Event::Type::PeerReconnecting>(
            [this] (Device::Identifier const&, std::uint32_t attempt, std::chrono::milliseconds delay) {
                m_events.reconnecting.emplace_back(attempt, delay);
            });
        m_spPublisher->Subscribe<Event::Type::PeerUnpaired>(
            [this] (Device::Identifier const& peer, UnpairCause cause) { m_events.unpaired.emplace_back(peer, cause); });
        m_spPublisher->Subscribe<Event::Type::ReconnectExhausted>(
            [this] (Device::Identifier const&, std::uint32_t attempts) { m_events.exhausted.emplace_back(attempts); });

        m_upPairingManager = std::make_unique<Pairing::Manager>(
            local.identifier, m_registry, m_spPublisher, Pairing::Manager::Options{},
            [this] () { return m_now; },
            [] (std::size_t) { return std::string{ test::PairingCode }; });

        m_spManager = std::make_shared<Connection::Manager>(
            local, m_registry, m_upPairingManager.get(), m_spPublisher, m_router, &m_connector, options,
            [this] () { return m_now; },
            [] () { return 0.0; });
        m_spManager->RegisterObserver(this);

        EXPECT_TRUE((m_router.Register<Route::Delegate<Message::PairingRequest, Connection::Manager>>(
            Message::PairingRequest::Type)));
        EXPECT_TRUE((m_router.Register<Route::Delegate<Message::Hello, Connection::Manager>>(Message::Hello::Type)));
        EXPECT_TRUE((m_router.Register<Route::Delegate<Message::Unpair, Connection::Manager>>(Message::Unpair::Type)));
        EXPECT_TRUE((m_router.Register<Route::Delegate<Message::Ping, Connection::Manager>>(Message::Ping::Type)));
        EXPECT_TRUE((m_router.Register<Route::Delegate<Message::Pong, Connection::Manager>>(Message::Pong::Type)));
        EXPECT_TRUE((m_router.Register<Route::Delegate<Message::ClientSetting, Connection::Manager>>(
            Message::ClientSetting::Type)));

        auto const spServiceProvider = std::make_shared<Hub::ServiceProvider>();
        EXPECT_TRUE(spServiceProvider->Register(m_spManager));
        EXPECT_TRUE(m_router.Initialize(spServiceProvider));

        m_spPublisher->SuspendSubscriptions();
    }

    ~ConnectionFixture() { m_spManager->UnregisterObserver(this); }

    // IPeerObserver {
    virtual void OnPeerConnected(Device::Identifier const&) override { ++m_observed; }
    virtual void OnPeerDisconnected(Device::Identifier const&, Connection::Cause) override { --m_observed; }
    // } IPeerObserver

    // Accepts a transport from a trusted device and completes its authentication.
    std::shared_ptr<Connection::Test::Transport> OpenTrusted(Device::Details const& details)
    {
        EXPECT_TRUE(m_registry.Trust(details));
        auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
        EXPECT_TRUE(m_spManager->OnTransportAccepted(spTransport));
        spTransport->Receive(test::CreateHello(details));
        return spTransport;
    }

    void Advance(std::chrono::milliseconds elapsed) { m_now += elapsed; }
    void Tick() { m_spManager->Tick(); }
    std::size_t Dispatch() { return m_spPublisher->Dispatch(); }

    [[nodiscard]] Connection::Manager& GetManager() { return *m_spManager; }
    [[nodiscard]] Pairing::Manager& GetPairingManager() { return *m_upPairingManager; }
    [[nodiscard]] Device::Registry& GetRegistry() { return m_registry; }
    [[nodiscard]] Connection::Test::Connector& GetConnector() { return m_connector; }
    [[nodiscard]] Events const& GetEvents() const { return m_events; }
    [[nodiscard]] std::int32_t GetObservedCount() const { return m_observed; }

private:
    Connection::Clock::time_point m_now;
    Event::SharedPublisher m_spPublisher;
    Device::Registry m_registry;
    Route::Router m_router;
    Connection::Test::Connector m_connector;
    std::unique_ptr<Pairing::Manager> m_upPairingManager;
    std::shared_ptr<Connection::Manager> m_spManager;
    Events m_events;
    std::int32_t m_observed;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, AcceptedPairingTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();
    ASSERT_TRUE(fixture.GetPairingManager().IssueCode());

    auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
    auto const optKey = manager.OnTransportAccepted(spTransport);
    ASSERT_TRUE(optKey);
    EXPECT_EQ(manager.GetState(*optKey), Connection::State::Connecting);
    EXPECT_FALSE(manager.IsOpen(test::Phone.identifier));

    spTransport->Receive(Message::PairingRequest{
        .code = "7kq2mx", .deviceId = test::Phone.identifier, .deviceName = test::Phone.name, .deviceType = "android" });

    auto const optResponse = spTransport->GetLast<Message::PairingResponse>();
    ASSERT_TRUE(optResponse);
    EXPECT_TRUE(optResponse->success);
    EXPECT_EQ(optResponse->deviceId, test::Hub.identifier);
    EXPECT_EQ(optResponse->deviceName, test::Hub.name);

    EXPECT_EQ(manager.GetState(*optKey), Connection::State::Open);
    EXPECT_TRUE(manager.IsOpen(test::Phone.identifier));
    EXPECT_EQ(manager.GetOpenKey(test::Phone.identifier), optKey);
    EXPECT_EQ(manager.GetOpenPeers(), std::vector<Device::Identifier>{ test::Phone.identifier });
    EXPECT_EQ(fixture.GetObservedCount(), 1);

    auto const optDetails = fixture.GetRegistry().Find(test::Phone.identifier);
    ASSERT_TRUE(optDetails);
    EXPECT_EQ(optDetails->trust, Device::TrustState::Trusted);
    EXPECT_EQ(optDetails->kind, Device::Kind::Mobile);

    fixture.Dispatch();
    EXPECT_EQ(fixture.GetEvents().paired, std::vector<Device::Identifier>{ test::Phone.identifier });
    EXPECT_EQ(fixture.GetEvents().connected, std::vector<Device::Identifier>{ test::Phone.identifier });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, RejectedPairingTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();
    ASSERT_TRUE(fixture.GetPairingManager().IssueCode());

    auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
    ASSERT_TRUE(manager.OnTransportAccepted(spTransport));
    spTransport->Receive(Message::PairingRequest{
        .code = "WRONG1", .deviceId = test::Phone.identifier, .deviceName = test::Phone.name, .deviceType = "mobile" });

    auto const optResponse = spTransport->GetLast<Message::PairingResponse>();
    ASSERT_TRUE(optResponse);
    EXPECT_FALSE(optResponse->success);
    EXPECT_TRUE(optResponse->message);

    EXPECT_FALSE(spTransport->IsActive());
    EXPECT_EQ(manager.GetConnectionCount(), 0u);
    EXPECT_FALSE(fixture.GetRegistry().IsTrusted(test::Phone.identifier));
    EXPECT_EQ(fixture.GetRegistry().GetTrustState(test::Phone.identifier), Device::TrustState::Pending);

    fixture.Dispatch();
    EXPECT_TRUE(fixture.GetEvents().connected.empty());
    EXPECT_TRUE(fixture.GetEvents().disconnected.empty()); // The connection was never open.
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, TrustedHelloTest)
{
    local::ConnectionFixture fixture;
    auto const spTransport = fixture.OpenTrusted(test::Phone);

    auto const optResponse = spTransport->GetLast<Message::HelloResponse>();
    ASSERT_TRUE(optResponse);
    EXPECT_TRUE(optResponse->success);
    EXPECT_EQ(optResponse->deviceId, test::Hub.identifier);
    EXPECT_TRUE(fixture.GetManager().IsOpen(test::Phone.identifier));

    // A second handshake over an open connection is answered without disturbing the connection.
    spTransport->Receive(test::CreateHello(test::Phone));
    auto const optRepeated = spTransport->GetLast<Message::HelloResponse>();
    ASSERT_TRUE(optRepeated);
    EXPECT_FALSE(optRepeated->success);
    EXPECT_TRUE(fixture.GetManager().IsOpen(test::Phone.identifier));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, UntrustedHelloTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();

    auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
    ASSERT_TRUE(manager.OnTransportAccepted(spTransport));
    spTransport->Receive(test::CreateHello(test::Phone));

    auto const optResponse = spTransport->GetLast<Message::HelloResponse>();
    ASSERT_TRUE(optResponse);
    EXPECT_FALSE(optResponse->success);
    EXPECT_FALSE(spTransport->IsActive());
    EXPECT_FALSE(manager.IsOpen(test::Phone.identifier));
    EXPECT_EQ(manager.GetConnectionCount(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, FrameBeforeHandshakeTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();

    {
        auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
        ASSERT_TRUE(manager.OnTransportAccepted(spTransport));
        spTransport->Receive(Message::ClipboardUpdate{
            .text = "secret", .timestamp = TimeUtils::Timestamp{ 1 }, .originDeviceId = test::Phone.identifier });

        auto const optError = spTransport->GetLast<Message::ProtocolError>();
        ASSERT_TRUE(optError);
        EXPECT_EQ(optError->reference, "clipboard_update");
        EXPECT_FALSE(spTransport->IsActive());
    }

    {
        auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
        ASSERT_TRUE(manager.OnTransportAccepted(spTransport));
        spTransport->Receive(std::string_view{ "{ this is not json" });
        EXPECT_TRUE(spTransport->GetLast<Message::ProtocolError>());
        EXPECT_FALSE(spTransport->IsActive());
    }

    {
        auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
        ASSERT_TRUE(manager.OnTransportAccepted(spTransport));
        spTransport->Receive(std::vector<std::uint8_t>{ 0x01, 0x02, 0x03 });
        EXPECT_TRUE(spTransport->GetLast<Message::ProtocolError>());
        EXPECT_FALSE(spTransport->IsActive());
    }

    EXPECT_EQ(manager.GetConnectionCount(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, HandshakeTimeoutTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();

    auto const spTransport = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
    auto const optKey = manager.OnTransportAccepted(spTransport);
    ASSERT_TRUE(optKey);

    fixture.Advance(std::chrono::milliseconds{ 4999 });
    fixture.Tick();
    EXPECT_EQ(manager.GetState(*optKey), Connection::State::Connecting);

    fixture.Advance(std::chrono::milliseconds{ 1 });
    fixture.Tick();
    EXPECT_FALSE(manager.GetState(*optKey));
    EXPECT_FALSE(spTransport->IsActive());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, SupersededConnectionTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();

    auto const spFirst = fixture.OpenTrusted(test::Phone);
    auto const optFirstKey = manager.GetOpenKey(test::Phone.identifier);
    ASSERT_TRUE(optFirstKey);

    auto const spSecond = fixture.OpenTrusted(test::Phone);
    auto const optSecondKey = manager.GetOpenKey(test::Phone.identifier);
    ASSERT_TRUE(optSecondKey);
    EXPECT_NE(*optFirstKey, *optSecondKey);

    // At most one connection may be open per device.
    EXPECT_FALSE(spFirst->IsActive());
    EXPECT_TRUE(spSecond->IsActive());
    EXPECT_EQ(manager.GetOpenPeers().size(), 1u);
    EXPECT_EQ(manager.GetConnectionCount(), 1u);

    fixture.Dispatch();
    auto const& disconnected = fixture.GetEvents().disconnected;
    ASSERT_EQ(disconnected.size(), 1u);
    EXPECT_EQ(disconnected.front().second, Connection::Cause::Superseded);
    EXPECT_EQ(fixture.GetEvents().connected.size(), 2u);
    EXPECT_EQ(fixture.GetObservedCount(), 1);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, PingTest)
{
    local::ConnectionFixture fixture;
    auto const spTransport = fixture.OpenTrusted(test::Phone);

    spTransport->Receive(Message::Ping{ .timestamp = TimeUtils::Timestamp{ 1234 } });
    auto const optPong = spTransport->GetLast<Message::Pong>();
    ASSERT_TRUE(optPong);
    EXPECT_EQ(optPong->timestamp.count(), 1234);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, HeartbeatLostTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();
    auto const spTransport = fixture.OpenTrusted(test::Phone);

    fixture.Advance(std::chrono::seconds{ 10 });
    fixture.Tick();
    EXPECT_EQ(spTransport->Count(Message::Ping::Type), 1u);

    fixture.Advance(std::chrono::seconds{ 10 });
    fixture.Tick();
    EXPECT_EQ(spTransport->Count(Message::Ping::Type), 2u);
    EXPECT_TRUE(manager.IsOpen(test::Phone.identifier));

    fixture.Advance(std::chrono::seconds{ 10 });
    fixture.Tick();
    EXPECT_FALSE(manager.IsOpen(test::Phone.identifier));
    EXPECT_FALSE(spTransport->IsActive());

    fixture.Dispatch();
    auto const& disconnected = fixture.GetEvents().disconnected;
    ASSERT_EQ(disconnected.size(), 1u);
    EXPECT_EQ(disconnected.front().first, test::Phone.identifier);
    EXPECT_EQ(disconnected.front().second, Connection::Cause::HeartbeatLost);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, HeartbeatActivityTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();
    auto const spTransport = fixture.OpenTrusted(test::Phone);

    // Any inbound frame within each interval keeps the connection alive.
    for (std::size_t idx = 0; idx < 6; ++idx) {
        fixture.Advance(std::chrono::seconds{ 5 });
        spTransport->Receive(Message::Pong{ .timestamp = TimeUtils::Timestamp{ 1 } });
        fixture.Advance(std::chrono::seconds{ 5 });
        fixture.Tick();
    }

    EXPECT_TRUE(manager.IsOpen(test::Phone.identifier));
    EXPECT_EQ(spTransport->Count(Message::Ping::Type), 6u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, ClientSettingTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();
    auto const spTransport = fixture.OpenTrusted(test::Phone);

    EXPECT_EQ(manager.IsEnabled(test::Phone.identifier, Connection::Setting::ClipboardSync), true);
    EXPECT_EQ(manager.GetInterestedPeers(Connection::Setting::ClipboardSync).size(), 1u);

    spTransport->Receive(Message::ClientSetting{ .setting = "clipboard_sync", .value = false });
    EXPECT_EQ(manager.IsEnabled(test::Phone.identifier, Connection::Setting::ClipboardSync), false);
    EXPECT_EQ(manager.IsEnabled(test::Phone.identifier, Connection::Setting::NotificationMirroring), true);
    EXPECT_TRUE(manager.GetInterestedPeers(Connection::Setting::ClipboardSync).empty());

    spTransport->Receive(Message::ClientSetting{ .setting = "teleportation", .value = true });
    auto const optError = spTransport->GetLast<Message::ProtocolError>();
    ASSERT_TRUE(optError);
    EXPECT_EQ(optError->reference, "client_setting");
    EXPECT_TRUE(manager.IsOpen(test::Phone.identifier)); // An unknown setting does not end the connection.

    EXPECT_FALSE(manager.IsEnabled("unknown-device", Connection::Setting::ClipboardSync));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, LocalUnpairTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();
    auto const spTransport = fixture.OpenTrusted(test::Phone);

    EXPECT_TRUE(manager.Unpair(test::Phone.identifier));

    auto const optUnpair = spTransport->GetLast<Message::Unpair>();
    ASSERT_TRUE(optUnpair);
    EXPECT_EQ(optUnpair->deviceId, test::Hub.identifier);
    EXPECT_FALSE(spTransport->IsActive());
    EXPECT_FALSE(manager.IsOpen(test::Phone.identifier));
    EXPECT_EQ(fixture.GetRegistry().GetTrustState(test::Phone.identifier), Device::TrustState::Revoked);

    fixture.Dispatch();
    ASSERT_EQ(fixture.GetEvents().unpaired.size(), 1u);
    EXPECT_EQ(fixture.GetEvents().unpaired.front().second, local::UnpairCause::LocalRequest);
    ASSERT_EQ(fixture.GetEvents().disconnected.size(), 1u);
    EXPECT_EQ(fixture.GetEvents().disconnected.front().second, Connection::Cause::Unpaired);

    // The revoked device can no longer authenticate.
    auto const spRetry = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
    ASSERT_TRUE(manager.OnTransportAccepted(spRetry));
    spRetry->Receive(test::CreateHello(test::Phone));
    EXPECT_FALSE(manager.IsOpen(test::Phone.identifier));

    EXPECT_FALSE(manager.Unpair("unknown-device"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, PeerUnpairTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();
    auto const spTransport = fixture.OpenTrusted(test::Phone);

    // The request must identify the sending device.
    spTransport->Receive(Message::Unpair{ .deviceId = "someone-else" });
    EXPECT_TRUE(manager.IsOpen(test::Phone.identifier));
    EXPECT_TRUE(spTransport->GetLast<Message::ProtocolError>());

    spTransport->Receive(Message::Unpair{ .deviceId = test::Phone.identifier });
    EXPECT_FALSE(manager.IsOpen(test::Phone.identifier));
    EXPECT_EQ(fixture.GetRegistry().GetTrustState(test::Phone.identifier), Device::TrustState::Revoked);

    fixture.Dispatch();
    ASSERT_EQ(fixture.GetEvents().unpaired.size(), 1u);
    EXPECT_EQ(fixture.GetEvents().unpaired.front().second, local::UnpairCause::PeerRequest);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, InitiatedPairingTest)
{
    local::ConnectionFixture fixture{ test::Phone };
    auto& manager = fixture.GetManager();
    auto& connector = fixture.GetConnector();

    EXPECT_TRUE(manager.Connect(test::HubAddress, std::string{ test::PairingCode }));
    EXPECT_FALSE(manager.Connect(test::HubAddress)); // The target is already being connected.
    EXPECT_EQ(manager.GetTargetCount(), 1u);
    ASSERT_EQ(connector.GetPendingCount(), 1u);

    auto const spTransport = connector.Establish();
    auto const optRequest = spTransport->GetLast<Message::PairingRequest>();
    ASSERT_TRUE(optRequest);
    EXPECT_EQ(optRequest->code, test::PairingCode);
    EXPECT_EQ(optRequest->deviceId, test::Phone.identifier);
    EXPECT_EQ(optRequest->deviceType, "mobile");

    spTransport->Receive(Message::PairingResponse{
        .success = true, .message = {}, .deviceId = test::Hub.identifier, .deviceName = test::Hub.name });
    EXPECT_TRUE(manager.IsOpen(test::Hub.identifier));

    auto const optHub = fixture.GetRegistry().Find(test::Hub.identifier);
    ASSERT_TRUE(optHub);
    EXPECT_EQ(optHub->trust, Device::TrustState::Trusted);
    EXPECT_EQ(optHub->kind, Device::Kind::Hub);

    fixture.Dispatch();
    EXPECT_EQ(fixture.GetEvents().paired, std::vector<Device::Identifier>{ test::Hub.identifier });
    EXPECT_EQ(fixture.GetEvents().connected, std::vector<Device::Identifier>{ test::Hub.identifier });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, InitiatedPairingRejectedTest)
{
    local::ConnectionFixture fixture{ test::Phone };
    auto& manager = fixture.GetManager();

    EXPECT_TRUE(manager.Connect(test::HubAddress, std::string{ test::PairingCode }));
    auto const spTransport = fixture.GetConnector().Establish();
    spTransport->Receive(Message::PairingResponse{
        .success = false, .message = "The pairing code has expired.", .deviceId = {}, .deviceName = {} });

    // A rejection is deliberate, the target is not retried.
    EXPECT_FALSE(spTransport->IsActive());
    EXPECT_EQ(manager.GetTargetCount(), 0u);
    EXPECT_FALSE(fixture.GetRegistry().IsTrusted(test::Hub.identifier));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, ReconnectTest)
{
    local::ConnectionFixture fixture{ test::Phone };
    auto& manager = fixture.GetManager();
    auto& connector = fixture.GetConnector();

    EXPECT_TRUE(manager.Connect(test::HubAddress, std::string{ test::PairingCode }));
    auto const spFirst = connector.Establish();
    spFirst->Receive(Message::PairingResponse{
        .success = true, .message = {}, .deviceId = test::Hub.identifier, .deviceName = test::Hub.name });
    ASSERT_TRUE(manager.IsOpen(test::Hub.identifier));

    spFirst->Disconnect();
    EXPECT_FALSE(manager.IsOpen(test::Hub.identifier));
    EXPECT_EQ(manager.GetReconnectAttempts(test::HubAddress), 1u);
    EXPECT_EQ(connector.GetPendingCount(), 0u);

    fixture.Advance(std::chrono::milliseconds{ 499 });
    fixture.Tick();
    EXPECT_EQ(connector.GetPendingCount(), 0u);

    fixture.Advance(std::chrono::milliseconds{ 1 });
    fixture.Tick();
    ASSERT_EQ(connector.GetPendingCount(), 1u);

    // The pairing code was consumed, the reconnect authenticates as a trusted device.
    auto const spSecond = connector.Establish();
    auto const optHello = spSecond->GetLast<Message::Hello>();
    ASSERT_TRUE(optHello);
    EXPECT_EQ(optHello->deviceId, test::Phone.identifier);
    EXPECT_FALSE(spSecond->GetLast<Message::PairingRequest>());

    spSecond->Receive(Message::HelloResponse{
        .success = true, .message = {}, .deviceId = test::Hub.identifier, .deviceName = test::Hub.name });
    EXPECT_TRUE(manager.IsOpen(test::Hub.identifier));
    EXPECT_EQ(manager.GetReconnectAttempts(test::HubAddress), 0u);

    fixture.Dispatch();
    auto const& events = fixture.GetEvents();
    ASSERT_EQ(events.reconnecting.size(), 1u);
    EXPECT_EQ(events.reconnecting.front().first, 1u);
    EXPECT_EQ(events.reconnecting.front().second, std::chrono::milliseconds{ 500 });
    ASSERT_EQ(events.disconnected.size(), 1u);
    EXPECT_EQ(events.disconnected.front().second, Connection::Cause::TransportClosed);
    EXPECT_EQ(events.connected.size(), 2u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, ReconnectExhaustedTest)
{
    local::ConnectionFixture fixture{ test::Phone, test::CreateOptions(3) };
    auto& manager = fixture.GetManager();
    auto& connector = fixture.GetConnector();

    EXPECT_TRUE(manager.Connect(test::HubAddress, std::string{ test::PairingCode }));

    std::vector<std::chrono::milliseconds> const expected = {
        std::chrono::milliseconds{ 500 }, std::chrono::milliseconds{ 1000 }, std::chrono::milliseconds{ 2000 } };
    for (auto const& delay : expected) {
        ASSERT_EQ(connector.GetPendingCount(), 1u);
        connector.Refuse();
        fixture.Advance(delay);
        fixture.Tick();
    }

    ASSERT_EQ(connector.GetPendingCount(), 1u);
    connector.Refuse();
    EXPECT_EQ(manager.GetTargetCount(), 0u);
    EXPECT_FALSE(manager.GetReconnectAttempts(test::HubAddress));

    fixture.Dispatch();
    auto const& events = fixture.GetEvents();
    ASSERT_EQ(events.reconnecting.size(), expected.size());
    for (std::size_t idx = 0; idx < expected.size(); ++idx) {
        EXPECT_EQ(events.reconnecting[idx].first, idx + 1);
        EXPECT_EQ(events.reconnecting[idx].second, expected[idx]);
    }
    EXPECT_EQ(events.exhausted, std::vector<std::uint32_t>{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, UnpairCancelsReconnectTest)
{
    local::ConnectionFixture fixture{ test::Phone };
    auto& manager = fixture.GetManager();
    auto& connector = fixture.GetConnector();

    EXPECT_TRUE(manager.Connect(test::HubAddress, std::string{ test::PairingCode }));
    auto const spTransport = connector.Establish();
    spTransport->Receive(Message::PairingResponse{
        .success = true, .message = {}, .deviceId = test::Hub.identifier, .deviceName = test::Hub.name });
    spTransport->Disconnect();
    ASSERT_EQ(manager.GetTargetCount(), 1u);

    EXPECT_TRUE(manager.Unpair(test::Hub.identifier));
    EXPECT_EQ(manager.GetTargetCount(), 0u);

    fixture.Advance(std::chrono::seconds{ 60 });
    fixture.Tick();
    EXPECT_EQ(connector.GetPendingCount(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, ShutdownTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();

    auto const spOpen = fixture.OpenTrusted(test::Phone);
    auto const spPending = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
    ASSERT_TRUE(manager.OnTransportAccepted(spPending));

    manager.Shutdown();
    EXPECT_FALSE(spOpen->IsActive());
    EXPECT_FALSE(spPending->IsActive());
    EXPECT_FALSE(manager.IsOpen(test::Phone.identifier));
    EXPECT_EQ(manager.GetConnectionCount(), 0u);

    // New transports and targets are refused once shut down.
    auto const spLate = std::make_shared<Connection::Test::Transport>(test::PhoneAddress);
    EXPECT_FALSE(manager.OnTransportAccepted(spLate));
    EXPECT_FALSE(spLate->IsActive());
    EXPECT_FALSE(manager.Connect(test::HubAddress));

    fixture.Dispatch();
    ASSERT_EQ(fixture.GetEvents().disconnected.size(), 1u);
    EXPECT_EQ(fixture.GetEvents().disconnected.front().second, Connection::Cause::Shutdown);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionManagerSuite, SendTest)
{
    local::ConnectionFixture fixture;
    auto& manager = fixture.GetManager();

    Message::NotificationRemoved const removed{ .id = "n-1" };
    EXPECT_FALSE(manager.Send(test::Phone.identifier, removed));

    auto const spTransport = fixture.OpenTrusted(test::Phone);
    EXPECT_TRUE(manager.Send(test::Phone.identifier, removed));
    EXPECT_EQ(spTransport->GetLastType(), "notification_removed");

    Message::Chunk const chunk{ .transferId = "t-1", .sequence = 0, .data = { 1, 2, 3 } };
    EXPECT_TRUE(manager.Send(test::Phone.identifier, chunk));
    ASSERT_EQ(spTransport->GetBinaries().size(), 1u);
    EXPECT_EQ(Message::DecodeChunk(spTransport->GetBinaries().front()), chunk);
}

//----------------------------------------------------------------------------------------------------------------------
