//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Publisher.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Network/WebSocket/Endpoint.hpp"
#include "Interfaces/Transport.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class TransportObserver;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Loopback = "127.0.0.1";
constexpr std::chrono::seconds Timeout = std::chrono::seconds{ 5 };

std::string const TextFrame = R"({"type":"clipboard_update","content":"hello"})";
std::vector<std::uint8_t> const BinaryFrame = { 0x46, 0x52, 0x59, 0x00, 0x01, 0xFF };

[[nodiscard]] bool RunUntil(boost::asio::io_context& context, std::function<bool()> const& condition);

// Runs the handlers left after a shutdown while the endpoints are still alive.
void Drain(boost::asio::io_context& context);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::TransportObserver
{
public:
    TransportObserver() = default;

    void Observe(SharedTransport const& spTransport)
    {
        m_spTransport = spTransport;
        if (!m_spTransport) { return; }
        m_spTransport->Attach(
            [this] (std::string_view frame) { m_text.emplace_back(frame); },
            [this] (std::span<std::uint8_t const> frame) { m_binary.emplace_back(frame.begin(), frame.end()); },
            [this] (ITransport::StopCause cause) { m_optStopCause = cause; });
    }

    [[nodiscard]] SharedTransport const& GetTransport() const { return m_spTransport; }
    [[nodiscard]] std::vector<std::string> const& GetText() const { return m_text; }
    [[nodiscard]] std::vector<std::vector<std::uint8_t>> const& GetBinary() const { return m_binary; }
    [[nodiscard]] std::optional<ITransport::StopCause> const& GetStopCause() const { return m_optStopCause; }

private:
    SharedTransport m_spTransport;
    std::vector<std::string> m_text;
    std::vector<std::vector<std::uint8_t>> m_binary;
    std::optional<ITransport::StopCause> m_optStopCause;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(WebSocketEndpointSuite, ExchangeFramesTest)
{
    boost::asio::io_context context;
    auto const spPublisher = std::make_shared<Event::Publisher>();
    spPublisher->SuspendSubscriptions();

    local::TransportObserver server;
    local::TransportObserver client;
    bool connected = false;

    Network::WebSocket::Endpoint listener(context, spPublisher);
    listener.SetAcceptHandler([&server] (SharedTransport const& spTransport) { server.Observe(spTransport); });
    ASSERT_TRUE(listener.Bind(Network::BindingAddress{ test::Loopback, 0 }));
    ASSERT_TRUE(listener.IsListening());

    // An ephemeral port was requested, the bound port is assigned by the system.
    auto const& optBinding = listener.GetBinding();
    ASSERT_TRUE(optBinding);
    EXPECT_NE(optBinding->GetPort(), 0);

    Network::WebSocket::Endpoint connector(context, spPublisher);
    Network::RemoteAddress const address{ test::Loopback, optBinding->GetPort(), Network::RemoteAddress::Origin::User };
    ASSERT_TRUE(connector.ScheduleConnect(address, [&] (SharedTransport const& spTransport) {
        connected = true;
        client.Observe(spTransport);
    }));

    ASSERT_TRUE(test::RunUntil(context, [&] () { return connected && server.GetTransport(); }));
    ASSERT_TRUE(client.GetTransport());
    EXPECT_TRUE(client.GetTransport()->IsActive());
    EXPECT_EQ(client.GetTransport()->GetAddress(), address);
    EXPECT_EQ(server.GetTransport()->GetAddress().GetHost(), test::Loopback);
    EXPECT_EQ(server.GetTransport()->GetAddress().GetOrigin(), Network::RemoteAddress::Origin::Network);
    EXPECT_EQ(listener.GetSessionCount(), 1u);
    EXPECT_EQ(connector.GetSessionCount(), 1u);

    EXPECT_TRUE(client.GetTransport()->SendText(std::string{ test::TextFrame }));
    EXPECT_TRUE(server.GetTransport()->SendBinary(std::vector<std::uint8_t>{ test::BinaryFrame }));
    EXPECT_TRUE(server.GetTransport()->SendText(std::string{ test::TextFrame }));
    ASSERT_TRUE(test::RunUntil(context, [&] () {
        return server.GetText().size() == 1 && client.GetBinary().size() == 1 && client.GetText().size() == 1;
    }));

    EXPECT_EQ(server.GetText().front(), test::TextFrame);
    EXPECT_EQ(client.GetBinary().front(), test::BinaryFrame);
    EXPECT_EQ(client.GetText().front(), test::TextFrame);
    EXPECT_TRUE(server.GetBinary().empty());

    // A closure flushes the frames scheduled before it and is observed by both sides.
    EXPECT_TRUE(client.GetTransport()->SendText(std::string{ test::TextFrame }));
    client.GetTransport()->Close();
    EXPECT_FALSE(client.GetTransport()->IsActive());
    EXPECT_FALSE(client.GetTransport()->SendText(std::string{ test::TextFrame }));

    ASSERT_TRUE(test::RunUntil(context, [&] () { return server.GetStopCause() && client.GetStopCause(); }));
    EXPECT_EQ(server.GetText().size(), 2u);
    EXPECT_EQ(server.GetStopCause(), ITransport::StopCause::Closed);
    EXPECT_EQ(client.GetStopCause(), ITransport::StopCause::Requested);
    EXPECT_FALSE(server.GetTransport()->IsActive());

    listener.Shutdown();
    connector.Shutdown();
    EXPECT_FALSE(listener.IsListening());
    test::Drain(context);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WebSocketEndpointSuite, ShutdownStopsSessionsTest)
{
    boost::asio::io_context context;
    auto const spPublisher = std::make_shared<Event::Publisher>();
    spPublisher->SuspendSubscriptions();

    local::TransportObserver server;
    local::TransportObserver client;

    Network::WebSocket::Endpoint listener(context, spPublisher);
    listener.SetAcceptHandler([&server] (SharedTransport const& spTransport) { server.Observe(spTransport); });
    ASSERT_TRUE(listener.Bind(Network::BindingAddress{ test::Loopback, 0 }));

    Network::WebSocket::Endpoint connector(context, spPublisher);
    Network::RemoteAddress const address{ test::Loopback, listener.GetBinding()->GetPort() };
    ASSERT_TRUE(connector.ScheduleConnect(address, [&client] (SharedTransport const& spTransport) {
        client.Observe(spTransport);
    }));
    ASSERT_TRUE(test::RunUntil(context, [&] () { return client.GetTransport() && server.GetTransport(); }));

    // Shutting down the listener stops its sessions, the peer observes an abrupt closure.
    listener.Shutdown();
    EXPECT_FALSE(listener.IsListening());
    ASSERT_TRUE(test::RunUntil(context, [&] () { return server.GetStopCause() && client.GetStopCause(); }));
    EXPECT_EQ(server.GetStopCause(), ITransport::StopCause::Requested);
    EXPECT_NE(client.GetStopCause(), ITransport::StopCause::Requested);
    EXPECT_EQ(listener.GetSessionCount(), 0u);

    // A shutdown endpoint no longer accepts connection requests.
    connector.Shutdown();
    EXPECT_FALSE(connector.ScheduleConnect(address, [] (SharedTransport const&) { }));
    test::Drain(context);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WebSocketEndpointSuite, UnreachableAddressTest)
{
    boost::asio::io_context context;
    auto const spPublisher = std::make_shared<Event::Publisher>();
    spPublisher->SuspendSubscriptions();

    // Acquire a port that is known to be closed.
    std::uint16_t port = 0;
    {
        Network::WebSocket::Endpoint listener(context, spPublisher);
        ASSERT_TRUE(listener.Bind(Network::BindingAddress{ test::Loopback, 0 }));
        port = listener.GetBinding()->GetPort();
        listener.Shutdown();
        test::Drain(context);
    }

    Network::WebSocket::Endpoint connector(context, spPublisher);
    EXPECT_FALSE(connector.ScheduleConnect(Network::RemoteAddress{}, [] (SharedTransport const&) { }));

    bool invoked = false;
    SharedTransport spResult;
    ASSERT_TRUE(connector.ScheduleConnect(
        Network::RemoteAddress{ test::Loopback, port },
        [&] (SharedTransport const& spTransport) { invoked = true; spResult = spTransport; }));

    ASSERT_TRUE(test::RunUntil(context, [&] () { return invoked; }));
    EXPECT_FALSE(spResult);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WebSocketEndpointSuite, BindingFailureTest)
{
    boost::asio::io_context context;
    auto const spPublisher = std::make_shared<Event::Publisher>();

    std::optional<Event::Message<Event::Type::BindingFailed>::Cause> optCause;
    std::string failed;
    spPublisher->Subscribe<Event::Type::BindingFailed>(
        [&] (std::string const& uri, Event::Message<Event::Type::BindingFailed>::Cause cause) {
            failed = uri;
            optCause = cause;
        });
    spPublisher->SuspendSubscriptions();

    Network::WebSocket::Endpoint first(context, spPublisher);
    ASSERT_TRUE(first.Bind(Network::BindingAddress{ test::Loopback, 0 }));
    Network::BindingAddress const occupied{ test::Loopback, first.GetBinding()->GetPort() };

    Network::WebSocket::Endpoint second(context, spPublisher);
    EXPECT_TRUE(spPublisher->IsAdvertised(Event::Type::BindingFailed));
    EXPECT_FALSE(second.Bind(occupied));
    EXPECT_FALSE(second.IsListening());
    EXPECT_FALSE(second.GetBinding());

    EXPECT_EQ(spPublisher->Dispatch(), 1u);
    EXPECT_EQ(failed, occupied.GetUri());
    EXPECT_EQ(optCause, Event::Message<Event::Type::BindingFailed>::Cause::AddressInUse);

    first.Shutdown();
    second.Shutdown();
    test::Drain(context);
}

//----------------------------------------------------------------------------------------------------------------------

bool test::RunUntil(boost::asio::io_context& context, std::function<bool()> const& condition)
{
    constexpr auto Interval = std::chrono::milliseconds{ 5 };
    auto const deadline = std::chrono::steady_clock::now() + (condition() ? std::chrono::seconds{ 0 } : Timeout);
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) { return false; }
        if (context.stopped()) { context.restart(); }
        context.run_for(Interval);
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void test::Drain(boost::asio::io_context& context)
{
    if (context.stopped()) { context.restart(); }
    context.run_for(std::chrono::milliseconds{ 100 });
}

//----------------------------------------------------------------------------------------------------------------------
