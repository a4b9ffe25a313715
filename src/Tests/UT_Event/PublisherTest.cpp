//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Publisher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const Identifier = "phone-0001";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(EventPublisherSuite, AdvertiseTest)
{
    Event::Publisher publisher;
    EXPECT_FALSE(publisher.IsAdvertised(Event::Type::BindingFailed));

    publisher.Advertise(Event::Type::RuntimeStarted);
    publisher.Advertise({ Event::Type::PeerConnected, Event::Type::PeerDisconnected, Event::Type::RuntimeStarted });
    publisher.Advertise(Event::Type::TransferFinished);

    EXPECT_TRUE(publisher.IsAdvertised(Event::Type::RuntimeStarted));
    EXPECT_TRUE(publisher.IsAdvertised(Event::Type::PeerConnected));
    EXPECT_TRUE(publisher.IsAdvertised(Event::Type::PeerDisconnected));
    EXPECT_TRUE(publisher.IsAdvertised(Event::Type::TransferFinished));
    EXPECT_FALSE(publisher.IsAdvertised(Event::Type::BindingFailed));
    EXPECT_FALSE(publisher.IsAdvertised(Event::Type::ServiceDiscovered));

    // Advertising is allowed after subscriptions have been suspended.
    publisher.SuspendSubscriptions();
    publisher.Advertise(Event::Type::BindingFailed);
    EXPECT_TRUE(publisher.IsAdvertised(Event::Type::BindingFailed));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EventPublisherSuite, DispatchTest)
{
    Event::Publisher publisher;

    std::vector<std::uint32_t> attempts;
    std::uint32_t started = 0;
    EXPECT_TRUE(publisher.Subscribe<Event::Type::PeerReconnecting>(
        [&attempts] (Device::Identifier const& identifier, std::uint32_t attempt, std::chrono::milliseconds) {
            EXPECT_EQ(identifier, test::Identifier);
            attempts.emplace_back(attempt);
        }));
    EXPECT_TRUE(publisher.Subscribe<Event::Type::RuntimeStarted>([&started] () { ++started; }));
    EXPECT_TRUE(publisher.Subscribe<Event::Type::RuntimeStarted>([&started] () { ++started; }));

    publisher.SuspendSubscriptions();
    EXPECT_FALSE(publisher.Subscribe<Event::Type::RuntimeStopped>([] (auto) { }));

    publisher.Publish<Event::Type::RuntimeStarted>();
    publisher.Publish<Event::Type::PeerReconnecting>(test::Identifier, std::uint32_t{ 1 }, std::chrono::milliseconds{ 500 });
    publisher.Publish<Event::Type::PeerReconnecting>(test::Identifier, std::uint32_t{ 2 }, std::chrono::milliseconds{ 1000 });
    EXPECT_EQ(publisher.EventCount(), 3u);

    // Events without a listener are discarded when published.
    publisher.Publish<Event::Type::ServiceRemoved>(std::string{ "ferry-hub" });
    EXPECT_EQ(publisher.EventCount(), 3u);

    EXPECT_EQ(publisher.Dispatch(), 3u);
    EXPECT_EQ(publisher.EventCount(), 0u);
    EXPECT_EQ(started, 2u);
    EXPECT_EQ(attempts, (std::vector<std::uint32_t>{ 1, 2 }));

    EXPECT_EQ(publisher.Dispatch(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(EventPublisherSuite, CrossThreadPublishTest)
{
    Event::Publisher publisher;

    std::vector<Connection::Cause> causes;
    EXPECT_TRUE(publisher.Subscribe<Event::Type::PeerDisconnected>(
        [&causes] (Device::Identifier const&, Connection::Cause cause) { causes.emplace_back(cause); }));
    publisher.SuspendSubscriptions();

    constexpr std::size_t PublishCount = 100;
    std::thread network([&publisher] () {
        for (std::size_t idx = 0; idx < PublishCount; ++idx) {
            publisher.Publish<Event::Type::PeerDisconnected>(test::Identifier, Connection::Cause::HeartbeatLost);
        }
    });
    network.join();

    EXPECT_EQ(publisher.Dispatch(), PublishCount);
    ASSERT_EQ(causes.size(), PublishCount);
    EXPECT_EQ(causes.front(), Connection::Cause::HeartbeatLost);
}

//----------------------------------------------------------------------------------------------------------------------
