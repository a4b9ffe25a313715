//----------------------------------------------------------------------------------------------------------------------
#include "PeerMessengerStub.hpp"
#include "Components/Notification/Channel.hpp"
#include "Components/Route/MessageHandler.hpp"
#include "Interfaces/NotificationSink.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <map>
#include <string>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class NotificationSinkStub;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const Hub = "hub-0001";
Device::Identifier const PeerA = "phone-aaaa";
Device::Identifier const PeerB = "laptop-bbbb";

Message::Notification CreateNotification(std::string const& id, std::string const& title)
{
    return Message::Notification{
        .id = id,
        .appName = "Messages",
        .title = title,
        .content = "Are we still on for lunch?",
        .timestamp = TimeUtils::Timestamp{ 1'700'000'000'000 },
        .originDeviceId = {}
    };
}

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::NotificationSinkStub : public INotificationSink
{
public:
    // INotificationSink {
    virtual void Present(Device::Identifier const& origin, Message::Notification const& notification) override
    {
        m_presented.insert_or_assign({ origin, notification.id }, notification);
        ++m_presentations;
    }

    virtual void Dismiss(Device::Identifier const& origin, std::string const& id) override
    {
        m_presented.erase({ origin, id });
    }
    // } INotificationSink

    [[nodiscard]] std::size_t GetPresentedCount() const { return m_presented.size(); }
    [[nodiscard]] std::size_t GetPresentations() const { return m_presentations; }

private:
    std::map<std::pair<Device::Identifier, std::string>, Message::Notification> m_presented;
    std::size_t m_presentations = 0;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(NotificationChannelSuite, LocalPostTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);
    messenger.Connect(test::PeerB);
    messenger.SetEnabled(test::PeerB, Connection::Setting::NotificationMirroring, false);

    Notification::Channel channel{ test::Hub, messenger, nullptr, {} };
    EXPECT_EQ(channel.OnLocalPosted(test::CreateNotification("n-1", "Dinner")), 1u);

    auto const sent = messenger.GetSent<Message::Notification>(test::PeerA);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent.front().id, "n-1");
    EXPECT_EQ(sent.front().originDeviceId, test::Hub);
    EXPECT_TRUE(messenger.GetSent<Message::Notification>(test::PeerB).empty());

    EXPECT_EQ(channel.OnLocalRemoved("n-1"), 1u);
    auto const removed = messenger.GetSent<Message::NotificationRemoved>(test::PeerA);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed.front().id, "n-1");

    EXPECT_EQ(channel.OnLocalPosted(test::CreateNotification("", "No identifier")), 0u);
    EXPECT_EQ(channel.OnLocalRemoved(""), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NotificationChannelSuite, MirrorTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);
    messenger.Connect(test::PeerB);

    local::NotificationSinkStub sink;
    Notification::Channel channel{ test::Hub, messenger, &sink, {} };

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateNotification("n-1", "Dinner")));
    EXPECT_EQ(channel.GetMirroredCount(), 1u);
    EXPECT_EQ(sink.GetPresentedCount(), 1u);

    auto const optMirrored = channel.FindMirrored(test::PeerA, "n-1");
    ASSERT_TRUE(optMirrored);
    EXPECT_EQ(optMirrored->originDeviceId, test::PeerA);
    EXPECT_EQ(optMirrored->title, "Dinner");

    // A repeated post with the same identifier replaces the mirrored copy.
    EXPECT_TRUE(channel.Handle(fromA, test::CreateNotification("n-1", "Dinner at eight")));
    EXPECT_EQ(channel.GetMirroredCount(), 1u);
    EXPECT_EQ(sink.GetPresentedCount(), 1u);
    EXPECT_EQ(sink.GetPresentations(), 2u);
    EXPECT_EQ(channel.FindMirrored(test::PeerA, "n-1")->title, "Dinner at eight");

    // The same identifier from a different origin is a distinct notification.
    Route::Context const fromB{ test::PeerB, 2, messenger };
    EXPECT_TRUE(channel.Handle(fromB, test::CreateNotification("n-1", "Build finished")));
    EXPECT_EQ(channel.GetMirroredCount(), 2u);

    // Relaying is disabled by default.
    EXPECT_EQ(messenger.GetSentCount(), 0u);

    EXPECT_TRUE(channel.Handle(fromA, Message::NotificationRemoved{ .id = "n-1" }));
    EXPECT_EQ(channel.GetMirroredCount(), 1u);
    EXPECT_FALSE(channel.FindMirrored(test::PeerA, "n-1"));
    EXPECT_TRUE(channel.FindMirrored(test::PeerB, "n-1"));
    EXPECT_EQ(sink.GetPresentedCount(), 1u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NotificationChannelSuite, RelayTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);
    messenger.Connect(test::PeerB);

    Notification::Channel channel{ test::Hub, messenger, nullptr, { .enabled = true, .relay = true } };

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateNotification("n-1", "Dinner")));

    EXPECT_TRUE(messenger.GetSent<Message::Notification>(test::PeerA).empty());
    auto const relayed = messenger.GetSent<Message::Notification>(test::PeerB);
    ASSERT_EQ(relayed.size(), 1u);
    EXPECT_EQ(relayed.front().originDeviceId, test::PeerA);

    EXPECT_TRUE(channel.Handle(fromA, Message::NotificationRemoved{ .id = "n-1" }));
    EXPECT_EQ(messenger.GetSent<Message::NotificationRemoved>(test::PeerB).size(), 1u);

    // A removal of an unknown notification is not relayed.
    EXPECT_TRUE(channel.Handle(fromA, Message::NotificationRemoved{ .id = "n-404" }));
    EXPECT_EQ(messenger.GetSent<Message::NotificationRemoved>(test::PeerB).size(), 1u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NotificationChannelSuite, DismissTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);

    local::NotificationSinkStub sink;
    Notification::Channel channel{ test::Hub, messenger, &sink, {} };

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateNotification("n-1", "Dinner")));

    EXPECT_TRUE(channel.Dismiss(test::PeerA, "n-1"));
    EXPECT_EQ(channel.GetMirroredCount(), 0u);
    EXPECT_EQ(sink.GetPresentedCount(), 0u);

    auto const removed = messenger.GetSent<Message::NotificationRemoved>(test::PeerA);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed.front().id, "n-1");

    EXPECT_FALSE(channel.Dismiss(test::PeerA, "n-1"));
    EXPECT_FALSE(channel.Dismiss(test::PeerB, "n-1"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NotificationChannelSuite, PeerDisconnectedTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);

    local::NotificationSinkStub sink;
    Notification::Channel channel{ test::Hub, messenger, &sink, {} };

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateNotification("n-1", "Dinner")));
    EXPECT_TRUE(channel.Handle(fromA, test::CreateNotification("n-2", "Lunch")));

    // The mirrored notifications survive a dropped connection.
    channel.OnPeerDisconnected(test::PeerA, Connection::Cause::HeartbeatLost);
    EXPECT_EQ(channel.GetMirroredCount(), 2u);

    channel.OnPeerDisconnected(test::PeerA, Connection::Cause::Unpaired);
    EXPECT_EQ(channel.GetMirroredCount(), 0u);
    EXPECT_EQ(sink.GetPresentedCount(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NotificationChannelSuite, DisabledTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);

    local::NotificationSinkStub sink;
    Notification::Channel channel{ test::Hub, messenger, &sink, { .enabled = false, .relay = false } };

    EXPECT_EQ(channel.OnLocalPosted(test::CreateNotification("n-1", "Dinner")), 0u);

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateNotification("n-2", "Lunch")));
    EXPECT_EQ(channel.GetMirroredCount(), 0u);
    EXPECT_EQ(sink.GetPresentations(), 0u);
    EXPECT_EQ(messenger.GetSentCount(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------
