//----------------------------------------------------------------------------------------------------------------------
#include "PeerMessengerStub.hpp"
#include "Components/Clipboard/Channel.hpp"
#include "Components/Route/MessageHandler.hpp"
#include "Interfaces/ClipboardAccess.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class ClipboardStub;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const Hub = "hub-0001";
Device::Identifier const PeerA = "phone-aaaa";
Device::Identifier const PeerB = "laptop-bbbb";

Message::ClipboardUpdate CreateUpdate(std::string const& text, Device::Identifier const& origin)
{
    return Message::ClipboardUpdate{
        .text = text, .timestamp = TimeUtils::Timestamp{ 1'700'000'000'000 }, .originDeviceId = origin };
}

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::ClipboardStub : public IClipboardAccess
{
public:
    // IClipboardAccess {
    [[nodiscard]] virtual bool Apply(std::string const& text, Device::Identifier const& origin) override
    {
        m_applied.emplace_back(text, origin);
        return true;
    }
    // } IClipboardAccess

    [[nodiscard]] std::vector<std::pair<std::string, Device::Identifier>> const& GetApplied() const { return m_applied; }

private:
    std::vector<std::pair<std::string, Device::Identifier>> m_applied;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(ClipboardChannelSuite, RelayWithoutEchoTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);
    messenger.Connect(test::PeerB);

    local::ClipboardStub clipboard;
    Clipboard::Channel channel{ test::Hub, messenger, &clipboard, { .enabled = true, .relay = true } };

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateUpdate("hello", test::PeerA)));

    // The update is applied locally and relayed to the other peer only.
    ASSERT_EQ(clipboard.GetApplied().size(), 1u);
    EXPECT_EQ(clipboard.GetApplied().front().first, "hello");
    EXPECT_EQ(clipboard.GetApplied().front().second, test::PeerA);
    EXPECT_TRUE(messenger.GetSent<Message::ClipboardUpdate>(test::PeerA).empty());

    auto const relayed = messenger.GetSent<Message::ClipboardUpdate>(test::PeerB);
    ASSERT_EQ(relayed.size(), 1u);
    EXPECT_EQ(relayed.front().text, "hello");
    EXPECT_EQ(relayed.front().originDeviceId, test::PeerA);

    // Peer B's clipboard listener reports the relayed content back to the hub.
    Route::Context const fromB{ test::PeerB, 2, messenger };
    EXPECT_TRUE(channel.Handle(fromB, test::CreateUpdate("hello", test::PeerB)));
    EXPECT_EQ(messenger.GetSentCount(), 1u);
    EXPECT_EQ(clipboard.GetApplied().size(), 1u);

    // The local clipboard reports the applied content as a change.
    EXPECT_EQ(channel.OnLocalChange("hello"), 0u);
    EXPECT_EQ(messenger.GetSentCount(), 1u);

    ASSERT_TRUE(channel.GetCurrent());
    EXPECT_EQ(channel.GetCurrent()->origin, test::PeerA);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ClipboardChannelSuite, WithoutRelayTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);
    messenger.Connect(test::PeerB);

    local::ClipboardStub clipboard;
    Clipboard::Channel channel{ test::Hub, messenger, &clipboard, {} };

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateUpdate("hello", test::PeerA)));
    EXPECT_EQ(clipboard.GetApplied().size(), 1u);
    EXPECT_EQ(messenger.GetSentCount(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ClipboardChannelSuite, LocalChangeTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);
    messenger.Connect(test::PeerB);
    messenger.SetEnabled(test::PeerB, Connection::Setting::ClipboardSync, false);

    Clipboard::Channel channel{ test::Hub, messenger, nullptr, {} };

    EXPECT_EQ(channel.OnLocalChange("copied text"), 1u);
    auto const sent = messenger.GetSent<Message::ClipboardUpdate>(test::PeerA);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent.front().text, "copied text");
    EXPECT_EQ(sent.front().originDeviceId, test::Hub);
    EXPECT_TRUE(messenger.GetSent<Message::ClipboardUpdate>(test::PeerB).empty());

    // Identical consecutive content is not sent again.
    EXPECT_EQ(channel.OnLocalChange("copied text"), 0u);
    EXPECT_EQ(channel.OnLocalChange(""), 0u);
    EXPECT_EQ(messenger.GetSentCount(), 1u);

    EXPECT_EQ(channel.OnLocalChange("something else"), 1u);
    EXPECT_EQ(channel.GetLastExchanged(test::PeerA), "something else");
    EXPECT_FALSE(channel.GetLastExchanged(test::PeerB));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ClipboardChannelSuite, ReconnectedPeerTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);

    Clipboard::Channel channel{ test::Hub, messenger, nullptr, {} };
    EXPECT_EQ(channel.OnLocalChange("first"), 1u);

    // The peer's clipboard may have changed while it was away, the exchanged content is forgotten.
    channel.OnPeerDisconnected(test::PeerA, Connection::Cause::TransportClosed);
    EXPECT_FALSE(channel.GetLastExchanged(test::PeerA));

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateUpdate("second", test::PeerA)));
    EXPECT_EQ(channel.GetLastExchanged(test::PeerA), "second");
    EXPECT_EQ(channel.OnLocalChange("second"), 0u);
    EXPECT_EQ(messenger.GetSentCount(), 1u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ClipboardChannelSuite, DisabledTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);

    local::ClipboardStub clipboard;
    Clipboard::Channel channel{ test::Hub, messenger, &clipboard, { .enabled = false, .relay = false } };
    EXPECT_FALSE(channel.IsEnabled());

    EXPECT_EQ(channel.OnLocalChange("text"), 0u);

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateUpdate("text", test::PeerA)));
    EXPECT_TRUE(clipboard.GetApplied().empty());
    EXPECT_FALSE(channel.GetCurrent());
    EXPECT_EQ(messenger.GetSentCount(), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ClipboardChannelSuite, MissingOriginTest)
{
    PeerMessengerStub messenger;
    messenger.Connect(test::PeerA);

    local::ClipboardStub clipboard;
    Clipboard::Channel channel{ test::Hub, messenger, &clipboard, {} };

    Route::Context const fromA{ test::PeerA, 1, messenger };
    EXPECT_TRUE(channel.Handle(fromA, test::CreateUpdate("text", "")));
    ASSERT_EQ(clipboard.GetApplied().size(), 1u);
    EXPECT_EQ(clipboard.GetApplied().front().second, test::PeerA);
}

//----------------------------------------------------------------------------------------------------------------------
