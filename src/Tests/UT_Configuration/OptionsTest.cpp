//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Options.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

boost::json::object Parse(std::string_view serialized);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, StringToMillisecondsTest)
{
    using namespace std::chrono_literals;
    EXPECT_EQ(Configuration::StringToMilliseconds("500ms"), 500ms);
    EXPECT_EQ(Configuration::StringToMilliseconds("30s"), 30s);
    EXPECT_EQ(Configuration::StringToMilliseconds("2min"), 2min);
    EXPECT_EQ(Configuration::StringToMilliseconds("1h"), 1h);
    EXPECT_EQ(Configuration::StringToMilliseconds("0ms"), 0ms);

    EXPECT_FALSE(Configuration::StringToMilliseconds(""));
    EXPECT_FALSE(Configuration::StringToMilliseconds("500"));
    EXPECT_FALSE(Configuration::StringToMilliseconds("ms"));
    EXPECT_FALSE(Configuration::StringToMilliseconds("5days"));
    EXPECT_FALSE(Configuration::StringToMilliseconds("-5s"));
    EXPECT_FALSE(Configuration::StringToMilliseconds("1.5s"));
    EXPECT_FALSE(Configuration::StringToMilliseconds("s30"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, StringFromMillisecondsTest)
{
    using namespace std::chrono_literals;
    EXPECT_EQ(Configuration::StringFromMilliseconds(0ms), "0ms");
    EXPECT_EQ(Configuration::StringFromMilliseconds(250ms), "250ms");
    EXPECT_EQ(Configuration::StringFromMilliseconds(1500ms), "1500ms");
    EXPECT_EQ(Configuration::StringFromMilliseconds(30s), "30s");
    EXPECT_EQ(Configuration::StringFromMilliseconds(90s), "90s");
    EXPECT_EQ(Configuration::StringFromMilliseconds(2min), "2min");
    EXPECT_EQ(Configuration::StringFromMilliseconds(3h), "3h");
    EXPECT_FALSE(Configuration::StringFromMilliseconds(-1ms));

    // Every serialized value must be readable by the parsing counterpart.
    for (auto const value : { 0ms, 250ms, 1500ms, 30000ms, 120000ms, 3600000ms }) {
        auto const optSerialized = Configuration::StringFromMilliseconds(value);
        ASSERT_TRUE(optSerialized);
        EXPECT_EQ(Configuration::StringToMilliseconds(*optSerialized), value);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, DefaultValuesTest)
{
    Configuration::Options::Network const network;
    EXPECT_EQ(network.GetInterface(), Configuration::Defaults::NetworkInterface);
    EXPECT_EQ(network.GetPort(), Configuration::Defaults::NetworkPort);
    EXPECT_EQ(network.GetConnection().GetTimeout(), Configuration::Defaults::ConnectionTimeout);
    EXPECT_EQ(network.GetConnection().GetHeartbeat().GetInterval(), Configuration::Defaults::HeartbeatInterval);
    EXPECT_EQ(network.GetConnection().GetRetry().GetBase(), Configuration::Defaults::RetryBase);
    EXPECT_EQ(network.GetConnection().GetRetry().GetCeiling(), Configuration::Defaults::RetryCeiling);
    EXPECT_EQ(network.AreOptionsAllowable().first, Configuration::StatusCode::Success);

    Configuration::Options::Discovery const discovery;
    EXPECT_TRUE(discovery.IsEnabled());
    EXPECT_EQ(discovery.GetServiceType(), Configuration::Defaults::DiscoveryServiceType);
    EXPECT_EQ(discovery.GetGroup(), Configuration::Defaults::DiscoveryGroup);
    EXPECT_EQ(discovery.AreOptionsAllowable().first, Configuration::StatusCode::Success);

    Configuration::Options::Sync const sync;
    EXPECT_TRUE(sync.UseClipboard());
    EXPECT_TRUE(sync.UseNotifications());
    EXPECT_FALSE(sync.UseRelay());

    Configuration::Options::Transfer const transfer;
    EXPECT_EQ(transfer.GetChunkSize(), Configuration::Defaults::TransferChunkSize);
    EXPECT_EQ(transfer.GetWindow(), Configuration::Defaults::TransferWindow);
    EXPECT_TRUE(transfer.IsResumable());
    EXPECT_EQ(transfer.AreOptionsAllowable().first, Configuration::StatusCode::Success);

    // Nothing is written for a section that only holds default values.
    boost::json::object json;
    EXPECT_EQ(network.Write(json).first, Configuration::StatusCode::Success);
    EXPECT_EQ(discovery.Write(json).first, Configuration::StatusCode::Success);
    EXPECT_EQ(sync.Write(json).first, Configuration::StatusCode::Success);
    EXPECT_EQ(transfer.Write(json).first, Configuration::StatusCode::Success);
    EXPECT_TRUE(json.empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, MergeNetworkTest)
{
    using namespace std::chrono_literals;
    auto const json = test::Parse(R"({
        "interface": "127.0.0.1",
        "port": 9000,
        "connection": {
            "timeout": "2s",
            "heartbeat": { "interval": "15s", "tolerance": 5 },
            "retry": { "base": "250ms", "ceiling": "1min", "limit": 3, "jitter": 0 }
        }
    })");

    Configuration::Options::Network network;
    ASSERT_EQ(network.Merge(json).first, Configuration::StatusCode::Success);
    EXPECT_EQ(network.GetInterface(), "127.0.0.1");
    EXPECT_EQ(network.GetPort(), 9000);

    auto const& connection = network.GetConnection();
    EXPECT_EQ(connection.GetTimeout(), 2s);
    EXPECT_EQ(connection.GetHeartbeat().GetInterval(), 15s);
    EXPECT_EQ(connection.GetHeartbeat().GetTolerance(), 5u);
    EXPECT_EQ(connection.GetRetry().GetBase(), 250ms);
    EXPECT_EQ(connection.GetRetry().GetCeiling(), 1min);
    EXPECT_EQ(connection.GetRetry().GetLimit(), 3u);
    EXPECT_EQ(connection.GetRetry().GetJitter(), 0.0);
    EXPECT_EQ(network.AreOptionsAllowable().first, Configuration::StatusCode::Success);

    // The written section must merge back into an equivalent set of options.
    boost::json::object written;
    ASSERT_EQ(network.Write(written).first, Configuration::StatusCode::Success);
    ASSERT_TRUE(written.contains(Configuration::Options::Network::Symbol));

    Configuration::Options::Network reloaded;
    ASSERT_EQ(reloaded.Merge(written.at(Configuration::Options::Network::Symbol).as_object()).first,
        Configuration::StatusCode::Success);
    EXPECT_EQ(reloaded, network);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, MismatchedTypeTest)
{
    {
        Configuration::Options::Network network;
        EXPECT_EQ(network.Merge(test::Parse(R"({ "port": "9000" })")).first, Configuration::StatusCode::DecodeError);
    }

    {
        Configuration::Options::Network network;
        EXPECT_EQ(network.Merge(test::Parse(R"({ "connection": [] })")).first, Configuration::StatusCode::DecodeError);
    }

    {
        Configuration::Options::Discovery discovery;
        EXPECT_EQ(discovery.Merge(test::Parse(R"({ "enabled": "yes" })")).first, Configuration::StatusCode::DecodeError);
    }

    {
        Configuration::Options::Transfer transfer;
        EXPECT_EQ(transfer.Merge(test::Parse(R"({ "grace_period": 60 })")).first, Configuration::StatusCode::DecodeError);
    }

    {
        Configuration::Options::Network network;
        auto const json = test::Parse(R"({ "connection": { "retry": { "jitter": "low" } } })");
        EXPECT_EQ(network.Merge(json).first, Configuration::StatusCode::DecodeError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, InvalidValueTest)
{
    {
        Configuration::Options::Network network;
        EXPECT_EQ(network.Merge(test::Parse(R"({ "port": 70000 })")).first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Network network;
        EXPECT_EQ(network.Merge(test::Parse(R"({ "port": -1 })")).first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Discovery discovery;
        auto const json = test::Parse(R"({ "service_type": "ferry-sync._tcp" })");
        EXPECT_EQ(discovery.Merge(json).first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Transfer transfer;
        EXPECT_EQ(transfer.Merge(test::Parse(R"({ "window": 0 })")).first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Transfer transfer;
        auto const json = test::Parse(R"({ "stall_timeout": "soon" })");
        EXPECT_EQ(transfer.Merge(json).first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Pairing pairing;
        EXPECT_EQ(pairing.Merge(test::Parse(R"({ "code_length": 2 })")).first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Network network;
        auto const json = test::Parse(R"({ "connection": { "retry": { "jitter": 1.5 } } })");
        EXPECT_EQ(network.Merge(json).first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Details details;
        EXPECT_EQ(details.Merge(test::Parse(R"({ "kind": "toaster" })")).first, Configuration::StatusCode::InputError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, AllowableOptionsTest)
{
    {
        Configuration::Options::Network network;
        ASSERT_EQ(network.Merge(test::Parse(R"({ "interface": "localhost" })")).first, Configuration::StatusCode::Success);
        EXPECT_EQ(network.AreOptionsAllowable().first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Network network;
        auto const json = test::Parse(R"({ "connection": { "retry": { "base": "1min", "ceiling": "30s" } } })");
        ASSERT_EQ(network.Merge(json).first, Configuration::StatusCode::Success);
        EXPECT_EQ(network.AreOptionsAllowable().first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Discovery discovery;
        ASSERT_EQ(discovery.Merge(test::Parse(R"({ "group": "192.168.1.1" })")).first, Configuration::StatusCode::Success);
        EXPECT_EQ(discovery.AreOptionsAllowable().first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Discovery discovery;
        auto const json = test::Parse(R"({ "interval": "10s", "expiration": "10s" })");
        ASSERT_EQ(discovery.Merge(json).first, Configuration::StatusCode::Success);
        EXPECT_EQ(discovery.AreOptionsAllowable().first, Configuration::StatusCode::InputError);
    }

    {
        Configuration::Options::Transfer transfer;
        ASSERT_EQ(transfer.Merge(test::Parse(R"({ "chunk_size": 4294967295 })")).first, Configuration::StatusCode::Success);
        EXPECT_EQ(transfer.AreOptionsAllowable().first, Configuration::StatusCode::InputError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, RuntimePrecedenceTest)
{
    Configuration::Options::Sync sync;
    ASSERT_TRUE(sync.SetRelay(true));
    ASSERT_TRUE(sync.SetClipboard(false));

    // Values set at runtime are not replaced by the values read from the file.
    auto const json = test::Parse(R"({ "clipboard": true, "notifications": false, "relay": false })");
    ASSERT_EQ(sync.Merge(json).first, Configuration::StatusCode::Success);
    EXPECT_FALSE(sync.UseClipboard());
    EXPECT_FALSE(sync.UseNotifications());
    EXPECT_TRUE(sync.UseRelay());

    boost::json::object written;
    ASSERT_EQ(sync.Write(written).first, Configuration::StatusCode::Success);
    auto const& group = written.at(Configuration::Options::Sync::Symbol).as_object();
    EXPECT_EQ(group.at("clipboard").as_bool(), false);
    EXPECT_EQ(group.at("notifications").as_bool(), false);
    EXPECT_EQ(group.at("relay").as_bool(), true);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, DetailsTest)
{
    Configuration::Options::Details details;
    EXPECT_FALSE(details.GetName().empty()); // The host name is used when no name has been provided.
    EXPECT_EQ(details.GetKind(), Device::Kind::Hub);

    EXPECT_FALSE(details.SetName(""));
    EXPECT_FALSE(details.SetName(std::string(Configuration::Options::Details::NameSizeLimit + 1, 'x')));
    EXPECT_TRUE(details.SetName("Living Room"));
    EXPECT_EQ(details.GetName(), "Living Room");

    ASSERT_EQ(details.Merge(test::Parse(R"({ "name": "Office" })")).first, Configuration::StatusCode::Success);
    EXPECT_EQ(details.GetName(), "Living Room");
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object test::Parse(std::string_view serialized)
{
    return boost::json::parse(serialized).as_object();
}

//----------------------------------------------------------------------------------------------------------------------
