//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Options.hpp"
#include "Components/Configuration/Parser.hpp"
#include "FerryHub/StartupOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class Arguments;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Parse(Startup::Options& options, std::initializer_list<std::string> arguments);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Owns a mutable argv for the command line parser.
//----------------------------------------------------------------------------------------------------------------------
class local::Arguments
{
public:
    explicit Arguments(std::initializer_list<std::string> arguments)
        : m_values({ "ferry-hub" })
        , m_pointers()
    {
        m_values.insert(m_values.end(), arguments.begin(), arguments.end());
        for (auto& value : m_values) { m_pointers.emplace_back(value.data()); }
        m_pointers.emplace_back(nullptr);
    }

    [[nodiscard]] std::int32_t GetCount() const { return static_cast<std::int32_t>(m_values.size()); }
    [[nodiscard]] char** GetValues() { return m_pointers.data(); }

private:
    std::vector<std::string> m_values;
    std::vector<char*> m_pointers;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(StartupOptionsSuite, DefaultOptionsTest)
{
    Startup::Options options;
    ASSERT_EQ(test::Parse(options, {}), Startup::ParseCode::Success);
    EXPECT_EQ(options.GetVerbosityLevel(), spdlog::level::info);
    EXPECT_EQ(options.GetConfigPath(), Configuration::GetDefaultConfigurationFilepath().string());
    EXPECT_EQ(options.GetDevicesPath(), Configuration::GetDefaultDevicesFilepath().string());
    EXPECT_FALSE(options.ShouldIssueCode());
    EXPECT_FALSE(options.GetHubTarget());
    EXPECT_FALSE(options.GetPairingCode());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(StartupOptionsSuite, ExitRequestedTest)
{
    {
        Startup::Options options;
        EXPECT_EQ(test::Parse(options, { "--help" }), Startup::ParseCode::ExitRequested);
    }

    {
        Startup::Options options;
        EXPECT_EQ(test::Parse(options, { "--version" }), Startup::ParseCode::ExitRequested);
    }

    local::Arguments arguments{};
    Startup::Options const options;
    EXPECT_NE(options.GenerateHelpText(arguments.GetCount(), arguments.GetValues()).find("Usage: ferry-hub"),
        std::string::npos);
    EXPECT_NE(options.GenerateVersionText(arguments.GetCount(), arguments.GetValues()).find("ferry-hub (Ferry Hub)"),
        std::string::npos);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(StartupOptionsSuite, VerbosityTest)
{
    {
        Startup::Options options;
        ASSERT_EQ(test::Parse(options, { "--verbosity", "WARNING" }), Startup::ParseCode::Success);
        EXPECT_EQ(options.GetVerbosityLevel(), spdlog::level::warn);
    }

    {
        Startup::Options options;
        ASSERT_EQ(test::Parse(options, { "--debug" }), Startup::ParseCode::Success);
        EXPECT_EQ(options.GetVerbosityLevel(), spdlog::level::debug);
    }

    {
        Startup::Options options;
        ASSERT_EQ(test::Parse(options, { "--quiet" }), Startup::ParseCode::Success);
        EXPECT_EQ(options.GetVerbosityLevel(), spdlog::level::off);
    }

    {
        Startup::Options options;
        EXPECT_EQ(test::Parse(options, { "--verbosity", "loud" }), Startup::ParseCode::Malformed);
    }

    {
        Startup::Options options;
        EXPECT_EQ(test::Parse(options, { "--debug", "--quiet" }), Startup::ParseCode::Malformed);
    }

    {
        Startup::Options options;
        EXPECT_EQ(test::Parse(options, { "--verbosity", "trace", "--debug" }), Startup::ParseCode::Malformed);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(StartupOptionsSuite, MalformedOptionsTest)
{
    auto const IsMalformed = [] (std::initializer_list<std::string> arguments) {
        Startup::Options options;
        return test::Parse(options, arguments) == Startup::ParseCode::Malformed;
    };

    EXPECT_TRUE(IsMalformed({ "--unknown" }));
    EXPECT_TRUE(IsMalformed({ "--port" }));
    EXPECT_TRUE(IsMalformed({ "--port", "http" }));
    EXPECT_TRUE(IsMalformed({ "--port", "70000" }));
    EXPECT_TRUE(IsMalformed({ "--config", "" }));
    EXPECT_TRUE(IsMalformed({ "--hub", "192.168.1.20" }));
    EXPECT_TRUE(IsMalformed({ "--pair", "7KQ2MX" }));
    EXPECT_TRUE(IsMalformed({ "--hub", "auto", "--pair", "7KQ" }));
    EXPECT_TRUE(IsMalformed({ "--hub", "auto", "--issue-code" }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(StartupOptionsSuite, PeerOptionsTest)
{
    {
        Startup::Options options;
        ASSERT_EQ(test::Parse(options, { "--hub", "auto" }), Startup::ParseCode::Success);
        EXPECT_EQ(options.GetHubTarget(), std::string{ Startup::AutomaticHub });
        EXPECT_FALSE(options.GetPairingCode());
    }

    {
        Startup::Options options;
        ASSERT_EQ(test::Parse(options, { "--hub", "192.168.1.20:8765", "--pair", "7kq2mx" }),
            Startup::ParseCode::Success);
        EXPECT_EQ(options.GetHubTarget(), "192.168.1.20:8765");
        EXPECT_EQ(options.GetPairingCode(), "7KQ2MX");
    }

    {
        Startup::Options options;
        ASSERT_EQ(test::Parse(options, { "--issue-code" }), Startup::ParseCode::Success);
        EXPECT_TRUE(options.ShouldIssueCode());
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(StartupOptionsSuite, ApplyOverridesTest)
{
    Startup::Options options;
    ASSERT_EQ(test::Parse(options, {
        "--interface", "127.0.0.1", "--port", "9100", "--no-clipboard", "--no-discovery", "--relay" }),
        Startup::ParseCode::Success);

    Configuration::Parser parser;
    ASSERT_TRUE(options.ApplyOverrides(parser));
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);

    EXPECT_EQ(parser.GetNetworkOptions().GetInterface(), "127.0.0.1");
    EXPECT_EQ(parser.GetNetworkOptions().GetPort(), 9100);
    EXPECT_FALSE(parser.GetSyncOptions().UseClipboard());
    EXPECT_TRUE(parser.GetSyncOptions().UseNotifications());
    EXPECT_TRUE(parser.GetSyncOptions().UseRelay());
    EXPECT_FALSE(parser.GetDiscoveryOptions().IsEnabled());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(StartupOptionsSuite, RejectedOverrideTest)
{
    Startup::Options options;
    ASSERT_EQ(test::Parse(options, { "--interface", "" }), Startup::ParseCode::Success);

    Configuration::Parser parser;
    EXPECT_FALSE(options.ApplyOverrides(parser));
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode test::Parse(Startup::Options& options, std::initializer_list<std::string> arguments)
{
    local::Arguments argv{ arguments };
    return options.Parse(argv.GetCount(), argv.GetValues());
}

//----------------------------------------------------------------------------------------------------------------------
