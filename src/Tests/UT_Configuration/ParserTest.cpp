//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <fmt/format.h>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class TemporaryDirectory;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Identifier = "hub-test-0001";

void WriteFile(std::filesystem::path const& path, std::string_view content);
boost::json::object ReadObject(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::TemporaryDirectory
{
public:
    TemporaryDirectory()
        : m_path(std::filesystem::temp_directory_path() / fmt::format(
            "ferry-config-{}", std::chrono::steady_clock::now().time_since_epoch().count()))
    {
        std::filesystem::create_directories(m_path);
    }

    ~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
    }

    [[nodiscard]] std::filesystem::path const& GetPath() const { return m_path; }
    [[nodiscard]] std::filesystem::path GetConfigurationPath() const { return m_path / "config.json"; }

private:
    std::filesystem::path m_path;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, GenerateConfigurationFilepathTest)
{
    auto const filepath = Configuration::GetDefaultConfigurationFilepath();
    EXPECT_TRUE(filepath.has_parent_path());
    EXPECT_NE(filepath.string().find(Configuration::DefaultFerryFolder), std::string::npos);
    EXPECT_EQ(filepath.filename(), Configuration::DefaultConfigurationFilename);

    auto const devices = Configuration::GetDefaultDevicesFilepath();
    EXPECT_EQ(devices.parent_path(), filepath.parent_path());
    EXPECT_EQ(devices.filename(), Configuration::DefaultDevicesFilename);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, FolderFilepathTest)
{
    local::TemporaryDirectory directory;
    Configuration::Parser parser(directory.GetPath() / "nested");
    EXPECT_FALSE(parser.FilesystemDisabled());
    EXPECT_EQ(parser.GetFilepath(), directory.GetPath() / "nested" / Configuration::DefaultConfigurationFilename);
    EXPECT_TRUE(std::filesystem::exists(directory.GetPath() / "nested"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, FileGenerationTest)
{
    local::TemporaryDirectory directory;
    auto const filepath = directory.GetConfigurationPath();

    std::string identifier;
    {
        Configuration::Parser parser(filepath);
        EXPECT_FALSE(parser.Validated());
        EXPECT_FALSE(parser.Changed());

        auto const [status, message] = parser.FetchOptions();
        ASSERT_EQ(status, Configuration::StatusCode::Success) << message;
        EXPECT_TRUE(parser.Validated());
        EXPECT_FALSE(parser.Changed());
        EXPECT_TRUE(std::filesystem::exists(filepath));

        identifier = parser.GetIdentifier();
        EXPECT_EQ(identifier.size(), 32u);
        EXPECT_TRUE(Device::IsValidIdentifier(identifier));

        auto const details = parser.GetDeviceDetails();
        EXPECT_EQ(details.identifier, identifier);
        EXPECT_EQ(details.kind, Device::Kind::Hub);
        EXPECT_FALSE(details.name.empty());

        EXPECT_EQ(parser.GetNetworkOptions().GetPort(), Configuration::Defaults::NetworkPort);
        EXPECT_EQ(parser.GetDiscoveryOptions().GetGroup(), Configuration::Defaults::DiscoveryGroup);
        EXPECT_EQ(parser.GetPairingOptions().GetCodeLength(), Configuration::Defaults::PairingCodeLength);
        EXPECT_EQ(parser.GetTransferOptions().GetChunkSize(), Configuration::Defaults::TransferChunkSize);
    }

    // The generated file only contains the version and the identifier.
    auto const json = test::ReadObject(filepath);
    EXPECT_EQ(json.size(), 2u);
    EXPECT_EQ(json.at("version").as_string(), Ferry::Version);
    EXPECT_EQ(json.at("identifier").as_string(), identifier);

    // A later start must reuse the stored identifier.
    Configuration::Parser parser(filepath);
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(parser.GetIdentifier(), identifier);
    EXPECT_FALSE(parser.Changed());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, ParseGoodFileTest)
{
    using namespace std::chrono_literals;
    local::TemporaryDirectory directory;
    auto const filepath = directory.GetConfigurationPath();
    test::WriteFile(filepath, fmt::format(R"({{
        // Comments and trailing commas are accepted.
        "version": "{}",
        "identifier": "{}",
        "details": {{ "name": "Living Room", "kind": "hub" }},
        "network": {{
            "interface": "127.0.0.1",
            "port": 9000,
            "connection": {{ "heartbeat": {{ "interval": "20s" }}, }},
        }},
        "discovery": {{ "enabled": false, "interval": "2s", "expiration": "10s" }},
        "pairing": {{ "ttl": "1min", "code_length": 8 }},
        "sync": {{ "notifications": false, "relay": true }},
        "transfer": {{ "directory": "/tmp/ferry-downloads", "chunk_size": 32768, "window": 4, "rate_limit": 1048576 }},
    }})", Ferry::Version, test::Identifier));

    Configuration::Parser parser(filepath);
    auto const [status, message] = parser.FetchOptions();
    ASSERT_EQ(status, Configuration::StatusCode::Success) << message;
    EXPECT_TRUE(parser.Validated());
    EXPECT_FALSE(parser.Changed());

    EXPECT_EQ(parser.GetIdentifier(), test::Identifier);
    EXPECT_EQ(parser.GetDetailsOptions().GetName(), "Living Room");
    EXPECT_EQ(parser.GetNetworkOptions().GetInterface(), "127.0.0.1");
    EXPECT_EQ(parser.GetNetworkOptions().GetPort(), 9000);
    EXPECT_EQ(parser.GetNetworkOptions().GetConnection().GetHeartbeat().GetInterval(), 20s);
    EXPECT_FALSE(parser.GetDiscoveryOptions().IsEnabled());
    EXPECT_EQ(parser.GetDiscoveryOptions().GetInterval(), 2s);
    EXPECT_EQ(parser.GetPairingOptions().GetLifetime(), 1min);
    EXPECT_EQ(parser.GetPairingOptions().GetCodeLength(), 8u);
    EXPECT_TRUE(parser.GetSyncOptions().UseClipboard());
    EXPECT_FALSE(parser.GetSyncOptions().UseNotifications());
    EXPECT_TRUE(parser.GetSyncOptions().UseRelay());
    EXPECT_EQ(parser.GetTransferOptions().GetDirectory(), std::filesystem::path{ "/tmp/ferry-downloads" });
    EXPECT_EQ(parser.GetTransferOptions().GetChunkSize(), 32768u);
    EXPECT_EQ(parser.GetTransferOptions().GetWindow(), 4u);
    EXPECT_EQ(parser.GetTransferOptions().GetRateLimit(), 1048576u);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, ParseMalformedFileTest)
{
    local::TemporaryDirectory directory;
    auto const filepath = directory.GetConfigurationPath();

    {
        test::WriteFile(filepath, R"({ "version": "0.3.0", "network": { "port": 9000 )");
        Configuration::Parser parser(filepath);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
        EXPECT_FALSE(parser.Validated());
        EXPECT_FALSE(parser.Changed());
    }

    {
        test::WriteFile(filepath, R"([ "version" ])");
        Configuration::Parser parser(filepath);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        test::WriteFile(filepath, "");
        Configuration::Parser parser(filepath);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        test::WriteFile(filepath, R"({ "network": { "port": 9000 } })");
        Configuration::Parser parser(filepath);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        test::WriteFile(filepath, R"({ "version": "0.3.0", "identifier": "not a valid identifier!" })");
        Configuration::Parser parser(filepath);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError);
    }

    {
        test::WriteFile(filepath, R"({ "version": "0.3.0", "sync": true })");
        Configuration::Parser parser(filepath);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::DecodeError);
    }

    {
        test::WriteFile(filepath, std::string(Configuration::Defaults::FileSizeLimit + 1, ' '));
        Configuration::Parser parser(filepath);
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::FileError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, DisallowedOptionsTest)
{
    local::TemporaryDirectory directory;
    auto const filepath = directory.GetConfigurationPath();
    test::WriteFile(filepath, fmt::format(
        R"({{ "version": "{}", "identifier": "{}", "discovery": {{ "group": "10.0.0.1" }} }})",
        Ferry::Version, test::Identifier));

    Configuration::Parser parser(filepath);
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError);
    EXPECT_FALSE(parser.Validated());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, VersionUpgradeTest)
{
    local::TemporaryDirectory directory;
    auto const filepath = directory.GetConfigurationPath();
    test::WriteFile(filepath, fmt::format(
        R"({{ "version": "0.0.1", "identifier": "{}", "network": {{ "port": 9000 }} }})", test::Identifier));

    {
        Configuration::Parser parser(filepath);
        ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
        EXPECT_FALSE(parser.Changed());
        EXPECT_EQ(parser.GetNetworkOptions().GetPort(), 9000);
    }

    auto const json = test::ReadObject(filepath);
    EXPECT_EQ(json.at("version").as_string(), Ferry::Version);
    EXPECT_EQ(json.at("identifier").as_string(), test::Identifier);
    EXPECT_EQ(json.at("network").as_object().at("port").as_int64(), 9000);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, RuntimeOverrideTest)
{
    local::TemporaryDirectory directory;
    auto const filepath = directory.GetConfigurationPath();
    test::WriteFile(filepath, fmt::format(
        R"({{ "version": "{}", "identifier": "{}", "network": {{ "port": 9000 }}, "sync": {{ "relay": false }} }})",
        Ferry::Version, test::Identifier));

    {
        Configuration::Parser parser(filepath);
        EXPECT_TRUE(parser.SetNetworkPort(9100));
        EXPECT_TRUE(parser.SetRelay(true));
        EXPECT_TRUE(parser.SetDiscoveryEnabled(false));
        EXPECT_FALSE(parser.SetDeviceName(""));

        ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
        EXPECT_EQ(parser.GetNetworkOptions().GetPort(), 9100);
        EXPECT_TRUE(parser.GetSyncOptions().UseRelay());
        EXPECT_FALSE(parser.GetDiscoveryOptions().IsEnabled());
        EXPECT_FALSE(parser.Changed());
    }

    // Overrides only apply to the current run, an existing file is left as it was written.
    auto const json = test::ReadObject(filepath);
    EXPECT_EQ(json.at("network").as_object().at("port").as_int64(), 9000);
    EXPECT_FALSE(json.at("sync").as_object().at("relay").as_bool());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationParserSuite, DisabledFilesystemTest)
{
    Configuration::Parser parser;
    EXPECT_TRUE(parser.FilesystemDisabled());
    EXPECT_TRUE(parser.GetFilepath().empty());
    EXPECT_TRUE(parser.SetNetworkPort(9200));

    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());
    EXPECT_FALSE(parser.Changed());
    EXPECT_TRUE(Device::IsValidIdentifier(parser.GetIdentifier()));
    EXPECT_EQ(parser.GetNetworkOptions().GetPort(), 9200);
}

//----------------------------------------------------------------------------------------------------------------------

void test::WriteFile(std::filesystem::path const& path, std::string_view content)
{
    std::ofstream writer(path, std::ios::binary | std::ios::trunc);
    writer << content;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object test::ReadObject(std::filesystem::path const& path)
{
    std::ifstream reader(path, std::ios::binary);
    std::string const content{ std::istreambuf_iterator<char>(reader), std::istreambuf_iterator<char>() };

    boost::json::parse_options options;
    options.allow_comments = true;
    options.allow_trailing_commas = true;
    return boost::json::parse(content, boost::json::storage_ptr{}, options).as_object();
}

//----------------------------------------------------------------------------------------------------------------------
