//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description: The command line options of the hub executable. Values supplied on the command line take precedence
// over the values read from the configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Configuration { class Parser; }

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

// The value of the hub option that requests a hub be found through discovery.
constexpr std::string_view AutomaticHub = "auto";

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Debug = "debug";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view DevicesFilepath = "devices";
    static constexpr std::string_view Interface = "interface";
    static constexpr std::string_view Port = "port";
    static constexpr std::string_view NoClipboard = "no-clipboard";
    static constexpr std::string_view NoNotifications = "no-notifications";
    static constexpr std::string_view NoDiscovery = "no-discovery";
    static constexpr std::string_view Relay = "relay";
    static constexpr std::string_view IssueCode = "issue-code";
    static constexpr std::string_view HubTarget = "hub";
    static constexpr std::string_view PairingCode = "pair";

    Options();

    void SetupDescriptions();
    [[nodiscard]] ParseCode Parse(std::int32_t argc, char** argv);

    [[nodiscard]] std::string GenerateHelpText(std::int32_t argc, char** argv) const;
    [[nodiscard]] std::string GenerateVersionText(std::int32_t argc, char** argv) const;

    // Applies the overrides supplied on the command line. Returns false if an override is not an allowable value.
    [[nodiscard]] bool ApplyOverrides(Configuration::Parser& parser) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosityLevel() const;
    [[nodiscard]] std::string const& GetConfigPath() const;
    [[nodiscard]] std::string const& GetDevicesPath() const;
    [[nodiscard]] bool ShouldIssueCode() const;
    [[nodiscard]] std::optional<std::string> const& GetHubTarget() const;
    [[nodiscard]] std::optional<std::string> const& GetPairingCode() const;

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    std::string m_configurationFilepath;
    std::string m_devicesFilepath;
    std::optional<std::string> m_optInterface;
    std::optional<std::uint16_t> m_optPort;
    bool m_disableClipboard;
    bool m_disableNotifications;
    bool m_disableDiscovery;
    bool m_enableRelay;
    bool m_issueCode;
    std::optional<std::string> m_optHubTarget;
    std::optional<std::string> m_optPairingCode;
};

//----------------------------------------------------------------------------------------------------------------------
