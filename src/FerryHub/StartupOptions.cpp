//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Pairing/Code.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::uint32_t GetTerminalWidth();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
    , m_devicesFilepath()
    , m_optInterface()
    , m_optPort()
    , m_disableClipboard(false)
    , m_disableNotifications(false)
    , m_disableDiscovery(false)
    , m_enableRelay(false)
    , m_issueCode(false)
    , m_optHubTarget()
    , m_optPairingCode()
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    std::uint32_t const width = local::GetTerminalWidth();
    boost::program_options::options_description general("General Options", width);
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    // Option to set the log verbosity level.
    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };

        std::ostringstream oss;
        oss << "Sets the maximum log level for console output. ";
        oss << "Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddGeneralOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    AddGeneralOption(
        Debug.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Shorthand for a debug verbosity level.");

    AddGeneralOption(
        Quiet.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Disables all logging output to the console.");

    m_descriptions.add(general);

    boost::program_options::options_description configuration("Configuration Options", width);
    auto AddConfigurationOption = configuration.add_options();

    // Option to set the configuration filepath.
    {
        auto const filepath = Configuration::GetDefaultConfigurationFilepath();
        std::ostringstream oss;
        oss << "Set the configuration filepath. This may specify a complete filepath or ";
        oss << "directory. If a directory is specified \"config.json\" is assumed.";
        AddConfigurationOption(
            ConfigurationFilepath.data(),
            boost::program_options::value(&m_configurationFilepath)->value_name("<filepath>")->default_value(
                filepath.string()), oss.str().c_str());
    }

    // Option to set the paired devices filepath.
    {
        auto const filepath = Configuration::GetDefaultDevicesFilepath();
        std::ostringstream oss;
        oss << "Set the paired devices filepath. This may specify a complete filepath or ";
        oss << "directory. If a directory is specified \"devices.json\" is assumed.";
        AddConfigurationOption(
            DevicesFilepath.data(),
            boost::program_options::value(&m_devicesFilepath)->value_name("<filepath>")->default_value(
                filepath.string()), oss.str().c_str());
    }

    AddConfigurationOption(
        Interface.data(),
        boost::program_options::value<std::string>()->value_name("<address>"),
        "Override the address the hub listens on.");

    AddConfigurationOption(
        Port.data(),
        boost::program_options::value<std::uint32_t>()->value_name("<port>"),
        "Override the port the hub listens on. A port of 0 lets the system choose.");

    AddConfigurationOption(
        NoClipboard.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Disables clipboard synchronization.");

    AddConfigurationOption(
        NoNotifications.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Disables notification mirroring.");

    AddConfigurationOption(
        NoDiscovery.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Disables advertising and watching for services on the local network.");

    AddConfigurationOption(
        Relay.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Forwards the clipboard and notifications of one peer to the other peers.");

    m_descriptions.add(configuration);

    boost::program_options::options_description pairing("Pairing Options", width);
    auto AddPairingOption = pairing.add_options();

    AddPairingOption(
        IssueCode.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Issues a pairing code on startup.");

    {
        std::ostringstream oss;
        oss << "Connect to a hub at the provided \"host:port\". When \"" << AutomaticHub << "\" is provided ";
        oss << "the first hub discovered on the local network is used.";
        AddPairingOption(
            HubTarget.data(),
            boost::program_options::value<std::string>()->value_name("<host:port>"),
            oss.str().c_str());
    }

    AddPairingOption(
        PairingCode.data(),
        boost::program_options::value<std::string>()->value_name("<code>"),
        "Pair with the hub using a code it has issued. Requires the hub option.");

    m_descriptions.add(pairing);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char** argv)
{
    constexpr auto IsOptionSupplied = [] (
        boost::program_options::variables_map const& options, std::string_view option) -> bool
    {
        return options.count(option.data()) && !options[option.data()].defaulted();
    };

    constexpr auto IsSwitchEnabled = [] (
        boost::program_options::variables_map const& options, std::string_view option) -> bool
    {
        return options.count(option.data()) && options[option.data()].as<bool>();
    };

    auto const CheckConflictingOptions = [&] (std::string_view left, std::string_view right) -> std::optional<std::string>
    {
        auto const IsProvided = [&] (std::string_view option) {
            auto const& value = m_options[option.data()];
            if (value.empty() || value.defaulted()) { return false; }
            if (auto const pSwitch = boost::any_cast<bool>(&value.value()); pSwitch) { return *pSwitch; }
            return true;
        };

        if (IsProvided(left) && IsProvided(right)) {
            std::ostringstream oss;
            oss << "Conflicting options '" << left << "' and '" << right << "'.";
            return oss.str();
        }
        return {};
    };

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv).options(m_descriptions).run(), m_options);
        boost::program_options::notify(m_options);
    } catch (boost::program_options::error const& exception) {
        std::cout << "An error occured parsing startup options due to: ";
        std::cout << exception.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    using ConflictingOptions = std::array<std::pair<std::string_view, std::string_view>, 3>;
    constexpr ConflictingOptions conflicts = {{ { Verbosity, Quiet }, { Debug, Quiet }, { Verbosity, Debug } }};
    for (auto const& [left, right] : conflicts) {
        if (auto const optError = CheckConflictingOptions(left, right); optError) {
            std::cout << *optError << std::endl;
            return ParseCode::Malformed;
        }
    }

    if (IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return boost::algorithm::iequals(argument, item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (IsSwitchEnabled(m_options, Debug)) { m_verbosity = spdlog::level::debug; }
    if (IsSwitchEnabled(m_options, Quiet)) { m_verbosity = spdlog::level::off; }

    if (m_configurationFilepath.empty()) {
        std::cout << "The configuration filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    if (m_devicesFilepath.empty()) {
        std::cout << "The devices filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Interface)) { m_optInterface = m_options[Interface.data()].as<std::string>(); }

    if (IsOptionSupplied(m_options, Port)) {
        auto const port = m_options[Port.data()].as<std::uint32_t>();
        if (port > std::numeric_limits<std::uint16_t>::max()) {
            std::cout << "The port must be between 0 and 65535." << std::endl;
            return ParseCode::Malformed;
        }
        m_optPort = static_cast<std::uint16_t>(port);
    }

    m_disableClipboard = IsSwitchEnabled(m_options, NoClipboard);
    m_disableNotifications = IsSwitchEnabled(m_options, NoNotifications);
    m_disableDiscovery = IsSwitchEnabled(m_options, NoDiscovery);
    m_enableRelay = IsSwitchEnabled(m_options, Relay);
    m_issueCode = IsSwitchEnabled(m_options, IssueCode);

    if (IsOptionSupplied(m_options, HubTarget)) {
        auto const& target = m_options[HubTarget.data()].as<std::string>();
        if (target != AutomaticHub && !Network::RemoteAddress::FromUri(target)) {
            std::cout << "The hub must be provided as \"host:port\" or \"" << AutomaticHub << "\"." << std::endl;
            return ParseCode::Malformed;
        }
        m_optHubTarget = target;
    }

    if (IsOptionSupplied(m_options, PairingCode)) {
        if (!m_optHubTarget) {
            std::cout << "A pairing code may only be provided with the hub option." << std::endl;
            return ParseCode::Malformed;
        }

        // Codes are displayed in upper case, but may be entered in any case.
        auto code = boost::algorithm::to_upper_copy(m_options[PairingCode.data()].as<std::string>());
        if (code.size() < Pairing::MinimumCodeLength || code.size() > Pairing::MaximumCodeLength) {
            std::cout << "The pairing code must be between " << Pairing::MinimumCodeLength << " and ";
            std::cout << Pairing::MaximumCodeLength << " characters." << std::endl;
            return ParseCode::Malformed;
        }
        m_optPairingCode = std::move(code);
    }

    if (m_issueCode && m_optHubTarget) {
        std::cout << "Conflicting options '" << IssueCode << "' and '" << HubTarget << "'." << std::endl;
        return ParseCode::Malformed;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " [options] \n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << name << " (Ferry Hub) " << Ferry::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::ApplyOverrides(Configuration::Parser& parser) const
{
    if (m_optInterface && !parser.SetNetworkInterface(*m_optInterface)) {
        std::cout << "The interface must be a valid address." << std::endl;
        return false;
    }

    if (m_optPort && !parser.SetNetworkPort(*m_optPort)) { return false; }
    if (m_disableClipboard && !parser.SetClipboardSync(false)) { return false; }
    if (m_disableNotifications && !parser.SetNotificationMirroring(false)) { return false; }
    if (m_disableDiscovery && !parser.SetDiscoveryEnabled(false)) { return false; }
    if (m_enableRelay && !parser.SetRelay(true)) { return false; }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosityLevel() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetConfigPath() const { return m_configurationFilepath; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetDevicesPath() const { return m_devicesFilepath; }

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::ShouldIssueCode() const { return m_issueCode; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Startup::Options::GetHubTarget() const { return m_optHubTarget; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Startup::Options::GetPairingCode() const { return m_optPairingCode; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    constexpr std::uint32_t DefaultWidth = boost::program_options::options_description::m_default_line_length;
    struct winsize size = {};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col < DefaultWidth) { return DefaultWidth; }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------
