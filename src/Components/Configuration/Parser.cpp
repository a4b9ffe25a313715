//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <fstream>
#include <sstream>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

template<typename SectionType>
[[nodiscard]] Configuration::DeserializationResult MergeSection(SectionType& section, boost::json::object const& json);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema.
// Note: Only the version field is required, every omitted value resolves to its default.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "identifier": Optional String,
// "details": { "name": Optional String, "kind": Optional String },
// "network": {
//     "interface": Optional String,
//     "port": Optional Integer,
//     "connection": {
//         "timeout": Optional String,
//         "heartbeat": { "interval": Optional String, "tolerance": Optional Integer },
//         "retry": {
//             "base": Optional String, "ceiling": Optional String, "limit": Optional Integer, "jitter": Optional Number
//         }
//     }
// },
// "discovery": {
//     "enabled": Optional Boolean, "service_type": Optional String, "group": Optional String,
//     "port": Optional Integer, "interval": Optional String, "expiration": Optional String
// },
// "pairing": { "ttl": Optional String, "code_length": Optional Integer },
// "sync": { "clipboard": Optional Boolean, "notifications": Optional Boolean, "relay": Optional Boolean },
// "transfer": {
//     "directory": Optional String, "chunk_size": Optional Integer, "window": Optional Integer,
//     "resumable": Optional Boolean, "rate_limit": Optional Integer, "grace_period": Optional String,
//     "stall_timeout": Optional String, "resume_timeout": Optional String, "progress_interval": Optional Integer
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser()
    : m_logger(Logger::Get(Logger::Name::Core))
    , m_version(std::string{ Ferry::Version }, [] (auto const& value) { return !value.empty(); })
    , m_optIdentifier([] (auto const& value) { return Device::IsValidIdentifier(value); })
    , m_filepath()
    , m_details()
    , m_network()
    , m_discovery()
    , m_pairing()
    , m_sync()
    , m_transfer()
    , m_validated(false)
    , m_changed(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : Parser()
{
    m_filepath = filepath;
    if (m_filepath.extension().empty()) { m_filepath /= DefaultConfigurationFilename; } // A folder was provided.

    if (!FileUtils::CreateParentFolderIfNoneExist(m_filepath)) {
        m_logger->error("Failed to create the configuration folder for {}!", m_filepath.string());
        DisableFilesystem(); // If we failed to create the filepath, we are unable to use the filesystem.
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::~Parser()
{
    if (!m_filepath.empty() && m_changed) {
        if (auto const status = Serialize(); status.first != StatusCode::Success) {
            m_logger->error("Failed to update configuration file at: {}! Reason: {}", m_filepath.string(), status.second);
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }

    InitializeIdentifier(); // The identifier may only be generated once the file has been read.

    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    // Update the configuration file when a new file or a new identifier has been created.
    if (!m_changed) { return { StatusCode::Success, "" }; }

    auto status = Serialize();
    if (status.first != StatusCode::Success) {
        m_logger->error("Failed to update configuration file at: {}! Reason: {}", m_filepath.string(), status.second);
    }

    return status;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (m_changed) {
        if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
    }

    // If the filesystem is disabled, there is nothing to do.
    if (m_filepath.empty()) {
        m_changed = false;
        return { StatusCode::Success, "" };
    }

    boost::json::object json;

    json[m_version.GetFieldName()] = m_version.GetValue();
    if (m_optIdentifier.HasValue()) { json[m_optIdentifier.GetFieldName()] = m_optIdentifier.GetValue(); }

    if (auto const status = m_details.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_network.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_discovery.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_pairing.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_sync.Write(json); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_transfer.Write(json); status.first != StatusCode::Success) { return status; }

    std::ofstream os(m_filepath, std::ofstream::out | std::ofstream::trunc);
    if (os.fail()) { return { StatusCode::FileError, "Failed to open file." }; }

    JSON::WritePretty(boost::json::value(std::move(json)), os);

    os.close();
    if (os.fail()) { return { StatusCode::FileError, "Failed to write file." }; }

    m_changed = false; // On success, reset the changed flag to indicate all changes have been processed.

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::DisableFilesystem()
{
    m_filepath.clear(); // This is not considered a change as it does not have serializable side effects.
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::FilesystemDisabled() const { return m_filepath.empty(); }

//----------------------------------------------------------------------------------------------------------------------

Device::Identifier const& Configuration::Parser::GetIdentifier() const
{
    assert(m_optIdentifier.HasValue()); // The identifier is available after the options have been fetched.
    return m_optIdentifier.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

Device::Details Configuration::Parser::GetDeviceDetails() const
{
    return Device::Details{
        .identifier = GetIdentifier(),
        .name = m_details.GetName(),
        .kind = m_details.GetKind(),
        .trust = Device::TrustState::Trusted,
    };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Details const& Configuration::Parser::GetDetailsOptions() const { return m_details; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Network const& Configuration::Parser::GetNetworkOptions() const { return m_network; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Discovery const& Configuration::Parser::GetDiscoveryOptions() const { return m_discovery; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Pairing const& Configuration::Parser::GetPairingOptions() const { return m_pairing; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Sync const& Configuration::Parser::GetSyncOptions() const { return m_sync; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Transfer const& Configuration::Parser::GetTransferOptions() const { return m_transfer; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated && !m_changed; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Changed() const { return m_changed; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetDeviceName(std::string_view name) { return m_details.SetName(name); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetNetworkInterface(std::string_view interface) { return m_network.SetInterface(interface); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetNetworkPort(std::uint16_t port) { return m_network.SetPort(port); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetDiscoveryEnabled(bool enabled) { return m_discovery.SetEnabled(enabled); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetClipboardSync(bool enabled) { return m_sync.SetClipboard(enabled); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetNotificationMirroring(bool enabled) { return m_sync.SetNotifications(enabled); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetRelay(bool enabled) { return m_sync.SetRelay(enabled); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; } // If filesystem usage is disabled, there is nothing to do.
    if (m_validated && !m_changed) { return { StatusCode::Success, "" }; } // If there are no changes, there is nothing to do.

    if (std::filesystem::exists(m_filepath)) {
        m_logger->debug("Reading configuration file at: {}.", m_filepath.string());
        return Deserialize();
    }

    // A missing file is not an error, a file containing the defaults will be written once the options are validated.
    m_logger->info("Generating a configuration file at: {}.", m_filepath.string());
    m_changed = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    // If the filepath is empty, filesystem usage has been disabled.
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    std::error_code fileError;
    if (auto const size = std::filesystem::file_size(m_filepath, fileError); fileError || size > Defaults::FileSizeLimit) {
        return { StatusCode::FileError, "The configuration file exceeds the maximum allowable size." };
    }

    std::stringstream buffer;
    {
        std::ifstream reader{ m_filepath };
        if (reader.fail()) [[unlikely]] {
            return { StatusCode::FileError, "Failed to open configuration file for reading." };
        }
        buffer << reader.rdbuf(); // Read the file into the buffer stream.
    }

    auto const serialized = buffer.str();
    if (serialized.empty()) { return { StatusCode::DecodeError, "The configuration file is empty." }; }

    boost::json::parse_options options;
    options.allow_comments = true;
    options.allow_trailing_commas = true;

    boost::json::error_code error;
    auto const parsed = boost::json::parse(serialized, error, boost::json::storage_ptr{}, options);
    if (error || !parsed.is_object()) {
        return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
    }

    auto const& json = parsed.get_object();

    // Required field parsing.
    if (auto const itr = json.find(m_version.GetFieldName()); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", m_version.GetFieldName()) };
        }
        auto const& version = itr->value().get_string();
        if (!m_version.SetValueFromConfig(std::string{ version.data(), version.size() })) {
            return { StatusCode::InputError, CreateInvalidValueMessage(m_version.GetFieldName()) };
        }
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(m_version.GetFieldName()) };
    }

    if (auto const itr = json.find(m_optIdentifier.GetFieldName()); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", m_optIdentifier.GetFieldName()) };
        }
        auto const& identifier = itr->value().get_string();
        if (!m_optIdentifier.SetValueFromConfig(std::string{ identifier.data(), identifier.size() })) {
            return { StatusCode::InputError, CreateInvalidValueMessage(m_optIdentifier.GetFieldName()) };
        }
    }

    if (auto const status = local::MergeSection(m_details, json); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeSection(m_network, json); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeSection(m_discovery, json); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeSection(m_pairing, json); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeSection(m_sync, json); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeSection(m_transfer, json); status.first != StatusCode::Success) { return status; }

    // Files written by an older release are rewritten under the current version.
    if (m_version.GetValue() != Ferry::Version) {
        m_logger->info("Upgrading configuration file from version {} to {}.", m_version.GetValue(), Ferry::Version);
        [[maybe_unused]] bool const updated = m_version.SetValueFromConfig(std::string{ Ferry::Version });
        m_changed = true;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (!m_optIdentifier.HasValue()) {
        return { StatusCode::InputError, CreateMissingFieldMessage(m_optIdentifier.GetFieldName()) };
    }

    if (auto const status = m_network.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_discovery.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_transfer.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::InitializeIdentifier()
{
    if (m_optIdentifier.HasValue()) { return; }
    [[maybe_unused]] bool const initialized = m_optIdentifier.SetValueFromConfig(Device::GenerateIdentifier());
    assert(initialized);
    m_logger->info("Generated a new device identifier: {}.", m_optIdentifier.GetValue());
    m_changed = true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename SectionType>
Configuration::DeserializationResult local::MergeSection(SectionType& section, boost::json::object const& json)
{
    using namespace Configuration;

    auto const itr = json.find(SectionType::GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_object()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", SectionType::GetFieldName()) };
    }

    return section.Merge(itr->value().get_object());
}

//----------------------------------------------------------------------------------------------------------------------
