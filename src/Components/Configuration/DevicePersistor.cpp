//----------------------------------------------------------------------------------------------------------------------
// File: DevicePersistor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "DevicePersistor.hpp"
#include "Defaults.hpp"
#include "Options.hpp"
#include "SerializationErrors.hpp"
#include "Components/Device/Registry.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

namespace Symbols {

constexpr std::string_view Identifier = "identifier";
constexpr std::string_view Name = "name";
constexpr std::string_view Kind = "kind";
constexpr std::string_view Trust = "trust";
constexpr std::string_view Paired = "paired";
constexpr std::string_view Pairings = "pairings";

} // Symbols namespace

// Only settled trust decisions are stored. A pending device must present a code again after a restart.
[[nodiscard]] bool IsPersistable(Device::TrustState state);

[[nodiscard]] std::optional<Device::Details> ParseEntry(boost::json::value const& entry);
[[nodiscard]] boost::json::object WriteEntry(Device::Details const& details);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema.
//----------------------------------------------------------------------------------------------------------------------
// [
//   {
//     "identifier": String,
//     "name": String,
//     "kind": String,
//     "trust": String,
//     "paired": Integer (milliseconds since the epoch),
//     "pairings": Integer
//   },
//   ...
// ]
//----------------------------------------------------------------------------------------------------------------------

Configuration::DevicePersistor::DevicePersistor(std::filesystem::path const& filepath, bool shouldBuildPath)
    : m_logger(Logger::Get(Logger::Name::Core))
    , m_registry(nullptr)
    , m_fileMutex()
    , m_filepath(filepath)
{
    if (!shouldBuildPath) { return; }

    // If the filepath does not have a filename, attach the default devices.json
    if (!m_filepath.has_filename()) { m_filepath = m_filepath / DefaultDevicesFilename; }

    // If the filepath does not have a parent path, get and attach the default ferry folder
    if (!m_filepath.has_parent_path()) { m_filepath = GetDefaultFerryFolder() / m_filepath; }

    if (!FileUtils::CreateParentFolderIfNoneExist(m_filepath)) {
        m_logger->error("Failed to create the filepath at: {}!", m_filepath.string());
        m_filepath.clear();
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DevicePersistor::~DevicePersistor()
{
    SetRegistry(nullptr);
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::DevicePersistor::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::DevicePersistor::SetRegistry(Device::Registry* const registry)
{
    // If there is already a registry attached to the persistor, unregister from the previous registry.
    if (m_registry) [[likely]] { m_registry->Unregister(this); }

    // It is possible for the registry to be a nullptr if the caller intends to detach the previous registry.
    m_registry = registry;

    if (m_registry) [[likely]] { m_registry->Register(this); }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::DevicePersistor::FetchDevices()
{
    assert(m_registry);

    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    if (!std::filesystem::exists(m_filepath)) {
        m_logger->debug("Generating devices file at: {}.", m_filepath.string());
        m_registry->Restore({});
        return Serialize();
    }

    m_logger->debug("Reading devices file at: {}.", m_filepath.string());

    std::vector<Device::Details> devices;
    auto const status = DecodeDevicesFile(devices);
    if (status.first != StatusCode::Success) {
        // A device that can not be read must pair again, the registry starts without any trusted devices.
        m_logger->warn("Failed to decode devices file at: {}! Reason: {}", m_filepath.string(), status.second);
        m_registry->Restore({});
        return status;
    }

    m_registry->Restore(devices);
    m_logger->info("Restored {} paired device(s) from {}.", devices.size(), m_filepath.string());

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::DevicePersistor::Serialize()
{
    if (!m_registry) [[unlikely]] { return { StatusCode::InputError, "A device registry has not been attached." }; }
    if (m_filepath.empty()) [[unlikely]] { return { StatusCode::FileError, "The filesystem has been disabled." }; }

    boost::json::array json;
    for (auto const& details : m_registry->GetSnapshot()) {
        if (!local::IsPersistable(details.trust)) { continue; }
        json.emplace_back(local::WriteEntry(details));
    }

    std::scoped_lock lock(m_fileMutex);

    std::ofstream out(m_filepath, std::ofstream::out | std::ofstream::trunc);
    if (out.fail()) [[unlikely]] { return { StatusCode::FileError, "Failed to open file." }; }

    JSON::WritePretty(boost::json::value(std::move(json)), out);

    out.close();
    if (out.fail()) [[unlikely]] { return { StatusCode::FileError, "Failed to write file." }; }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::DevicePersistor::OnTrustStateChanged(Device::Details const& details)
{
    if (m_filepath.empty()) { return; }

    m_logger->debug(
        "Updating devices file after {} became {}.",
        details.identifier, Device::TrustStateToString(details.trust));

    if (auto const status = Serialize(); status.first != StatusCode::Success) [[unlikely]] {
        m_logger->error("Failed to serialize devices! Reason: {}", status.second);
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::DevicePersistor::DecodeDevicesFile(
    std::vector<Device::Details>& devices) const
{
    std::scoped_lock lock(m_fileMutex);

    // Determine the size of the file about to be read. Do not read a file that is above the given treshold.
    std::error_code error;
    auto const size = std::filesystem::file_size(m_filepath, error);
    if (error || size == 0 || size > Defaults::DeviceFileSizeLimit) [[unlikely]] {
        return { StatusCode::FileError, "The devices file is empty or exceeds the maximum allowable size." };
    }

    std::ifstream file(m_filepath);
    if (file.fail()) [[unlikely]] { return { StatusCode::FileError, "Failed to open file." }; }

    std::stringstream buffer;
    buffer << file.rdbuf(); // Read the file into the buffer stream

    boost::json::error_code decodeError;
    auto const json = boost::json::parse(buffer.str(), decodeError);
    if (decodeError || !json.is_array()) [[unlikely]] {
        return { StatusCode::DecodeError, "Failed to read the devices file as a valid JSON array." };
    }

    auto const& entries = json.get_array();
    devices.reserve(entries.size());

    for (auto const& entry : entries) {
        auto optDetails = local::ParseEntry(entry);
        if (!optDetails) [[unlikely]] { return { StatusCode::DecodeError, CreateInvalidValueMessage("device") }; }
        devices.emplace_back(std::move(*optDetails));
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsPersistable(Device::TrustState state)
{
    return state == Device::TrustState::Trusted || state == Device::TrustState::Revoked;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Device::Details> local::ParseEntry(boost::json::value const& entry)
{
    auto const pObject = entry.if_object();
    if (!pObject) { return {}; }

    auto const pIdentifier = pObject->if_contains(Symbols::Identifier);
    if (!pIdentifier || !pIdentifier->is_string()) { return {}; }

    auto const pTrust = pObject->if_contains(Symbols::Trust);
    if (!pTrust || !pTrust->is_string()) { return {}; }

    Device::Details details;
    details.identifier = std::string{ pIdentifier->get_string().data(), pIdentifier->get_string().size() };
    if (!Device::IsValidIdentifier(details.identifier)) { return {}; }

    auto const optTrust = Device::StringToTrustState(
        std::string_view{ pTrust->get_string().data(), pTrust->get_string().size() });
    if (!optTrust || !IsPersistable(*optTrust)) { return {}; }
    details.trust = *optTrust;

    if (auto const pName = pObject->if_contains(Symbols::Name); pName && pName->is_string()) {
        auto const& name = pName->get_string();
        if (name.size() > Device::MaximumNameSize) { return {}; }
        details.name = std::string{ name.data(), name.size() };
    }

    if (auto const pKind = pObject->if_contains(Symbols::Kind); pKind && pKind->is_string()) {
        auto const& kind = pKind->get_string();
        details.kind = Device::StringToKind(std::string_view{ kind.data(), kind.size() });
    }

    if (auto const pPaired = pObject->if_contains(Symbols::Paired); pPaired && pPaired->is_int64()) {
        details.paired = TimeUtils::Timestamp{ pPaired->get_int64() };
    }

    if (auto const pPairings = pObject->if_contains(Symbols::Pairings); pPairings) {
        if (pPairings->is_int64() && pPairings->get_int64() >= 0) {
            details.pairings = static_cast<std::uint32_t>(
                std::min<std::int64_t>(pPairings->get_int64(), std::numeric_limits<std::uint32_t>::max()));
        }
    }

    return details;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object local::WriteEntry(Device::Details const& details)
{
    boost::json::object entry;
    entry[Symbols::Identifier] = details.identifier;
    entry[Symbols::Name] = details.name;
    entry[Symbols::Kind] = Device::KindToString(details.kind);
    entry[Symbols::Trust] = Device::TrustStateToString(details.trust);
    entry[Symbols::Paired] = details.paired.count();
    entry[Symbols::Pairings] = details.pairings;
    return entry;
}

//----------------------------------------------------------------------------------------------------------------------
