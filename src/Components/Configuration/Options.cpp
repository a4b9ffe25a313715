//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Components/Message/Codec.hpp"
#include "Utilities/FileUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <ranges>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using namespace Configuration;

constexpr auto MaximumDuration = std::chrono::hours{ 24 };

[[nodiscard]] bool IsDurationAllowable(std::chrono::milliseconds const& value);
[[nodiscard]] bool IsPositiveDuration(std::chrono::milliseconds const& value);

template<typename FieldType>
[[nodiscard]] DeserializationResult MergeBoolean(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section);

template<typename FieldType>
[[nodiscard]] DeserializationResult MergeString(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section);

template<typename ValueType, typename FieldType>
[[nodiscard]] DeserializationResult MergeInteger(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section);

template<typename FieldType>
[[nodiscard]] DeserializationResult MergeDuration(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section);

template<typename SectionType>
[[nodiscard]] DeserializationResult MergeSection(
    SectionType& section, boost::json::object const& json, std::string_view context, std::string_view parent);

template<typename FieldType, typename DefaultType>
void WriteIfNotDefault(boost::json::object& group, FieldType const& field, DefaultType const& defaultValue);

template<typename FieldType>
void WriteDurationIfNotDefault(
    boost::json::object& group, FieldType const& field, std::chrono::milliseconds const& defaultValue);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultFerryFolder()
{
    std::string filepath{ Defaults::FallbackConfigurationFolder.string() }; // Set the filepath root to /etc/ by default

    // Prefer $XDG_CONFIG_HOME as the configuration directory, otherwise use the .config folder of the user's home.
    if (auto const pConfigHome = std::getenv("XDG_CONFIG_HOME"); pConfigHome && *pConfigHome != '\0') {
        filepath = pConfigHome;
    } else if (auto const pUserHome = std::getenv("HOME"); pUserHome) {
        filepath = std::string{ pUserHome } + "/.config";
    }

    filepath += DefaultFerryFolder;
    return filepath;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultConfigurationFilepath()
{
    return GetDefaultFerryFolder() / DefaultConfigurationFilename; // ../config.json
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultDevicesFilepath()
{
    return GetDefaultFerryFolder() / DefaultDevicesFilename; // ../devices.json
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::chrono::milliseconds> Configuration::StringToMilliseconds(std::string_view value)
{
    enum class Duration : std::uint32_t { Milliseconds, Seconds, Minutes, Hours };

    using Postfix = std::pair<std::string_view, Duration>;
    constexpr std::array<Postfix, 4> Postfixes = {{
        { "ms", Duration::Milliseconds },
        { "s", Duration::Seconds },
        { "min", Duration::Minutes },
        { "h", Duration::Hours },
    }};

    // Find the first instance of a non-numeric character, the remainder of the value is the unit postfix.
    auto const first = std::ranges::find_if(value, [] (char c) { return std::isalpha(static_cast<unsigned char>(c)); });
    if (first == value.end() || first == value.begin()) { return {}; }

    std::size_t const size = static_cast<std::size_t>(std::distance(value.begin(), first));
    std::string_view const postfix = value.substr(size);
    auto const entry = std::ranges::find(Postfixes, postfix, &Postfix::first);
    if (entry == Postfixes.end()) { return {}; }

    // Only unsigned whole numbers are accepted, the lexical cast would otherwise wrap negative values.
    auto const numeric = value.substr(0, size);
    if (!std::ranges::all_of(numeric, [] (char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return {};
    }

    std::uint32_t count = 0;
    if (!boost::conversion::try_lexical_convert(numeric.data(), numeric.size(), count)) { return {}; }

    auto const converted = static_cast<std::int64_t>(count);
    switch (entry->second) {
        case Duration::Hours: return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(converted));
        case Duration::Minutes: return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::minutes(converted));
        case Duration::Seconds: return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(converted));
        case Duration::Milliseconds: return std::chrono::milliseconds(converted);
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Configuration::StringFromMilliseconds(std::chrono::milliseconds const& value)
{
    if (value.count() < 0) { return {}; }

    using Unit = std::pair<std::int64_t, std::string_view>;
    constexpr std::array<Unit, 3> Units = {{ { 3'600'000, "h" }, { 60'000, "min" }, { 1'000, "s" } }};

    // Use the largest unit that represents the value exactly, such that the value survives a round trip.
    for (auto const& [divisor, postfix] : Units) {
        if (value.count() != 0 && value.count() % divisor == 0) {
            return std::to_string(value.count() / divisor).append(postfix);
        }
    }

    return std::to_string(value.count()).append("ms");
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Details::Details()
    : m_optName([] (auto const& value) { return !value.empty() && value.size() <= NameSizeLimit; })
    , m_optKind([] (auto const& value) { return Device::StringToKind(value) != Device::Kind::Unknown; })
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Details::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "details": {
    //     "name": Optional String,
    //     "kind": Optional String
    // },

    if (auto const result = local::MergeString(m_optName, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeString(m_optKind, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Details::Write(boost::json::object& json) const
{
    boost::json::object group;

    if (m_optName.HasValue()) { group[m_optName.GetFieldName()] = m_optName.GetValue(); }
    local::WriteIfNotDefault(group, m_optKind, std::string{ Defaults::DeviceKind });

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::Options::Details::GetName() const
{
    if (m_optName.HasValue()) { return m_optName.GetValue(); }

    boost::system::error_code error;
    auto name = boost::asio::ip::host_name(error);
    if (error || name.empty()) { return "ferry-hub"; }
    return name;
}

//----------------------------------------------------------------------------------------------------------------------

Device::Kind Configuration::Options::Details::GetKind() const
{
    return Device::StringToKind(m_optKind.GetValueOrElse(std::string{ Defaults::DeviceKind }));
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Details::SetName(std::string_view name)
{
    return m_optName.SetValue(std::string{ name });
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Retry::Retry()
    : m_optBase(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
    , m_optCeiling(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
    , m_optLimit()
    , m_optJitter([] (double value) { return value >= 0.0 && value <= 1.0; })
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Retry::Merge(
    boost::json::object const& json, std::string_view context)
{
    // JSON Schema:
    // "retry": {
    //     "base": Optional String,
    //     "ceiling": Optional String,
    //     "limit": Optional Integer,
    //     "jitter": Optional Number
    // },

    if (auto const result = local::MergeDuration(m_optBase, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeDuration(m_optCeiling, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint32_t>(m_optLimit, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    // Deserialize the jitter field from the retry object. Whole numbers are accepted for the bounds of the range.
    if (m_optJitter.NotModified()) {
        if (auto const itr = json.find(m_optJitter.GetFieldName()); itr != json.end()) {
            std::optional<double> optJitter;
            if (itr->value().is_double()) {
                optJitter = itr->value().get_double();
            } else if (itr->value().is_int64()) {
                optJitter = static_cast<double>(itr->value().get_int64());
            } else if (itr->value().is_uint64()) {
                optJitter = static_cast<double>(itr->value().get_uint64());
            }

            if (!optJitter) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("number", context, Symbol, m_optJitter.GetFieldName())
                };
            }

            if (!m_optJitter.SetValueFromConfig(*optJitter)) {
                return { StatusCode::InputError, CreateInvalidValueMessage(context, Symbol, m_optJitter.GetFieldName()) };
            }
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Retry::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteDurationIfNotDefault(group, m_optBase, Defaults::RetryBase);
    local::WriteDurationIfNotDefault(group, m_optCeiling, Defaults::RetryCeiling);
    local::WriteIfNotDefault(group, m_optLimit, Defaults::RetryLimit);
    local::WriteIfNotDefault(group, m_optJitter, Defaults::RetryJitter);

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Retry::AreOptionsAllowable(std::string_view context) const
{
    if (GetBase() > GetCeiling()) {
        return {
            StatusCode::InputError,
            fmt::format(
                "The '{}' field must not exceed the '{}' field.",
                ConcatenateFieldNames(context, Symbol, m_optBase.GetFieldName()),
                ConcatenateFieldNames(context, Symbol, m_optCeiling.GetFieldName()))
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Retry::GetBase() const
{
    return m_optBase.GetValueOrElse(Defaults::RetryBase);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Retry::GetCeiling() const
{
    return m_optCeiling.GetValueOrElse(Defaults::RetryCeiling);
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Retry::GetLimit() const { return m_optLimit.GetValueOrElse(Defaults::RetryLimit); }

//----------------------------------------------------------------------------------------------------------------------

double Configuration::Options::Retry::GetJitter() const { return m_optJitter.GetValueOrElse(Defaults::RetryJitter); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Retry::SetLimit(std::uint32_t value) { return m_optLimit.SetValue(value); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Heartbeat::Heartbeat()
    : m_optInterval(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
    , m_optTolerance([] (std::uint32_t value) { return value > 0; })
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Heartbeat::Merge(
    boost::json::object const& json, std::string_view context)
{
    // JSON Schema:
    // "heartbeat": {
    //     "interval": Optional String,
    //     "tolerance": Optional Integer
    // },

    if (auto const result = local::MergeDuration(m_optInterval, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint32_t>(m_optTolerance, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Heartbeat::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteDurationIfNotDefault(group, m_optInterval, Defaults::HeartbeatInterval);
    local::WriteIfNotDefault(group, m_optTolerance, Defaults::HeartbeatTolerance);

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Heartbeat::GetInterval() const
{
    return m_optInterval.GetValueOrElse(Defaults::HeartbeatInterval);
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Heartbeat::GetTolerance() const
{
    return m_optTolerance.GetValueOrElse(Defaults::HeartbeatTolerance);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Connection::Connection()
    : m_optTimeout(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
    , m_heartbeat()
    , m_retry()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Connection::Merge(
    boost::json::object const& json, std::string_view context)
{
    // JSON Schema:
    // "connection": {
    //     "timeout": Optional String,
    //     "heartbeat": Optional Object,
    //     "retry": Optional Object
    // },

    if (auto const result = local::MergeDuration(m_optTimeout, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeSection(m_heartbeat, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeSection(m_retry, json, context, Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Connection::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteDurationIfNotDefault(group, m_optTimeout, Defaults::ConnectionTimeout);
    if (auto const result = m_heartbeat.Write(group); result.first != StatusCode::Success) { return result; }
    if (auto const result = m_retry.Write(group); result.first != StatusCode::Success) { return result; }

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Connection::AreOptionsAllowable(std::string_view context) const
{
    return m_retry.AreOptionsAllowable(ConcatenateFieldNames(context, Symbol));
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Connection::GetTimeout() const
{
    return m_optTimeout.GetValueOrElse(Defaults::ConnectionTimeout);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Heartbeat const& Configuration::Options::Connection::GetHeartbeat() const { return m_heartbeat; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Retry const& Configuration::Options::Connection::GetRetry() const { return m_retry; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Network::Network()
    : m_optInterface([] (auto const& value) { return !value.empty(); })
    , m_optPort()
    , m_connection()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Network::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "network": {
    //     "interface": Optional String,
    //     "port": Optional Integer,
    //     "connection": Optional Object
    // },

    if (auto const result = local::MergeString(m_optInterface, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint16_t>(m_optPort, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeSection(m_connection, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Network::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteIfNotDefault(group, m_optInterface, std::string{ Defaults::NetworkInterface });
    local::WriteIfNotDefault(group, m_optPort, Defaults::NetworkPort);
    if (auto const result = m_connection.Write(group); result.first != StatusCode::Success) { return result; }

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Network::AreOptionsAllowable() const
{
    boost::system::error_code error;
    [[maybe_unused]] auto const address = boost::asio::ip::make_address(GetInterface(), error);
    if (error) {
        return { StatusCode::InputError, CreateInvalidValueMessage(Symbol, m_optInterface.GetFieldName()) };
    }

    return m_connection.AreOptionsAllowable(Symbol);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::Options::Network::GetInterface() const
{
    return m_optInterface.GetValueOrElse(std::string{ Defaults::NetworkInterface });
}

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Configuration::Options::Network::GetPort() const { return m_optPort.GetValueOrElse(Defaults::NetworkPort); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Connection const& Configuration::Options::Network::GetConnection() const
{
    return m_connection;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Network::SetInterface(std::string_view interface)
{
    return m_optInterface.SetValue(std::string{ interface });
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Network::SetPort(std::uint16_t port) { return m_optPort.SetValue(port); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Discovery::Discovery()
    : m_optEnabled()
    , m_optServiceType([] (auto const& value) { return !value.empty() && value.front() == '_'; })
    , m_optGroup()
    , m_optPort([] (std::uint16_t value) { return value != 0; })
    , m_optInterval(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
    , m_optExpiration(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Discovery::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "discovery": {
    //     "enabled": Optional Boolean,
    //     "service_type": Optional String,
    //     "group": Optional String,
    //     "port": Optional Integer,
    //     "interval": Optional String,
    //     "expiration": Optional String
    // },

    if (auto const result = local::MergeBoolean(m_optEnabled, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeString(m_optServiceType, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeString(m_optGroup, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint16_t>(m_optPort, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeDuration(m_optInterval, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeDuration(m_optExpiration, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Discovery::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteIfNotDefault(group, m_optEnabled, Defaults::DiscoveryEnabled);
    local::WriteIfNotDefault(group, m_optServiceType, std::string{ Defaults::DiscoveryServiceType });
    local::WriteIfNotDefault(group, m_optGroup, std::string{ Defaults::DiscoveryGroup });
    local::WriteIfNotDefault(group, m_optPort, Defaults::DiscoveryPort);
    local::WriteDurationIfNotDefault(group, m_optInterval, Defaults::DiscoveryInterval);
    local::WriteDurationIfNotDefault(group, m_optExpiration, Defaults::DiscoveryExpiration);

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Discovery::AreOptionsAllowable() const
{
    boost::system::error_code error;
    auto const group = boost::asio::ip::make_address(GetGroup(), error);
    if (error || !group.is_multicast()) {
        return { StatusCode::InputError, CreateInvalidValueMessage(Symbol, m_optGroup.GetFieldName()) };
    }

    // Records must outlive at least one announcement interval, otherwise every service would flap.
    if (GetExpiration() <= GetInterval()) {
        return {
            StatusCode::InputError,
            fmt::format(
                "The '{}' field must exceed the '{}' field.",
                ConcatenateFieldNames(Symbol, m_optExpiration.GetFieldName()),
                ConcatenateFieldNames(Symbol, m_optInterval.GetFieldName()))
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Discovery::IsEnabled() const
{
    return m_optEnabled.GetValueOrElse(Defaults::DiscoveryEnabled);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::Options::Discovery::GetServiceType() const
{
    return m_optServiceType.GetValueOrElse(std::string{ Defaults::DiscoveryServiceType });
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::Options::Discovery::GetGroup() const
{
    return m_optGroup.GetValueOrElse(std::string{ Defaults::DiscoveryGroup });
}

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Configuration::Options::Discovery::GetPort() const
{
    return m_optPort.GetValueOrElse(Defaults::DiscoveryPort);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Discovery::GetInterval() const
{
    return m_optInterval.GetValueOrElse(Defaults::DiscoveryInterval);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Discovery::GetExpiration() const
{
    return m_optExpiration.GetValueOrElse(Defaults::DiscoveryExpiration);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Discovery::SetEnabled(bool enabled) { return m_optEnabled.SetValue(enabled); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Pairing::Pairing()
    : m_optLifetime(StringToMilliseconds, StringFromMilliseconds, [] (auto const& value) {
        return value >= std::chrono::seconds{ 1 } && local::IsDurationAllowable(value);
    })
    , m_optCodeLength([] (std::uint32_t value) { return value >= 4 && value <= 16; })
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Pairing::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "pairing": {
    //     "ttl": Optional String,
    //     "code_length": Optional Integer
    // },

    if (auto const result = local::MergeDuration(m_optLifetime, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint32_t>(m_optCodeLength, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Pairing::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteDurationIfNotDefault(group, m_optLifetime, Defaults::PairingLifetime);
    local::WriteIfNotDefault(group, m_optCodeLength, Defaults::PairingCodeLength);

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Pairing::GetLifetime() const
{
    return m_optLifetime.GetValueOrElse(Defaults::PairingLifetime);
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Pairing::GetCodeLength() const
{
    return m_optCodeLength.GetValueOrElse(Defaults::PairingCodeLength);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Sync::Sync()
    : m_optClipboard()
    , m_optNotifications()
    , m_optRelay()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Sync::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "sync": {
    //     "clipboard": Optional Boolean,
    //     "notifications": Optional Boolean,
    //     "relay": Optional Boolean
    // },

    if (auto const result = local::MergeBoolean(m_optClipboard, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeBoolean(m_optNotifications, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeBoolean(m_optRelay, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Sync::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteIfNotDefault(group, m_optClipboard, Defaults::SyncClipboard);
    local::WriteIfNotDefault(group, m_optNotifications, Defaults::SyncNotifications);
    local::WriteIfNotDefault(group, m_optRelay, Defaults::SyncRelay);

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Sync::UseClipboard() const { return m_optClipboard.GetValueOrElse(Defaults::SyncClipboard); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Sync::UseNotifications() const
{
    return m_optNotifications.GetValueOrElse(Defaults::SyncNotifications);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Sync::UseRelay() const { return m_optRelay.GetValueOrElse(Defaults::SyncRelay); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Sync::SetClipboard(bool enabled) { return m_optClipboard.SetValue(enabled); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Sync::SetNotifications(bool enabled) { return m_optNotifications.SetValue(enabled); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Sync::SetRelay(bool enabled) { return m_optRelay.SetValue(enabled); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Transfer::Transfer()
    : m_optDirectory([] (auto const& value) { return !value.empty(); })
    , m_optChunkSize([] (std::uint32_t value) { return value >= 1024; })
    , m_optWindow([] (std::uint32_t value) { return value > 0; })
    , m_optResumable()
    , m_optRateLimit()
    , m_optGracePeriod(StringToMilliseconds, StringFromMilliseconds, local::IsDurationAllowable)
    , m_optStallTimeout(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
    , m_optResumeTimeout(StringToMilliseconds, StringFromMilliseconds, local::IsPositiveDuration)
    , m_optProgressInterval([] (std::uint32_t value) { return value > 0; })
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Transfer::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "transfer": {
    //     "directory": Optional String,
    //     "chunk_size": Optional Integer,
    //     "window": Optional Integer,
    //     "resumable": Optional Boolean,
    //     "rate_limit": Optional Integer,
    //     "grace_period": Optional String,
    //     "stall_timeout": Optional String,
    //     "resume_timeout": Optional String,
    //     "progress_interval": Optional Integer
    // },

    if (auto const result = local::MergeString(m_optDirectory, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint32_t>(m_optChunkSize, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint32_t>(m_optWindow, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeBoolean(m_optResumable, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint64_t>(m_optRateLimit, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeDuration(m_optGracePeriod, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeDuration(m_optStallTimeout, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeDuration(m_optResumeTimeout, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    if (auto const result = local::MergeInteger<std::uint32_t>(m_optProgressInterval, json, "", Symbol); result.first != StatusCode::Success) {
        return result;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Transfer::Write(boost::json::object& json) const
{
    boost::json::object group;

    local::WriteIfNotDefault(group, m_optDirectory, std::string{ Defaults::TransferDirectory });
    local::WriteIfNotDefault(group, m_optChunkSize, Defaults::TransferChunkSize);
    local::WriteIfNotDefault(group, m_optWindow, Defaults::TransferWindow);
    local::WriteIfNotDefault(group, m_optResumable, Defaults::TransferResumable);
    local::WriteIfNotDefault(group, m_optRateLimit, Defaults::TransferRateLimit);
    local::WriteDurationIfNotDefault(group, m_optGracePeriod, Defaults::TransferGracePeriod);
    local::WriteDurationIfNotDefault(group, m_optStallTimeout, Defaults::TransferStallTimeout);
    local::WriteDurationIfNotDefault(group, m_optResumeTimeout, Defaults::TransferResumeTimeout);
    local::WriteIfNotDefault(group, m_optProgressInterval, Defaults::TransferProgressInterval);

    if (!group.empty()) { json.emplace(Symbol, std::move(group)); }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Transfer::AreOptionsAllowable() const
{
    // A chunk must fit within a single binary frame alongside its header.
    constexpr std::size_t ChunkLimit = Message::MaximumFrameSize / 2;
    if (GetChunkSize() > ChunkLimit) {
        return {
            StatusCode::InputError,
            CreateExceededValueLimitMessage(ChunkLimit, Symbol, m_optChunkSize.GetFieldName())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Options::Transfer::GetDirectory() const
{
    return FileUtils::ExpandUserDirectory(m_optDirectory.GetValueOrElse(std::string{ Defaults::TransferDirectory }));
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Transfer::GetChunkSize() const
{
    return m_optChunkSize.GetValueOrElse(Defaults::TransferChunkSize);
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Transfer::GetWindow() const
{
    return m_optWindow.GetValueOrElse(Defaults::TransferWindow);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Transfer::IsResumable() const
{
    return m_optResumable.GetValueOrElse(Defaults::TransferResumable);
}

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Configuration::Options::Transfer::GetRateLimit() const
{
    return m_optRateLimit.GetValueOrElse(Defaults::TransferRateLimit);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Transfer::GetGracePeriod() const
{
    return m_optGracePeriod.GetValueOrElse(Defaults::TransferGracePeriod);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Transfer::GetStallTimeout() const
{
    return m_optStallTimeout.GetValueOrElse(Defaults::TransferStallTimeout);
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::Transfer::GetResumeTimeout() const
{
    return m_optResumeTimeout.GetValueOrElse(Defaults::TransferResumeTimeout);
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Transfer::GetProgressInterval() const
{
    return m_optProgressInterval.GetValueOrElse(Defaults::TransferProgressInterval);
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsDurationAllowable(std::chrono::milliseconds const& value)
{
    return value.count() >= 0 && value <= MaximumDuration;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsPositiveDuration(std::chrono::milliseconds const& value)
{
    return value.count() > 0 && value <= MaximumDuration;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
Configuration::DeserializationResult local::MergeBoolean(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section)
{
    if (field.Modified()) { return { StatusCode::Success, "" }; } // Runtime values take precedence over the file.

    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_bool()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("boolean", context, section, field.GetFieldName())
        };
    }

    if (!field.SetValueFromConfig(itr->value().get_bool())) {
        return { StatusCode::InputError, CreateInvalidValueMessage(context, section, field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
Configuration::DeserializationResult local::MergeString(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section)
{
    if (field.Modified()) { return { StatusCode::Success, "" }; }

    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_string()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("string", context, section, field.GetFieldName())
        };
    }

    auto const& value = itr->value().get_string();
    if (!field.SetValueFromConfig(std::string{ value.data(), value.size() })) {
        return { StatusCode::InputError, CreateInvalidValueMessage(context, section, field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename ValueType, typename FieldType>
Configuration::DeserializationResult local::MergeInteger(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section)
{
    if (field.Modified()) { return { StatusCode::Success, "" }; }

    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    auto const& value = itr->value();
    if (!value.is_int64() && !value.is_uint64()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("integer", context, section, field.GetFieldName())
        };
    }

    bool const inRange = value.is_int64() ?
        std::in_range<ValueType>(value.get_int64()) : std::in_range<ValueType>(value.get_uint64());
    if (!inRange) {
        return {
            StatusCode::InputError,
            CreateExceededValueLimitMessage(
                std::numeric_limits<ValueType>::max(), context, section, field.GetFieldName())
        };
    }

    auto const converted = value.is_int64() ?
        static_cast<ValueType>(value.get_int64()) : static_cast<ValueType>(value.get_uint64());
    if (!field.SetValueFromConfig(converted)) {
        return { StatusCode::InputError, CreateInvalidValueMessage(context, section, field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
Configuration::DeserializationResult local::MergeDuration(
    FieldType& field, boost::json::object const& json, std::string_view context, std::string_view section)
{
    if (field.Modified()) { return { StatusCode::Success, "" }; }

    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_string()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("string", context, section, field.GetFieldName())
        };
    }

    auto const& value = itr->value().get_string();
    if (!field.SetValueFromConfig(std::string_view{ value.data(), value.size() })) {
        return { StatusCode::InputError, CreateInvalidValueMessage(context, section, field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename SectionType>
Configuration::DeserializationResult local::MergeSection(
    SectionType& section, boost::json::object const& json, std::string_view context, std::string_view parent)
{
    auto const itr = json.find(SectionType::GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    if (!itr->value().is_object()) {
        return {
            StatusCode::DecodeError,
            CreateMismatchedValueTypeMessage("object", context, parent, SectionType::GetFieldName())
        };
    }

    return section.Merge(itr->value().get_object(), ConcatenateFieldNames(context, parent));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType, typename DefaultType>
void local::WriteIfNotDefault(boost::json::object& group, FieldType const& field, DefaultType const& defaultValue)
{
    if (field.WouldMatchDefault(defaultValue)) { return; }
    group[field.GetFieldName()] = field.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

template<typename FieldType>
void local::WriteDurationIfNotDefault(
    boost::json::object& group, FieldType const& field, std::chrono::milliseconds const& defaultValue)
{
    if (field.WouldMatchDefault(defaultValue)) { return; }
    if (auto const optSerialized = field.GetSerializedValue(); optSerialized) {
        group[field.GetFieldName()] = *optSerialized;
    }
}

//----------------------------------------------------------------------------------------------------------------------
