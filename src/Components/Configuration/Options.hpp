//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The sections of the hub's configuration file. Each section merges its values from the section's JSON
// object and writes back only the values that differ from the defaults.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "StatusCode.hpp"
#include "Components/Device/Device.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view DefaultFerryFolder = "/ferry/";

std::filesystem::path const DefaultConfigurationFilename = "config.json";
std::filesystem::path const DefaultDevicesFilename = "devices.json";

[[nodiscard]] std::filesystem::path GetDefaultFerryFolder();
[[nodiscard]] std::filesystem::path GetDefaultConfigurationFilepath();
[[nodiscard]] std::filesystem::path GetDefaultDevicesFilepath();

// Durations are written with a unit postfix of "ms", "s", "min", or "h" (e.g. "500ms", "30s").
[[nodiscard]] std::optional<std::chrono::milliseconds> StringToMilliseconds(std::string_view value);
[[nodiscard]] std::optional<std::string> StringFromMilliseconds(std::chrono::milliseconds const& value);

//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

class Details;
class Retry;
class Heartbeat;
class Connection;
class Network;
class Discovery;
class Pairing;
class Sync;
class Transfer;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Base);
DEFINE_FIELD_NAME(Ceiling);
DEFINE_FIELD_NAME(ChunkSize);
DEFINE_FIELD_NAME(Clipboard);
DEFINE_FIELD_NAME(CodeLength);
DEFINE_FIELD_NAME(Connection);
DEFINE_FIELD_NAME(Details);
DEFINE_FIELD_NAME(Directory);
DEFINE_FIELD_NAME(Discovery);
DEFINE_FIELD_NAME(Enabled);
DEFINE_FIELD_NAME(Expiration);
DEFINE_FIELD_NAME(GracePeriod);
DEFINE_FIELD_NAME(Group);
DEFINE_FIELD_NAME(Heartbeat);
DEFINE_FIELD_NAME(Interface);
DEFINE_FIELD_NAME(Interval);
DEFINE_FIELD_NAME(Jitter);
DEFINE_FIELD_NAME(Kind);
DEFINE_FIELD_NAME(Limit);
DEFINE_FIELD_NAME(Name);
DEFINE_FIELD_NAME(Network);
DEFINE_FIELD_NAME(Notifications);
DEFINE_FIELD_NAME(Pairing);
DEFINE_FIELD_NAME(Port);
DEFINE_FIELD_NAME(ProgressInterval);
DEFINE_FIELD_NAME(RateLimit);
DEFINE_FIELD_NAME(Relay);
DEFINE_FIELD_NAME(Resumable);
DEFINE_FIELD_NAME(ResumeTimeout);
DEFINE_FIELD_NAME(Retry);
DEFINE_FIELD_NAME(ServiceType);
DEFINE_FIELD_NAME(StallTimeout);
DEFINE_FIELD_NAME(Sync);
DEFINE_FIELD_NAME(Timeout);
DEFINE_FIELD_NAME(Tolerance);
DEFINE_FIELD_NAME(Transfer);
DEFINE_FIELD_NAME(Ttl);
DEFINE_FIELD_NAME(Window);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used to describe the hub to its peers.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Details
{
public:
    static constexpr std::string_view Symbol = Symbols::Details{};
    static constexpr std::size_t NameSizeLimit = 256;

    Details();

    [[nodiscard]] bool operator==(Details const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    // The name defaults to the host's name when one has not been configured.
    [[nodiscard]] std::string GetName() const;
    [[nodiscard]] Device::Kind GetKind() const;

    [[nodiscard]] bool SetName(std::string_view name);

private:
    OptionalField<Symbols::Name, std::string> m_optName;
    OptionalField<Symbols::Kind, std::string> m_optKind;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used to pace reconnection attempts.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Retry
{
public:
    static constexpr std::string_view Symbol = Symbols::Retry{};

    Retry();

    [[nodiscard]] bool operator==(Retry const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json, std::string_view context = "");
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable(std::string_view context = "") const;

    [[nodiscard]] std::chrono::milliseconds GetBase() const;
    [[nodiscard]] std::chrono::milliseconds GetCeiling() const;
    [[nodiscard]] std::uint32_t GetLimit() const;
    [[nodiscard]] double GetJitter() const;

    [[nodiscard]] bool SetLimit(std::uint32_t value);

private:
    OptionalConstructedField<Symbols::Base, std::chrono::milliseconds> m_optBase;
    OptionalConstructedField<Symbols::Ceiling, std::chrono::milliseconds> m_optCeiling;
    OptionalField<Symbols::Limit, std::uint32_t> m_optLimit;
    OptionalField<Symbols::Jitter, double> m_optJitter;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used to detect silently dead connections.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Heartbeat
{
public:
    static constexpr std::string_view Symbol = Symbols::Heartbeat{};

    Heartbeat();

    [[nodiscard]] bool operator==(Heartbeat const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json, std::string_view context = "");
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] std::chrono::milliseconds GetInterval() const;
    [[nodiscard]] std::uint32_t GetTolerance() const;

private:
    OptionalConstructedField<Symbols::Interval, std::chrono::milliseconds> m_optInterval;
    OptionalField<Symbols::Tolerance, std::uint32_t> m_optTolerance;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used for peer connections.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Connection
{
public:
    static constexpr std::string_view Symbol = Symbols::Connection{};

    Connection();

    [[nodiscard]] bool operator==(Connection const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json, std::string_view context = "");
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable(std::string_view context = "") const;

    [[nodiscard]] std::chrono::milliseconds GetTimeout() const;
    [[nodiscard]] Heartbeat const& GetHeartbeat() const;
    [[nodiscard]] Retry const& GetRetry() const;

private:
    OptionalConstructedField<Symbols::Timeout, std::chrono::milliseconds> m_optTimeout;
    Heartbeat m_heartbeat;
    Retry m_retry;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used to open the hub's listener.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Network
{
public:
    static constexpr std::string_view Symbol = Symbols::Network{};

    Network();

    [[nodiscard]] bool operator==(Network const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::string GetInterface() const;
    [[nodiscard]] std::uint16_t GetPort() const;
    [[nodiscard]] Connection const& GetConnection() const;

    [[nodiscard]] bool SetInterface(std::string_view interface);
    [[nodiscard]] bool SetPort(std::uint16_t port);

private:
    OptionalField<Symbols::Interface, std::string> m_optInterface;
    OptionalField<Symbols::Port, std::uint16_t> m_optPort;
    Connection m_connection;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used to advertise the hub on the local network.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Discovery
{
public:
    static constexpr std::string_view Symbol = Symbols::Discovery{};

    Discovery();

    [[nodiscard]] bool operator==(Discovery const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] bool IsEnabled() const;
    [[nodiscard]] std::string GetServiceType() const;
    [[nodiscard]] std::string GetGroup() const;
    [[nodiscard]] std::uint16_t GetPort() const;
    [[nodiscard]] std::chrono::milliseconds GetInterval() const;
    [[nodiscard]] std::chrono::milliseconds GetExpiration() const;

    [[nodiscard]] bool SetEnabled(bool enabled);

private:
    OptionalField<Symbols::Enabled, bool> m_optEnabled;
    OptionalField<Symbols::ServiceType, std::string> m_optServiceType;
    OptionalField<Symbols::Group, std::string> m_optGroup;
    OptionalField<Symbols::Port, std::uint16_t> m_optPort;
    OptionalConstructedField<Symbols::Interval, std::chrono::milliseconds> m_optInterval;
    OptionalConstructedField<Symbols::Expiration, std::chrono::milliseconds> m_optExpiration;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used when issuing pairing codes.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Pairing
{
public:
    static constexpr std::string_view Symbol = Symbols::Pairing{};

    Pairing();

    [[nodiscard]] bool operator==(Pairing const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] std::chrono::milliseconds GetLifetime() const;
    [[nodiscard]] std::uint32_t GetCodeLength() const;

private:
    OptionalConstructedField<Symbols::Ttl, std::chrono::milliseconds> m_optLifetime;
    OptionalField<Symbols::CodeLength, std::uint32_t> m_optCodeLength;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used to toggle the synchronization channels.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Sync
{
public:
    static constexpr std::string_view Symbol = Symbols::Sync{};

    Sync();

    [[nodiscard]] bool operator==(Sync const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] bool UseClipboard() const;
    [[nodiscard]] bool UseNotifications() const;
    [[nodiscard]] bool UseRelay() const;

    [[nodiscard]] bool SetClipboard(bool enabled);
    [[nodiscard]] bool SetNotifications(bool enabled);
    [[nodiscard]] bool SetRelay(bool enabled);

private:
    OptionalField<Symbols::Clipboard, bool> m_optClipboard;
    OptionalField<Symbols::Notifications, bool> m_optNotifications;
    OptionalField<Symbols::Relay, bool> m_optRelay;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The set of options used by the file transfer engine and its storage.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Transfer
{
public:
    static constexpr std::string_view Symbol = Symbols::Transfer{};

    Transfer();

    [[nodiscard]] bool operator==(Transfer const& other) const noexcept = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;

    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    // The directory with any leading "~" expanded to the user's home directory.
    [[nodiscard]] std::filesystem::path GetDirectory() const;
    [[nodiscard]] std::uint32_t GetChunkSize() const;
    [[nodiscard]] std::uint32_t GetWindow() const;
    [[nodiscard]] bool IsResumable() const;
    [[nodiscard]] std::uint64_t GetRateLimit() const;
    [[nodiscard]] std::chrono::milliseconds GetGracePeriod() const;
    [[nodiscard]] std::chrono::milliseconds GetStallTimeout() const;
    [[nodiscard]] std::chrono::milliseconds GetResumeTimeout() const;
    [[nodiscard]] std::uint32_t GetProgressInterval() const;

private:
    OptionalField<Symbols::Directory, std::string> m_optDirectory;
    OptionalField<Symbols::ChunkSize, std::uint32_t> m_optChunkSize;
    OptionalField<Symbols::Window, std::uint32_t> m_optWindow;
    OptionalField<Symbols::Resumable, bool> m_optResumable;
    OptionalField<Symbols::RateLimit, std::uint64_t> m_optRateLimit;
    OptionalConstructedField<Symbols::GracePeriod, std::chrono::milliseconds> m_optGracePeriod;
    OptionalConstructedField<Symbols::StallTimeout, std::chrono::milliseconds> m_optStallTimeout;
    OptionalConstructedField<Symbols::ResumeTimeout, std::chrono::milliseconds> m_optResumeTimeout;
    OptionalField<Symbols::ProgressInterval, std::uint32_t> m_optProgressInterval;
};

//----------------------------------------------------------------------------------------------------------------------
