//----------------------------------------------------------------------------------------------------------------------
// File: Datagram.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Datagram.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Addresses = "addresses";
constexpr std::string_view Event = "event";
constexpr std::string_view Instance = "instance";
constexpr std::string_view Metadata = "metadata";
constexpr std::string_view Port = "port";
constexpr std::string_view ServiceName = "service_name";
constexpr std::string_view ServiceType = "service_type";

constexpr std::string_view Announce = "announce";
constexpr std::string_view Goodbye = "goodbye";
constexpr std::string_view Query = "query";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::string> GetString(boost::json::object const& json, std::string_view field);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string_view Discovery::IntentToString(Intent intent)
{
    switch (intent) {
        case Intent::Announce: return symbols::Announce;
        case Intent::Goodbye: return symbols::Goodbye;
        case Intent::Query: return symbols::Query;
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::Intent> Discovery::IntentFromString(std::string_view intent)
{
    if (intent == symbols::Announce) { return Intent::Announce; }
    if (intent == symbols::Goodbye) { return Intent::Goodbye; }
    if (intent == symbols::Query) { return Intent::Query; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::string Discovery::Encode(Datagram const& datagram)
{
    boost::json::object json;
    json[symbols::Event] = IntentToString(datagram.intent);
    json[symbols::ServiceType] = datagram.serviceType;

    if (datagram.intent != Intent::Query) {
        json[symbols::ServiceName] = datagram.serviceName;
        json[symbols::Instance] = datagram.instance;
    }

    if (datagram.intent == Intent::Announce) {
        json[symbols::Port] = datagram.port;

        boost::json::array addresses;
        for (auto const& address : datagram.addresses) { addresses.emplace_back(address); }
        json[symbols::Addresses] = std::move(addresses);

        boost::json::object metadata;
        for (auto const& [key, value] : datagram.metadata) { metadata[key] = value; }
        json[symbols::Metadata] = std::move(metadata);
    }

    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::Datagram> Discovery::Decode(std::string_view buffer)
{
    if (buffer.empty() || buffer.size() > MaximumDatagramSize) { return {}; }

    boost::system::error_code error;
    auto const parsed = boost::json::parse(buffer, error);
    if (error || !parsed.is_object()) { return {}; }
    auto const& json = parsed.get_object();

    Datagram datagram;
    {
        auto const optEvent = local::GetString(json, symbols::Event);
        if (!optEvent) { return {}; }
        auto const optIntent = IntentFromString(*optEvent);
        if (!optIntent) { return {}; }
        datagram.intent = *optIntent;
    }

    auto optServiceType = local::GetString(json, symbols::ServiceType);
    if (!optServiceType || optServiceType->empty()) { return {}; }
    datagram.serviceType = std::move(*optServiceType);

    if (datagram.intent == Intent::Query) { return datagram; }

    auto optInstance = local::GetString(json, symbols::Instance);
    if (!optInstance || optInstance->empty()) { return {}; }
    datagram.instance = std::move(*optInstance);
    datagram.serviceName = local::GetString(json, symbols::ServiceName).value_or(std::string{});

    if (datagram.intent == Intent::Goodbye) { return datagram; }

    {
        auto const pPort = json.if_contains(symbols::Port);
        if (!pPort) { return {}; }
        auto const optPort = pPort->if_int64();
        if (!optPort || *optPort <= 0 || *optPort > std::numeric_limits<std::uint16_t>::max()) { return {}; }
        datagram.port = static_cast<std::uint16_t>(*optPort);
    }

    if (auto const pAddresses = json.if_contains(symbols::Addresses); pAddresses) {
        auto const pArray = pAddresses->if_array();
        if (!pArray) { return {}; }
        for (auto const& address : *pArray) {
            // Entries that are not strings are skipped, they are not reachable addresses.
            if (auto const pAddress = address.if_string(); pAddress && !pAddress->empty()) {
                datagram.addresses.emplace_back(pAddress->c_str(), pAddress->size());
            }
        }
    }

    if (auto const pMetadata = json.if_contains(symbols::Metadata); pMetadata) {
        auto const pObject = pMetadata->if_object();
        if (!pObject) { return {}; }
        for (auto const& [key, value] : *pObject) {
            if (auto const pValue = value.if_string(); pValue) {
                datagram.metadata.emplace(std::string{ key }, std::string{ pValue->c_str(), pValue->size() });
            }
        }
    }

    return datagram;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::GetString(boost::json::object const& json, std::string_view field)
{
    auto const pValue = json.if_contains(field);
    if (!pValue) { return {}; }
    auto const pString = pValue->if_string();
    if (!pString) { return {}; }
    return std::string{ pString->c_str(), pString->size() };
}

//----------------------------------------------------------------------------------------------------------------------
