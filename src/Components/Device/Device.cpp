//----------------------------------------------------------------------------------------------------------------------
// File: Device.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Device.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string.hpp>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

Device::Identifier Device::GenerateIdentifier()
{
    std::array<std::uint8_t, GeneratedIdentifierBytes> buffer = {};
    if (::RAND_bytes(buffer.data(), static_cast<std::int32_t>(buffer.size())) != 1) {
        throw std::runtime_error("Failed to generate random bytes for a device identifier!");
    }

    Identifier identifier;
    boost::algorithm::hex_lower(buffer.begin(), buffer.end(), std::back_inserter(identifier));
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

bool Device::IsValidIdentifier(std::string_view identifier)
{
    if (identifier.empty() || identifier.size() > MaximumIdentifierSize) { return false; }
    return std::ranges::all_of(identifier, [] (char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == ':';
    });
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Device::KindToString(Kind kind)
{
    switch (kind) {
        case Kind::Hub: return "hub";
        case Kind::Mobile: return "mobile";
        case Kind::Desktop: return "desktop";
        default: return "unknown";
    }
}

//----------------------------------------------------------------------------------------------------------------------

Device::Kind Device::StringToKind(std::string_view value)
{
    using namespace boost::algorithm;
    // Clients describe themselves by platform as well as by form factor.
    if (iequals(value, "hub")) { return Kind::Hub; }
    if (iequals(value, "mobile") || iequals(value, "android") || iequals(value, "ios") || iequals(value, "phone")) {
        return Kind::Mobile;
    }
    if (iequals(value, "desktop") || iequals(value, "linux") || iequals(value, "windows") || iequals(value, "macos")) {
        return Kind::Desktop;
    }
    return Kind::Unknown;
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Device::TrustStateToString(TrustState state)
{
    switch (state) {
        case TrustState::Pending: return "pending";
        case TrustState::Trusted: return "trusted";
        case TrustState::Revoked: return "revoked";
        default: return "unknown";
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Device::TrustState> Device::StringToTrustState(std::string_view value)
{
    using namespace boost::algorithm;
    if (iequals(value, "unknown")) { return TrustState::Unknown; }
    if (iequals(value, "pending")) { return TrustState::Pending; }
    if (iequals(value, "trusted")) { return TrustState::Trusted; }
    if (iequals(value, "revoked")) { return TrustState::Revoked; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
