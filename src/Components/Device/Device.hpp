//----------------------------------------------------------------------------------------------------------------------
// File: Device.hpp
// Description: The identity and trust state of a hub or peer device.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Device {
//----------------------------------------------------------------------------------------------------------------------

using Identifier = std::string;

constexpr std::size_t MaximumIdentifierSize = 128;
constexpr std::size_t MaximumNameSize = 256;
constexpr std::size_t GeneratedIdentifierBytes = 16;

enum class Kind : std::uint32_t { Unknown, Hub, Mobile, Desktop };

// Note: The trust state only advances (Unknown -> Pending -> Trusted). Revoked is entered through an explicit unpair
// and may only be left through a fresh pairing.
enum class TrustState : std::uint32_t { Unknown, Pending, Trusted, Revoked };

struct Details;

// Generates a random identifier for the local device. The owner is responsible for persisting the result.
[[nodiscard]] Identifier GenerateIdentifier();
[[nodiscard]] bool IsValidIdentifier(std::string_view identifier);

[[nodiscard]] std::string_view KindToString(Kind kind);
[[nodiscard]] Kind StringToKind(std::string_view value);

[[nodiscard]] std::string_view TrustStateToString(TrustState state);
[[nodiscard]] std::optional<TrustState> StringToTrustState(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // Device namespace
//----------------------------------------------------------------------------------------------------------------------

struct Device::Details
{
    [[nodiscard]] bool operator==(Details const& other) const = default;

    Identifier identifier;
    std::string name;
    Kind kind = Kind::Unknown;
    TrustState trust = TrustState::Unknown;
    TimeUtils::Timestamp paired = {};
    std::uint32_t pairings = 0;
};

//----------------------------------------------------------------------------------------------------------------------
