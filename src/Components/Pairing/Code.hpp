//----------------------------------------------------------------------------------------------------------------------
// File: Code.hpp
// Description: The one time secret issued by the hub and the results of submitting it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Device/Device.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Pairing {
//----------------------------------------------------------------------------------------------------------------------

using Clock = std::chrono::steady_clock;

constexpr std::size_t DefaultCodeLength = 6;
constexpr std::size_t MinimumCodeLength = 4;
constexpr std::size_t MaximumCodeLength = 16;
constexpr std::chrono::seconds DefaultCodeLifetime = std::chrono::seconds{ 120 };

// Ambiguous glyphs (0/O, 1/I) are excluded from the alphabet as codes are read off of a screen.
constexpr std::string_view CodeAlphabet = "23456789ABCDEFGHJKLMNPQRSTUVWXYZ";

enum class State : std::uint32_t { NoCode, CodeIssued, Consumed, Expired };
enum class Error : std::uint32_t { CodeInvalid, CodeExpired, CodeAlreadyUsed, AlreadyPaired };

struct Code;
struct Accepted;
struct Rejected;

using Result = std::variant<Accepted, Rejected>;

[[nodiscard]] std::string_view StateToString(State state);
[[nodiscard]] std::string_view ErrorToString(Error error);
[[nodiscard]] std::string_view ErrorToDescription(Error error);

// Generates a random code drawn from the code alphabet.
[[nodiscard]] std::string GenerateCode(std::size_t length);

// The payload encoded into the QR code displayed by the hub (e.g. ferry://<hub>/<code>).
[[nodiscard]] std::string CreatePairingUri(Code const& code);

//----------------------------------------------------------------------------------------------------------------------
} // Pairing namespace
//----------------------------------------------------------------------------------------------------------------------

struct Pairing::Code
{
    [[nodiscard]] bool IsExpired(Clock::time_point const& now) const { return now >= created + lifetime; }
    [[nodiscard]] Clock::time_point GetExpiration() const { return created + lifetime; }

    std::string value;
    Device::Identifier issuer;
    Clock::time_point created;
    std::chrono::seconds lifetime;
    bool consumed = false;
};

//----------------------------------------------------------------------------------------------------------------------

struct Pairing::Accepted
{
    Device::Identifier identifier;
};

//----------------------------------------------------------------------------------------------------------------------

struct Pairing::Rejected
{
    Error reason;
};

//----------------------------------------------------------------------------------------------------------------------
