//----------------------------------------------------------------------------------------------------------------------
// File: Code.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Code.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view UriScheme = "ferry://";

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string_view Pairing::StateToString(State state)
{
    switch (state) {
        case State::NoCode: return "no_code";
        case State::CodeIssued: return "code_issued";
        case State::Consumed: return "consumed";
        case State::Expired: return "expired";
        default: assert(false); return "";
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Pairing::ErrorToString(Error error)
{
    switch (error) {
        case Error::CodeInvalid: return "CODE_INVALID";
        case Error::CodeExpired: return "CODE_EXPIRED";
        case Error::CodeAlreadyUsed: return "CODE_ALREADY_USED";
        case Error::AlreadyPaired: return "ALREADY_PAIRED";
        default: assert(false); return "";
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Pairing::ErrorToDescription(Error error)
{
    switch (error) {
        case Error::CodeInvalid: return "The pairing code is not valid.";
        case Error::CodeExpired: return "The pairing code has expired. Request a new code from the hub.";
        case Error::CodeAlreadyUsed: return "The pairing code has already been used. Request a new code from the hub.";
        case Error::AlreadyPaired: return "The connection has already been paired.";
        default: assert(false); return "";
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string Pairing::GenerateCode(std::size_t length)
{
    assert(length >= MinimumCodeLength && length <= MaximumCodeLength);
    static_assert(CodeAlphabet.size() == 32); // Each random byte is masked into the alphabet without a modulo bias.

    std::array<std::uint8_t, MaximumCodeLength> buffer = {};
    if (RAND_bytes(buffer.data(), static_cast<std::int32_t>(length)) != 1) { return {}; }

    std::string code;
    code.reserve(length);
    for (std::size_t idx = 0; idx < length; ++idx) { code.push_back(CodeAlphabet[buffer[idx] & 0x1F]); }
    return code;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Pairing::CreatePairingUri(Code const& code)
{
    std::ostringstream oss;
    oss << local::UriScheme << code.issuer << "/" << code.value;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
