//----------------------------------------------------------------------------------------------------------------------
// File: Checksum.hpp
// Description: An incremental SHA-256 digest over a transfer's payload, rendered as lowercase hex.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Transfer {
//----------------------------------------------------------------------------------------------------------------------

class Checksum;

//----------------------------------------------------------------------------------------------------------------------
} // Transfer namespace
//----------------------------------------------------------------------------------------------------------------------

class Transfer::Checksum
{
public:
    Checksum();

    Checksum(Checksum const&) = delete;
    Checksum(Checksum&&) = default;
    Checksum& operator=(Checksum const&) = delete;
    Checksum& operator=(Checksum&&) = default;

    [[nodiscard]] bool IsValid() const;
    [[nodiscard]] bool Update(std::span<std::uint8_t const> data);

    // Completes the digest. The checksum must be reset before it can be updated again.
    [[nodiscard]] std::optional<std::string> Finalize();
    [[nodiscard]] bool Reset();

    [[nodiscard]] static std::optional<std::string> Compute(std::span<std::uint8_t const> data);
    [[nodiscard]] static std::optional<std::string> Compute(std::filesystem::path const& filepath);

    // Compares hex digests without regard to case.
    [[nodiscard]] static bool IsMatching(std::string_view expected, std::string_view actual);

private:
    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    DigestContext m_upDigestContext;
    bool m_valid;
};

//----------------------------------------------------------------------------------------------------------------------
