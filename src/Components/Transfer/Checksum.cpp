//----------------------------------------------------------------------------------------------------------------------
// File: Checksum.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Checksum.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/predicate.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <fstream>
#include <iterator>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t ReadBlockSize = 64 * 1024;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Transfer::Checksum::Checksum()
    : m_upDigestContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
    , m_valid(false)
{
    m_valid = Reset();
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Checksum::IsValid() const
{
    return m_valid;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Checksum::Update(std::span<std::uint8_t const> data)
{
    if (!m_valid) { return false; }
    if (data.empty()) { return true; }
    if (EVP_DigestUpdate(m_upDigestContext.get(), data.data(), data.size()) <= 0) { m_valid = false; }
    return m_valid;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Transfer::Checksum::Finalize()
{
    if (!m_valid) { return {}; }
    m_valid = false;

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest = {};
    std::uint32_t length = 0;
    if (EVP_DigestFinal_ex(m_upDigestContext.get(), digest.data(), &length) <= 0) { return {}; }
    if (length != static_cast<std::uint32_t>(EVP_MD_size(EVP_sha256()))) { return {}; }

    std::string encoded;
    encoded.reserve(length * 2);
    boost::algorithm::hex_lower(digest.begin(), digest.begin() + length, std::back_inserter(encoded));
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Checksum::Reset()
{
    if (!m_upDigestContext) { return m_valid = false; }
    m_valid = EVP_DigestInit_ex(m_upDigestContext.get(), EVP_sha256(), nullptr) > 0;
    return m_valid;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Transfer::Checksum::Compute(std::span<std::uint8_t const> data)
{
    Checksum checksum;
    if (!checksum.Update(data)) { return {}; }
    return checksum.Finalize();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Transfer::Checksum::Compute(std::filesystem::path const& filepath)
{
    std::ifstream reader(filepath, std::ios::binary);
    if (!reader.good()) { return {}; }

    Checksum checksum;
    std::vector<std::uint8_t> buffer(local::ReadBlockSize);
    while (reader) {
        reader.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto const read = static_cast<std::size_t>(reader.gcount());
        if (read == 0) { break; }
        if (!checksum.Update({ buffer.data(), read })) { return {}; }
    }

    if (reader.bad()) { return {}; }
    return checksum.Finalize();
}

//----------------------------------------------------------------------------------------------------------------------

bool Transfer::Checksum::IsMatching(std::string_view expected, std::string_view actual)
{
    return !expected.empty() && boost::algorithm::iequals(expected, actual);
}

//----------------------------------------------------------------------------------------------------------------------
