//----------------------------------------------------------------------------------------------------------------------
// File: PackUtils.hpp
// Description: Helpers for packing fixed width integers and sized buffers into network order byte buffers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/endian/conversion.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace PackUtils {
//----------------------------------------------------------------------------------------------------------------------

using Buffer = std::vector<std::uint8_t>;
using ReadableView = std::span<std::uint8_t const>;

//----------------------------------------------------------------------------------------------------------------------

template<std::unsigned_integral Source>
void PackChunk(Source const& source, Buffer& destination)
{
    constexpr std::size_t SourceBytes = sizeof(Source);
    auto const size = destination.size();
    destination.resize(size + SourceBytes, 0x00);
    boost::endian::endian_store<Source, SourceBytes, boost::endian::order::big>(destination.data() + size, source);
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Variable length buffers must be preceeded by their size. The caller supplies the unsigned integral type used
// for the size field and must ensure the source does not exceed the maximum value representable by that type.
//----------------------------------------------------------------------------------------------------------------------
template<std::unsigned_integral SizeField>
void PackChunk(ReadableView source, Buffer& destination)
{
    assert(std::cmp_less_equal(source.size(), std::numeric_limits<SizeField>::max()));
    PackChunk(static_cast<SizeField>(source.size()), destination);
    destination.insert(destination.end(), source.begin(), source.end());
}

//----------------------------------------------------------------------------------------------------------------------

template<std::unsigned_integral SizeField>
void PackChunk(std::string_view source, Buffer& destination)
{
    auto const begin = reinterpret_cast<std::uint8_t const*>(source.data());
    PackChunk<SizeField>(ReadableView{ begin, source.size() }, destination);
}

//----------------------------------------------------------------------------------------------------------------------

template<std::unsigned_integral Destination>
[[nodiscard]] bool UnpackChunk(ReadableView& source, Destination& destination)
{
    constexpr std::size_t DestinationBytes = sizeof(Destination);

    // If the buffer does not contain enough data to unpack the chunk unpacking cannot occur.
    if (source.size() < DestinationBytes) { return false; }

    destination = boost::endian::endian_load<Destination, DestinationBytes, boost::endian::order::big>(source.data());
    source = source.subspan(DestinationBytes);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Destination>
    requires std::is_same_v<Destination, Buffer> || std::is_same_v<Destination, std::string>
[[nodiscard]] bool UnpackChunk(ReadableView& source, Destination& destination, std::size_t count)
{
    if (source.size() < count) { return false; }
    destination.assign(source.begin(), source.begin() + count);
    source = source.subspan(count);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
} // PackUtils namespace
//----------------------------------------------------------------------------------------------------------------------
