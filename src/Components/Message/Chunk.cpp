//----------------------------------------------------------------------------------------------------------------------
// File: Chunk.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Chunk.hpp"
#include "Utilities/PackUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

std::vector<std::uint8_t> Message::EncodeChunk(Chunk const& chunk)
{
    assert(!chunk.transferId.empty() && chunk.transferId.size() <= std::numeric_limits<std::uint16_t>::max());
    assert(chunk.data.size() <= MaximumChunkDataSize);

    std::vector<std::uint8_t> frame;
    frame.reserve(
        sizeof(std::uint8_t) + sizeof(std::uint16_t) + chunk.transferId.size() + sizeof(std::uint64_t) +
        sizeof(std::uint32_t) + chunk.data.size());

    PackUtils::PackChunk(ChunkVersion, frame);
    PackUtils::PackChunk<std::uint16_t>(std::string_view{ chunk.transferId }, frame);
    PackUtils::PackChunk(chunk.sequence, frame);
    PackUtils::PackChunk<std::uint32_t>(PackUtils::ReadableView{ chunk.data }, frame);

    return frame;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Chunk> Message::DecodeChunk(std::span<std::uint8_t const> frame)
{
    PackUtils::ReadableView view = frame;

    std::uint8_t version = 0;
    if (!PackUtils::UnpackChunk(view, version) || version != ChunkVersion) { return {}; }

    Chunk chunk;
    std::uint16_t identifierSize = 0;
    if (!PackUtils::UnpackChunk(view, identifierSize) || identifierSize == 0) { return {}; }
    if (!PackUtils::UnpackChunk(view, chunk.transferId, identifierSize)) { return {}; }
    if (!PackUtils::UnpackChunk(view, chunk.sequence)) { return {}; }

    std::uint32_t dataSize = 0;
    if (!PackUtils::UnpackChunk(view, dataSize) || dataSize > MaximumChunkDataSize) { return {}; }
    if (!PackUtils::UnpackChunk(view, chunk.data, dataSize)) { return {}; }

    if (!view.empty()) { return {}; } // Trailing bytes indicate a framing error.

    return chunk;
}

//----------------------------------------------------------------------------------------------------------------------
