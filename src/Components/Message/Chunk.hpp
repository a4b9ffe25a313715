//----------------------------------------------------------------------------------------------------------------------
// File: Chunk.hpp
// Description: The binary frame carrying one bounded unit of a transfer's payload.
// Layout (network order): version (u8) | identifier size (u16) | identifier | sequence (u64) | data size (u32) | data
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Transfer/Status.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

struct Chunk;

constexpr std::uint8_t ChunkVersion = 1;
constexpr std::size_t MaximumChunkDataSize = 1024 * 1024;

[[nodiscard]] std::vector<std::uint8_t> EncodeChunk(Chunk const& chunk);
[[nodiscard]] std::optional<Chunk> DecodeChunk(std::span<std::uint8_t const> frame);

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------

struct Message::Chunk
{
    [[nodiscard]] bool operator==(Chunk const& other) const = default;

    Transfer::Identifier transferId;
    std::uint64_t sequence;
    std::vector<std::uint8_t> data;
};

//----------------------------------------------------------------------------------------------------------------------
