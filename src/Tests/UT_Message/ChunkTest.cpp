//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/Chunk.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Message::Chunk GenerateChunk(std::size_t size)
{
    Message::Chunk chunk{ .transferId = "transfer-1", .sequence = 3, .data = {} };
    chunk.data.reserve(size);
    for (std::size_t idx = 0; idx < size; ++idx) { chunk.data.emplace_back(static_cast<std::uint8_t>(idx % 251)); }
    return chunk;
}

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(ChunkSuite, FrameLayoutTest)
{
    Message::Chunk const chunk{ .transferId = "ab", .sequence = 258, .data = { 0xDE, 0xAD } };
    auto const frame = Message::EncodeChunk(chunk);

    std::vector<std::uint8_t> const expected = {
        Message::ChunkVersion,
        0x00, 0x02, 'a', 'b',
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02,
        0x00, 0x00, 0x00, 0x02, 0xDE, 0xAD,
    };
    EXPECT_EQ(frame, expected);

    auto const optDecoded = Message::DecodeChunk(frame);
    ASSERT_TRUE(optDecoded);
    EXPECT_EQ(*optDecoded, chunk);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChunkSuite, LargeChunkTest)
{
    auto const chunk = local::GenerateChunk(Message::MaximumChunkDataSize);
    auto const optDecoded = Message::DecodeChunk(Message::EncodeChunk(chunk));
    ASSERT_TRUE(optDecoded);
    EXPECT_EQ(optDecoded->data.size(), Message::MaximumChunkDataSize);
    EXPECT_EQ(*optDecoded, chunk);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChunkSuite, EmptyDataTest)
{
    auto const chunk = local::GenerateChunk(0);
    auto const optDecoded = Message::DecodeChunk(Message::EncodeChunk(chunk));
    ASSERT_TRUE(optDecoded);
    EXPECT_TRUE(optDecoded->data.empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChunkSuite, MalformedFrameTest)
{
    auto const frame = Message::EncodeChunk(local::GenerateChunk(64));

    // Every truncation of a valid frame must be rejected.
    for (std::size_t size = 0; size < frame.size(); ++size) {
        EXPECT_FALSE(Message::DecodeChunk({ frame.data(), size })) << "size " << size;
    }

    auto trailing = frame;
    trailing.emplace_back(0x00);
    EXPECT_FALSE(Message::DecodeChunk(trailing));

    auto versioned = frame;
    versioned.front() = Message::ChunkVersion + 1;
    EXPECT_FALSE(Message::DecodeChunk(versioned));

    std::vector<std::uint8_t> const anonymous = { Message::ChunkVersion, 0x00, 0x00 };
    EXPECT_FALSE(Message::DecodeChunk(anonymous));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChunkSuite, OversizedDataTest)
{
    std::vector<std::uint8_t> const frame = {
        Message::ChunkVersion,
        0x00, 0x01, 't',
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x10, 0x00, 0x01, // One byte over the maximum data size.
    };
    EXPECT_FALSE(Message::DecodeChunk(frame));
}

//----------------------------------------------------------------------------------------------------------------------
