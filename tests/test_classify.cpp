#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "crypto/digest.hpp"
#include "proto/classify.hpp"

using namespace proto;

TEST(Classify, StartOnlyWhenIdle)
{
    EXPECT_EQ(classify(Chunk{0x02}, false), Kind::Start);
    EXPECT_EQ(classify(Chunk{0x02, 0x41, 0x42}, false), Kind::Start);
    // same chunk while receiving is ordinary payload
    EXPECT_EQ(classify(Chunk{0x02}, true), Kind::Payload);
    EXPECT_EQ(classify(Chunk{0x02, 0x41}, true), Kind::Payload);
}

TEST(Classify, EndOnlyWhenReceiving)
{
    EXPECT_EQ(classify(Chunk{0x03}, true), Kind::End);
    EXPECT_EQ(classify(Chunk{0x41, 0x42, 0x03}, true), Kind::End);
    EXPECT_EQ(classify(Chunk{0x03}, false), Kind::Payload);
    EXPECT_EQ(classify(Chunk{0x41, 0x03}, false), Kind::Payload);
}

TEST(Classify, MarkerPositionMatters)
{
    // start marker must be first, end marker must be last
    EXPECT_EQ(classify(Chunk{0x41, 0x02}, false), Kind::Payload);
    EXPECT_EQ(classify(Chunk{0x03, 0x41}, true), Kind::Payload);
    // idle chunk that both starts with 0x02 and ends with 0x03 is a start
    EXPECT_EQ(classify(Chunk{0x02, 0x03}, false), Kind::Start);
    // receiving chunk that both starts with 0x02 and ends with 0x03 is an end
    EXPECT_EQ(classify(Chunk{0x02, 0x03}, true), Kind::End);
}

TEST(Classify, EmptyChunkIsPayload)
{
    EXPECT_EQ(classify(Chunk{}, false), Kind::Payload);
    EXPECT_EQ(classify(Chunk{}, true), Kind::Payload);
}

TEST(Classify, EveryFirstByteWhileIdle)
{
    for (int b = 0; b < 256; ++b)
    {
        Chunk c{static_cast<std::uint8_t>(b), 0x10};
        EXPECT_EQ(classify(c, false) == Kind::Start, b == 0x02) << "byte " << b;
        EXPECT_NE(classify(c, false), Kind::End);
    }
}

TEST(Classify, EveryLastByteWhileReceiving)
{
    for (int b = 0; b < 256; ++b)
    {
        Chunk c{0x10, static_cast<std::uint8_t>(b)};
        EXPECT_EQ(classify(c, true) == Kind::End, b == 0x03) << "byte " << b;
        EXPECT_NE(classify(c, true), Kind::Start);
    }
}

TEST(MakeTransfer, FramesBodyAndTrailer)
{
    const std::string         body_s = "hello, file";
    std::vector<std::uint8_t> body(body_s.begin(), body_s.end());

    auto chunks = make_transfer(body, 4);
    ASSERT_GE(chunks.size(), 3u);
    EXPECT_EQ(chunks.front(), Chunk{START_MARKER});
    EXPECT_EQ(chunks.back(), Chunk{END_MARKER});

    std::vector<std::uint8_t> middle;
    for (std::size_t i = 1; i + 1 < chunks.size(); ++i)
    {
        EXPECT_LE(chunks[i].size(), 4u);
        middle.insert(middle.end(), chunks[i].begin(), chunks[i].end());
    }
    const std::string tag = integrity::sha256_hex(body.data(), body.size());
    EXPECT_EQ(std::string(middle.begin(), middle.end()), body_s + tag);
    // 11 body bytes -> 3 chunks, 64 tag bytes -> 16 chunks
    EXPECT_EQ(chunks.size(), 2u + 3u + 16u);
}

TEST(MakeTransfer, EmptyBodyStillCarriesTrailer)
{
    auto chunks = make_transfer({}, 512);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[1].size(), integrity::TAG_HEX_LEN);
}

TEST(MakeTransfer, ZeroMtuRejected)
{
    EXPECT_TRUE(make_transfer({0x41}, 0).empty());
}
