// tests/test_frame.cpp
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "proto/chunker.hpp"
#include "proto/frame.hpp"

using namespace frame;
using chunk::ChunkError;
using chunk::Chunker;
using chunk::HEADER_SIZE;
using chunk::META_SIZE;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 7) & 0xFF);
    return v;
}

TEST(Frame, FirstFrameCarriesHeader)
{
    auto bytes = gen_bytes(1000);
    auto c     = Chunker::create(250, 0x10, bytes);
    ASSERT_TRUE(c.has_value());

    auto v = c->chunk(0);
    ASSERT_TRUE(v.has_value());
    Frame f = make_frame(*c, *v);
    ASSERT_EQ(f.size(), 250u);

    HeaderInfo h;
    ASSERT_EQ(parse_header(f, h), ChunkError::None);
    EXPECT_EQ(h.topic, 0x10);
    EXPECT_EQ(h.total, 1000u);
    EXPECT_TRUE(std::equal(f.begin() + HEADER_SIZE, f.end(), bytes.begin()));
}

TEST(Frame, LaterFramesCarryRemainingLength)
{
    auto bytes = gen_bytes(1000);
    auto c     = Chunker::create(250, 0x10, bytes);
    ASSERT_TRUE(c.has_value());

    auto frames = make_frames(*c);
    ASSERT_EQ(frames.size(), 5u);
    for (std::size_t i = 0; i + 1 < frames.size(); ++i)
        EXPECT_EQ(frames[i].size(), 250u) << "frame " << i;
    EXPECT_EQ(frames[4].size(), META_SIZE + 33u);

    std::uint64_t remaining = 0;
    ASSERT_EQ(Chunker::meta(frames[1].data(), frames[1].size(), remaining), ChunkError::None);
    EXPECT_EQ(remaining, 1000u - 241u);
    ASSERT_EQ(Chunker::meta(frames[4].data(), frames[4].size(), remaining), ChunkError::None);
    EXPECT_EQ(remaining, 33u);

    // make_frames works off random access, the cursor is untouched
    EXPECT_EQ(c->cursor(), 0u);
}

TEST(Frame, ParseHeader_RejectShort)
{
    Frame      f(HEADER_SIZE - 1, 0);
    HeaderInfo h;
    testing::internal::CaptureStderr();
    EXPECT_EQ(parse_header(f, h), ChunkError::InvalidMetaSize);
    (void)testing::internal::GetCapturedStderr();
}

TEST(Frame, Reassembler_InOrder)
{
    auto bytes = gen_bytes(777);
    auto c     = Chunker::create(64, 3, bytes);
    ASSERT_TRUE(c.has_value());
    auto frames = make_frames(*c);

    Reassembler r(64);
    for (std::size_t i = 0; i < frames.size(); ++i)
    {
        EXPECT_FALSE(r.complete());
        ASSERT_EQ(r.feed(i, frames[i]), ChunkError::None) << "frame " << i;
    }
    ASSERT_TRUE(r.complete());
    ASSERT_TRUE(r.topic().has_value());
    EXPECT_EQ(*r.topic(), 3);
    auto out = r.take();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, bytes);

    // reset after take
    EXPECT_FALSE(r.complete());
    EXPECT_FALSE(r.total().has_value());
}

TEST(Frame, Reassembler_OutOfOrder_WithDup)
{
    auto bytes = gen_bytes(600);
    auto c     = Chunker::create(250, 0x20, bytes);
    ASSERT_TRUE(c.has_value());
    auto frames = make_frames(*c);
    ASSERT_EQ(frames.size(), 3u);

    Reassembler r(250);
    // seq2 first: total is learned from the size prefix
    ASSERT_EQ(r.feed(2, frames[2]), ChunkError::None);
    ASSERT_TRUE(r.total().has_value());
    EXPECT_EQ(*r.total(), 600u);
    EXPECT_EQ(r.expected(), 3u);
    EXPECT_FALSE(r.take().has_value());

    // duplicate
    ASSERT_EQ(r.feed(2, frames[2]), ChunkError::None);
    EXPECT_EQ(r.received(), 1u);

    ASSERT_EQ(r.feed(0, frames[0]), ChunkError::None);
    EXPECT_FALSE(r.complete());
    EXPECT_EQ(r.missing(), std::vector<std::size_t>{1});

    ASSERT_EQ(r.feed(1, frames[1]), ChunkError::None);
    ASSERT_TRUE(r.complete());
    auto out = r.take();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, bytes);
}

TEST(Frame, Reassembler_EmptyPayload)
{
    std::vector<std::uint8_t> empty;
    auto                      c = Chunker::create(32, 1, empty);
    ASSERT_TRUE(c.has_value());
    auto frames = make_frames(*c);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].size(), HEADER_SIZE);

    Reassembler r(32);
    ASSERT_EQ(r.feed(0, frames[0]), ChunkError::None);
    ASSERT_TRUE(r.complete());
    auto out = r.take();
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->empty());
}

TEST(Frame, Reassembler_RejectsInconsistentFrames)
{
    auto bytes = gen_bytes(600);
    auto c     = Chunker::create(250, 0, bytes);
    ASSERT_TRUE(c.has_value());
    auto frames = make_frames(*c);

    testing::internal::CaptureStderr();
    {
        Reassembler r(250);
        ASSERT_EQ(r.feed(0, frames[0]), ChunkError::None);
        // frame 1 presented as frame 2: declared remaining no longer matches
        EXPECT_EQ(r.feed(2, frames[1]), ChunkError::ProtocolViolation);
        // data length cut short
        Frame cut = frames[1];
        cut.pop_back();
        EXPECT_EQ(r.feed(1, cut), ChunkError::ProtocolViolation);
        // index beyond the chunk count
        Frame beyond(META_SIZE, 0);
        chunk::put_u64_le(0, beyond.data());
        EXPECT_NE(r.feed(7, beyond), ChunkError::None);
    }
    {
        Reassembler r(250);
        Frame       tiny(META_SIZE - 1, 0);
        EXPECT_EQ(r.feed(1, tiny), ChunkError::InvalidMetaSize);
        Frame big(251, 0);
        EXPECT_EQ(r.feed(1, big), ChunkError::InvalidConfig);
    }
    {
        Reassembler r(HEADER_SIZE);  // no room for data
        EXPECT_EQ(r.feed(0, frames[0]), ChunkError::InvalidConfig);
    }
    {
        Reassembler r(250, /*max_payload=*/100);
        EXPECT_EQ(r.feed(0, frames[0]), ChunkError::ProtocolViolation);
    }
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[ERROR]"), std::string::npos);
}

TEST(Frame, Reassembler_RejectedFirstFrameDoesNotPin)
{
    auto bytes = gen_bytes(600);
    auto c     = Chunker::create(250, 0x42, bytes);
    ASSERT_TRUE(c.has_value());
    auto frames = make_frames(*c);
    ASSERT_EQ(frames.size(), 3u);

    Reassembler r(250);
    testing::internal::CaptureStderr();
    // stray frame: remaining 0 at index 9 claims a 2177 byte payload of 9 chunks
    Frame stray(META_SIZE, 0);
    chunk::put_u64_le(0, stray.data());
    EXPECT_EQ(r.feed(9, stray), ChunkError::ProtocolViolation);
    EXPECT_FALSE(r.total().has_value());
    EXPECT_EQ(r.expected(), 0u);

    // header frame with its data cut short
    Frame cut = frames[0];
    cut.pop_back();
    EXPECT_EQ(r.feed(0, cut), ChunkError::ProtocolViolation);
    EXPECT_FALSE(r.total().has_value());
    testing::internal::GetCapturedStderr();

    EXPECT_EQ(r.feed(2, frames[2]), ChunkError::None);
    EXPECT_EQ(r.feed(0, frames[0]), ChunkError::None);
    EXPECT_EQ(r.feed(1, frames[1]), ChunkError::None);
    ASSERT_TRUE(r.complete());
    EXPECT_EQ(r.topic(), 0x42);
    auto out = r.take();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, bytes);
}
