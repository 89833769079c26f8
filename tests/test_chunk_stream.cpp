//
// Created by cv2 on 21.01.2026.
//

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <vector>

#include "chunk_stream.hpp"
#include "crypto.hpp"

using namespace comb;

namespace {

std::vector<uint8_t> pattern(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) data[i] = static_cast<uint8_t>(i % 251);
    return data;
}

std::vector<uint8_t> slice(const std::vector<uint8_t>& data, size_t offset, size_t length) {
    return {data.begin() + offset, data.begin() + offset + length};
}

// Counts how many streams were handed out
class CountingSource : public ByteSource {
public:
    explicit CountingSource(std::vector<uint8_t> data) : inner_("counting", std::move(data)) {}

    std::unique_ptr<ByteStream> open() override {
        ++opens;
        return inner_.open();
    }
    std::string name() const override { return "counting"; }

    std::atomic<int> opens{0};

private:
    MemorySource inner_;
};

class UnavailableSource : public ByteSource {
public:
    std::unique_ptr<ByteStream> open() override { return nullptr; }
    std::string name() const override { return "missing"; }
};

} // namespace

TEST(PlanChunks, SplitsWithShortTail) {
    auto chunks = plan_chunks(10, 4);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].offset, 0u);
    EXPECT_EQ(chunks[1].offset, 4u);
    EXPECT_EQ(chunks[2].offset, 8u);
    EXPECT_EQ(chunks[2].length, 2u);
}

TEST(PlanChunks, EmptyFileHasNoChunks) {
    EXPECT_TRUE(plan_chunks(0).empty());
    EXPECT_EQ(plan_chunks(FILE_CHUNK_SIZE).size(), 1u);
    EXPECT_EQ(plan_chunks(FILE_CHUNK_SIZE + 1).size(), 2u);
}

TEST(ChunkFileName, SingleChunkKeepsName) {
    EXPECT_EQ(chunk_file_name("video.mp4", 0, 1), "video.mp4");
    EXPECT_EQ(chunk_file_name("video.mp4", 2, 5), "video.mp4.chunk_2_of_5");
}

class ChunkStreamCodecTest : public ::testing::TestWithParam<size_t> {};

TEST_P(ChunkStreamCodecTest, CopiesExactRange) {
    auto data = pattern(100'000);
    MemorySource source("data", data);
    ChunkStreamCodec codec(source, Chunk{1000, 50'000}, GetParam());

    VectorSink sink;
    auto written = codec.write_chunk(sink);
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, 50'000u);
    EXPECT_EQ(sink.bytes(), slice(data, 1000, 50'000));
    EXPECT_EQ(sink.flush_count(), 1u);
}

TEST_P(ChunkStreamCodecTest, DigestIsTruncatedSha256OfRange) {
    auto data = pattern(100'000);
    MemorySource source("data", data);
    ChunkStreamCodec codec(source, Chunk{1000, 50'000}, GetParam());

    auto expected = crypto::sha256_hex(slice(data, 1000, 50'000), DIGEST_HEX_LENGTH);
    ASSERT_TRUE(expected);

    auto digest = codec.compute_digest();
    ASSERT_TRUE(digest);
    EXPECT_EQ(digest->size(), DIGEST_HEX_LENGTH);
    EXPECT_EQ(*digest, *expected);
}

INSTANTIATE_TEST_SUITE_P(BufferSizes, ChunkStreamCodecTest, ::testing::Values(7, STREAM_BUFFER_SIZE, 1 << 20));

TEST(ChunkStreamCodec, DigestIsComputedOnce) {
    CountingSource source(pattern(4096));
    ChunkStreamCodec codec(source, Chunk{0, 4096});

    auto first = codec.compute_digest();
    auto second = codec.compute_digest();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(source.opens.load(), 1);

    codec.reset_digest_cache();
    ASSERT_TRUE(codec.compute_digest());
    EXPECT_EQ(source.opens.load(), 2);
}

TEST(ChunkStreamCodec, WriteAndDigestUseSeparateStreams) {
    CountingSource source(pattern(4096));
    ChunkStreamCodec codec(source, Chunk{100, 200});

    ASSERT_TRUE(codec.compute_digest());
    VectorSink sink;
    ASSERT_TRUE(codec.write_chunk(sink));
    EXPECT_EQ(source.opens.load(), 2);
    EXPECT_EQ(sink.bytes().size(), 200u);
}

TEST(ChunkStreamCodec, ShortSourceReportsShortCount) {
    MemorySource source("short", pattern(1500));
    ChunkStreamCodec codec(source, Chunk{1000, 50'000});

    VectorSink sink;
    auto written = codec.write_chunk(sink);
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, 500u);
    EXPECT_LT(*written, codec.content_length());
}

TEST(ChunkStreamCodec, OffsetPastEndIsAnError) {
    MemorySource source("tiny", pattern(500));
    ChunkStreamCodec codec(source, Chunk{1000, 10});

    VectorSink sink;
    auto written = codec.write_chunk(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error(), StreamError::OffsetBeyondEnd);

    auto digest = codec.compute_digest();
    ASSERT_FALSE(digest);
    EXPECT_EQ(digest.error(), StreamError::OffsetBeyondEnd);
}

TEST(ChunkStreamCodec, UnopenableSource) {
    UnavailableSource source;
    ChunkStreamCodec codec(source, Chunk{0, 10});

    VectorSink sink;
    auto written = codec.write_chunk(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error(), StreamError::StreamUnavailable);
    EXPECT_EQ(codec.compute_digest().error(), StreamError::StreamUnavailable);
}

TEST(ChunkStreamCodec, StoppedBeforeCopy) {
    MemorySource source("data", pattern(1000));
    ChunkStreamCodec codec(source, Chunk{0, 1000});

    std::stop_source stop;
    stop.request_stop();
    VectorSink sink;
    auto written = codec.write_chunk(sink, stop.get_token());
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error(), StreamError::Cancelled);
    EXPECT_TRUE(sink.bytes().empty());
}

TEST(ChunkStreamCodec, DefaultMediaType) {
    MemorySource source("data", pattern(10));
    ChunkStreamCodec codec(source, Chunk{0, 10});
    EXPECT_EQ(codec.media_type(), "application/octet-stream");
}
