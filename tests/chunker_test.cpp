#include "chunker.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

using namespace chunkflow;

TEST(ChunkerTest, PlansTenMebibytesAsFourFourTwo) {
    const uint64_t MiB = 1024 * 1024;
    auto chunks = Chunker::plan(10 * MiB, DEFAULT_CHUNK_SIZE);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size, 4 * MiB);
    EXPECT_EQ(chunks[1].size, 4 * MiB);
    EXPECT_EQ(chunks[2].size, 2 * MiB);
    EXPECT_EQ(chunks[2].offset, 8 * MiB);
}

TEST(ChunkerTest, RangesAreContiguousAndCoverTheFile) {
    const uint64_t total = 10007;
    auto chunks = Chunker::plan(total, 1000);

    ASSERT_EQ(chunks.size(), 11u);
    uint64_t expected_offset = 0;
    for (uint32_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].offset, expected_offset);
        EXPECT_GT(chunks[i].size, 0u);
        EXPECT_EQ(chunks[i].status, ChunkStatus::PENDING);
        expected_offset += chunks[i].size;
    }
    EXPECT_EQ(expected_offset, total);
}

TEST(ChunkerTest, ExactMultipleHasNoRemainderChunk) {
    EXPECT_EQ(Chunker::chunk_count(4000, 1000), 4u);
    EXPECT_EQ(Chunker::chunk_count(4001, 1000), 5u);
    EXPECT_EQ(Chunker::chunk_count(0, 1000), 0u);
    EXPECT_THROW(Chunker::chunk_count(10, 0), std::invalid_argument);
}

TEST(ChunkerTest, ChunksReassembleToTheInput) {
    std::string data = test::make_payload(5500);
    std::istringstream input(data);
    Chunker chunker(input, data.size(), 1024);

    std::string reassembled;
    uint32_t count = 0;
    while (auto chunk = chunker.next()) {
        EXPECT_EQ(chunk->descriptor.index, count);
        EXPECT_EQ(chunk->descriptor.checksum, util::sha256_hex(chunk->data));
        reassembled.append(chunk->data.begin(), chunk->data.end());
        ++count;
    }
    EXPECT_EQ(count, 6u);
    EXPECT_TRUE(chunker.finished());
    EXPECT_EQ(reassembled, data);
}

TEST(ChunkerTest, FullPassChecksumMatchesFileChecksum) {
    std::string data = test::make_payload(3000, 7);
    std::istringstream input(data);

    std::string expected = Chunker::file_checksum(input, data.size());
    EXPECT_EQ(expected, util::sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size()));

    Chunker chunker(input, data.size(), 512);
    while (chunker.next()) {
    }
    EXPECT_EQ(chunker.checksum(), expected);
}

TEST(ChunkerTest, SkipsCompletedChunks) {
    std::string data = test::make_payload(4096, 3);
    std::istringstream input(data);
    Chunker chunker(input, data.size(), 1024);
    chunker.skip({0, 2});

    std::vector<uint32_t> produced;
    while (auto chunk = chunker.next()) {
        produced.push_back(chunk->descriptor.index);
        EXPECT_EQ(std::string(chunk->data.begin(), chunk->data.end()),
                  data.substr(chunk->descriptor.offset, chunk->descriptor.size));
    }
    EXPECT_EQ(produced, (std::vector<uint32_t>{1, 3}));
    // Skipped ranges still count towards the whole-file checksum
    EXPECT_EQ(chunker.checksum(), util::sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

TEST(ChunkerTest, ChecksumNeedsAFullPass) {
    std::string data = test::make_payload(2048, 3);
    std::istringstream input(data);
    Chunker chunker(input, data.size(), 1024);
    ASSERT_TRUE(chunker.next());
    EXPECT_THROW(chunker.checksum(), std::logic_error);
}

TEST(ChunkerTest, RefusesMoreChunksThanAnIndexCanHold) {
    EXPECT_EQ(Chunker::chunk_count(0xFFFFFFFFull, 1), 0xFFFFFFFFu);
    EXPECT_THROW(Chunker::chunk_count(0x100000000ull, 1), std::invalid_argument);
}

TEST(ChunkerTest, RewindRestartsTheSequence) {
    std::string data = test::make_payload(2048, 5);
    std::istringstream input(data);
    Chunker chunker(input, data.size(), 1000);

    auto first = chunker.next();
    ASSERT_TRUE(first);
    while (chunker.next()) {
    }
    chunker.rewind();
    auto again = chunker.next();
    ASSERT_TRUE(again);
    EXPECT_EQ(again->descriptor.index, 0u);
    EXPECT_EQ(again->data, first->data);
}

TEST(ChunkerTest, ShortInputIsAnInputError) {
    std::string data = test::make_payload(100);
    std::istringstream input(data);

    try {
        Chunker::file_checksum(input, 200);
        FAIL() << "Expected UploadError";
    } catch (const UploadError& e) {
        EXPECT_EQ(e.reason(), FailureReason::INPUT_ERROR);
    }

    Chunker chunker(input, 200, 64);
    chunker.next();
    EXPECT_THROW(chunker.next(), UploadError);
}
