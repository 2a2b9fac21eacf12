#pragma once

#include "upload_types.hpp"
#include "chunkflow/digest.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkflow {

struct Chunk {
    ChunkDescriptor descriptor;
    std::vector<uint8_t> data;
};

// Splits a stream into fixed-size chunks. The sequence is lazy (one chunk is
// read per next() call), finite and restartable through rewind().
class Chunker {
public:
    Chunker(std::istream& input, uint64_t total_size, uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Throws std::invalid_argument for a zero chunk size or more than 2^32 - 1 chunks
    static uint32_t chunk_count(uint64_t total_size, uint64_t chunk_size);

    // Byte ranges of every chunk, without reading any data
    static std::vector<ChunkDescriptor> plan(uint64_t total_size, uint64_t chunk_size);

    // Hashes the whole stream and rewinds it. Throws UploadError(INPUT_ERROR)
    // when the stream cannot be read or holds a different number of bytes.
    static std::string file_checksum(std::istream& input, uint64_t expected_size);

    // Chunks in this set are hashed but not produced
    void skip(const std::set<uint32_t>& completed);

    // Next chunk that is not skipped, or nullopt once the stream is exhausted.
    // Read failures throw UploadError(INPUT_ERROR).
    std::optional<Chunk> next();

    void rewind();

    bool finished() const { return next_index_ >= total_chunks_; }
    uint32_t total_chunks() const { return total_chunks_; }

    // Whole-file checksum accumulated by next(), skipped chunks included;
    // only available once the sequence is exhausted
    std::string checksum();

private:
    void seek(uint64_t offset);
    void hash_range(uint64_t offset, uint64_t size);

    std::istream& input_;
    uint64_t total_size_;
    uint64_t chunk_size_;
    uint32_t total_chunks_;
    uint32_t next_index_ = 0;
    std::set<uint32_t> skipped_;
    std::optional<util::Sha256> file_hash_;
};

}
