#include "chunker.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace chunkflow {

namespace {

// Read buffer for the whole-file pass
const size_t HASH_BUFFER_SIZE = 256 * 1024;

}

Chunker::Chunker(std::istream& input, uint64_t total_size, uint64_t chunk_size)
    : input_(input),
      total_size_(total_size),
      chunk_size_(chunk_size),
      total_chunks_(chunk_count(total_size, chunk_size)) {
    file_hash_.emplace();
}

uint32_t Chunker::chunk_count(uint64_t total_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    uint64_t count = (total_size + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("File of " + std::to_string(total_size) + " bytes needs more than " +
                                    std::to_string(std::numeric_limits<uint32_t>::max()) + " chunks");
    }
    return static_cast<uint32_t>(count);
}

std::vector<ChunkDescriptor> Chunker::plan(uint64_t total_size, uint64_t chunk_size) {
    uint32_t count = chunk_count(total_size, chunk_size);
    std::vector<ChunkDescriptor> chunks;
    chunks.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ChunkDescriptor chunk;
        chunk.index = i;
        chunk.offset = static_cast<uint64_t>(i) * chunk_size;
        chunk.size = std::min(chunk_size, total_size - chunk.offset);
        chunks.push_back(chunk);
    }
    return chunks;
}

std::string Chunker::file_checksum(std::istream& input, uint64_t expected_size) {
    input.clear();
    input.seekg(0, std::ios::beg);
    if (!input) {
        throw UploadError(FailureReason::INPUT_ERROR, "Input stream is not readable");
    }

    util::Sha256 sha;
    std::vector<char> buffer(HASH_BUFFER_SIZE);
    uint64_t total = 0;
    while (input) {
        input.read(buffer.data(), buffer.size());
        std::streamsize count = input.gcount();
        if (count > 0) {
            sha.update(buffer.data(), static_cast<size_t>(count));
            total += static_cast<uint64_t>(count);
        }
    }
    if (input.bad()) {
        throw UploadError(FailureReason::INPUT_ERROR, "Read error while hashing input");
    }
    if (total != expected_size) {
        throw UploadError(FailureReason::INPUT_ERROR,
                          "Input holds " + std::to_string(total) + " bytes, declared " +
                          std::to_string(expected_size));
    }

    input.clear();
    input.seekg(0, std::ios::beg);
    return sha.hex_digest();
}

void Chunker::skip(const std::set<uint32_t>& completed) {
    for (uint32_t index : completed) {
        if (index < total_chunks_) {
            skipped_.insert(index);
        }
    }
}

std::optional<Chunk> Chunker::next() {
    while (next_index_ < total_chunks_ && skipped_.count(next_index_)) {
        // Still hashed so the whole-file checksum covers every byte
        uint64_t offset = static_cast<uint64_t>(next_index_) * chunk_size_;
        hash_range(offset, std::min(chunk_size_, total_size_ - offset));
        ++next_index_;
    }
    if (next_index_ >= total_chunks_) {
        return std::nullopt;
    }

    Chunk chunk;
    chunk.descriptor.index = next_index_;
    chunk.descriptor.offset = static_cast<uint64_t>(next_index_) * chunk_size_;
    chunk.descriptor.size = std::min(chunk_size_, total_size_ - chunk.descriptor.offset);

    seek(chunk.descriptor.offset);
    chunk.data.resize(chunk.descriptor.size);
    input_.read(reinterpret_cast<char*>(chunk.data.data()), chunk.descriptor.size);
    if (static_cast<uint64_t>(input_.gcount()) != chunk.descriptor.size) {
        throw UploadError(FailureReason::INPUT_ERROR,
                          "Short read on chunk " + std::to_string(next_index_));
    }

    chunk.descriptor.checksum = util::sha256_hex(chunk.data);
    file_hash_->update(chunk.data.data(), chunk.data.size());
    ++next_index_;
    return chunk;
}

void Chunker::rewind() {
    next_index_ = 0;
    file_hash_.emplace();
    seek(0);
}

std::string Chunker::checksum() {
    if (!finished()) {
        throw std::logic_error("Whole-file checksum requires a full pass");
    }
    return file_hash_->hex_digest();
}

void Chunker::hash_range(uint64_t offset, uint64_t size) {
    seek(offset);
    std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(size, HASH_BUFFER_SIZE)));
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        input_.read(buffer.data(), want);
        if (static_cast<size_t>(input_.gcount()) != want) {
            throw UploadError(FailureReason::INPUT_ERROR,
                              "Short read on skipped chunk " + std::to_string(next_index_));
        }
        file_hash_->update(buffer.data(), want);
        remaining -= want;
    }
}

void Chunker::seek(uint64_t offset) {
    input_.clear();
    input_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!input_) {
        throw UploadError(FailureReason::INPUT_ERROR, "Seek failed at offset " + std::to_string(offset));
    }
}

}
