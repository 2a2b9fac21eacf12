#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkflow {

// Chunk files of one storage account on local disk:
// <root>/<file_id>/<chunk_index>.chunk
class ChunkStore {
public:
    ChunkStore(std::filesystem::path root, std::string account_id, uint64_t capacity_bytes);

    // Verifies the checksum, writes the chunk and returns its storage locator.
    // Throws std::runtime_error on checksum mismatch, quota or I/O failure.
    std::string put(const std::string& file_id, uint32_t chunk_index,
                    const std::string& data, const std::string& checksum);

    // Chunk data for a locator returned by put(), nullopt if unknown
    std::optional<std::string> get(const std::string& locator) const;

    uint64_t used_bytes() const { return used_bytes_; }
    uint64_t free_space() const;
    const std::string& account_id() const { return account_id_; }

private:
    std::filesystem::path chunk_path(const std::string& file_id, uint32_t chunk_index) const;
    uint64_t scan_usage() const;

    std::filesystem::path root_;
    std::string account_id_;
    uint64_t capacity_bytes_;
    uint64_t used_bytes_ = 0;
};

}
