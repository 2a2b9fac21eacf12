#pragma once

#include "chunkflow.pb.h"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

// Durable record of partially uploaded files, keyed by whole-file checksum.
// Each entry is stored as one protobuf file "<checksum>.partial" in the
// ledger directory. An empty directory path keeps the ledger in memory.
class PartialUploadLedger {
public:
    explicit PartialUploadLedger(std::filesystem::path directory = {});

    std::optional<LedgerEntry> find_by_checksum(const std::string& checksum) const;

    // Entry to resume from, or nullopt when none exists. A stored entry with
    // the same checksum but a different total size throws IntegrityError.
    std::optional<LedgerEntry> check_resumable(const std::string& checksum, uint64_t total_size) const;

    // Stores the entry; created_at is kept from an existing entry
    void create_or_update(const LedgerEntry& entry);

    // Inserts one completed index. Safe to call from several threads for the
    // same checksum. Returns false when there is no such entry.
    bool mark_chunk_complete(const std::string& checksum, const ChunkPlacement& placement);

    bool remove(const std::string& checksum);

    // Entries owned by owner_scope, or all entries when it is empty
    std::vector<LedgerEntry> list(const std::string& owner_scope = {}) const;

private:
    void load();
    void persist(const LedgerEntry& entry) const;
    std::filesystem::path entry_path(const std::string& checksum) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
    std::map<std::string, LedgerEntry> entries_;
};

}
