#pragma once

#include "chunkflow.pb.h"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

// Quota applied to accounts registered without a max size (1.8 GB)
const uint64_t DEFAULT_ACCOUNT_MAX_BYTES = 1932735283;

// Advisory per-account usage. Bytes are reserved before a chunk is
// dispatched and then committed or released once the outcome is known.
// Accounts that were never registered are not metered.
class CapacityAccountant {
public:
    // Records are loaded from and written to snapshot_path when it is set
    explicit CapacityAccountant(std::filesystem::path snapshot_path = {});

    // Registers or updates an account. The stored used size is kept unless
    // the record carries a larger one.
    void upsert(const UsageRecord& record);

    // Pessimistic check of current + reserved + bytes <= max
    bool reserve(const std::string& account_id, uint64_t bytes);
    void commit(const std::string& account_id, uint64_t bytes);
    void release(const std::string& account_id, uint64_t bytes);

    std::optional<UsageRecord> record(const std::string& account_id) const;
    std::vector<UsageRecord> records() const;
    uint64_t reserved(const std::string& account_id) const;

private:
    struct Account {
        UsageRecord record;
        uint64_t reserved = 0;
    };

    void load();
    void persist_locked() const;

    std::filesystem::path snapshot_path_;
    mutable std::mutex mutex_;
    std::map<std::string, Account> accounts_;
};

}
