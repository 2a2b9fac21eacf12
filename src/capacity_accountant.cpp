#include "capacity_accountant.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>

namespace chunkflow {

namespace {

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}

CapacityAccountant::CapacityAccountant(std::filesystem::path snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {
    if (!snapshot_path_.empty()) {
        load();
    }
}

void CapacityAccountant::load() {
    if (!std::filesystem::exists(snapshot_path_)) {
        return;
    }
    std::ifstream file(snapshot_path_, std::ios::binary);
    UsageSnapshot snapshot;
    if (!snapshot.ParseFromIstream(&file)) {
        throw std::runtime_error("Failed to parse usage snapshot " + snapshot_path_.string());
    }
    for (const auto& record : snapshot.records()) {
        accounts_[record.id()].record = record;
    }
    std::cout << "[Accountant] Loaded " << accounts_.size() << " usage record(s)" << std::endl;
}

void CapacityAccountant::persist_locked() const {
    if (snapshot_path_.empty()) {
        return;
    }
    UsageSnapshot snapshot;
    for (const auto& [id, account] : accounts_) {
        *snapshot.add_records() = account.record;
    }
    if (snapshot_path_.has_parent_path()) {
        std::filesystem::create_directories(snapshot_path_.parent_path());
    }
    std::filesystem::path temp = snapshot_path_;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!snapshot.SerializeToOstream(&file)) {
            throw std::runtime_error("Failed to write usage snapshot " + temp.string());
        }
    }
    std::filesystem::rename(temp, snapshot_path_);
}

void CapacityAccountant::upsert(const UsageRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Account& account = accounts_[record.id()];
    uint64_t used = std::max(account.record.current_size(), record.current_size());
    account.record = record;
    account.record.set_current_size(used);
    if (account.record.max_size() == 0) {
        account.record.set_max_size(DEFAULT_ACCOUNT_MAX_BYTES);
    }
    account.record.set_last_updated(now_seconds());
    persist_locked();
}

bool CapacityAccountant::reserve(const std::string& account_id, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account_id);
    if (it == accounts_.end()) {
        return true;
    }
    Account& account = it->second;
    if (!account.record.active()) {
        return false;
    }
    uint64_t projected = account.record.current_size() + account.reserved + bytes;
    if (projected > account.record.max_size()) {
        std::cout << "[Accountant] Rejecting " << bytes << " bytes on account " << account_id
                  << " (" << account.record.current_size() << " used, " << account.reserved
                  << " reserved, " << account.record.max_size() << " max)" << std::endl;
        return false;
    }
    account.reserved += bytes;
    return true;
}

void CapacityAccountant::commit(const std::string& account_id, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account_id);
    if (it == accounts_.end()) {
        return;
    }
    Account& account = it->second;
    account.reserved -= std::min(account.reserved, bytes);
    account.record.set_current_size(account.record.current_size() + bytes);
    account.record.set_last_updated(now_seconds());
    persist_locked();
}

void CapacityAccountant::release(const std::string& account_id, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account_id);
    if (it == accounts_.end()) {
        return;
    }
    it->second.reserved -= std::min(it->second.reserved, bytes);
}

std::optional<UsageRecord> CapacityAccountant::record(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account_id);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<UsageRecord> CapacityAccountant::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UsageRecord> result;
    for (const auto& [id, account] : accounts_) {
        result.push_back(account.record);
    }
    return result;
}

uint64_t CapacityAccountant::reserved(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account_id);
    return it == accounts_.end() ? 0 : it->second.reserved;
}

}
