#include "ledger.hpp"
#include "upload_types.hpp"
#include "chunkflow/hex.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>

namespace chunkflow {

namespace {

const char* ENTRY_EXTENSION = ".partial";

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}

PartialUploadLedger::PartialUploadLedger(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    if (!directory_.empty()) {
        std::filesystem::create_directories(directory_);
        load();
    }
}

void PartialUploadLedger::load() {
    for (const auto& item : std::filesystem::directory_iterator(directory_)) {
        if (!item.is_regular_file() || item.path().extension() != ENTRY_EXTENSION) {
            continue;
        }
        std::ifstream file(item.path(), std::ios::binary);
        LedgerEntry entry;
        if (!entry.ParseFromIstream(&file)) {
            std::cerr << "[Ledger] Skipping unreadable entry " << item.path() << std::endl;
            continue;
        }
        if (!util::is_checksum(entry.checksum())) {
            std::cerr << "[Ledger] Skipping entry with malformed checksum " << item.path() << std::endl;
            continue;
        }
        entries_[entry.checksum()] = entry;
    }
    std::cout << "[Ledger] Loaded " << entries_.size() << " partial upload(s) from " << directory_ << std::endl;
}

std::filesystem::path PartialUploadLedger::entry_path(const std::string& checksum) const {
    return directory_ / (checksum + ENTRY_EXTENSION);
}

void PartialUploadLedger::persist(const LedgerEntry& entry) const {
    if (directory_.empty()) {
        return;
    }
    std::filesystem::path target = entry_path(entry.checksum());
    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!entry.SerializeToOstream(&file)) {
            throw std::runtime_error("Failed to write ledger entry " + temp.string());
        }
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to flush ledger entry " + temp.string());
        }
    }
    // Replace the previous version in one step
    std::filesystem::rename(temp, target);
}

std::optional<LedgerEntry> PartialUploadLedger::find_by_checksum(const std::string& checksum) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(checksum);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<LedgerEntry> PartialUploadLedger::check_resumable(const std::string& checksum,
                                                                uint64_t total_size) const {
    auto entry = find_by_checksum(checksum);
    if (!entry) {
        return std::nullopt;
    }
    if (entry->total_size() != total_size) {
        throw IntegrityError("Partial upload " + checksum + " was recorded with " +
                             std::to_string(entry->total_size()) + " bytes, request declares " +
                             std::to_string(total_size));
    }
    return entry;
}

void PartialUploadLedger::create_or_update(const LedgerEntry& entry) {
    if (!util::is_checksum(entry.checksum())) {
        throw std::invalid_argument("Ledger entries are keyed by a SHA-256 hex checksum");
    }
    for (uint32_t index : entry.completed_chunks()) {
        if (index >= entry.total_chunks()) {
            throw std::invalid_argument("Completed chunk index " + std::to_string(index) + " out of range");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    LedgerEntry stored = entry;
    auto it = entries_.find(entry.checksum());
    int64_t now = now_seconds();
    stored.set_created_at(it != entries_.end() ? it->second.created_at() : now);
    stored.set_updated_at(now);
    persist(stored);
    entries_[stored.checksum()] = stored;
}

bool PartialUploadLedger::mark_chunk_complete(const std::string& checksum, const ChunkPlacement& placement) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(checksum);
    if (it == entries_.end()) {
        return false;
    }
    if (placement.chunk_index() >= it->second.total_chunks()) {
        throw std::out_of_range("Chunk index " + std::to_string(placement.chunk_index()) +
                                " outside of " + std::to_string(it->second.total_chunks()) + " chunks");
    }

    LedgerEntry updated = it->second;
    auto* completed = updated.mutable_completed_chunks();
    auto pos = std::lower_bound(completed->begin(), completed->end(), placement.chunk_index());
    if (pos == completed->end() || *pos != placement.chunk_index()) {
        // Keep the indices sorted so files stay comparable
        completed->Add(placement.chunk_index());
        std::sort(completed->begin(), completed->end());
    }

    auto* placements = updated.mutable_placements();
    auto existing = std::find_if(placements->begin(), placements->end(), [&](const ChunkPlacement& p) {
        return p.chunk_index() == placement.chunk_index();
    });
    if (existing != placements->end()) {
        *existing = placement;
    } else {
        *placements->Add() = placement;
    }
    updated.set_updated_at(now_seconds());

    persist(updated);
    it->second = std::move(updated);
    return true;
}

bool PartialUploadLedger::remove(const std::string& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(checksum) == 0) {
        return false;
    }
    if (!directory_.empty()) {
        std::error_code ec;
        std::filesystem::remove(entry_path(checksum), ec);
        if (ec) {
            std::cerr << "[Ledger] Failed to delete entry file for " << checksum << ": " << ec.message() << std::endl;
        }
    }
    return true;
}

std::vector<LedgerEntry> PartialUploadLedger::list(const std::string& owner_scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEntry> result;
    for (const auto& [checksum, entry] : entries_) {
        if (owner_scope.empty() || entry.owner_scope() == owner_scope) {
            result.push_back(entry);
        }
    }
    return result;
}

}
