#include "chunk_store.hpp"
#include "chunkflow/digest.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace chunkflow {

namespace {

// File ids become directory names, so only a safe alphabet is accepted
bool is_safe_name(const std::string& name) {
    if (name.empty() || name.size() > 128) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
    });
}

}

ChunkStore::ChunkStore(std::filesystem::path root, std::string account_id, uint64_t capacity_bytes)
    : root_(std::move(root)),
      account_id_(std::move(account_id)),
      capacity_bytes_(capacity_bytes) {
    std::filesystem::create_directories(root_);
    used_bytes_ = scan_usage();
    std::cout << "[ChunkStore] Account " << account_id_ << " at " << root_ << ": "
              << used_bytes_ << " bytes used of " << capacity_bytes_ << std::endl;
}

uint64_t ChunkStore::scan_usage() const {
    uint64_t total = 0;
    for (const auto& item : std::filesystem::recursive_directory_iterator(root_)) {
        if (item.is_regular_file() && item.path().extension() == ".chunk") {
            total += item.file_size();
        }
    }
    return total;
}

uint64_t ChunkStore::free_space() const {
    return capacity_bytes_ > used_bytes_ ? capacity_bytes_ - used_bytes_ : 0;
}

std::filesystem::path ChunkStore::chunk_path(const std::string& file_id, uint32_t chunk_index) const {
    return root_ / file_id / (std::to_string(chunk_index) + ".chunk");
}

std::string ChunkStore::put(const std::string& file_id, uint32_t chunk_index,
                            const std::string& data, const std::string& checksum) {
    if (!is_safe_name(file_id)) {
        throw std::runtime_error("Invalid file id");
    }
    std::string actual = util::sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    if (!checksum.empty() && actual != checksum) {
        throw std::runtime_error("Chunk checksum mismatch");
    }

    std::filesystem::path path = chunk_path(file_id, chunk_index);
    uint64_t replaced = 0;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        replaced = std::filesystem::file_size(path, ec);
    }
    if (used_bytes_ - replaced + data.size() > capacity_bytes_) {
        throw std::runtime_error("Storage account " + account_id_ + " is full");
    }

    std::filesystem::create_directories(path.parent_path());
    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file) {
            throw std::runtime_error("Failed to write chunk " + temp.string());
        }
    }
    std::filesystem::rename(temp, path);
    used_bytes_ = used_bytes_ - replaced + data.size();

    return account_id_ + "/" + file_id + "/" + std::to_string(chunk_index);
}

std::optional<std::string> ChunkStore::get(const std::string& locator) const {
    // <account>/<file_id>/<index>
    size_t first = locator.find('/');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    size_t second = locator.find('/', first + 1);
    if (second == std::string::npos) {
        return std::nullopt;
    }
    if (locator.substr(0, first) != account_id_) {
        return std::nullopt;
    }
    std::string file_id = locator.substr(first + 1, second - first - 1);
    std::string index_str = locator.substr(second + 1);
    if (!is_safe_name(file_id) || index_str.empty() ||
        !std::all_of(index_str.begin(), index_str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    uint32_t index = 0;
    try {
        index = static_cast<uint32_t>(std::stoul(index_str));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    std::ifstream file(chunk_path(file_id, index), std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}
