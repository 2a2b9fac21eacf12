#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace chunkflow {
namespace util {

// --- Hex encoding for checksums and identifiers ---
std::string to_hex(const std::string& s);
std::string to_hex(const std::vector<uint8_t>& bytes);

// Checksums are SHA-256 digests rendered as 64 lowercase hex characters
inline bool is_checksum(const std::string& s) {
    if (s.length() != 64) {
        return false;
    }
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return true;
}

} // namespace util
} // namespace chunkflow
