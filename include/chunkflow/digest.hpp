#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkflow {
namespace util {

// Helper for managing EVP_MD_CTX context
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Incremental SHA-256, used for both per-chunk and whole-file checksums
class Sha256 {
public:
    Sha256();

    void update(const void* data, size_t len);
    // Finalizes the digest; the object must not be updated afterwards
    std::string hex_digest();

private:
    EVP_MD_CTX_ptr ctx_;
    bool finalized_ = false;
};

std::string sha256_hex(const uint8_t* data, size_t len);

inline std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

} // namespace util
} // namespace chunkflow
