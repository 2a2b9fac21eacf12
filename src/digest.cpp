#include "chunkflow/digest.hpp"
#include "chunkflow/hex.hpp"
#include <stdexcept>

namespace chunkflow {
namespace util {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
}

void Sha256::update(const void* data, size_t len) {
    if (finalized_) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("Failed to update SHA-256 hash");
    }
}

std::string Sha256::hex_digest() {
    if (finalized_) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash.data(), &hash_len) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 hash");
    }
    finalized_ = true;
    hash.resize(hash_len);
    return to_hex(hash);
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    Sha256 sha;
    sha.update(data, len);
    return sha.hex_digest();
}

} // namespace util
} // namespace chunkflow
