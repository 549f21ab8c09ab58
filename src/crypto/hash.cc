#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace aether {

// ============================================================================
// One-shot Digests
// ============================================================================

hash_t sha256(std::span<const std::uint8_t> data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(const void* data, std::size_t len) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        log::crypto.error("SHA-256 failed");
        throw std::runtime_error("SHA-256 failed");
    }
    return result;
}

hash_t sha256(std::string_view text) {
    return sha256(text.data(), text.size());
}

// ============================================================================
// Address from public key (declared in types.hh)
// ============================================================================

Address Address::from_public_key(const public_key_t& pk) {
    auto digest = sha256(pk);
    Address addr;
    std::copy(digest.end() - ADDRESS_SIZE, digest.end(), addr.bytes.begin());
    return addr;
}

}  // namespace aether
