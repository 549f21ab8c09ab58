#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <string>

namespace aether {

// ============================================================================
// Transaction Fields (everything that is hashed; no signature, no hash)
// ============================================================================

struct TransactionFields {
    Address sender;
    public_key_t sender_public_key{};
    Address recipient;
    amount_t amount = 0;
    amount_t fee = 0;
    gas_t gas_limit = 0;
    nonce_t nonce = 0;
    std::optional<std::string> memo;
    std::optional<bytes_t> payload;

    bool operator==(const TransactionFields&) const = default;
};

// ============================================================================
// Canonical Encoding
// ============================================================================
//
// Layout, fixed order, integers little-endian fixed width:
//
//   sender            20 bytes
//   sender_public_key 32 bytes
//   recipient         20 bytes
//   amount            u64
//   fee               u64
//   gas_limit         u64
//   nonce             u64
//   memo              u32 length + UTF-8 bytes
//   payload           u32 length + bytes
//
// An absent memo or payload is encoded exactly like an empty one.

inline constexpr std::size_t CANONICAL_FIXED_SIZE =
    ADDRESS_SIZE +                     // sender
    ED25519_PUBLIC_KEY_SIZE +          // sender_public_key
    ADDRESS_SIZE +                     // recipient
    sizeof(std::uint64_t) * 4 +        // amount, fee, gas_limit, nonce
    sizeof(std::uint32_t) * 2;         // memo and payload lengths

// Throws ValidationError for an oversized or non-UTF-8 memo, or an
// oversized payload. Never truncates.
[[nodiscard]] bytes_t canonical_encode(const TransactionFields& fields);

// Inverse of canonical_encode. Returns nullopt for truncated input, trailing
// bytes, oversized lengths or a non-UTF-8 memo. Zero-length memo and payload
// decode as absent.
[[nodiscard]] std::optional<TransactionFields> canonical_decode(std::span<const std::uint8_t> encoded);

// SHA-256 of already encoded bytes
[[nodiscard]] hash_t canonical_digest(std::span<const std::uint8_t> encoded);

// canonical_digest(canonical_encode(fields))
[[nodiscard]] hash_t transaction_hash(const TransactionFields& fields);

}  // namespace aether
