#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>

namespace aether {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// Ed25519 (RFC 8032)
inline constexpr std::size_t ED25519_PUBLIC_KEY_SIZE = 32;
inline constexpr std::size_t ED25519_SECRET_KEY_SIZE = 32;
inline constexpr std::size_t ED25519_SIGNATURE_SIZE = 64;

// SHA-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Address is the trailing 20 bytes of SHA-256(public key)
inline constexpr std::size_t ADDRESS_SIZE = 20;

// ============================================================================
// Limits
// ============================================================================

inline constexpr std::size_t MAX_MEMO_SIZE = 128 * 1024;
inline constexpr std::size_t MAX_PAYLOAD_SIZE = 128 * 1024;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using bytes_t = std::vector<std::uint8_t>;
using nonce_t = std::uint64_t;
using amount_t = std::uint64_t;
using gas_t = std::uint64_t;
using slot_t = std::uint64_t;

// ============================================================================
// Cryptographic Key Types
// ============================================================================

using public_key_t = std::array<std::uint8_t, ED25519_PUBLIC_KEY_SIZE>;
using secret_key_t = std::array<std::uint8_t, ED25519_SECRET_KEY_SIZE>;
using signature_t = std::array<std::uint8_t, ED25519_SIGNATURE_SIZE>;

// ============================================================================
// Address (derived from public key hash, never chosen freely)
// ============================================================================

struct Address {
    std::array<std::uint8_t, ADDRESS_SIZE> bytes{};

    [[nodiscard]] static Address from_public_key(const public_key_t& pk);
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] auto begin() const { return bytes.begin(); }
    [[nodiscard]] auto end() const { return bytes.end(); }

    auto operator<=>(const Address&) const = default;
};

// ============================================================================
// Time Utilities
// ============================================================================

using steady_time_t = std::chrono::steady_clock::time_point;
using millis_t = std::chrono::milliseconds;

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (8 * i));
    }
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (8 * i);
    }
    return val;
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

// Lowercase hex, no prefix
[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);

// Lowercase hex with 0x prefix (wire form)
[[nodiscard]] std::string to_prefixed_hex(std::span<const std::uint8_t> bytes);

// Accepts an optional 0x prefix and either case
[[nodiscard]] std::optional<bytes_t> hex_to_bytes(std::string_view hex);

// Requires the 0x prefix and exactly N bytes
template<std::size_t N>
[[nodiscard]] std::optional<std::array<std::uint8_t, N>> fixed_from_prefixed_hex(std::string_view hex) {
    if (hex.size() != 2 + 2 * N || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        return std::nullopt;
    }
    auto bytes = hex_to_bytes(hex);
    if (!bytes || bytes->size() != N) {
        return std::nullopt;
    }
    std::array<std::uint8_t, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        out[i] = (*bytes)[i];
    }
    return out;
}

[[nodiscard]] inline std::string hash_to_hex(const hash_t& h) {
    return to_prefixed_hex(h);
}

[[nodiscard]] inline std::optional<hash_t> hash_from_hex(std::string_view hex) {
    return fixed_from_prefixed_hex<HASH_SIZE>(hex);
}

// ============================================================================
// Text Helpers
// ============================================================================

[[nodiscard]] bool is_valid_utf8(std::string_view text);

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace aether

// ============================================================================
// Hash specialization (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<aether::hash_t> {
    std::size_t operator()(const aether::hash_t& h) const noexcept {
        // First 8 bytes are already uniformly distributed
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

template<>
struct hash<aether::Address> {
    std::size_t operator()(const aether::Address& addr) const noexcept {
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result |= static_cast<std::size_t>(addr.bytes[ADDRESS_OFFSET + i]) << (i * 8);
        }
        return result;
    }

private:
    static constexpr std::size_t ADDRESS_OFFSET = aether::ADDRESS_SIZE - sizeof(std::size_t);
};

}  // namespace std
