#pragma once

#include "core/types.hh"
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace aether {

// ============================================================================
// Ed25519 Key Pair
// ============================================================================

// Owns the secret key for its whole lifetime. The secret never reaches the
// logger; export_secret_key*() are the only ways to read it back out.
class KeyPair {
public:
    ~KeyPair();

    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;
    KeyPair(KeyPair&&) noexcept;
    KeyPair& operator=(KeyPair&&) noexcept;

    // Fresh key from the OpenSSL CSPRNG
    [[nodiscard]] static KeyPair generate();

    // secret = SHA-256(seed). Deterministic, for fixtures and reproducible
    // accounts only: there is no domain separation or stretching, so a
    // guessable seed yields a guessable key.
    [[nodiscard]] static KeyPair from_seed(std::string_view seed);
    [[nodiscard]] static KeyPair from_seed(std::span<const std::uint8_t> seed);

    // Throws InvalidKeyMaterial unless exactly ED25519_SECRET_KEY_SIZE bytes
    [[nodiscard]] static KeyPair from_secret_key(std::span<const std::uint8_t> secret);
    [[nodiscard]] static KeyPair from_secret_key_hex(std::string_view hex);

    [[nodiscard]] const public_key_t& public_key() const { return public_key_; }
    [[nodiscard]] std::string public_key_hex() const;
    [[nodiscard]] const Address& address() const { return address_; }
    [[nodiscard]] bool has_secret_key() const { return secret_key_ != nullptr; }

    [[nodiscard]] secret_key_t export_secret_key() const;
    [[nodiscard]] std::string export_secret_key_hex() const;

    // Signs a digest, never raw transaction fields
    [[nodiscard]] signature_t sign(const hash_t& digest) const;

    [[nodiscard]] bool verify(const hash_t& digest, const signature_t& signature) const;

private:
    KeyPair() = default;

    public_key_t public_key_{};
    Address address_;
    std::unique_ptr<secret_key_t> secret_key_;
};

// ============================================================================
// Standalone Verification
// ============================================================================

// None of these throw: malformed input is simply an invalid signature.
[[nodiscard]] bool ed25519_verify(
    const public_key_t& public_key,
    std::span<const std::uint8_t> message,
    const signature_t& signature);

[[nodiscard]] bool verify_signature(
    std::span<const std::uint8_t> signature,
    const hash_t& digest,
    std::span<const std::uint8_t> public_key);

[[nodiscard]] bool verify_signature_hex(
    std::string_view signature_hex,
    const hash_t& digest,
    const public_key_t& public_key);

// Last 20 bytes of SHA-256(public key)
[[nodiscard]] inline Address address_of(const public_key_t& public_key) {
    return Address::from_public_key(public_key);
}

[[nodiscard]] std::optional<public_key_t> public_key_from_hex(std::string_view hex);

}  // namespace aether
