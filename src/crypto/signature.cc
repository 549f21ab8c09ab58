#include "signature.hh"
#include "hash.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>

namespace aether {

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using pkey_ptr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

[[nodiscard]] pkey_ptr load_private(const secret_key_t& secret) {
    return pkey_ptr(EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, secret.data(), secret.size()));
}

[[nodiscard]] pkey_ptr load_public(const public_key_t& public_key) {
    return pkey_ptr(EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
}

}  // namespace

// ============================================================================
// KeyPair Implementation
// ============================================================================

KeyPair::~KeyPair() {
    if (secret_key_) {
        secure_zero(*secret_key_);
    }
}

KeyPair::KeyPair(KeyPair&& other) noexcept
    : public_key_(other.public_key_)
    , address_(other.address_)
    , secret_key_(std::move(other.secret_key_)) {}

KeyPair& KeyPair::operator=(KeyPair&& other) noexcept {
    if (this != &other) {
        if (secret_key_) {
            secure_zero(*secret_key_);
        }
        public_key_ = other.public_key_;
        address_ = other.address_;
        secret_key_ = std::move(other.secret_key_);
    }
    return *this;
}

KeyPair KeyPair::generate() {
    secret_key_t secret;
    if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
        log::crypto.error("Failed to draw random bytes for Ed25519 key");
        throw std::runtime_error("Failed to draw random bytes for Ed25519 key");
    }

    KeyPair keypair = from_secret_key(secret);
    secure_zero(secret);
    AETHER_LOG_DEBUG(log::crypto) << "Generated Ed25519 keypair for " << keypair.address_.to_hex();
    return keypair;
}

KeyPair KeyPair::from_seed(std::string_view seed) {
    return from_seed(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(seed.data()), seed.size()));
}

KeyPair KeyPair::from_seed(std::span<const std::uint8_t> seed) {
    hash_t secret = sha256(seed);
    KeyPair keypair = from_secret_key(secret);
    secure_zero(secret);
    return keypair;
}

KeyPair KeyPair::from_secret_key(std::span<const std::uint8_t> secret) {
    if (secret.size() != ED25519_SECRET_KEY_SIZE) {
        throw InvalidKeyMaterial("Ed25519 secret key must be " +
                                 std::to_string(ED25519_SECRET_KEY_SIZE) + " bytes, got " +
                                 std::to_string(secret.size()));
    }

    KeyPair keypair;
    keypair.secret_key_ = std::make_unique<secret_key_t>();
    std::copy(secret.begin(), secret.end(), keypair.secret_key_->begin());

    auto pkey = load_private(*keypair.secret_key_);
    if (!pkey) {
        throw InvalidKeyMaterial("OpenSSL rejected the Ed25519 secret key");
    }

    std::size_t pub_len = ED25519_PUBLIC_KEY_SIZE;
    if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key_.data(), &pub_len) != 1 ||
        pub_len != ED25519_PUBLIC_KEY_SIZE) {
        log::crypto.error("Failed to derive Ed25519 public key");
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }

    keypair.address_ = Address::from_public_key(keypair.public_key_);
    return keypair;
}

KeyPair KeyPair::from_secret_key_hex(std::string_view hex) {
    auto bytes = hex_to_bytes(hex);
    if (!bytes) {
        throw InvalidKeyMaterial("secret key is not valid hex");
    }
    KeyPair keypair = from_secret_key(*bytes);
    secure_zero(*bytes);
    return keypair;
}

std::string KeyPair::public_key_hex() const {
    return to_prefixed_hex(public_key_);
}

secret_key_t KeyPair::export_secret_key() const {
    if (!secret_key_) {
        throw InvalidKeyMaterial("key pair holds no secret key");
    }
    return *secret_key_;
}

std::string KeyPair::export_secret_key_hex() const {
    if (!secret_key_) {
        throw InvalidKeyMaterial("key pair holds no secret key");
    }
    return to_prefixed_hex(*secret_key_);
}

signature_t KeyPair::sign(const hash_t& digest) const {
    if (!secret_key_) {
        throw InvalidKeyMaterial("key pair holds no secret key");
    }

    auto pkey = load_private(*secret_key_);
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        log::crypto.error("Failed to create Ed25519 signing context");
        throw std::runtime_error("Failed to create Ed25519 signing context");
    }

    signature_t signature;
    std::size_t sig_len = signature.size();

    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &sig_len,
                       digest.data(), digest.size()) != 1 ||
        sig_len != ED25519_SIGNATURE_SIZE) {
        log::crypto.error("Ed25519 signing failed");
        throw std::runtime_error("Ed25519 signing failed");
    }

    AETHER_LOG_TRACE(log::crypto) << "Signed digest " << hash_to_hex(digest)
                                  << " for " << address_.to_hex();
    return signature;
}

bool KeyPair::verify(const hash_t& digest, const signature_t& signature) const {
    return ed25519_verify(public_key_, digest, signature);
}

// ============================================================================
// Standalone Verification
// ============================================================================

bool ed25519_verify(const public_key_t& public_key,
                    std::span<const std::uint8_t> message,
                    const signature_t& signature) {
    auto pkey = load_public(public_key);
    if (!pkey) {
        AETHER_LOG_DEBUG(log::crypto) << "Ed25519 public key rejected by OpenSSL";
        return false;
    }

    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        log::crypto.error("Failed to create Ed25519 verification context");
        return false;
    }

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        log::crypto.error("Failed to initialize Ed25519 verification");
        return false;
    }

    bool result = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                   message.data(), message.size()) == 1;

    if (!result) {
        AETHER_LOG_DEBUG(log::crypto) << "Ed25519 signature verification failed";
    }
    return result;
}

bool verify_signature(std::span<const std::uint8_t> signature,
                      const hash_t& digest,
                      std::span<const std::uint8_t> public_key) {
    if (signature.size() != ED25519_SIGNATURE_SIZE ||
        public_key.size() != ED25519_PUBLIC_KEY_SIZE) {
        return false;
    }

    signature_t sig;
    public_key_t pk;
    std::copy(signature.begin(), signature.end(), sig.begin());
    std::copy(public_key.begin(), public_key.end(), pk.begin());
    return ed25519_verify(pk, digest, sig);
}

bool verify_signature_hex(std::string_view signature_hex,
                          const hash_t& digest,
                          const public_key_t& public_key) {
    auto sig = hex_to_bytes(signature_hex);
    if (!sig) {
        return false;
    }
    return verify_signature(*sig, digest, public_key);
}

std::optional<public_key_t> public_key_from_hex(std::string_view hex) {
    return fixed_from_prefixed_hex<ED25519_PUBLIC_KEY_SIZE>(hex);
}

}  // namespace aether
