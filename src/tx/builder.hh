#pragma once

#include "transaction.hh"
#include "core/config.hh"
#include "core/types.hh"
#include <optional>
#include <string>
#include <string_view>

namespace aether {

class KeyPair;

// ============================================================================
// Build Result
// ============================================================================

enum class BuildError : std::uint8_t {
    NONE = 0,
    INCOMPLETE = 1,        // Required field never set
    MALFORMED_FIELD = 2,   // Bad hex / wrong length
    KEY_MISMATCH = 3,      // Sender, public key and signing key disagree
    ENCODING = 4,          // Memo/payload rejected by the canonical codec
};

[[nodiscard]] constexpr std::string_view build_error_string(BuildError error) {
    switch (error) {
        case BuildError::NONE: return "none";
        case BuildError::INCOMPLETE: return "incomplete";
        case BuildError::MALFORMED_FIELD: return "malformed_field";
        case BuildError::KEY_MISMATCH: return "key_mismatch";
        case BuildError::ENCODING: return "encoding";
    }
    return "unknown";
}

struct BuildResult {
    std::optional<Transaction> transaction;
    BuildError error = BuildError::NONE;
    std::string field;      // Offending field, empty on success
    std::string message;

    [[nodiscard]] bool ok() const { return transaction.has_value(); }

    // Throws IncompleteTransaction for INCOMPLETE, ValidationError otherwise
    [[nodiscard]] const Transaction& value() const;
};

// ============================================================================
// Transaction Draft
// ============================================================================

// Addresses and keys are kept in their textual form until build() so that
// malformed input is reported against the field it was given for.
struct TransactionDraft {
    std::optional<std::string> sender;
    std::optional<std::string> sender_public_key;
    std::optional<std::string> recipient;
    std::optional<amount_t> amount;
    std::optional<amount_t> fee;
    std::optional<gas_t> gas_limit;
    std::optional<nonce_t> nonce;
    std::optional<std::string> memo;
    std::optional<bytes_t> payload;
};

// ============================================================================
// Transaction Builder
// ============================================================================

// Every setter returns a new builder; the receiver is never modified.
// build() is a pure function of the draft and the key pair: it never touches
// the network, so nonces must be supplied by the caller.
class TransactionBuilder {
public:
    TransactionBuilder() = default;

    // Fee and gas limit prefilled from the config
    [[nodiscard]] static TransactionBuilder with_defaults(const ClientConfig& config);

    [[nodiscard]] static TransactionBuilder transfer(
        const KeyPair& sender, const Address& to, amount_t amount, nonce_t nonce,
        const ClientConfig& config = ClientConfig{});

    [[nodiscard]] static TransactionBuilder call(
        const KeyPair& sender, const Address& contract, bytes_t data, nonce_t nonce,
        amount_t value = 0, const ClientConfig& config = ClientConfig{});

    [[nodiscard]] TransactionBuilder sender(std::string_view address_hex) const;
    [[nodiscard]] TransactionBuilder sender(const Address& address) const;
    [[nodiscard]] TransactionBuilder sender_public_key(std::string_view public_key_hex) const;
    [[nodiscard]] TransactionBuilder sender_public_key(const public_key_t& public_key) const;
    // Sets both sender and sender_public_key from the key pair
    [[nodiscard]] TransactionBuilder signer(const KeyPair& keypair) const;
    [[nodiscard]] TransactionBuilder recipient(std::string_view address_hex) const;
    [[nodiscard]] TransactionBuilder recipient(const Address& address) const;
    [[nodiscard]] TransactionBuilder amount(amount_t value) const;
    [[nodiscard]] TransactionBuilder fee(amount_t value) const;
    [[nodiscard]] TransactionBuilder gas_limit(gas_t value) const;
    [[nodiscard]] TransactionBuilder nonce(nonce_t value) const;
    [[nodiscard]] TransactionBuilder memo(std::string text) const;
    [[nodiscard]] TransactionBuilder payload(bytes_t data) const;

    [[nodiscard]] const TransactionDraft& draft() const { return draft_; }

    // validate -> encode -> digest -> sign -> immutable Transaction
    [[nodiscard]] BuildResult build(const KeyPair& keypair) const;

private:
    explicit TransactionBuilder(TransactionDraft draft) : draft_(std::move(draft)) {}

    [[nodiscard]] std::optional<TransactionFields> validate(BuildResult& result) const;

    TransactionDraft draft_;
};

}  // namespace aether
