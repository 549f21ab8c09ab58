#include "builder.hh"
#include "crypto/signature.hh"
#include "core/error.hh"
#include "core/logging.hh"

namespace aether {

// ============================================================================
// BuildResult
// ============================================================================

const Transaction& BuildResult::value() const {
    if (transaction) {
        return *transaction;
    }
    if (error == BuildError::INCOMPLETE) {
        throw IncompleteTransaction(field);
    }
    throw ValidationError(message.empty() ? std::string(build_error_string(error)) : message);
}

// ============================================================================
// Construction Helpers
// ============================================================================

TransactionBuilder TransactionBuilder::with_defaults(const ClientConfig& config) {
    TransactionDraft draft;
    draft.fee = config.default_fee;
    draft.gas_limit = config.default_gas_limit;
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::transfer(const KeyPair& sender, const Address& to,
                                                amount_t amount, nonce_t nonce,
                                                const ClientConfig& config) {
    return with_defaults(config).signer(sender).recipient(to).amount(amount).nonce(nonce);
}

TransactionBuilder TransactionBuilder::call(const KeyPair& sender, const Address& contract,
                                            bytes_t data, nonce_t nonce, amount_t value,
                                            const ClientConfig& config) {
    return with_defaults(config)
        .signer(sender)
        .recipient(contract)
        .amount(value)
        .payload(std::move(data))
        .nonce(nonce);
}

// ============================================================================
// Setters
// ============================================================================

TransactionBuilder TransactionBuilder::sender(std::string_view address_hex) const {
    auto draft = draft_;
    draft.sender = std::string(address_hex);
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::sender(const Address& address) const {
    return sender(address.to_hex());
}

TransactionBuilder TransactionBuilder::sender_public_key(std::string_view public_key_hex) const {
    auto draft = draft_;
    draft.sender_public_key = std::string(public_key_hex);
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::sender_public_key(const public_key_t& public_key) const {
    return sender_public_key(to_prefixed_hex(public_key));
}

TransactionBuilder TransactionBuilder::signer(const KeyPair& keypair) const {
    return sender(keypair.address()).sender_public_key(keypair.public_key());
}

TransactionBuilder TransactionBuilder::recipient(std::string_view address_hex) const {
    auto draft = draft_;
    draft.recipient = std::string(address_hex);
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::recipient(const Address& address) const {
    return recipient(address.to_hex());
}

TransactionBuilder TransactionBuilder::amount(amount_t value) const {
    auto draft = draft_;
    draft.amount = value;
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::fee(amount_t value) const {
    auto draft = draft_;
    draft.fee = value;
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::gas_limit(gas_t value) const {
    auto draft = draft_;
    draft.gas_limit = value;
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::nonce(nonce_t value) const {
    auto draft = draft_;
    draft.nonce = value;
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::memo(std::string text) const {
    auto draft = draft_;
    draft.memo = std::move(text);
    return TransactionBuilder(std::move(draft));
}

TransactionBuilder TransactionBuilder::payload(bytes_t data) const {
    auto draft = draft_;
    draft.payload = std::move(data);
    return TransactionBuilder(std::move(draft));
}

// ============================================================================
// Validation
// ============================================================================

std::optional<TransactionFields> TransactionBuilder::validate(BuildResult& result) const {
    auto fail = [&result](BuildError error, std::string field, std::string message) {
        result.error = error;
        result.field = std::move(field);
        result.message = std::move(message);
        return std::nullopt;
    };

    // Presence first, in a fixed order. A nonce of zero is a set nonce.
    if (!draft_.sender) return fail(BuildError::INCOMPLETE, "sender", "sender is required");
    if (!draft_.sender_public_key) {
        return fail(BuildError::INCOMPLETE, "sender_public_key", "sender_public_key is required");
    }
    if (!draft_.recipient) return fail(BuildError::INCOMPLETE, "recipient", "recipient is required");
    if (!draft_.amount) return fail(BuildError::INCOMPLETE, "amount", "amount is required");
    if (!draft_.fee) return fail(BuildError::INCOMPLETE, "fee", "fee is required");
    if (!draft_.gas_limit) return fail(BuildError::INCOMPLETE, "gas_limit", "gas_limit is required");
    if (!draft_.nonce) return fail(BuildError::INCOMPLETE, "nonce", "nonce is required");

    TransactionFields fields;

    auto sender = Address::from_hex(*draft_.sender);
    if (!sender) {
        return fail(BuildError::MALFORMED_FIELD, "sender",
                    "sender must be 0x followed by " + std::to_string(ADDRESS_SIZE * 2) + " hex characters");
    }
    auto public_key = public_key_from_hex(*draft_.sender_public_key);
    if (!public_key) {
        return fail(BuildError::MALFORMED_FIELD, "sender_public_key",
                    "sender_public_key must be 0x followed by " +
                    std::to_string(ED25519_PUBLIC_KEY_SIZE * 2) + " hex characters");
    }
    auto recipient = Address::from_hex(*draft_.recipient);
    if (!recipient) {
        return fail(BuildError::MALFORMED_FIELD, "recipient",
                    "recipient must be 0x followed by " + std::to_string(ADDRESS_SIZE * 2) + " hex characters");
    }

    if (address_of(*public_key) != *sender) {
        return fail(BuildError::KEY_MISMATCH, "sender",
                    "sender " + sender->to_hex() + " is not derived from sender_public_key");
    }

    fields.sender = *sender;
    fields.sender_public_key = *public_key;
    fields.recipient = *recipient;
    fields.amount = *draft_.amount;
    fields.fee = *draft_.fee;
    fields.gas_limit = *draft_.gas_limit;
    fields.nonce = *draft_.nonce;
    fields.memo = draft_.memo;
    fields.payload = draft_.payload;
    return fields;
}

// ============================================================================
// Build
// ============================================================================

BuildResult TransactionBuilder::build(const KeyPair& keypair) const {
    BuildResult result;

    auto fields = validate(result);
    if (!fields) {
        AETHER_LOG_DEBUG(log::tx) << "Transaction rejected (" << build_error_string(result.error)
                                  << "): " << result.message;
        return result;
    }

    if (fields->sender_public_key != keypair.public_key()) {
        result.error = BuildError::KEY_MISMATCH;
        result.field = "sender_public_key";
        result.message = "signing key does not belong to sender " + fields->sender.to_hex();
        AETHER_LOG_DEBUG(log::tx) << "Transaction rejected: " << result.message;
        return result;
    }

    bytes_t encoded;
    try {
        encoded = canonical_encode(*fields);
    } catch (const ValidationError& e) {
        result.error = BuildError::ENCODING;
        const bool memo_rejected = fields->memo &&
            (fields->memo->size() > MAX_MEMO_SIZE || !is_valid_utf8(*fields->memo));
        result.field = memo_rejected ? "memo" : "payload";
        result.message = e.what();
        return result;
    }

    hash_t hash = canonical_digest(encoded);
    signature_t signature = keypair.sign(hash);

    result.transaction = Transaction(std::move(*fields), signature, hash);

    AETHER_LOG_DEBUG(log::tx) << "Built transaction " << result.transaction->hash_hex()
                              << " nonce=" << result.transaction->nonce()
                              << " to=" << result.transaction->recipient().to_hex();
    return result;
}

}  // namespace aether
