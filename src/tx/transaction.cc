#include "transaction.hh"
#include "crypto/signature.hh"
#include "core/error.hh"
#include "core/logging.hh"

namespace aether {

// ============================================================================
// Transaction Implementation
// ============================================================================

Transaction::Transaction(TransactionFields fields, const signature_t& signature, const hash_t& hash)
    : fields_(std::move(fields))
    , signature_(signature)
    , hash_(hash)
    , writes_{fields_.recipient} {}

Transaction Transaction::assemble(TransactionFields fields,
                                  const signature_t& signature,
                                  const hash_t& hash) {
    if (address_of(fields.sender_public_key) != fields.sender) {
        throw ValidationError("sender address does not match sender public key");
    }

    hash_t expected = transaction_hash(fields);
    if (expected != hash) {
        throw ValidationError("transaction hash mismatch: expected " + hash_to_hex(expected) +
                              ", got " + hash_to_hex(hash));
    }

    if (!ed25519_verify(fields.sender_public_key, hash, signature)) {
        throw ValidationError("transaction signature does not verify for " +
                              fields.sender.to_hex());
    }

    return Transaction(std::move(fields), signature, hash);
}

bool Transaction::verify() const {
    if (address_of(fields_.sender_public_key) != fields_.sender) {
        return false;
    }
    try {
        if (transaction_hash(fields_) != hash_) {
            return false;
        }
    } catch (const ValidationError& e) {
        AETHER_LOG_DEBUG(log::tx) << "Transaction no longer encodes: " << e.what();
        return false;
    }
    return ed25519_verify(fields_.sender_public_key, hash_, signature_);
}

TransactionEnvelope Transaction::envelope() const {
    TransactionEnvelope env;
    env.from = fields_.sender;
    env.to = fields_.recipient;
    env.value = fields_.amount;
    if (fields_.payload && !fields_.payload->empty()) {
        env.data = fields_.payload;
    }
    env.nonce = fields_.nonce;
    env.signature = signature_;
    return env;
}

// ============================================================================
// Receipt Helpers
// ============================================================================

std::optional<ExecutionStatus> parse_execution_status(std::string_view text) {
    if (text == "success") return ExecutionStatus::SUCCESS;
    if (text == "failed") return ExecutionStatus::FAILED;
    return std::nullopt;
}

}  // namespace aether
