#pragma once

#include "codec.hh"
#include "core/types.hh"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aether {

class TransactionBuilder;

// ============================================================================
// Transaction Envelope (what sendTransaction carries)
// ============================================================================

struct TransactionEnvelope {
    Address from;
    Address to;
    amount_t value = 0;
    std::optional<bytes_t> data;
    nonce_t nonce = 0;
    signature_t signature{};

    bool operator==(const TransactionEnvelope&) const = default;
};

// ============================================================================
// Signed Transaction
// ============================================================================

// Immutable once built. Every instance satisfies
//   hash == transaction_hash(fields)
//   signature verifies against hash under sender_public_key
//   sender == address_of(sender_public_key)
class Transaction {
public:
    // Accepts an externally produced transaction. Throws ValidationError if
    // any of the invariants above does not hold.
    [[nodiscard]] static Transaction assemble(TransactionFields fields,
                                              const signature_t& signature,
                                              const hash_t& hash);

    [[nodiscard]] const TransactionFields& fields() const { return fields_; }
    [[nodiscard]] const Address& sender() const { return fields_.sender; }
    [[nodiscard]] const public_key_t& sender_public_key() const { return fields_.sender_public_key; }
    [[nodiscard]] const Address& recipient() const { return fields_.recipient; }
    [[nodiscard]] amount_t amount() const { return fields_.amount; }
    [[nodiscard]] amount_t fee() const { return fields_.fee; }
    [[nodiscard]] gas_t gas_limit() const { return fields_.gas_limit; }
    [[nodiscard]] nonce_t nonce() const { return fields_.nonce; }
    [[nodiscard]] const std::optional<std::string>& memo() const { return fields_.memo; }
    [[nodiscard]] const std::optional<bytes_t>& payload() const { return fields_.payload; }

    [[nodiscard]] const signature_t& signature() const { return signature_; }
    [[nodiscard]] const hash_t& hash() const { return hash_; }
    [[nodiscard]] std::string hash_hex() const { return hash_to_hex(hash_); }
    [[nodiscard]] std::string signature_hex() const { return to_prefixed_hex(signature_); }

    // Access lists; writes always contains the recipient
    [[nodiscard]] const std::vector<Address>& reads() const { return reads_; }
    [[nodiscard]] const std::vector<Address>& writes() const { return writes_; }

    // Re-derives the hash and checks signature and sender binding
    [[nodiscard]] bool verify() const;

    [[nodiscard]] TransactionEnvelope envelope() const;

    bool operator==(const Transaction& other) const {
        return fields_ == other.fields_ && signature_ == other.signature_ && hash_ == other.hash_;
    }

private:
    friend class TransactionBuilder;

    Transaction(TransactionFields fields, const signature_t& signature, const hash_t& hash);

    TransactionFields fields_;
    signature_t signature_;
    hash_t hash_;
    std::vector<Address> reads_;
    std::vector<Address> writes_;
};

// ============================================================================
// Transaction Receipt
// ============================================================================

enum class ExecutionStatus : std::uint8_t {
    SUCCESS = 0,
    FAILED = 1,
};

[[nodiscard]] constexpr std::string_view execution_status_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::FAILED: return "failed";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ExecutionStatus> parse_execution_status(std::string_view text);

struct ReceiptLog {
    Address address;
    std::vector<hash_t> topics;
    bytes_t data;

    bool operator==(const ReceiptLog&) const = default;
};

struct TransactionReceipt {
    hash_t transaction_hash{};
    hash_t block_hash{};
    slot_t block_slot = 0;
    Address from;
    Address to;
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    std::optional<std::string> failure_reason;
    gas_t gas_used = 0;
    std::vector<ReceiptLog> logs;

    [[nodiscard]] bool is_success() const { return status == ExecutionStatus::SUCCESS; }

    bool operator==(const TransactionReceipt&) const = default;
};

}  // namespace aether
