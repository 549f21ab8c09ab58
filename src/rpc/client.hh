#pragma once

#include "types.hh"
#include "wire.hh"
#include "ai/job.hh"
#include "ai/receipt_verifier.hh"
#include "core/config.hh"
#include "tracking/clock.hh"
#include "tracking/completion_tracker.hh"
#include "tx/transaction.hh"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aether {

class KeyPair;

// ============================================================================
// Transport
// ============================================================================

// One JSON-RPC round trip. Returns the "result" member: null means the node
// has no such record. Node error objects and transport failures are thrown as
// RpcError. Must tolerate concurrent calls if wait_for_jobs() is used.
class RpcTransport {
public:
    virtual ~RpcTransport() = default;

    [[nodiscard]] virtual json call(const std::string& method, const json& params) = 0;
};

// ============================================================================
// Aether Client
// ============================================================================

// Typed facade over the node RPC. Every request and response passes through
// the wire codec, so shape errors surface as ValidationError at the boundary.
class AetherClient {
public:
    explicit AetherClient(RpcTransport& transport,
                          ClientConfig config = ClientConfig{},
                          Clock& clock = SystemClock::instance());

    [[nodiscard]] const ClientConfig& config() const { return config_; }

    // ---- Accounts ----

    // Throws NotFound if the node has no record for the address
    [[nodiscard]] AccountInfo get_account(const Address& address);
    [[nodiscard]] amount_t get_balance(const Address& address);
    [[nodiscard]] nonce_t get_nonce(const Address& address);

    // ---- Transactions ----

    // Returns the hash the node assigned
    hash_t send_transaction(const Transaction& tx);

    [[nodiscard]] std::optional<TransactionReceipt> get_transaction_receipt(const hash_t& hash);

    // Looks up the sender nonce, builds with the configured fee and gas
    // limit, signs and submits
    Transaction transfer(const KeyPair& from, const Address& to, amount_t amount,
                         std::optional<std::string> memo = std::nullopt);

    // ---- AI Jobs ----

    [[nodiscard]] std::optional<AIJob> get_job(const hash_t& job_id);
    [[nodiscard]] std::optional<ProviderReputation> get_provider_reputation(const Address& provider);
    [[nodiscard]] ProofVerdict verify_vcr(const VerifiableComputeReceipt& vcr);

    // Local cross-checks against the job, then ai_verifyVCR
    [[nodiscard]] VcrVerification verify_job_receipt(const AIJob& job,
                                                     const VerifiableComputeReceipt& vcr);
    [[nodiscard]] VcrVerification verify_job_receipt(const AIJob& job);

    // ---- Waiting ----

    // Absent receipts keep the wait going; a failed receipt is RemoteFailure
    TransactionReceipt wait_for_transaction(const hash_t& hash);
    TransactionReceipt wait_for_transaction(const hash_t& hash, const WaitOptions& options);

    // Throws ValidationError before any probe if the text is not a hash
    TransactionReceipt wait_for_transaction(std::string_view hash_hex);

    // completed/settled return the job, challenged is RemoteFailure, an
    // unknown id is NotFound unless the config says to keep waiting
    AIJob wait_for_job_completion(const hash_t& job_id);
    AIJob wait_for_job_completion(const hash_t& job_id, const WaitOptions& options);

    // One independent wait per job, run concurrently. Results keep the order
    // of `job_ids`; if any wait fails, the first failure in that order is
    // rethrown once all waits have finished.
    std::vector<AIJob> wait_for_jobs(const std::vector<hash_t>& job_ids);
    std::vector<AIJob> wait_for_jobs(const std::vector<hash_t>& job_ids, const WaitOptions& options);

private:
    json call(const std::string& method, json params);

    RpcTransport& transport_;
    ClientConfig config_;
    Clock& clock_;
};

// ============================================================================
// Node-backed proof verifier
// ============================================================================

class RpcProofVerifier final : public ProofVerifier {
public:
    explicit RpcProofVerifier(AetherClient& client) : client_(client) {}

    [[nodiscard]] ProofVerdict verify(const VerifiableComputeReceipt& vcr) override {
        return client_.verify_vcr(vcr);
    }

private:
    AetherClient& client_;
};

}  // namespace aether
