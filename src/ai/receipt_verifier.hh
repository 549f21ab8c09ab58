#pragma once

#include "job.hh"
#include <string>
#include <string_view>

namespace aether {

// ============================================================================
// Proof Verification (remote)
// ============================================================================

// Three independent answers from the proof verifier. Never collapse them:
// "commitments check out but no attestation" is a different trust decision
// from outright invalidity.
struct ProofVerdict {
    bool valid = false;      // Overall verdict
    bool kzg_valid = false;  // Commitments verify against the execution trace
    bool tee_valid = false;  // Hardware attestation verifies

    bool operator==(const ProofVerdict&) const = default;
};

// Checks KZG commitments and TEE attestation. Implemented by the node
// (ai_verifyVCR) or by a test double.
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    [[nodiscard]] virtual ProofVerdict verify(const VerifiableComputeReceipt& vcr) = 0;
};

// ============================================================================
// Local Cross-Checks
// ============================================================================

enum class LocalCheck : std::uint8_t {
    PASSED = 0,
    JOB_ID_MISMATCH = 1,
    PROVIDER_MISMATCH = 2,     // Includes a job with no assigned provider
    RESULT_HASH_MISMATCH = 3,  // SHA-256(vcr.result) differs from the recorded hash
};

[[nodiscard]] constexpr std::string_view local_check_string(LocalCheck check) {
    switch (check) {
        case LocalCheck::PASSED: return "passed";
        case LocalCheck::JOB_ID_MISMATCH: return "job_id_mismatch";
        case LocalCheck::PROVIDER_MISMATCH: return "provider_mismatch";
        case LocalCheck::RESULT_HASH_MISMATCH: return "result_hash_mismatch";
    }
    return "unknown";
}

// Runs the checks in order and reports the first one that fails
[[nodiscard]] LocalCheck cross_check(const AIJob& job, const VerifiableComputeReceipt& vcr);

// ============================================================================
// Verification Result
// ============================================================================

struct VcrVerification {
    LocalCheck local = LocalCheck::PASSED;
    bool forwarded = false;  // Reached the proof verifier
    ProofVerdict proof;      // All false unless forwarded
    std::string detail;

    [[nodiscard]] bool locally_consistent() const { return local == LocalCheck::PASSED; }
    [[nodiscard]] bool valid() const { return locally_consistent() && proof.valid; }
    [[nodiscard]] bool kzg_valid() const { return locally_consistent() && proof.kzg_valid; }
    [[nodiscard]] bool tee_valid() const { return locally_consistent() && proof.tee_valid; }

    // Every check passed, including the attestation
    [[nodiscard]] bool fully_valid() const { return valid() && kzg_valid() && tee_valid(); }
};

// ============================================================================
// Receipt Verifier
// ============================================================================

// A VCR only means something next to the job it claims to belong to. Local
// cross-checks run first; a receipt failing any of them is never forwarded.
class ReceiptVerifier {
public:
    explicit ReceiptVerifier(ProofVerifier& proofs) : proofs_(proofs) {}

    [[nodiscard]] VcrVerification verify(const AIJob& job, const VerifiableComputeReceipt& vcr);

    // Uses the receipt the job carries; throws NotFound if it has none
    [[nodiscard]] VcrVerification verify(const AIJob& job);

private:
    ProofVerifier& proofs_;
};

}  // namespace aether
