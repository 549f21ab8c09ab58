#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "tracking/completion_tracker.hh"
#include "tx/transaction.hh"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aether {

class KeyPair;

// ============================================================================
// Job Lifecycle
// ============================================================================
//
//   pending -> assigned -> computing -> completed -> settled
//                                   \-> challenged -> settled

enum class JobStatus : std::uint8_t {
    PENDING = 0,
    ASSIGNED = 1,
    COMPUTING = 2,
    COMPLETED = 3,
    CHALLENGED = 4,
    SETTLED = 5,
};

[[nodiscard]] constexpr std::string_view job_status_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::ASSIGNED: return "assigned";
        case JobStatus::COMPUTING: return "computing";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::CHALLENGED: return "challenged";
        case JobStatus::SETTLED: return "settled";
    }
    return "unknown";
}

[[nodiscard]] std::optional<JobStatus> parse_job_status(std::string_view text);

// Terminal for waiting purposes: completed, challenged, settled
[[nodiscard]] constexpr bool is_terminal(JobStatus status) {
    return status == JobStatus::COMPLETED ||
           status == JobStatus::CHALLENGED ||
           status == JobStatus::SETTLED;
}

// ============================================================================
// Verifiable Compute Receipt
// ============================================================================

struct VerifiableComputeReceipt {
    hash_t job_id{};
    Address provider;
    bytes_t result;
    hash_t execution_trace{};
    std::vector<bytes_t> kzg_commitments;
    bytes_t tee_attestation;
    std::uint64_t timestamp = 0;

    bool operator==(const VerifiableComputeReceipt&) const = default;
};

// ============================================================================
// AI Job
// ============================================================================

struct AIJob {
    hash_t id{};
    Address creator;
    hash_t model_hash{};
    bytes_t input_data;
    amount_t aic_locked = 0;
    JobStatus status = JobStatus::PENDING;
    std::optional<Address> provider;
    std::optional<bytes_t> result;
    std::optional<hash_t> result_hash;   // Recorded on chain when the result was submitted
    std::optional<VerifiableComputeReceipt> vcr;

    [[nodiscard]] std::string id_hex() const { return hash_to_hex(id); }

    bool operator==(const AIJob&) const = default;
};

// completed/settled -> success, challenged -> failure, anything else pending.
// A completed job without result bytes is still a success; see
// normalize_completed_job().
[[nodiscard]] Classification classify_job(const AIJob& job);

// Gives a completed or settled job with no result an empty one, so that the
// result field is always present on a job a wait returned.
void normalize_completed_job(AIJob& job);

// ============================================================================
// Job Escrow Calls
// ============================================================================

// 0x1000000000000000000000000000000000000003
[[nodiscard]] const Address& job_escrow_contract();

using selector_t = std::array<std::uint8_t, 4>;

// First four bytes of SHA-256(method name)
[[nodiscard]] selector_t method_selector(std::string_view method);

// Call data is the selector followed by the arguments, fixed-size values raw.
// Each helper returns a signed call to the escrow contract and throws
// ValidationError for a zero amount or stake.
namespace job_calls {

// submitJob(model_hash, input) with `amount` AIC locked as the call value
[[nodiscard]] Transaction submit_job(const KeyPair& creator, const hash_t& model_hash,
                                     const bytes_t& input, amount_t amount, nonce_t nonce,
                                     const ClientConfig& config = ClientConfig{});

[[nodiscard]] Transaction accept_job(const KeyPair& provider, const hash_t& job_id,
                                     nonce_t nonce, const ClientConfig& config = ClientConfig{});

[[nodiscard]] Transaction submit_result(const KeyPair& provider, const hash_t& job_id,
                                        const bytes_t& result, nonce_t nonce,
                                        const ClientConfig& config = ClientConfig{});

// `stake` is the call value
[[nodiscard]] Transaction challenge_result(const KeyPair& challenger, const hash_t& job_id,
                                           amount_t stake, nonce_t nonce,
                                           const ClientConfig& config = ClientConfig{});

[[nodiscard]] Transaction claim_payment(const KeyPair& provider, const hash_t& job_id,
                                        nonce_t nonce, const ClientConfig& config = ClientConfig{});

}  // namespace job_calls

}  // namespace aether
