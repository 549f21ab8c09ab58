#include "job.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include "tx/builder.hh"
#include <algorithm>
#include <span>

namespace aether {

// ============================================================================
// Job Status
// ============================================================================

std::optional<JobStatus> parse_job_status(std::string_view text) {
    if (text == "pending") return JobStatus::PENDING;
    if (text == "assigned") return JobStatus::ASSIGNED;
    if (text == "computing") return JobStatus::COMPUTING;
    if (text == "completed") return JobStatus::COMPLETED;
    if (text == "challenged") return JobStatus::CHALLENGED;
    if (text == "settled") return JobStatus::SETTLED;
    return std::nullopt;
}

Classification classify_job(const AIJob& job) {
    switch (job.status) {
        case JobStatus::COMPLETED:
        case JobStatus::SETTLED:
            return Classification::success();
        case JobStatus::CHALLENGED:
            return Classification::failure("job " + job.id_hex() + " is being challenged");
        case JobStatus::PENDING:
        case JobStatus::ASSIGNED:
        case JobStatus::COMPUTING:
            break;
    }
    return Classification::pending();
}

void normalize_completed_job(AIJob& job) {
    if ((job.status == JobStatus::COMPLETED || job.status == JobStatus::SETTLED) && !job.result) {
        AETHER_LOG_DEBUG(log::ai) << "Job " << job.id_hex() << " is "
                                  << job_status_string(job.status) << " without result bytes";
        job.result = bytes_t{};
    }
}

// ============================================================================
// Escrow Contract
// ============================================================================

const Address& job_escrow_contract() {
    static const Address contract = [] {
        Address addr;
        addr.bytes[0] = 0x10;
        addr.bytes[ADDRESS_SIZE - 1] = 0x03;
        return addr;
    }();
    return contract;
}

selector_t method_selector(std::string_view method) {
    hash_t digest = sha256(method);
    selector_t selector{};
    std::copy_n(digest.begin(), selector.size(), selector.begin());
    return selector;
}

namespace {

class CallData {
public:
    explicit CallData(std::string_view method) {
        auto selector = method_selector(method);
        data_.insert(data_.end(), selector.begin(), selector.end());
    }

    CallData& append(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    [[nodiscard]] bytes_t take() { return std::move(data_); }

private:
    bytes_t data_;
};

Transaction escrow_call(const KeyPair& keypair, std::string_view method, bytes_t data,
                        amount_t value, nonce_t nonce, const ClientConfig& config) {
    auto result = TransactionBuilder::call(keypair, job_escrow_contract(), std::move(data),
                                           nonce, value, config).build(keypair);
    const Transaction& tx = result.value();
    AETHER_LOG_DEBUG(log::ai) << method << " call " << tx.hash_hex()
                              << " from " << tx.sender().to_hex() << " value=" << value;
    return tx;
}

void require_positive(amount_t value, std::string_view what) {
    if (value == 0) {
        throw ValidationError(std::string(what) + " must be positive");
    }
}

}  // namespace

namespace job_calls {

Transaction submit_job(const KeyPair& creator, const hash_t& model_hash, const bytes_t& input,
                       amount_t amount, nonce_t nonce, const ClientConfig& config) {
    require_positive(amount, "AIC amount");
    auto data = CallData("submitJob").append(model_hash).append(input).take();
    return escrow_call(creator, "submitJob", std::move(data), amount, nonce, config);
}

Transaction accept_job(const KeyPair& provider, const hash_t& job_id, nonce_t nonce,
                       const ClientConfig& config) {
    auto data = CallData("acceptJob").append(job_id).take();
    return escrow_call(provider, "acceptJob", std::move(data), 0, nonce, config);
}

Transaction submit_result(const KeyPair& provider, const hash_t& job_id, const bytes_t& result,
                          nonce_t nonce, const ClientConfig& config) {
    auto data = CallData("submitResult").append(job_id).append(result).take();
    return escrow_call(provider, "submitResult", std::move(data), 0, nonce, config);
}

Transaction challenge_result(const KeyPair& challenger, const hash_t& job_id, amount_t stake,
                             nonce_t nonce, const ClientConfig& config) {
    require_positive(stake, "challenge stake");
    auto data = CallData("challengeResult").append(job_id).take();
    return escrow_call(challenger, "challengeResult", std::move(data), stake, nonce, config);
}

Transaction claim_payment(const KeyPair& provider, const hash_t& job_id, nonce_t nonce,
                          const ClientConfig& config) {
    auto data = CallData("claimPayment").append(job_id).take();
    return escrow_call(provider, "claimPayment", std::move(data), 0, nonce, config);
}

}  // namespace job_calls

}  // namespace aether
