#include "receipt_verifier.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"

namespace aether {

// ============================================================================
// Local Cross-Checks
// ============================================================================

LocalCheck cross_check(const AIJob& job, const VerifiableComputeReceipt& vcr) {
    if (vcr.job_id != job.id) {
        return LocalCheck::JOB_ID_MISMATCH;
    }
    if (!job.provider || *job.provider != vcr.provider) {
        return LocalCheck::PROVIDER_MISMATCH;
    }
    if (job.result_hash && sha256(vcr.result) != *job.result_hash) {
        return LocalCheck::RESULT_HASH_MISMATCH;
    }
    return LocalCheck::PASSED;
}

namespace {

std::string describe(LocalCheck check, const AIJob& job, const VerifiableComputeReceipt& vcr) {
    switch (check) {
        case LocalCheck::JOB_ID_MISMATCH:
            return "receipt is for job " + hash_to_hex(vcr.job_id) + ", not " + job.id_hex();
        case LocalCheck::PROVIDER_MISMATCH:
            if (!job.provider) {
                return "job " + job.id_hex() + " has no assigned provider";
            }
            return "receipt provider " + vcr.provider.to_hex() +
                   " is not the assigned provider " + job.provider->to_hex();
        case LocalCheck::RESULT_HASH_MISMATCH:
            return "receipt result hashes to " + hash_to_hex(sha256(vcr.result)) +
                   ", job recorded " + hash_to_hex(*job.result_hash);
        case LocalCheck::PASSED:
            break;
    }
    return {};
}

}  // namespace

// ============================================================================
// ReceiptVerifier
// ============================================================================

VcrVerification ReceiptVerifier::verify(const AIJob& job, const VerifiableComputeReceipt& vcr) {
    VcrVerification out;
    out.local = cross_check(job, vcr);

    if (out.local != LocalCheck::PASSED) {
        out.detail = describe(out.local, job, vcr);
        log::vcr.warn() << "Rejected receipt locally (" << local_check_string(out.local)
                        << "): " << out.detail;
        return out;
    }

    out.forwarded = true;
    out.proof = proofs_.verify(vcr);

    AETHER_LOG_INFO(log::vcr) << "Receipt for job " << job.id_hex()
                              << ": valid=" << out.proof.valid
                              << " kzg=" << out.proof.kzg_valid
                              << " tee=" << out.proof.tee_valid;
    return out;
}

VcrVerification ReceiptVerifier::verify(const AIJob& job) {
    if (!job.vcr) {
        throw NotFound("receipt for job " + job.id_hex());
    }
    return verify(job, *job.vcr);
}

}  // namespace aether
