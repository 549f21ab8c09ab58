#include "client.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/signature.hh"
#include "tx/builder.hh"
#include <exception>
#include <future>

namespace aether {

AetherClient::AetherClient(RpcTransport& transport, ClientConfig config, Clock& clock)
    : transport_(transport)
    , config_(std::move(config))
    , clock_(clock) {}

json AetherClient::call(const std::string& method, json params) {
    AETHER_LOG_TRACE(log::rpc) << "-> " << method << " " << params.dump();
    try {
        json result = transport_.call(method, params);
        AETHER_LOG_TRACE(log::rpc) << "<- " << method << (result.is_null() ? " (null)" : "");
        return result;
    } catch (const RpcError& e) {
        AETHER_LOG_DEBUG(log::rpc) << method << " failed (code " << e.code() << "): " << e.what();
        throw;
    }
}

// ============================================================================
// Accounts
// ============================================================================

AccountInfo AetherClient::get_account(const Address& address) {
    json result = call("getAccount", json::array({address.to_hex()}));
    if (result.is_null()) {
        throw NotFound("account " + address.to_hex());
    }
    AccountInfo account = wire::decode_account(result);
    account.address = address;
    return account;
}

amount_t AetherClient::get_balance(const Address& address) {
    return get_account(address).balance;
}

nonce_t AetherClient::get_nonce(const Address& address) {
    return get_account(address).nonce;
}

// ============================================================================
// Transactions
// ============================================================================

hash_t AetherClient::send_transaction(const Transaction& tx) {
    json result = call("sendTransaction", json::array({wire::encode_envelope(tx.envelope())}));
    if (result.is_null()) {
        throw RpcError("sendTransaction", RpcError::TRANSPORT_ERROR, "node returned no hash");
    }
    hash_t hash = wire::decode_hash(result, "result");
    if (hash != tx.hash()) {
        log::rpc.warn() << "Node reported hash " << hash_to_hex(hash)
                        << " for transaction " << tx.hash_hex();
    }
    AETHER_LOG_INFO(log::rpc) << "Submitted transaction " << hash_to_hex(hash)
                              << " from " << tx.sender().to_hex() << " nonce=" << tx.nonce();
    return hash;
}

std::optional<TransactionReceipt> AetherClient::get_transaction_receipt(const hash_t& hash) {
    json result = call("getTransactionReceipt", json::array({hash_to_hex(hash)}));
    if (result.is_null()) {
        return std::nullopt;
    }
    return wire::decode_receipt(result);
}

Transaction AetherClient::transfer(const KeyPair& from, const Address& to, amount_t amount,
                                   std::optional<std::string> memo) {
    nonce_t nonce = get_nonce(from.address());

    auto builder = TransactionBuilder::transfer(from, to, amount, nonce, config_);
    if (memo) {
        builder = builder.memo(std::move(*memo));
    }
    Transaction tx = builder.build(from).value();
    send_transaction(tx);
    return tx;
}

// ============================================================================
// AI Jobs
// ============================================================================

std::optional<AIJob> AetherClient::get_job(const hash_t& job_id) {
    json result = call("ai_getJob", json::array({hash_to_hex(job_id)}));
    if (result.is_null()) {
        return std::nullopt;
    }
    return wire::decode_job(result);
}

std::optional<ProviderReputation> AetherClient::get_provider_reputation(const Address& provider) {
    json result = call("ai_getProviderReputation", json::array({provider.to_hex()}));
    if (result.is_null()) {
        return std::nullopt;
    }
    return wire::decode_reputation(result, provider);
}

ProofVerdict AetherClient::verify_vcr(const VerifiableComputeReceipt& vcr) {
    json result = call("ai_verifyVCR", json::array({wire::encode_vcr(vcr)}));
    if (result.is_null()) {
        throw RpcError("ai_verifyVCR", RpcError::TRANSPORT_ERROR, "node returned no verdict");
    }
    return wire::decode_proof_verdict(result);
}

VcrVerification AetherClient::verify_job_receipt(const AIJob& job,
                                                 const VerifiableComputeReceipt& vcr) {
    RpcProofVerifier proofs(*this);
    ReceiptVerifier verifier(proofs);
    return verifier.verify(job, vcr);
}

VcrVerification AetherClient::verify_job_receipt(const AIJob& job) {
    RpcProofVerifier proofs(*this);
    ReceiptVerifier verifier(proofs);
    return verifier.verify(job);
}

// ============================================================================
// Waiting
// ============================================================================

TransactionReceipt AetherClient::wait_for_transaction(const hash_t& hash) {
    return wait_for_transaction(hash, WaitOptions::for_transactions(config_));
}

TransactionReceipt AetherClient::wait_for_transaction(const hash_t& hash,
                                                      const WaitOptions& options) {
    CompletionTracker<TransactionReceipt> tracker(
        "transaction " + hash_to_hex(hash),
        [this, &hash] { return get_transaction_receipt(hash); },
        [](const TransactionReceipt& receipt) {
            if (receipt.is_success()) {
                return Classification::success();
            }
            return Classification::failure(receipt.failure_reason.value_or("execution failed"));
        },
        options, clock_, log::tx_wait);
    return tracker.wait();
}

TransactionReceipt AetherClient::wait_for_transaction(std::string_view hash_hex) {
    auto hash = hash_from_hex(hash_hex);
    if (!hash) {
        throw ValidationError("not a transaction hash: '" + std::string(hash_hex) + "'");
    }
    return wait_for_transaction(*hash);
}

AIJob AetherClient::wait_for_job_completion(const hash_t& job_id) {
    return wait_for_job_completion(job_id, WaitOptions::for_jobs(config_));
}

AIJob AetherClient::wait_for_job_completion(const hash_t& job_id, const WaitOptions& options) {
    CompletionTracker<AIJob> tracker(
        "job " + hash_to_hex(job_id),
        [this, &job_id] { return get_job(job_id); },
        classify_job,
        options, clock_, log::job_wait);
    AIJob job = tracker.wait();
    normalize_completed_job(job);
    return job;
}

std::vector<AIJob> AetherClient::wait_for_jobs(const std::vector<hash_t>& job_ids) {
    return wait_for_jobs(job_ids, WaitOptions::for_jobs(config_));
}

std::vector<AIJob> AetherClient::wait_for_jobs(const std::vector<hash_t>& job_ids,
                                               const WaitOptions& options) {
    options.validate();

    std::vector<std::future<AIJob>> pending;
    pending.reserve(job_ids.size());
    for (const auto& id : job_ids) {
        pending.push_back(std::async(std::launch::async, [this, id, options] {
            return wait_for_job_completion(id, options);
        }));
    }

    AETHER_LOG_DEBUG(log::job_wait) << "Waiting for " << job_ids.size() << " job(s)";

    std::vector<AIJob> jobs;
    jobs.reserve(job_ids.size());
    std::exception_ptr first_failure;
    for (auto& future : pending) {
        try {
            jobs.push_back(future.get());
        } catch (const std::exception& e) {
            AETHER_LOG_DEBUG(log::job_wait) << "Job wait failed: " << e.what();
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }

    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
    return jobs;
}

}  // namespace aether
