#include "wire.hh"
#include "core/error.hh"
#include <charconv>
#include <cmath>

namespace aether::wire {

namespace {

[[noreturn]] void malformed(const char* field, const std::string& what) {
    throw ValidationError(std::string("invalid field '") + field + "': " + what);
}

const json& require_object(const json& value, const char* what) {
    if (!value.is_object()) {
        malformed(what, "expected an object");
    }
    return value;
}

const json& require(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        malformed(key, "missing");
    }
    return *it;
}

// nullptr when the key is absent or explicitly null
const json* optional_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string decode_string(const json& value, const char* field) {
    if (!value.is_string()) {
        malformed(field, "expected a string");
    }
    return value.get<std::string>();
}

bool decode_bool(const json& value, const char* field) {
    if (!value.is_boolean()) {
        malformed(field, "expected a boolean");
    }
    return value.get<bool>();
}

double decode_number(const json& value, const char* field) {
    if (!value.is_number()) {
        malformed(field, "expected a number");
    }
    double out = value.get<double>();
    if (!std::isfinite(out)) {
        malformed(field, "not finite");
    }
    return out;
}

}  // namespace

// ============================================================================
// Scalars
// ============================================================================

hash_t decode_hash(const json& value, const char* field) {
    auto hash = hash_from_hex(decode_string(value, field));
    if (!hash) {
        malformed(field, "expected 0x followed by 64 hex characters");
    }
    return *hash;
}

Address decode_address(const json& value, const char* field) {
    auto addr = Address::from_hex(decode_string(value, field));
    if (!addr) {
        malformed(field, "expected 0x followed by 40 hex characters");
    }
    return *addr;
}

bytes_t decode_bytes(const json& value, const char* field) {
    std::string text = decode_string(value, field);
    if (text.size() < 2 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        malformed(field, "expected 0x-prefixed hex");
    }
    auto bytes = hex_to_bytes(text);
    if (!bytes) {
        malformed(field, "expected 0x-prefixed hex");
    }
    return std::move(*bytes);
}

std::uint64_t decode_uint(const json& value, const char* field) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer()) {
        auto signed_value = value.get<std::int64_t>();
        if (signed_value < 0) {
            malformed(field, "must not be negative");
        }
        return static_cast<std::uint64_t>(signed_value);
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        std::uint64_t out = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
            malformed(field, "expected a decimal integer string");
        }
        return out;
    }
    malformed(field, "expected an unsigned integer");
}

// ============================================================================
// Requests
// ============================================================================

json encode_envelope(const TransactionEnvelope& envelope) {
    json out;
    out["from"] = envelope.from.to_hex();
    out["to"] = envelope.to.to_hex();
    out["value"] = envelope.value;
    out["data"] = envelope.data ? json(to_prefixed_hex(*envelope.data)) : json(nullptr);
    out["nonce"] = envelope.nonce;
    out["signature"] = to_prefixed_hex(envelope.signature);
    return out;
}

json encode_vcr(const VerifiableComputeReceipt& vcr) {
    json commitments = json::array();
    for (const auto& commitment : vcr.kzg_commitments) {
        commitments.push_back(to_prefixed_hex(commitment));
    }

    json out;
    out["job_id"] = hash_to_hex(vcr.job_id);
    out["provider"] = vcr.provider.to_hex();
    out["result"] = to_prefixed_hex(vcr.result);
    out["execution_trace"] = hash_to_hex(vcr.execution_trace);
    out["kzg_commitments"] = commitments;
    out["tee_attestation"] = to_prefixed_hex(vcr.tee_attestation);
    out["timestamp"] = vcr.timestamp;
    return out;
}

// ============================================================================
// Responses
// ============================================================================

AccountInfo decode_account(const json& value) {
    require_object(value, "account");

    AccountInfo account;
    if (const json* addr = optional_field(value, "address")) {
        account.address = decode_address(*addr, "address");
    }
    account.balance = decode_uint(require(value, "balance"), "balance");
    account.nonce = decode_uint(require(value, "nonce"), "nonce");
    if (const json* code = optional_field(value, "code_hash")) {
        account.code_hash = decode_hash(*code, "code_hash");
    }
    return account;
}

TransactionReceipt decode_receipt(const json& value) {
    require_object(value, "receipt");

    TransactionReceipt receipt;
    receipt.transaction_hash = decode_hash(require(value, "transaction_hash"), "transaction_hash");
    receipt.block_hash = decode_hash(require(value, "block_hash"), "block_hash");
    receipt.block_slot = decode_uint(require(value, "block_slot"), "block_slot");
    receipt.from = decode_address(require(value, "from"), "from");
    receipt.to = decode_address(require(value, "to"), "to");

    auto status = parse_execution_status(decode_string(require(value, "status"), "status"));
    if (!status) {
        malformed("status", "expected \"success\" or \"failed\"");
    }
    receipt.status = *status;

    if (const json* reason = optional_field(value, "failure_reason")) {
        receipt.failure_reason = decode_string(*reason, "failure_reason");
    }
    receipt.gas_used = decode_uint(require(value, "gas_used"), "gas_used");

    if (const json* logs = optional_field(value, "logs")) {
        if (!logs->is_array()) {
            malformed("logs", "expected an array");
        }
        for (const auto& entry : *logs) {
            require_object(entry, "logs[]");
            ReceiptLog log_entry;
            log_entry.address = decode_address(require(entry, "address"), "logs[].address");
            if (const json* topics = optional_field(entry, "topics")) {
                if (!topics->is_array()) {
                    malformed("logs[].topics", "expected an array");
                }
                for (const auto& topic : *topics) {
                    log_entry.topics.push_back(decode_hash(topic, "logs[].topics[]"));
                }
            }
            if (const json* data = optional_field(entry, "data")) {
                log_entry.data = decode_bytes(*data, "logs[].data");
            }
            receipt.logs.push_back(std::move(log_entry));
        }
    }
    return receipt;
}

VerifiableComputeReceipt decode_vcr(const json& value) {
    require_object(value, "vcr");

    VerifiableComputeReceipt vcr;
    vcr.job_id = decode_hash(require(value, "job_id"), "job_id");
    vcr.provider = decode_address(require(value, "provider"), "provider");
    vcr.result = decode_bytes(require(value, "result"), "result");
    vcr.execution_trace = decode_hash(require(value, "execution_trace"), "execution_trace");

    const json& commitments = require(value, "kzg_commitments");
    if (!commitments.is_array()) {
        malformed("kzg_commitments", "expected an array");
    }
    for (const auto& commitment : commitments) {
        vcr.kzg_commitments.push_back(decode_bytes(commitment, "kzg_commitments[]"));
    }

    vcr.tee_attestation = decode_bytes(require(value, "tee_attestation"), "tee_attestation");
    vcr.timestamp = decode_uint(require(value, "timestamp"), "timestamp");
    return vcr;
}

AIJob decode_job(const json& value) {
    require_object(value, "job");

    AIJob job;
    job.id = decode_hash(require(value, "id"), "id");
    job.creator = decode_address(require(value, "creator"), "creator");
    job.model_hash = decode_hash(require(value, "model_hash"), "model_hash");
    if (const json* input = optional_field(value, "input_data")) {
        job.input_data = decode_bytes(*input, "input_data");
    }
    job.aic_locked = decode_uint(require(value, "aic_locked"), "aic_locked");

    auto status = parse_job_status(decode_string(require(value, "status"), "status"));
    if (!status) {
        malformed("status", "unknown job status");
    }
    job.status = *status;

    if (const json* provider = optional_field(value, "provider")) {
        job.provider = decode_address(*provider, "provider");
    }
    if (const json* result = optional_field(value, "result")) {
        job.result = decode_bytes(*result, "result");
    }
    if (const json* result_hash = optional_field(value, "result_hash")) {
        job.result_hash = decode_hash(*result_hash, "result_hash");
    }
    if (const json* vcr = optional_field(value, "vcr")) {
        job.vcr = decode_vcr(*vcr);
    }
    return job;
}

ProofVerdict decode_proof_verdict(const json& value) {
    require_object(value, "verdict");

    ProofVerdict verdict;
    verdict.valid = decode_bool(require(value, "valid"), "valid");
    verdict.kzg_valid = decode_bool(require(value, "kzg_valid"), "kzg_valid");
    verdict.tee_valid = decode_bool(require(value, "tee_valid"), "tee_valid");
    return verdict;
}

ProviderReputation decode_reputation(const json& value, const Address& provider) {
    require_object(value, "reputation");

    // Nodes have shipped both spellings
    auto either = [&value](const char* snake, const char* camel) -> const json& {
        if (const json* found = optional_field(value, snake)) return *found;
        if (const json* found = optional_field(value, camel)) return *found;
        malformed(snake, "missing");
    };

    ProviderReputation rep;
    rep.provider = provider;
    rep.score = decode_number(require(value, "score"), "score");
    rep.completed_jobs = decode_uint(either("completed_jobs", "completedJobs"), "completed_jobs");
    rep.average_time = decode_number(either("average_time", "averageTime"), "average_time");
    return rep;
}

// ============================================================================
// JSON-RPC Framing
// ============================================================================

json make_request(std::uint64_t id, const std::string& method, const json& params) {
    json request;
    request["jsonrpc"] = "2.0";
    request["id"] = id;
    request["method"] = method;
    request["params"] = params.is_null() ? json::array() : params;
    return request;
}

json unwrap_response(const std::string& method, const json& response) {
    if (!response.is_object()) {
        throw RpcError(method, RpcError::TRANSPORT_ERROR, "response is not a JSON object");
    }

    auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        std::int64_t code = RpcError::TRANSPORT_ERROR;
        std::string message = "unknown error";
        if (error->is_object()) {
            auto c = error->find("code");
            if (c != error->end() && c->is_number_integer()) {
                code = c->get<std::int64_t>();
            }
            auto m = error->find("message");
            if (m != error->end() && m->is_string()) {
                message = m->get<std::string>();
            }
        } else if (error->is_string()) {
            message = error->get<std::string>();
        }
        throw RpcError(method, code, message);
    }

    auto result = response.find("result");
    if (result == response.end()) {
        throw RpcError(method, RpcError::TRANSPORT_ERROR, "response has neither result nor error");
    }
    return *result;
}

}  // namespace aether::wire
