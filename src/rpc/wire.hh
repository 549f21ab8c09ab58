#pragma once

#include "types.hh"
#include "ai/job.hh"
#include "ai/receipt_verifier.hh"
#include "tx/transaction.hh"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace aether {

using json = nlohmann::json;

// ============================================================================
// JSON Wire Codec
// ============================================================================
//
// Hashes, addresses, signatures and byte strings travel as 0x-prefixed
// lowercase hex. Unsigned integers are written as JSON numbers and accepted
// as numbers or decimal strings. Object keys are snake_case.
//
// Every decoder validates at the boundary and throws ValidationError naming
// the offending field; nothing half-parsed escapes.

namespace wire {

// ---- Requests ----

[[nodiscard]] json encode_envelope(const TransactionEnvelope& envelope);
[[nodiscard]] json encode_vcr(const VerifiableComputeReceipt& vcr);

// ---- Responses ----

[[nodiscard]] AccountInfo decode_account(const json& value);
[[nodiscard]] TransactionReceipt decode_receipt(const json& value);
[[nodiscard]] AIJob decode_job(const json& value);
[[nodiscard]] VerifiableComputeReceipt decode_vcr(const json& value);
[[nodiscard]] ProofVerdict decode_proof_verdict(const json& value);
[[nodiscard]] ProviderReputation decode_reputation(const json& value, const Address& provider);

// ---- Scalars ----

[[nodiscard]] hash_t decode_hash(const json& value, const char* field);
[[nodiscard]] Address decode_address(const json& value, const char* field);
[[nodiscard]] bytes_t decode_bytes(const json& value, const char* field);
[[nodiscard]] std::uint64_t decode_uint(const json& value, const char* field);

// ---- JSON-RPC 2.0 framing (for transports) ----

[[nodiscard]] json make_request(std::uint64_t id, const std::string& method, const json& params);

// Returns "result" (null for an absent record). Throws RpcError for an error
// object or a malformed response.
[[nodiscard]] json unwrap_response(const std::string& method, const json& response);

}  // namespace wire

}  // namespace aether
