#include <gtest/gtest.h>
#include "rpc/wire.hh"
#include "core/error.hh"

using namespace aether;

namespace {

const char* kHashA = "0x1111111111111111111111111111111111111111111111111111111111111111";
const char* kHashB = "0x2222222222222222222222222222222222222222222222222222222222222222";
const char* kAddrA = "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
const char* kAddrB = "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";

json receipt_json() {
    return json{
        {"transaction_hash", kHashA},
        {"block_hash", kHashB},
        {"block_slot", 42},
        {"from", kAddrA},
        {"to", kAddrB},
        {"status", "success"},
        {"gas_used", "21000"},
        {"logs", json::array({
            json{{"address", kAddrB}, {"topics", json::array({kHashA})}, {"data", "0x0102"}},
        })},
    };
}

}  // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(WireScalarTest, UnsignedFromNumberOrString) {
    EXPECT_EQ(wire::decode_uint(json(7), "n"), 7u);
    EXPECT_EQ(wire::decode_uint(json("18446744073709551615"), "n"), UINT64_MAX);
    EXPECT_EQ(wire::decode_uint(json(std::uint64_t{1} << 60), "n"), std::uint64_t{1} << 60);
}

TEST(WireScalarTest, UnsignedRejectsJunk) {
    EXPECT_THROW((void)wire::decode_uint(json(-1), "n"), ValidationError);
    EXPECT_THROW((void)wire::decode_uint(json("12abc"), "n"), ValidationError);
    EXPECT_THROW((void)wire::decode_uint(json(""), "n"), ValidationError);
    EXPECT_THROW((void)wire::decode_uint(json("-5"), "n"), ValidationError);
    EXPECT_THROW((void)wire::decode_uint(json(1.5), "n"), ValidationError);
    EXPECT_THROW((void)wire::decode_uint(json("18446744073709551616"), "n"), ValidationError);
}

TEST(WireScalarTest, HexFields) {
    EXPECT_EQ(hash_to_hex(wire::decode_hash(json(kHashA), "h")), kHashA);
    EXPECT_EQ(wire::decode_address(json(kAddrA), "a").to_hex(), kAddrA);
    EXPECT_EQ(wire::decode_bytes(json("0x"), "b"), bytes_t{});
    EXPECT_EQ(wire::decode_bytes(json("0xCAFE"), "b"), (bytes_t{0xca, 0xfe}));

    EXPECT_THROW((void)wire::decode_hash(json("0x11"), "h"), ValidationError);
    EXPECT_THROW((void)wire::decode_address(json(5), "a"), ValidationError);
    EXPECT_THROW((void)wire::decode_bytes(json("cafe"), "b"), ValidationError);
}

TEST(WireScalarTest, ErrorNamesField) {
    try {
        (void)wire::decode_hash(json("nope"), "block_hash");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("block_hash"), std::string::npos);
    }
}

// ============================================================================
// Requests
// ============================================================================

TEST(WireEncodeTest, Envelope) {
    TransactionEnvelope env;
    env.from.bytes.fill(0xaa);
    env.to.bytes.fill(0xbb);
    env.value = 1000;
    env.nonce = 3;
    env.signature.fill(0x01);

    json out = wire::encode_envelope(env);
    EXPECT_EQ(out["from"], kAddrA);
    EXPECT_EQ(out["to"], kAddrB);
    EXPECT_EQ(out["value"], 1000);
    EXPECT_EQ(out["nonce"], 3);
    EXPECT_TRUE(out["data"].is_null());
    EXPECT_EQ(out["signature"].get<std::string>().size(), 2u + 128u);

    env.data = bytes_t{0xab};
    EXPECT_EQ(wire::encode_envelope(env)["data"], "0xab");
}

TEST(WireEncodeTest, VcrRoundTrip) {
    VerifiableComputeReceipt vcr;
    vcr.job_id.fill(0x11);
    vcr.provider.bytes.fill(0xaa);
    vcr.result = {1, 2};
    vcr.execution_trace.fill(0x22);
    vcr.kzg_commitments = {bytes_t{3}, bytes_t{4, 5}};
    vcr.tee_attestation = {6};
    vcr.timestamp = 99;

    json out = wire::encode_vcr(vcr);
    EXPECT_EQ(out["job_id"], kHashA);
    EXPECT_EQ(out["kzg_commitments"].size(), 2u);
    EXPECT_EQ(wire::decode_vcr(out), vcr);
}

// ============================================================================
// Responses
// ============================================================================

TEST(WireDecodeTest, Receipt) {
    auto receipt = wire::decode_receipt(receipt_json());
    EXPECT_EQ(hash_to_hex(receipt.transaction_hash), kHashA);
    EXPECT_EQ(receipt.block_slot, 42u);
    EXPECT_EQ(receipt.from.to_hex(), kAddrA);
    EXPECT_TRUE(receipt.is_success());
    EXPECT_EQ(receipt.gas_used, 21000u);
    ASSERT_EQ(receipt.logs.size(), 1u);
    EXPECT_EQ(receipt.logs[0].address.to_hex(), kAddrB);
    ASSERT_EQ(receipt.logs[0].topics.size(), 1u);
    EXPECT_EQ(receipt.logs[0].data, (bytes_t{1, 2}));
}

TEST(WireDecodeTest, FailedReceipt) {
    json value = receipt_json();
    value["status"] = "failed";
    value["failure_reason"] = "out of gas";

    auto receipt = wire::decode_receipt(value);
    EXPECT_FALSE(receipt.is_success());
    EXPECT_EQ(receipt.failure_reason, "out of gas");
}

TEST(WireDecodeTest, ReceiptShapeErrors) {
    json missing = receipt_json();
    missing.erase("block_hash");
    EXPECT_THROW((void)wire::decode_receipt(missing), ValidationError);

    json bad_status = receipt_json();
    bad_status["status"] = "pending";
    EXPECT_THROW((void)wire::decode_receipt(bad_status), ValidationError);

    EXPECT_THROW((void)wire::decode_receipt(json::array()), ValidationError);
}

TEST(WireDecodeTest, Job) {
    json value = {
        {"id", kHashA},
        {"creator", kAddrA},
        {"model_hash", kHashB},
        {"input_data", "0x0a0b"},
        {"aic_locked", 500},
        {"status", "computing"},
        {"provider", kAddrB},
        {"result", nullptr},
    };

    auto job = wire::decode_job(value);
    EXPECT_EQ(job.id_hex(), kHashA);
    EXPECT_EQ(job.status, JobStatus::COMPUTING);
    EXPECT_EQ(job.input_data, (bytes_t{0x0a, 0x0b}));
    EXPECT_EQ(job.aic_locked, 500u);
    ASSERT_TRUE(job.provider.has_value());
    EXPECT_EQ(job.provider->to_hex(), kAddrB);
    EXPECT_FALSE(job.result.has_value());
    EXPECT_FALSE(job.vcr.has_value());

    value["status"] = "exploded";
    EXPECT_THROW((void)wire::decode_job(value), ValidationError);
}

TEST(WireDecodeTest, AccountAndReputation) {
    auto account = wire::decode_account(json{{"balance", "1000000"}, {"nonce", 4}});
    EXPECT_EQ(account.balance, 1'000'000u);
    EXPECT_EQ(account.nonce, 4u);
    EXPECT_FALSE(account.code_hash.has_value());

    Address provider;
    provider.bytes.fill(0xaa);
    auto snake = wire::decode_reputation(
        json{{"score", 0.9}, {"completed_jobs", 12}, {"average_time", 3.5}}, provider);
    auto camel = wire::decode_reputation(
        json{{"score", 0.9}, {"completedJobs", 12}, {"averageTime", 3.5}}, provider);
    EXPECT_EQ(snake, camel);
    EXPECT_EQ(snake.completed_jobs, 12u);
    EXPECT_EQ(snake.provider, provider);
}

TEST(WireDecodeTest, ProofVerdict) {
    auto verdict = wire::decode_proof_verdict(
        json{{"valid", true}, {"kzg_valid", true}, {"tee_valid", false}});
    EXPECT_TRUE(verdict.valid);
    EXPECT_TRUE(verdict.kzg_valid);
    EXPECT_FALSE(verdict.tee_valid);

    EXPECT_THROW((void)wire::decode_proof_verdict(json{{"valid", 1}, {"kzg_valid", true},
                                                       {"tee_valid", true}}),
                 ValidationError);
}

// ============================================================================
// JSON-RPC framing
// ============================================================================

TEST(WireFramingTest, Request) {
    json request = wire::make_request(7, "getAccount", json::array({kAddrA}));
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(request["id"], 7);
    EXPECT_EQ(request["method"], "getAccount");
    EXPECT_EQ(request["params"][0], kAddrA);
}

TEST(WireFramingTest, ResultAndNull) {
    EXPECT_EQ(wire::unwrap_response("m", json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", 5}}), 5);
    EXPECT_TRUE(wire::unwrap_response("m", json{{"id", 1}, {"result", nullptr}}).is_null());
}

TEST(WireFramingTest, ErrorObject) {
    json response = {{"id", 1}, {"error", {{"code", -32602}, {"message", "invalid params"}}}};
    try {
        (void)wire::unwrap_response("getAccount", response);
        FAIL() << "expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code(), -32602);
        EXPECT_EQ(e.method(), "getAccount");
        EXPECT_EQ(e.kind(), ErrorKind::RPC);
    }

    EXPECT_THROW((void)wire::unwrap_response("m", json{{"id", 1}}), RpcError);
    EXPECT_THROW((void)wire::unwrap_response("m", json("text")), RpcError);
}
