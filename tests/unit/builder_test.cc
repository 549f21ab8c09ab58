#include <gtest/gtest.h>
#include "tx/builder.hh"
#include "crypto/signature.hh"
#include "core/error.hh"

namespace aether {
namespace {

class BuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        recipient_ = *Address::from_hex("0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa");
    }

    TransactionBuilder complete() const {
        return TransactionBuilder{}
            .signer(kp_)
            .recipient(recipient_)
            .amount(1000)
            .fee(10)
            .gas_limit(21'000)
            .nonce(0);
    }

    KeyPair kp_ = KeyPair::from_seed("builder");
    Address recipient_;
};

TEST_F(BuilderTest, BuildsSignedTransaction) {
    auto result = complete().build(kp_);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.error, BuildError::NONE);

    const Transaction& tx = result.value();
    EXPECT_EQ(tx.sender(), kp_.address());
    EXPECT_EQ(tx.recipient(), recipient_);
    EXPECT_EQ(tx.amount(), 1000u);
    EXPECT_EQ(tx.nonce(), 0u);
    EXPECT_EQ(tx.hash(), transaction_hash(tx.fields()));
    EXPECT_TRUE(ed25519_verify(kp_.public_key(), tx.hash(), tx.signature()));
    EXPECT_TRUE(tx.verify());
}

TEST_F(BuilderTest, ZeroNonceIsSet) {
    auto result = complete().nonce(0).build(kp_);
    EXPECT_TRUE(result.ok());
}

TEST_F(BuilderTest, SameInputsSameOutput) {
    auto a = complete().memo("hello").build(kp_);
    auto b = complete().memo("hello").build(kp_);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value().hash(), b.value().hash());
    EXPECT_EQ(a.value().signature(), b.value().signature());
    EXPECT_EQ(a.value(), b.value());
}

TEST_F(BuilderTest, SettersDoNotModifyReceiver) {
    auto base = complete();
    auto changed = base.amount(5).memo("x");

    EXPECT_EQ(*base.draft().amount, 1000u);
    EXPECT_FALSE(base.draft().memo.has_value());
    EXPECT_EQ(*changed.draft().amount, 5u);
    EXPECT_NE(base.build(kp_).value().hash(), changed.build(kp_).value().hash());
}

TEST_F(BuilderTest, OrderIndependent) {
    auto forward = TransactionBuilder{}
        .signer(kp_).recipient(recipient_).amount(1).fee(2).gas_limit(3).nonce(4);
    auto backward = TransactionBuilder{}
        .nonce(4).gas_limit(3).fee(2).amount(1).recipient(recipient_).signer(kp_);
    EXPECT_EQ(forward.build(kp_).value(), backward.build(kp_).value());
}

// ============================================================================
// Missing fields
// ============================================================================

TEST_F(BuilderTest, MissingRecipient) {
    auto result = TransactionBuilder{}
        .signer(kp_).amount(1).fee(1).gas_limit(1).nonce(0).build(kp_);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, BuildError::INCOMPLETE);
    EXPECT_EQ(result.field, "recipient");

    try {
        (void)result.value();
        FAIL() << "expected IncompleteTransaction";
    } catch (const IncompleteTransaction& e) {
        EXPECT_EQ(e.field(), "recipient");
    }
}

TEST_F(BuilderTest, MissingAmount) {
    auto result = TransactionBuilder{}
        .signer(kp_).recipient(recipient_).fee(1).gas_limit(1).nonce(0).build(kp_);
    EXPECT_EQ(result.error, BuildError::INCOMPLETE);
    EXPECT_EQ(result.field, "amount");
}

TEST_F(BuilderTest, MissingNonce) {
    auto result = TransactionBuilder{}
        .signer(kp_).recipient(recipient_).amount(1).fee(1).gas_limit(1).build(kp_);
    EXPECT_EQ(result.error, BuildError::INCOMPLETE);
    EXPECT_EQ(result.field, "nonce");
    EXPECT_THROW((void)result.value(), IncompleteTransaction);
}

TEST_F(BuilderTest, MissingEachRequiredField) {
    struct Case {
        const char* field;
        TransactionBuilder builder;
    };
    const TransactionBuilder rest = TransactionBuilder{}
        .recipient(recipient_).amount(1).fee(1).gas_limit(1).nonce(0);

    std::vector<Case> cases = {
        {"sender", rest.sender_public_key(kp_.public_key())},
        {"sender_public_key", rest.sender(kp_.address())},
        {"fee", TransactionBuilder{}.signer(kp_).recipient(recipient_).amount(1).gas_limit(1).nonce(0)},
        {"gas_limit", TransactionBuilder{}.signer(kp_).recipient(recipient_).amount(1).fee(1).nonce(0)},
    };

    for (const auto& c : cases) {
        auto result = c.builder.build(kp_);
        EXPECT_EQ(result.error, BuildError::INCOMPLETE) << c.field;
        EXPECT_EQ(result.field, c.field);
    }
}

TEST_F(BuilderTest, EmptyBuilderReportsSenderFirst) {
    auto result = TransactionBuilder{}.build(kp_);
    EXPECT_EQ(result.field, "sender");
}

// ============================================================================
// Malformed and inconsistent fields
// ============================================================================

TEST_F(BuilderTest, MalformedRecipient) {
    auto result = complete().recipient("0x1234").build(kp_);
    EXPECT_EQ(result.error, BuildError::MALFORMED_FIELD);
    EXPECT_EQ(result.field, "recipient");
    EXPECT_THROW((void)result.value(), ValidationError);
}

TEST_F(BuilderTest, MalformedPublicKey) {
    auto result = complete().sender_public_key("0xzz").build(kp_);
    EXPECT_EQ(result.error, BuildError::MALFORMED_FIELD);
    EXPECT_EQ(result.field, "sender_public_key");
}

TEST_F(BuilderTest, SenderNotDerivedFromKey) {
    auto result = complete().sender(recipient_).build(kp_);
    EXPECT_EQ(result.error, BuildError::KEY_MISMATCH);
    EXPECT_EQ(result.field, "sender");
}

TEST_F(BuilderTest, SigningKeyMustMatchSender) {
    auto other = KeyPair::from_seed("someone else");
    auto result = complete().build(other);
    EXPECT_EQ(result.error, BuildError::KEY_MISMATCH);
    EXPECT_EQ(result.field, "sender_public_key");
}

TEST_F(BuilderTest, InvalidMemoIsEncodingError) {
    auto result = complete().memo(std::string("\xff\xfe", 2)).build(kp_);
    EXPECT_EQ(result.error, BuildError::ENCODING);
    EXPECT_EQ(result.field, "memo");
    EXPECT_THROW((void)result.value(), ValidationError);
}

TEST_F(BuilderTest, OversizedPayloadIsEncodingError) {
    auto result = complete().payload(bytes_t(MAX_PAYLOAD_SIZE + 1, 0)).build(kp_);
    EXPECT_EQ(result.error, BuildError::ENCODING);
    EXPECT_EQ(result.field, "payload");
}

TEST_F(BuilderTest, OversizedMemoIsBlamedOnMemo) {
    auto result = complete().memo(std::string(MAX_MEMO_SIZE + 1, 'a')).build(kp_);
    EXPECT_EQ(result.error, BuildError::ENCODING);
    EXPECT_EQ(result.field, "memo");
    EXPECT_FALSE(result.transaction.has_value());
}

// ============================================================================
// Convenience constructors
// ============================================================================

TEST_F(BuilderTest, TransferUsesConfigDefaults) {
    ClientConfig config;
    auto tx = TransactionBuilder::transfer(kp_, recipient_, 1000, 0, config).build(kp_).value();
    EXPECT_EQ(tx.fee(), config.default_fee);
    EXPECT_EQ(tx.gas_limit(), config.default_gas_limit);
    EXPECT_FALSE(tx.payload().has_value());
}

TEST_F(BuilderTest, CallCarriesPayloadAndValue) {
    bytes_t data = {0xca, 0xfe};
    auto tx = TransactionBuilder::call(kp_, recipient_, data, 3, 25).build(kp_).value();
    ASSERT_TRUE(tx.payload().has_value());
    EXPECT_EQ(*tx.payload(), data);
    EXPECT_EQ(tx.amount(), 25u);
    EXPECT_EQ(tx.nonce(), 3u);
}

TEST_F(BuilderTest, WithDefaultsCanBeOverridden) {
    ClientConfig config;
    config.default_fee = 5;
    auto tx = TransactionBuilder::with_defaults(config)
        .signer(kp_).recipient(recipient_).amount(1).nonce(1).fee(9)
        .build(kp_).value();
    EXPECT_EQ(tx.fee(), 9u);
    EXPECT_EQ(tx.gas_limit(), config.default_gas_limit);
}

}  // namespace
}  // namespace aether
