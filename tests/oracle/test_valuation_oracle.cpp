// BONDVAULT - Valuation Oracle Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/crypto/sha256.h"
#include "bondvault/oracle/round_codec.h"
#include "bondvault/oracle/valuation_oracle.h"
#include "../test_helpers.h"

namespace bondvault {
namespace oracle {
namespace test {

namespace {

relay::DomainId Domain(const std::string& name) {
    return SHA256Hash(name);
}

PriceRound MakeRound(RoundId id, Answer answer, Timestamp at) {
    PriceRound r;
    r.roundId = id;
    r.answer = answer;
    r.startedAt = at - 10;
    r.updatedAt = at;
    r.answeredInRound = id;
    return r;
}

} // namespace

class ValuationOracleTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.admin = admin_;
        config_.sourceDomain = Domain("source");
        config_.sourceSender = MakeAddress(0x51);
        config_.decimals = 8;
        config_.description = "BOND / USD";
    }

    relay::MessageContext Context(uint32_t version = 1) const {
        relay::MessageContext ctx;
        ctx.messageId = Domain("msg");
        ctx.sourceDomain = config_.sourceDomain;
        ctx.originSender = config_.sourceSender;
        ctx.messengerVersion = version;
        return ctx;
    }

    const Address admin_ = MakeAddress(0xAD);
    ValuationOracle::Config config_;
};

// ============================================================================
// Construction and Metadata
// ============================================================================

TEST_F(ValuationOracleTest, Metadata) {
    ValuationOracle oracle(config_);
    EXPECT_EQ(oracle.Decimals(), 8);
    EXPECT_EQ(oracle.Description(), "BOND / USD");
    EXPECT_EQ(oracle.Version(), ValuationOracle::VERSION);
    EXPECT_EQ(oracle.SourceDomain(), config_.sourceDomain);
    EXPECT_EQ(oracle.SourceSender(), config_.sourceSender);
    EXPECT_EQ(oracle.Admin(), admin_);
    EXPECT_EQ(oracle.MinMessengerVersion(), 1u);
    EXPECT_EQ(oracle.OrderPolicy(), RoundOrderPolicy::AcceptAll);
    EXPECT_STREQ(RoundOrderPolicyToString(oracle.OrderPolicy()), "accept-all");
}

TEST_F(ValuationOracleTest, ConstructorValidation) {
    auto bad = config_;
    bad.sourceSender = Address();
    EXPECT_OP_ERROR(ValuationOracle{bad}, ErrorCode::ZeroAddress);

    bad = config_;
    bad.decimals = 19;
    EXPECT_OP_ERROR(ValuationOracle{bad}, ErrorCode::InvalidDecimals);

    bad = config_;
    bad.admin = Address();
    EXPECT_OP_ERROR(ValuationOracle{bad}, ErrorCode::ZeroAddress);

    bad = config_;
    bad.minMessengerVersion = 0;
    EXPECT_OP_ERROR(ValuationOracle{bad}, ErrorCode::InvalidMessengerVersion);
}

TEST_F(ValuationOracleTest, EmptyOracleReportsAbsentRound) {
    ValuationOracle oracle(config_);
    PriceRound latest = oracle.LatestRoundData();
    EXPECT_TRUE(latest.IsAbsent());
    EXPECT_EQ(latest, PriceRound{});
    EXPECT_EQ(oracle.LatestRoundId(), 0u);
    EXPECT_OP_ERROR(oracle.GetRoundData(1), ErrorCode::RoundNotFound);
}

// ============================================================================
// Delivery
// ============================================================================

TEST_F(ValuationOracleTest, DeliveredRoundIsServedExactly) {
    ValuationOracle oracle(config_);
    PriceRound round = MakeRound(7, 99500000, 1700000000);
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(round));

    EXPECT_EQ(oracle.LatestRoundData(), round);
    EXPECT_EQ(oracle.GetRoundData(7), round);
    EXPECT_EQ(oracle.LatestRoundId(), 7u);
    EXPECT_EQ(oracle.RoundCount(), 1u);
}

TEST_F(ValuationOracleTest, WideRoundFieldsAreAccepted) {
    ValuationOracle oracle(config_);
    // Phase 1 round 7 quoting 10.0 at 18 decimals
    PriceRound round = MakeRound((RoundId(1) << 64) + 7,
                                 Answer(10) * Answer(1000000000000000000ULL), 1700000000);
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(round));

    EXPECT_EQ(oracle.LatestRoundId(), round.roundId);
    EXPECT_EQ(oracle.LatestRoundData(), round);
    EXPECT_EQ(oracle.GetRoundData(round.roundId).answer, round.answer);
}

TEST_F(ValuationOracleTest, RedeliveryOverwritesRound) {
    ValuationOracle oracle(config_);
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(3, 100, 1000)));
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(3, 105, 1050)));

    EXPECT_EQ(oracle.RoundCount(), 1u);
    EXPECT_EQ(oracle.GetRoundData(3).answer, 105);
    EXPECT_EQ(oracle.GetRoundData(3).updatedAt, 1050);
}

TEST_F(ValuationOracleTest, OlderRoundMovesLatestBack) {
    ValuationOracle oracle(config_);
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(5, 100, 1000)));
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(4, 90, 900)));

    EXPECT_EQ(oracle.LatestRoundId(), 4u);
    EXPECT_EQ(oracle.LatestRoundData().answer, 90);
    EXPECT_EQ(oracle.GetRoundData(5).answer, 100);
}

TEST_F(ValuationOracleTest, RejectNonIncreasingPolicy) {
    config_.orderPolicy = RoundOrderPolicy::RejectNonIncreasing;
    ValuationOracle oracle(config_);
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(5, 100, 1000)));

    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(4, 90, 900))),
                    ErrorCode::InvalidPayload);
    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(5, 90, 900))),
                    ErrorCode::InvalidPayload);
    EXPECT_EQ(oracle.LatestRoundId(), 5u);
    EXPECT_EQ(oracle.GetRoundData(5).answer, 100);

    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(6, 110, 1100)));
    EXPECT_EQ(oracle.LatestRoundId(), 6u);
}

TEST_F(ValuationOracleTest, WrongSenderIsRejected) {
    ValuationOracle oracle(config_);
    auto ctx = Context();
    ctx.originSender = MakeAddress(0x66);

    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(ctx, EncodeRound(MakeRound(1, 100, 1000))),
                    ErrorCode::InvalidSource);
    EXPECT_TRUE(oracle.LatestRoundData().IsAbsent());
}

TEST_F(ValuationOracleTest, WrongDomainIsRejected) {
    ValuationOracle oracle(config_);
    auto ctx = Context();
    ctx.sourceDomain = Domain("elsewhere");

    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(ctx, EncodeRound(MakeRound(1, 100, 1000))),
                    ErrorCode::InvalidSource);
    EXPECT_EQ(oracle.RoundCount(), 0u);
}

TEST_F(ValuationOracleTest, MalformedPayloadIsRejected) {
    ValuationOracle oracle(config_);
    std::vector<uint8_t> shortPayload(64, 0);
    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(Context(), shortPayload),
                    ErrorCode::InvalidPayload);
    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(PriceRound{})),
                    ErrorCode::InvalidPayload);
    EXPECT_EQ(oracle.RoundCount(), 0u);
}

// ============================================================================
// Messenger Version Gate
// ============================================================================

TEST_F(ValuationOracleTest, OldMessengerVersionIsRefused) {
    config_.minMessengerVersion = 2;
    ValuationOracle oracle(config_);

    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(Context(1), EncodeRound(MakeRound(1, 100, 1000))),
                    ErrorCode::UnauthorizedMessenger);
    oracle.ReceiveCrossDomainMessage(Context(2), EncodeRound(MakeRound(1, 100, 1000)));
    EXPECT_EQ(oracle.LatestRoundId(), 1u);
}

TEST_F(ValuationOracleTest, MinimumVersionOnlyIncreases) {
    ValuationOracle oracle(config_);

    EXPECT_OP_ERROR(oracle.UpdateMinMessengerVersion(MakeAddress(0x01), 2), ErrorCode::OnlyAdmin);
    EXPECT_OP_ERROR(oracle.UpdateMinMessengerVersion(admin_, 1), ErrorCode::InvalidMessengerVersion);

    oracle.UpdateMinMessengerVersion(admin_, 3);
    EXPECT_EQ(oracle.MinMessengerVersion(), 3u);
    EXPECT_OP_ERROR(oracle.UpdateMinMessengerVersion(admin_, 2), ErrorCode::InvalidMessengerVersion);
    auto payload = EncodeRound(MakeRound(1, 1, 1000));
    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(Context(2), payload),
                    ErrorCode::UnauthorizedMessenger);
    oracle.ReceiveCrossDomainMessage(Context(3), payload);
    EXPECT_EQ(oracle.LatestRoundId(), 1u);
}

// ============================================================================
// Notifications
// ============================================================================

TEST_F(ValuationOracleTest, CallbackSeesEachStoredRound) {
    ValuationOracle oracle(config_);
    std::vector<PriceRound> seen;
    oracle.OnRoundDataUpdated([&seen](const PriceRound& r) { seen.push_back(r); });

    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(1, 100, 1000)));
    auto ctx = Context();
    ctx.originSender = MakeAddress(0x66);
    auto payload = EncodeRound(MakeRound(2, 1, 1100));
    EXPECT_OP_ERROR(oracle.ReceiveCrossDomainMessage(ctx, payload), ErrorCode::InvalidSource);
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(2, 120, 1200)));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].roundId, 1u);
    EXPECT_EQ(seen[1].answer, 120);
}

TEST_F(ValuationOracleTest, CallbackMayQueryOracle) {
    ValuationOracle oracle(config_);
    RoundId observed = 0;
    oracle.OnRoundDataUpdated([&](const PriceRound&) { observed = oracle.LatestRoundId(); });
    oracle.ReceiveCrossDomainMessage(Context(), EncodeRound(MakeRound(9, 100, 1000)));
    EXPECT_EQ(observed, 9u);
}

} // namespace test
} // namespace oracle
} // namespace bondvault
