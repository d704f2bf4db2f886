// BONDVAULT - Round Payload Codec Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/oracle/round_codec.h"
#include "../test_helpers.h"

namespace bondvault {
namespace oracle {
namespace test {

namespace {

PriceRound SampleRound() {
    PriceRound r;
    r.roundId = 42;
    r.answer = 101500000;
    r.startedAt = 1700000000;
    r.updatedAt = 1700000060;
    r.answeredInRound = 42;
    return r;
}

} // namespace

TEST(RoundCodecTest, LayoutIsFiveBigEndianWords) {
    auto payload = EncodeRound(SampleRound());
    ASSERT_EQ(payload.size(), ROUND_PAYLOAD_SIZE);
    ASSERT_EQ(payload.size(), 160u);

    // roundId occupies the low byte of word 0
    for (size_t i = 0; i < 31; ++i) {
        EXPECT_EQ(payload[i], 0) << i;
    }
    EXPECT_EQ(payload[31], 42);

    // word 3 holds updatedAt in the last eight bytes
    EXPECT_EQ(ReadBE64(payload.data() + 3 * ABI_WORD_SIZE + 24), 1700000060u);
}

TEST(RoundCodecTest, DecodeRecoversEveryField) {
    PriceRound original = SampleRound();
    EXPECT_EQ(DecodeRound(EncodeRound(original)), original);
}

TEST(RoundCodecTest, NegativeAnswerIsSignExtended) {
    PriceRound r = SampleRound();
    r.answer = -5;
    auto payload = EncodeRound(r);
    for (size_t i = ABI_WORD_SIZE; i < 2 * ABI_WORD_SIZE - 1; ++i) {
        EXPECT_EQ(payload[i], 0xFF) << i;
    }
    EXPECT_EQ(payload[2 * ABI_WORD_SIZE - 1], 0xFB);
    EXPECT_EQ(DecodeRound(payload).answer, -5);
}

TEST(RoundCodecTest, ExtremeAnswers) {
    PriceRound r = SampleRound();
    r.answer = MinAnswer();
    auto payload = EncodeRound(r);
    EXPECT_EQ(payload[ABI_WORD_SIZE], 0x80);
    EXPECT_EQ(DecodeRound(payload).answer, MinAnswer());

    r.answer = MaxAnswer();
    payload = EncodeRound(r);
    EXPECT_EQ(payload[ABI_WORD_SIZE], 0x7F);
    EXPECT_EQ(DecodeRound(payload).answer, MaxAnswer());

    r.answer = MaxAnswer() + 1;
    EXPECT_OP_ERROR(EncodeRound(r), ErrorCode::InvalidPayload);
}

TEST(RoundCodecTest, AnswerBeyondSixtyFourBits) {
    // 10.0 from an 18-decimal feed
    PriceRound r = SampleRound();
    r.answer = Answer(10) * Answer(1000000000000000000ULL);
    auto payload = EncodeRound(r);

    // 10^19 = 0x8AC7230489E80000 sits in the last eight bytes, zero padded
    for (size_t i = ABI_WORD_SIZE; i < 2 * ABI_WORD_SIZE - 8; ++i) {
        EXPECT_EQ(payload[i], 0) << i;
    }
    EXPECT_EQ(ReadBE64(payload.data() + 2 * ABI_WORD_SIZE - 8), 10000000000000000000ULL);
    EXPECT_EQ(DecodeRound(payload).answer, r.answer);

    r.answer = -r.answer;
    EXPECT_EQ(DecodeRound(EncodeRound(r)).answer, r.answer);
}

TEST(RoundCodecTest, PhasedRoundIds) {
    // Phase 2 in bits 64..79 above aggregator round 7
    PriceRound r = SampleRound();
    r.roundId = (RoundId(2) << 64) + 7;
    r.answeredInRound = r.roundId;
    auto payload = EncodeRound(r);
    EXPECT_EQ(payload[ABI_WORD_SIZE - 9], 0x02);
    EXPECT_EQ(payload[ABI_WORD_SIZE - 1], 0x07);

    PriceRound decoded = DecodeRound(payload);
    EXPECT_EQ(decoded.roundId, r.roundId);
    EXPECT_EQ(decoded.answeredInRound, r.roundId);

    r.roundId = MaxRoundId();
    EXPECT_EQ(DecodeRound(EncodeRound(r)).roundId, MaxRoundId());
}

TEST(RoundCodecTest, RoundIdsLimitedToEightyBits) {
    PriceRound r = SampleRound();
    r.roundId = MaxRoundId() + 1;
    EXPECT_OP_ERROR(EncodeRound(r), ErrorCode::InvalidPayload);

    // bit 80 set on the wire
    auto payload = EncodeRound(SampleRound());
    payload[ABI_WORD_SIZE - 11] = 0x01;
    EXPECT_OP_ERROR(DecodeRound(payload), ErrorCode::InvalidPayload);

    payload = EncodeRound(SampleRound());
    payload[5 * ABI_WORD_SIZE - 11] = 0x01;
    EXPECT_OP_ERROR(DecodeRound(payload), ErrorCode::InvalidPayload);
}

TEST(RoundCodecTest, RejectsWrongLength) {
    auto payload = EncodeRound(SampleRound());
    payload.pop_back();
    EXPECT_OP_ERROR(DecodeRound(payload), ErrorCode::InvalidPayload);

    payload.resize(ROUND_PAYLOAD_SIZE + 32);
    EXPECT_OP_ERROR(DecodeRound(payload), ErrorCode::InvalidPayload);
    EXPECT_OP_ERROR(DecodeRound({}), ErrorCode::InvalidPayload);
}

TEST(RoundCodecTest, RejectsRoundZero) {
    PriceRound r = SampleRound();
    r.roundId = 0;
    EXPECT_OP_ERROR(DecodeRound(EncodeRound(r)), ErrorCode::InvalidPayload);
}

TEST(RoundCodecTest, RejectsOversizedWords) {
    auto payload = EncodeRound(SampleRound());
    payload[0] = 0x01;
    EXPECT_OP_ERROR(DecodeRound(payload), ErrorCode::InvalidPayload);

    // updatedAt beyond int64
    payload = EncodeRound(SampleRound());
    payload[3 * ABI_WORD_SIZE + 24] = 0x80;
    EXPECT_OP_ERROR(DecodeRound(payload), ErrorCode::InvalidPayload);
}

TEST(RoundCodecTest, HighBitOfAnswerWordIsTheSign) {
    auto payload = EncodeRound(SampleRound());
    payload[ABI_WORD_SIZE] = 0x80;
    EXPECT_LT(DecodeRound(payload).answer, 0);
}

TEST(RoundCodecTest, EncodeRejectsNegativeTimestamps) {
    PriceRound r = SampleRound();
    r.startedAt = -1;
    EXPECT_OP_ERROR(EncodeRound(r), ErrorCode::InvalidPayload);
}

TEST(RoundCodecTest, WordHelpers) {
    uint8_t word[ABI_WORD_SIZE];
    abi::EncodeWord(word, Word256(0x0102030405060708ULL));
    EXPECT_EQ(abi::DecodeWord(word), 0x0102030405060708ULL);
    EXPECT_EQ(word[24], 0x01);

    ASSERT_TRUE(abi::EncodeInt(word, -1));
    for (size_t i = 0; i < ABI_WORD_SIZE; ++i) {
        EXPECT_EQ(word[i], 0xFF) << i;
    }
    EXPECT_EQ(abi::DecodeInt(word), -1);
    EXPECT_FALSE(abi::EncodeInt(word, MinAnswer() - 1));
}

} // namespace test
} // namespace oracle
} // namespace bondvault
