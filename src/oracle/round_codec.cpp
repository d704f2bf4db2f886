// BONDVAULT - Round Payload Codec Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/oracle/round_codec.h"
#include "bondvault/core/errors.h"

#include <limits>

namespace bondvault {
namespace oracle {

namespace abi {

bool EncodeInt(uint8_t* word, const Answer& value) {
    Word256 bits;
    if (!ToTwosComplement(value, bits)) return false;
    EncodeWord(word, bits);
    return true;
}

Answer DecodeInt(const uint8_t* word) {
    return FromTwosComplement(DecodeWord(word));
}

} // namespace abi

namespace {

bool DecodeRoundId(const uint8_t* word, RoundId& out) {
    Word256 v = abi::DecodeWord(word);
    if (v > Word256(MaxRoundId())) return false;
    out = RoundId(v);
    return true;
}

bool DecodeTimestamp(const uint8_t* word, Timestamp& out) {
    Word256 v = abi::DecodeWord(word);
    if (v > std::numeric_limits<Timestamp>::max()) return false;
    out = v.convert_to<Timestamp>();
    return true;
}

} // namespace

std::vector<uint8_t> EncodeRound(const PriceRound& round) {
    Require(round.startedAt >= 0 && round.updatedAt >= 0,
            ErrorCode::InvalidPayload, "negative timestamp");
    Require(round.roundId <= MaxRoundId() && round.answeredInRound <= MaxRoundId(),
            ErrorCode::InvalidPayload, "round id wider than 80 bits");

    std::vector<uint8_t> payload(ROUND_PAYLOAD_SIZE);
    uint8_t* p = payload.data();
    abi::EncodeWord(p + 0 * ABI_WORD_SIZE, Word256(round.roundId));
    Require(abi::EncodeInt(p + 1 * ABI_WORD_SIZE, round.answer),
            ErrorCode::InvalidPayload, "answer wider than 256 bits");
    abi::EncodeWord(p + 2 * ABI_WORD_SIZE, Word256(round.startedAt));
    abi::EncodeWord(p + 3 * ABI_WORD_SIZE, Word256(round.updatedAt));
    abi::EncodeWord(p + 4 * ABI_WORD_SIZE, Word256(round.answeredInRound));
    return payload;
}

PriceRound DecodeRound(const std::vector<uint8_t>& payload) {
    if (payload.size() != ROUND_PAYLOAD_SIZE) {
        throw OperationError(ErrorCode::InvalidPayload,
                             "expected " + std::to_string(ROUND_PAYLOAD_SIZE) +
                             " bytes, got " + std::to_string(payload.size()));
    }

    const uint8_t* p = payload.data();
    PriceRound round;
    Require(DecodeRoundId(p + 0 * ABI_WORD_SIZE, round.roundId),
            ErrorCode::InvalidPayload, "roundId out of range");
    round.answer = abi::DecodeInt(p + 1 * ABI_WORD_SIZE);
    Require(DecodeTimestamp(p + 2 * ABI_WORD_SIZE, round.startedAt),
            ErrorCode::InvalidPayload, "startedAt out of range");
    Require(DecodeTimestamp(p + 3 * ABI_WORD_SIZE, round.updatedAt),
            ErrorCode::InvalidPayload, "updatedAt out of range");
    Require(DecodeRoundId(p + 4 * ABI_WORD_SIZE, round.answeredInRound),
            ErrorCode::InvalidPayload, "answeredInRound out of range");
    Require(round.roundId != 0, ErrorCode::InvalidPayload, "roundId 0");
    return round;
}

} // namespace oracle
} // namespace bondvault
