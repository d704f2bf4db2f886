// BONDVAULT - Round Payload Codec
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Relay payload layout: five 32-byte big-endian words
//
//   word 0  roundId          unsigned, 80 bits
//   word 1  answer           signed 256-bit, two's complement
//   word 2  startedAt        unsigned
//   word 3  updatedAt        unsigned
//   word 4  answeredInRound  unsigned, 80 bits
//
// Decoding rejects payloads of the wrong length, words whose value does not
// fit the field (round ids above 2^80 - 1, timestamps above int64), and
// roundId 0.

#ifndef BONDVAULT_ORACLE_ROUND_CODEC_H
#define BONDVAULT_ORACLE_ROUND_CODEC_H

#include "bondvault/core/bigint.h"
#include "bondvault/oracle/round.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bondvault {
namespace oracle {

constexpr size_t ABI_WORD_SIZE = 32;
constexpr size_t ROUND_PAYLOAD_WORDS = 5;
constexpr size_t ROUND_PAYLOAD_SIZE = ABI_WORD_SIZE * ROUND_PAYLOAD_WORDS;

namespace abi {

inline void EncodeWord(uint8_t* word, const Word256& value) {
    StoreBigEndian(value, word, ABI_WORD_SIZE);
}

inline Word256 DecodeWord(const uint8_t* word) {
    return LoadBigEndian<Word256>(word, ABI_WORD_SIZE);
}

/// Write a signed value as a two's complement word; false if out of range
bool EncodeInt(uint8_t* word, const Answer& value);

/// Read a two's complement word
Answer DecodeInt(const uint8_t* word);

} // namespace abi

/// Encode a round; throws OperationError(InvalidPayload) for negative
/// timestamps, round ids above 80 bits or answers outside 256 bits
std::vector<uint8_t> EncodeRound(const PriceRound& round);

/// Decode a round; throws OperationError(InvalidPayload) on malformed input
PriceRound DecodeRound(const std::vector<uint8_t>& payload);

} // namespace oracle
} // namespace bondvault

#endif // BONDVAULT_ORACLE_ROUND_CODEC_H
