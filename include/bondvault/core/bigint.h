// BONDVAULT - Wide Integers
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Range limits, byte conversions and storage encoding for RoundId and
// Answer. Relay words are 256 bits wide; round ids use the low 80 bits and
// answers are two's complement over the full word.

#ifndef BONDVAULT_CORE_BIGINT_H
#define BONDVAULT_CORE_BIGINT_H

#include "bondvault/core/errors.h"
#include "bondvault/core/types.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

namespace bondvault {

/// Unsigned image of one 32-byte relay word
using Word256 = boost::multiprecision::uint256_t;

/// Width of a relayed round id
constexpr unsigned ROUND_ID_BITS = 80;

constexpr size_t ROUND_ID_STORAGE_SIZE = 16;
constexpr size_t ANSWER_STORAGE_SIZE = 32;

/// 2^80 - 1
const RoundId& MaxRoundId();

/// 2^255 - 1
const Answer& MaxAnswer();

/// -2^255
const Answer& MinAnswer();

inline bool IsValidAnswer(const Answer& a) {
    return a >= MinAnswer() && a <= MaxAnswer();
}

// ============================================================================
// Two's Complement
// ============================================================================

/// Word image of `a`; false when `a` lies outside [MinAnswer, MaxAnswer]
bool ToTwosComplement(const Answer& a, Word256& out);

/// Inverse of ToTwosComplement; every word maps to a valid answer
Answer FromTwosComplement(const Word256& word);

// ============================================================================
// Byte Order
// ============================================================================

/// Write the low `len` bytes of `v`, most significant first
template<typename UInt>
void StoreBigEndian(const UInt& v, uint8_t* out, size_t len) {
    UInt rest = v;
    for (size_t i = len; i-- > 0;) {
        out[i] = static_cast<uint8_t>((rest & 0xFF).template convert_to<unsigned>());
        rest >>= 8;
    }
}

template<typename UInt>
UInt LoadBigEndian(const uint8_t* in, size_t len) {
    UInt v = 0;
    for (size_t i = 0; i < len; ++i) {
        v <<= 8;
        v |= in[i];
    }
    return v;
}

// ============================================================================
// Text
// ============================================================================

/// Decimal digits only, at most MaxRoundId()
bool ParseRoundId(const std::string& text, RoundId& out);

/// Optional '-' then decimal digits, within [MinAnswer, MaxAnswer]
bool ParseAnswer(const std::string& text, Answer& out);

// ============================================================================
// Serialization
// ============================================================================
// Stored little-endian like the fixed-width integers: round ids in 16 bytes,
// answers as a 32-byte two's complement word.

template<typename Stream>
void Serialize(Stream& s, const RoundId& v) {
    uint8_t buf[ROUND_ID_STORAGE_SIZE];
    StoreBigEndian(v, buf, sizeof(buf));
    std::reverse(buf, buf + sizeof(buf));
    s.Write(buf, sizeof(buf));
}

template<typename Stream>
void Unserialize(Stream& s, RoundId& v) {
    uint8_t buf[ROUND_ID_STORAGE_SIZE];
    s.Read(buf, sizeof(buf));
    std::reverse(buf, buf + sizeof(buf));
    v = LoadBigEndian<RoundId>(buf, sizeof(buf));
}

template<typename Stream>
void Serialize(Stream& s, const Answer& v) {
    Word256 word;
    Require(ToTwosComplement(v, word), ErrorCode::ArithmeticOverflow,
            "answer outside 256-bit range");
    uint8_t buf[ANSWER_STORAGE_SIZE];
    StoreBigEndian(word, buf, sizeof(buf));
    std::reverse(buf, buf + sizeof(buf));
    s.Write(buf, sizeof(buf));
}

template<typename Stream>
void Unserialize(Stream& s, Answer& v) {
    uint8_t buf[ANSWER_STORAGE_SIZE];
    s.Read(buf, sizeof(buf));
    std::reverse(buf, buf + sizeof(buf));
    v = FromTwosComplement(LoadBigEndian<Word256>(buf, sizeof(buf)));
}

} // namespace bondvault

#endif // BONDVAULT_CORE_BIGINT_H
