// BONDVAULT - Wide Integers Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/core/bigint.h"

#include <cctype>

namespace bondvault {

namespace {

// 2^255 has 77 decimal digits; 2^80 has 25
constexpr size_t MAX_ANSWER_DIGITS = 77;
constexpr size_t MAX_ROUND_ID_DIGITS = 25;

template<typename Int>
bool ParseDigits(const std::string& text, size_t begin, size_t maxDigits, Int& out) {
    size_t count = text.size() - begin;
    if (count == 0 || count > maxDigits) return false;

    Int v = 0;
    for (size_t i = begin; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace

const RoundId& MaxRoundId() {
    static const RoundId limit = (RoundId(1) << ROUND_ID_BITS) - 1;
    return limit;
}

const Answer& MaxAnswer() {
    static const Answer limit = (Answer(1) << 255) - 1;
    return limit;
}

const Answer& MinAnswer() {
    static const Answer limit = -(Answer(1) << 255);
    return limit;
}

bool ToTwosComplement(const Answer& a, Word256& out) {
    if (!IsValidAnswer(a)) return false;
    if (a >= 0) {
        out = Word256(a);
    } else {
        Word256 magnitude(-a);
        out = ~magnitude + 1;
    }
    return true;
}

Answer FromTwosComplement(const Word256& word) {
    if (!boost::multiprecision::bit_test(word, 255)) {
        return Answer(word);
    }
    Word256 magnitude = ~word + 1;
    return -Answer(magnitude);
}

bool ParseRoundId(const std::string& text, RoundId& out) {
    RoundId v = 0;
    if (!ParseDigits(text, 0, MAX_ROUND_ID_DIGITS, v) || v > MaxRoundId()) {
        return false;
    }
    out = v;
    return true;
}

bool ParseAnswer(const std::string& text, Answer& out) {
    bool negative = !text.empty() && text[0] == '-';
    Answer v = 0;
    if (!ParseDigits(text, negative ? 1 : 0, MAX_ANSWER_DIGITS, v)) {
        return false;
    }
    if (negative) v = -v;
    if (!IsValidAnswer(v)) return false;
    out = v;
    return true;
}

} // namespace bondvault
