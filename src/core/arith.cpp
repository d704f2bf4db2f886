// BONDVAULT - Checked Arithmetic Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/core/arith.h"
#include "bondvault/core/bigint.h"
#include "bondvault/core/errors.h"

#include <limits>

namespace bondvault {

uint64_t Pow10(uint32_t exp) {
    Require(exp <= MAX_POW10_EXPONENT, ErrorCode::ArithmeticOverflow, "Pow10 exponent");
    uint64_t result = 1;
    for (uint32_t i = 0; i < exp; ++i) {
        result *= 10;
    }
    return result;
}

uint64_t MulDiv(uint64_t a, uint64_t b, uint64_t d) {
    Require(d != 0, ErrorCode::ArithmeticOverflow, "division by zero");
    __uint128_t product = static_cast<__uint128_t>(a) * b;
    __uint128_t quotient = product / d;
    Require(quotient <= std::numeric_limits<uint64_t>::max(),
            ErrorCode::ArithmeticOverflow, "MulDiv result");
    return static_cast<uint64_t>(quotient);
}

Answer MulDivSigned(const Answer& a, const Answer& b, const Answer& d) {
    using boost::multiprecision::int512_t;
    Require(d != 0, ErrorCode::ArithmeticOverflow, "division by zero");
    Require(IsValidAnswer(a) && IsValidAnswer(b) && IsValidAnswer(d),
            ErrorCode::ArithmeticOverflow, "MulDivSigned operand");
    // |a*b| <= 2^510 always fits in a signed 512-bit product
    int512_t quotient = int512_t(a) * int512_t(b) / int512_t(d);
    Require(quotient <= int512_t(MaxAnswer()) && quotient >= int512_t(MinAnswer()),
            ErrorCode::ArithmeticOverflow, "MulDivSigned result");
    return Answer(quotient);
}

uint64_t CheckedAdd(uint64_t a, uint64_t b) {
    Require(a <= std::numeric_limits<uint64_t>::max() - b,
            ErrorCode::ArithmeticOverflow, "addition");
    return a + b;
}

uint64_t CheckedSub(uint64_t a, uint64_t b) {
    Require(b <= a, ErrorCode::ArithmeticOverflow, "subtraction");
    return a - b;
}

} // namespace bondvault
