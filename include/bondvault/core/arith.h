// BONDVAULT - Checked Arithmetic
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Fixed-point helpers for converting between asset units and value units.
// Amount intermediates are 128-bit and answer intermediates 512-bit; results
// that do not fit the return type raise OperationError(ArithmeticOverflow)
// instead of wrapping.

#ifndef BONDVAULT_CORE_ARITH_H
#define BONDVAULT_CORE_ARITH_H

#include "bondvault/core/types.h"

#include <cstdint>

namespace bondvault {

/// Largest exponent for which 10^exp fits in uint64_t
constexpr uint32_t MAX_POW10_EXPONENT = 19;

/// 10^exp; throws ArithmeticOverflow for exp > 19
uint64_t Pow10(uint32_t exp);

/// floor(a * b / d) for unsigned operands; throws on d == 0 or overflow
uint64_t MulDiv(uint64_t a, uint64_t b, uint64_t d);

/// (a * b) / d truncated toward zero; the result must lie within
/// [MinAnswer, MaxAnswer]
Answer MulDivSigned(const Answer& a, const Answer& b, const Answer& d);

/// a + b; throws ArithmeticOverflow on wrap
uint64_t CheckedAdd(uint64_t a, uint64_t b);

/// a - b; throws ArithmeticOverflow when b > a
uint64_t CheckedSub(uint64_t a, uint64_t b);

} // namespace bondvault

#endif // BONDVAULT_CORE_ARITH_H
