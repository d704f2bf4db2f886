// BONDVAULT - Core Types Header
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Scalar aliases for amounts, prices and rounds, plus the tagged
// fixed-width byte strings used for addresses and 32-byte identifiers.

#ifndef BONDVAULT_CORE_TYPES_H
#define BONDVAULT_CORE_TYPES_H

#include "bondvault/core/hex.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bondvault {

// ============================================================================
// Scalars
// ============================================================================

using Byte = uint8_t;

/// Smallest asset unit; also used for shares and target value
using Amount = uint64_t;

/// Unix epoch seconds
using Timestamp = int64_t;

/// Round identifier; 0 never names a stored round. Relayed ids carry a
/// phase in bits 64..79, so 64 bits are not enough.
using RoundId = boost::multiprecision::uint128_t;

/// Signed feed answer. Valid values are those of a 256-bit two's
/// complement word; see MinAnswer()/MaxAnswer() in core/bigint.h.
using Answer = boost::multiprecision::int256_t;

using BondId = uint64_t;

/// Basis points, 1/10000
using Bips = uint32_t;

constexpr Bips BIPS_DENOMINATOR = 10000;

// ============================================================================
// FixedBytes
// ============================================================================

/**
 * N opaque bytes. Tag keeps addresses and identifiers from mixing.
 * Ordering, equality and hex rendering all follow storage order.
 */
template<size_t N, typename Tag>
class FixedBytes {
public:
    static constexpr size_t SIZE = N;

    FixedBytes() noexcept : bytes_{} {}

    explicit FixedBytes(const std::array<Byte, N>& bytes) noexcept : bytes_(bytes) {}

    /// Copies min(len, N) bytes; the remainder stays zero
    FixedBytes(const Byte* src, size_t len) noexcept : bytes_{} {
        if (src) std::copy_n(src, std::min(len, N), bytes_.begin());
    }

    /// Throws std::invalid_argument unless hex decodes to exactly N bytes
    static FixedBytes FromHex(const std::string& hex) {
        std::vector<Byte> raw = HexToBytes(hex);
        if (raw.size() != N) {
            throw std::invalid_argument("expected " + std::to_string(N) +
                                        " bytes of hex, got " + std::to_string(raw.size()));
        }
        return FixedBytes(raw.data(), raw.size());
    }

    std::string ToHex() const { return BytesToHex(bytes_.data(), N); }

    bool IsNull() const noexcept {
        return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
    }

    constexpr size_t size() const noexcept { return N; }
    Byte* data() noexcept { return bytes_.data(); }
    const Byte* data() const noexcept { return bytes_.data(); }
    const Byte* begin() const noexcept { return bytes_.data(); }
    const Byte* end() const noexcept { return bytes_.data() + N; }

    Byte operator[](size_t i) const { return bytes_[i]; }

    friend bool operator==(const FixedBytes& a, const FixedBytes& b) noexcept {
        return a.bytes_ == b.bytes_;
    }
    friend bool operator!=(const FixedBytes& a, const FixedBytes& b) noexcept {
        return !(a == b);
    }
    friend bool operator<(const FixedBytes& a, const FixedBytes& b) noexcept {
        return a.bytes_ < b.bytes_;
    }

    friend std::ostream& operator<<(std::ostream& os, const FixedBytes& v) {
        return os << "0x" << v.ToHex();
    }

private:
    std::array<Byte, N> bytes_;
};

struct Hash256Tag {};
struct AddressTag {};

/// Domain identifiers and message ids
using Hash256 = FixedBytes<32, Hash256Tag>;

/// Account or contract address; the null value is the zero address
using Address = FixedBytes<20, AddressTag>;

/// Every byte set to fill
inline Address MakeAddress(Byte fill) {
    std::array<Byte, Address::SIZE> bytes;
    bytes.fill(fill);
    return Address(bytes);
}

/// "0x01020304..." for log lines
std::string ShortAddress(const Address& addr);

} // namespace bondvault

#endif // BONDVAULT_CORE_TYPES_H
