// BONDVAULT - Serialization Header
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Binary encoding for persisted rounds and relay envelopes.
//
//   integers      fixed width, little-endian
//   bool          one byte, 0 or 1
//   strings/bytes CompactSize length, then raw bytes
//   vectors       CompactSize count, then each element
//   FixedBytes    raw bytes in storage order
//
// WriteBE64/ReadBE64 produce big-endian storage keys that sort numerically.

#ifndef BONDVAULT_CORE_SERIALIZE_H
#define BONDVAULT_CORE_SERIALIZE_H

#include "bondvault/core/types.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <string>
#include <type_traits>
#include <vector>

namespace bondvault {

/// Upper bound on any decoded length prefix
constexpr uint64_t MAX_SERIALIZED_SIZE = 32 * 1024 * 1024;

/// Thrown on truncated, oversized or non-canonical input
class DecodeError : public std::ios_base::failure {
public:
    explicit DecodeError(const std::string& what) : std::ios_base::failure(what) {}
};

// ============================================================================
// DataStream
// ============================================================================

/// Growable buffer with a read cursor. size() and data() cover unread bytes.
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> bytes) : buf_(std::move(bytes)) {}
    DataStream(const uint8_t* bytes, size_t len) : buf_(bytes, bytes + len) {}

    size_t size() const noexcept { return buf_.size() - cursor_; }
    bool empty() const noexcept { return cursor_ == buf_.size(); }
    const uint8_t* data() const noexcept { return buf_.data() + cursor_; }

    void Write(const void* src, size_t len) {
        const uint8_t* p = static_cast<const uint8_t*>(src);
        buf_.insert(buf_.end(), p, p + len);
    }

    void Read(void* dst, size_t len) {
        if (len > size()) {
            throw DecodeError("DataStream: read past end");
        }
        std::copy_n(buf_.data() + cursor_, len, static_cast<uint8_t*>(dst));
        cursor_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& value);

    template<typename T>
    DataStream& operator>>(T& value);

private:
    std::vector<uint8_t> buf_;
    size_t cursor_{0};
};

// ============================================================================
// Integers
// ============================================================================

template<typename T>
using EnableIfWireInt =
    typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value>::type;

template<typename Stream, typename T, typename = EnableIfWireInt<T>>
void Serialize(Stream& s, T value) {
    using U = typename std::make_unsigned<T>::type;
    U bits = static_cast<U>(value);
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<uint8_t>(bits >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename Stream, typename T, typename = EnableIfWireInt<T>>
void Unserialize(Stream& s, T& value) {
    using U = typename std::make_unsigned<T>::type;
    uint8_t buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    U bits = 0;
    for (size_t i = sizeof(T); i-- > 0;) {
        bits = static_cast<U>((bits << 8) | buf[i]);
    }
    value = static_cast<T>(bits);
}

template<typename Stream>
void Serialize(Stream& s, bool value) {
    uint8_t b = value ? 1 : 0;
    s.Write(&b, 1);
}

template<typename Stream>
void Unserialize(Stream& s, bool& value) {
    uint8_t b = 0;
    s.Read(&b, 1);
    if (b > 1) {
        throw DecodeError("bool: byte " + std::to_string(b));
    }
    value = b == 1;
}

inline void WriteBE64(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(v >> shift));
    }
}

/// p must point at 8 readable bytes
inline uint64_t ReadBE64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

// ============================================================================
// CompactSize
// ============================================================================
// One byte below 0xFD; 0xFE + uint32; 0xFF + uint64. The shortest form is
// mandatory on decode and 0xFD is not used.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t n) {
    if (n < 0xFD) {
        Serialize(s, static_cast<uint8_t>(n));
    } else if (n <= 0xFFFFFFFFu) {
        Serialize(s, uint8_t{0xFE});
        Serialize(s, static_cast<uint32_t>(n));
    } else {
        Serialize(s, uint8_t{0xFF});
        Serialize(s, n);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t tag = 0;
    Unserialize(s, tag);

    uint64_t n = tag;
    if (tag == 0xFE) {
        uint32_t v = 0;
        Unserialize(s, v);
        if (v < 0xFD) throw DecodeError("CompactSize: non-canonical 32-bit form");
        n = v;
    } else if (tag == 0xFF) {
        Unserialize(s, n);
        if (n <= 0xFFFFFFFFu) throw DecodeError("CompactSize: non-canonical 64-bit form");
    } else if (tag == 0xFD) {
        throw DecodeError("CompactSize: 16-bit form not supported");
    }

    if (n > MAX_SERIALIZED_SIZE) {
        throw DecodeError("CompactSize: " + std::to_string(n) + " exceeds limit");
    }
    return n;
}

// ============================================================================
// Fixed-width Byte Strings
// ============================================================================

template<typename Stream, size_t N, typename Tag>
void Serialize(Stream& s, const FixedBytes<N, Tag>& v) {
    s.Write(v.data(), N);
}

template<typename Stream, size_t N, typename Tag>
void Unserialize(Stream& s, FixedBytes<N, Tag>& v) {
    s.Read(v.data(), N);
}

// ============================================================================
// Strings and Vectors
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t n = ReadCompactSize(s);
    if (n > s.size()) throw DecodeError("string: length beyond input");
    str.resize(static_cast<size_t>(n));
    s.Read(&str[0], str.size());
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    if constexpr (std::is_same<T, uint8_t>::value) {
        s.Write(v.data(), v.size());
    } else {
        for (const T& item : v) {
            Serialize(s, item);
        }
    }
}

/// Every element takes at least one byte, so a count beyond the unread
/// input is rejected before allocating.
template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t n = ReadCompactSize(s);
    if (n > s.size()) throw DecodeError("vector: count beyond input");
    v.assign(static_cast<size_t>(n), T{});
    if constexpr (std::is_same<T, uint8_t>::value) {
        s.Read(v.data(), v.size());
    } else {
        for (T& item : v) {
            Unserialize(s, item);
        }
    }
}

// ============================================================================
// DataStream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& value) {
    Serialize(*this, value);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& value) {
    Unserialize(*this, value);
    return *this;
}

} // namespace bondvault

#endif // BONDVAULT_CORE_SERIALIZE_H
