// BONDVAULT - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/core/hex.h"

#include <stdexcept>

namespace bondvault {

namespace {

int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(c | 0x20);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool HasPrefix(const std::string& s) {
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

} // namespace

std::string StripHexPrefix(const std::string& hex) {
    return HasPrefix(hex) ? hex.substr(2) : hex;
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    static const char DIGITS[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0x0F];
    }
    return out;
}

bool TryHexToBytes(const std::string& hex, std::vector<uint8_t>& out, size_t* errorPos) {
    const size_t skip = HasPrefix(hex) ? 2 : 0;
    const size_t digits = hex.size() - skip;
    if (digits % 2 != 0) {
        if (errorPos) *errorPos = digits;
        return false;
    }

    std::vector<uint8_t> bytes(digits / 2);
    for (size_t i = 0; i < digits; ++i) {
        int v = DigitValue(hex[skip + i]);
        if (v < 0) {
            if (errorPos) *errorPos = skip + i;
            return false;
        }
        bytes[i / 2] = static_cast<uint8_t>((bytes[i / 2] << 4) | v);
    }
    out.swap(bytes);
    return true;
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    std::vector<uint8_t> out;
    size_t pos = 0;
    if (!TryHexToBytes(hex, out, &pos)) {
        if (StripHexPrefix(hex).size() % 2 != 0) {
            throw std::invalid_argument("hex has odd digit count " + std::to_string(pos));
        }
        throw std::invalid_argument("bad hex digit at offset " + std::to_string(pos));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    std::vector<uint8_t> scratch;
    return !StripHexPrefix(str).empty() && TryHexToBytes(str, scratch);
}

} // namespace bondvault
