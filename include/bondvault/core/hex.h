// BONDVAULT - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Hex text is what config files and the CLI use for domains and addresses.
// Output is lowercase without a prefix; input may carry "0x" and any case.

#ifndef BONDVAULT_CORE_HEX_H
#define BONDVAULT_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bondvault {

std::string BytesToHex(const uint8_t* data, size_t len);

inline std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

/// Decode into out. On failure returns false, leaves out untouched and,
/// when errorPos is given, stores the offset of the first bad digit
/// (or the digit count for odd-length input).
bool TryHexToBytes(const std::string& hex, std::vector<uint8_t>& out,
                   size_t* errorPos = nullptr);

/// Throwing form of TryHexToBytes; std::invalid_argument on bad input
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Non-empty, even length, hex digits only (after an optional "0x")
bool IsValidHex(const std::string& str);

std::string StripHexPrefix(const std::string& hex);

} // namespace bondvault

#endif // BONDVAULT_CORE_HEX_H
