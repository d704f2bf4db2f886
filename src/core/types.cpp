// BONDVAULT - Core Types Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/core/types.h"

namespace bondvault {

std::string ShortAddress(const Address& addr) {
    return "0x" + BytesToHex(addr.data(), 4) + "...";
}

} // namespace bondvault
