// BONDVAULT - Bond Ownership Registry Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/vault/bond_registry.h"
#include "bondvault/core/errors.h"
#include "bondvault/util/logging.h"

namespace bondvault {
namespace vault {

BondId BondRegistry::Mint(const Address& to) {
    Require(!to.IsNull(), ErrorCode::ZeroAddress, "bond owner");
    std::lock_guard<std::mutex> lock(mutex_);
    BondId id = nextId_++;
    owners_[id] = to;
    LOG_DEBUG(util::LogCategory::VAULT) << "Bond " << id << " issued to " << ShortAddress(to);
    return id;
}

Address BondRegistry::OwnerOf(BondId bondId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(bondId);
    if (it == owners_.end()) {
        throw OperationError(ErrorCode::NonexistentBond, "bond " + std::to_string(bondId));
    }
    return it->second;
}

bool BondRegistry::Exists(BondId bondId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.count(bondId) > 0;
}

void BondRegistry::Transfer(const Address& caller, const Address& to, BondId bondId) {
    Require(!to.IsNull(), ErrorCode::ZeroAddress, "bond recipient");
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(bondId);
    if (it == owners_.end()) {
        throw OperationError(ErrorCode::NonexistentBond, "bond " + std::to_string(bondId));
    }
    Require(it->second == caller, ErrorCode::NotBondOwner);
    it->second = to;
    LOG_INFO(util::LogCategory::VAULT) << "Bond " << bondId << " transferred "
                                       << ShortAddress(caller) << " -> " << ShortAddress(to);
}

size_t BondRegistry::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.size();
}

} // namespace vault
} // namespace bondvault
