// BONDVAULT - Bond Ownership Registry
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_VAULT_BOND_REGISTRY_H
#define BONDVAULT_VAULT_BOND_REGISTRY_H

#include "bondvault/core/types.h"

#include <map>
#include <mutex>

namespace bondvault {
namespace vault {

/// Resolves the current holder of a bond. The holder is the creditor.
class IOwnershipRegistry {
public:
    virtual ~IOwnershipRegistry() = default;

    /// Current owner; throws OperationError(NonexistentBond) for unknown ids
    virtual Address OwnerOf(BondId bondId) const = 0;
};

/**
 * Transferable bond ownership tokens.
 *
 * Ids are assigned sequentially from 1. Ownership changes take effect for
 * the next OwnerOf() call.
 */
class BondRegistry : public IOwnershipRegistry {
public:
    BondRegistry() = default;

    /// Issue a new bond token to `to` and return its id
    BondId Mint(const Address& to);

    Address OwnerOf(BondId bondId) const override;

    bool Exists(BondId bondId) const;

    /// Move a bond; caller must be the current owner (NotBondOwner)
    void Transfer(const Address& caller, const Address& to, BondId bondId);

    size_t Count() const;

private:
    std::map<BondId, Address> owners_;
    BondId nextId_{1};
    mutable std::mutex mutex_;
};

} // namespace vault
} // namespace bondvault

#endif // BONDVAULT_VAULT_BOND_REGISTRY_H
