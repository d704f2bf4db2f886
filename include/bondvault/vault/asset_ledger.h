// BONDVAULT - Fungible Asset Ledger
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Custodial balance ledger for one fungible asset. The vault custodies its
// asset through this interface and the relay network collects fees with it.

#ifndef BONDVAULT_VAULT_ASSET_LEDGER_H
#define BONDVAULT_VAULT_ASSET_LEDGER_H

#include "bondvault/core/types.h"

#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace bondvault {
namespace vault {

// ============================================================================
// Asset Ledger Interface
// ============================================================================

/**
 * Standard custodial ledger semantics.
 *
 * Every mutating call names the acting account first. Failures throw
 * OperationError (ZeroAddress, InsufficientBalance, InsufficientAllowance)
 * and leave balances untouched.
 */
class IAssetLedger {
public:
    virtual ~IAssetLedger() = default;

    virtual std::string Symbol() const = 0;
    virtual uint8_t Decimals() const = 0;
    virtual Amount TotalSupply() const = 0;
    virtual Amount BalanceOf(const Address& account) const = 0;
    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;

    /// Move amount from the caller's own balance
    virtual void Transfer(const Address& caller, const Address& to, Amount amount) = 0;

    /// Move amount from `from`, spending the caller's allowance
    virtual void TransferFrom(const Address& caller, const Address& from,
                              const Address& to, Amount amount) = 0;

    /// Set the caller's allowance for spender
    virtual void Approve(const Address& caller, const Address& spender, Amount amount) = 0;
};

// ============================================================================
// In-Memory Asset Ledger
// ============================================================================

class AssetLedger : public IAssetLedger {
public:
    AssetLedger(std::string symbol, uint8_t decimals);

    std::string Symbol() const override { return symbol_; }
    uint8_t Decimals() const override { return decimals_; }
    Amount TotalSupply() const override;
    Amount BalanceOf(const Address& account) const override;
    Amount Allowance(const Address& owner, const Address& spender) const override;

    void Transfer(const Address& caller, const Address& to, Amount amount) override;
    void TransferFrom(const Address& caller, const Address& from,
                      const Address& to, Amount amount) override;
    void Approve(const Address& caller, const Address& spender, Amount amount) override;

    /// Credit new units to an account (funding test and demo accounts)
    void Mint(const Address& to, Amount amount);

private:
    void MoveLocked(const Address& from, const Address& to, Amount amount);

    const std::string symbol_;
    const uint8_t decimals_;

    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount totalSupply_{0};
    mutable std::mutex mutex_;
};

} // namespace vault
} // namespace bondvault

#endif // BONDVAULT_VAULT_ASSET_LEDGER_H
