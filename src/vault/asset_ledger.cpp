// BONDVAULT - Fungible Asset Ledger Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/vault/asset_ledger.h"
#include "bondvault/core/arith.h"
#include "bondvault/core/errors.h"

namespace bondvault {
namespace vault {

AssetLedger::AssetLedger(std::string symbol, uint8_t decimals)
    : symbol_(std::move(symbol)), decimals_(decimals) {
    Require(decimals_ <= 18, ErrorCode::InvalidDecimals, "asset decimals");
}

Amount AssetLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

Amount AssetLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount AssetLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

void AssetLedger::MoveLocked(const Address& from, const Address& to, Amount amount) {
    Require(!to.IsNull(), ErrorCode::ZeroAddress, "transfer to zero address");
    Amount& fromBalance = balances_[from];
    Require(fromBalance >= amount, ErrorCode::InsufficientBalance, symbol_.c_str());
    if (from == to) {
        return;
    }
    Amount newTo = CheckedAdd(balances_[to], amount);
    fromBalance -= amount;
    balances_[to] = newTo;
}

void AssetLedger::Transfer(const Address& caller, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    MoveLocked(caller, to, amount);
}

void AssetLedger::TransferFrom(const Address& caller, const Address& from,
                               const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(from, caller);
    Amount allowed = 0;
    auto it = allowances_.find(key);
    if (it != allowances_.end()) {
        allowed = it->second;
    }
    Require(allowed >= amount, ErrorCode::InsufficientAllowance, symbol_.c_str());

    MoveLocked(from, to, amount);
    allowances_[key] = allowed - amount;
}

void AssetLedger::Approve(const Address& caller, const Address& spender, Amount amount) {
    Require(!spender.IsNull(), ErrorCode::ZeroAddress, "approve zero spender");
    std::lock_guard<std::mutex> lock(mutex_);
    allowances_[{caller, spender}] = amount;
}

void AssetLedger::Mint(const Address& to, Amount amount) {
    Require(!to.IsNull(), ErrorCode::ZeroAddress, "mint to zero address");
    std::lock_guard<std::mutex> lock(mutex_);
    Amount newSupply = CheckedAdd(totalSupply_, amount);
    Amount newBalance = CheckedAdd(balances_[to], amount);
    totalSupply_ = newSupply;
    balances_[to] = newBalance;
}

} // namespace vault
} // namespace bondvault
