// BONDVAULT - Bond Repayment Vault Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/vault/repayment_vault.h"
#include "bondvault/core/arith.h"
#include "bondvault/core/errors.h"
#include "bondvault/util/logging.h"
#include "bondvault/util/time.h"
#include "bondvault/vault/valuation.h"

#include <limits>

namespace bondvault {
namespace vault {

RepaymentVault::RepaymentVault(const VaultParams& params)
    : registry_(params.ownershipRegistry),
      bondId_(params.bondId),
      debtor_(params.debtor),
      asset_(params.asset),
      assetDecimals_(params.asset ? params.asset->Decimals() : 0),
      debtAmount_(params.debtAmount),
      bondMaturity_(params.bondMaturity),
      priceFeed_(params.priceFeed),
      vaultAddress_(params.vaultAddress),
      principalPaid_(params.initialPrincipalPaid),
      principalRepaid_(params.initialPrincipalRepaid),
      feesBips_(params.feesBips),
      feesRecipient_(params.feesRecipient),
      admin_(params.admin) {
    Require(!debtor_.IsNull(), ErrorCode::ZeroAddress, "debtor");
    Require(debtAmount_ != 0, ErrorCode::ZeroAmount, "debt amount");
    Require(feesBips_ <= MAX_VAULT_FEES_BIPS, ErrorCode::ExcessiveVaultFees);
    Require(!feesRecipient_.IsNull(), ErrorCode::ZeroAddress, "fees recipient");
    Require(priceFeed_ != nullptr, ErrorCode::ZeroAddress, "price feed");
    Require(registry_ != nullptr, ErrorCode::ZeroAddress, "ownership registry");
    Require(asset_ != nullptr, ErrorCode::ZeroAddress, "asset");
    Require(!vaultAddress_.IsNull(), ErrorCode::ZeroAddress, "vault address");
    Require(!admin_.IsNull(), ErrorCode::ZeroAddress, "admin");
    Require(assetDecimals_ <= 18, ErrorCode::InvalidDecimals);
    Require(bondMaturity_ > 0, ErrorCode::InvalidBondMaturity);
    Require(principalRepaid_ <= debtAmount_, ErrorCode::InvalidPrincipalAmount,
            "initial repayment exceeds debt");
    Require(principalRepaid_ == 0 || principalPaid_, ErrorCode::PrincipalNotPaid,
            "repayment recorded before principal was paid");

    // Bond must exist; throws NonexistentBond otherwise
    Address creditor = registry_->OwnerOf(bondId_);

    LOG_INFO(util::LogCategory::VAULT)
        << "Vault " << ShortAddress(vaultAddress_) << " opened for bond " << bondId_
        << " (debt " << debtAmount_ << ", debtor " << ShortAddress(debtor_)
        << ", creditor " << ShortAddress(creditor) << ", fees " << feesBips_ << " bips)";
}

// ============================================================================
// Bond Payments
// ============================================================================

DepositResult RepaymentVault::Deposit(const Address& caller, Amount maxAssets,
                                      Amount targetValue, bool principal) {
    DepositResult result;
    VaultEvent event;
    std::vector<std::pair<Address, Amount>> credits;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Address creditor = registry_->OwnerOf(bondId_);

        AssetQuote quote = vault::QuoteAssets(*priceFeed_, assetDecimals_, targetValue,
                                              util::GetTime());
        Amount required = quote.requiredAssets;
        if (required > maxAssets) {
            throw OperationError(ErrorCode::InsufficientAssets,
                                 "requires " + std::to_string(required) +
                                 ", max " + std::to_string(maxAssets));
        }

        bool nextPaid = principalPaid_;
        Amount nextRepaid = principalRepaid_;

        if (principal) {
            if (caller == creditor) {
                Require(targetValue == debtAmount_, ErrorCode::InvalidPrincipalAmount,
                        "principal must equal the debt amount");
                Require(!principalPaid_, ErrorCode::PrincipalAlreadyPaid);
                nextPaid = true;
                credits.emplace_back(debtor_, required);
                event = VaultEvent::PrincipalPaid(required, targetValue, creditor, debtor_);
            } else if (caller == debtor_) {
                Require(principalPaid_, ErrorCode::PrincipalNotPaid);
                Require(targetValue <= debtAmount_ - principalRepaid_,
                        ErrorCode::InvalidPrincipalAmount, "repayment exceeds outstanding principal");
                nextRepaid = principalRepaid_ + targetValue;
                credits.emplace_back(creditor, required);
                event = VaultEvent::PrincipalRepaid(required, targetValue, debtor_, creditor);
            } else {
                throw OperationError(ErrorCode::OnlyDebtorOrCreditor, ShortAddress(caller));
            }
        } else {
            Require(caller == debtor_, ErrorCode::OnlyDebtor);
            Amount fees = MulDiv(required, feesBips_, BIPS_DENOMINATOR);
            Amount net = required - fees;
            credits.emplace_back(feesRecipient_, fees);
            credits.emplace_back(creditor, net);
            event = VaultEvent::InterestPaid(required, targetValue, debtor_, creditor);
        }
        Require(required > 0, ErrorCode::ZeroAmount, "payment rounds to zero assets");

        Require(totalShares_ <= std::numeric_limits<Amount>::max() - required,
                ErrorCode::ArithmeticOverflow, "share supply");

        // Commit flags before pulling assets; undo them if the pull fails
        const bool prevPaid = principalPaid_;
        const Amount prevRepaid = principalRepaid_;
        principalPaid_ = nextPaid;
        principalRepaid_ = nextRepaid;
        try {
            asset_->TransferFrom(vaultAddress_, caller, vaultAddress_, required);
        } catch (const std::exception&) {
            principalPaid_ = prevPaid;
            principalRepaid_ = prevRepaid;
            throw;
        }

        for (const auto& [to, shares] : credits) {
            if (shares > 0) {
                MintSharesLocked(to, shares);
            }
            result.shares += shares;
        }
        result.assetsUsed = required;
        events_.push_back(event);
    }

    LOG_INFO(util::LogCategory::VAULT) << event.ToString();
    Publish({event});
    return result;
}

Amount RepaymentVault::QuoteAssets(Amount targetValue) const {
    return vault::QuoteAssets(*priceFeed_, assetDecimals_, targetValue,
                              util::GetTime()).requiredAssets;
}

// ============================================================================
// Sealed Inflows
// ============================================================================

Amount RepaymentVault::Deposit(const Address&, Amount, const Address&) {
    throw OperationError(ErrorCode::NotSupported, "use the priced bond deposit");
}

Amount RepaymentVault::Mint(const Address&, Amount, const Address&) {
    throw OperationError(ErrorCode::NotSupported, "use the priced bond deposit");
}

// ============================================================================
// IShareVault
// ============================================================================

Amount RepaymentVault::Withdraw(const Address& caller, Amount assets,
                                const Address& receiver, const Address& owner) {
    return WithdrawShares(caller, ConvertToShares(assets), receiver, owner);
}

Amount RepaymentVault::Redeem(const Address& caller, Amount shares,
                              const Address& receiver, const Address& owner) {
    return ConvertToAssets(WithdrawShares(caller, shares, receiver, owner));
}

Amount RepaymentVault::WithdrawShares(const Address& caller, Amount shares,
                                      const Address& receiver, const Address& owner) {
    VaultEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Require(!receiver.IsNull(), ErrorCode::ZeroAddress, "receiver");
        Require(shares > 0, ErrorCode::ZeroAmount);

        Require(BalanceLocked(owner) >= shares, ErrorCode::InsufficientBalance, "share balance");

        Amount* allowance = nullptr;
        if (caller != owner) {
            auto it = shareAllowances_.find({owner, caller});
            Require(it != shareAllowances_.end() && it->second >= shares,
                    ErrorCode::InsufficientAllowance, "share allowance");
            allowance = &it->second;
        }

        Amount assets = ConvertToAssets(shares);
        if (allowance) {
            *allowance -= shares;
        }
        BurnSharesLocked(owner, shares);
        try {
            asset_->Transfer(vaultAddress_, receiver, assets);
        } catch (const std::exception&) {
            MintSharesLocked(owner, shares);
            if (allowance) {
                *allowance += shares;
            }
            throw;
        }

        event = VaultEvent::Withdraw(caller, receiver, owner, assets, shares);
        events_.push_back(event);
    }

    LOG_INFO(util::LogCategory::VAULT) << event.ToString();
    Publish({event});
    return shares;
}

Amount RepaymentVault::TotalAssets() const {
    return asset_->BalanceOf(vaultAddress_);
}

// ============================================================================
// Share Token
// ============================================================================

Amount RepaymentVault::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalShares_;
}

Amount RepaymentVault::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BalanceLocked(account);
}

Amount RepaymentVault::BalanceLocked(const Address& account) const {
    auto it = shares_.find(account);
    return it == shares_.end() ? 0 : it->second;
}

Amount RepaymentVault::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shareAllowances_.find({owner, spender});
    return it == shareAllowances_.end() ? 0 : it->second;
}

void RepaymentVault::Transfer(const Address& caller, const Address& to, Amount shares) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(!to.IsNull(), ErrorCode::ZeroAddress, "recipient");
    Require(BalanceLocked(caller) >= shares, ErrorCode::InsufficientBalance);
    BurnSharesLocked(caller, shares);
    MintSharesLocked(to, shares);
}

void RepaymentVault::Approve(const Address& caller, const Address& spender, Amount shares) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(!spender.IsNull(), ErrorCode::ZeroAddress, "spender");
    shareAllowances_[{caller, spender}] = shares;
}

void RepaymentVault::TransferFrom(const Address& caller, const Address& from,
                                  const Address& to, Amount shares) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(!to.IsNull(), ErrorCode::ZeroAddress, "recipient");
    auto allowance = shareAllowances_.find({from, caller});
    Require(allowance != shareAllowances_.end() && allowance->second >= shares,
            ErrorCode::InsufficientAllowance);
    Require(BalanceLocked(from) >= shares, ErrorCode::InsufficientBalance);

    allowance->second -= shares;
    BurnSharesLocked(from, shares);
    MintSharesLocked(to, shares);
}

void RepaymentVault::MintSharesLocked(const Address& to, Amount shares) {
    shares_[to] += shares;
    totalShares_ += shares;
}

void RepaymentVault::BurnSharesLocked(const Address& from, Amount shares) {
    if (shares == 0) {
        return;
    }
    auto it = shares_.find(from);
    it->second -= shares;
    if (it->second == 0) {
        shares_.erase(it);
    }
    totalShares_ -= shares;
}

// ============================================================================
// Administration
// ============================================================================

void RepaymentVault::RequireAdminLocked(const Address& caller) const {
    Require(caller == admin_, ErrorCode::OnlyAdmin);
}

void RepaymentVault::SetFeesBips(const Address& caller, Bips bips) {
    VaultEvent event = VaultEvent::FeesSet(bips);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RequireAdminLocked(caller);
        Require(bips <= MAX_VAULT_FEES_BIPS, ErrorCode::ExcessiveVaultFees);
        feesBips_ = bips;
        events_.push_back(event);
    }
    LOG_INFO(util::LogCategory::VAULT) << event.ToString();
    Publish({event});
}

void RepaymentVault::SetFeesRecipient(const Address& caller, const Address& recipient) {
    VaultEvent event = VaultEvent::FeesRecipientSet(recipient);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RequireAdminLocked(caller);
        Require(!recipient.IsNull(), ErrorCode::ZeroAddress, "fees recipient");
        feesRecipient_ = recipient;
        events_.push_back(event);
    }
    LOG_INFO(util::LogCategory::VAULT) << event.ToString();
    Publish({event});
}

void RepaymentVault::TransferAdmin(const Address& caller, const Address& newAdmin) {
    VaultEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RequireAdminLocked(caller);
        Require(!newAdmin.IsNull(), ErrorCode::ZeroAddress, "admin");
        event = VaultEvent::AdminTransferred(admin_, newAdmin);
        admin_ = newAdmin;
        events_.push_back(event);
    }
    LOG_INFO(util::LogCategory::VAULT) << event.ToString();
    Publish({event});
}

// ============================================================================
// Reads
// ============================================================================

Address RepaymentVault::Creditor() const {
    return registry_->OwnerOf(bondId_);
}

bool RepaymentVault::PrincipalPaid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return principalPaid_;
}

Amount RepaymentVault::PrincipalRepaid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return principalRepaid_;
}

Bips RepaymentVault::FeesBips() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return feesBips_;
}

Address RepaymentVault::FeesRecipient() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return feesRecipient_;
}

Address RepaymentVault::Admin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_;
}

// ============================================================================
// Events
// ============================================================================

void RepaymentVault::OnEvent(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

std::vector<VaultEvent> RepaymentVault::Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

void RepaymentVault::Publish(const std::vector<VaultEvent>& events) {
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = callbacks_;
    }
    for (const auto& event : events) {
        for (const auto& cb : callbacks) {
            cb(event);
        }
    }
}

} // namespace vault
} // namespace bondvault
