// BONDVAULT - Bond Repayment Vault
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Custodies one fungible asset for a single bond and enforces its payment
// protocol: the creditor funds principal, the debtor repays principal and
// pays interest (minus a fee skim). Every credited asset unit mints exactly
// one share. The creditor is whoever holds the bond token at call time.

#ifndef BONDVAULT_VAULT_REPAYMENT_VAULT_H
#define BONDVAULT_VAULT_REPAYMENT_VAULT_H

#include "bondvault/oracle/round.h"
#include "bondvault/vault/asset_ledger.h"
#include "bondvault/vault/bond_registry.h"
#include "bondvault/vault/events.h"

#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace bondvault {
namespace vault {

/// Highest fee rate the vault accepts (10%)
constexpr Bips MAX_VAULT_FEES_BIPS = 1000;

// ============================================================================
// Share Vault Interface
// ============================================================================

/**
 * Share vault surface: conversions and outflows.
 *
 * There is no generic inflow here. Vaults that accept deposits expose their
 * own validated entry point.
 */
class IShareVault {
public:
    virtual ~IShareVault() = default;

    virtual Amount TotalAssets() const = 0;
    virtual Amount ConvertToShares(Amount assets) const = 0;
    virtual Amount ConvertToAssets(Amount shares) const = 0;
    virtual Amount MaxWithdraw(const Address& owner) const = 0;
    virtual Amount MaxRedeem(const Address& owner) const = 0;

    virtual Amount Withdraw(const Address& caller, Amount assets,
                            const Address& receiver, const Address& owner) = 0;
    virtual Amount Redeem(const Address& caller, Amount shares,
                          const Address& receiver, const Address& owner) = 0;
};

// ============================================================================
// RepaymentVault
// ============================================================================

/// Construction parameters. Collaborators are not owned.
struct VaultParams {
    Address admin;
    const IOwnershipRegistry* ownershipRegistry{nullptr};
    BondId bondId{0};
    Address debtor;
    IAssetLedger* asset{nullptr};
    /// Principal target in value units
    Amount debtAmount{0};
    /// Informational maturity timestamp
    Timestamp bondMaturity{0};
    bool initialPrincipalPaid{false};
    Amount initialPrincipalRepaid{0};
    Bips feesBips{0};
    Address feesRecipient;
    const oracle::IRoundFeed* priceFeed{nullptr};
    /// Account holding custodied assets in the asset ledger
    Address vaultAddress;
};

struct DepositResult {
    Amount shares{0};
    Amount assetsUsed{0};
};

class RepaymentVault final : public IShareVault {
public:
    using EventCallback = std::function<void(const VaultEvent&)>;

    /// Validates every parameter; throws OperationError on the first violation
    explicit RepaymentVault(const VaultParams& params);

    RepaymentVault(const RepaymentVault&) = delete;
    RepaymentVault& operator=(const RepaymentVault&) = delete;

    // ========================================================================
    // Bond Payments
    // ========================================================================

    /**
     * Pay `targetValue` (value units) into the vault.
     *
     * principal == true:
     *   creditor funds the full principal once (shares to the debtor), or
     *   the debtor repays part of it (shares to the creditor).
     * principal == false:
     *   the debtor pays interest; the fee share goes to the fees recipient
     *   and the rest to the creditor.
     *
     * The caller must have approved the vault address for at least the
     * required assets. Fails InsufficientAssets when the current price needs
     * more than maxAssets.
     */
    DepositResult Deposit(const Address& caller, Amount maxAssets,
                          Amount targetValue, bool principal);

    /// Assets needed right now to pay targetValue
    Amount QuoteAssets(Amount targetValue) const;

    // ========================================================================
    // Sealed Inflows
    // ========================================================================
    // Deposit to an arbitrary receiver and Mint are not virtual and not part
    // of IShareVault. They fail NotSupported without touching any state.

    Amount Deposit(const Address& caller, Amount assets, const Address& receiver);
    Amount Mint(const Address& caller, Amount shares, const Address& receiver);

    // ========================================================================
    // IShareVault
    // ========================================================================

    Amount Withdraw(const Address& caller, Amount assets,
                    const Address& receiver, const Address& owner) override;
    Amount Redeem(const Address& caller, Amount shares,
                  const Address& receiver, const Address& owner) override;

    Amount TotalAssets() const override;
    Amount ConvertToShares(Amount assets) const override { return assets; }
    Amount ConvertToAssets(Amount shares) const override { return shares; }
    Amount MaxWithdraw(const Address& owner) const override { return BalanceOf(owner); }
    Amount MaxRedeem(const Address& owner) const override { return BalanceOf(owner); }

    // ========================================================================
    // Share Token
    // ========================================================================

    Amount TotalSupply() const;
    Amount BalanceOf(const Address& account) const;
    Amount Allowance(const Address& owner, const Address& spender) const;
    void Transfer(const Address& caller, const Address& to, Amount shares);
    void Approve(const Address& caller, const Address& spender, Amount shares);
    void TransferFrom(const Address& caller, const Address& from,
                      const Address& to, Amount shares);

    // ========================================================================
    // Administration
    // ========================================================================

    void SetFeesBips(const Address& caller, Bips bips);
    void SetFeesRecipient(const Address& caller, const Address& recipient);
    void TransferAdmin(const Address& caller, const Address& newAdmin);

    // ========================================================================
    // Reads
    // ========================================================================

    /// Current bond holder (looked up on every call)
    Address Creditor() const;
    const Address& Debtor() const { return debtor_; }
    Amount DebtAmount() const { return debtAmount_; }
    Timestamp BondMaturity() const { return bondMaturity_; }
    BondId GetBondId() const { return bondId_; }
    const Address& VaultAddress() const { return vaultAddress_; }
    const oracle::IRoundFeed* PriceFeed() const { return priceFeed_; }
    uint8_t AssetDecimals() const { return assetDecimals_; }

    bool PrincipalPaid() const;
    Amount PrincipalRepaid() const;
    Bips FeesBips() const;
    Address FeesRecipient() const;
    Address Admin() const;

    // ========================================================================
    // Events
    // ========================================================================

    /// Called after every committed state change, in order
    void OnEvent(EventCallback callback);

    /// Every event emitted so far
    std::vector<VaultEvent> Events() const;

private:
    void RequireAdminLocked(const Address& caller) const;
    Amount BalanceLocked(const Address& account) const;
    void MintSharesLocked(const Address& to, Amount shares);
    void BurnSharesLocked(const Address& from, Amount shares);
    Amount WithdrawShares(const Address& caller, Amount shares,
                          const Address& receiver, const Address& owner);
    void Publish(const std::vector<VaultEvent>& events);

    // Immutable bond terms
    const IOwnershipRegistry* registry_;
    const BondId bondId_;
    const Address debtor_;
    IAssetLedger* asset_;
    const uint8_t assetDecimals_;
    const Amount debtAmount_;
    const Timestamp bondMaturity_;
    const oracle::IRoundFeed* priceFeed_;
    const Address vaultAddress_;

    // Payment state
    bool principalPaid_;
    Amount principalRepaid_;
    Bips feesBips_;
    Address feesRecipient_;
    Address admin_;

    // Shares
    std::map<Address, Amount> shares_;
    std::map<std::pair<Address, Address>, Amount> shareAllowances_;
    Amount totalShares_{0};

    std::vector<VaultEvent> events_;
    std::vector<EventCallback> callbacks_;
    mutable std::mutex mutex_;
};

} // namespace vault
} // namespace bondvault

#endif // BONDVAULT_VAULT_REPAYMENT_VAULT_H
