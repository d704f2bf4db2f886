// BONDVAULT - Vault Events
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_VAULT_EVENTS_H
#define BONDVAULT_VAULT_EVENTS_H

#include "bondvault/core/types.h"

#include <string>

namespace bondvault {
namespace vault {

enum class VaultEventType {
    PrincipalPaid,
    PrincipalRepaid,
    InterestPaid,
    FeesSet,
    FeesRecipientSet,
    AdminTransferred,
    Withdraw,
};

const char* VaultEventTypeToString(VaultEventType type);

/**
 * A committed vault state change.
 *
 * Field use by type:
 *   PrincipalPaid     assets, value, from = creditor, to = debtor
 *   PrincipalRepaid   assets, value, from = debtor, to = creditor
 *   InterestPaid      assets, value, from = debtor, to = creditor
 *   FeesSet           bips
 *   FeesRecipientSet  account = new recipient
 *   AdminTransferred  from = old admin, account = new admin
 *   Withdraw          assets, shares, from = caller, to = receiver, account = owner
 */
struct VaultEvent {
    VaultEventType type{VaultEventType::PrincipalPaid};
    Amount assets{0};
    Amount value{0};
    Amount shares{0};
    Address from;
    Address to;
    Address account;
    Bips bips{0};

    static VaultEvent PrincipalPaid(Amount assets, Amount value,
                                    const Address& creditor, const Address& debtor);
    static VaultEvent PrincipalRepaid(Amount assets, Amount value,
                                      const Address& debtor, const Address& creditor);
    static VaultEvent InterestPaid(Amount assets, Amount value,
                                   const Address& debtor, const Address& creditor);
    static VaultEvent FeesSet(Bips bips);
    static VaultEvent FeesRecipientSet(const Address& recipient);
    static VaultEvent AdminTransferred(const Address& previous, const Address& next);
    static VaultEvent Withdraw(const Address& caller, const Address& receiver,
                               const Address& owner, Amount assets, Amount shares);

    std::string ToString() const;
};

} // namespace vault
} // namespace bondvault

#endif // BONDVAULT_VAULT_EVENTS_H
