// BONDVAULT - Vault Events
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/vault/events.h"

#include <sstream>

namespace bondvault {
namespace vault {

const char* VaultEventTypeToString(VaultEventType type) {
    switch (type) {
        case VaultEventType::PrincipalPaid: return "PrincipalPaid";
        case VaultEventType::PrincipalRepaid: return "PrincipalRepaid";
        case VaultEventType::InterestPaid: return "InterestPaid";
        case VaultEventType::FeesSet: return "FeesSet";
        case VaultEventType::FeesRecipientSet: return "FeesRecipientSet";
        case VaultEventType::AdminTransferred: return "AdminTransferred";
        case VaultEventType::Withdraw: return "Withdraw";
        default: return "Unknown";
    }
}

VaultEvent VaultEvent::PrincipalPaid(Amount assets, Amount value,
                                     const Address& creditor, const Address& debtor) {
    VaultEvent e;
    e.type = VaultEventType::PrincipalPaid;
    e.assets = assets;
    e.value = value;
    e.from = creditor;
    e.to = debtor;
    return e;
}

VaultEvent VaultEvent::PrincipalRepaid(Amount assets, Amount value,
                                       const Address& debtor, const Address& creditor) {
    VaultEvent e;
    e.type = VaultEventType::PrincipalRepaid;
    e.assets = assets;
    e.value = value;
    e.from = debtor;
    e.to = creditor;
    return e;
}

VaultEvent VaultEvent::InterestPaid(Amount assets, Amount value,
                                    const Address& debtor, const Address& creditor) {
    VaultEvent e;
    e.type = VaultEventType::InterestPaid;
    e.assets = assets;
    e.value = value;
    e.from = debtor;
    e.to = creditor;
    return e;
}

VaultEvent VaultEvent::FeesSet(Bips bips) {
    VaultEvent e;
    e.type = VaultEventType::FeesSet;
    e.bips = bips;
    return e;
}

VaultEvent VaultEvent::FeesRecipientSet(const Address& recipient) {
    VaultEvent e;
    e.type = VaultEventType::FeesRecipientSet;
    e.account = recipient;
    return e;
}

VaultEvent VaultEvent::AdminTransferred(const Address& previous, const Address& next) {
    VaultEvent e;
    e.type = VaultEventType::AdminTransferred;
    e.from = previous;
    e.account = next;
    return e;
}

VaultEvent VaultEvent::Withdraw(const Address& caller, const Address& receiver,
                                const Address& owner, Amount assets, Amount shares) {
    VaultEvent e;
    e.type = VaultEventType::Withdraw;
    e.from = caller;
    e.to = receiver;
    e.account = owner;
    e.assets = assets;
    e.shares = shares;
    return e;
}

std::string VaultEvent::ToString() const {
    std::ostringstream ss;
    ss << VaultEventTypeToString(type) << "(";
    switch (type) {
        case VaultEventType::PrincipalPaid:
        case VaultEventType::PrincipalRepaid:
        case VaultEventType::InterestPaid:
            ss << "assets=" << assets << ", value=" << value
               << ", from=" << ShortAddress(from) << ", to=" << ShortAddress(to);
            break;
        case VaultEventType::FeesSet:
            ss << "bips=" << bips;
            break;
        case VaultEventType::FeesRecipientSet:
            ss << "recipient=" << ShortAddress(account);
            break;
        case VaultEventType::AdminTransferred:
            ss << "from=" << ShortAddress(from) << ", to=" << ShortAddress(account);
            break;
        case VaultEventType::Withdraw:
            ss << "assets=" << assets << ", shares=" << shares
               << ", receiver=" << ShortAddress(to) << ", owner=" << ShortAddress(account);
            break;
    }
    ss << ")";
    return ss.str();
}

} // namespace vault
} // namespace bondvault
