// BONDVAULT - Relay Message Envelope
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_RELAY_ENVELOPE_H
#define BONDVAULT_RELAY_ENVELOPE_H

#include "bondvault/core/serialize.h"
#include "bondvault/relay/messenger.h"

#include <cstdint>
#include <vector>

namespace bondvault {
namespace relay {

/// Relay-level wrapper around one payload
struct MessageEnvelope {
    MessageId id;
    uint64_t nonce{0};
    DomainId sourceDomain;
    Address originSender;
    DomainId destinationDomain;
    Address destinationAddress;
    FeeInfo fee;
    uint64_t requiredGasLimit{0};
    std::vector<Address> allowedRelayers;
    uint32_t messengerVersion{0};
    std::vector<uint8_t> payload;

    /// SHA-256 over every field except id
    MessageId ComputeId() const;

    MessageContext Context() const {
        return {id, sourceDomain, originSender, messengerVersion};
    }
};

/// Serializes every field except id
template<typename Stream>
void SerializeBody(Stream& s, const MessageEnvelope& e) {
    ::bondvault::Serialize(s, e.nonce);
    ::bondvault::Serialize(s, e.sourceDomain);
    ::bondvault::Serialize(s, e.originSender);
    ::bondvault::Serialize(s, e.destinationDomain);
    ::bondvault::Serialize(s, e.destinationAddress);
    ::bondvault::Serialize(s, e.fee.feeToken);
    ::bondvault::Serialize(s, e.fee.amount);
    ::bondvault::Serialize(s, e.requiredGasLimit);
    ::bondvault::Serialize(s, e.allowedRelayers);
    ::bondvault::Serialize(s, e.messengerVersion);
    ::bondvault::Serialize(s, e.payload);
}

template<typename Stream>
void Serialize(Stream& s, const MessageEnvelope& e) {
    ::bondvault::Serialize(s, e.id);
    SerializeBody(s, e);
}

template<typename Stream>
void Unserialize(Stream& s, MessageEnvelope& e) {
    ::bondvault::Unserialize(s, e.id);
    ::bondvault::Unserialize(s, e.nonce);
    ::bondvault::Unserialize(s, e.sourceDomain);
    ::bondvault::Unserialize(s, e.originSender);
    ::bondvault::Unserialize(s, e.destinationDomain);
    ::bondvault::Unserialize(s, e.destinationAddress);
    ::bondvault::Unserialize(s, e.fee.feeToken);
    ::bondvault::Unserialize(s, e.fee.amount);
    ::bondvault::Unserialize(s, e.requiredGasLimit);
    ::bondvault::Unserialize(s, e.allowedRelayers);
    ::bondvault::Unserialize(s, e.messengerVersion);
    ::bondvault::Unserialize(s, e.payload);
}

} // namespace relay
} // namespace bondvault

#endif // BONDVAULT_RELAY_ENVELOPE_H
