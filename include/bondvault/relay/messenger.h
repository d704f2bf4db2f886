// BONDVAULT - Cross-Domain Messaging Interfaces
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// A domain sends through its IMessenger; the relay later invokes the
// destination's IMessageReceiver. Sender and receiver never call each other
// directly, and nothing guarantees a submitted message is ever delivered.

#ifndef BONDVAULT_RELAY_MESSENGER_H
#define BONDVAULT_RELAY_MESSENGER_H

#include "bondvault/core/types.h"

#include <cstdint>
#include <mutex>
#include <vector>

namespace bondvault {
namespace relay {

/// 32-byte identifier of a domain (chain, subnet, process)
using DomainId = Hash256;

/// Relay-assigned message identifier
using MessageId = Hash256;

/// Fee paid to the relay for delivering a message
struct FeeInfo {
    Address feeToken;
    Amount amount{0};
};

/// Parameters of an outbound message
struct SendMessageInput {
    DomainId destinationDomain;
    Address destinationAddress;
    FeeInfo fee;
    uint64_t requiredGasLimit{0};
    std::vector<Address> allowedRelayers;
    std::vector<uint8_t> message;
};

/// What the receiver learns about a delivered message
struct MessageContext {
    MessageId messageId;
    DomainId sourceDomain;
    Address originSender;
    uint32_t messengerVersion{0};
};

// ============================================================================
// Outbound
// ============================================================================

class IMessenger {
public:
    virtual ~IMessenger() = default;

    /**
     * Submit a message for later delivery.
     *
     * @param sender   Contract/account on this domain the message originates from
     * @param feePayer Account charged input.fee
     * @return Relay-assigned id
     *
     * Throws OperationError on rejected submissions (unknown fee token,
     * insufficient fee balance, zero destination).
     */
    virtual MessageId SendCrossDomainMessage(const Address& sender,
                                             const Address& feePayer,
                                             const SendMessageInput& input) = 0;

    /// Domain this messenger submits from
    virtual DomainId DomainIdentifier() const = 0;
};

// ============================================================================
// Inbound
// ============================================================================

class IMessageReceiver {
public:
    virtual ~IMessageReceiver() = default;

    /// Invoked by the relay. Throwing OperationError rejects the delivery.
    virtual void ReceiveCrossDomainMessage(const MessageContext& context,
                                           const std::vector<uint8_t>& payload) = 0;
};

/**
 * Receiver base with a messenger version gate.
 *
 * Deliveries stamped with a messenger version below the minimum are refused
 * with UnauthorizedMessenger before the application sees them. The admin may
 * only raise the minimum.
 */
class RelayReceiverApp : public IMessageReceiver {
public:
    RelayReceiverApp(const Address& admin, uint32_t minMessengerVersion);

    void ReceiveCrossDomainMessage(const MessageContext& context,
                                   const std::vector<uint8_t>& payload) final;

    /// Admin only; version must be strictly greater than the current minimum
    void UpdateMinMessengerVersion(const Address& caller, uint32_t version);

    uint32_t MinMessengerVersion() const;
    Address Admin() const;

protected:
    /// Application handler, called after the version gate passes
    virtual void ReceiveMessage(const MessageContext& context,
                                const std::vector<uint8_t>& payload) = 0;

private:
    const Address admin_;
    uint32_t minMessengerVersion_;
    mutable std::mutex gateMutex_;
};

} // namespace relay
} // namespace bondvault

#endif // BONDVAULT_RELAY_MESSENGER_H
