// BONDVAULT - In-Process Relay Network
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Joins independently constructed domains through a reliable-or-absent
// channel. Submitting only queues a message; delivery happens when the owner
// drives it (DeliverNext / Deliver / DeliverAll), in any order. Messages can
// be dropped to simulate loss. Failed deliveries are recorded and retried
// only through an explicit Retry(). Finished records stay inspectable until
// PruneFinished() discards them.

#ifndef BONDVAULT_RELAY_RELAY_NETWORK_H
#define BONDVAULT_RELAY_RELAY_NETWORK_H

#include "bondvault/core/errors.h"
#include "bondvault/relay/envelope.h"
#include "bondvault/relay/messenger.h"
#include "bondvault/vault/asset_ledger.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bondvault {
namespace relay {

// ============================================================================
// Delivery State
// ============================================================================

enum class DeliveryStatus {
    Pending,     ///< Queued, not yet attempted (or being attempted)
    Delivered,   ///< Receiver accepted the message
    Failed,      ///< Receiver rejected it, or no receiver is registered
    Dropped,     ///< Lost; will never be delivered
};

const char* DeliveryStatusToString(DeliveryStatus status);

struct MessageRecord {
    MessageEnvelope envelope;
    DeliveryStatus status{DeliveryStatus::Pending};
    uint32_t attempts{0};
    ErrorCode lastError{ErrorCode::Ok};
    std::string lastErrorDetail;
};

// ============================================================================
// RelayNetwork
// ============================================================================

class RelayNetwork {
public:
    struct Config {
        /// Version stamped on every submitted envelope
        uint32_t messengerVersion{1};
        /// Account that receives delivery fees
        Address feeCollector;
    };

    using DeliveryCallback = std::function<void(const MessageRecord&)>;

    RelayNetwork();
    explicit RelayNetwork(const Config& config);

    RelayNetwork(const RelayNetwork&) = delete;
    RelayNetwork& operator=(const RelayNetwork&) = delete;

    // ========================================================================
    // Wiring
    // ========================================================================

    /**
     * Make `receiver` reachable at (domain, address).
     * The receiver is not owned and must outlive the network or be
     * unregistered first.
     */
    void RegisterReceiver(const DomainId& domain, const Address& address,
                          IMessageReceiver* receiver);

    void UnregisterReceiver(const DomainId& domain, const Address& address);

    /// Ledger used to collect fees paid in `token` (not owned)
    void RegisterFeeToken(const Address& token, vault::IAssetLedger* ledger);

    /// Change the version stamped on future submissions
    void SetMessengerVersion(uint32_t version);
    uint32_t MessengerVersion() const;

    /// Observe every completed delivery attempt
    void OnDelivery(DeliveryCallback callback);

    // ========================================================================
    // Submission
    // ========================================================================

    /**
     * Queue a message from (sourceDomain, sender).
     *
     * A non-zero fee is moved from feePayer to the fee collector before the
     * message is queued; if that fails nothing is queued.
     */
    MessageId Submit(const DomainId& sourceDomain, const Address& sender,
                     const Address& feePayer, const SendMessageInput& input);

    // ========================================================================
    // Delivery
    // ========================================================================

    /// Deliver the oldest pending message; nullopt if none is pending
    std::optional<MessageId> DeliverNext();

    /// Deliver a specific pending message (out-of-order delivery)
    DeliveryStatus Deliver(const MessageId& id);

    /// Deliver every pending message in submission order; returns attempts made
    size_t DeliverAll();

    /// Lose a pending or failed message
    void Drop(const MessageId& id);

    /// Re-attempt a failed message
    DeliveryStatus Retry(const MessageId& id);

    // ========================================================================
    // Inspection
    // ========================================================================

    std::optional<MessageRecord> GetMessage(const MessageId& id) const;
    std::vector<MessageId> PendingMessages() const;
    size_t PendingCount() const;
    size_t MessageCount() const;

    /// Forget delivered and dropped records; returns how many were removed.
    /// Failed messages are kept so they can still be retried.
    size_t PruneFinished();

private:
    DeliveryStatus Attempt(const MessageId& id);
    void Finish(const MessageId& id, DeliveryStatus status,
                ErrorCode code, const std::string& detail);

    using Endpoint = std::pair<DomainId, Address>;

    Config config_;
    std::map<Endpoint, IMessageReceiver*> receivers_;
    std::map<Address, vault::IAssetLedger*> feeLedgers_;
    std::map<MessageId, MessageRecord> messages_;
    /// Messages still in Pending state, keyed by nonce (submission order)
    std::map<uint64_t, MessageId> pending_;
    std::set<MessageId> inFlight_;
    std::vector<DeliveryCallback> callbacks_;
    uint64_t nextNonce_{1};
    mutable std::mutex mutex_;
};

// ============================================================================
// CrossDomainMessenger
// ============================================================================

/// Per-domain IMessenger bound to a RelayNetwork
class CrossDomainMessenger : public IMessenger {
public:
    CrossDomainMessenger(RelayNetwork& network, const DomainId& domain)
        : network_(network), domain_(domain) {}

    MessageId SendCrossDomainMessage(const Address& sender,
                                     const Address& feePayer,
                                     const SendMessageInput& input) override {
        return network_.Submit(domain_, sender, feePayer, input);
    }

    DomainId DomainIdentifier() const override { return domain_; }

private:
    RelayNetwork& network_;
    const DomainId domain_;
};

} // namespace relay
} // namespace bondvault

#endif // BONDVAULT_RELAY_RELAY_NETWORK_H
