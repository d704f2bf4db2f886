// BONDVAULT - In-Process Relay Network Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/relay/relay_network.h"
#include "bondvault/util/logging.h"

namespace bondvault {
namespace relay {

namespace {

std::string ShortId(const MessageId& id) {
    return id.ToHex().substr(0, 16);
}

} // namespace

const char* DeliveryStatusToString(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Pending: return "pending";
        case DeliveryStatus::Delivered: return "delivered";
        case DeliveryStatus::Failed: return "failed";
        case DeliveryStatus::Dropped: return "dropped";
        default: return "unknown";
    }
}

RelayNetwork::RelayNetwork() : RelayNetwork(Config{}) {}

RelayNetwork::RelayNetwork(const Config& config) : config_(config) {
    Require(config_.messengerVersion > 0, ErrorCode::InvalidMessengerVersion);
}

// ============================================================================
// Wiring
// ============================================================================

void RelayNetwork::RegisterReceiver(const DomainId& domain, const Address& address,
                                    IMessageReceiver* receiver) {
    Require(receiver != nullptr, ErrorCode::ZeroAddress, "receiver");
    Require(!address.IsNull(), ErrorCode::ZeroAddress, "receiver address");
    std::lock_guard<std::mutex> lock(mutex_);
    receivers_[{domain, address}] = receiver;
}

void RelayNetwork::UnregisterReceiver(const DomainId& domain, const Address& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    receivers_.erase({domain, address});
}

void RelayNetwork::RegisterFeeToken(const Address& token, vault::IAssetLedger* ledger) {
    Require(!token.IsNull() && ledger != nullptr, ErrorCode::ZeroAddress, "fee token");
    std::lock_guard<std::mutex> lock(mutex_);
    feeLedgers_[token] = ledger;
}

void RelayNetwork::SetMessengerVersion(uint32_t version) {
    Require(version > 0, ErrorCode::InvalidMessengerVersion);
    std::lock_guard<std::mutex> lock(mutex_);
    config_.messengerVersion = version;
}

uint32_t RelayNetwork::MessengerVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.messengerVersion;
}

void RelayNetwork::OnDelivery(DeliveryCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

// ============================================================================
// Submission
// ============================================================================

MessageId RelayNetwork::Submit(const DomainId& sourceDomain, const Address& sender,
                               const Address& feePayer, const SendMessageInput& input) {
    Require(!input.destinationAddress.IsNull(), ErrorCode::ZeroAddress, "destination address");

    if (input.fee.amount > 0) {
        vault::IAssetLedger* ledger = nullptr;
        Address collector;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = feeLedgers_.find(input.fee.feeToken);
            if (it != feeLedgers_.end()) {
                ledger = it->second;
            }
            collector = config_.feeCollector;
        }
        Require(ledger != nullptr, ErrorCode::UnknownFeeToken, ShortAddress(input.fee.feeToken).c_str());
        Require(!collector.IsNull(), ErrorCode::ZeroAddress, "fee collector");
        ledger->Transfer(feePayer, collector, input.fee.amount);
    }

    MessageRecord record;
    MessageEnvelope& env = record.envelope;
    env.sourceDomain = sourceDomain;
    env.originSender = sender;
    env.destinationDomain = input.destinationDomain;
    env.destinationAddress = input.destinationAddress;
    env.fee = input.fee;
    env.requiredGasLimit = input.requiredGasLimit;
    env.allowedRelayers = input.allowedRelayers;
    env.payload = input.message;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        env.nonce = nextNonce_++;
        env.messengerVersion = config_.messengerVersion;
        env.id = env.ComputeId();
        pending_.emplace(env.nonce, env.id);
        messages_[env.id] = record;
    }

    LOG_INFO(util::LogCategory::RELAY)
        << "Submitted message " << ShortId(env.id) << " nonce=" << env.nonce
        << " from " << ShortAddress(sender) << " to " << ShortAddress(env.destinationAddress)
        << " (" << env.payload.size() << " bytes, fee " << env.fee.amount << ")";
    return env.id;
}

// ============================================================================
// Delivery
// ============================================================================

DeliveryStatus RelayNetwork::Attempt(const MessageId& id) {
    IMessageReceiver* receiver = nullptr;
    MessageEnvelope env;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = messages_.find(id);
        if (it == messages_.end()) {
            throw OperationError(ErrorCode::MessageNotFound, ShortId(id));
        }
        MessageRecord& rec = it->second;
        if (rec.status == DeliveryStatus::Delivered || rec.status == DeliveryStatus::Dropped) {
            return rec.status;
        }
        if (!inFlight_.insert(id).second) {
            return rec.status;
        }
        ++rec.attempts;
        env = rec.envelope;

        auto rit = receivers_.find({env.destinationDomain, env.destinationAddress});
        if (rit != receivers_.end()) {
            receiver = rit->second;
        }
    }

    if (!receiver) {
        Finish(id, DeliveryStatus::Failed, ErrorCode::UnknownDestination,
               "no receiver at " + ShortAddress(env.destinationAddress));
        return DeliveryStatus::Failed;
    }

    try {
        receiver->ReceiveCrossDomainMessage(env.Context(), env.payload);
    } catch (const OperationError& e) {
        Finish(id, DeliveryStatus::Failed, e.Code(), e.Detail());
        return DeliveryStatus::Failed;
    } catch (const std::exception&) {
        // Leave the message in its previous state for the caller to inspect
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(id);
        throw;
    }

    Finish(id, DeliveryStatus::Delivered, ErrorCode::Ok, "");
    return DeliveryStatus::Delivered;
}

void RelayNetwork::Finish(const MessageId& id, DeliveryStatus status,
                          ErrorCode code, const std::string& detail) {
    MessageRecord snapshot;
    std::vector<DeliveryCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(id);
        MessageRecord& rec = messages_.at(id);
        pending_.erase(rec.envelope.nonce);
        rec.status = status;
        rec.lastError = code;
        rec.lastErrorDetail = detail;
        snapshot = rec;
        callbacks = callbacks_;
    }

    if (status == DeliveryStatus::Delivered) {
        LOG_INFO(util::LogCategory::RELAY)
            << "Delivered message " << ShortId(id) << " (attempt " << snapshot.attempts << ")";
    } else {
        LOG_WARN(util::LogCategory::RELAY)
            << "Delivery of message " << ShortId(id) << " failed: "
            << ErrorCodeToString(code) << (detail.empty() ? "" : " (" + detail + ")");
    }

    for (const auto& cb : callbacks) {
        cb(snapshot);
    }
}

std::optional<MessageId> RelayNetwork::DeliverNext() {
    std::optional<MessageId> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : pending_) {
            if (inFlight_.count(entry.second) == 0) {
                next = entry.second;
                break;
            }
        }
    }
    if (next) {
        Attempt(*next);
    }
    return next;
}

DeliveryStatus RelayNetwork::Deliver(const MessageId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = messages_.find(id);
        if (it == messages_.end()) {
            throw OperationError(ErrorCode::MessageNotFound, ShortId(id));
        }
        if (it->second.status != DeliveryStatus::Pending) {
            return it->second.status;
        }
    }
    return Attempt(id);
}

size_t RelayNetwork::DeliverAll() {
    std::vector<MessageId> pending = PendingMessages();
    size_t attempted = 0;
    for (const auto& id : pending) {
        Deliver(id);
        ++attempted;
    }
    return attempted;
}

void RelayNetwork::Drop(const MessageId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = messages_.find(id);
        if (it == messages_.end()) {
            throw OperationError(ErrorCode::MessageNotFound, ShortId(id));
        }
        MessageRecord& rec = it->second;
        if (rec.status == DeliveryStatus::Delivered || rec.status == DeliveryStatus::Dropped) {
            return;
        }
        pending_.erase(rec.envelope.nonce);
        rec.status = DeliveryStatus::Dropped;
    }
    LOG_WARN(util::LogCategory::RELAY) << "Message " << ShortId(id) << " dropped";
}

DeliveryStatus RelayNetwork::Retry(const MessageId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = messages_.find(id);
        if (it == messages_.end()) {
            throw OperationError(ErrorCode::MessageNotFound, ShortId(id));
        }
        if (it->second.status != DeliveryStatus::Failed) {
            return it->second.status;
        }
    }
    LOG_INFO(util::LogCategory::RELAY) << "Retrying message " << ShortId(id);
    return Attempt(id);
}

// ============================================================================
// Inspection
// ============================================================================

std::optional<MessageRecord> RelayNetwork::GetMessage(const MessageId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MessageId> RelayNetwork::PendingMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MessageId> result;
    result.reserve(pending_.size());
    for (const auto& entry : pending_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t RelayNetwork::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t RelayNetwork::MessageCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

size_t RelayNetwork::PruneFinished() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = messages_.begin(); it != messages_.end();) {
            DeliveryStatus status = it->second.status;
            if (status == DeliveryStatus::Delivered || status == DeliveryStatus::Dropped) {
                it = messages_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        LOG_DEBUG(util::LogCategory::RELAY) << "Pruned " << removed << " finished messages";
    }
    return removed;
}

} // namespace relay
} // namespace bondvault
