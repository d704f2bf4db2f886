// BONDVAULT - Relay Receiver Base and Envelope
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/relay/envelope.h"
#include "bondvault/relay/messenger.h"
#include "bondvault/core/errors.h"
#include "bondvault/crypto/sha256.h"
#include "bondvault/util/logging.h"

namespace bondvault {
namespace relay {

// ============================================================================
// MessageEnvelope
// ============================================================================

MessageId MessageEnvelope::ComputeId() const {
    DataStream ss;
    SerializeBody(ss, *this);
    return SHA256Hash(ss.data(), ss.size());
}

// ============================================================================
// RelayReceiverApp
// ============================================================================

RelayReceiverApp::RelayReceiverApp(const Address& admin, uint32_t minMessengerVersion)
    : admin_(admin), minMessengerVersion_(minMessengerVersion) {
    Require(!admin_.IsNull(), ErrorCode::ZeroAddress, "receiver admin");
    Require(minMessengerVersion_ > 0, ErrorCode::InvalidMessengerVersion,
            "minimum messenger version must be positive");
}

void RelayReceiverApp::ReceiveCrossDomainMessage(const MessageContext& context,
                                                 const std::vector<uint8_t>& payload) {
    uint32_t minVersion = MinMessengerVersion();
    if (context.messengerVersion < minVersion) {
        LOG_WARN(util::LogCategory::RELAY)
            << "Refusing message " << context.messageId.ToHex().substr(0, 16)
            << ": messenger version " << context.messengerVersion
            << " below minimum " << minVersion;
        throw OperationError(ErrorCode::UnauthorizedMessenger,
                             "messenger version " + std::to_string(context.messengerVersion));
    }
    ReceiveMessage(context, payload);
}

void RelayReceiverApp::UpdateMinMessengerVersion(const Address& caller, uint32_t version) {
    Require(caller == admin_, ErrorCode::OnlyAdmin);
    {
        std::lock_guard<std::mutex> lock(gateMutex_);
        Require(version > minMessengerVersion_, ErrorCode::InvalidMessengerVersion,
                "minimum messenger version can only increase");
        minMessengerVersion_ = version;
    }
    LOG_INFO(util::LogCategory::RELAY) << "Minimum messenger version raised to " << version;
}

uint32_t RelayReceiverApp::MinMessengerVersion() const {
    std::lock_guard<std::mutex> lock(gateMutex_);
    return minMessengerVersion_;
}

Address RelayReceiverApp::Admin() const {
    return admin_;
}

} // namespace relay
} // namespace bondvault
