// BONDVAULT - Relayed Valuation Oracle Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/oracle/valuation_oracle.h"
#include "bondvault/core/errors.h"
#include "bondvault/oracle/round_codec.h"
#include "bondvault/util/logging.h"

namespace bondvault {
namespace oracle {

const char* RoundOrderPolicyToString(RoundOrderPolicy policy) {
    switch (policy) {
        case RoundOrderPolicy::AcceptAll: return "accept-all";
        case RoundOrderPolicy::RejectNonIncreasing: return "reject-non-increasing";
        default: return "unknown";
    }
}

ValuationOracle::ValuationOracle(const Config& config, std::shared_ptr<RoundStore> store)
    : RelayReceiverApp(config.admin, config.minMessengerVersion),
      config_(config),
      store_(std::move(store)) {
    Require(!config_.sourceSender.IsNull(), ErrorCode::ZeroAddress, "source sender");
    Require(config_.decimals <= 18, ErrorCode::InvalidDecimals);

    if (store_) {
        rounds_ = store_->LoadAll();
        latestRoundId_ = store_->LatestRoundId();
        if (latestRoundId_ != 0 && rounds_.count(latestRoundId_) == 0) {
            throw OperationError(ErrorCode::StorageFailure,
                                 "latest round " + latestRoundId_.str() + " missing");
        }
        LOG_INFO(util::LogCategory::ORACLE)
            << "Loaded " << rounds_.size() << " rounds, latest " << latestRoundId_;
    }
}

PriceRound ValuationOracle::LatestRoundData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(latestRoundId_);
    if (it == rounds_.end()) {
        return PriceRound{};
    }
    return it->second;
}

PriceRound ValuationOracle::GetRoundData(RoundId roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(roundId);
    if (it == rounds_.end()) {
        throw OperationError(ErrorCode::RoundNotFound, roundId.str());
    }
    return it->second;
}

RoundId ValuationOracle::LatestRoundId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latestRoundId_;
}

size_t ValuationOracle::RoundCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rounds_.size();
}

void ValuationOracle::OnRoundDataUpdated(RoundCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void ValuationOracle::ReceiveMessage(const relay::MessageContext& context,
                                     const std::vector<uint8_t>& payload) {
    if (context.sourceDomain != config_.sourceDomain ||
        context.originSender != config_.sourceSender) {
        LOG_WARN(util::LogCategory::ORACLE)
            << "Rejected round from unexpected source " << ShortAddress(context.originSender);
        throw OperationError(ErrorCode::InvalidSource, ShortAddress(context.originSender));
    }

    PriceRound round = DecodeRound(payload);

    std::vector<RoundCallback> callbacks;
    RoundId previous = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = latestRoundId_;
        if (round.roundId <= previous &&
            config_.orderPolicy == RoundOrderPolicy::RejectNonIncreasing) {
            throw OperationError(ErrorCode::InvalidPayload,
                                 "round " + round.roundId.str() +
                                 " not newer than " + previous.str());
        }

        // Persist first so a storage failure leaves memory untouched
        if (store_) {
            store_->Store(round);
        }
        rounds_[round.roundId] = round;
        latestRoundId_ = round.roundId;
        callbacks = callbacks_;
    }

    if (round.roundId < previous) {
        LOG_WARN(util::LogCategory::ORACLE)
            << "Latest round moved back from " << previous << " to " << round.roundId;
    }
    LOG_INFO(util::LogCategory::ORACLE) << "Round data updated: " << round.ToString();

    for (const auto& cb : callbacks) {
        cb(round);
    }
}

} // namespace oracle
} // namespace bondvault
