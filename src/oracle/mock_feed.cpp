// BONDVAULT - Local Mock Price Feed Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/oracle/mock_feed.h"
#include "bondvault/core/errors.h"
#include "bondvault/util/time.h"

namespace bondvault {
namespace oracle {

MockPriceFeed::MockPriceFeed(uint8_t decimals, Answer initialAnswer, std::string description)
    : decimals_(decimals), description_(std::move(description)) {
    Require(decimals_ <= 18, ErrorCode::InvalidDecimals);
    UpdateAnswer(initialAnswer);
}

RoundId MockPriceFeed::UpdateAnswer(Answer answer) {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = util::GetTime();

    PriceRound round;
    round.roundId = latestRound_ + 1;
    round.answer = answer;
    round.startedAt = now;
    round.updatedAt = now;
    round.answeredInRound = round.roundId;

    rounds_[round.roundId] = round;
    latestRound_ = round.roundId;
    return latestRound_;
}

void MockPriceFeed::UpdateRoundData(RoundId roundId, Answer answer,
                                    Timestamp updatedAt, Timestamp startedAt,
                                    RoundId answeredInRound) {
    Require(roundId != 0, ErrorCode::InvalidPayload, "round id 0");
    std::lock_guard<std::mutex> lock(mutex_);

    PriceRound round;
    round.roundId = roundId;
    round.answer = answer;
    round.startedAt = startedAt;
    round.updatedAt = updatedAt;
    round.answeredInRound = answeredInRound == 0 ? roundId : answeredInRound;

    rounds_[roundId] = round;
    latestRound_ = roundId;
}

PriceRound MockPriceFeed::LatestRoundData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(latestRound_);
    return it == rounds_.end() ? PriceRound{} : it->second;
}

PriceRound MockPriceFeed::GetRoundData(RoundId roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(roundId);
    if (it == rounds_.end()) {
        throw OperationError(ErrorCode::RoundNotFound, roundId.str());
    }
    return it->second;
}

RoundId MockPriceFeed::LatestRound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latestRound_;
}

} // namespace oracle
} // namespace bondvault
