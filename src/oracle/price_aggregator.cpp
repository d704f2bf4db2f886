// BONDVAULT - Two-Feed Ratio Aggregator Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/oracle/price_aggregator.h"
#include "bondvault/core/arith.h"
#include "bondvault/core/errors.h"

namespace bondvault {
namespace oracle {

PriceAggregator::PriceAggregator(const IRoundFeed* feed1, const IRoundFeed* feed2,
                                 uint8_t decimals)
    : feed1_(feed1), feed2_(feed2), decimals_(decimals) {
    Require(feed1_ != nullptr, ErrorCode::ZeroAddress, "feed1");
    Require(feed2_ != nullptr, ErrorCode::ZeroAddress, "feed2");
    Require(decimals_ <= 18, ErrorCode::InvalidDecimals);
}

PriceRound PriceAggregator::LatestRoundData() const {
    return Compose(feed1_->LatestRoundData(), feed2_->LatestRoundData());
}

PriceRound PriceAggregator::GetRoundData(RoundId roundId) const {
    return Compose(feed1_->GetRoundData(roundId), feed2_->GetRoundData(roundId));
}

std::string PriceAggregator::Description() const {
    return "(" + feed1_->Description() + ") / (" + feed2_->Description() + ")";
}

PriceRound PriceAggregator::Compose(const PriceRound& r1, const PriceRound& r2) const {
    Timestamp delta = r1.updatedAt > r2.updatedAt ? r1.updatedAt - r2.updatedAt
                                                  : r2.updatedAt - r1.updatedAt;
    if (delta > MAX_FEED_TIME_DELTA) {
        throw OperationError(ErrorCode::PriceFeedsTimeMismatch,
                             std::to_string(delta) + "s apart");
    }
    Require(r2.answer != 0, ErrorCode::InvalidPriceValue, "zero denominator");

    PriceRound out = r1;
    out.answer = MulDivSigned(r1.answer, Answer(Pow10(decimals_)), r2.answer);
    return out;
}

} // namespace oracle
} // namespace bondvault
