// BONDVAULT - Asset Valuation Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/vault/valuation.h"
#include "bondvault/core/arith.h"
#include "bondvault/core/bigint.h"
#include "bondvault/core/errors.h"

#include <limits>

namespace bondvault {
namespace vault {

oracle::PriceRound CheckedLatestPrice(const oracle::IRoundFeed& feed, Timestamp now) {
    oracle::PriceRound round = feed.LatestRoundData();

    // Equivalent to now - updatedAt > MAX_PRICE_AGE without overflow.
    // An absent round (updatedAt 0) is always stale.
    if (round.updatedAt < now - MAX_PRICE_AGE) {
        throw OperationError(ErrorCode::StalePrice,
                             "round " + round.roundId.str() + " updated at " +
                             std::to_string(round.updatedAt));
    }
    Require(round.answer > 0, ErrorCode::InvalidPriceValue, round.answer.str().c_str());
    return round;
}

Amount RequiredAssets(Amount targetValue, uint8_t assetDecimals, Answer price) {
    Require(price > 0, ErrorCode::InvalidPriceValue);
    Answer assets = MulDivSigned(Answer(targetValue), Answer(Pow10(assetDecimals)), price);
    Require(assets <= std::numeric_limits<Amount>::max(), ErrorCode::ArithmeticOverflow,
            "required assets");
    return assets.convert_to<Amount>();
}

AssetQuote QuoteAssets(const oracle::IRoundFeed& feed, uint8_t assetDecimals,
                       Amount targetValue, Timestamp now) {
    AssetQuote quote;
    quote.round = CheckedLatestPrice(feed, now);
    quote.requiredAssets = RequiredAssets(targetValue, assetDecimals, quote.round.answer);
    return quote;
}

} // namespace vault
} // namespace bondvault
