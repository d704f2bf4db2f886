// BONDVAULT - Asset Valuation
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Converts value units into asset units using a feed's latest round.

#ifndef BONDVAULT_VAULT_VALUATION_H
#define BONDVAULT_VAULT_VALUATION_H

#include "bondvault/oracle/round.h"

#include <cstdint>

namespace bondvault {
namespace vault {

/// Oldest acceptable price (seconds between updatedAt and now): 25 hours
constexpr Timestamp MAX_PRICE_AGE = 25 * 60 * 60;

struct AssetQuote {
    oracle::PriceRound round;
    Amount requiredAssets{0};
};

/**
 * Latest round of `feed`, checked for use in valuation.
 *
 * Throws StalePrice when now - updatedAt > MAX_PRICE_AGE and
 * InvalidPriceValue when the answer is not positive.
 */
oracle::PriceRound CheckedLatestPrice(const oracle::IRoundFeed& feed, Timestamp now);

/// targetValue * 10^assetDecimals / price, floored
Amount RequiredAssets(Amount targetValue, uint8_t assetDecimals, Answer price);

/// Price check plus conversion in one step
AssetQuote QuoteAssets(const oracle::IRoundFeed& feed, uint8_t assetDecimals,
                       Amount targetValue, Timestamp now);

} // namespace vault
} // namespace bondvault

#endif // BONDVAULT_VAULT_VALUATION_H
