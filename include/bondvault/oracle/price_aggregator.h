// BONDVAULT - Two-Feed Ratio Aggregator
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_ORACLE_PRICE_AGGREGATOR_H
#define BONDVAULT_ORACLE_PRICE_AGGREGATOR_H

#include "bondvault/oracle/round.h"

#include <cstdint>
#include <string>

namespace bondvault {
namespace oracle {

/// Largest allowed gap between the two feeds' updatedAt (seconds)
constexpr Timestamp MAX_FEED_TIME_DELTA = 3600;

/**
 * Ratio of two round-based feeds.
 *
 * answer = feed1.answer * 10^decimals / feed2.answer, truncated. Round
 * metadata (ids and timestamps) comes from feed1 only. Both rounds must have
 * been updated within MAX_FEED_TIME_DELTA of each other.
 */
class PriceAggregator : public IRoundFeed {
public:
    static constexpr uint64_t VERSION = 1;

    /// Feeds are not owned and must outlive the aggregator
    PriceAggregator(const IRoundFeed* feed1, const IRoundFeed* feed2, uint8_t decimals);

    PriceRound LatestRoundData() const override;
    PriceRound GetRoundData(RoundId roundId) const override;
    uint8_t Decimals() const override { return decimals_; }
    std::string Description() const override;
    uint64_t Version() const override { return VERSION; }

private:
    PriceRound Compose(const PriceRound& r1, const PriceRound& r2) const;

    const IRoundFeed* feed1_;
    const IRoundFeed* feed2_;
    const uint8_t decimals_;
};

} // namespace oracle
} // namespace bondvault

#endif // BONDVAULT_ORACLE_PRICE_AGGREGATOR_H
