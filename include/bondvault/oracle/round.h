// BONDVAULT - Price Rounds
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// A price round is one timestamped observation from a round-based feed.
// Every feed in BondVault (local mock feeds, the relayed valuation oracle and
// the ratio aggregator) answers the same IRoundFeed queries.

#ifndef BONDVAULT_ORACLE_ROUND_H
#define BONDVAULT_ORACLE_ROUND_H

#include "bondvault/core/bigint.h"
#include "bondvault/core/serialize.h"
#include "bondvault/core/types.h"

#include <cstdint>
#include <string>

namespace bondvault {
namespace oracle {

// ============================================================================
// PriceRound
// ============================================================================

/**
 * A single price observation.
 *
 * roundId == 0 is the "absent" sentinel: a feed that has never received data
 * reports an all-zero round.
 */
struct PriceRound {
    RoundId roundId{0};
    Answer answer{0};
    Timestamp startedAt{0};
    Timestamp updatedAt{0};
    RoundId answeredInRound{0};

    bool IsAbsent() const { return roundId == 0; }

    bool operator==(const PriceRound& other) const {
        return roundId == other.roundId && answer == other.answer &&
               startedAt == other.startedAt && updatedAt == other.updatedAt &&
               answeredInRound == other.answeredInRound;
    }
    bool operator!=(const PriceRound& other) const { return !(*this == other); }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const PriceRound& r) {
    ::bondvault::Serialize(s, r.roundId);
    ::bondvault::Serialize(s, r.answer);
    ::bondvault::Serialize(s, r.startedAt);
    ::bondvault::Serialize(s, r.updatedAt);
    ::bondvault::Serialize(s, r.answeredInRound);
}

template<typename Stream>
void Unserialize(Stream& s, PriceRound& r) {
    ::bondvault::Unserialize(s, r.roundId);
    ::bondvault::Unserialize(s, r.answer);
    ::bondvault::Unserialize(s, r.startedAt);
    ::bondvault::Unserialize(s, r.updatedAt);
    ::bondvault::Unserialize(s, r.answeredInRound);
}

// ============================================================================
// Round Feed Interface
// ============================================================================

/// Read side of a round-based price feed
class IRoundFeed {
public:
    virtual ~IRoundFeed() = default;

    /// Most recent round (all-zero if the feed has none)
    virtual PriceRound LatestRoundData() const = 0;

    /// Stored round; throws OperationError(RoundNotFound) if never written
    virtual PriceRound GetRoundData(RoundId roundId) const = 0;

    /// Number of decimals in Answer values
    virtual uint8_t Decimals() const = 0;

    virtual std::string Description() const = 0;

    virtual uint64_t Version() const = 0;
};

} // namespace oracle
} // namespace bondvault

#endif // BONDVAULT_ORACLE_ROUND_H
