// BONDVAULT - Local Mock Price Feed
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Round-based feed driven by hand. Used as the source feed on the sending
// domain and as a stand-in feed in tests.

#ifndef BONDVAULT_ORACLE_MOCK_FEED_H
#define BONDVAULT_ORACLE_MOCK_FEED_H

#include "bondvault/oracle/round.h"

#include <map>
#include <mutex>
#include <string>

namespace bondvault {
namespace oracle {

class MockPriceFeed : public IRoundFeed {
public:
    static constexpr uint64_t VERSION = 0;

    /// Opens round 1 with `initialAnswer` at the current time
    MockPriceFeed(uint8_t decimals, Answer initialAnswer,
                  std::string description = "MOCK / USD");

    /// Open the next round with `answer`, stamped with the current time
    RoundId UpdateAnswer(Answer answer);

    /// Write an arbitrary round and make it the latest.
    /// answeredInRound 0 means "answered in this round".
    void UpdateRoundData(RoundId roundId, Answer answer,
                         Timestamp updatedAt, Timestamp startedAt,
                         RoundId answeredInRound = 0);

    PriceRound LatestRoundData() const override;
    PriceRound GetRoundData(RoundId roundId) const override;
    uint8_t Decimals() const override { return decimals_; }
    std::string Description() const override { return description_; }
    uint64_t Version() const override { return VERSION; }

    RoundId LatestRound() const;

private:
    const uint8_t decimals_;
    const std::string description_;

    std::map<RoundId, PriceRound> rounds_;
    RoundId latestRound_{0};
    mutable std::mutex mutex_;
};

} // namespace oracle
} // namespace bondvault

#endif // BONDVAULT_ORACLE_MOCK_FEED_H
