// BONDVAULT - Relayed Valuation Oracle
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Mirrors a remote round-based price feed. Rounds arrive only through
// authenticated relay delivery from one configured (domain, sender) pair and
// are served through the IRoundFeed queries.

#ifndef BONDVAULT_ORACLE_VALUATION_ORACLE_H
#define BONDVAULT_ORACLE_VALUATION_ORACLE_H

#include "bondvault/oracle/round.h"
#include "bondvault/oracle/round_store.h"
#include "bondvault/relay/messenger.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bondvault {
namespace oracle {

/// How the oracle treats a delivered round that is not newer than the latest
enum class RoundOrderPolicy {
    /// Store it and move the latest pointer to it (last delivery wins)
    AcceptAll,
    /// Reject rounds whose id is not greater than the latest (InvalidPayload)
    RejectNonIncreasing,
};

const char* RoundOrderPolicyToString(RoundOrderPolicy policy);

class ValuationOracle : public relay::RelayReceiverApp, public IRoundFeed {
public:
    static constexpr uint64_t VERSION = 1;

    struct Config {
        /// May raise the minimum messenger version
        Address admin;
        /// Only deliveries from this domain...
        relay::DomainId sourceDomain;
        /// ...and this sender are accepted
        Address sourceSender;
        uint8_t decimals{8};
        std::string description;
        uint32_t minMessengerVersion{1};
        RoundOrderPolicy orderPolicy{RoundOrderPolicy::AcceptAll};
    };

    using RoundCallback = std::function<void(const PriceRound&)>;

    /**
     * Create the oracle.
     *
     * @param config Source pair and feed metadata
     * @param store  Optional persistent history; existing rounds are loaded
     */
    explicit ValuationOracle(const Config& config,
                             std::shared_ptr<RoundStore> store = nullptr);

    // ========================================================================
    // IRoundFeed
    // ========================================================================

    PriceRound LatestRoundData() const override;
    PriceRound GetRoundData(RoundId roundId) const override;
    uint8_t Decimals() const override { return config_.decimals; }
    std::string Description() const override { return config_.description; }
    uint64_t Version() const override { return VERSION; }

    // ========================================================================
    // Queries
    // ========================================================================

    RoundId LatestRoundId() const;
    size_t RoundCount() const;
    const relay::DomainId& SourceDomain() const { return config_.sourceDomain; }
    const Address& SourceSender() const { return config_.sourceSender; }
    RoundOrderPolicy OrderPolicy() const { return config_.orderPolicy; }

    /// Called after each stored round (RoundDataUpdated)
    void OnRoundDataUpdated(RoundCallback callback);

protected:
    void ReceiveMessage(const relay::MessageContext& context,
                        const std::vector<uint8_t>& payload) override;

private:
    const Config config_;
    std::shared_ptr<RoundStore> store_;

    std::map<RoundId, PriceRound> rounds_;
    RoundId latestRoundId_{0};
    std::vector<RoundCallback> callbacks_;
    mutable std::mutex mutex_;
};

} // namespace oracle
} // namespace bondvault

#endif // BONDVAULT_ORACLE_VALUATION_ORACLE_H
