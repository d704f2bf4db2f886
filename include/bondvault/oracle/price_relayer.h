// BONDVAULT - Price Relayer
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_ORACLE_PRICE_RELAYER_H
#define BONDVAULT_ORACLE_PRICE_RELAYER_H

#include "bondvault/oracle/round.h"
#include "bondvault/relay/messenger.h"

#include <cstdint>
#include <vector>

namespace bondvault {
namespace oracle {

/**
 * Send-only forwarder of a local feed's latest round.
 *
 * Holds no state of its own. Submission failures from the messenger are
 * propagated to the caller. Every inbound delivery is refused with
 * UnexpectedMessage.
 */
class PriceRelayer : public relay::RelayReceiverApp {
public:
    struct Config {
        /// Address this relayer sends from (the oracle's configured sender)
        Address address;
        Address admin;
        uint32_t minMessengerVersion{1};
    };

    /// Feed and messenger are not owned and must outlive the relayer
    PriceRelayer(const Config& config, const IRoundFeed* feed, relay::IMessenger* messenger);

    /**
     * Forward the feed's latest round to a destination oracle.
     *
     * @param caller             Account paying the relay fee
     * @param destinationDomain  Domain of the receiving oracle
     * @param destinationAddress Address of the receiving oracle
     * @param feeToken           Token the fee is paid in
     * @param feeAmount          Fee amount (may be zero)
     * @param gasLimit           Execution budget requested for delivery
     * @return Relay-assigned message id
     */
    relay::MessageId SendLatestRoundData(const Address& caller,
                                         const relay::DomainId& destinationDomain,
                                         const Address& destinationAddress,
                                         const Address& feeToken,
                                         Amount feeAmount,
                                         uint64_t gasLimit);

    /// Read-only passthrough of the wrapped feed
    PriceRound GetLatestRoundData() const;

    const Address& GetAddress() const { return config_.address; }

protected:
    void ReceiveMessage(const relay::MessageContext& context,
                        const std::vector<uint8_t>& payload) override;

private:
    const Config config_;
    const IRoundFeed* feed_;
    relay::IMessenger* messenger_;
};

} // namespace oracle
} // namespace bondvault

#endif // BONDVAULT_ORACLE_PRICE_RELAYER_H
