// BONDVAULT - Price Relayer Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/oracle/price_relayer.h"
#include "bondvault/core/errors.h"
#include "bondvault/oracle/round_codec.h"
#include "bondvault/util/logging.h"

namespace bondvault {
namespace oracle {

PriceRelayer::PriceRelayer(const Config& config, const IRoundFeed* feed,
                           relay::IMessenger* messenger)
    : RelayReceiverApp(config.admin, config.minMessengerVersion),
      config_(config),
      feed_(feed),
      messenger_(messenger) {
    Require(!config_.address.IsNull(), ErrorCode::ZeroAddress, "relayer address");
    Require(feed_ != nullptr, ErrorCode::ZeroAddress, "price feed");
    Require(messenger_ != nullptr, ErrorCode::ZeroAddress, "messenger");
}

relay::MessageId PriceRelayer::SendLatestRoundData(const Address& caller,
                                                   const relay::DomainId& destinationDomain,
                                                   const Address& destinationAddress,
                                                   const Address& feeToken,
                                                   Amount feeAmount,
                                                   uint64_t gasLimit) {
    PriceRound round = feed_->LatestRoundData();

    relay::SendMessageInput input;
    input.destinationDomain = destinationDomain;
    input.destinationAddress = destinationAddress;
    input.fee.feeToken = feeToken;
    input.fee.amount = feeAmount;
    input.requiredGasLimit = gasLimit;
    input.message = EncodeRound(round);

    relay::MessageId id = messenger_->SendCrossDomainMessage(config_.address, caller, input);

    LOG_INFO(util::LogCategory::ORACLE)
        << "Relayed round " << round.roundId << " (answer " << round.answer
        << ") as message " << id.ToHex().substr(0, 16);
    return id;
}

PriceRound PriceRelayer::GetLatestRoundData() const {
    return feed_->LatestRoundData();
}

void PriceRelayer::ReceiveMessage(const relay::MessageContext& context,
                                  const std::vector<uint8_t>&) {
    throw OperationError(ErrorCode::UnexpectedMessage, ShortAddress(context.originSender));
}

} // namespace oracle
} // namespace bondvault
