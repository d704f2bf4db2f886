// BONDVAULT - Price Rounds
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/oracle/round.h"

#include <sstream>

namespace bondvault {
namespace oracle {

std::string PriceRound::ToString() const {
    std::ostringstream oss;
    oss << "PriceRound(id=" << roundId
        << ", answer=" << answer
        << ", startedAt=" << startedAt
        << ", updatedAt=" << updatedAt
        << ", answeredInRound=" << answeredInRound << ")";
    return oss.str();
}

} // namespace oracle
} // namespace bondvault
