// BONDVAULT - Error Codes Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/core/errors.h"

namespace bondvault {

namespace {

std::string FormatMessage(ErrorCode code, const std::string& detail) {
    std::string msg = ErrorCodeToString(code);
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

} // namespace

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::OnlyDebtor: return "OnlyDebtor";
        case ErrorCode::OnlyDebtorOrCreditor: return "OnlyDebtorOrCreditor";
        case ErrorCode::OnlyAdmin: return "OnlyAdmin";
        case ErrorCode::NotBondOwner: return "NotBondOwner";
        case ErrorCode::UnauthorizedMessenger: return "UnauthorizedMessenger";
        case ErrorCode::PrincipalAlreadyPaid: return "PrincipalAlreadyPaid";
        case ErrorCode::PrincipalNotPaid: return "PrincipalNotPaid";
        case ErrorCode::ZeroAddress: return "ZeroAddress";
        case ErrorCode::ZeroAmount: return "ZeroAmount";
        case ErrorCode::InvalidPrincipalAmount: return "InvalidPrincipalAmount";
        case ErrorCode::ExcessiveVaultFees: return "ExcessiveVaultFees";
        case ErrorCode::InvalidBondMaturity: return "InvalidBondMaturity";
        case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
        case ErrorCode::InvalidMessengerVersion: return "InvalidMessengerVersion";
        case ErrorCode::InvalidDecimals: return "InvalidDecimals";
        case ErrorCode::StalePrice: return "StalePrice";
        case ErrorCode::InvalidPriceValue: return "InvalidPriceValue";
        case ErrorCode::PriceFeedsTimeMismatch: return "PriceFeedsTimeMismatch";
        case ErrorCode::RoundNotFound: return "RoundNotFound";
        case ErrorCode::InvalidPayload: return "InvalidPayload";
        case ErrorCode::InvalidSource: return "InvalidSource";
        case ErrorCode::UnexpectedMessage: return "UnexpectedMessage";
        case ErrorCode::UnknownDestination: return "UnknownDestination";
        case ErrorCode::MessageNotFound: return "MessageNotFound";
        case ErrorCode::UnknownFeeToken: return "UnknownFeeToken";
        case ErrorCode::InsufficientAssets: return "InsufficientAssets";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::InsufficientAllowance: return "InsufficientAllowance";
        case ErrorCode::NonexistentBond: return "NonexistentBond";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::StorageFailure: return "StorageFailure";
        default: return "Unknown";
    }
}

ErrorCategory ErrorCodeCategory(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return ErrorCategory::None;
        case ErrorCode::OnlyDebtor:
        case ErrorCode::OnlyDebtorOrCreditor:
        case ErrorCode::OnlyAdmin:
        case ErrorCode::NotBondOwner:
        case ErrorCode::UnauthorizedMessenger:
            return ErrorCategory::Authorization;
        case ErrorCode::PrincipalAlreadyPaid:
        case ErrorCode::PrincipalNotPaid:
            return ErrorCategory::StatePrecondition;
        case ErrorCode::ZeroAddress:
        case ErrorCode::ZeroAmount:
        case ErrorCode::InvalidPrincipalAmount:
        case ErrorCode::ExcessiveVaultFees:
        case ErrorCode::InvalidBondMaturity:
        case ErrorCode::ArithmeticOverflow:
        case ErrorCode::InvalidMessengerVersion:
        case ErrorCode::InvalidDecimals:
            return ErrorCategory::ParameterValidation;
        case ErrorCode::StalePrice:
        case ErrorCode::InvalidPriceValue:
        case ErrorCode::PriceFeedsTimeMismatch:
        case ErrorCode::RoundNotFound:
        case ErrorCode::InvalidPayload:
            return ErrorCategory::OracleIntegrity;
        case ErrorCode::InvalidSource:
        case ErrorCode::UnexpectedMessage:
        case ErrorCode::UnknownDestination:
        case ErrorCode::MessageNotFound:
        case ErrorCode::UnknownFeeToken:
            return ErrorCategory::Relay;
        case ErrorCode::InsufficientAssets:
            return ErrorCategory::Slippage;
        case ErrorCode::InsufficientBalance:
        case ErrorCode::InsufficientAllowance:
        case ErrorCode::NonexistentBond:
            return ErrorCategory::Ledger;
        case ErrorCode::NotSupported:
        case ErrorCode::StorageFailure:
            return ErrorCategory::Unsupported;
    }
    return ErrorCategory::None;
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::Authorization: return "authorization";
        case ErrorCategory::StatePrecondition: return "state-precondition";
        case ErrorCategory::ParameterValidation: return "parameter-validation";
        case ErrorCategory::OracleIntegrity: return "oracle-integrity";
        case ErrorCategory::Relay: return "relay";
        case ErrorCategory::Slippage: return "slippage";
        case ErrorCategory::Ledger: return "ledger";
        case ErrorCategory::Unsupported: return "unsupported";
        default: return "unknown";
    }
}

OperationError::OperationError(ErrorCode code, const std::string& detail)
    : std::runtime_error(FormatMessage(code, detail)),
      code_(code),
      detail_(detail) {}

} // namespace bondvault
