// BONDVAULT - Error Codes
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Every rejected operation in BondVault raises an OperationError carrying one
// of the codes below. Operations check all preconditions before mutating
// state, so a thrown OperationError always means "nothing happened".

#ifndef BONDVAULT_CORE_ERRORS_H
#define BONDVAULT_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace bondvault {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // Authorization
    OnlyDebtor,
    OnlyDebtorOrCreditor,
    OnlyAdmin,
    NotBondOwner,
    UnauthorizedMessenger,

    // State preconditions
    PrincipalAlreadyPaid,
    PrincipalNotPaid,

    // Parameter validation
    ZeroAddress,
    ZeroAmount,
    InvalidPrincipalAmount,
    ExcessiveVaultFees,
    InvalidBondMaturity,
    ArithmeticOverflow,
    InvalidMessengerVersion,
    InvalidDecimals,

    // Oracle integrity
    StalePrice,
    InvalidPriceValue,
    PriceFeedsTimeMismatch,
    RoundNotFound,
    InvalidPayload,

    // Relay
    InvalidSource,
    UnexpectedMessage,
    UnknownDestination,
    MessageNotFound,
    UnknownFeeToken,

    // Slippage
    InsufficientAssets,

    // Asset ledger / registry
    InsufficientBalance,
    InsufficientAllowance,
    NonexistentBond,

    // Unsupported / storage
    NotSupported,
    StorageFailure,
};

/// Taxonomy class of an error code
enum class ErrorCategory {
    None,
    Authorization,
    StatePrecondition,
    ParameterValidation,
    OracleIntegrity,
    Relay,
    Slippage,
    Ledger,
    Unsupported,
};

/// Stable identifier for an error code (e.g. "StalePrice")
const char* ErrorCodeToString(ErrorCode code);

/// Taxonomy class of an error code
ErrorCategory ErrorCodeCategory(ErrorCode code);

/// Name of a taxonomy class (e.g. "authorization")
const char* ErrorCategoryToString(ErrorCategory category);

// ============================================================================
// OperationError
// ============================================================================

/**
 * Exception raised when an operation is rejected.
 *
 * what() reads "<Code>" or "<Code>: <detail>".
 */
class OperationError : public std::runtime_error {
public:
    explicit OperationError(ErrorCode code, const std::string& detail = "");

    ErrorCode Code() const noexcept { return code_; }
    const std::string& Detail() const noexcept { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

/// Throw OperationError(code, detail) unless cond holds
inline void Require(bool cond, ErrorCode code, const char* detail = "") {
    if (!cond) {
        throw OperationError(code, detail);
    }
}

} // namespace bondvault

#endif // BONDVAULT_CORE_ERRORS_H
