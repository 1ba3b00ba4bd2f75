// POLYMINT - Call Results Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/core/result.h"

namespace polymint {

const char* CallErrorToString(CallError err) {
    switch (err) {
        case CallError::None:                    return "None";
        case CallError::NotStarted:              return "NotStarted";
        case CallError::EpochNotOpened:          return "EpochNotOpened";
        case CallError::SameBlockReentry:        return "SameBlockReentry";
        case CallError::AlreadyInitialized:      return "AlreadyInitialized";
        case CallError::NotInitialized:          return "NotInitialized";
        case CallError::MissingPermission:       return "MissingPermission";
        case CallError::ZeroAmount:              return "ZeroAmount";
        case CallError::PriceMoved:              return "PriceMoved";
        case CallError::PriceNotEligible:        return "PriceNotEligible";
        case CallError::InsufficientBudget:      return "InsufficientBudget";
        case CallError::InvalidBondRate:         return "InvalidBondRate";
        case CallError::OverMaxDebtRatio:        return "OverMaxDebtRatio";
        case CallError::TreasuryBudgetExhausted: return "TreasuryBudgetExhausted";
        case CallError::InvalidArgument:         return "InvalidArgument";
        case CallError::DuplicatePool:           return "DuplicatePool";
        case CallError::UnknownPool:             return "UnknownPool";
        case CallError::InsufficientBalance:     return "InsufficientBalance";
        case CallError::ProtectedToken:          return "ProtectedToken";
        case CallError::CollaboratorFailure:     return "CollaboratorFailure";
        case CallError::OracleFailure:           return "OracleFailure";
        case CallError::Unauthorized:            return "Unauthorized";
        case CallError::OutOfRange:              return "OutOfRange";
        case CallError::ArithmeticFault:         return "ArithmeticFault";
        default:                                 return "Unknown";
    }
}

const char* ErrorClassToString(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::None:          return "None";
        case ErrorClass::Precondition:  return "PreconditionViolation";
        case ErrorClass::Oracle:        return "OracleFailure";
        case ErrorClass::Authorization: return "AuthorizationFailure";
        case ErrorClass::Range:         return "RangeViolation";
        case ErrorClass::Arithmetic:    return "ArithmeticFault";
        default:                        return "Unknown";
    }
}

ErrorClass ClassifyError(CallError err) {
    switch (err) {
        case CallError::None:
            return ErrorClass::None;
        case CallError::OracleFailure:
            return ErrorClass::Oracle;
        case CallError::Unauthorized:
        case CallError::MissingPermission:
            return ErrorClass::Authorization;
        case CallError::OutOfRange:
            return ErrorClass::Range;
        case CallError::ArithmeticFault:
            return ErrorClass::Arithmetic;
        default:
            return ErrorClass::Precondition;
    }
}

std::string CallResult::ToString() const {
    if (IsOk()) {
        return "OK";
    }
    return std::string(CallErrorToString(error)) + ": " + reason;
}

} // namespace polymint
