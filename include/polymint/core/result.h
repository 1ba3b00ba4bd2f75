// POLYMINT - Call Results
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Outcome of a state-mutating entry point. A failed call never leaves
// partial mutations behind; the result carries the reason it was rejected.

#ifndef POLYMINT_CORE_RESULT_H
#define POLYMINT_CORE_RESULT_H

#include <string>

namespace polymint {

// ============================================================================
// Error Codes
// ============================================================================

/// Reasons an entry point can reject a call
enum class CallError {
    None = 0,

    // Guards
    NotStarted,
    EpochNotOpened,
    SameBlockReentry,
    AlreadyInitialized,
    NotInitialized,
    MissingPermission,

    // Preconditions
    ZeroAmount,
    PriceMoved,
    PriceNotEligible,
    InsufficientBudget,
    InvalidBondRate,
    OverMaxDebtRatio,
    TreasuryBudgetExhausted,
    InvalidArgument,
    DuplicatePool,
    UnknownPool,
    InsufficientBalance,
    ProtectedToken,
    CollaboratorFailure,

    // Oracle
    OracleFailure,

    // Authorization
    Unauthorized,

    // Governance bounds
    OutOfRange,

    // Checked arithmetic
    ArithmeticFault,
};

/// Broad failure classes
enum class ErrorClass {
    None,
    Precondition,
    Oracle,
    Authorization,
    Range,
    Arithmetic,
};

/// Convert error to string
const char* CallErrorToString(CallError err);

/// Convert error class to string
const char* ErrorClassToString(ErrorClass cls);

/// Map an error code to its failure class
ErrorClass ClassifyError(CallError err);

// ============================================================================
// Call Result
// ============================================================================

struct CallResult {
    CallError error{CallError::None};
    std::string reason;

    static CallResult Ok() { return CallResult(); }

    static CallResult Fail(CallError err, const std::string& why) {
        CallResult r;
        r.error = err;
        r.reason = why;
        return r;
    }

    bool IsOk() const { return error == CallError::None; }
    explicit operator bool() const { return IsOk(); }

    ErrorClass Class() const { return ClassifyError(error); }

    std::string ToString() const;
};

} // namespace polymint

#endif // POLYMINT_CORE_RESULT_H
