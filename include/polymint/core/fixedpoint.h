// POLYMINT - Fixed-Point Arithmetic
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Deterministic unsigned fixed-point helpers on 18-decimal values.
// All operations are floor-rounded and overflow-checked; a fault throws
// std::overflow_error (overflow, division by zero) or std::range_error
// (result below zero).

#ifndef POLYMINT_CORE_FIXEDPOINT_H
#define POLYMINT_CORE_FIXEDPOINT_H

#include <polymint/core/types.h>

#include <optional>
#include <string>

namespace polymint {

// ============================================================================
// Scale Constants
// ============================================================================

/// Fixed-point unit (1.0)
inline const Amount WAD{1000000000000000000ULL};

/// Basis-point denominator (100.00%)
constexpr uint64_t BPS_DENOMINATOR = 10000;

/// Whole-percent denominator
constexpr uint64_t PERCENT_DENOMINATOR = 100;

/// Scale of one basis point expressed in WAD (1e18 / 1e4)
inline const Amount BPS_IN_WAD{100000000000000ULL};

namespace fixedpoint {

/// n whole units in WAD (n * 1e18)
inline Amount ToWad(uint64_t n) { return Amount(n) * WAD; }

/// floor(a * b / d)
inline Amount MulDiv(const Amount& a, const Amount& b, const Amount& d) {
    return a * b / d;
}

/// floor(a * b / 1e18)
inline Amount WadMul(const Amount& a, const Amount& b) { return a * b / WAD; }

/// floor(a * 1e18 / b)
inline Amount WadDiv(const Amount& a, const Amount& b) { return a * WAD / b; }

/// floor(x * bps / 10000)
inline Amount ApplyBps(const Amount& x, uint64_t bps) {
    return x * bps / BPS_DENOMINATOR;
}

/// floor(x * pct / 100)
inline Amount ApplyPercent(const Amount& x, uint64_t pct) {
    return x * pct / PERCENT_DENOMINATOR;
}

/// a - b, or zero when b exceeds a
inline Amount SaturatingSub(const Amount& a, const Amount& b) {
    return a > b ? Amount(a - b) : Amount(0);
}

inline Amount Min(const Amount& a, const Amount& b) { return a < b ? a : b; }
inline Amount Max(const Amount& a, const Amount& b) { return a < b ? b : a; }

/// Check that a + b would not exceed the representable range
bool CanAdd(const Amount& a, const Amount& b);

/// Format with 18 decimals, trimming trailing zeros ("1.01", "0", "42")
std::string FormatAmount(const Amount& value);

/**
 * Parse a decimal amount.
 *
 * "1.5" -> 1.5e18, "1000" -> 1000e18, "123wei" -> 123 raw units.
 * Returns nullopt for malformed input or more than 18 decimals.
 */
std::optional<Amount> ParseAmount(const std::string& str);

/// Lossy conversion for display and statistics
double ToDouble(const Amount& value);

} // namespace fixedpoint
} // namespace polymint

#endif // POLYMINT_CORE_FIXEDPOINT_H
