// POLYMINT - Bond Pricing
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Discount rate for buying bonds below peg and premium rate for redeeming
// them above the ceiling. A rate of zero means the branch is inactive.

#ifndef POLYMINT_ECONOMICS_BOND_PRICING_H
#define POLYMINT_ECONOMICS_BOND_PRICING_H

#include <polymint/core/fixedpoint.h>
#include <polymint/core/types.h>

namespace polymint {
namespace economics {

/// Default premium threshold (110% of peg)
constexpr uint64_t DEFAULT_PREMIUM_THRESHOLD = 110;

/// Default premium percent (70.00%)
constexpr uint64_t DEFAULT_PREMIUM_PERCENT = 7000;

/// Upper bound for discount and premium percents (200.00%)
constexpr uint64_t MAX_BOND_RATE_PERCENT = 20000;

/// Upper bound for the premium threshold (150% of peg)
constexpr uint64_t MAX_PREMIUM_THRESHOLD = 150;

struct BondPricingParams {
    /// Peg price (1.0)
    Amount pegPrice{WAD};

    /// Price above which expansion and redemption are allowed
    Amount priceCeiling{WAD * 101 / 100};

    /// Share of the bond/peg gap granted as discount (bps, 0 disables)
    uint64_t discountPercent{0};

    /// Cap on the discount rate (0 = uncapped)
    Amount maxDiscountRate{0};

    /// Price at which the premium starts, in percent of peg
    uint64_t premiumThreshold{DEFAULT_PREMIUM_THRESHOLD};

    /// Share of the price/peg gap paid as premium (bps)
    uint64_t premiumPercent{DEFAULT_PREMIUM_PERCENT};

    /// Cap on the premium rate (0 = uncapped)
    Amount maxPremiumRate{0};
};

/**
 * Stateless rate calculator.
 *
 * Rates are WAD-scaled multipliers: bonds = amount * rate / 1e18 on
 * purchase, payout = bonds * rate / 1e18 on redemption.
 */
class BondPricingEngine {
public:
    /// Rate for buying bonds; 0 when price is above peg
    static Amount DiscountRate(const BondPricingParams& params, const Amount& price);

    /// Rate for redeeming bonds; 0 when price is at or below the ceiling
    static Amount PremiumRate(const BondPricingParams& params, const Amount& price);

    /// Bonds minted for burning amount pegged tokens
    static Amount BondsForPurchase(const Amount& amount, const Amount& rate) {
        return fixedpoint::WadMul(amount, rate);
    }

    /// Pegged tokens paid out for redeeming bondAmount
    static Amount PayoutForRedemption(const Amount& bondAmount, const Amount& rate) {
        return fixedpoint::WadMul(bondAmount, rate);
    }
};

} // namespace economics
} // namespace polymint

#endif // POLYMINT_ECONOMICS_BOND_PRICING_H
