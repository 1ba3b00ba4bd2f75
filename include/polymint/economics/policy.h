// POLYMINT - Monetary Policy Parameters
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// The governance-tunable parameters of the treasury and the bounds every
// setter (and the config loader) enforces.

#ifndef POLYMINT_ECONOMICS_POLICY_H
#define POLYMINT_ECONOMICS_POLICY_H

#include <polymint/core/result.h>
#include <polymint/core/types.h>
#include <polymint/economics/bond_pricing.h>
#include <polymint/economics/expansion.h>

#include <cstdint>

namespace polymint {
namespace economics {

// ============================================================================
// Bounds
// ============================================================================

/// Default epoch length
constexpr Timestamp DEFAULT_PERIOD = 6 * HOURS;

constexpr uint64_t DEFAULT_MAX_SUPPLY_CONTRACTION_PERCENT = 300;
constexpr uint64_t DEFAULT_MAX_DEBT_RATIO_PERCENT = 3500;

constexpr uint64_t MIN_BOND_DEPLETION_FLOOR_PERCENT = 500;
constexpr uint64_t MAX_BOND_DEPLETION_FLOOR_PERCENT = 10000;
constexpr uint64_t MIN_SUPPLY_CONTRACTION_PERCENT = 100;
constexpr uint64_t MAX_SUPPLY_CONTRACTION_PERCENT = 1500;
constexpr uint64_t MIN_DEBT_RATIO_PERCENT = 1000;
constexpr uint64_t MAX_DEBT_RATIO_PERCENT = 10000;
constexpr uint64_t MAX_BOOTSTRAP_EPOCHS = 120;
constexpr uint64_t MIN_BOOTSTRAP_EXPANSION_PERCENT = 100;
constexpr uint64_t MAX_BOOTSTRAP_EXPANSION_PERCENT = 1000;
constexpr uint64_t MAX_DAO_FUND_PERCENT = 3000;
constexpr uint64_t MAX_DEV_FUND_PERCENT = 1000;
constexpr uint64_t MIN_MINTING_FACTOR = 10000;
constexpr uint64_t MAX_MINTING_FACTOR = 20000;
constexpr uint64_t MAX_BOND_SUPPLY_EXPANSION_PERCENT = 1000;

/// Ceiling may be at most 120% of peg
constexpr uint64_t MAX_PRICE_CEILING_PERCENT = 120;

// ============================================================================
// Monetary Policy
// ============================================================================

struct MonetaryPolicy {
    /// Epoch length in seconds
    Timestamp period{DEFAULT_PERIOD};

    BondPricingParams pricing;
    ExpansionParams expansion;

    /// Per-epoch contraction budget as share of circulating supply (bps)
    uint64_t maxSupplyContractionPercent{DEFAULT_MAX_SUPPLY_CONTRACTION_PERCENT};

    /// Bond supply cap as share of circulating supply (bps)
    uint64_t maxDebtRatioPercent{DEFAULT_MAX_DEBT_RATIO_PERCENT};

    /// Carve-outs from reward-sink funding (bps)
    uint64_t daoFundSharedPercent{0};
    uint64_t devFundSharedPercent{0};
};

/// Recipients of the dao and dev shares of seigniorage
struct ExtraFunds {
    Address daoFund;
    Address devFund;
};

namespace bounds {

CallResult CheckPriceCeiling(const Amount& peg, const Amount& ceiling);
CallResult CheckMaxSupplyExpansionPercent(uint64_t percent);
CallResult CheckBondDepletionFloorPercent(uint64_t percent);
CallResult CheckMaxSupplyContractionPercent(uint64_t percent);
CallResult CheckMaxDebtRatioPercent(uint64_t percent);
CallResult CheckBootstrap(uint64_t epochs, uint64_t percent);
CallResult CheckDaoFundPercent(uint64_t percent);
CallResult CheckDevFundPercent(uint64_t percent);
CallResult CheckDiscountPercent(uint64_t percent);
CallResult CheckPremiumPercent(uint64_t percent);

/// threshold in [ceiling as percent of peg, 150]
CallResult CheckPremiumThreshold(const Amount& peg, const Amount& ceiling, uint64_t threshold);

CallResult CheckMintingFactor(uint64_t factor);
CallResult CheckBondSupplyExpansionPercent(uint64_t percent);

/// Check every parameter of a policy
CallResult CheckPolicy(const MonetaryPolicy& policy);

/// A nonzero dao or dev share needs a fund address to pay
CallResult CheckExtraFunds(const MonetaryPolicy& policy, const ExtraFunds& funds);

} // namespace bounds

} // namespace economics
} // namespace polymint

#endif // POLYMINT_ECONOMICS_POLICY_H
