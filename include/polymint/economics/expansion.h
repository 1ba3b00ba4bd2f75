// POLYMINT - Supply Expansion Planner
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Tiered expansion caps and the per-epoch split of new supply between
// the bond treasury, the reward sink and the seigniorage reserve.

#ifndef POLYMINT_ECONOMICS_EXPANSION_H
#define POLYMINT_ECONOMICS_EXPANSION_H

#include <polymint/core/fixedpoint.h>
#include <polymint/core/result.h>
#include <polymint/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace polymint {
namespace economics {

// ============================================================================
// Constants
// ============================================================================

/// Number of supply tiers
constexpr size_t SUPPLY_TIER_COUNT = 9;

/// Bounds on a tier's (and the global) max expansion percent, in bps
constexpr uint64_t MIN_EXPANSION_PERCENT = 10;
constexpr uint64_t MAX_EXPANSION_PERCENT = 1000;

constexpr uint64_t DEFAULT_MAX_SUPPLY_EXPANSION_PERCENT = 400;
constexpr uint64_t DEFAULT_BOND_DEPLETION_FLOOR_PERCENT = 10000;
constexpr uint64_t DEFAULT_SEIGNIORAGE_EXPANSION_FLOOR_PERCENT = 3500;
constexpr uint64_t DEFAULT_BOOTSTRAP_EPOCHS = 28;
constexpr uint64_t DEFAULT_BOOTSTRAP_SUPPLY_EXPANSION_PERCENT = 450;

// ============================================================================
// Supply Tier Table
// ============================================================================

/**
 * Nine (threshold, maxExpansionPercent) pairs with strictly increasing
 * thresholds. The first threshold is normally zero so every supply
 * resolves to a tier.
 */
class SupplyTierTable {
public:
    /// Default table: 0, 500k, 1M, 1.5M, 2M, 5M, 10M, 20M, 50M
    SupplyTierTable();

    SupplyTierTable(const std::array<Amount, SUPPLY_TIER_COUNT>& thresholds,
                    const std::array<uint64_t, SUPPLY_TIER_COUNT>& percents)
        : thresholds_(thresholds), percents_(percents) {}

    /// Index of the highest tier whose threshold <= supply, or -1 if none
    int Lookup(const Amount& supply) const;

    /// Replace a threshold; it must stay strictly between its neighbours
    CallResult SetThreshold(size_t index, const Amount& value);

    /// Replace a tier percent; must lie in [10, 1000]
    CallResult SetPercent(size_t index, uint64_t value);

    /// Check ordering and percent bounds of the whole table
    bool IsValid() const;

    const Amount& Threshold(size_t index) const { return thresholds_[index]; }
    uint64_t Percent(size_t index) const { return percents_[index]; }

    const std::array<Amount, SUPPLY_TIER_COUNT>& Thresholds() const { return thresholds_; }
    const std::array<uint64_t, SUPPLY_TIER_COUNT>& Percents() const { return percents_; }

private:
    std::array<Amount, SUPPLY_TIER_COUNT> thresholds_;
    std::array<uint64_t, SUPPLY_TIER_COUNT> percents_;
};

// ============================================================================
// Expansion Parameters
// ============================================================================

struct ExpansionParams {
    SupplyTierTable tiers;

    /// Last resolved tier percent (bps); updated on every tier lookup
    uint64_t maxSupplyExpansionPercent{DEFAULT_MAX_SUPPLY_EXPANSION_PERCENT};

    /// Reserve coverage of bond supply above which all seigniorage goes to the sink (bps)
    uint64_t bondDepletionFloorPercent{DEFAULT_BOND_DEPLETION_FLOOR_PERCENT};

    /// Sink share of seigniorage while debt is outstanding (bps)
    uint64_t seigniorageExpansionFloorPercent{DEFAULT_SEIGNIORAGE_EXPANSION_FLOOR_PERCENT};

    uint64_t bootstrapEpochs{DEFAULT_BOOTSTRAP_EPOCHS};
    uint64_t bootstrapSupplyExpansionPercent{DEFAULT_BOOTSTRAP_SUPPLY_EXPANSION_PERCENT};

    /// Scale on the debt-repayment share (bps, 0 = unscaled)
    uint64_t mintingFactorForPayingDebt{0};

    /// Share of supply routed to the bond treasury every epoch (bps)
    uint64_t bondSupplyExpansionPercent{0};
};

// ============================================================================
// Allocation Plan
// ============================================================================

/// Inputs of one epoch allocation
struct AllocationInput {
    uint64_t epoch{0};
    Amount previousPrice{0};
    Amount pegPrice{WAD};
    Amount priceCeiling{WAD};
    /// Circulating supply net of the reserve
    Amount supply{0};
    Amount reserve{0};
    Amount bondSupply{0};
};

/// Amounts to move for one epoch
struct AllocationPlan {
    /// Requested funding of the bond treasury
    Amount bondTreasuryAmount{0};

    /// Seigniorage for the reward sink (before DAO/dev carve-out)
    Amount rewardSinkAmount{0};

    /// New supply minted to the treasury and added to the reserve
    Amount reserveAmount{0};

    bool bootstrap{false};
    bool expansion{false};

    /// Tier used for the cap, -1 when no expansion was evaluated
    int tierIndex{-1};
};

/**
 * Computes the expansion plan for an epoch.
 */
class SupplyExpansionPlanner {
public:
    /**
     * Resolve the tier percent for supply and store it in
     * params.maxSupplyExpansionPercent. Returns the stored value.
     */
    static uint64_t MaxExpansionPercent(ExpansionParams& params, const Amount& supply,
                                        int* tierIndex = nullptr);

    /// Plan the allocation. Updates the cached tier percent on the steady-state path.
    static AllocationPlan Plan(ExpansionParams& params, const AllocationInput& input);
};

} // namespace economics
} // namespace polymint

#endif // POLYMINT_ECONOMICS_EXPANSION_H
