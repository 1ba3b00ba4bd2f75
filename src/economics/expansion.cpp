// POLYMINT - Supply Expansion Planner Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/economics/expansion.h"

namespace polymint {
namespace economics {

// ============================================================================
// SupplyTierTable
// ============================================================================

SupplyTierTable::SupplyTierTable()
    : thresholds_{Amount(0),
                  fixedpoint::ToWad(500000),
                  fixedpoint::ToWad(1000000),
                  fixedpoint::ToWad(1500000),
                  fixedpoint::ToWad(2000000),
                  fixedpoint::ToWad(5000000),
                  fixedpoint::ToWad(10000000),
                  fixedpoint::ToWad(20000000),
                  fixedpoint::ToWad(50000000)},
      percents_{450, 400, 350, 300, 250, 200, 150, 125, 100} {}

int SupplyTierTable::Lookup(const Amount& supply) const {
    for (int i = static_cast<int>(SUPPLY_TIER_COUNT) - 1; i >= 0; --i) {
        if (supply >= thresholds_[static_cast<size_t>(i)]) {
            return i;
        }
    }
    return -1;
}

CallResult SupplyTierTable::SetThreshold(size_t index, const Amount& value) {
    if (index >= SUPPLY_TIER_COUNT) {
        return CallResult::Fail(CallError::OutOfRange, "tier index out of range");
    }
    if (index > 0 && value <= thresholds_[index - 1]) {
        return CallResult::Fail(CallError::OutOfRange, "threshold not above previous tier");
    }
    if (index + 1 < SUPPLY_TIER_COUNT && value >= thresholds_[index + 1]) {
        return CallResult::Fail(CallError::OutOfRange, "threshold not below next tier");
    }
    thresholds_[index] = value;
    return CallResult::Ok();
}

CallResult SupplyTierTable::SetPercent(size_t index, uint64_t value) {
    if (index >= SUPPLY_TIER_COUNT) {
        return CallResult::Fail(CallError::OutOfRange, "tier index out of range");
    }
    if (value < MIN_EXPANSION_PERCENT || value > MAX_EXPANSION_PERCENT) {
        return CallResult::Fail(CallError::OutOfRange, "tier percent out of [10, 1000]");
    }
    percents_[index] = value;
    return CallResult::Ok();
}

bool SupplyTierTable::IsValid() const {
    for (size_t i = 0; i < SUPPLY_TIER_COUNT; ++i) {
        if (percents_[i] < MIN_EXPANSION_PERCENT || percents_[i] > MAX_EXPANSION_PERCENT) {
            return false;
        }
        if (i > 0 && thresholds_[i] <= thresholds_[i - 1]) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// SupplyExpansionPlanner
// ============================================================================

uint64_t SupplyExpansionPlanner::MaxExpansionPercent(ExpansionParams& params,
                                                     const Amount& supply,
                                                     int* tierIndex) {
    int index = params.tiers.Lookup(supply);
    if (index >= 0) {
        params.maxSupplyExpansionPercent = params.tiers.Percent(static_cast<size_t>(index));
    }
    if (tierIndex) {
        *tierIndex = index;
    }
    return params.maxSupplyExpansionPercent;
}

AllocationPlan SupplyExpansionPlanner::Plan(ExpansionParams& params, const AllocationInput& input) {
    AllocationPlan plan;
    plan.bondTreasuryAmount = fixedpoint::ApplyBps(input.supply, params.bondSupplyExpansionPercent);

    if (input.epoch < params.bootstrapEpochs) {
        plan.bootstrap = true;
        plan.rewardSinkAmount =
            fixedpoint::ApplyBps(input.supply, params.bootstrapSupplyExpansionPercent);
        return plan;
    }

    if (input.previousPrice <= input.priceCeiling) {
        return plan;
    }

    plan.expansion = true;
    Amount percentage = input.previousPrice - input.pegPrice;
    Amount cap = Amount(MaxExpansionPercent(params, input.supply, &plan.tierIndex)) * BPS_IN_WAD;
    if (percentage > cap) {
        percentage = cap;
    }

    Amount seigniorage = fixedpoint::WadMul(input.supply, percentage);
    Amount depletionFloor = fixedpoint::ApplyBps(input.bondSupply, params.bondDepletionFloorPercent);

    if (input.reserve >= depletionFloor) {
        plan.rewardSinkAmount = seigniorage;
        return plan;
    }

    plan.rewardSinkAmount = fixedpoint::ApplyBps(seigniorage, params.seigniorageExpansionFloorPercent);
    Amount forDebt = seigniorage - plan.rewardSinkAmount;
    if (params.mintingFactorForPayingDebt > 0) {
        forDebt = fixedpoint::ApplyBps(forDebt, params.mintingFactorForPayingDebt);
    }
    plan.reserveAmount = forDebt;
    return plan;
}

} // namespace economics
} // namespace polymint
