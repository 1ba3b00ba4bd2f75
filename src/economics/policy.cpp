// POLYMINT - Monetary Policy Bounds
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/economics/policy.h"

#include <string>

namespace polymint {
namespace economics {
namespace bounds {

namespace {

CallResult InRange(uint64_t value, uint64_t lo, uint64_t hi, const char* what) {
    if (value < lo || value > hi) {
        return CallResult::Fail(CallError::OutOfRange,
                                std::string(what) + " out of [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + "]");
    }
    return CallResult::Ok();
}

} // namespace

CallResult CheckPriceCeiling(const Amount& peg, const Amount& ceiling) {
    if (ceiling < peg || ceiling > fixedpoint::ApplyPercent(peg, MAX_PRICE_CEILING_PERCENT)) {
        return CallResult::Fail(CallError::OutOfRange, "price ceiling out of [peg, 1.2 * peg]");
    }
    return CallResult::Ok();
}

CallResult CheckMaxSupplyExpansionPercent(uint64_t percent) {
    return InRange(percent, MIN_EXPANSION_PERCENT, MAX_EXPANSION_PERCENT,
                   "max supply expansion percent");
}

CallResult CheckBondDepletionFloorPercent(uint64_t percent) {
    return InRange(percent, MIN_BOND_DEPLETION_FLOOR_PERCENT, MAX_BOND_DEPLETION_FLOOR_PERCENT,
                   "bond depletion floor percent");
}

CallResult CheckMaxSupplyContractionPercent(uint64_t percent) {
    return InRange(percent, MIN_SUPPLY_CONTRACTION_PERCENT, MAX_SUPPLY_CONTRACTION_PERCENT,
                   "max supply contraction percent");
}

CallResult CheckMaxDebtRatioPercent(uint64_t percent) {
    return InRange(percent, MIN_DEBT_RATIO_PERCENT, MAX_DEBT_RATIO_PERCENT,
                   "max debt ratio percent");
}

CallResult CheckBootstrap(uint64_t epochs, uint64_t percent) {
    auto result = InRange(epochs, 0, MAX_BOOTSTRAP_EPOCHS, "bootstrap epochs");
    if (!result) {
        return result;
    }
    return InRange(percent, MIN_BOOTSTRAP_EXPANSION_PERCENT, MAX_BOOTSTRAP_EXPANSION_PERCENT,
                   "bootstrap supply expansion percent");
}

CallResult CheckDaoFundPercent(uint64_t percent) {
    return InRange(percent, 0, MAX_DAO_FUND_PERCENT, "dao fund percent");
}

CallResult CheckDevFundPercent(uint64_t percent) {
    return InRange(percent, 0, MAX_DEV_FUND_PERCENT, "dev fund percent");
}

CallResult CheckDiscountPercent(uint64_t percent) {
    return InRange(percent, 0, MAX_BOND_RATE_PERCENT, "discount percent");
}

CallResult CheckPremiumPercent(uint64_t percent) {
    return InRange(percent, 0, MAX_BOND_RATE_PERCENT, "premium percent");
}

CallResult CheckPremiumThreshold(const Amount& peg, const Amount& ceiling, uint64_t threshold) {
    if (threshold > MAX_PREMIUM_THRESHOLD) {
        return CallResult::Fail(CallError::OutOfRange, "premium threshold above 150");
    }
    // Compare in percent units: threshold% of peg must not sit below the ceiling
    Amount ceilingPercent = fixedpoint::MulDiv(ceiling, PERCENT_DENOMINATOR, peg);
    if (Amount(threshold) < ceilingPercent) {
        return CallResult::Fail(CallError::OutOfRange, "premium threshold below price ceiling");
    }
    return CallResult::Ok();
}

CallResult CheckMintingFactor(uint64_t factor) {
    return InRange(factor, MIN_MINTING_FACTOR, MAX_MINTING_FACTOR, "minting factor");
}

CallResult CheckBondSupplyExpansionPercent(uint64_t percent) {
    return InRange(percent, 0, MAX_BOND_SUPPLY_EXPANSION_PERCENT,
                   "bond supply expansion percent");
}

CallResult CheckExtraFunds(const MonetaryPolicy& policy, const ExtraFunds& funds) {
    if (policy.daoFundSharedPercent > 0 && funds.daoFund.IsNull()) {
        return CallResult::Fail(CallError::InvalidArgument, "dao fund share without a dao fund");
    }
    if (policy.devFundSharedPercent > 0 && funds.devFund.IsNull()) {
        return CallResult::Fail(CallError::InvalidArgument, "dev fund share without a dev fund");
    }
    return CallResult::Ok();
}

CallResult CheckPolicy(const MonetaryPolicy& policy) {
    if (policy.period <= 0) {
        return CallResult::Fail(CallError::OutOfRange, "period must be positive");
    }
    const auto& pricing = policy.pricing;
    const auto& expansion = policy.expansion;

    CallResult checks[] = {
        CheckPriceCeiling(pricing.pegPrice, pricing.priceCeiling),
        CheckMaxSupplyExpansionPercent(expansion.maxSupplyExpansionPercent),
        CheckBondDepletionFloorPercent(expansion.bondDepletionFloorPercent),
        CheckMaxSupplyContractionPercent(policy.maxSupplyContractionPercent),
        CheckMaxDebtRatioPercent(policy.maxDebtRatioPercent),
        CheckBootstrap(expansion.bootstrapEpochs, expansion.bootstrapSupplyExpansionPercent),
        CheckDaoFundPercent(policy.daoFundSharedPercent),
        CheckDevFundPercent(policy.devFundSharedPercent),
        CheckDiscountPercent(pricing.discountPercent),
        CheckPremiumPercent(pricing.premiumPercent),
        CheckPremiumThreshold(pricing.pegPrice, pricing.priceCeiling, pricing.premiumThreshold),
        CheckBondSupplyExpansionPercent(expansion.bondSupplyExpansionPercent),
        InRange(expansion.seigniorageExpansionFloorPercent, 0, BPS_DENOMINATOR,
                "seigniorage expansion floor percent"),
    };
    for (const auto& check : checks) {
        if (!check) {
            return check;
        }
    }
    // Zero means unscaled; anything else must be a valid factor
    if (expansion.mintingFactorForPayingDebt != 0) {
        auto result = CheckMintingFactor(expansion.mintingFactorForPayingDebt);
        if (!result) {
            return result;
        }
    }
    if (!expansion.tiers.IsValid()) {
        return CallResult::Fail(CallError::OutOfRange, "supply tier table is not ordered");
    }
    return CallResult::Ok();
}

} // namespace bounds
} // namespace economics
} // namespace polymint
