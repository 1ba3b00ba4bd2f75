// POLYMINT - Bond Pricing Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/economics/bond_pricing.h"

namespace polymint {
namespace economics {

Amount BondPricingEngine::DiscountRate(const BondPricingParams& params, const Amount& price) {
    if (price > params.pegPrice || price.is_zero()) {
        return 0;
    }
    if (params.discountPercent == 0) {
        // no discount
        return params.pegPrice;
    }

    // Bonds obtained for burning one pegged token at this price
    Amount bondAmount = fixedpoint::WadDiv(params.pegPrice, price);
    Amount discount = fixedpoint::ApplyBps(bondAmount - params.pegPrice, params.discountPercent);
    Amount rate = params.pegPrice + discount;

    if (params.maxDiscountRate > 0 && rate > params.maxDiscountRate) {
        rate = params.maxDiscountRate;
    }
    return rate;
}

Amount BondPricingEngine::PremiumRate(const BondPricingParams& params, const Amount& price) {
    if (price <= params.priceCeiling) {
        return 0;
    }

    Amount thresholdPrice = fixedpoint::ApplyPercent(params.pegPrice, params.premiumThreshold);
    if (price < thresholdPrice) {
        return params.pegPrice;
    }

    Amount premium = fixedpoint::ApplyBps(price - params.pegPrice, params.premiumPercent);
    Amount rate = params.pegPrice + premium;

    if (params.maxPremiumRate > 0 && rate > params.maxPremiumRate) {
        rate = params.maxPremiumRate;
    }
    return rate;
}

} // namespace economics
} // namespace polymint
