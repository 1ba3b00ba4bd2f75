// POLYMINT - Bond Pricing Tests
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include <gtest/gtest.h>

#include <polymint/core/fixedpoint.h>
#include <polymint/economics/bond_pricing.h>

namespace polymint {
namespace economics {
namespace {

using fixedpoint::ToWad;

class BondPricingTest : public ::testing::Test {
protected:
    BondPricingParams params_;

    /// Price given in hundredths of a unit
    static Amount Cents(uint64_t cents) { return WAD * cents / 100; }
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(BondPricingTest, DefaultParameters) {
    EXPECT_EQ(params_.pegPrice, WAD);
    EXPECT_EQ(params_.priceCeiling, Cents(101));
    EXPECT_EQ(params_.discountPercent, 0u);
    EXPECT_EQ(params_.premiumThreshold, DEFAULT_PREMIUM_THRESHOLD);
    EXPECT_EQ(params_.premiumPercent, DEFAULT_PREMIUM_PERCENT);
    EXPECT_EQ(params_.maxDiscountRate, 0);
    EXPECT_EQ(params_.maxPremiumRate, 0);
}

// ============================================================================
// Discount Rate
// ============================================================================

TEST_F(BondPricingTest, DiscountRateZeroAbovePeg) {
    EXPECT_EQ(BondPricingEngine::DiscountRate(params_, Cents(101)), 0);
}

TEST_F(BondPricingTest, DiscountRateZeroForZeroPrice) {
    params_.discountPercent = 5000;
    EXPECT_EQ(BondPricingEngine::DiscountRate(params_, 0), 0);
}

TEST_F(BondPricingTest, NoDiscountGivesPegRate) {
    EXPECT_EQ(BondPricingEngine::DiscountRate(params_, Cents(90)), WAD);
    EXPECT_EQ(BondPricingEngine::DiscountRate(params_, Cents(100)), WAD);
}

TEST_F(BondPricingTest, DiscountSharesBondGap) {
    params_.discountPercent = 5000;
    // 1 / 0.8 = 1.25 bonds, half of the 0.25 gap granted
    EXPECT_EQ(BondPricingEngine::DiscountRate(params_, Cents(80)), WAD * 1125 / 1000);
}

TEST_F(BondPricingTest, DiscountRateCapped) {
    params_.discountPercent = 5000;
    params_.maxDiscountRate = Cents(110);
    EXPECT_EQ(BondPricingEngine::DiscountRate(params_, Cents(80)), Cents(110));
    // Below the cap the computed rate is kept
    Amount expected = WAD + fixedpoint::ApplyBps(fixedpoint::WadDiv(WAD, Cents(99)) - WAD, 5000);
    EXPECT_LT(expected, Cents(110));
    EXPECT_EQ(BondPricingEngine::DiscountRate(params_, Cents(99)), expected);
}

// ============================================================================
// Premium Rate
// ============================================================================

TEST_F(BondPricingTest, PremiumRateZeroAtOrBelowCeiling) {
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(101)), 0);
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(50)), 0);
}

TEST_F(BondPricingTest, PremiumRateIsPegBelowThreshold) {
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(105)), WAD);
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(109)), WAD);
}

TEST_F(BondPricingTest, PremiumSharesPriceGap) {
    // 1.0 + 0.2 * 70%
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(120)), Cents(114));
    // At the threshold the premium already applies
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(110)), Cents(107));
}

TEST_F(BondPricingTest, PremiumRateCapped) {
    params_.maxPremiumRate = Cents(110);
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(120)), Cents(110));
    EXPECT_EQ(BondPricingEngine::PremiumRate(params_, Cents(112)), WAD + Cents(12) * 7 / 10);
}

// ============================================================================
// Conversions
// ============================================================================

TEST_F(BondPricingTest, BondsForPurchase) {
    EXPECT_EQ(BondPricingEngine::BondsForPurchase(ToWad(100), WAD), ToWad(100));
    EXPECT_EQ(BondPricingEngine::BondsForPurchase(ToWad(100), WAD * 1125 / 1000),
              ToWad(1125) / 10);
}

TEST_F(BondPricingTest, PayoutForRedemption) {
    EXPECT_EQ(BondPricingEngine::PayoutForRedemption(ToWad(50), Cents(114)), ToWad(57));
}

} // namespace
} // namespace economics
} // namespace polymint
