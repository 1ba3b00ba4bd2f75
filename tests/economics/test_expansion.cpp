// POLYMINT - Supply Expansion Tests
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include <gtest/gtest.h>

#include <polymint/core/fixedpoint.h>
#include <polymint/economics/expansion.h>

namespace polymint {
namespace economics {
namespace {

using fixedpoint::ToWad;

// ============================================================================
// Supply Tier Table Tests
// ============================================================================

class SupplyTierTableTest : public ::testing::Test {
protected:
    SupplyTierTable tiers_;
};

TEST_F(SupplyTierTableTest, DefaultTable) {
    EXPECT_TRUE(tiers_.IsValid());
    EXPECT_EQ(tiers_.Threshold(0), 0);
    EXPECT_EQ(tiers_.Threshold(5), ToWad(5000000));
    EXPECT_EQ(tiers_.Threshold(8), ToWad(50000000));
    EXPECT_EQ(tiers_.Percent(0), 450u);
    EXPECT_EQ(tiers_.Percent(8), 100u);
}

TEST_F(SupplyTierTableTest, LookupPicksHighestMatchingTier) {
    EXPECT_EQ(tiers_.Lookup(0), 0);
    EXPECT_EQ(tiers_.Lookup(ToWad(499999)), 0);
    EXPECT_EQ(tiers_.Lookup(ToWad(500000)), 1);
    EXPECT_EQ(tiers_.Lookup(ToWad(6000000)), 5);
    EXPECT_EQ(tiers_.Lookup(ToWad(1000000000)), 8);
}

TEST_F(SupplyTierTableTest, LookupBelowFirstThreshold) {
    ASSERT_TRUE(tiers_.SetThreshold(0, ToWad(100)));
    EXPECT_EQ(tiers_.Lookup(ToWad(99)), -1);
    EXPECT_EQ(tiers_.Lookup(ToWad(100)), 0);
}

TEST_F(SupplyTierTableTest, SetThresholdKeepsOrdering) {
    EXPECT_TRUE(tiers_.SetThreshold(1, ToWad(600000)));
    EXPECT_EQ(tiers_.Threshold(1), ToWad(600000));

    EXPECT_EQ(tiers_.SetThreshold(1, 0).error, CallError::OutOfRange);
    EXPECT_EQ(tiers_.SetThreshold(1, ToWad(1000000)).error, CallError::OutOfRange);
    EXPECT_EQ(tiers_.SetThreshold(SUPPLY_TIER_COUNT, ToWad(1)).error, CallError::OutOfRange);
    EXPECT_TRUE(tiers_.SetThreshold(8, ToWad(90000000)));
    EXPECT_TRUE(tiers_.IsValid());
}

TEST_F(SupplyTierTableTest, SetPercentBounds) {
    EXPECT_TRUE(tiers_.SetPercent(3, MIN_EXPANSION_PERCENT));
    EXPECT_TRUE(tiers_.SetPercent(3, MAX_EXPANSION_PERCENT));
    EXPECT_EQ(tiers_.SetPercent(3, 9).error, CallError::OutOfRange);
    EXPECT_EQ(tiers_.SetPercent(3, 1001).error, CallError::OutOfRange);
    EXPECT_EQ(tiers_.SetPercent(9, 100).error, CallError::OutOfRange);
    EXPECT_EQ(tiers_.Percent(3), MAX_EXPANSION_PERCENT);
}

TEST_F(SupplyTierTableTest, InvalidCustomTable) {
    std::array<Amount, SUPPLY_TIER_COUNT> thresholds = tiers_.Thresholds();
    std::array<uint64_t, SUPPLY_TIER_COUNT> percents = tiers_.Percents();
    thresholds[4] = thresholds[3];
    EXPECT_FALSE(SupplyTierTable(thresholds, percents).IsValid());

    thresholds = tiers_.Thresholds();
    percents[0] = 5;
    EXPECT_FALSE(SupplyTierTable(thresholds, percents).IsValid());
}

// ============================================================================
// Planner Tests
// ============================================================================

class ExpansionPlannerTest : public ::testing::Test {
protected:
    ExpansionParams params_;
    AllocationInput input_;

    void SetUp() override {
        input_.epoch = 30;
        input_.pegPrice = WAD;
        input_.priceCeiling = WAD * 101 / 100;
        input_.supply = ToWad(6000000);
        input_.previousPrice = WAD * 105 / 100;
    }
};

TEST_F(ExpansionPlannerTest, MaxExpansionPercentCachesTier) {
    int index = -2;
    EXPECT_EQ(SupplyExpansionPlanner::MaxExpansionPercent(params_, ToWad(6000000), &index), 200u);
    EXPECT_EQ(index, 5);
    EXPECT_EQ(params_.maxSupplyExpansionPercent, 200u);
}

TEST_F(ExpansionPlannerTest, MaxExpansionPercentKeepsValueWithoutTier) {
    ASSERT_TRUE(params_.tiers.SetThreshold(0, ToWad(100)));
    params_.maxSupplyExpansionPercent = 321;
    int index = 0;
    EXPECT_EQ(SupplyExpansionPlanner::MaxExpansionPercent(params_, ToWad(1), &index), 321u);
    EXPECT_EQ(index, -1);
}

TEST_F(ExpansionPlannerTest, BootstrapFundsSinkRegardlessOfPrice) {
    input_.epoch = 0;
    input_.previousPrice = WAD / 2;
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_TRUE(plan.bootstrap);
    EXPECT_FALSE(plan.expansion);
    EXPECT_EQ(plan.rewardSinkAmount, ToWad(270000));
    EXPECT_EQ(plan.reserveAmount, 0);
}

TEST_F(ExpansionPlannerTest, NoExpansionAtCeiling) {
    input_.previousPrice = input_.priceCeiling;
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_FALSE(plan.bootstrap);
    EXPECT_FALSE(plan.expansion);
    EXPECT_EQ(plan.rewardSinkAmount, 0);
    EXPECT_EQ(plan.reserveAmount, 0);
    EXPECT_EQ(plan.tierIndex, -1);
}

TEST_F(ExpansionPlannerTest, ExpansionCappedByTier) {
    // 5% above peg, capped at the 2% tier for 6M supply
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_TRUE(plan.expansion);
    EXPECT_EQ(plan.tierIndex, 5);
    EXPECT_EQ(plan.rewardSinkAmount, ToWad(120000));
    EXPECT_EQ(plan.reserveAmount, 0);
}

TEST_F(ExpansionPlannerTest, ExpansionBelowTierCap) {
    input_.previousPrice = WAD * 1015 / 1000;
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_EQ(plan.rewardSinkAmount, ToWad(90000));
}

TEST_F(ExpansionPlannerTest, DebtSplitsSeigniorage) {
    input_.bondSupply = ToWad(100000);
    input_.reserve = ToWad(50000);
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_EQ(plan.rewardSinkAmount, ToWad(42000));
    EXPECT_EQ(plan.reserveAmount, ToWad(78000));
}

TEST_F(ExpansionPlannerTest, ReserveAtFloorSendsAllToSink) {
    input_.bondSupply = ToWad(100000);
    input_.reserve = ToWad(100000);
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_EQ(plan.rewardSinkAmount, ToWad(120000));
    EXPECT_EQ(plan.reserveAmount, 0);
}

TEST_F(ExpansionPlannerTest, MintingFactorScalesDebtShare) {
    params_.mintingFactorForPayingDebt = 15000;
    input_.bondSupply = ToWad(100000);
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_EQ(plan.rewardSinkAmount, ToWad(42000));
    EXPECT_EQ(plan.reserveAmount, ToWad(117000));
}

TEST_F(ExpansionPlannerTest, BondTreasuryShareOnEveryPath) {
    params_.bondSupplyExpansionPercent = 100;
    auto plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_EQ(plan.bondTreasuryAmount, ToWad(60000));

    input_.previousPrice = WAD;
    plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_EQ(plan.bondTreasuryAmount, ToWad(60000));

    input_.epoch = 0;
    plan = SupplyExpansionPlanner::Plan(params_, input_);
    EXPECT_EQ(plan.bondTreasuryAmount, ToWad(60000));
}

} // namespace
} // namespace economics
} // namespace polymint
