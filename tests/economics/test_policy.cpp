// POLYMINT - Monetary Policy Tests
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include <gtest/gtest.h>

#include <polymint/core/fixedpoint.h>
#include <polymint/economics/policy.h>
#include <polymint/economics/policy_config.h>
#include <polymint/util/config.h>

#include <string>
#include <vector>

namespace polymint {
namespace economics {
namespace {

using fixedpoint::ToWad;

// ============================================================================
// Bounds Tests
// ============================================================================

TEST(PolicyBoundsTest, DefaultPolicyIsValid) {
    MonetaryPolicy policy;
    EXPECT_TRUE(bounds::CheckPolicy(policy));
    EXPECT_EQ(policy.period, 6 * HOURS);
    EXPECT_EQ(policy.maxSupplyContractionPercent, 300u);
    EXPECT_EQ(policy.maxDebtRatioPercent, 3500u);
    EXPECT_EQ(policy.expansion.bootstrapEpochs, 28u);
}

TEST(PolicyBoundsTest, PriceCeiling) {
    EXPECT_TRUE(bounds::CheckPriceCeiling(WAD, WAD));
    EXPECT_TRUE(bounds::CheckPriceCeiling(WAD, WAD * 120 / 100));
    EXPECT_EQ(bounds::CheckPriceCeiling(WAD, WAD - 1).error, CallError::OutOfRange);
    EXPECT_EQ(bounds::CheckPriceCeiling(WAD, WAD * 120 / 100 + 1).error, CallError::OutOfRange);
}

TEST(PolicyBoundsTest, PercentRanges) {
    EXPECT_TRUE(bounds::CheckMaxSupplyExpansionPercent(10));
    EXPECT_FALSE(bounds::CheckMaxSupplyExpansionPercent(1001));
    EXPECT_TRUE(bounds::CheckBondDepletionFloorPercent(500));
    EXPECT_FALSE(bounds::CheckBondDepletionFloorPercent(499));
    EXPECT_TRUE(bounds::CheckMaxSupplyContractionPercent(1500));
    EXPECT_FALSE(bounds::CheckMaxSupplyContractionPercent(99));
    EXPECT_TRUE(bounds::CheckMaxDebtRatioPercent(10000));
    EXPECT_FALSE(bounds::CheckMaxDebtRatioPercent(999));
    EXPECT_TRUE(bounds::CheckDaoFundPercent(3000));
    EXPECT_FALSE(bounds::CheckDaoFundPercent(3001));
    EXPECT_TRUE(bounds::CheckDevFundPercent(1000));
    EXPECT_FALSE(bounds::CheckDevFundPercent(1001));
    EXPECT_TRUE(bounds::CheckDiscountPercent(20000));
    EXPECT_FALSE(bounds::CheckPremiumPercent(20001));
    EXPECT_TRUE(bounds::CheckMintingFactor(10000));
    EXPECT_FALSE(bounds::CheckMintingFactor(20001));
    EXPECT_TRUE(bounds::CheckBondSupplyExpansionPercent(1000));
    EXPECT_FALSE(bounds::CheckBondSupplyExpansionPercent(1001));
}

TEST(PolicyBoundsTest, Bootstrap) {
    EXPECT_TRUE(bounds::CheckBootstrap(0, 100));
    EXPECT_TRUE(bounds::CheckBootstrap(120, 1000));
    EXPECT_FALSE(bounds::CheckBootstrap(121, 450));
    EXPECT_FALSE(bounds::CheckBootstrap(28, 99));
}

TEST(PolicyBoundsTest, PremiumThresholdAgainstCeiling) {
    Amount ceiling = WAD * 101 / 100;
    EXPECT_TRUE(bounds::CheckPremiumThreshold(WAD, ceiling, 101));
    EXPECT_TRUE(bounds::CheckPremiumThreshold(WAD, ceiling, 150));
    EXPECT_FALSE(bounds::CheckPremiumThreshold(WAD, ceiling, 100));
    EXPECT_FALSE(bounds::CheckPremiumThreshold(WAD, ceiling, 151));
}

TEST(PolicyBoundsTest, CheckPolicyRejectsBadFields) {
    MonetaryPolicy policy;
    policy.period = 0;
    EXPECT_FALSE(bounds::CheckPolicy(policy));

    policy = MonetaryPolicy();
    policy.expansion.mintingFactorForPayingDebt = 5000;
    EXPECT_FALSE(bounds::CheckPolicy(policy));
    policy.expansion.mintingFactorForPayingDebt = 0;
    EXPECT_TRUE(bounds::CheckPolicy(policy));

    policy.expansion.seigniorageExpansionFloorPercent = 10001;
    EXPECT_FALSE(bounds::CheckPolicy(policy));
}

TEST(PolicyBoundsTest, FundShareNeedsFund) {
    MonetaryPolicy policy;
    ExtraFunds funds;
    EXPECT_TRUE(bounds::CheckExtraFunds(policy, funds));

    policy.daoFundSharedPercent = 1000;
    EXPECT_EQ(bounds::CheckExtraFunds(policy, funds).error, CallError::InvalidArgument);
    funds.daoFund = Address::FromLabel("dao");
    EXPECT_TRUE(bounds::CheckExtraFunds(policy, funds));

    policy.devFundSharedPercent = 500;
    EXPECT_EQ(bounds::CheckExtraFunds(policy, funds).error, CallError::InvalidArgument);
    funds.devFund = Address::FromLabel("dev");
    EXPECT_TRUE(bounds::CheckExtraFunds(policy, funds));
}

// ============================================================================
// Duration Parsing Tests
// ============================================================================

TEST(ParseDurationTest, Units) {
    EXPECT_EQ(*ParseDuration("90"), 90);
    EXPECT_EQ(*ParseDuration("90s"), 90);
    EXPECT_EQ(*ParseDuration("15m"), 900);
    EXPECT_EQ(*ParseDuration("6h"), 6 * HOURS);
    EXPECT_EQ(*ParseDuration(" 4d "), 4 * DAYS);
}

TEST(ParseDurationTest, RejectsMalformed) {
    EXPECT_FALSE(ParseDuration(""));
    EXPECT_FALSE(ParseDuration("h"));
    EXPECT_FALSE(ParseDuration("-5"));
    EXPECT_FALSE(ParseDuration("1.5h"));
    EXPECT_FALSE(ParseDuration("99999999999999999999"));
}

// ============================================================================
// Policy Loader Tests
// ============================================================================

class PolicyConfigTest : public ::testing::Test {
protected:
    util::ConfigManager config_;
    MonetaryPolicy policy_;
    ExtraFunds funds_;

    void Load(const std::string& content) {
        auto parsed = config_.ParseString(content);
        ASSERT_TRUE(parsed.success) << parsed.errorMessage;
    }
};

TEST_F(PolicyConfigTest, EmptyConfigKeepsDefaults) {
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(policy_.period, DEFAULT_PERIOD);
}

TEST_F(PolicyConfigTest, OverridesKeys) {
    Load("[treasury]\n"
         "period = 8h\n"
         "price_ceiling = 1.02\n"
         "max_debt_ratio_percent = 4000\n"
         "discount_percent = 5000\n"
         "max_premium_rate = 1.5\n"
         "bootstrap_epochs = 0\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(policy_.period, 8 * HOURS);
    EXPECT_EQ(policy_.pricing.priceCeiling, WAD * 102 / 100);
    EXPECT_EQ(policy_.maxDebtRatioPercent, 4000u);
    EXPECT_EQ(policy_.pricing.discountPercent, 5000u);
    EXPECT_EQ(policy_.pricing.maxPremiumRate, WAD * 3 / 2);
    EXPECT_EQ(policy_.expansion.bootstrapEpochs, 0u);
}

TEST_F(PolicyConfigTest, TierLists) {
    Load("[treasury]\n"
         "supply_tiers = 0, 1000, 2000, 3000, 4000, 5000, 6000, 7000, 8000\n"
         "max_expansion_tiers = 500, 450, 400, 350, 300, 250, 200, 150, 100\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(policy_.expansion.tiers.Threshold(8), ToWad(8000));
    EXPECT_EQ(policy_.expansion.tiers.Percent(0), 500u);
}

TEST_F(PolicyConfigTest, TierListWrongLength) {
    Load("[treasury]\nsupply_tiers = 0, 1000\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("treasury.supply_tiers"), std::string::npos);
}

TEST_F(PolicyConfigTest, BadValueNamesKey) {
    Load("[treasury]\nmax_debt_ratio_percent = lots\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("treasury.max_debt_ratio_percent"), std::string::npos);
}

TEST_F(PolicyConfigTest, OutOfBoundsLeavesPolicyUntouched) {
    Load("[treasury]\nperiod = 1h\nmax_debt_ratio_percent = 20000\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage.rfind("treasury: ", 0), 0u);
    EXPECT_EQ(policy_.period, DEFAULT_PERIOD);
    EXPECT_EQ(policy_.maxDebtRatioPercent, DEFAULT_MAX_DEBT_RATIO_PERCENT);
}

TEST_F(PolicyConfigTest, FundShareWithoutFundRejected) {
    Load("[treasury]\ndao_fund_shared_percent = 1000\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage.rfind("treasury: ", 0), 0u);
    EXPECT_EQ(policy_.daoFundSharedPercent, 0u);
}

TEST_F(PolicyConfigTest, FundShareWithFund) {
    Load("[treasury]\n"
         "dao_fund_shared_percent = 1000\n"
         "dao_fund = 0x00000000000000000000000000000000000000da\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(policy_.daoFundSharedPercent, 1000u);
    EXPECT_EQ(funds_.daoFund, Address::FromHex("00000000000000000000000000000000000000da"));
    EXPECT_TRUE(funds_.devFund.IsNull());
}

TEST_F(PolicyConfigTest, BadFundAddressNamesKey) {
    Load("[treasury]\ndev_fund = 0x1234\n");
    auto result = LoadMonetaryPolicy(config_, policy_, funds_);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("treasury.dev_fund"), std::string::npos);
}

// ============================================================================
// Emission Loader Tests
// ============================================================================

TEST_F(PolicyConfigTest, EmissionAbsentLeavesOutputs) {
    std::vector<Amount> totals{WAD};
    std::vector<Timestamp> durations{DAYS};
    EXPECT_TRUE(LoadEmissionConfig(config_, totals, durations).success);
    EXPECT_EQ(totals.size(), 1u);
    EXPECT_EQ(durations[0], DAYS);
}

TEST_F(PolicyConfigTest, EmissionLists) {
    Load("[rewardpool]\n"
         "epoch_totals = 80000, 60000\n"
         "epoch_durations = 4d, 5d\n");
    std::vector<Amount> totals;
    std::vector<Timestamp> durations;
    auto result = LoadEmissionConfig(config_, totals, durations);
    ASSERT_TRUE(result.success) << result.errorMessage;
    ASSERT_EQ(totals.size(), 2u);
    EXPECT_EQ(totals[0], ToWad(80000));
    EXPECT_EQ(durations[1], 5 * DAYS);
}

TEST_F(PolicyConfigTest, EmissionListsMustMatch) {
    Load("[rewardpool]\nepoch_totals = 80000, 60000\nepoch_durations = 4d\n");
    std::vector<Amount> totals;
    std::vector<Timestamp> durations;
    EXPECT_FALSE(LoadEmissionConfig(config_, totals, durations).success);
    EXPECT_TRUE(totals.empty());

    util::ConfigManager onlyTotals;
    ASSERT_TRUE(onlyTotals.ParseString("[rewardpool]\nepoch_totals = 100\n").success);
    EXPECT_FALSE(LoadEmissionConfig(onlyTotals, totals, durations).success);
}

TEST_F(PolicyConfigTest, EmissionRejectsZeroDuration) {
    Load("[rewardpool]\nepoch_totals = 100\nepoch_durations = 0\n");
    std::vector<Amount> totals;
    std::vector<Timestamp> durations;
    auto result = LoadEmissionConfig(config_, totals, durations);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("rewardpool.epoch_durations"), std::string::npos);
}

} // namespace
} // namespace economics
} // namespace polymint
