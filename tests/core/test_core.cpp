// POLYMINT - Core Tests
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include <gtest/gtest.h>

#include <polymint/asset/asset.h>
#include <polymint/core/fixedpoint.h>
#include <polymint/core/journal.h>
#include <polymint/core/result.h>
#include <polymint/core/types.h>

#include <limits>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace polymint {
namespace {

using namespace fixedpoint;

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.ToHex(), "0x0000000000000000000000000000000000000000");
}

TEST(AddressTest, FromLabelIsStableAndDistinct) {
    Address a = Address::FromLabel("alice");
    Address b = Address::FromLabel("bob");
    EXPECT_FALSE(a.IsNull());
    EXPECT_EQ(a, Address::FromLabel("alice"));
    EXPECT_NE(a, b);
}

TEST(AddressTest, HexRoundTrip) {
    Address a = Address::FromLabel("treasury");
    EXPECT_EQ(Address::FromHex(a.ToHex()), a);
    EXPECT_EQ(Address::FromHex(a.ToHex().substr(2)), a);
}

TEST(AddressTest, FromHexRejectsMalformed) {
    EXPECT_THROW(Address::FromHex("0x1234"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(40, 'g')), std::invalid_argument);
}

TEST(AddressTest, ShortStringAndHash) {
    Address a = Address::FromLabel("alice");
    EXPECT_EQ(a.ToShortString().size(), 10u);
    std::unordered_set<Address> set{a, Address::FromLabel("bob"), a};
    EXPECT_EQ(set.size(), 2u);
}

TEST(CallContextTest, DirectSetsCallerAndOrigin) {
    Address a = Address::FromLabel("alice");
    CallContext ctx = CallContext::Direct(a, 7, 1000);
    EXPECT_EQ(ctx.caller, a);
    EXPECT_EQ(ctx.origin, a);
    EXPECT_EQ(ctx.blockNumber, 7u);
    EXPECT_EQ(ctx.timestamp, 1000);
}

// ============================================================================
// Fixed-Point Tests
// ============================================================================

TEST(FixedPointTest, ScaleConstants) {
    EXPECT_EQ(WAD, Amount("1000000000000000000"));
    EXPECT_EQ(BPS_IN_WAD * BPS_DENOMINATOR, WAD);
    EXPECT_EQ(ToWad(3), WAD * 3);
}

TEST(FixedPointTest, MulDivFloors) {
    EXPECT_EQ(WadMul(ToWad(3), WAD / 2), WAD * 3 / 2);
    EXPECT_EQ(WadDiv(WAD, ToWad(3)), Amount("333333333333333333"));
    EXPECT_EQ(MulDiv(10, 3, 4), 7);
    EXPECT_EQ(ApplyBps(ToWad(100), 350), ToWad(3) + WAD / 2);
    EXPECT_EQ(ApplyPercent(WAD, 101), WAD * 101 / 100);
}

TEST(FixedPointTest, SaturatingAndMinMax) {
    EXPECT_EQ(SaturatingSub(5, 7), 0);
    EXPECT_EQ(SaturatingSub(7, 5), 2);
    EXPECT_EQ(Min(3, 4), 3);
    EXPECT_EQ(Max(3, 4), 4);
}

TEST(FixedPointTest, CheckedArithmeticThrows) {
    Amount max = std::numeric_limits<Amount>::max();
    EXPECT_FALSE(CanAdd(max, 1));
    EXPECT_TRUE(CanAdd(max - 1, 1));
    EXPECT_THROW({ Amount r = max + Amount(1); (void)r; }, std::overflow_error);
    EXPECT_THROW({ Amount r = Amount(1) - Amount(2); (void)r; }, std::range_error);
    EXPECT_THROW({ Amount r = WadDiv(WAD, 0); (void)r; }, std::overflow_error);
}

TEST(FixedPointTest, FormatAmount) {
    EXPECT_EQ(FormatAmount(0), "0");
    EXPECT_EQ(FormatAmount(ToWad(42)), "42");
    EXPECT_EQ(FormatAmount(WAD * 101 / 100), "1.01");
    EXPECT_EQ(FormatAmount(1), "0.000000000000000001");
}

TEST(FixedPointTest, ParseAmount) {
    EXPECT_EQ(*ParseAmount("1.5"), WAD * 3 / 2);
    EXPECT_EQ(*ParseAmount("1000"), ToWad(1000));
    EXPECT_EQ(*ParseAmount(".25"), WAD / 4);
    EXPECT_EQ(*ParseAmount("0.010"), WAD / 100);
    EXPECT_EQ(*ParseAmount("123wei"), 123);
    EXPECT_EQ(*ParseAmount("0755wei"), 755);
    EXPECT_EQ(*ParseAmount("0.000000000000000001"), 1);
}

TEST(FixedPointTest, ParseAmountRejectsMalformed) {
    EXPECT_FALSE(ParseAmount(""));
    EXPECT_FALSE(ParseAmount("abc"));
    EXPECT_FALSE(ParseAmount("-1"));
    EXPECT_FALSE(ParseAmount("1.2.3"));
    EXPECT_FALSE(ParseAmount("1.0000000000000000001"));
    EXPECT_FALSE(ParseAmount("xwei"));
    EXPECT_FALSE(ParseAmount(std::string(90, '9')));
}

TEST(FixedPointTest, ToDouble) {
    EXPECT_DOUBLE_EQ(ToDouble(WAD * 3 / 2), 1.5);
}

// ============================================================================
// Result Tests
// ============================================================================

TEST(CallResultTest, OkAndFail) {
    CallResult ok = CallResult::Ok();
    EXPECT_TRUE(ok.IsOk());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.Class(), ErrorClass::None);

    CallResult fail = CallResult::Fail(CallError::PriceMoved, "price moved");
    EXPECT_FALSE(fail);
    EXPECT_EQ(fail.error, CallError::PriceMoved);
    EXPECT_EQ(fail.reason, "price moved");
    EXPECT_NE(fail.ToString().find("price moved"), std::string::npos);
}

TEST(CallResultTest, ErrorClassification) {
    EXPECT_EQ(ClassifyError(CallError::NotStarted), ErrorClass::Precondition);
    EXPECT_EQ(ClassifyError(CallError::SameBlockReentry), ErrorClass::Precondition);
    EXPECT_EQ(ClassifyError(CallError::InsufficientBudget), ErrorClass::Precondition);
    EXPECT_EQ(ClassifyError(CallError::OracleFailure), ErrorClass::Oracle);
    EXPECT_EQ(ClassifyError(CallError::Unauthorized), ErrorClass::Authorization);
    EXPECT_EQ(ClassifyError(CallError::MissingPermission), ErrorClass::Authorization);
    EXPECT_EQ(ClassifyError(CallError::OutOfRange), ErrorClass::Range);
    EXPECT_EQ(ClassifyError(CallError::ArithmeticFault), ErrorClass::Arithmetic);
}

TEST(CallResultTest, ErrorToString) {
    EXPECT_STREQ(CallErrorToString(CallError::EpochNotOpened), "EpochNotOpened");
    EXPECT_STREQ(CallErrorToString(CallError::OverMaxDebtRatio), "OverMaxDebtRatio");
    EXPECT_STREQ(ErrorClassToString(ErrorClass::Range), "RangeViolation");
}

// ============================================================================
// Journal Tests
// ============================================================================

class Counter : public IJournaled {
public:
    int value{0};
    int checkpoints{0};

    void Checkpoint() override {
        saved_.push_back(value);
        ++checkpoints;
    }
    void Rollback() override {
        value = saved_.back();
        saved_.pop_back();
    }
    void Release() override { saved_.pop_back(); }
    size_t Depth() const { return saved_.size(); }

private:
    std::vector<int> saved_;
};

TEST(JournalTest, RollsBackWithoutCommit) {
    Counter a, b;
    {
        JournalScope scope({&a, &b});
        a.value = 5;
        b.value = 7;
    }
    EXPECT_EQ(a.value, 0);
    EXPECT_EQ(b.value, 0);
    EXPECT_EQ(a.Depth(), 0u);
}

TEST(JournalTest, CommitKeepsChanges) {
    Counter a;
    {
        JournalScope scope({&a});
        a.value = 5;
        scope.Commit();
        EXPECT_TRUE(scope.IsCommitted());
    }
    EXPECT_EQ(a.value, 5);
    EXPECT_EQ(a.Depth(), 0u);
}

TEST(JournalTest, SkipsNullAndDuplicates) {
    Counter a;
    {
        JournalScope scope(std::vector<IJournaled*>{&a, nullptr, &a});
        a.value = 3;
    }
    EXPECT_EQ(a.checkpoints, 1);
    EXPECT_EQ(a.value, 0);
}

TEST(JournalTest, NestedScopes) {
    Counter a;
    {
        JournalScope outer({&a});
        a.value = 1;
        {
            JournalScope inner({&a});
            a.value = 2;
        }
        EXPECT_EQ(a.value, 1);
        outer.Commit();
    }
    EXPECT_EQ(a.value, 1);
}

// ============================================================================
// Asset Tests
// ============================================================================

class AssetTest : public ::testing::Test {
protected:
    Address op_ = Address::FromLabel("operator");
    Address alice_ = Address::FromLabel("alice");
    Address bob_ = Address::FromLabel("bob");
    asset::BasicAsset token_{Address::FromLabel("token"), "PEG", op_};
};

TEST_F(AssetTest, MintIsOperatorOnly) {
    EXPECT_FALSE(token_.Mint(alice_, alice_, WAD));
    EXPECT_TRUE(token_.Mint(op_, alice_, WAD));
    EXPECT_FALSE(token_.Mint(op_, Address(), WAD));
    EXPECT_EQ(token_.BalanceOf(alice_), WAD);
    EXPECT_EQ(token_.TotalSupply(), WAD);
}

TEST_F(AssetTest, MintRejectsOverflow) {
    ASSERT_TRUE(token_.Mint(op_, alice_, std::numeric_limits<Amount>::max()));
    EXPECT_FALSE(token_.Mint(op_, bob_, 1));
    EXPECT_EQ(token_.BalanceOf(bob_), 0);
}

TEST_F(AssetTest, TransferAndAllowance) {
    ASSERT_TRUE(token_.Mint(op_, alice_, ToWad(10)));
    EXPECT_TRUE(token_.Transfer(alice_, bob_, ToWad(4)));
    EXPECT_FALSE(token_.Transfer(alice_, bob_, ToWad(7)));

    EXPECT_FALSE(token_.TransferFrom(bob_, alice_, bob_, WAD));
    ASSERT_TRUE(token_.Approve(alice_, bob_, ToWad(2)));
    EXPECT_TRUE(token_.TransferFrom(bob_, alice_, bob_, WAD));
    EXPECT_EQ(token_.Allowance(alice_, bob_), WAD);
    EXPECT_EQ(token_.BalanceOf(bob_), ToWad(5));
    EXPECT_EQ(token_.BalanceOf(alice_), ToWad(5));
}

TEST_F(AssetTest, BurnFromNeedsAllowanceForOthers) {
    ASSERT_TRUE(token_.Mint(op_, alice_, ToWad(10)));
    EXPECT_FALSE(token_.BurnFrom(alice_, alice_, WAD));
    EXPECT_FALSE(token_.BurnFrom(op_, alice_, WAD));

    ASSERT_TRUE(token_.Approve(alice_, op_, ToWad(3)));
    EXPECT_TRUE(token_.BurnFrom(op_, alice_, ToWad(3)));
    EXPECT_EQ(token_.TotalSupply(), ToWad(7));
    EXPECT_EQ(token_.Allowance(alice_, op_), 0);
}

TEST_F(AssetTest, BurnRemovesEmptyHolder) {
    ASSERT_TRUE(token_.Mint(op_, alice_, WAD));
    EXPECT_EQ(token_.HolderCount(), 1u);
    EXPECT_TRUE(token_.Burn(alice_, WAD));
    EXPECT_EQ(token_.HolderCount(), 0u);
    EXPECT_FALSE(token_.Burn(alice_, 1));
}

TEST_F(AssetTest, TransferOperator) {
    EXPECT_FALSE(token_.TransferOperator(alice_, alice_));
    EXPECT_TRUE(token_.TransferOperator(op_, alice_));
    EXPECT_EQ(token_.Operator(), alice_);
    EXPECT_TRUE(token_.Mint(alice_, bob_, WAD));
}

TEST_F(AssetTest, CheckpointRollback) {
    ASSERT_TRUE(token_.Mint(op_, alice_, WAD));
    token_.Checkpoint();
    ASSERT_TRUE(token_.Mint(op_, bob_, WAD));
    EXPECT_EQ(token_.CheckpointDepth(), 1u);
    token_.Rollback();
    EXPECT_EQ(token_.CheckpointDepth(), 0u);
    EXPECT_EQ(token_.TotalSupply(), WAD);
    EXPECT_EQ(token_.BalanceOf(bob_), 0);
}

} // namespace
} // namespace polymint
