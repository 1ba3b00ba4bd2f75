// POLYMINT - Treasury Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/treasury/treasury.h"
#include "polymint/core/fixedpoint.h"
#include "polymint/economics/bond_pricing.h"
#include "polymint/economics/expansion.h"
#include "polymint/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace polymint {
namespace treasury {

using economics::BondPricingEngine;
using economics::SupplyExpansionPlanner;
using fixedpoint::FormatAmount;

namespace {

template<typename T>
IJournaled* AsJournaled(T* collaborator) {
    return dynamic_cast<IJournaled*>(collaborator);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Treasury::Treasury(const Address& self, const Address& op) : self_(self) {
    state_.operatorAddress = op;
}

Treasury::~Treasury() = default;

CallResult Treasury::Initialize(const CallContext& ctx, const TreasuryInit& init,
                                const economics::MonetaryPolicy& policy) {
    return Execute(ctx, "initialize", [&](TreasuryState& s, Events& events) {
        if (s.initialized) {
            return CallResult::Fail(CallError::AlreadyInitialized, "already initialized");
        }
        auto auth = RequireOperator(s, ctx);
        if (!auth) {
            return auth;
        }
        if (!init.pegged || !init.bond || !init.share || !init.oracle || !init.rewardSink) {
            return CallResult::Fail(CallError::InvalidArgument, "missing collaborator");
        }
        auto valid = economics::bounds::CheckPolicy(policy);
        if (!valid) {
            return valid;
        }
        valid = economics::bounds::CheckExtraFunds(policy, init.funds);
        if (!valid) {
            return valid;
        }

        s.pegged = init.pegged;
        s.bond = init.bond;
        s.share = init.share;
        s.oracle = oracle::OracleGateway(init.oracle, init.pegged->GetAddress());
        s.rewardSink = init.rewardSink;
        s.daoFund = init.funds.daoFund;
        s.devFund = init.funds.devFund;
        s.policy = policy;
        s.epochs = EpochController(init.startTime, policy.period);

        if (!init.genesisPool.IsNull()) {
            s.excludedFromTotalSupply.push_back(init.genesisPool);
        }

        // Pegged tokens already held back the reserve
        s.seigniorageSaved = s.pegged->BalanceOf(self_);

        s.initialized = true;
        s.operatorAddress = ctx.caller;

        Address executor = ctx.caller;
        BlockNumber block = ctx.blockNumber;
        events.push_back([executor, block](ITreasuryListener& l) {
            l.OnInitialized(executor, block);
        });
        LOG_INFO(util::LogCategory::TREASURY)
            << "Initialized at block " << block << ", start " << init.startTime
            << ", reserve " << FormatAmount(s.seigniorageSaved);
        return CallResult::Ok();
    });
}

// ============================================================================
// Call Execution
// ============================================================================

CallResult Treasury::Execute(const CallContext& ctx, const char* name, const Body& body,
                             std::vector<IJournaled*> extra) {
    Events events;
    CallResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<IJournaled*> participants = {
            AsJournaled(state_.pegged),
            AsJournaled(state_.bond),
            AsJournaled(state_.share),
            AsJournaled(state_.oracle.GetOracle()),
            AsJournaled(state_.rewardSink),
            AsJournaled(state_.bondTreasury),
        };
        participants.insert(participants.end(), extra.begin(), extra.end());

        TreasuryState next = state_;
        JournalScope journal(participants);
        try {
            result = body(next, events);
        } catch (const std::overflow_error& e) {
            result = CallResult::Fail(CallError::ArithmeticFault, e.what());
        } catch (const std::range_error& e) {
            result = CallResult::Fail(CallError::ArithmeticFault, e.what());
        }

        if (result) {
            journal.Commit();
            state_ = std::move(next);
        }
    }

    if (!result) {
        LOG_DEBUG(util::LogCategory::TREASURY) << name << " by " << ctx.caller.ToShortString()
                                               << " rejected: " << result.reason;
        return result;
    }
    Notify(events);
    return result;
}

CallResult Treasury::Govern(const CallContext& ctx, const char* name, const Body& body,
                            std::vector<IJournaled*> extra) {
    return Execute(ctx, name, [&](TreasuryState& s, Events& events) {
        auto auth = RequireOperator(s, ctx);
        if (!auth) {
            return auth;
        }
        if (!s.initialized) {
            return CallResult::Fail(CallError::NotInitialized, "not initialized");
        }
        auto result = body(s, events);
        if (result) {
            LOG_INFO(util::LogCategory::TREASURY) << name << " applied";
        }
        return result;
    }, std::move(extra));
}

void Treasury::Notify(const Events& events) {
    if (events.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    for (auto* listener : listeners_) {
        for (const auto& event : events) {
            event(*listener);
        }
    }
}

void Treasury::AddListener(ITreasuryListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void Treasury::RemoveListener(ITreasuryListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

// ============================================================================
// Guards
// ============================================================================

CallResult Treasury::RequireOperator(const TreasuryState& s, const CallContext& ctx) const {
    if (ctx.caller != s.operatorAddress) {
        return CallResult::Fail(CallError::Unauthorized, "caller is not the operator");
    }
    return CallResult::Ok();
}

CallResult Treasury::CheckAssetOperators(const TreasuryState& s) const {
    bool ok = s.pegged->Operator() == self_ &&
              s.bond->Operator() == self_ &&
              s.share->Operator() == self_ &&
              s.rewardSink && s.rewardSink->Operator() == self_;
    if (!ok) {
        return CallResult::Fail(CallError::MissingPermission, "need more permission");
    }
    return CallResult::Ok();
}

// ============================================================================
// Ledger
// ============================================================================

Amount Treasury::CirculatingSupplyOf(const TreasuryState& s) const {
    Amount balanceExcluded = 0;
    for (const auto& account : s.excludedFromTotalSupply) {
        balanceExcluded += s.pegged->BalanceOf(account);
    }
    return s.pegged->TotalSupply() - balanceExcluded;
}

CallResult Treasury::FetchPrice(const TreasuryState& s, Amount& price) const {
    auto consulted = s.oracle.GetPrice();
    if (!consulted) {
        return CallResult::Fail(CallError::OracleFailure, "failed to consult price");
    }
    price = *consulted;
    return CallResult::Ok();
}

CallResult Treasury::SendToRewardSink(TreasuryState& s, Timestamp now, const Amount& amount,
                                      Events& events) {
    if (amount.is_zero()) {
        return CallResult::Ok();
    }
    if (!s.pegged->Mint(self_, self_, amount)) {
        return CallResult::Fail(CallError::CollaboratorFailure, "mint for reward sink failed");
    }

    Amount daoAmount = 0;
    if (s.policy.daoFundSharedPercent > 0) {
        daoAmount = fixedpoint::ApplyBps(amount, s.policy.daoFundSharedPercent);
        if (!s.pegged->Transfer(self_, s.daoFund, daoAmount)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "dao fund transfer failed");
        }
        events.push_back([now, daoAmount](ITreasuryListener& l) {
            l.OnDaoFundFunded(now, daoAmount);
        });
    }

    Amount devAmount = 0;
    if (s.policy.devFundSharedPercent > 0) {
        devAmount = fixedpoint::ApplyBps(amount, s.policy.devFundSharedPercent);
        if (!s.pegged->Transfer(self_, s.devFund, devAmount)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "dev fund transfer failed");
        }
        events.push_back([now, devAmount](ITreasuryListener& l) {
            l.OnDevFundFunded(now, devAmount);
        });
    }

    Amount sinkAmount = amount - daoAmount - devAmount;
    if (sinkAmount.is_zero()) {
        return CallResult::Ok();
    }

    const Address sink = s.rewardSink->GetAddress();
    if (!s.pegged->Approve(self_, sink, 0) || !s.pegged->Approve(self_, sink, sinkAmount)) {
        return CallResult::Fail(CallError::CollaboratorFailure, "approve reward sink failed");
    }
    if (!s.rewardSink->AllocateSeigniorage(self_, sinkAmount)) {
        LOG_WARN(util::LogCategory::TREASURY) << "reward sink refused "
                                              << FormatAmount(sinkAmount);
        return CallResult::Fail(CallError::CollaboratorFailure, "reward sink allocation failed");
    }
    events.push_back([now, sinkAmount](ITreasuryListener& l) {
        l.OnRewardSinkFunded(now, sinkAmount);
    });
    return CallResult::Ok();
}

CallResult Treasury::SendToBondTreasury(TreasuryState& s, Timestamp now, const Amount& amount,
                                        Events& events) {
    if (!s.bondTreasury || amount.is_zero()) {
        return CallResult::Ok();
    }
    const Address target = s.bondTreasury->GetAddress();
    Amount balance = s.pegged->BalanceOf(target);
    Amount vested = s.bondTreasury->TotalVested();
    if (vested >= balance) {
        return CallResult::Ok();
    }
    Amount unspent = balance - vested;
    if (amount <= unspent) {
        return CallResult::Ok();
    }
    Amount minted = amount - unspent;
    if (!s.pegged->Mint(self_, target, minted)) {
        return CallResult::Fail(CallError::CollaboratorFailure, "mint for bond treasury failed");
    }
    events.push_back([now, minted](ITreasuryListener& l) {
        l.OnBondTreasuryFunded(now, minted);
    });
    return CallResult::Ok();
}

// ============================================================================
// Entry Points
// ============================================================================

CallResult Treasury::BuyBonds(const CallContext& ctx, const Amount& peggedAmount,
                              const Amount& targetPrice) {
    return Execute(ctx, "buyBonds", [&](TreasuryState& s, Events& events) {
        if (!s.initialized) {
            return CallResult::Fail(CallError::NotInitialized, "not initialized");
        }
        CallResult guard = s.callGuard.Enter(ctx);
        if (!guard) return guard;
        guard = s.epochs.CheckCondition(ctx.timestamp);
        if (!guard) return guard;
        guard = CheckAssetOperators(s);
        if (!guard) return guard;

        if (peggedAmount.is_zero()) {
            return CallResult::Fail(CallError::ZeroAmount, "cannot purchase bonds with zero amount");
        }

        Amount price;
        auto fetched = FetchPrice(s, price);
        if (!fetched) return fetched;
        if (price != targetPrice) {
            return CallResult::Fail(CallError::PriceMoved, "price moved");
        }
        if (price >= s.policy.pricing.pegPrice) {
            return CallResult::Fail(CallError::PriceNotEligible,
                                    "price not eligible for bond purchase");
        }
        if (peggedAmount > s.epochs.ContractionLeft()) {
            return CallResult::Fail(CallError::InsufficientBudget,
                                    "not enough bond left to purchase");
        }

        Amount rate = BondPricingEngine::DiscountRate(s.policy.pricing, price);
        if (rate.is_zero()) {
            return CallResult::Fail(CallError::InvalidBondRate, "invalid bond rate");
        }

        Amount bondAmount = BondPricingEngine::BondsForPurchase(peggedAmount, rate);
        Amount supply = CirculatingSupplyOf(s);
        Amount newBondSupply = s.bond->TotalSupply() + bondAmount;
        if (newBondSupply > fixedpoint::ApplyBps(supply, s.policy.maxDebtRatioPercent)) {
            return CallResult::Fail(CallError::OverMaxDebtRatio, "over max debt ratio");
        }

        if (!s.pegged->BurnFrom(self_, ctx.caller, peggedAmount)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "burn of pegged token failed");
        }
        if (!s.bond->Mint(self_, ctx.caller, bondAmount)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "bond mint failed");
        }
        auto consumed = s.epochs.ConsumeContraction(peggedAmount);
        if (!consumed) return consumed;

        s.oracle.RefreshPrice(ctx.timestamp);

        Address from = ctx.caller;
        Amount paid = peggedAmount;
        events.push_back([from, paid, bondAmount](ITreasuryListener& l) {
            l.OnBoughtBonds(from, paid, bondAmount);
        });
        LOG_INFO(util::LogCategory::BOND)
            << from.ToShortString() << " bought " << FormatAmount(bondAmount) << " bonds for "
            << FormatAmount(paid) << " at rate " << FormatAmount(rate);
        return CallResult::Ok();
    });
}

CallResult Treasury::RedeemBonds(const CallContext& ctx, const Amount& bondAmount,
                                 const Amount& targetPrice) {
    return Execute(ctx, "redeemBonds", [&](TreasuryState& s, Events& events) {
        if (!s.initialized) {
            return CallResult::Fail(CallError::NotInitialized, "not initialized");
        }
        CallResult guard = s.callGuard.Enter(ctx);
        if (!guard) return guard;
        guard = s.epochs.CheckCondition(ctx.timestamp);
        if (!guard) return guard;
        guard = CheckAssetOperators(s);
        if (!guard) return guard;

        if (bondAmount.is_zero()) {
            return CallResult::Fail(CallError::ZeroAmount, "cannot redeem bonds with zero amount");
        }

        Amount price;
        auto fetched = FetchPrice(s, price);
        if (!fetched) return fetched;
        if (price != targetPrice) {
            return CallResult::Fail(CallError::PriceMoved, "price moved");
        }
        if (price <= s.policy.pricing.priceCeiling) {
            return CallResult::Fail(CallError::PriceNotEligible,
                                    "price not eligible for bond redemption");
        }

        Amount rate = BondPricingEngine::PremiumRate(s.policy.pricing, price);
        if (rate.is_zero()) {
            return CallResult::Fail(CallError::InvalidBondRate, "invalid bond rate");
        }

        Amount payout = BondPricingEngine::PayoutForRedemption(bondAmount, rate);
        if (s.pegged->BalanceOf(self_) < payout) {
            return CallResult::Fail(CallError::TreasuryBudgetExhausted,
                                    "treasury has no more budget");
        }

        s.seigniorageSaved -= fixedpoint::Min(s.seigniorageSaved, payout);
        if (!s.bond->BurnFrom(self_, ctx.caller, bondAmount)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "burn of bonds failed");
        }
        if (!s.pegged->Transfer(self_, ctx.caller, payout)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "payout transfer failed");
        }

        s.oracle.RefreshPrice(ctx.timestamp);

        Address from = ctx.caller;
        Amount redeemed = bondAmount;
        events.push_back([from, payout, redeemed](ITreasuryListener& l) {
            l.OnRedeemedBonds(from, payout, redeemed);
        });
        LOG_INFO(util::LogCategory::BOND)
            << from.ToShortString() << " redeemed " << FormatAmount(redeemed) << " bonds for "
            << FormatAmount(payout) << " at rate " << FormatAmount(rate);
        return CallResult::Ok();
    });
}

CallResult Treasury::AllocateSeigniorage(const CallContext& ctx) {
    return Execute(ctx, "allocateSeigniorage", [&](TreasuryState& s, Events& events) {
        if (!s.initialized) {
            return CallResult::Fail(CallError::NotInitialized, "not initialized");
        }
        CallResult guard = s.callGuard.Enter(ctx);
        if (!guard) return guard;
        guard = s.epochs.CheckCondition(ctx.timestamp);
        if (!guard) return guard;
        guard = s.epochs.CheckEpoch(ctx.timestamp);
        if (!guard) return guard;
        guard = CheckAssetOperators(s);
        if (!guard) return guard;

        const Timestamp now = ctx.timestamp;
        s.oracle.RefreshPrice(now);

        Amount price;
        auto fetched = FetchPrice(s, price);
        if (!fetched) return fetched;
        s.previousEpochPrice = price;

        economics::AllocationInput input;
        input.epoch = s.epochs.Epoch();
        input.previousPrice = price;
        input.pegPrice = s.policy.pricing.pegPrice;
        input.priceCeiling = s.policy.pricing.priceCeiling;
        input.supply = CirculatingSupplyOf(s) - s.seigniorageSaved;
        input.reserve = s.seigniorageSaved;
        input.bondSupply = s.bond->TotalSupply();

        auto plan = SupplyExpansionPlanner::Plan(s.policy.expansion, input);

        auto sent = SendToBondTreasury(s, now, plan.bondTreasuryAmount, events);
        if (!sent) return sent;
        sent = SendToRewardSink(s, now, plan.rewardSinkAmount, events);
        if (!sent) return sent;

        if (plan.reserveAmount > 0) {
            s.seigniorageSaved += plan.reserveAmount;
            if (!s.pegged->Mint(self_, self_, plan.reserveAmount)) {
                return CallResult::Fail(CallError::CollaboratorFailure, "reserve mint failed");
            }
            Amount funded = plan.reserveAmount;
            events.push_back([now, funded](ITreasuryListener& l) {
                l.OnTreasuryFunded(now, funded);
            });
        }

        // Close the epoch against the post-allocation price and supply
        Amount closingPrice;
        fetched = FetchPrice(s, closingPrice);
        if (!fetched) return fetched;
        s.epochs.CloseEpoch(closingPrice, s.policy.pricing.priceCeiling, CirculatingSupplyOf(s),
                            s.policy.maxSupplyContractionPercent);

        LOG_INFO(util::LogCategory::EPOCH)
            << "epoch " << input.epoch << " allocated: price " << FormatAmount(price)
            << (plan.bootstrap ? " bootstrap" : (plan.expansion ? " expansion" : " no expansion"))
            << ", sink " << FormatAmount(plan.rewardSinkAmount) << ", reserve +"
            << FormatAmount(plan.reserveAmount);
        return CallResult::Ok();
    });
}

// ============================================================================
// Governance
// ============================================================================

CallResult Treasury::SetOperator(const CallContext& ctx, const Address& newOperator) {
    return Execute(ctx, "setOperator", [&](TreasuryState& s, Events&) {
        auto auth = RequireOperator(s, ctx);
        if (!auth) return auth;
        if (newOperator.IsNull()) {
            return CallResult::Fail(CallError::InvalidArgument, "null operator");
        }
        s.operatorAddress = newOperator;
        LOG_INFO(util::LogCategory::TREASURY) << "operator set to " << newOperator.ToShortString();
        return CallResult::Ok();
    });
}

CallResult Treasury::SetRewardSink(const CallContext& ctx, IRewardSink* sink) {
    return Govern(ctx, "setRewardSink", [&](TreasuryState& s, Events&) {
        if (!sink) {
            return CallResult::Fail(CallError::InvalidArgument, "null reward sink");
        }
        s.rewardSink = sink;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetOracle(const CallContext& ctx, oracle::IPriceOracle* priceOracle) {
    return Govern(ctx, "setOracle", [&](TreasuryState& s, Events&) {
        if (!priceOracle) {
            return CallResult::Fail(CallError::InvalidArgument, "null oracle");
        }
        s.oracle.SetOracle(priceOracle);
        return CallResult::Ok();
    });
}

CallResult Treasury::SetBondTreasury(const CallContext& ctx, IBondTreasury* bondTreasury,
                                     uint64_t bondSupplyExpansionPercent) {
    return Govern(ctx, "setBondTreasury", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckBondSupplyExpansionPercent(bondSupplyExpansionPercent);
        if (!check) return check;
        s.bondTreasury = bondTreasury;
        s.policy.expansion.bondSupplyExpansionPercent = bondSupplyExpansionPercent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetPriceCeiling(const CallContext& ctx, const Amount& ceiling) {
    return Govern(ctx, "setPriceCeiling", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckPriceCeiling(s.policy.pricing.pegPrice, ceiling);
        if (!check) return check;
        s.policy.pricing.priceCeiling = ceiling;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetMaxSupplyExpansionPercent(const CallContext& ctx, uint64_t percent) {
    return Govern(ctx, "setMaxSupplyExpansionPercent", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckMaxSupplyExpansionPercent(percent);
        if (!check) return check;
        s.policy.expansion.maxSupplyExpansionPercent = percent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetSupplyTiersEntry(const CallContext& ctx, size_t index, const Amount& value) {
    return Govern(ctx, "setSupplyTiersEntry", [&](TreasuryState& s, Events&) {
        return s.policy.expansion.tiers.SetThreshold(index, value);
    });
}

CallResult Treasury::SetMaxExpansionTiersEntry(const CallContext& ctx, size_t index,
                                               uint64_t value) {
    return Govern(ctx, "setMaxExpansionTiersEntry", [&](TreasuryState& s, Events&) {
        return s.policy.expansion.tiers.SetPercent(index, value);
    });
}

CallResult Treasury::SetBondDepletionFloorPercent(const CallContext& ctx, uint64_t percent) {
    return Govern(ctx, "setBondDepletionFloorPercent", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckBondDepletionFloorPercent(percent);
        if (!check) return check;
        s.policy.expansion.bondDepletionFloorPercent = percent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetMaxSupplyContractionPercent(const CallContext& ctx, uint64_t percent) {
    return Govern(ctx, "setMaxSupplyContractionPercent", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckMaxSupplyContractionPercent(percent);
        if (!check) return check;
        s.policy.maxSupplyContractionPercent = percent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetMaxDebtRatioPercent(const CallContext& ctx, uint64_t percent) {
    return Govern(ctx, "setMaxDebtRatioPercent", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckMaxDebtRatioPercent(percent);
        if (!check) return check;
        s.policy.maxDebtRatioPercent = percent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetBootstrap(const CallContext& ctx, uint64_t epochs, uint64_t percent) {
    return Govern(ctx, "setBootstrap", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckBootstrap(epochs, percent);
        if (!check) return check;
        s.policy.expansion.bootstrapEpochs = epochs;
        s.policy.expansion.bootstrapSupplyExpansionPercent = percent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetExtraFunds(const CallContext& ctx, const Address& daoFund,
                                   uint64_t daoPercent, const Address& devFund,
                                   uint64_t devPercent) {
    return Govern(ctx, "setExtraFunds", [&](TreasuryState& s, Events&) {
        if (daoFund.IsNull() || devFund.IsNull()) {
            return CallResult::Fail(CallError::InvalidArgument, "null fund address");
        }
        auto check = economics::bounds::CheckDaoFundPercent(daoPercent);
        if (!check) return check;
        check = economics::bounds::CheckDevFundPercent(devPercent);
        if (!check) return check;
        s.daoFund = daoFund;
        s.policy.daoFundSharedPercent = daoPercent;
        s.devFund = devFund;
        s.policy.devFundSharedPercent = devPercent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetMaxDiscountRate(const CallContext& ctx, const Amount& rate) {
    return Govern(ctx, "setMaxDiscountRate", [&](TreasuryState& s, Events&) {
        s.policy.pricing.maxDiscountRate = rate;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetMaxPremiumRate(const CallContext& ctx, const Amount& rate) {
    return Govern(ctx, "setMaxPremiumRate", [&](TreasuryState& s, Events&) {
        s.policy.pricing.maxPremiumRate = rate;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetDiscountPercent(const CallContext& ctx, uint64_t percent) {
    return Govern(ctx, "setDiscountPercent", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckDiscountPercent(percent);
        if (!check) return check;
        s.policy.pricing.discountPercent = percent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetPremiumThreshold(const CallContext& ctx, uint64_t threshold) {
    return Govern(ctx, "setPremiumThreshold", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckPremiumThreshold(
            s.policy.pricing.pegPrice, s.policy.pricing.priceCeiling, threshold);
        if (!check) return check;
        s.policy.pricing.premiumThreshold = threshold;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetPremiumPercent(const CallContext& ctx, uint64_t percent) {
    return Govern(ctx, "setPremiumPercent", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckPremiumPercent(percent);
        if (!check) return check;
        s.policy.pricing.premiumPercent = percent;
        return CallResult::Ok();
    });
}

CallResult Treasury::SetMintingFactorForPayingDebt(const CallContext& ctx, uint64_t factor) {
    return Govern(ctx, "setMintingFactorForPayingDebt", [&](TreasuryState& s, Events&) {
        auto check = economics::bounds::CheckMintingFactor(factor);
        if (!check) return check;
        s.policy.expansion.mintingFactorForPayingDebt = factor;
        return CallResult::Ok();
    });
}

CallResult Treasury::AddExcludedAddress(const CallContext& ctx, const Address& account) {
    return Govern(ctx, "addExcludedAddress", [&](TreasuryState& s, Events&) {
        if (account.IsNull()) {
            return CallResult::Fail(CallError::InvalidArgument, "null address");
        }
        s.excludedFromTotalSupply.push_back(account);
        return CallResult::Ok();
    });
}

CallResult Treasury::GovernanceRecoverUnsupported(const CallContext& ctx,
                                                  asset::IBasisAsset* token,
                                                  const Amount& amount, const Address& to) {
    return Govern(ctx, "governanceRecoverUnsupported", [&](TreasuryState& s, Events&) {
        if (!token || to.IsNull()) {
            return CallResult::Fail(CallError::InvalidArgument, "missing token or recipient");
        }
        const Address tokenAddress = token->GetAddress();
        if (tokenAddress == s.pegged->GetAddress() || tokenAddress == s.bond->GetAddress() ||
            tokenAddress == s.share->GetAddress()) {
            return CallResult::Fail(CallError::ProtectedToken, "protected token");
        }
        if (!token->Transfer(self_, to, amount)) {
            return CallResult::Fail(CallError::InsufficientBalance, "recover transfer failed");
        }
        return CallResult::Ok();
    }, {AsJournaled(token)});
}

// ============================================================================
// Reward Sink Pass-Through
// ============================================================================

CallResult Treasury::RewardSinkSetOperator(const CallContext& ctx, const Address& newOperator) {
    return Govern(ctx, "rewardSinkSetOperator", [&](TreasuryState& s, Events&) {
        if (!s.rewardSink->SetOperator(self_, newOperator)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "reward sink refused operator");
        }
        return CallResult::Ok();
    });
}

CallResult Treasury::RewardSinkSetLockUp(const CallContext& ctx, uint64_t withdrawLockupEpochs,
                                         uint64_t rewardLockupEpochs) {
    return Govern(ctx, "rewardSinkSetLockUp", [&](TreasuryState& s, Events&) {
        if (!s.rewardSink->SetLockUp(self_, withdrawLockupEpochs, rewardLockupEpochs)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "reward sink refused lock-up");
        }
        return CallResult::Ok();
    });
}

CallResult Treasury::RewardSinkAllocateSeigniorage(const CallContext& ctx, const Amount& amount) {
    return Govern(ctx, "rewardSinkAllocateSeigniorage", [&](TreasuryState& s, Events&) {
        const Address sink = s.rewardSink->GetAddress();
        if (!s.pegged->Approve(self_, sink, amount) ||
            !s.rewardSink->AllocateSeigniorage(self_, amount)) {
            return CallResult::Fail(CallError::CollaboratorFailure,
                                    "reward sink allocation failed");
        }
        return CallResult::Ok();
    });
}

CallResult Treasury::RewardSinkGovernanceRecoverUnsupported(const CallContext& ctx,
                                                            const Address& token,
                                                            const Amount& amount,
                                                            const Address& to) {
    return Govern(ctx, "rewardSinkGovernanceRecoverUnsupported", [&](TreasuryState& s, Events&) {
        if (!s.rewardSink->GovernanceRecoverUnsupported(self_, token, amount, to)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "reward sink refused recovery");
        }
        return CallResult::Ok();
    });
}

// ============================================================================
// Views
// ============================================================================

bool Treasury::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.initialized;
}

Address Treasury::Operator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.operatorAddress;
}

uint64_t Treasury::Epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.epochs.Epoch();
}

Timestamp Treasury::NextEpochPoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.epochs.NextEpochPoint();
}

Amount Treasury::GetReserve() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.seigniorageSaved;
}

Amount Treasury::EpochSupplyContractionLeft() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.epochs.ContractionLeft();
}

Amount Treasury::PreviousEpochPrice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.previousEpochPrice;
}

std::vector<Address> Treasury::ExcludedAddresses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.excludedFromTotalSupply;
}

economics::MonetaryPolicy Treasury::Policy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.policy;
}

Address Treasury::DaoFund() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.daoFund;
}

Address Treasury::DevFund() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.devFund;
}

TreasuryState Treasury::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Amount> Treasury::CirculatingSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.pegged) {
        return std::nullopt;
    }
    try {
        return CirculatingSupplyOf(state_);
    } catch (const std::range_error& e) {
        LOG_DEBUG(util::LogCategory::TREASURY) << "circulating supply underflow: " << e.what();
        return std::nullopt;
    }
}

std::optional<Amount> Treasury::GetPrice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.oracle.GetPrice();
}

std::optional<Amount> Treasury::GetUpdatedPrice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.oracle.GetUpdatedPrice();
}

std::optional<Amount> Treasury::DiscountRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto price = state_.oracle.GetPrice();
    if (!price) {
        return std::nullopt;
    }
    return BondPricingEngine::DiscountRate(state_.policy.pricing, *price);
}

std::optional<Amount> Treasury::PremiumRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto price = state_.oracle.GetPrice();
    if (!price) {
        return std::nullopt;
    }
    return BondPricingEngine::PremiumRate(state_.policy.pricing, *price);
}

std::optional<Amount> Treasury::GetBurnableLeft() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto price = state_.oracle.GetPrice();
    if (!price || !state_.initialized) {
        return std::nullopt;
    }
    if (*price > state_.policy.pricing.pegPrice) {
        return Amount(0);
    }
    try {
        Amount supply = CirculatingSupplyOf(state_);
        Amount bondMaxSupply = fixedpoint::ApplyBps(supply, state_.policy.maxDebtRatioPercent);
        Amount bondSupply = state_.bond->TotalSupply();
        if (bondMaxSupply <= bondSupply) {
            return Amount(0);
        }
        Amount maxBurnable = fixedpoint::WadMul(bondMaxSupply - bondSupply, *price);
        return fixedpoint::Min(state_.epochs.ContractionLeft(), maxBurnable);
    } catch (const std::range_error& e) {
        LOG_DEBUG(util::LogCategory::TREASURY) << "burnable left unavailable: " << e.what();
        return std::nullopt;
    }
}

std::optional<Amount> Treasury::GetRedeemableBonds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto price = state_.oracle.GetPrice();
    if (!price || !state_.initialized) {
        return std::nullopt;
    }
    if (*price <= state_.policy.pricing.priceCeiling) {
        return Amount(0);
    }
    Amount rate = BondPricingEngine::PremiumRate(state_.policy.pricing, *price);
    if (rate.is_zero()) {
        return Amount(0);
    }
    return fixedpoint::WadDiv(state_.pegged->BalanceOf(self_), rate);
}

} // namespace treasury
} // namespace polymint
