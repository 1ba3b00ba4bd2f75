// POLYMINT - Epoch Controller Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/treasury/epoch.h"
#include "polymint/core/fixedpoint.h"
#include "polymint/util/logging.h"

#include <string>

namespace polymint {
namespace treasury {

// ============================================================================
// EpochController
// ============================================================================

Timestamp EpochController::NextEpochPoint() const {
    return startTime_ + static_cast<Timestamp>(epoch_) * period_;
}

CallResult EpochController::CheckCondition(Timestamp now) const {
    if (now < startTime_) {
        return CallResult::Fail(CallError::NotStarted, "not started yet");
    }
    return CallResult::Ok();
}

CallResult EpochController::CheckEpoch(Timestamp now) const {
    if (now < NextEpochPoint()) {
        return CallResult::Fail(CallError::EpochNotOpened,
                                "epoch opens at " + std::to_string(NextEpochPoint()));
    }
    return CallResult::Ok();
}

void EpochController::CloseEpoch(const Amount& price, const Amount& priceCeiling,
                                 const Amount& circulatingSupply,
                                 uint64_t maxContractionPercent) {
    ++epoch_;
    if (price > priceCeiling) {
        contractionLeft_ = 0;
    } else {
        contractionLeft_ = fixedpoint::ApplyBps(circulatingSupply, maxContractionPercent);
    }
    LOG_DEBUG(util::LogCategory::EPOCH) << "epoch " << epoch_ << " contraction budget "
                                        << fixedpoint::FormatAmount(contractionLeft_);
}

CallResult EpochController::ConsumeContraction(const Amount& amount) {
    if (amount > contractionLeft_) {
        return CallResult::Fail(CallError::InsufficientBudget, "not enough bond left to purchase");
    }
    contractionLeft_ -= amount;
    return CallResult::Ok();
}

// ============================================================================
// BlockCallGuard
// ============================================================================

bool BlockCallGuard::HasEntered(BlockNumber block, const Address& account) const {
    auto o = origins_.find(block);
    if (o != origins_.end() && o->second.count(account)) {
        return true;
    }
    auto c = callers_.find(block);
    return c != callers_.end() && c->second.count(account) > 0;
}

CallResult BlockCallGuard::Check(const CallContext& ctx) const {
    auto o = origins_.find(ctx.blockNumber);
    if (o != origins_.end() && o->second.count(ctx.origin)) {
        return CallResult::Fail(CallError::SameBlockReentry, "one block, one function");
    }
    auto c = callers_.find(ctx.blockNumber);
    if (c != callers_.end() && c->second.count(ctx.caller)) {
        return CallResult::Fail(CallError::SameBlockReentry, "one block, one function");
    }
    return CallResult::Ok();
}

CallResult BlockCallGuard::Enter(const CallContext& ctx) {
    auto result = Check(ctx);
    if (!result) {
        return result;
    }
    Prune(ctx.blockNumber);
    origins_[ctx.blockNumber].insert(ctx.origin);
    callers_[ctx.blockNumber].insert(ctx.caller);
    return CallResult::Ok();
}

void BlockCallGuard::Prune(BlockNumber current) {
    origins_.erase(origins_.begin(), origins_.lower_bound(current));
    callers_.erase(callers_.begin(), callers_.lower_bound(current));
}

} // namespace treasury
} // namespace polymint
