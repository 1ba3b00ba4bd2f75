// POLYMINT - Epoch Controller
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Time gating of treasury entry points: start-time and epoch-boundary
// guards, the per-epoch contraction budget, and the one-call-per-block
// guard.

#ifndef POLYMINT_TREASURY_EPOCH_H
#define POLYMINT_TREASURY_EPOCH_H

#include <polymint/core/result.h>
#include <polymint/core/types.h>

#include <map>
#include <set>

namespace polymint {
namespace treasury {

// ============================================================================
// Epoch Controller
// ============================================================================

/**
 * Epoch counter and contraction budget.
 *
 * nextEpochPoint = startTime + epoch * period. The epoch advances by one
 * per successful epoch-gated call, and the contraction budget is
 * recomputed at that moment.
 */
class EpochController {
public:
    EpochController() = default;
    EpochController(Timestamp startTime, Timestamp period)
        : startTime_(startTime), period_(period) {}

    /// Time at which the next epoch-gated call is allowed
    Timestamp NextEpochPoint() const;

    /// now >= startTime
    CallResult CheckCondition(Timestamp now) const;

    /// now >= NextEpochPoint()
    CallResult CheckEpoch(Timestamp now) const;

    /**
     * Close the current epoch: advance the counter and recompute the
     * contraction budget (0 above the ceiling, else a share of supply).
     */
    void CloseEpoch(const Amount& price, const Amount& priceCeiling,
                    const Amount& circulatingSupply, uint64_t maxContractionPercent);

    /// Spend contraction budget; fails without change if amount exceeds it
    CallResult ConsumeContraction(const Amount& amount);

    uint64_t Epoch() const { return epoch_; }
    Timestamp StartTime() const { return startTime_; }
    Timestamp Period() const { return period_; }
    const Amount& ContractionLeft() const { return contractionLeft_; }

private:
    Timestamp startTime_{0};
    Timestamp period_{6 * HOURS};
    uint64_t epoch_{0};
    Amount contractionLeft_{0};
};

// ============================================================================
// Block Call Guard
// ============================================================================

/**
 * Admits at most one mutating call per block for any origin and any
 * caller.
 *
 * Entries for blocks before the one being entered are dropped.
 */
class BlockCallGuard {
public:
    /// Check both keys without recording
    CallResult Check(const CallContext& ctx) const;

    /// Check and record the call
    CallResult Enter(const CallContext& ctx);

    /// Whether an entry for the account exists in the given block
    bool HasEntered(BlockNumber block, const Address& account) const;

private:
    void Prune(BlockNumber current);

    std::map<BlockNumber, std::set<Address>> origins_;
    std::map<BlockNumber, std::set<Address>> callers_;
};

} // namespace treasury
} // namespace polymint

#endif // POLYMINT_TREASURY_EPOCH_H
