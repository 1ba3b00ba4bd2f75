// POLYMINT - Reward Pool
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Staking pools sharing a time-based emission of the reward token.
// Rewards accrue lazily through a per-pool accumulator
// (accRewardPerShare, scaled by 1e18); each user's rewardDebt marks the
// part of the accumulator already settled.

#ifndef POLYMINT_REWARDS_REWARD_POOL_H
#define POLYMINT_REWARDS_REWARD_POOL_H

#include <polymint/asset/asset.h>
#include <polymint/core/journal.h>
#include <polymint/core/result.h>
#include <polymint/core/types.h>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace polymint {
namespace rewards {

// ============================================================================
// Emission Schedule
// ============================================================================

/// Days after the last emission epoch during which staked tokens stay protected
constexpr Timestamp RECOVERY_LOCK_PERIOD = 30 * DAYS;

/**
 * Piecewise-constant emission rate.
 *
 * Segment i runs until endTimes[i] at rates[i] tokens per second
 * (total / duration, floored); emission starts at startTime and stops
 * after the last end time.
 */
class EmissionSchedule {
public:
    /// Two epochs: 80,000 tokens over 4 days, then 60,000 over 5 days
    static EmissionSchedule Default(Timestamp startTime);

    /// nullopt if the lists are empty, differ in length or a duration is not positive
    static std::optional<EmissionSchedule> Create(Timestamp startTime,
                                                  const std::vector<Amount>& totals,
                                                  const std::vector<Timestamp>& durations);

    /// Tokens emitted over [from, to); zero when to <= from
    Amount GeneratedReward(Timestamp from, Timestamp to) const;

    /// Emission rate in effect at time t
    Amount RateAt(Timestamp t) const;

    Timestamp StartTime() const { return startTime_; }
    Timestamp LastEpochEnd() const { return endTimes_.back(); }
    const std::vector<Timestamp>& EndTimes() const { return endTimes_; }
    const std::vector<Amount>& Rates() const { return rates_; }

private:
    EmissionSchedule(Timestamp startTime, std::vector<Timestamp> endTimes,
                     std::vector<Amount> rates)
        : startTime_(startTime), endTimes_(std::move(endTimes)), rates_(std::move(rates)) {}

    Timestamp startTime_;
    std::vector<Timestamp> endTimes_;
    std::vector<Amount> rates_;
};

// ============================================================================
// Pool Records
// ============================================================================

struct PoolInfo {
    /// Staked token (not owned)
    asset::IBasisAsset* token{nullptr};
    uint64_t allocPoint{0};
    Timestamp lastRewardTime{0};
    Amount accRewardPerShare{0};
    bool isStarted{false};
};

struct UserInfo {
    Amount amount{0};
    Amount rewardDebt{0};
};

struct RewardPoolState {
    Address operatorAddress;
    std::vector<PoolInfo> pools;
    std::map<std::pair<size_t, Address>, UserInfo> users;
    /// Sum of allocPoint over started pools
    uint64_t totalAllocPoint{0};
};

// ============================================================================
// Reward Pool
// ============================================================================

class RewardPool {
public:
    RewardPool(const Address& self, asset::IBasisAsset* rewardToken, const Address& op,
               EmissionSchedule schedule);

    RewardPool(const RewardPool&) = delete;
    RewardPool& operator=(const RewardPool&) = delete;

    // ========================================================================
    // Operator
    // ========================================================================

    /**
     * Register a staking token.
     *
     * lastRewardTime is moved up to the pool start (before start) or to
     * now (after start). A pool whose lastRewardTime is still in the
     * future does not count toward totalAllocPoint until it starts.
     */
    CallResult Add(const CallContext& ctx, uint64_t allocPoint, asset::IBasisAsset* token,
                   bool withUpdate, Timestamp lastRewardTime);

    /// Change a pool's weight after settling all pools
    CallResult Set(const CallContext& ctx, size_t pid, uint64_t allocPoint);

    CallResult SetOperator(const CallContext& ctx, const Address& newOperator);

    /// Move tokens held by the pool; reward and staked tokens are locked until
    /// 30 days after the last emission epoch
    CallResult GovernanceRecoverUnsupported(const CallContext& ctx, asset::IBasisAsset* token,
                                            const Amount& amount, const Address& to);

    // ========================================================================
    // Accrual
    // ========================================================================

    CallResult UpdatePool(const CallContext& ctx, size_t pid);
    CallResult MassUpdatePools(const CallContext& ctx);

    // ========================================================================
    // Staking
    // ========================================================================

    /// Settle pending reward, then stake amount (may be zero to just harvest)
    CallResult Deposit(const CallContext& ctx, size_t pid, const Amount& amount);

    /// Settle pending reward, then unstake amount
    CallResult Withdraw(const CallContext& ctx, size_t pid, const Amount& amount);

    /// Return the principal and forfeit pending reward
    CallResult EmergencyWithdraw(const CallContext& ctx, size_t pid);

    // ========================================================================
    // Views
    // ========================================================================

    /// Reward the user could harvest at now; nullopt for an unknown pool
    std::optional<Amount> PendingReward(size_t pid, const Address& user, Timestamp now) const;

    Amount GeneratedReward(Timestamp from, Timestamp to) const {
        return schedule_.GeneratedReward(from, to);
    }

    size_t PoolCount() const;
    std::optional<PoolInfo> GetPool(size_t pid) const;
    UserInfo GetUser(size_t pid, const Address& user) const;
    uint64_t TotalAllocPoint() const;
    Address Operator() const;
    Address GetAddress() const { return self_; }
    const EmissionSchedule& Schedule() const { return schedule_; }

private:
    using Body = std::function<CallResult(RewardPoolState&)>;

    CallResult Execute(const CallContext& ctx, const char* name, const Body& body,
                       IJournaled* extra = nullptr);

    CallResult RequireOperator(const RewardPoolState& s, const CallContext& ctx) const;

    /// Accumulator after accruing up to now, without mutating
    Amount ProjectedAccumulator(const RewardPoolState& s, const PoolInfo& pool,
                                Timestamp now) const;

    void UpdatePoolIn(RewardPoolState& s, size_t pid, Timestamp now) const;
    void MassUpdateIn(RewardPoolState& s, Timestamp now) const;

    /// Pay min(amount, reward balance); returns the amount paid
    Amount SafeRewardTransfer(const Address& to, const Amount& amount);

    static Amount Settled(const UserInfo& user, const Amount& acc);

    Address self_;
    asset::IBasisAsset* rewardToken_;
    EmissionSchedule schedule_;
    RewardPoolState state_;
    mutable std::mutex mutex_;
};

} // namespace rewards
} // namespace polymint

#endif // POLYMINT_REWARDS_REWARD_POOL_H
