// POLYMINT - Reward Pool Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/rewards/reward_pool.h"
#include "polymint/core/fixedpoint.h"
#include "polymint/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace polymint {
namespace rewards {

using fixedpoint::FormatAmount;

// ============================================================================
// EmissionSchedule
// ============================================================================

EmissionSchedule EmissionSchedule::Default(Timestamp startTime) {
    auto schedule = Create(startTime,
                           {fixedpoint::ToWad(80000), fixedpoint::ToWad(60000)},
                           {4 * DAYS, 5 * DAYS});
    return *schedule;
}

std::optional<EmissionSchedule> EmissionSchedule::Create(Timestamp startTime,
                                                         const std::vector<Amount>& totals,
                                                         const std::vector<Timestamp>& durations) {
    if (totals.empty() || totals.size() != durations.size()) {
        return std::nullopt;
    }
    std::vector<Timestamp> endTimes;
    std::vector<Amount> rates;
    Timestamp end = startTime;
    for (size_t i = 0; i < totals.size(); ++i) {
        if (durations[i] <= 0) {
            return std::nullopt;
        }
        end += durations[i];
        endTimes.push_back(end);
        rates.push_back(totals[i] / Amount(durations[i]));
    }
    return EmissionSchedule(startTime, std::move(endTimes), std::move(rates));
}

Amount EmissionSchedule::GeneratedReward(Timestamp from, Timestamp to) const {
    Amount total = 0;
    if (to <= from) {
        return total;
    }
    Timestamp segmentStart = startTime_;
    for (size_t i = 0; i < endTimes_.size(); ++i) {
        Timestamp lo = std::max(from, segmentStart);
        Timestamp hi = std::min(to, endTimes_[i]);
        if (hi > lo) {
            total += rates_[i] * Amount(hi - lo);
        }
        segmentStart = endTimes_[i];
        if (segmentStart >= to) {
            break;
        }
    }
    return total;
}

Amount EmissionSchedule::RateAt(Timestamp t) const {
    if (t < startTime_) {
        return 0;
    }
    for (size_t i = 0; i < endTimes_.size(); ++i) {
        if (t < endTimes_[i]) {
            return rates_[i];
        }
    }
    return 0;
}

// ============================================================================
// Construction
// ============================================================================

RewardPool::RewardPool(const Address& self, asset::IBasisAsset* rewardToken, const Address& op,
                       EmissionSchedule schedule)
    : self_(self), rewardToken_(rewardToken), schedule_(std::move(schedule)) {
    state_.operatorAddress = op;
}

CallResult RewardPool::Execute(const CallContext& ctx, const char* name, const Body& body,
                               IJournaled* extra) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<IJournaled*> participants;
    participants.push_back(dynamic_cast<IJournaled*>(rewardToken_));
    for (const auto& pool : state_.pools) {
        participants.push_back(dynamic_cast<IJournaled*>(pool.token));
    }
    participants.push_back(extra);

    RewardPoolState next = state_;
    JournalScope journal(participants);
    CallResult result;
    try {
        result = body(next);
    } catch (const std::overflow_error& e) {
        result = CallResult::Fail(CallError::ArithmeticFault, e.what());
    } catch (const std::range_error& e) {
        result = CallResult::Fail(CallError::ArithmeticFault, e.what());
    }

    if (!result) {
        LOG_DEBUG(util::LogCategory::REWARDS) << name << " by " << ctx.caller.ToShortString()
                                              << " rejected: " << result.reason;
        return result;
    }
    journal.Commit();
    state_ = std::move(next);
    return result;
}

CallResult RewardPool::RequireOperator(const RewardPoolState& s, const CallContext& ctx) const {
    if (ctx.caller != s.operatorAddress) {
        return CallResult::Fail(CallError::Unauthorized, "caller is not the operator");
    }
    return CallResult::Ok();
}

// ============================================================================
// Accrual
// ============================================================================

Amount RewardPool::Settled(const UserInfo& user, const Amount& acc) {
    return fixedpoint::WadMul(user.amount, acc);
}

Amount RewardPool::ProjectedAccumulator(const RewardPoolState& s, const PoolInfo& pool,
                                        Timestamp now) const {
    Amount acc = pool.accRewardPerShare;
    Amount tokenSupply = pool.token->BalanceOf(self_);
    if (now <= pool.lastRewardTime || tokenSupply.is_zero()) {
        return acc;
    }
    uint64_t totalAlloc = s.totalAllocPoint;
    if (!pool.isStarted) {
        totalAlloc += pool.allocPoint;
    }
    if (totalAlloc == 0) {
        return acc;
    }
    Amount generated = schedule_.GeneratedReward(pool.lastRewardTime, now);
    Amount poolReward = fixedpoint::MulDiv(generated, pool.allocPoint, totalAlloc);
    return acc + fixedpoint::WadDiv(poolReward, tokenSupply);
}

void RewardPool::UpdatePoolIn(RewardPoolState& s, size_t pid, Timestamp now) const {
    PoolInfo& pool = s.pools[pid];
    if (now <= pool.lastRewardTime) {
        return;
    }
    Amount tokenSupply = pool.token->BalanceOf(self_);
    if (tokenSupply.is_zero()) {
        pool.lastRewardTime = now;
        return;
    }
    if (!pool.isStarted) {
        pool.isStarted = true;
        s.totalAllocPoint += pool.allocPoint;
    }
    if (s.totalAllocPoint > 0) {
        Amount generated = schedule_.GeneratedReward(pool.lastRewardTime, now);
        Amount poolReward = fixedpoint::MulDiv(generated, pool.allocPoint, s.totalAllocPoint);
        pool.accRewardPerShare += fixedpoint::WadDiv(poolReward, tokenSupply);
    }
    pool.lastRewardTime = now;
}

void RewardPool::MassUpdateIn(RewardPoolState& s, Timestamp now) const {
    for (size_t pid = 0; pid < s.pools.size(); ++pid) {
        UpdatePoolIn(s, pid, now);
    }
}

CallResult RewardPool::UpdatePool(const CallContext& ctx, size_t pid) {
    return Execute(ctx, "updatePool", [&](RewardPoolState& s) {
        if (pid >= s.pools.size()) {
            return CallResult::Fail(CallError::UnknownPool, "unknown pool");
        }
        UpdatePoolIn(s, pid, ctx.timestamp);
        return CallResult::Ok();
    });
}

CallResult RewardPool::MassUpdatePools(const CallContext& ctx) {
    return Execute(ctx, "massUpdatePools", [&](RewardPoolState& s) {
        MassUpdateIn(s, ctx.timestamp);
        return CallResult::Ok();
    });
}

Amount RewardPool::SafeRewardTransfer(const Address& to, const Amount& amount) {
    Amount balance = rewardToken_->BalanceOf(self_);
    Amount paid = fixedpoint::Min(amount, balance);
    if (paid.is_zero()) {
        return paid;
    }
    if (!rewardToken_->Transfer(self_, to, paid)) {
        LOG_WARN(util::LogCategory::REWARDS) << "reward transfer of " << FormatAmount(paid)
                                             << " refused";
        return 0;
    }
    return paid;
}

// ============================================================================
// Operator
// ============================================================================

CallResult RewardPool::Add(const CallContext& ctx, uint64_t allocPoint, asset::IBasisAsset* token,
                           bool withUpdate, Timestamp lastRewardTime) {
    return Execute(ctx, "add", [&](RewardPoolState& s) {
        auto auth = RequireOperator(s, ctx);
        if (!auth) return auth;
        if (!token) {
            return CallResult::Fail(CallError::InvalidArgument, "null token");
        }
        for (const auto& pool : s.pools) {
            if (pool.token->GetAddress() == token->GetAddress()) {
                return CallResult::Fail(CallError::DuplicatePool, "existing pool");
            }
        }
        if (withUpdate) {
            MassUpdateIn(s, ctx.timestamp);
        }

        const Timestamp now = ctx.timestamp;
        const Timestamp start = schedule_.StartTime();
        if (now < start) {
            if (lastRewardTime == 0 || lastRewardTime < start) {
                lastRewardTime = start;
            }
        } else if (lastRewardTime == 0 || lastRewardTime < now) {
            lastRewardTime = now;
        }

        PoolInfo pool;
        pool.token = token;
        pool.allocPoint = allocPoint;
        pool.lastRewardTime = lastRewardTime;
        pool.isStarted = lastRewardTime <= start || lastRewardTime <= now;
        if (pool.isStarted) {
            s.totalAllocPoint += allocPoint;
        }
        s.pools.push_back(pool);

        LOG_INFO(util::LogCategory::REWARDS)
            << "pool " << (s.pools.size() - 1) << " added for " << token->Symbol()
            << " alloc " << allocPoint << (pool.isStarted ? " (started)" : " (pending)");
        return CallResult::Ok();
    });
}

CallResult RewardPool::Set(const CallContext& ctx, size_t pid, uint64_t allocPoint) {
    return Execute(ctx, "set", [&](RewardPoolState& s) {
        auto auth = RequireOperator(s, ctx);
        if (!auth) return auth;
        if (pid >= s.pools.size()) {
            return CallResult::Fail(CallError::UnknownPool, "unknown pool");
        }
        MassUpdateIn(s, ctx.timestamp);
        PoolInfo& pool = s.pools[pid];
        if (pool.isStarted) {
            if (s.totalAllocPoint < pool.allocPoint) {
                return CallResult::Fail(CallError::ArithmeticFault,
                                        "total alloc point below pool alloc point");
            }
            s.totalAllocPoint = s.totalAllocPoint - pool.allocPoint + allocPoint;
        }
        pool.allocPoint = allocPoint;
        LOG_INFO(util::LogCategory::REWARDS) << "pool " << pid << " alloc set to " << allocPoint;
        return CallResult::Ok();
    });
}

CallResult RewardPool::SetOperator(const CallContext& ctx, const Address& newOperator) {
    return Execute(ctx, "setOperator", [&](RewardPoolState& s) {
        auto auth = RequireOperator(s, ctx);
        if (!auth) return auth;
        if (newOperator.IsNull()) {
            return CallResult::Fail(CallError::InvalidArgument, "null operator");
        }
        s.operatorAddress = newOperator;
        return CallResult::Ok();
    });
}

CallResult RewardPool::GovernanceRecoverUnsupported(const CallContext& ctx,
                                                    asset::IBasisAsset* token,
                                                    const Amount& amount, const Address& to) {
    return Execute(ctx, "governanceRecoverUnsupported", [&](RewardPoolState& s) {
        auto auth = RequireOperator(s, ctx);
        if (!auth) return auth;
        if (!token || to.IsNull()) {
            return CallResult::Fail(CallError::InvalidArgument, "missing token or recipient");
        }
        if (ctx.timestamp < schedule_.LastEpochEnd() + RECOVERY_LOCK_PERIOD) {
            if (token->GetAddress() == rewardToken_->GetAddress()) {
                return CallResult::Fail(CallError::ProtectedToken, "reward token");
            }
            for (const auto& pool : s.pools) {
                if (pool.token->GetAddress() == token->GetAddress()) {
                    return CallResult::Fail(CallError::ProtectedToken, "pool token");
                }
            }
        }
        if (!token->Transfer(self_, to, amount)) {
            return CallResult::Fail(CallError::InsufficientBalance, "recover transfer failed");
        }
        return CallResult::Ok();
    }, dynamic_cast<IJournaled*>(token));
}

// ============================================================================
// Staking
// ============================================================================

CallResult RewardPool::Deposit(const CallContext& ctx, size_t pid, const Amount& amount) {
    return Execute(ctx, "deposit", [&](RewardPoolState& s) {
        if (pid >= s.pools.size()) {
            return CallResult::Fail(CallError::UnknownPool, "unknown pool");
        }
        UpdatePoolIn(s, pid, ctx.timestamp);
        PoolInfo& pool = s.pools[pid];
        UserInfo& user = s.users[{pid, ctx.caller}];

        if (user.amount > 0) {
            Amount pending = Settled(user, pool.accRewardPerShare) - user.rewardDebt;
            if (pending > 0) {
                Amount paid = SafeRewardTransfer(ctx.caller, pending);
                LOG_INFO(util::LogCategory::REWARDS) << ctx.caller.ToShortString() << " paid "
                                                     << FormatAmount(paid) << " from pool " << pid;
            }
        }
        if (amount > 0) {
            if (!pool.token->TransferFrom(self_, ctx.caller, self_, amount)) {
                return CallResult::Fail(CallError::InsufficientBalance, "stake transfer failed");
            }
            user.amount += amount;
        }
        user.rewardDebt = Settled(user, pool.accRewardPerShare);

        LOG_INFO(util::LogCategory::REWARDS) << ctx.caller.ToShortString() << " deposited "
                                             << FormatAmount(amount) << " into pool " << pid;
        return CallResult::Ok();
    });
}

CallResult RewardPool::Withdraw(const CallContext& ctx, size_t pid, const Amount& amount) {
    return Execute(ctx, "withdraw", [&](RewardPoolState& s) {
        if (pid >= s.pools.size()) {
            return CallResult::Fail(CallError::UnknownPool, "unknown pool");
        }
        UserInfo& user = s.users[{pid, ctx.caller}];
        if (user.amount < amount) {
            return CallResult::Fail(CallError::InsufficientBalance, "withdraw exceeds stake");
        }
        UpdatePoolIn(s, pid, ctx.timestamp);
        PoolInfo& pool = s.pools[pid];

        Amount pending = Settled(user, pool.accRewardPerShare) - user.rewardDebt;
        if (pending > 0) {
            Amount paid = SafeRewardTransfer(ctx.caller, pending);
            LOG_INFO(util::LogCategory::REWARDS) << ctx.caller.ToShortString() << " paid "
                                                 << FormatAmount(paid) << " from pool " << pid;
        }
        if (amount > 0) {
            user.amount -= amount;
            if (!pool.token->Transfer(self_, ctx.caller, amount)) {
                return CallResult::Fail(CallError::CollaboratorFailure, "unstake transfer failed");
            }
        }
        user.rewardDebt = Settled(user, pool.accRewardPerShare);

        LOG_INFO(util::LogCategory::REWARDS) << ctx.caller.ToShortString() << " withdrew "
                                             << FormatAmount(amount) << " from pool " << pid;
        return CallResult::Ok();
    });
}

CallResult RewardPool::EmergencyWithdraw(const CallContext& ctx, size_t pid) {
    return Execute(ctx, "emergencyWithdraw", [&](RewardPoolState& s) {
        if (pid >= s.pools.size()) {
            return CallResult::Fail(CallError::UnknownPool, "unknown pool");
        }
        UserInfo& user = s.users[{pid, ctx.caller}];
        Amount principal = user.amount;
        user.amount = 0;
        user.rewardDebt = 0;
        if (principal > 0 && !s.pools[pid].token->Transfer(self_, ctx.caller, principal)) {
            return CallResult::Fail(CallError::CollaboratorFailure, "unstake transfer failed");
        }
        LOG_INFO(util::LogCategory::REWARDS) << ctx.caller.ToShortString()
                                             << " emergency-withdrew " << FormatAmount(principal)
                                             << " from pool " << pid;
        return CallResult::Ok();
    });
}

// ============================================================================
// Views
// ============================================================================

std::optional<Amount> RewardPool::PendingReward(size_t pid, const Address& user,
                                                Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid >= state_.pools.size()) {
        return std::nullopt;
    }
    auto it = state_.users.find({pid, user});
    if (it == state_.users.end()) {
        return Amount(0);
    }
    Amount acc = ProjectedAccumulator(state_, state_.pools[pid], now);
    return Settled(it->second, acc) - it->second.rewardDebt;
}

size_t RewardPool::PoolCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.pools.size();
}

std::optional<PoolInfo> RewardPool::GetPool(size_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid >= state_.pools.size()) {
        return std::nullopt;
    }
    return state_.pools[pid];
}

UserInfo RewardPool::GetUser(size_t pid, const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.users.find({pid, user});
    return it == state_.users.end() ? UserInfo() : it->second;
}

uint64_t RewardPool::TotalAllocPoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.totalAllocPoint;
}

Address RewardPool::Operator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.operatorAddress;
}

} // namespace rewards
} // namespace polymint
