// POLYMINT - Treasury Sinks
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Capabilities of the contracts that receive newly minted supply.

#ifndef POLYMINT_TREASURY_SINKS_H
#define POLYMINT_TREASURY_SINKS_H

#include <polymint/core/types.h>

#include <cstdint>

namespace polymint {
namespace treasury {

/**
 * Staking contract that distributes seigniorage to share holders.
 *
 * AllocateSeigniorage pulls amount of the pegged token from the caller,
 * which must have approved the sink beforehand. Mutators return false
 * when rejected.
 */
class IRewardSink {
public:
    virtual ~IRewardSink() = default;

    virtual Address GetAddress() const = 0;
    virtual Address Operator() const = 0;

    virtual bool AllocateSeigniorage(const Address& caller, const Amount& amount) = 0;
    virtual bool SetOperator(const Address& caller, const Address& newOperator) = 0;
    virtual bool SetLockUp(const Address& caller, uint64_t withdrawLockupEpochs,
                           uint64_t rewardLockupEpochs) = 0;
    virtual bool GovernanceRecoverUnsupported(const Address& caller, const Address& token,
                                              const Amount& amount, const Address& to) = 0;
};

/**
 * Vesting bond treasury topped up with pegged tokens every epoch.
 */
class IBondTreasury {
public:
    virtual ~IBondTreasury() = default;

    virtual Address GetAddress() const = 0;

    /// Pegged tokens already promised to vesting bonds
    virtual Amount TotalVested() const = 0;
};

} // namespace treasury
} // namespace polymint

#endif // POLYMINT_TREASURY_SINKS_H
