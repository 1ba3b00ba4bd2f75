// POLYMINT - Price Oracle
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Oracle capability consumed by the treasury, the gateway that applies
// the hard-fail / best-effort policy to it, and an epoch-based TWAP
// oracle implementation.

#ifndef POLYMINT_ORACLE_ORACLE_H
#define POLYMINT_ORACLE_ORACLE_H

#include <polymint/core/journal.h>
#include <polymint/core/types.h>

#include <optional>
#include <vector>

namespace polymint {
namespace oracle {

// ============================================================================
// Oracle Capability
// ============================================================================

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    /// Price of amountIn of token at the last completed update
    virtual std::optional<Amount> Consult(const Address& token, const Amount& amountIn) const = 0;

    /// Time-weighted price of amountIn of token over the open window
    virtual std::optional<Amount> Twap(const Address& token, const Amount& amountIn) const = 0;

    /// Close the current window if due. Returns false when nothing was updated.
    virtual bool Update(Timestamp now) = 0;
};

// ============================================================================
// Oracle Gateway
// ============================================================================

/**
 * Applies the call-site policy for oracle access.
 *
 * Price reads return nullopt on failure and the caller aborts; a failed
 * refresh is swallowed.
 */
class OracleGateway {
public:
    OracleGateway() = default;
    OracleGateway(IPriceOracle* oracle, const Address& token)
        : oracle_(oracle), token_(token) {}

    /// Consult price of one unit of the pegged token
    std::optional<Amount> GetPrice() const;

    /// TWAP price of one unit of the pegged token
    std::optional<Amount> GetUpdatedPrice() const;

    /// Best-effort oracle update; returns whether the oracle accepted it
    bool RefreshPrice(Timestamp now);

    void SetOracle(IPriceOracle* oracle) { oracle_ = oracle; }
    IPriceOracle* GetOracle() const { return oracle_; }
    const Address& GetToken() const { return token_; }

private:
    IPriceOracle* oracle_{nullptr};
    Address token_;
};

// ============================================================================
// Epoch TWAP Oracle
// ============================================================================

/**
 * Time-weighted average price oracle that closes one window per period.
 *
 * Spot prices are fed with Observe(). Each spot price is weighted by the
 * time it was in effect. Update() is accepted once the next epoch point
 * is reached and freezes the window average as the consult price; late
 * updates skip the missed epochs.
 */
class EpochTwapOracle : public IPriceOracle, public IJournaled {
public:
    EpochTwapOracle(const Address& token, Timestamp period, Timestamp startTime,
                    const Amount& initialPrice);

    std::optional<Amount> Consult(const Address& token, const Amount& amountIn) const override;
    std::optional<Amount> Twap(const Address& token, const Amount& amountIn) const override;
    bool Update(Timestamp now) override;

    /// Record a spot price effective from ts. Out-of-order samples are rejected.
    bool Observe(const Amount& price, Timestamp ts);

    Timestamp NextEpochPoint() const { return state_.lastEpochTime + period_; }
    uint64_t Epoch() const { return state_.epoch; }
    const Amount& SpotPrice() const { return state_.spotPrice; }
    const Amount& AveragePrice() const { return state_.averagePrice; }

    // IJournaled
    void Checkpoint() override;
    void Rollback() override;
    void Release() override;

private:
    struct State {
        uint64_t epoch{0};
        Timestamp lastEpochTime{0};
        Amount spotPrice{0};
        Timestamp lastObservation{0};
        /// Sum of price * seconds since the window opened
        Amount cumulative{0};
        Timestamp windowStart{0};
        Amount averagePrice{0};
    };

    /// Carry the current spot price forward to ts
    void Accumulate(Timestamp ts);

    Address token_;
    Timestamp period_;
    State state_;
    std::vector<State> checkpoints_;
};

} // namespace oracle
} // namespace polymint

#endif // POLYMINT_ORACLE_ORACLE_H
