// POLYMINT - Price Oracle Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/oracle/oracle.h"
#include "polymint/core/fixedpoint.h"
#include "polymint/util/logging.h"

namespace polymint {
namespace oracle {

// ============================================================================
// OracleGateway
// ============================================================================

std::optional<Amount> OracleGateway::GetPrice() const {
    if (!oracle_) {
        return std::nullopt;
    }
    auto price = oracle_->Consult(token_, WAD);
    if (!price) {
        LOG_DEBUG(util::LogCategory::ORACLE) << "consult failed for " << token_.ToShortString();
    }
    return price;
}

std::optional<Amount> OracleGateway::GetUpdatedPrice() const {
    if (!oracle_) {
        return std::nullopt;
    }
    auto price = oracle_->Twap(token_, WAD);
    if (!price) {
        LOG_DEBUG(util::LogCategory::ORACLE) << "twap failed for " << token_.ToShortString();
    }
    return price;
}

bool OracleGateway::RefreshPrice(Timestamp now) {
    if (!oracle_) {
        return false;
    }
    if (!oracle_->Update(now)) {
        LOG_DEBUG(util::LogCategory::ORACLE) << "price refresh skipped at " << now;
        return false;
    }
    return true;
}

// ============================================================================
// EpochTwapOracle
// ============================================================================

EpochTwapOracle::EpochTwapOracle(const Address& token, Timestamp period, Timestamp startTime,
                                 const Amount& initialPrice)
    : token_(token), period_(period) {
    state_.lastEpochTime = startTime - period;
    state_.spotPrice = initialPrice;
    state_.averagePrice = initialPrice;
    state_.lastObservation = startTime;
    state_.windowStart = startTime;
}

void EpochTwapOracle::Accumulate(Timestamp ts) {
    if (ts <= state_.lastObservation) {
        return;
    }
    state_.cumulative += state_.spotPrice * Amount(ts - state_.lastObservation);
    state_.lastObservation = ts;
}

bool EpochTwapOracle::Observe(const Amount& price, Timestamp ts) {
    if (ts < state_.lastObservation || price.is_zero()) {
        return false;
    }
    Accumulate(ts);
    state_.spotPrice = price;
    return true;
}

std::optional<Amount> EpochTwapOracle::Consult(const Address& token, const Amount& amountIn) const {
    if (token != token_) {
        return std::nullopt;
    }
    return fixedpoint::WadMul(state_.averagePrice, amountIn);
}

std::optional<Amount> EpochTwapOracle::Twap(const Address& token, const Amount& amountIn) const {
    if (token != token_) {
        return std::nullopt;
    }
    Timestamp elapsed = state_.lastObservation - state_.windowStart;
    if (elapsed <= 0) {
        return fixedpoint::WadMul(state_.spotPrice, amountIn);
    }
    Amount average = state_.cumulative / Amount(elapsed);
    return fixedpoint::WadMul(average, amountIn);
}

bool EpochTwapOracle::Update(Timestamp now) {
    if (now < NextEpochPoint()) {
        return false;
    }
    Accumulate(now);

    Timestamp elapsed = state_.lastObservation - state_.windowStart;
    if (elapsed > 0) {
        state_.averagePrice = state_.cumulative / Amount(elapsed);
    } else {
        state_.averagePrice = state_.spotPrice;
    }
    state_.cumulative = 0;
    state_.windowStart = state_.lastObservation;

    // Catch up on missed epochs
    do {
        state_.lastEpochTime += period_;
        ++state_.epoch;
    } while (now >= NextEpochPoint());

    LOG_DEBUG(util::LogCategory::ORACLE) << "oracle epoch " << state_.epoch << " average "
                                         << fixedpoint::FormatAmount(state_.averagePrice);
    return true;
}

void EpochTwapOracle::Checkpoint() {
    checkpoints_.push_back(state_);
}

void EpochTwapOracle::Rollback() {
    if (checkpoints_.empty()) {
        return;
    }
    state_ = checkpoints_.back();
    checkpoints_.pop_back();
}

void EpochTwapOracle::Release() {
    if (!checkpoints_.empty()) {
        checkpoints_.pop_back();
    }
}

} // namespace oracle
} // namespace polymint
