// POLYMINT - In-Memory Asset Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/asset/asset.h"
#include "polymint/core/fixedpoint.h"
#include "polymint/util/logging.h"

namespace polymint {
namespace asset {

BasicAsset::BasicAsset(const Address& address, std::string symbol, const Address& op)
    : address_(address), symbol_(std::move(symbol)) {
    state_.op = op;
}

Amount BasicAsset::BalanceOf(const Address& account) const {
    auto it = state_.balances.find(account);
    return it == state_.balances.end() ? Amount(0) : it->second;
}

Amount BasicAsset::Allowance(const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it == state_.allowances.end() ? Amount(0) : it->second;
}

// ============================================================================
// Supply Changes
// ============================================================================

bool BasicAsset::Mint(const Address& caller, const Address& to, const Amount& amount) {
    if (caller != state_.op) {
        LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << ": mint by non-operator "
                                            << caller.ToShortString();
        return false;
    }
    if (to.IsNull() || !fixedpoint::CanAdd(state_.totalSupply, amount)) {
        return false;
    }
    if (amount.is_zero()) {
        return true;
    }
    state_.totalSupply += amount;
    state_.balances[to] += amount;
    return true;
}

bool BasicAsset::BurnFrom(const Address& caller, const Address& from, const Amount& amount) {
    if (caller != state_.op) {
        LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << ": burnFrom by non-operator "
                                            << caller.ToShortString();
        return false;
    }
    if (BalanceOf(from) < amount) {
        return false;
    }
    if (from != caller) {
        Amount allowed = Allowance(from, caller);
        if (allowed < amount) {
            return false;
        }
        state_.allowances[{from, caller}] = allowed - amount;
    }
    return Burn(from, amount);
}

bool BasicAsset::Burn(const Address& holder, const Amount& amount) {
    Amount balance = BalanceOf(holder);
    if (balance < amount) {
        return false;
    }
    if (amount.is_zero()) {
        return true;
    }
    if (balance == amount) {
        state_.balances.erase(holder);
    } else {
        state_.balances[holder] = balance - amount;
    }
    state_.totalSupply -= amount;
    return true;
}

// ============================================================================
// Transfers
// ============================================================================

void BasicAsset::Move(const Address& from, const Address& to, const Amount& amount) {
    if (amount.is_zero() || from == to) {
        return;
    }
    Amount balance = BalanceOf(from);
    if (balance == amount) {
        state_.balances.erase(from);
    } else {
        state_.balances[from] = balance - amount;
    }
    state_.balances[to] += amount;
}

bool BasicAsset::Transfer(const Address& caller, const Address& to, const Amount& amount) {
    if (to.IsNull() || BalanceOf(caller) < amount) {
        return false;
    }
    Move(caller, to, amount);
    return true;
}

bool BasicAsset::Approve(const Address& owner, const Address& spender, const Amount& amount) {
    if (spender.IsNull()) {
        return false;
    }
    if (amount.is_zero()) {
        state_.allowances.erase({owner, spender});
    } else {
        state_.allowances[{owner, spender}] = amount;
    }
    return true;
}

bool BasicAsset::TransferFrom(const Address& spender, const Address& from,
                              const Address& to, const Amount& amount) {
    if (to.IsNull() || BalanceOf(from) < amount) {
        return false;
    }
    Amount allowed = Allowance(from, spender);
    if (allowed < amount) {
        return false;
    }
    Approve(from, spender, allowed - amount);
    Move(from, to, amount);
    return true;
}

bool BasicAsset::TransferOperator(const Address& caller, const Address& newOperator) {
    if (caller != state_.op || newOperator.IsNull()) {
        return false;
    }
    state_.op = newOperator;
    LOG_INFO(util::LogCategory::ASSET) << symbol_ << ": operator transferred to "
                                       << newOperator.ToShortString();
    return true;
}

// ============================================================================
// Journal
// ============================================================================

void BasicAsset::Checkpoint() {
    checkpoints_.push_back(state_);
}

void BasicAsset::Rollback() {
    if (checkpoints_.empty()) {
        return;
    }
    state_ = std::move(checkpoints_.back());
    checkpoints_.pop_back();
}

void BasicAsset::Release() {
    if (!checkpoints_.empty()) {
        checkpoints_.pop_back();
    }
}

} // namespace asset
} // namespace polymint
