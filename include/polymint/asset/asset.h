// POLYMINT - Basis Asset Capability
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Mint/burn/balance capability of the pegged, bond and share tokens, and
// an in-memory ledger implementing it.
//
// Mutators take the acting account explicitly and return false when the
// call is rejected; a rejected call has no effect.

#ifndef POLYMINT_ASSET_ASSET_H
#define POLYMINT_ASSET_ASSET_H

#include <polymint/core/journal.h>
#include <polymint/core/types.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace polymint {
namespace asset {

// ============================================================================
// Basis Asset Interface
// ============================================================================

class IBasisAsset {
public:
    virtual ~IBasisAsset() = default;

    /// Token contract address
    virtual Address GetAddress() const = 0;

    /// Ticker symbol
    virtual std::string Symbol() const = 0;

    virtual Amount TotalSupply() const = 0;
    virtual Amount BalanceOf(const Address& account) const = 0;
    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;

    /// Account allowed to mint and burn
    virtual Address Operator() const = 0;

    /// Operator-only: create amount for `to`
    virtual bool Mint(const Address& caller, const Address& to, const Amount& amount) = 0;

    /// Operator-only: destroy amount held by `from` (needs allowance unless from == caller)
    virtual bool BurnFrom(const Address& caller, const Address& from, const Amount& amount) = 0;

    virtual bool Transfer(const Address& caller, const Address& to, const Amount& amount) = 0;
    virtual bool Approve(const Address& owner, const Address& spender, const Amount& amount) = 0;
    virtual bool TransferFrom(const Address& spender, const Address& from,
                              const Address& to, const Amount& amount) = 0;

    /// Operator-only: hand the operator role to another account
    virtual bool TransferOperator(const Address& caller, const Address& newOperator) = 0;
};

// ============================================================================
// In-Memory Asset
// ============================================================================

/**
 * Ledger-backed token used by simulations and tests.
 *
 * Supports nested checkpoints so it can take part in a JournalScope.
 */
class BasicAsset : public IBasisAsset, public IJournaled {
public:
    BasicAsset(const Address& address, std::string symbol, const Address& op);

    Address GetAddress() const override { return address_; }
    std::string Symbol() const override { return symbol_; }

    Amount TotalSupply() const override { return state_.totalSupply; }
    Amount BalanceOf(const Address& account) const override;
    Amount Allowance(const Address& owner, const Address& spender) const override;
    Address Operator() const override { return state_.op; }

    bool Mint(const Address& caller, const Address& to, const Amount& amount) override;
    bool BurnFrom(const Address& caller, const Address& from, const Amount& amount) override;
    bool Transfer(const Address& caller, const Address& to, const Amount& amount) override;
    bool Approve(const Address& owner, const Address& spender, const Amount& amount) override;
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, const Amount& amount) override;
    bool TransferOperator(const Address& caller, const Address& newOperator) override;

    /// Self-burn by the holder
    bool Burn(const Address& holder, const Amount& amount);

    // IJournaled
    void Checkpoint() override;
    void Rollback() override;
    void Release() override;

    /// Number of open checkpoints
    size_t CheckpointDepth() const { return checkpoints_.size(); }

    /// Number of accounts with a non-zero balance
    size_t HolderCount() const { return state_.balances.size(); }

private:
    struct State {
        Address op;
        Amount totalSupply{0};
        std::map<Address, Amount> balances;
        std::map<std::pair<Address, Address>, Amount> allowances;
    };

    /// Move amount between accounts; caller has validated the balance
    void Move(const Address& from, const Address& to, const Amount& amount);

    Address address_;
    std::string symbol_;
    State state_;
    std::vector<State> checkpoints_;
};

} // namespace asset
} // namespace polymint

#endif // POLYMINT_ASSET_ASSET_H
