// POLYMINT - Treasury
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Epoch-driven monetary policy for the pegged token:
// - Bond purchases below peg (supply contraction)
// - Bond redemptions above the ceiling
// - Per-epoch seigniorage allocation to the bond treasury, the reward
//   sink, the DAO/dev funds and the seigniorage reserve
// - Operator-gated governance of every policy parameter
//
// Every mutating call either commits completely or has no effect.

#ifndef POLYMINT_TREASURY_TREASURY_H
#define POLYMINT_TREASURY_TREASURY_H

#include <polymint/asset/asset.h>
#include <polymint/core/journal.h>
#include <polymint/core/result.h>
#include <polymint/core/types.h>
#include <polymint/economics/policy.h>
#include <polymint/oracle/oracle.h>
#include <polymint/treasury/epoch.h>
#include <polymint/treasury/sinks.h>

#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace polymint {
namespace treasury {

// ============================================================================
// Treasury Listener
// ============================================================================

/// Receives treasury events after the emitting call has committed
class ITreasuryListener {
public:
    virtual ~ITreasuryListener() = default;

    virtual void OnInitialized(const Address& executor, BlockNumber block) {}
    virtual void OnBoughtBonds(const Address& from, const Amount& peggedAmount,
                               const Amount& bondAmount) {}
    virtual void OnRedeemedBonds(const Address& from, const Amount& peggedAmount,
                                 const Amount& bondAmount) {}
    virtual void OnRewardSinkFunded(Timestamp time, const Amount& amount) {}
    virtual void OnTreasuryFunded(Timestamp time, const Amount& amount) {}
    virtual void OnDaoFundFunded(Timestamp time, const Amount& amount) {}
    virtual void OnDevFundFunded(Timestamp time, const Amount& amount) {}
    virtual void OnBondTreasuryFunded(Timestamp time, const Amount& amount) {}
};

// ============================================================================
// Treasury State
// ============================================================================

/// Collaborators and genesis settings passed to Initialize
struct TreasuryInit {
    asset::IBasisAsset* pegged{nullptr};
    asset::IBasisAsset* bond{nullptr};
    asset::IBasisAsset* share{nullptr};
    oracle::IPriceOracle* oracle{nullptr};
    IRewardSink* rewardSink{nullptr};
    /// Excluded from circulating supply
    Address genesisPool;
    /// Required for each nonzero fund share of the policy
    economics::ExtraFunds funds;
    Timestamp startTime{0};
};

/**
 * Persisted treasury state.
 *
 * Collaborator pointers are not owned; they must outlive the treasury.
 */
struct TreasuryState {
    bool initialized{false};
    Address operatorAddress;

    asset::IBasisAsset* pegged{nullptr};
    asset::IBasisAsset* bond{nullptr};
    asset::IBasisAsset* share{nullptr};
    oracle::OracleGateway oracle;
    IRewardSink* rewardSink{nullptr};
    IBondTreasury* bondTreasury{nullptr};

    EpochController epochs;
    BlockCallGuard callGuard;
    economics::MonetaryPolicy policy;

    /// Pegged tokens held against future bond redemptions
    Amount seigniorageSaved{0};

    /// Price snapshot taken by the last allocation
    Amount previousEpochPrice{0};

    /// Append-only; an address listed twice is subtracted twice
    std::vector<Address> excludedFromTotalSupply;

    Address daoFund;
    Address devFund;
};

// ============================================================================
// Treasury
// ============================================================================

class Treasury {
public:
    /// self is the treasury's own account; op may initialize and govern it
    Treasury(const Address& self, const Address& op);
    ~Treasury();

    Treasury(const Treasury&) = delete;
    Treasury& operator=(const Treasury&) = delete;

    /// One-time setup; installs policy (defaults unless given) and the reserve
    CallResult Initialize(const CallContext& ctx, const TreasuryInit& init,
                          const economics::MonetaryPolicy& policy = economics::MonetaryPolicy());

    // ========================================================================
    // Entry Points
    // ========================================================================

    /// Burn peggedAmount from the caller for discounted bonds
    CallResult BuyBonds(const CallContext& ctx, const Amount& peggedAmount,
                        const Amount& targetPrice);

    /// Burn bondAmount from the caller for pegged tokens at a premium
    CallResult RedeemBonds(const CallContext& ctx, const Amount& bondAmount,
                           const Amount& targetPrice);

    /// Epoch-gated expansion; advances the epoch
    CallResult AllocateSeigniorage(const CallContext& ctx);

    // ========================================================================
    // Governance
    // ========================================================================

    CallResult SetOperator(const CallContext& ctx, const Address& newOperator);
    CallResult SetRewardSink(const CallContext& ctx, IRewardSink* sink);
    CallResult SetOracle(const CallContext& ctx, oracle::IPriceOracle* priceOracle);
    CallResult SetBondTreasury(const CallContext& ctx, IBondTreasury* bondTreasury,
                               uint64_t bondSupplyExpansionPercent);
    CallResult SetPriceCeiling(const CallContext& ctx, const Amount& ceiling);
    CallResult SetMaxSupplyExpansionPercent(const CallContext& ctx, uint64_t percent);
    CallResult SetSupplyTiersEntry(const CallContext& ctx, size_t index, const Amount& value);
    CallResult SetMaxExpansionTiersEntry(const CallContext& ctx, size_t index, uint64_t value);
    CallResult SetBondDepletionFloorPercent(const CallContext& ctx, uint64_t percent);
    CallResult SetMaxSupplyContractionPercent(const CallContext& ctx, uint64_t percent);
    CallResult SetMaxDebtRatioPercent(const CallContext& ctx, uint64_t percent);
    CallResult SetBootstrap(const CallContext& ctx, uint64_t epochs, uint64_t percent);
    CallResult SetExtraFunds(const CallContext& ctx, const Address& daoFund, uint64_t daoPercent,
                             const Address& devFund, uint64_t devPercent);
    CallResult SetMaxDiscountRate(const CallContext& ctx, const Amount& rate);
    CallResult SetMaxPremiumRate(const CallContext& ctx, const Amount& rate);
    CallResult SetDiscountPercent(const CallContext& ctx, uint64_t percent);
    CallResult SetPremiumThreshold(const CallContext& ctx, uint64_t threshold);
    CallResult SetPremiumPercent(const CallContext& ctx, uint64_t percent);
    CallResult SetMintingFactorForPayingDebt(const CallContext& ctx, uint64_t factor);
    CallResult AddExcludedAddress(const CallContext& ctx, const Address& account);

    /// Move a non-protected token held by the treasury
    CallResult GovernanceRecoverUnsupported(const CallContext& ctx, asset::IBasisAsset* token,
                                            const Amount& amount, const Address& to);

    // Reward sink pass-throughs
    CallResult RewardSinkSetOperator(const CallContext& ctx, const Address& newOperator);
    CallResult RewardSinkSetLockUp(const CallContext& ctx, uint64_t withdrawLockupEpochs,
                                   uint64_t rewardLockupEpochs);
    CallResult RewardSinkAllocateSeigniorage(const CallContext& ctx, const Amount& amount);
    CallResult RewardSinkGovernanceRecoverUnsupported(const CallContext& ctx, const Address& token,
                                                      const Amount& amount, const Address& to);

    // ========================================================================
    // Views
    // ========================================================================

    bool IsInitialized() const;
    Address GetAddress() const { return self_; }
    Address Operator() const;
    uint64_t Epoch() const;
    Timestamp NextEpochPoint() const;
    Amount GetReserve() const;
    Amount EpochSupplyContractionLeft() const;
    Amount PreviousEpochPrice() const;
    std::vector<Address> ExcludedAddresses() const;
    economics::MonetaryPolicy Policy() const;
    Address DaoFund() const;
    Address DevFund() const;

    /// Total supply minus excluded balances; nullopt if exclusions exceed supply
    std::optional<Amount> CirculatingSupply() const;

    // Price-dependent views return nullopt when the oracle fails
    std::optional<Amount> GetPrice() const;
    std::optional<Amount> GetUpdatedPrice() const;
    std::optional<Amount> DiscountRate() const;
    std::optional<Amount> PremiumRate() const;

    /// Pegged tokens that can still be burned for bonds this epoch
    std::optional<Amount> GetBurnableLeft() const;

    /// Bonds the treasury's pegged balance can currently redeem
    std::optional<Amount> GetRedeemableBonds() const;

    /// Snapshot copy of the state
    TreasuryState Snapshot() const;

    // ========================================================================
    // Listeners
    // ========================================================================

    void AddListener(ITreasuryListener* listener);
    void RemoveListener(ITreasuryListener* listener);

private:
    using Event = std::function<void(ITreasuryListener&)>;
    using Events = std::vector<Event>;
    using Body = std::function<CallResult(TreasuryState&, Events&)>;

    /**
     * Run body on a copy of the state under a journal over the current
     * collaborators. The copy and the journal commit only on success.
     */
    CallResult Execute(const CallContext& ctx, const char* name, const Body& body,
                       std::vector<IJournaled*> extra = {});

    /// Operator-only, initialized-only call
    CallResult Govern(const CallContext& ctx, const char* name, const Body& body,
                      std::vector<IJournaled*> extra = {});

    // Guards
    CallResult RequireOperator(const TreasuryState& s, const CallContext& ctx) const;
    CallResult CheckAssetOperators(const TreasuryState& s) const;

    // Ledger
    Amount CirculatingSupplyOf(const TreasuryState& s) const;
    CallResult FetchPrice(const TreasuryState& s, Amount& price) const;
    CallResult SendToRewardSink(TreasuryState& s, Timestamp now, const Amount& amount,
                                Events& events);
    CallResult SendToBondTreasury(TreasuryState& s, Timestamp now, const Amount& amount,
                                  Events& events);

    void Notify(const Events& events);

    Address self_;
    TreasuryState state_;
    mutable std::mutex mutex_;

    std::vector<ITreasuryListener*> listeners_;
    mutable std::mutex listenersMutex_;
};

} // namespace treasury
} // namespace polymint

#endif // POLYMINT_TREASURY_TREASURY_H
