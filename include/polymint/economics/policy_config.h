// POLYMINT - Policy Configuration Loaders
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Reads monetary policy and emission settings from a parsed config.
//
// [treasury]
// period = 6h
// price_ceiling = 1.01
// dao_fund_shared_percent = 1000
// dao_fund = 0x...
// supply_tiers = 0, 500000, 1000000, ...
// max_expansion_tiers = 450, 400, 350, ...
//
// [rewardpool]
// epoch_totals = 80000, 60000
// epoch_durations = 4d, 5d

#ifndef POLYMINT_ECONOMICS_POLICY_CONFIG_H
#define POLYMINT_ECONOMICS_POLICY_CONFIG_H

#include <polymint/core/types.h>
#include <polymint/economics/policy.h>
#include <polymint/util/config.h>

#include <optional>
#include <string>
#include <vector>

namespace polymint {
namespace economics {

/// Config sections
constexpr const char* TREASURY_SECTION = "treasury";
constexpr const char* REWARD_POOL_SECTION = "rewardpool";

/// Parse "90", "90s", "15m", "6h" or "4d" into seconds
std::optional<Timestamp> ParseDuration(const std::string& str);

/**
 * Override policy and funds with the [treasury] keys present in config.
 *
 * Values are checked against the governance bounds, and a nonzero fund
 * share must come with its fund address. On error policy and funds are
 * left untouched and the result names the offending key.
 */
util::ConfigParseResult LoadMonetaryPolicy(const util::ConfigManager& config,
                                           MonetaryPolicy& policy, ExtraFunds& funds);

/**
 * Read [rewardpool] epoch_totals and epoch_durations.
 *
 * Both lists must be given together with equal length; when neither is
 * present the outputs are left untouched.
 */
util::ConfigParseResult LoadEmissionConfig(const util::ConfigManager& config,
                                           std::vector<Amount>& totals,
                                           std::vector<Timestamp>& durations);

} // namespace economics
} // namespace polymint

#endif // POLYMINT_ECONOMICS_POLICY_CONFIG_H
