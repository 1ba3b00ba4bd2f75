// POLYMINT - Policy Configuration Loaders
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/economics/policy_config.h"
#include "polymint/core/fixedpoint.h"
#include "polymint/util/logging.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace polymint {
namespace economics {

using util::ConfigManager;
using util::ConfigParseResult;

std::optional<Timestamp> ParseDuration(const std::string& str) {
    std::string s = ConfigManager::Trim(str);
    if (s.empty()) {
        return std::nullopt;
    }

    Timestamp unit = 1;
    switch (std::tolower(static_cast<unsigned char>(s.back()))) {
        case 's': unit = 1; s.pop_back(); break;
        case 'm': unit = 60; s.pop_back(); break;
        case 'h': unit = HOURS; s.pop_back(); break;
        case 'd': unit = DAYS; s.pop_back(); break;
        default: break;
    }
    if (s.empty()) {
        return std::nullopt;
    }

    Timestamp value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (value > (std::numeric_limits<Timestamp>::max() - 9) / 10) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    if (value > std::numeric_limits<Timestamp>::max() / unit) {
        return std::nullopt;
    }
    return value * unit;
}

namespace {

/// Reads typed keys of one section, stopping at the first bad value
class SectionReader {
public:
    SectionReader(const ConfigManager& config, const char* section)
        : config_(config), section_(section) {}

    void UInt(const char* key, uint64_t& out) {
        if (!ok() || !config_.HasKey(key, section_)) {
            return;
        }
        auto value = config_.TryGetUInt(key, section_);
        if (!value) {
            Fail(key, "expected a non-negative integer");
            return;
        }
        out = *value;
    }

    void Amt(const char* key, Amount& out) {
        if (!ok() || !config_.HasKey(key, section_)) {
            return;
        }
        auto value = fixedpoint::ParseAmount(config_.GetString(key, "", section_));
        if (!value) {
            Fail(key, "expected a decimal amount");
            return;
        }
        out = *value;
    }

    void Addr(const char* key, Address& out) {
        if (!ok() || !config_.HasKey(key, section_)) {
            return;
        }
        try {
            out = Address::FromHex(config_.GetString(key, "", section_));
        } catch (const std::invalid_argument&) {
            Fail(key, "expected a 40 digit hex address");
        }
    }

    void Duration(const char* key, Timestamp& out) {
        if (!ok() || !config_.HasKey(key, section_)) {
            return;
        }
        auto value = ParseDuration(config_.GetString(key, "", section_));
        if (!value || *value <= 0) {
            Fail(key, "expected a positive duration");
            return;
        }
        out = *value;
    }

    bool AmountList(const char* key, std::vector<Amount>& out) {
        if (!ok() || !config_.HasKey(key, section_)) {
            return false;
        }
        std::vector<Amount> values;
        for (const auto& item : config_.GetList(key, section_)) {
            auto value = fixedpoint::ParseAmount(item);
            if (!value) {
                Fail(key, "bad amount '" + item + "'");
                return false;
            }
            values.push_back(*value);
        }
        out = std::move(values);
        return true;
    }

    bool UIntList(const char* key, std::vector<uint64_t>& out) {
        if (!ok() || !config_.HasKey(key, section_)) {
            return false;
        }
        std::vector<uint64_t> values;
        for (const auto& item : config_.GetList(key, section_)) {
            if (item.find_first_not_of("0123456789") != std::string::npos) {
                Fail(key, "bad integer '" + item + "'");
                return false;
            }
            auto value = ParseDuration(item);
            if (!value) {
                Fail(key, "integer too large '" + item + "'");
                return false;
            }
            values.push_back(static_cast<uint64_t>(*value));
        }
        out = std::move(values);
        return true;
    }

    bool DurationList(const char* key, std::vector<Timestamp>& out) {
        if (!ok() || !config_.HasKey(key, section_)) {
            return false;
        }
        std::vector<Timestamp> values;
        for (const auto& item : config_.GetList(key, section_)) {
            auto value = ParseDuration(item);
            if (!value || *value <= 0) {
                Fail(key, "bad duration '" + item + "'");
                return false;
            }
            values.push_back(*value);
        }
        out = std::move(values);
        return true;
    }

    void Fail(const std::string& key, const std::string& why) {
        if (ok()) {
            result_ = ConfigParseResult::Error(std::string(section_) + "." + key + ": " + why);
        }
    }

    bool ok() const { return result_.success; }
    const ConfigParseResult& result() const { return result_; }

private:
    const ConfigManager& config_;
    const char* section_;
    ConfigParseResult result_ = ConfigParseResult::Success();
};

} // namespace

ConfigParseResult LoadMonetaryPolicy(const ConfigManager& config, MonetaryPolicy& policy,
                                     ExtraFunds& funds) {
    MonetaryPolicy next = policy;
    ExtraFunds nextFunds = funds;
    SectionReader reader(config, TREASURY_SECTION);

    reader.Duration("period", next.period);
    reader.Amt("price_ceiling", next.pricing.priceCeiling);
    reader.UInt("max_supply_expansion_percent", next.expansion.maxSupplyExpansionPercent);
    reader.UInt("bond_depletion_floor_percent", next.expansion.bondDepletionFloorPercent);
    reader.UInt("seigniorage_expansion_floor_percent",
                next.expansion.seigniorageExpansionFloorPercent);
    reader.UInt("max_supply_contraction_percent", next.maxSupplyContractionPercent);
    reader.UInt("max_debt_ratio_percent", next.maxDebtRatioPercent);
    reader.UInt("bootstrap_epochs", next.expansion.bootstrapEpochs);
    reader.UInt("bootstrap_supply_expansion_percent",
                next.expansion.bootstrapSupplyExpansionPercent);
    reader.UInt("dao_fund_shared_percent", next.daoFundSharedPercent);
    reader.UInt("dev_fund_shared_percent", next.devFundSharedPercent);
    reader.Addr("dao_fund", nextFunds.daoFund);
    reader.Addr("dev_fund", nextFunds.devFund);
    reader.UInt("discount_percent", next.pricing.discountPercent);
    reader.UInt("premium_threshold", next.pricing.premiumThreshold);
    reader.UInt("premium_percent", next.pricing.premiumPercent);
    reader.Amt("max_discount_rate", next.pricing.maxDiscountRate);
    reader.Amt("max_premium_rate", next.pricing.maxPremiumRate);
    reader.UInt("minting_factor_for_paying_debt", next.expansion.mintingFactorForPayingDebt);
    reader.UInt("bond_supply_expansion_percent", next.expansion.bondSupplyExpansionPercent);

    std::vector<Amount> thresholds;
    std::vector<uint64_t> percents;
    bool hasThresholds = reader.AmountList("supply_tiers", thresholds);
    bool hasPercents = reader.UIntList("max_expansion_tiers", percents);
    if (hasThresholds || hasPercents) {
        std::array<Amount, SUPPLY_TIER_COUNT> t = next.expansion.tiers.Thresholds();
        std::array<uint64_t, SUPPLY_TIER_COUNT> p = next.expansion.tiers.Percents();
        if (hasThresholds) {
            if (thresholds.size() != SUPPLY_TIER_COUNT) {
                reader.Fail("supply_tiers", "expected 9 entries");
            } else {
                std::copy(thresholds.begin(), thresholds.end(), t.begin());
            }
        }
        if (hasPercents) {
            if (percents.size() != SUPPLY_TIER_COUNT) {
                reader.Fail("max_expansion_tiers", "expected 9 entries");
            } else {
                std::copy(percents.begin(), percents.end(), p.begin());
            }
        }
        next.expansion.tiers = SupplyTierTable(t, p);
    }

    if (!reader.ok()) {
        LOG_WARN(util::LogCategory::CONFIG) << reader.result().errorMessage;
        return reader.result();
    }

    auto valid = bounds::CheckPolicy(next);
    if (valid) {
        valid = bounds::CheckExtraFunds(next, nextFunds);
    }
    if (!valid) {
        LOG_WARN(util::LogCategory::CONFIG) << "treasury policy rejected: " << valid.reason;
        return ConfigParseResult::Error(std::string(TREASURY_SECTION) + ": " + valid.reason);
    }

    policy = next;
    funds = nextFunds;
    LOG_INFO(util::LogCategory::CONFIG)
        << "Monetary policy loaded: period " << policy.period << "s, ceiling "
        << fixedpoint::FormatAmount(policy.pricing.priceCeiling);
    return ConfigParseResult::Success();
}

ConfigParseResult LoadEmissionConfig(const ConfigManager& config, std::vector<Amount>& totals,
                                     std::vector<Timestamp>& durations) {
    SectionReader reader(config, REWARD_POOL_SECTION);

    std::vector<Amount> t;
    std::vector<Timestamp> d;
    bool hasTotals = reader.AmountList("epoch_totals", t);
    bool hasDurations = reader.DurationList("epoch_durations", d);

    if (!reader.ok()) {
        return reader.result();
    }
    if (!hasTotals && !hasDurations) {
        return ConfigParseResult::Success();
    }
    if (hasTotals != hasDurations || t.size() != d.size() || t.empty()) {
        return ConfigParseResult::Error(
            "rewardpool: epoch_totals and epoch_durations must have the same length");
    }

    totals = std::move(t);
    durations = std::move(d);
    LOG_INFO(util::LogCategory::CONFIG) << "Emission schedule loaded: " << totals.size()
                                        << " epochs";
    return ConfigParseResult::Success();
}

} // namespace economics
} // namespace polymint
