#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "rebalance/position_rebalancer.hpp"
#include "schedule/schedule_manager.hpp"

namespace wheel {

// Filter output for one target expiration
struct SlotCandidates {
    int slot_id{-1};
    Date target_expiration{};
    std::optional<Date> matched_expiration;
    std::vector<OptionContract> contracts;  // Liquid contracts at the matched expiration, both rights
    std::string reason;                     // Why the slot is ineligible

    bool eligible() const { return matched_expiration.has_value() && !contracts.empty(); }
};

// Contract picked for a side and delta band
struct ContractSelection {
    OptionContract contract;
    double abs_delta{0.0};
    bool in_band{false};
};

/**
 * Options chain filter.
 *
 * Matches chain expirations onto window targets (exact date, else the nearest
 * expiration within the tolerance, later date on a tie) and drops contracts
 * failing the liquidity predicate. Selection then picks one out-of-the-money
 * strike for a side and delta band.
 */
class OptionChainFilter {
public:
    using DeltaFn = std::function<std::optional<double>(const OptionContract&)>;

    OptionChainFilter(const ChainFilterConfig& filter_config, const StrategyConfig& strategy_config);

    std::optional<Date> match_expiration(Date target, const std::vector<Date>& available) const;

    bool passes_liquidity(const OptionContract& c) const;

    SlotCandidates filter_for_expiration(const ChainSnapshot& chain, int slot_id, Date target) const;

    // One entry per window slot, keyed by slot_id
    std::map<int, SlotCandidates> filter(const ChainSnapshot& chain, const ScheduleWindow& window) const;

    /**
     * Pick the best contract of `right` among `candidates`:
     * out of the money, within max_strike_distance of spot, optionally on a
     * whole or half dollar strike, |delta| at least min_candidate_delta and
     * below the roll threshold. Preference is inside the band, then closest
     * to the target |delta|, then richest mid.
     */
    std::optional<ContractSelection> select_contract(
        const std::vector<OptionContract>& candidates,
        OptionRight right,
        const DeltaBand& band,
        Price underlying,
        const DeltaFn& delta_of) const;

    static bool is_clean_strike(Price strike);

private:
    ChainFilterConfig config_;
    StrategyConfig strategy_;
};

} // namespace wheel
