#include "chain/option_chain_filter.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace wheel {

OptionChainFilter::OptionChainFilter(const ChainFilterConfig& filter_config,
                                     const StrategyConfig& strategy_config)
    : config_(filter_config)
    , strategy_(strategy_config)
{
}

std::optional<Date> OptionChainFilter::match_expiration(Date target, const std::vector<Date>& available) const {
    std::optional<Date> best;
    int best_distance = config_.expiry_tolerance_days + 1;

    for (const auto& exp : available) {
        int distance = std::abs(time_utils::days_between(target, exp));
        if (distance > config_.expiry_tolerance_days) continue;

        // Later date wins a tie, avoiding earlier-than-planned assignment
        if (distance < best_distance || (distance == best_distance && best && exp > *best)) {
            best = exp;
            best_distance = distance;
        }
    }
    return best;
}

bool OptionChainFilter::passes_liquidity(const OptionContract& c) const {
    if (c.open_interest < config_.min_open_interest) return false;
    if (c.bid < config_.min_bid) return false;
    if (c.ask <= 0.0 || c.ask < c.bid) return false;

    double spread = c.spread();
    if (spread > config_.max_spread_abs) return false;

    double mid = c.mid();
    if (mid <= 0.0) return false;
    return spread / mid <= config_.max_spread_fraction;
}

SlotCandidates OptionChainFilter::filter_for_expiration(const ChainSnapshot& chain, int slot_id, Date target) const {
    SlotCandidates result;
    result.slot_id = slot_id;
    result.target_expiration = target;

    std::set<Date> expirations;
    for (const auto& c : chain.contracts) {
        expirations.insert(c.expiration);
    }

    std::vector<Date> available(expirations.begin(), expirations.end());
    result.matched_expiration = match_expiration(target, available);
    if (!result.matched_expiration) {
        result.reason = fmt::format("no expiration within {} days of {}",
                                    config_.expiry_tolerance_days, time_utils::format_date(target));
        return result;
    }

    size_t at_expiry = 0;
    for (const auto& c : chain.contracts) {
        if (c.expiration != *result.matched_expiration) continue;
        ++at_expiry;
        if (passes_liquidity(c)) {
            result.contracts.push_back(c);
        }
    }

    if (result.contracts.empty()) {
        result.reason = fmt::format("all {} contracts at {} failed liquidity filter",
                                    at_expiry, time_utils::format_date(*result.matched_expiration));
    }
    return result;
}

std::map<int, SlotCandidates> OptionChainFilter::filter(const ChainSnapshot& chain, const ScheduleWindow& window) const {
    std::map<int, SlotCandidates> out;
    for (const auto& slot : window.slots) {
        out[slot.slot_id] = filter_for_expiration(chain, slot.slot_id, slot.target_expiration);
    }
    return out;
}

bool OptionChainFilter::is_clean_strike(Price strike) {
    double doubled = strike * 2.0;
    return std::abs(doubled - std::round(doubled)) < 1e-6;
}

std::optional<ContractSelection> OptionChainFilter::select_contract(
    const std::vector<OptionContract>& candidates,
    OptionRight right,
    const DeltaBand& band,
    Price underlying,
    const DeltaFn& delta_of) const
{
    if (underlying <= 0.0) return std::nullopt;

    std::vector<ContractSelection> eligible;
    for (const auto& c : candidates) {
        if (c.right != right) continue;

        bool otm = right == OptionRight::PUT ? c.strike < underlying : c.strike > underlying;
        if (!otm) continue;

        if (std::abs(c.strike - underlying) / underlying > strategy_.max_strike_distance) continue;
        if (strategy_.clean_strikes_only && !is_clean_strike(c.strike)) continue;

        auto delta = delta_of(c);
        if (!delta) continue;

        double abs_delta = std::abs(*delta);
        if (abs_delta < strategy_.min_candidate_delta) continue;
        if (abs_delta >= strategy_.roll_delta_threshold) continue;

        eligible.push_back({c, abs_delta, band.contains(abs_delta)});
    }

    if (eligible.empty()) return std::nullopt;

    auto better = [&band](const ContractSelection& a, const ContractSelection& b) {
        if (a.in_band != b.in_band) return a.in_band;
        double da = std::abs(a.abs_delta - band.target);
        double db = std::abs(b.abs_delta - band.target);
        if (std::abs(da - db) > 1e-9) return da < db;
        return a.contract.mid() > b.contract.mid();
    };

    auto best = std::min_element(eligible.begin(), eligible.end(), better);

    spdlog::debug("Selected {} {} strike {} delta {:.3f} ({} of {} candidates eligible)",
                  right_to_string(right), best->contract.contract_id, best->contract.strike,
                  best->abs_delta, eligible.size(), candidates.size());
    return *best;
}

} // namespace wheel
