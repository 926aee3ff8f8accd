#include "engine/roll_decision_engine.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace wheel {

namespace {

constexpr std::chrono::days kWeek{7};

Price round_to_cents(Price p) {
    return std::round(p * 100.0) / 100.0;
}

TargetContract to_target(const ContractSelection& sel) {
    TargetContract t;
    t.contract_id = sel.contract.contract_id;
    t.right = sel.contract.right;
    t.strike = sel.contract.strike;
    t.expiration = sel.contract.expiration;
    t.delta = sel.contract.right == OptionRight::PUT ? -sel.abs_delta : sel.abs_delta;
    Price mid = sel.contract.mid();
    t.limit_price = round_to_cents(mid > 0.0 ? mid : sel.contract.bid);
    return t;
}

void add_target_values(SnapshotValues& v, const TargetContract& t, const std::string& prefix) {
    v[prefix + "strike"] = t.strike;
    v[prefix + "delta"] = t.delta;
    v[prefix + "limit_price"] = t.limit_price;
}

} // namespace

const RollDecision* DecisionBatch::for_slot(int slot_id) const {
    for (const auto& d : decisions) {
        if (d.slot_id == slot_id) return &d;
    }
    return nullptr;
}

bool DecisionBatch::has_report(ConditionType type, int slot_id) const {
    return std::any_of(reports.begin(), reports.end(), [&](const ConditionReport& r) {
        return r.type == type && r.slot_id == slot_id;
    });
}

size_t DecisionBatch::action_count() const {
    return static_cast<size_t>(std::count_if(decisions.begin(), decisions.end(), [](const RollDecision& d) {
        return d.action != DecisionAction::HOLD;
    }));
}

RollDecisionEngine::RollDecisionEngine(const StrategyConfig& strategy,
                                       const ChainFilterConfig& chain_filter,
                                       const MarketDataConfig& market_data)
    : strategy_(strategy)
    , rebalancer_(strategy)
    , filter_(chain_filter, strategy)
    , monitor_(strategy, market_data)
{
}

double RollDecisionEngine::put_collateral(Price strike) const {
    return strike * strategy_.contract_multiplier * strategy_.contracts_per_slot;
}

double RollDecisionEngine::call_collateral() const {
    return static_cast<double>(strategy_.contract_multiplier) * strategy_.contracts_per_slot;
}

RollDecisionEngine::Collateral RollDecisionEngine::free_collateral(const CycleSnapshot& snapshot) const {
    Collateral c{snapshot.portfolio.cash_balance, snapshot.portfolio.shares_held};

    for (const auto& p : snapshot.positions) {
        if (!p.is_live()) continue;
        // A placeholder with no order behind it commits nothing
        if (p.status == PositionStatus::PENDING_OPEN && !snapshot.pending_order_slots.count(p.slot_id)) continue;

        double contracts = std::abs(p.quantity);
        if (p.right == OptionRight::PUT) {
            c.cash -= p.strike * strategy_.contract_multiplier * contracts;
        } else {
            c.shares -= strategy_.contract_multiplier * contracts;
        }
    }
    return c;
}

std::vector<OptionRight> RollDecisionEngine::candidate_rights(SidePreference pref, int slot_id) const {
    switch (pref) {
        case SidePreference::PUT: return {OptionRight::PUT};
        case SidePreference::CALL: return {OptionRight::CALL};
        case SidePreference::EITHER: break;
    }
    // Alternate the neutral preference across slots so the window stays mixed
    if (slot_id % 2 == 0) return {OptionRight::PUT, OptionRight::CALL};
    return {OptionRight::CALL, OptionRight::PUT};
}

std::optional<RollDecisionEngine::Leg> RollDecisionEngine::plan_leg(
    const CycleSnapshot& snapshot,
    int slot_id,
    Date expiration,
    const Collateral& available,
    LegFailure& failure,
    std::string& failure_reason) const
{
    failure = LegFailure::NONE;

    SlotCandidates candidates = filter_.filter_for_expiration(snapshot.chain, slot_id, expiration);
    if (!candidates.eligible()) {
        failure = LegFailure::NO_ELIGIBLE_CONTRACT;
        failure_reason = candidates.reason;
        return std::nullopt;
    }

    double bias = snapshot.portfolio.allocation_bias;
    DeltaBand band = rebalancer_.delta_band(rebalancer_.target_delta(bias));

    Price underlying = snapshot.portfolio.underlying_price > 0.0
        ? snapshot.portfolio.underlying_price
        : snapshot.chain.underlying_price();

    auto delta_of = [this, &snapshot, underlying](const OptionContract& c) -> std::optional<double> {
        // Never open on stale data
        if (monitor_.is_stale(c, snapshot.now)) return std::nullopt;
        return monitor_.contract_delta(c, underlying, snapshot.now);
    };

    bool any_selected = false;
    std::string shortfall;

    for (OptionRight right : candidate_rights(rebalancer_.side_preference(bias), slot_id)) {
        auto selection = filter_.select_contract(candidates.contracts, right, band, underlying, delta_of);
        if (!selection) continue;
        any_selected = true;

        Leg leg;
        leg.selection = *selection;
        if (right == OptionRight::PUT) {
            leg.required_cash = put_collateral(selection->contract.strike);
        } else {
            leg.required_shares = call_collateral();
        }

        if (!strategy_.enforce_collateral ||
            (leg.required_cash <= available.cash + 1e-6 && leg.required_shares <= available.shares + 1e-6)) {
            return leg;
        }

        if (!shortfall.empty()) shortfall += "; ";
        if (right == OptionRight::PUT) {
            shortfall += fmt::format("PUT {} needs ${:.2f} cash, ${:.2f} free",
                                     selection->contract.strike, leg.required_cash, available.cash);
        } else {
            shortfall += fmt::format("CALL {} needs {:.0f} shares, {:.0f} free",
                                     selection->contract.strike, leg.required_shares, available.shares);
        }
    }

    if (!any_selected) {
        failure = LegFailure::NO_ELIGIBLE_CONTRACT;
        failure_reason = fmt::format("no {} strike selectable near target delta {:.2f} among {} liquid contracts at {}",
                                     side_preference_to_string(rebalancer_.side_preference(bias)), band.target,
                                     candidates.contracts.size(),
                                     time_utils::format_date(*candidates.matched_expiration));
    } else {
        failure = LegFailure::INSUFFICIENT_COLLATERAL;
        failure_reason = shortfall;
    }
    return std::nullopt;
}

SnapshotValues RollDecisionEngine::base_values(const CycleSnapshot& snapshot) const {
    double bias = snapshot.portfolio.allocation_bias;
    return SnapshotValues{
        {"bias", bias},
        {"target_delta", rebalancer_.target_delta(bias)},
        {"cash", snapshot.portfolio.cash_balance},
        {"shares", snapshot.portfolio.shares_held},
        {"target_shares", static_cast<double>(snapshot.portfolio.target_shares)},
        {"underlying", snapshot.portfolio.underlying_price},
        {"roll_threshold", strategy_.roll_delta_threshold}
    };
}

void RollDecisionEngine::report(DecisionBatch& batch, const CycleSnapshot& snapshot, ConditionType type,
                                int slot_id, const std::string& reason, const SnapshotValues& values,
                                bool fatal) const {
    ConditionReport r;
    r.type = type;
    r.slot_id = slot_id;
    r.reason = reason;
    r.snapshot = values;
    r.time = snapshot.now;
    r.is_fatal = fatal;
    batch.reports.push_back(std::move(r));
}

RollDecision RollDecisionEngine::decide_slot(const CycleSnapshot& snapshot,
                                             const ScheduleSlot& slot,
                                             Collateral& collateral,
                                             DecisionBatch& batch) const {
    RollDecision d;
    d.slot_id = slot.slot_id;
    d.snapshot = base_values(snapshot);
    d.snapshot["slot_target_days"] = time_utils::days_between(snapshot.today, slot.target_expiration);

    if (snapshot.halted_slots.count(slot.slot_id)) {
        d.reason = "slot halted pending manual intervention";
        return d;
    }

    std::vector<const Position*> live;
    for (const auto& p : snapshot.positions) {
        if (p.slot_id == slot.slot_id && p.is_live()) live.push_back(&p);
    }

    if (live.size() > 1) {
        d.reason = fmt::format("{} live positions in one slot", live.size());
        d.snapshot["live_positions"] = static_cast<double>(live.size());
        report(batch, snapshot, ConditionType::INVARIANT_VIOLATION, slot.slot_id, d.reason, d.snapshot, true);
        batch.halt_requests.insert(slot.slot_id);
        return d;
    }

    const Position* pos = live.empty() ? nullptr : live.front();
    bool in_flight = snapshot.pending_order_slots.count(slot.slot_id) > 0;

    LegFailure failure = LegFailure::NONE;
    std::string failure_reason;

    // Rule 1: nothing held and nothing working
    if (pos == nullptr || (pos->status == PositionStatus::PENDING_OPEN && !in_flight)) {
        auto leg = plan_leg(snapshot, slot.slot_id, slot.target_expiration, collateral, failure, failure_reason);
        if (!leg) {
            d.reason = "OPEN blocked: " + failure_reason;
            report(batch, snapshot,
                   failure == LegFailure::NO_ELIGIBLE_CONTRACT ? ConditionType::NO_ELIGIBLE_CONTRACT
                                                               : ConditionType::INSUFFICIENT_COLLATERAL,
                   slot.slot_id, failure_reason, d.snapshot);
            return d;
        }

        collateral.cash -= leg->required_cash;
        collateral.shares -= leg->required_shares;

        d.action = DecisionAction::OPEN;
        d.trigger = DecisionTrigger::EMPTY_SLOT;
        d.target_contract = to_target(leg->selection);
        add_target_values(d.snapshot, *d.target_contract, "new_");
        d.reason = fmt::format("slot empty, sell {} {} exp {} delta {:.2f} (band {:.2f}-{:.2f})",
                               right_to_string(d.target_contract->right), d.target_contract->strike,
                               time_utils::format_date(d.target_contract->expiration),
                               leg->selection.abs_delta,
                               rebalancer_.delta_band(rebalancer_.target_delta(snapshot.portfolio.allocation_bias)).low,
                               rebalancer_.delta_band(rebalancer_.target_delta(snapshot.portfolio.allocation_bias)).high);
        return d;
    }

    if (pos->status != PositionStatus::OPEN || in_flight) {
        d.reason = fmt::format("awaiting order, position {}", position_status_to_string(pos->status));
        return d;
    }

    int dte = time_utils::days_between(snapshot.today, pos->expiration);
    d.snapshot["delta"] = pos->delta;
    d.snapshot["days_to_expiry"] = dte;
    d.snapshot["strike"] = pos->strike;
    d.snapshot["open_price"] = pos->open_price;
    d.snapshot["mark_price"] = pos->mark_price;

    // Rule 2
    if (pos->stale) {
        d.reason = "market data stale, holding";
        report(batch, snapshot, ConditionType::STALE_MARKET_DATA, slot.slot_id,
               fmt::format("{} excluded from roll logic: no fresh delta", pos->contract_id), d.snapshot);
        return d;
    }

    // Rules 3 and 4
    DecisionTrigger trigger = DecisionTrigger::NONE;
    if (monitor_.classify(pos->delta) == DeltaClass::NEAR_MONEY) {
        trigger = DecisionTrigger::DELTA_BREACH;
    } else if (dte <= strategy_.min_days_to_expiry) {
        trigger = DecisionTrigger::EXPIRY_PROXIMITY;
    }

    if (trigger != DecisionTrigger::NONE) {
        // The earliest slot rolls into the next week past the window, others
        // re-strike in their own week so no two slots share an expiration.
        Date replacement = snapshot.window.is_earliest(slot.slot_id)
            ? snapshot.window.farthest() + kWeek
            : slot.target_expiration;

        double contracts = std::abs(pos->quantity);
        Collateral with_release = collateral;
        if (pos->right == OptionRight::PUT) {
            with_release.cash += pos->strike * strategy_.contract_multiplier * contracts;
        } else {
            with_release.shares += strategy_.contract_multiplier * contracts;
        }

        std::string why = trigger == DecisionTrigger::DELTA_BREACH
            ? fmt::format("|delta| {:.2f} >= {:.2f}", std::abs(pos->delta), strategy_.roll_delta_threshold)
            : fmt::format("{} days to expiry <= {}", dte, strategy_.min_days_to_expiry);

        auto leg = plan_leg(snapshot, slot.slot_id, replacement, with_release, failure, failure_reason);
        if (leg) {
            double released_cash = with_release.cash - collateral.cash;
            double released_shares = with_release.shares - collateral.shares;
            collateral.cash -= std::max(0.0, leg->required_cash - released_cash);
            collateral.shares -= std::max(0.0, leg->required_shares - released_shares);

            d.action = DecisionAction::ROLL;
            d.trigger = trigger;
            d.target_contract = to_target(leg->selection);
            add_target_values(d.snapshot, *d.target_contract, "new_");
            d.reason = fmt::format("{}: roll {} into {} {} exp {}", why, pos->contract_id,
                                   right_to_string(d.target_contract->right), d.target_contract->strike,
                                   time_utils::format_date(d.target_contract->expiration));
            return d;
        }

        if (failure == LegFailure::NO_ELIGIBLE_CONTRACT) {
            d.reason = fmt::format("{} but no replacement: {}", why, failure_reason);
            report(batch, snapshot, ConditionType::NO_ELIGIBLE_CONTRACT, slot.slot_id, failure_reason, d.snapshot);
            return d;
        }

        // Replacement cannot be funded: take the threatened leg off
        d.action = DecisionAction::CLOSE;
        d.trigger = trigger;
        d.reason = fmt::format("{} and replacement unfunded ({}), closing", why, failure_reason);
        report(batch, snapshot, ConditionType::INSUFFICIENT_COLLATERAL, slot.slot_id, failure_reason, d.snapshot);
        return d;
    }

    // Rule 4': optional profit target
    if (strategy_.close_profit_fraction > 0.0 && pos->open_price > 0.0 && pos->mark_price > 0.0) {
        double captured = (pos->open_price - pos->mark_price) / pos->open_price;
        d.snapshot["captured_fraction"] = captured;
        if (captured >= strategy_.close_profit_fraction) {
            d.action = DecisionAction::CLOSE;
            d.trigger = DecisionTrigger::PROFIT_TARGET;
            d.reason = fmt::format("{:.0f}% of credit captured (target {:.0f}%)",
                                   captured * 100.0, strategy_.close_profit_fraction * 100.0);
            return d;
        }
    }

    d.reason = fmt::format("in range, |delta| {:.2f}, {} days to expiry", std::abs(pos->delta), dte);
    return d;
}

DecisionBatch RollDecisionEngine::evaluate(const CycleSnapshot& snapshot) const {
    DecisionBatch batch;

    if (!snapshot.broker_connected) {
        for (const auto& slot : snapshot.window.slots) {
            RollDecision d;
            d.slot_id = slot.slot_id;
            d.reason = "broker disconnected, holding";
            batch.decisions.push_back(std::move(d));
        }
        report(batch, snapshot, ConditionType::BROKER_DISCONNECTED, -1,
               "broker disconnected, order-affecting decisions suspended", base_values(snapshot));
        std::sort(batch.decisions.begin(), batch.decisions.end(),
                  [](const RollDecision& a, const RollDecision& b) { return a.slot_id < b.slot_id; });
        return batch;
    }

    Collateral collateral = free_collateral(snapshot);
    double bias = snapshot.portfolio.allocation_bias;

    for (int slot_id : rebalancer_.slot_priority(bias, snapshot.window.slot_ids())) {
        const ScheduleSlot* slot = snapshot.window.find(slot_id);
        if (slot == nullptr) continue;
        batch.decisions.push_back(decide_slot(snapshot, *slot, collateral, batch));
    }

    std::sort(batch.decisions.begin(), batch.decisions.end(),
              [](const RollDecision& a, const RollDecision& b) { return a.slot_id < b.slot_id; });

    spdlog::debug("Decision batch: {} slots, {} actions, {} reports, bias {:.2f}",
                  batch.decisions.size(), batch.action_count(), batch.reports.size(), bias);
    return batch;
}

bool RollDecisionEngine::should_cancel(DecisionTrigger pending_trigger, const Position& pos, Date today) const {
    if (pending_trigger != DecisionTrigger::DELTA_BREACH) return false;
    if (pos.stale) return false;
    if (time_utils::days_between(today, pos.expiration) <= strategy_.min_days_to_expiry) return false;
    return monitor_.classify(pos.delta) == DeltaClass::IN_RANGE;
}

} // namespace wheel
