#include "core/reconciler.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <map>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace wheel {

bool ReconciliationResult::has_critical_discrepancies() const {
    for (const auto& d : discrepancies) {
        if (d.is_critical) return true;
    }
    return false;
}

std::string ReconciliationResult::summary() const {
    std::string s;
    s += fmt::format("Reconciliation {}: ", success ? "SUCCESS" : "FAILED");
    s += fmt::format("{} discrepancies, ", discrepancies.size());
    s += fmt::format("{} positions synced, ", positions_synced);
    s += fmt::format("{} unmanaged, ", unmanaged);
    s += fmt::format("{} slots halted", halted_slots.size());
    if (!error_message.empty()) {
        s += fmt::format(" [Error: {}]", error_message);
    }
    return s;
}

Reconciler::Reconciler(std::shared_ptr<BrokerClient> broker,
                       const StrategyConfig& strategy,
                       const ChainFilterConfig& chain_filter)
    : broker_(std::move(broker))
    , strategy_(strategy)
    , chain_filter_(chain_filter)
{
}

std::vector<BrokerPosition> Reconciler::short_legs(const std::vector<BrokerPosition>& positions) const {
    std::vector<BrokerPosition> legs;
    for (const auto& p : positions) {
        if (p.is_option && p.symbol == strategy_.symbol && p.quantity < 0) {
            legs.push_back(p);
        }
    }
    std::sort(legs.begin(), legs.end(), [](const BrokerPosition& a, const BrokerPosition& b) {
        if (a.expiration != b.expiration) return a.expiration < b.expiration;
        return a.contract_id < b.contract_id;
    });
    return legs;
}

Date Reconciler::choose_anchor(const std::vector<BrokerPosition>& legs, const ScheduleManager& schedule,
                               Date today) const {
    for (const auto& leg : legs) {
        if (leg.expiration < today) continue;
        // Snap to the expiry weekday so a holiday-shifted expiration still anchors the usual week
        Date from = leg.expiration - std::chrono::days{chain_filter_.expiry_tolerance_days};
        return time_utils::next_weekday_on_or_after(std::max(from, today),
                                                    static_cast<unsigned>(strategy_.expiry_weekday));
    }
    return schedule.default_anchor(today);
}

Position Reconciler::to_position(const BrokerPosition& leg, int slot_id, WallClock now) const {
    Position pos;
    pos.slot_id = slot_id;
    pos.contract_id = leg.contract_id;
    pos.right = leg.right;
    pos.strike = leg.strike;
    pos.expiration = leg.expiration;
    pos.quantity = leg.quantity;
    pos.status = PositionStatus::OPEN;
    pos.open_price = leg.average_cost;
    pos.mark_price = leg.average_cost;
    pos.opened_at = now;
    pos.last_update = now;
    return pos;
}

ReconciliationResult Reconciler::reconcile(PositionBook& book, ScheduleManager& schedule, WallClock now) {
    ReconciliationResult result;
    spdlog::info("Starting reconciliation against {}...", broker_->name());

    result.balances = broker_->get_account_balances(strategy_.symbol);
    if (!result.balances.success) {
        result.error_message = "balances: " + result.balances.error;
        spdlog::error("Failed to fetch account balances: {}", result.balances.error);
        return result;
    }

    auto broker_positions = broker_->get_positions();
    if (!broker_positions.success) {
        result.error_message = "positions: " + broker_positions.error;
        spdlog::error("Failed to fetch positions: {}", broker_positions.error);
        return result;
    }

    spdlog::info("Fetched broker state: {} positions, cash=${:.2f}, shares={:.0f}",
                 broker_positions.positions.size(), result.balances.cash, result.balances.shares_held);

    for (const auto& p : broker_positions.positions) {
        if (p.is_option && p.symbol == strategy_.symbol && p.quantity > 0) {
            result.discrepancies.push_back({DiscrepancyType::LONG_OPTION, p.contract_id, -1,
                                            fmt::format("long {} contracts", p.quantity), false});
        }
    }

    Date today = time_utils::market_date(now);
    auto legs = short_legs(broker_positions.positions);

    result.anchor = choose_anchor(legs, schedule, today);
    schedule.initialize(result.anchor);

    std::map<int, std::vector<BrokerPosition>> by_slot;
    for (const auto& leg : legs) {
        if (leg.expiration < today) {
            result.discrepancies.push_back({DiscrepancyType::AWAITING_SETTLEMENT, leg.contract_id, -1,
                                            "expired " + time_utils::format_date(leg.expiration), false});
            continue;
        }
        auto slot = schedule.slot_for_expiration(leg.expiration);
        if (!slot) {
            result.discrepancies.push_back({DiscrepancyType::UNMANAGED_POSITION, leg.contract_id, -1,
                                            "expiration " + time_utils::format_date(leg.expiration) +
                                            " outside the window", false});
            result.unmanaged++;
            continue;
        }
        by_slot[*slot].push_back(leg);
    }

    std::vector<Position> rebuilt;
    for (const auto& [slot_id, slot_legs] : by_slot) {
        for (const auto& leg : slot_legs) {
            rebuilt.push_back(to_position(leg, slot_id, now));
        }
        if (slot_legs.size() < 2) continue;

        std::string reason = fmt::format("{} legs in slot {}", slot_legs.size(), slot_id);
        for (const auto& leg : slot_legs) {
            result.discrepancies.push_back({DiscrepancyType::DUPLICATE_SLOT_LEG, leg.contract_id, slot_id,
                                            reason, true});
        }

        ConditionReport report;
        report.type = ConditionType::INVARIANT_VIOLATION;
        report.slot_id = slot_id;
        report.reason = reason;
        report.snapshot["live_positions"] = static_cast<double>(slot_legs.size());
        report.time = now;
        report.is_fatal = true;
        result.reports.push_back(report);

        schedule.halt_slot(slot_id, reason);
        result.halted_slots.insert(slot_id);
    }

    book.load(rebuilt);
    result.positions_synced = static_cast<int>(rebuilt.size());

    if (!result.discrepancies.empty()) {
        spdlog::warn("Found {} discrepancies during reconciliation:", result.discrepancies.size());
        for (const auto& d : result.discrepancies) {
            spdlog::warn("  - {}: {} slot={} {} {}", discrepancy_to_string(d.type), d.contract_id,
                         d.slot_id, d.details, d.is_critical ? "[CRITICAL]" : "");
        }
    }

    result.success = true;
    spdlog::info("{} (anchor {})", result.summary(), time_utils::format_date(result.anchor));
    return result;
}

} // namespace wheel
