#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "broker/broker_client.hpp"
#include "position/position_book.hpp"
#include "schedule/schedule_manager.hpp"

namespace wheel {

/**
 * Discrepancy types found during reconciliation.
 */
enum class DiscrepancyType {
    UNMANAGED_POSITION,     // Short leg on the underlying outside the window
    DUPLICATE_SLOT_LEG,     // More than one leg maps to the same slot
    LONG_OPTION,            // Long option on the underlying, never opened by us
    AWAITING_SETTLEMENT     // Leg already past expiration, not yet settled
};

inline std::string discrepancy_to_string(DiscrepancyType d) {
    switch (d) {
        case DiscrepancyType::UNMANAGED_POSITION: return "UNMANAGED_POSITION";
        case DiscrepancyType::DUPLICATE_SLOT_LEG: return "DUPLICATE_SLOT_LEG";
        case DiscrepancyType::LONG_OPTION: return "LONG_OPTION";
        case DiscrepancyType::AWAITING_SETTLEMENT: return "AWAITING_SETTLEMENT";
    }
    return "UNKNOWN";
}

struct Discrepancy {
    DiscrepancyType type;
    std::string contract_id;
    int slot_id{-1};
    std::string details;
    bool is_critical{false};  // Slot halted
};

/**
 * Result of reconciliation process.
 */
struct ReconciliationResult {
    bool success{false};
    std::vector<Discrepancy> discrepancies;
    std::vector<ConditionReport> reports;

    AccountBalances balances;
    Date anchor{};
    int positions_synced{0};
    int unmanaged{0};
    std::set<int> halted_slots;

    std::string error_message;

    bool has_critical_discrepancies() const;
    std::string summary() const;
};

/**
 * Reconciler rebuilds the local view from broker truth on startup.
 *
 * Nothing is read from local storage: balances and short option legs come
 * from the broker, the window is anchored on the earliest live leg (or the
 * default anchor when flat) and each leg is mapped to the slot whose target
 * expiration is within the match tolerance. Two legs in one slot halt that
 * slot. Legs outside the window are reported and left alone.
 *
 * Never modifies broker state.
 */
class Reconciler {
public:
    Reconciler(std::shared_ptr<BrokerClient> broker,
               const StrategyConfig& strategy,
               const ChainFilterConfig& chain_filter);

    ReconciliationResult reconcile(PositionBook& book, ScheduleManager& schedule, WallClock now);

    // Short option legs on the strategy's underlying
    std::vector<BrokerPosition> short_legs(const std::vector<BrokerPosition>& positions) const;

    // Window anchor for the given live legs
    Date choose_anchor(const std::vector<BrokerPosition>& legs, const ScheduleManager& schedule, Date today) const;

private:
    std::shared_ptr<BrokerClient> broker_;
    StrategyConfig strategy_;
    ChainFilterConfig chain_filter_;

    Position to_position(const BrokerPosition& leg, int slot_id, WallClock now) const;
};

} // namespace wheel
