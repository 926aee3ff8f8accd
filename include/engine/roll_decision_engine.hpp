#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "chain/option_chain_filter.hpp"
#include "greeks/delta_monitor.hpp"
#include "rebalance/position_rebalancer.hpp"
#include "schedule/schedule_manager.hpp"

namespace wheel {

/**
 * Everything one decision cycle reads. Captured once at cycle start and not
 * touched while the batch is computed.
 */
struct CycleSnapshot {
    PortfolioState portfolio;
    std::vector<Position> positions;    // Delta and stale flag already refreshed
    ScheduleWindow window;
    ChainSnapshot chain;
    WallClock now;
    Date today{};
    std::set<int> pending_order_slots;  // Slots with an order in flight
    std::set<int> halted_slots;
    bool broker_connected{true};
};

struct DecisionBatch {
    std::vector<RollDecision> decisions;    // One per window slot, by slot_id
    std::vector<ConditionReport> reports;
    std::set<int> halt_requests;            // Slots found in violation this cycle

    const RollDecision* for_slot(int slot_id) const;
    bool has_report(ConditionType type, int slot_id) const;
    size_t action_count() const;            // Non-HOLD decisions
};

/**
 * Rolling decision engine.
 *
 * Pure function of the cycle snapshot. Per slot the first matching rule wins:
 *   - empty, closed, or unfilled open with nothing in flight: OPEN
 *   - OPEN on stale data: HOLD
 *   - OPEN with |delta| at or above the roll threshold: ROLL
 *   - OPEN within min_days_to_expiry of expiration: ROLL
 *   - OPEN with the profit target captured (when enabled): CLOSE
 *   - otherwise HOLD
 * A roll from the earliest slot goes one week past the farthest slot, which
 * retires that slot on the next advance. A roll from any other slot re-strikes
 * in that slot's own week, so no two slots ever share an expiration.
 * A disconnected broker turns every slot into HOLD. All decisions are
 * computed before anything is dispatched, and collateral is reserved across
 * the batch so two slots never spend the same cash or shares.
 */
class RollDecisionEngine {
public:
    RollDecisionEngine(const StrategyConfig& strategy,
                       const ChainFilterConfig& chain_filter,
                       const MarketDataConfig& market_data);

    DecisionBatch evaluate(const CycleSnapshot& snapshot) const;

    /**
     * A pending delta-triggered roll whose delta has come back in range may
     * be cancelled before the broker acknowledges it. Expiry-driven rolls
     * never reverse.
     */
    bool should_cancel(DecisionTrigger pending_trigger, const Position& pos, Date today) const;

    const PositionRebalancer& rebalancer() const { return rebalancer_; }
    PositionRebalancer& rebalancer() { return rebalancer_; }
    const OptionChainFilter& chain_filter() const { return filter_; }
    const DeltaMonitor& delta_monitor() const { return monitor_; }

private:
    struct Collateral {
        double cash{0.0};
        double shares{0.0};
    };

    struct Leg {
        ContractSelection selection;
        double required_cash{0.0};
        double required_shares{0.0};
    };

    enum class LegFailure {
        NONE,
        NO_ELIGIBLE_CONTRACT,
        INSUFFICIENT_COLLATERAL
    };

    StrategyConfig strategy_;
    PositionRebalancer rebalancer_;
    OptionChainFilter filter_;
    DeltaMonitor monitor_;

    Collateral free_collateral(const CycleSnapshot& snapshot) const;
    double put_collateral(Price strike) const;
    double call_collateral() const;

    std::vector<OptionRight> candidate_rights(SidePreference pref, int slot_id) const;

    // Pick and fund a new short leg at `expiration`
    std::optional<Leg> plan_leg(const CycleSnapshot& snapshot,
                                int slot_id,
                                Date expiration,
                                const Collateral& available,
                                LegFailure& failure,
                                std::string& failure_reason) const;

    RollDecision decide_slot(const CycleSnapshot& snapshot,
                             const ScheduleSlot& slot,
                             Collateral& collateral,
                             DecisionBatch& batch) const;

    SnapshotValues base_values(const CycleSnapshot& snapshot) const;

    void report(DecisionBatch& batch, const CycleSnapshot& snapshot, ConditionType type,
                int slot_id, const std::string& reason, const SnapshotValues& values,
                bool fatal = false) const;
};

} // namespace wheel
