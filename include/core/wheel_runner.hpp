#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "broker/broker_client.hpp"
#include "core/reconciler.hpp"
#include "engine/roll_decision_engine.hpp"
#include "execution/order_lifecycle_manager.hpp"
#include "persistence/decision_ledger.hpp"
#include "position/position_book.hpp"
#include "schedule/schedule_manager.hpp"

namespace wheel {

struct CycleResult {
    int64_t cycle{0};
    WallClock time;
    bool evaluated{false};          // Engine ran
    bool broker_connected{true};
    bool dispatch_skipped{false};   // Outside market hours with market_hours_only
    PortfolioState portfolio;
    DecisionBatch batch;
    std::vector<int> retired_slots;
    std::vector<ConditionReport> reports;   // Engine and lifecycle, in emission order
    int events_applied{0};
    int orders_sent{0};
    int intents_canceled{0};
    int orders_repriced{0};
    std::string error;

    bool has_report(ConditionType type, int slot_id) const;
};

/**
 * Evaluation loop.
 *
 * Owns the position book, schedule, order lifecycle and decision engine;
 * only the thread running cycles touches them. Broker status events are
 * queued from any thread and applied at the start of the next cycle, so
 * every decision in a cycle sees one consistent snapshot.
 *
 * Cycles run on the evaluation interval, on order events and on trigger().
 * Triggers arriving while a cycle runs coalesce into one follow-up cycle.
 */
class WheelRunner {
public:
    WheelRunner(const Config& config,
                std::shared_ptr<BrokerClient> broker,
                std::shared_ptr<DecisionLedger> ledger = nullptr);
    ~WheelRunner();

    WheelRunner(const WheelRunner&) = delete;
    WheelRunner& operator=(const WheelRunner&) = delete;

    // Connect and rebuild state from the broker. Run before the first cycle.
    bool initialize(WallClock now);

    // One full cycle; never throws
    CycleResult run_cycle(WallClock now);
    CycleResult run_cycle() { return run_cycle(clock_()); }

    // Background loop
    void start();
    void stop();
    bool is_running() const { return running_.load(); }
    void trigger();

    // Queue a broker status event for the next cycle
    void enqueue_event(const OrderStatusEvent& event);
    size_t queued_events() const;

    void set_clock(std::function<WallClock()> clock) { clock_ = std::move(clock); }

    const PositionBook& book() const { return *book_; }
    ScheduleManager& schedule() { return schedule_; }
    const ScheduleManager& schedule() const { return schedule_; }
    OrderLifecycleManager& lifecycle() { return *lifecycle_; }
    const RollDecisionEngine& engine() const { return engine_; }
    const std::optional<ReconciliationResult>& reconciliation() const { return reconciliation_; }
    bool initialized() const { return initialized_; }

    int64_t cycles_run() const { return cycles_run_.load(); }
    CycleResult last_result() const;

private:
    Config config_;
    std::shared_ptr<BrokerClient> broker_;
    std::shared_ptr<DecisionLedger> ledger_;
    std::shared_ptr<PositionBook> book_;
    ScheduleManager schedule_;
    RollDecisionEngine engine_;
    std::unique_ptr<OrderLifecycleManager> lifecycle_;
    Reconciler reconciler_;
    std::optional<ReconciliationResult> reconciliation_;
    bool initialized_{false};

    std::function<WallClock()> clock_;
    PortfolioState last_portfolio_;

    std::atomic<bool> running_{false};
    std::atomic<int64_t> cycles_run_{0};
    std::thread loop_thread_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<OrderStatusEvent> events_;
    bool triggered_{false};

    mutable std::mutex result_mutex_;
    CycleResult last_result_;

    void loop();
    void execute_cycle(CycleResult& result, WallClock now);
    int apply_events();
    void hold_cycle(CycleResult& result, WallClock now, Date today);
    int cancel_reversed_intents(const std::vector<Position>& positions, Date today);
    void publish(const CycleResult& result);
};

} // namespace wheel
