#include "core/wheel_runner.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>

namespace wheel {

bool CycleResult::has_report(ConditionType type, int slot_id) const {
    for (const auto& r : reports) {
        if (r.type == type && r.slot_id == slot_id) return true;
    }
    return false;
}

WheelRunner::WheelRunner(const Config& config,
                         std::shared_ptr<BrokerClient> broker,
                         std::shared_ptr<DecisionLedger> ledger)
    : config_(config)
    , broker_(std::move(broker))
    , ledger_(std::move(ledger))
    , book_(std::make_shared<PositionBook>(config.strategy.contract_multiplier))
    , schedule_(config.strategy.num_slots, static_cast<unsigned>(config.strategy.expiry_weekday),
                config.chain_filter.expiry_tolerance_days)
    , engine_(config.strategy, config.chain_filter, config.market_data)
    , lifecycle_(std::make_unique<OrderLifecycleManager>(config.mode, config.strategy, broker_, book_))
    , reconciler_(broker_, config.strategy, config.chain_filter)
    , clock_([] { return wall_now(); })
{
    broker_->set_order_status_callback([this](const OrderStatusEvent& event) {
        enqueue_event(event);
    });

    broker_->set_connection_callback([this](ConnectionStatus status) {
        spdlog::info("Broker {} connection: {}", broker_->name(), conn_status_to_string(status));
        trigger();
    });

    lifecycle_->set_order_callback([this](const Order& order) {
        if (ledger_) ledger_->record_order(order);
        if (order.state == OrderState::ACKNOWLEDGED) WHEEL_HISTOGRAM("ack_latency").record(order.time_to_ack());
        if (order.state == OrderState::FILLED) WHEEL_COUNTER("orders_filled").increment();
        if (order.state == OrderState::REJECTED) WHEEL_COUNTER("orders_rejected").increment();
    });
}

WheelRunner::~WheelRunner() {
    stop();
    broker_->set_order_status_callback(nullptr);
    broker_->set_connection_callback(nullptr);
}

bool WheelRunner::initialize(WallClock now) {
    if (!broker_->is_connected() && !broker_->connect()) {
        spdlog::error("Cannot initialize: broker {} did not connect", broker_->name());
        return false;
    }

    auto result = reconciler_.reconcile(*book_, schedule_, now);
    for (const auto& report : result.reports) {
        spdlog::critical("{} slot {}: {}", condition_to_string(report.type), report.slot_id, report.reason);
        if (ledger_) ledger_->record_report(report);
    }
    if (ledger_) {
        ledger_->record_event("reconciliation", {
            {"success", result.success},
            {"anchor", time_utils::format_date(result.anchor)},
            {"positions_synced", result.positions_synced},
            {"unmanaged", result.unmanaged},
            {"discrepancies", result.discrepancies.size()},
            {"error", result.error_message}
        });
    }

    bool ok = result.success;
    reconciliation_ = std::move(result);
    if (!ok) return false;

    initialized_ = true;
    return true;
}

void WheelRunner::enqueue_event(const OrderStatusEvent& event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        events_.push_back(event);
        triggered_ = true;
    }
    queue_cv_.notify_one();
}

size_t WheelRunner::queued_events() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return events_.size();
}

void WheelRunner::trigger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        triggered_ = true;
    }
    queue_cv_.notify_one();
}

int WheelRunner::apply_events() {
    std::deque<OrderStatusEvent> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(events_);
    }
    for (const auto& event : batch) {
        lifecycle_->on_order_status(event);
    }
    return static_cast<int>(batch.size());
}

CycleResult WheelRunner::run_cycle(WallClock now) {
    CycleResult result;
    result.cycle = ++cycles_run_;
    result.time = now;

    ScopedLatency latency(WHEEL_HISTOGRAM("cycle_latency"));
    try {
        execute_cycle(result, now);
    } catch (const std::exception& e) {
        result.error = e.what();
        spdlog::error("Cycle {} failed: {}", result.cycle, e.what());
        if (ledger_) ledger_->record_event("cycle_error", {{"cycle", result.cycle}, {"error", result.error}});
        WHEEL_COUNTER("cycle_errors").increment();
    }

    publish(result);
    return result;
}

void WheelRunner::hold_cycle(CycleResult& result, WallClock now, Date today) {
    CycleSnapshot snapshot;
    snapshot.portfolio = last_portfolio_;
    snapshot.positions = book_->positions();
    snapshot.window = schedule_.window();
    snapshot.now = now;
    snapshot.today = today;
    snapshot.pending_order_slots = lifecycle_->pending_slots();
    snapshot.halted_slots = schedule_.halted_slots();
    snapshot.broker_connected = false;

    result.broker_connected = false;
    result.portfolio = last_portfolio_;
    result.batch = engine_.evaluate(snapshot);
    result.evaluated = true;
    for (const auto& r : result.batch.reports) result.reports.push_back(r);
}

int WheelRunner::cancel_reversed_intents(const std::vector<Position>& positions, Date today) {
    int canceled = 0;
    for (int slot_id : lifecycle_->pending_slots()) {
        if (lifecycle_->pending_action(slot_id) != DecisionAction::ROLL) continue;
        auto trigger = lifecycle_->pending_trigger(slot_id);
        if (!trigger || !lifecycle_->is_unacknowledged(slot_id)) continue;

        for (const auto& pos : positions) {
            if (pos.slot_id != slot_id || !pos.is_live() || pos.status == PositionStatus::PENDING_OPEN) continue;
            if (engine_.should_cancel(*trigger, pos, today) &&
                lifecycle_->cancel_slot_intent(slot_id, "delta back in range")) {
                canceled++;
            }
            break;
        }
    }
    return canceled;
}

void WheelRunner::execute_cycle(CycleResult& result, WallClock now) {
    Date today = time_utils::market_date(now);

    if (!initialized_ && !initialize(now)) {
        result.error = "initialization failed";
        if (!broker_->is_connected()) {
            result.broker_connected = false;
        }
        return;
    }

    result.events_applied = apply_events();

    // 1. Connectivity
    if (!broker_->is_connected()) {
        hold_cycle(result, now, today);
        spdlog::warn("Broker disconnected: holding all {} slots", result.batch.decisions.size());
        if (broker_->connect()) {
            spdlog::info("Broker reconnected, resuming next cycle");
        }
        return;
    }

    // 2. Portfolio and market snapshot
    const std::string& symbol = config_.strategy.symbol;
    auto balances = broker_->get_account_balances(symbol);
    if (!balances.success) {
        result.error = "balances unavailable: " + balances.error;
        spdlog::error("Cycle {}: {}", result.cycle, result.error);
        return;
    }
    auto chain = broker_->get_option_chain(symbol);
    if (!chain.success) {
        result.error = "option chain unavailable: " + chain.error;
        spdlog::error("Cycle {}: {}", result.cycle, result.error);
        return;
    }

    Price underlying = chain.chain.underlying_price();
    PortfolioState portfolio = engine_.rebalancer().assess(balances.cash, balances.shares_held,
                                                           balances.net_liquidation, underlying, now);
    last_portfolio_ = portfolio;
    result.portfolio = portfolio;

    WHEEL_GAUGE("cash").set(portfolio.cash_balance);
    WHEEL_GAUGE("shares").set(portfolio.shares_held);
    WHEEL_GAUGE("allocation_bias").set(portfolio.allocation_bias);

    // 3. Schedule: expire finished legs, rotate the window
    book_->expire_positions(today, now);
    result.retired_slots = schedule_.advance(today, book_->positions());
    for (int slot_id : result.retired_slots) {
        book_->clear_closed(slot_id);
    }

    // 4. Delta refresh
    std::vector<Position> positions = book_->positions();
    engine_.delta_monitor().update_positions(positions, chain.chain, now);
    book_->update_marks(positions);

    if (!time_utils::is_us_equity_market_hours(now)) {
        spdlog::warn("Outside regular market hours: greeks may be missing or stale");
        result.dispatch_skipped = config_.loop.market_hours_only;
    }

    // 5. Decide
    CycleSnapshot snapshot;
    snapshot.portfolio = portfolio;
    snapshot.positions = positions;
    snapshot.window = schedule_.window();
    snapshot.chain = std::move(chain.chain);
    snapshot.now = now;
    snapshot.today = today;
    snapshot.pending_order_slots = lifecycle_->pending_slots();
    snapshot.halted_slots = schedule_.halted_slots();
    snapshot.broker_connected = true;

    result.batch = engine_.evaluate(snapshot);
    result.evaluated = true;
    for (const auto& r : result.batch.reports) result.reports.push_back(r);

    for (int slot_id : result.batch.halt_requests) {
        schedule_.halt_slot(slot_id, "invariant violation");
    }

    // 6. Act
    result.intents_canceled = cancel_reversed_intents(positions, today);

    if (result.dispatch_skipped) {
        spdlog::info("Market closed: {} actions deferred", result.batch.action_count());
    } else {
        for (const auto& decision : result.batch.decisions) {
            if (decision.action == DecisionAction::HOLD) continue;
            auto dispatched = lifecycle_->dispatch(decision, now);
            if (dispatched.sent) result.orders_sent++;
        }
        result.orders_repriced = lifecycle_->reprice_working_orders(
            snapshot.chain, std::chrono::seconds(config_.loop.reprice_after_seconds));
    }

    // Every order update is journaled as it happens, so old terminal orders can go
    lifecycle_->prune_terminal_orders(std::chrono::seconds(config_.loop.order_retention_seconds));
}

void WheelRunner::publish(const CycleResult& result_in) {
    CycleResult result = result_in;

    // Lifecycle conditions raised while applying events and dispatching
    for (auto& r : lifecycle_->take_reports()) {
        result.reports.push_back(std::move(r));
    }

    for (const auto& d : result.batch.decisions) {
        WHEEL_COUNTER("decisions_" + action_to_string(d.action)).increment();
        if (d.action != DecisionAction::HOLD) {
            spdlog::info("Slot {}: {} ({}) {}", d.slot_id, action_to_string(d.action),
                         trigger_to_string(d.trigger), d.reason);
        }
        if (ledger_) ledger_->record_decision(result.cycle, d, result.time);
    }

    for (const auto& r : result.reports) {
        WHEEL_COUNTER("reports_" + condition_to_string(r.type)).increment();
        if (r.is_fatal) {
            spdlog::critical("{} slot {}: {}", condition_to_string(r.type), r.slot_id, r.reason);
        } else {
            spdlog::warn("{} slot {}: {}", condition_to_string(r.type), r.slot_id, r.reason);
        }
        if (ledger_) ledger_->record_report(r);
    }

    if (ledger_) {
        if (result.evaluated) ledger_->record_cycle(result.cycle, result.time, result.portfolio, result.retired_slots);
        ledger_->flush();
    }

    WHEEL_COUNTER("cycles").increment();
    spdlog::debug("Cycle {} done: {} events, {} sent, {} canceled, {} repriced", result.cycle,
                  result.events_applied, result.orders_sent, result.intents_canceled, result.orders_repriced);

    std::lock_guard<std::mutex> lock(result_mutex_);
    last_result_ = std::move(result);
}

CycleResult WheelRunner::last_result() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return last_result_;
}

void WheelRunner::start() {
    if (running_.exchange(true)) return;
    loop_thread_ = std::thread(&WheelRunner::loop, this);
    spdlog::info("Evaluation loop started: every {}s", config_.loop.evaluation_interval_seconds);
}

void WheelRunner::stop() {
    if (!running_.exchange(false)) return;
    queue_cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    spdlog::info("Evaluation loop stopped after {} cycles", cycles_run());
}

void WheelRunner::loop() {
    const auto interval = std::chrono::seconds(std::max(1, config_.loop.evaluation_interval_seconds));
    auto next_cycle = now();

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_until(lock, next_cycle, [this] { return triggered_ || !running_; });
            if (!running_) break;
            triggered_ = false;
        }

        run_cycle(clock_());

        if (now() >= next_cycle) {
            next_cycle = now() + interval;
        }
    }
}

} // namespace wheel
