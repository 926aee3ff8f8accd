#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "broker/broker_client.hpp"
#include "execution/order.hpp"
#include "position/position_book.hpp"

namespace wheel {

/**
 * Order lifecycle manager.
 *
 * Turns decisions into orders and reconciles broker status events back into
 * the position book. OPEN and CLOSE send one order; ROLL sends the buy to
 * close first and the sell to open only after the close fills. Events are
 * matched by broker order id and may arrive in any order; an event that
 * arrives before its order id is known is held and replayed.
 *
 * Not thread-safe: owned and driven by the evaluation loop.
 */
class OrderLifecycleManager {
public:
    using OrderCallback = std::function<void(const Order&)>;

    struct DispatchResult {
        bool sent{false};
        std::string order_id;
        std::string error;
    };

    OrderLifecycleManager(TradingMode mode,
                          const StrategyConfig& strategy,
                          std::shared_ptr<BrokerClient> broker,
                          std::shared_ptr<PositionBook> book);

    DispatchResult dispatch(const RollDecision& decision, WallClock now);

    void on_order_status(const OrderStatusEvent& event);

    /**
     * Best-effort cancel of the slot's working order. The broker's report
     * decides the outcome: a fill that races the cancel wins.
     */
    bool cancel_slot_intent(int slot_id, const std::string& reason);

    // Modify acknowledged orders older than `after` to the current mid
    int reprice_working_orders(const ChainSnapshot& chain, std::chrono::seconds after);

    /**
     * Forget terminal orders that no intent references once they have been
     * terminal for `retain`. A late fill for a pruned order is treated like
     * an event for an unknown order. Returns orders dropped.
     */
    int prune_terminal_orders(std::chrono::seconds retain);
    size_t tracked_orders() const { return orders_.size(); }

    // Slots with an order in flight
    std::set<int> pending_slots() const;
    bool has_intent(int slot_id) const { return intents_.count(slot_id) > 0; }
    std::optional<DecisionTrigger> pending_trigger(int slot_id) const;
    std::optional<DecisionAction> pending_action(int slot_id) const;
    bool is_unacknowledged(int slot_id) const;

    // Conditions raised while handling dispatches and events
    std::vector<ConditionReport> take_reports();

    std::optional<Order> get_order(const std::string& client_order_id) const;
    std::optional<Order> working_order(int slot_id) const;
    std::vector<Order> get_open_orders() const;

    void set_order_callback(OrderCallback cb) { on_order_update_ = std::move(cb); }

    // Stats
    int64_t orders_submitted() const { return orders_submitted_.load(); }
    int64_t orders_filled() const { return orders_filled_.load(); }
    int64_t orders_rejected() const { return orders_rejected_.load(); }
    int64_t rolls_completed() const { return rolls_completed_.load(); }
    int64_t partial_roll_failures() const { return partial_roll_failures_.load(); }

    TradingMode mode() const { return mode_; }

private:
    struct SlotIntent {
        int slot_id{-1};
        DecisionAction action{DecisionAction::HOLD};
        DecisionTrigger trigger{DecisionTrigger::NONE};
        std::string working_order_id;
        std::optional<RollOrder> roll;
        Timestamp created_at;
    };

    TradingMode mode_;
    StrategyConfig strategy_;
    std::shared_ptr<BrokerClient> broker_;
    std::shared_ptr<PositionBook> book_;

    std::map<std::string, Order> orders_;                 // By client order id
    std::map<std::string, std::string> broker_to_client_;
    std::map<std::string, std::vector<OrderStatusEvent>> early_events_;
    std::map<int, SlotIntent> intents_;                   // By slot id
    std::vector<ConditionReport> reports_;

    OrderCallback on_order_update_;

    std::atomic<int64_t> orders_submitted_{0};
    std::atomic<int64_t> orders_filled_{0};
    std::atomic<int64_t> orders_rejected_{0};
    std::atomic<int64_t> rolls_completed_{0};
    std::atomic<int64_t> partial_roll_failures_{0};

    DispatchResult dispatch_open(const RollDecision& decision, WallClock now);
    DispatchResult dispatch_close(const RollDecision& decision, const Position& pos);
    DispatchResult dispatch_roll(const RollDecision& decision, const Position& pos);
    void log_dry_run(const RollDecision& decision) const;

    Order make_order(int slot_id, OrderPurpose purpose, Side side, const std::string& contract_id,
                     OptionRight right, Price strike, Date expiration, Price limit_price, int quantity) const;
    Order make_open_order(int slot_id, OrderPurpose purpose, const TargetContract& target) const;
    Order make_close_order(int slot_id, OrderPurpose purpose, const Position& pos, Price limit_price) const;

    // Places the order and records it; false when the broker refused it
    bool send(Order& order);

    void send_roll_open(SlotIntent& intent);
    void replay_early_events(const std::string& broker_order_id);

    void handle_fill(Order& order, bool after_cancel);
    void handle_failure(Order& order, bool rejected);
    void finish_intent(int slot_id, const std::string& order_id);

    void report(ConditionType type, int slot_id, const std::string& reason,
                SnapshotValues values, bool fatal = false);
    void notify(const Order& order) const;
};

} // namespace wheel
