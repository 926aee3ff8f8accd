#include "execution/order_lifecycle_manager.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace wheel {

namespace {

constexpr size_t kMaxEarlyEvents = 1000;

Price round_to_cents(Price p) {
    return std::round(p * 100.0) / 100.0;
}

} // namespace

OrderLifecycleManager::OrderLifecycleManager(TradingMode mode,
                                             const StrategyConfig& strategy,
                                             std::shared_ptr<BrokerClient> broker,
                                             std::shared_ptr<PositionBook> book)
    : mode_(mode)
    , strategy_(strategy)
    , broker_(std::move(broker))
    , book_(std::move(book))
{
    spdlog::info("OrderLifecycleManager initialized in {} mode", mode_to_string(mode_));
}

Order OrderLifecycleManager::make_order(int slot_id, OrderPurpose purpose, Side side,
                                        const std::string& contract_id, OptionRight right,
                                        Price strike, Date expiration, Price limit_price,
                                        int quantity) const {
    Order order;
    order.client_order_id = generate_order_id();
    order.slot_id = slot_id;
    order.purpose = purpose;
    order.contract_id = contract_id;
    order.symbol = strategy_.symbol;
    order.right = right;
    order.strike = strike;
    order.expiration = expiration;
    order.side = side;
    order.type = OrderType::LIMIT;
    order.limit_price = limit_price;
    order.quantity = quantity;
    order.created_at = now();
    return order;
}

Order OrderLifecycleManager::make_open_order(int slot_id, OrderPurpose purpose, const TargetContract& target) const {
    return make_order(slot_id, purpose, Side::SELL, target.contract_id, target.right, target.strike,
                      target.expiration, round_to_cents(target.limit_price), strategy_.contracts_per_slot);
}

Order OrderLifecycleManager::make_close_order(int slot_id, OrderPurpose purpose, const Position& pos,
                                              Price limit_price) const {
    return make_order(slot_id, purpose, Side::BUY, pos.contract_id, pos.right, pos.strike,
                      pos.expiration, limit_price, std::abs(pos.quantity));
}

bool OrderLifecycleManager::send(Order& order) {
    OrderRequest req;
    req.client_order_id = order.client_order_id;
    req.contract_id = order.contract_id;
    req.symbol = order.symbol;
    req.right = order.right;
    req.strike = order.strike;
    req.expiration = order.expiration;
    req.side = order.side;
    req.quantity = order.quantity;
    req.type = order.type;
    req.limit_price = order.limit_price;

    auto result = broker_->place_order(req);
    orders_submitted_++;

    if (!result.success) {
        order.mark_rejected(result.error);
        orders_[order.client_order_id] = order;
        orders_rejected_++;
        spdlog::warn("Order {} for slot {} refused: {}", order.client_order_id, order.slot_id, result.error);
        notify(order);
        return false;
    }

    order.mark_sent(result.broker_order_id);
    orders_[order.client_order_id] = order;
    broker_to_client_[result.broker_order_id] = order.client_order_id;

    spdlog::info("Order sent: slot {} {} {} {} x{} @ {:.2f} ({} / {})", order.slot_id,
                 purpose_to_string(order.purpose), side_to_string(order.side), order.contract_id,
                 order.quantity, order.limit_price, order.client_order_id, order.broker_order_id);
    notify(order);
    return true;
}

void OrderLifecycleManager::replay_early_events(const std::string& broker_order_id) {
    auto it = early_events_.find(broker_order_id);
    if (it == early_events_.end()) return;

    std::vector<OrderStatusEvent> events = std::move(it->second);
    early_events_.erase(it);
    for (const auto& event : events) {
        on_order_status(event);
    }
}

void OrderLifecycleManager::log_dry_run(const RollDecision& decision) const {
    if (decision.target_contract) {
        const auto& t = *decision.target_contract;
        spdlog::info("[DRY-RUN] Slot {}: would {} -> SELL {} {} {} exp {} @ {:.2f} x{}",
                     decision.slot_id, action_to_string(decision.action), t.contract_id,
                     right_to_string(t.right), t.strike, time_utils::format_date(t.expiration),
                     round_to_cents(t.limit_price), strategy_.contracts_per_slot);
    } else {
        spdlog::info("[DRY-RUN] Slot {}: would {} ({})", decision.slot_id,
                     action_to_string(decision.action), decision.reason);
    }
}

OrderLifecycleManager::DispatchResult OrderLifecycleManager::dispatch(const RollDecision& decision, WallClock now) {
    DispatchResult result;
    if (decision.action == DecisionAction::HOLD) return result;

    if (mode_ == TradingMode::DRY_RUN) {
        log_dry_run(decision);
        return result;
    }

    if (intents_.count(decision.slot_id)) {
        result.error = fmt::format("slot {} already has an order in flight", decision.slot_id);
        spdlog::warn("Dispatch skipped: {}", result.error);
        return result;
    }

    if (decision.action == DecisionAction::OPEN) {
        return dispatch_open(decision, now);
    }

    auto live = book_->live_position(decision.slot_id);
    if (!live || live->status != PositionStatus::OPEN) {
        result.error = fmt::format("slot {} has no OPEN position to {}", decision.slot_id,
                                   action_to_string(decision.action));
        spdlog::warn("Dispatch skipped: {}", result.error);
        return result;
    }

    if (decision.action == DecisionAction::CLOSE) {
        return dispatch_close(decision, *live);
    }
    return dispatch_roll(decision, *live);
}

OrderLifecycleManager::DispatchResult OrderLifecycleManager::dispatch_open(const RollDecision& decision, WallClock now) {
    DispatchResult result;

    if (!decision.target_contract) {
        result.error = "OPEN without target contract";
        spdlog::error("Slot {}: {}", decision.slot_id, result.error);
        return result;
    }

    auto live = book_->live_position(decision.slot_id);
    if (live && live->status != PositionStatus::PENDING_OPEN) {
        result.error = fmt::format("OPEN targets slot {} which holds {} ({})", decision.slot_id,
                                   live->contract_id, position_status_to_string(live->status));
        report(ConditionType::INVARIANT_VIOLATION, decision.slot_id, result.error,
               {{"strike", live->strike}, {"new_strike", decision.target_contract->strike}}, true);
        return result;
    }

    const auto& target = *decision.target_contract;
    book_->open_pending(decision.slot_id, target, -strategy_.contracts_per_slot, now);

    Order order = make_open_order(decision.slot_id, OrderPurpose::OPEN, target);
    if (!send(order)) {
        result.error = order.reject_reason;
        report(ConditionType::ORDER_REJECTED, decision.slot_id,
               fmt::format("open {} refused: {}", target.contract_id, order.reject_reason),
               {{"strike", target.strike}, {"limit_price", order.limit_price}});
        return result;
    }

    SlotIntent intent;
    intent.slot_id = decision.slot_id;
    intent.action = DecisionAction::OPEN;
    intent.trigger = decision.trigger;
    intent.working_order_id = order.client_order_id;
    intent.created_at = order.created_at;
    intents_[decision.slot_id] = intent;

    result.sent = true;
    result.order_id = order.client_order_id;
    replay_early_events(order.broker_order_id);
    return result;
}

OrderLifecycleManager::DispatchResult OrderLifecycleManager::dispatch_close(const RollDecision& decision, const Position& pos) {
    DispatchResult result;

    Price limit = round_to_cents(std::max(0.01, pos.mark_price));
    book_->set_status(decision.slot_id, pos.contract_id, PositionStatus::PENDING_CLOSE);

    Order order = make_close_order(decision.slot_id, OrderPurpose::CLOSE, pos, limit);
    if (!send(order)) {
        book_->set_status(decision.slot_id, pos.contract_id, PositionStatus::OPEN);
        result.error = order.reject_reason;
        report(ConditionType::ORDER_REJECTED, decision.slot_id,
               fmt::format("close {} refused: {}", pos.contract_id, order.reject_reason),
               {{"strike", pos.strike}, {"limit_price", limit}});
        return result;
    }

    SlotIntent intent;
    intent.slot_id = decision.slot_id;
    intent.action = DecisionAction::CLOSE;
    intent.trigger = decision.trigger;
    intent.working_order_id = order.client_order_id;
    intent.created_at = order.created_at;
    intents_[decision.slot_id] = intent;

    result.sent = true;
    result.order_id = order.client_order_id;
    replay_early_events(order.broker_order_id);
    return result;
}

OrderLifecycleManager::DispatchResult OrderLifecycleManager::dispatch_roll(const RollDecision& decision, const Position& pos) {
    DispatchResult result;

    if (!decision.target_contract) {
        result.error = "ROLL without target contract";
        spdlog::error("Slot {}: {}", decision.slot_id, result.error);
        return result;
    }

    Price limit = round_to_cents(std::max(0.01, pos.mark_price));
    book_->set_status(decision.slot_id, pos.contract_id, PositionStatus::PENDING_ROLL);

    Order close = make_close_order(decision.slot_id, OrderPurpose::ROLL_CLOSE, pos, limit);
    if (!send(close)) {
        book_->set_status(decision.slot_id, pos.contract_id, PositionStatus::OPEN);
        result.error = close.reject_reason;
        report(ConditionType::ORDER_REJECTED, decision.slot_id,
               fmt::format("roll close {} refused: {}", pos.contract_id, close.reject_reason),
               {{"strike", pos.strike}, {"limit_price", limit}, {"delta", pos.delta}});
        return result;
    }

    RollOrder roll;
    roll.roll_id = generate_order_id();
    roll.slot_id = decision.slot_id;
    roll.close_order_id = close.client_order_id;
    roll.closing_contract_id = pos.contract_id;
    roll.replacement = *decision.target_contract;

    SlotIntent intent;
    intent.slot_id = decision.slot_id;
    intent.action = DecisionAction::ROLL;
    intent.trigger = decision.trigger;
    intent.working_order_id = close.client_order_id;
    intent.roll = roll;
    intent.created_at = close.created_at;
    intents_[decision.slot_id] = intent;

    spdlog::info("Slot {} roll {} started ({}): close {} then open {}", decision.slot_id, roll.roll_id,
                 trigger_to_string(decision.trigger), pos.contract_id, roll.replacement.contract_id);

    result.sent = true;
    result.order_id = close.client_order_id;
    replay_early_events(close.broker_order_id);
    return result;
}

void OrderLifecycleManager::send_roll_open(SlotIntent& intent) {
    RollOrder& roll = *intent.roll;
    WallClock t = wall_now();

    book_->open_pending(intent.slot_id, roll.replacement, -strategy_.contracts_per_slot, t);

    Order open = make_open_order(intent.slot_id, OrderPurpose::ROLL_OPEN, roll.replacement);
    if (!send(open)) {
        roll.state = RollOrder::RollState::OPEN_FAILED;
        partial_roll_failures_++;
        report(ConditionType::PARTIAL_ROLL_FAILURE, intent.slot_id,
               fmt::format("closed {} but open {} refused: {}; slot unhedged",
                           roll.closing_contract_id, roll.replacement.contract_id, open.reject_reason),
               {{"new_strike", roll.replacement.strike}, {"new_limit_price", open.limit_price}});
        intents_.erase(intent.slot_id);
        return;
    }

    roll.open_order_id = open.client_order_id;
    roll.state = RollOrder::RollState::OPEN_WORKING;
    intent.working_order_id = open.client_order_id;
    replay_early_events(open.broker_order_id);
}

void OrderLifecycleManager::on_order_status(const OrderStatusEvent& event) {
    auto mapping = broker_to_client_.find(event.broker_order_id);
    if (mapping == broker_to_client_.end()) {
        size_t held = 0;
        for (const auto& [id, events] : early_events_) held += events.size();
        if (held < kMaxEarlyEvents) {
            early_events_[event.broker_order_id].push_back(event);
            spdlog::debug("Holding {} event for unknown order {}", broker_status_to_string(event.status),
                          event.broker_order_id);
        } else {
            spdlog::warn("Dropping {} event for unknown order {}", broker_status_to_string(event.status),
                         event.broker_order_id);
        }
        return;
    }

    auto it = orders_.find(mapping->second);
    if (it == orders_.end()) return;
    Order& order = it->second;

    if (order.is_terminal()) {
        // The broker's fill report wins over an assumed cancel
        if (event.status == BrokerOrderStatus::FILLED && order.state == OrderState::CANCELED) {
            spdlog::warn("Order {} filled after cancel, reconciling slot {} from the fill",
                         order.client_order_id, order.slot_id);
            order.apply_fill(event.filled_quantity > 0 ? event.filled_quantity : order.quantity,
                             event.fill_price, event.time);
            order.mark_filled();
            orders_filled_++;
            handle_fill(order, true);
            notify(order);
        } else {
            spdlog::debug("Ignoring {} for terminal order {} ({})", broker_status_to_string(event.status),
                          order.client_order_id, order_state_to_string(order.state));
        }
        return;
    }

    switch (event.status) {
        case BrokerOrderStatus::ACKED:
            order.mark_acknowledged();
            spdlog::debug("Order {} acknowledged", order.client_order_id);
            break;

        case BrokerOrderStatus::PARTIALLY_FILLED:
            order.apply_fill(event.filled_quantity, event.fill_price, event.time);
            spdlog::info("Order {} partial fill {}/{} @ {:.2f}", order.client_order_id,
                         order.filled_quantity, order.quantity, event.fill_price);
            if (order.state == OrderState::FILLED) {
                orders_filled_++;
                handle_fill(order, false);
            }
            break;

        case BrokerOrderStatus::FILLED:
            order.apply_fill(event.filled_quantity > 0 ? event.filled_quantity : order.quantity,
                             event.fill_price, event.time);
            order.mark_filled();
            orders_filled_++;
            handle_fill(order, false);
            break;

        case BrokerOrderStatus::REJECTED:
            order.mark_rejected(event.message);
            orders_rejected_++;
            handle_failure(order, true);
            break;

        case BrokerOrderStatus::CANCELLED:
            order.mark_canceled();
            handle_failure(order, false);
            break;
    }

    notify(order);
}

void OrderLifecycleManager::finish_intent(int slot_id, const std::string& order_id) {
    auto it = intents_.find(slot_id);
    if (it != intents_.end() && it->second.working_order_id == order_id) {
        intents_.erase(it);
    }
}

void OrderLifecycleManager::handle_fill(Order& order, bool after_cancel) {
    Price price = order.average_fill_price();
    int qty = order.filled_quantity;
    WallClock t = order.fills.empty() ? wall_now() : order.fills.back().time;

    switch (order.purpose) {
        case OrderPurpose::OPEN:
        case OrderPurpose::ROLL_OPEN: {
            if (!book_->record_open_fill(order.slot_id, order.contract_id, price, qty, t)) {
                // Placeholder already replaced; the fill is still held at the broker
                Position pos;
                pos.slot_id = order.slot_id;
                pos.contract_id = order.contract_id;
                pos.right = order.right;
                pos.strike = order.strike;
                pos.expiration = order.expiration;
                pos.quantity = -qty;
                pos.status = PositionStatus::OPEN;
                pos.open_price = price;
                pos.mark_price = price;
                pos.opened_at = t;
                pos.last_update = t;
                book_->adopt(pos);
                spdlog::warn("Slot {} adopted late fill of {}", order.slot_id, order.contract_id);
            }

            auto it = intents_.find(order.slot_id);
            if (order.purpose == OrderPurpose::ROLL_OPEN && it != intents_.end() && it->second.roll &&
                it->second.working_order_id == order.client_order_id) {
                it->second.roll->state = RollOrder::RollState::COMPLETED;
                rolls_completed_++;
                spdlog::info("Slot {} roll {} complete: {} sold @ {:.2f}", order.slot_id,
                             it->second.roll->roll_id, order.contract_id, price);
            } else {
                spdlog::info("Slot {} opened: {} sold x{} @ {:.2f}", order.slot_id, order.contract_id, qty, price);
            }
            finish_intent(order.slot_id, order.client_order_id);
            break;
        }

        case OrderPurpose::CLOSE:
            book_->record_close_fill(order.slot_id, order.contract_id, price, qty, t);
            spdlog::info("Slot {} closed: {} bought back x{} @ {:.2f}", order.slot_id, order.contract_id, qty, price);
            finish_intent(order.slot_id, order.client_order_id);
            break;

        case OrderPurpose::ROLL_CLOSE: {
            book_->record_close_fill(order.slot_id, order.contract_id, price, qty, t);

            auto it = intents_.find(order.slot_id);
            bool ours = it != intents_.end() && it->second.roll &&
                        it->second.working_order_id == order.client_order_id;
            if (!ours) {
                partial_roll_failures_++;
                report(ConditionType::PARTIAL_ROLL_FAILURE, order.slot_id,
                       fmt::format("roll close {} filled {}; slot unhedged", order.contract_id,
                                   after_cancel ? "after cancel" : "without a pending roll"),
                       {{"fill_price", price}, {"strike", order.strike}});
                break;
            }

            if (order.cancel_requested) {
                spdlog::warn("Slot {} roll close filled despite cancel request, completing roll", order.slot_id);
            }
            spdlog::info("Slot {} roll close filled @ {:.2f}, sending open leg", order.slot_id, price);
            send_roll_open(it->second);
            break;
        }
    }
}

void OrderLifecycleManager::handle_failure(Order& order, bool rejected) {
    const char* what = rejected ? "rejected" : "cancelled";
    WallClock t = wall_now();
    SnapshotValues values{{"strike", order.strike}, {"limit_price", order.limit_price},
                          {"filled_quantity", static_cast<double>(order.filled_quantity)}};

    switch (order.purpose) {
        case OrderPurpose::OPEN:
            if (order.filled_quantity > 0) {
                book_->record_open_fill(order.slot_id, order.contract_id, order.average_fill_price(),
                                        order.filled_quantity, t);
                spdlog::warn("Slot {} open {} {} after partial fill {}/{}", order.slot_id,
                             order.contract_id, what, order.filled_quantity, order.quantity);
            } else if (rejected) {
                report(ConditionType::ORDER_REJECTED, order.slot_id,
                       fmt::format("open {} rejected: {}", order.contract_id, order.reject_reason), values);
            } else {
                spdlog::info("Slot {} open {} cancelled", order.slot_id, order.contract_id);
            }
            break;

        case OrderPurpose::CLOSE:
        case OrderPurpose::ROLL_CLOSE:
            if (order.filled_quantity > 0) {
                book_->record_close_fill(order.slot_id, order.contract_id, order.average_fill_price(),
                                         order.filled_quantity, t);
            }
            book_->set_status(order.slot_id, order.contract_id, PositionStatus::OPEN);

            if (order.purpose == OrderPurpose::ROLL_CLOSE) {
                auto it = intents_.find(order.slot_id);
                if (it != intents_.end() && it->second.roll) {
                    it->second.roll->state = RollOrder::RollState::CLOSE_FAILED;
                    spdlog::warn("Slot {} roll {} {}", order.slot_id, it->second.roll->roll_id,
                                 roll_state_to_string(it->second.roll->state));
                }
            }

            if (rejected) {
                report(ConditionType::ORDER_REJECTED, order.slot_id,
                       fmt::format("{} {} rejected, leg still held: {}", purpose_to_string(order.purpose),
                                   order.contract_id, order.reject_reason), values);
            } else {
                spdlog::info("Slot {} {} {} cancelled, leg still held", order.slot_id,
                             purpose_to_string(order.purpose), order.contract_id);
            }
            break;

        case OrderPurpose::ROLL_OPEN: {
            if (order.filled_quantity > 0) {
                book_->record_open_fill(order.slot_id, order.contract_id, order.average_fill_price(),
                                        order.filled_quantity, t);
            }

            auto it = intents_.find(order.slot_id);
            if (it != intents_.end() && it->second.roll) {
                it->second.roll->state = RollOrder::RollState::OPEN_FAILED;
                spdlog::warn("Slot {} roll {} {}", order.slot_id, it->second.roll->roll_id,
                             roll_state_to_string(it->second.roll->state));
            }
            partial_roll_failures_++;
            report(ConditionType::PARTIAL_ROLL_FAILURE, order.slot_id,
                   fmt::format("roll open {} {} after close filled: {}; slot unhedged until re-opened",
                               order.contract_id, what,
                               order.reject_reason.empty() ? std::string(what) : order.reject_reason),
                   values);
            break;
        }
    }

    finish_intent(order.slot_id, order.client_order_id);
}

bool OrderLifecycleManager::cancel_slot_intent(int slot_id, const std::string& reason) {
    auto it = intents_.find(slot_id);
    if (it == intents_.end()) return false;

    auto order_it = orders_.find(it->second.working_order_id);
    if (order_it == orders_.end()) return false;

    Order& order = order_it->second;
    if (order.is_terminal() || order.cancel_requested) return false;

    auto result = broker_->cancel_order(order.broker_order_id);
    if (!result.success) {
        spdlog::warn("Cancel of {} for slot {} failed: {}", order.client_order_id, slot_id, result.error);
        return false;
    }

    order.cancel_requested = true;
    spdlog::info("Cancel requested for slot {} order {}: {}", slot_id, order.client_order_id, reason);
    return true;
}

int OrderLifecycleManager::reprice_working_orders(const ChainSnapshot& chain, std::chrono::seconds after) {
    if (mode_ == TradingMode::DRY_RUN) return 0;

    int modified = 0;
    auto t = now();

    for (const auto& [slot_id, intent] : intents_) {
        auto it = orders_.find(intent.working_order_id);
        if (it == orders_.end()) continue;
        Order& order = it->second;

        if (order.state != OrderState::ACKNOWLEDGED && order.state != OrderState::PARTIAL) continue;
        if (order.cancel_requested) continue;
        if (t - order.last_priced_at < after) continue;

        auto quote = std::find_if(chain.contracts.begin(), chain.contracts.end(),
                                  [&order](const OptionContract& c) { return c.contract_id == order.contract_id; });
        order.last_priced_at = t;
        if (quote == chain.contracts.end()) continue;

        Price mid = round_to_cents(quote->mid());
        if (mid <= 0.0 || std::abs(mid - order.limit_price) < 0.005) continue;

        ModifyParams params;
        params.limit_price = mid;
        auto result = broker_->modify_order(order.broker_order_id, params);
        if (!result.success) {
            spdlog::warn("Reprice of {} failed: {}", order.client_order_id, result.error);
            continue;
        }

        spdlog::info("Slot {} order {} repriced {:.2f} -> {:.2f}", slot_id, order.client_order_id,
                     order.limit_price, mid);
        order.limit_price = mid;
        order.modify_count++;
        modified++;
        notify(order);
    }
    return modified;
}

int OrderLifecycleManager::prune_terminal_orders(std::chrono::seconds retain) {
    std::set<std::string> referenced;
    for (const auto& [slot_id, intent] : intents_) {
        referenced.insert(intent.working_order_id);
        if (intent.roll) {
            referenced.insert(intent.roll->close_order_id);
            if (intent.roll->open_order_id) referenced.insert(*intent.roll->open_order_id);
        }
    }

    Timestamp cutoff = now() - retain;
    int pruned = 0;
    for (auto it = orders_.begin(); it != orders_.end();) {
        const Order& order = it->second;
        if (!order.is_terminal() || referenced.count(order.client_order_id) || order.completed_at > cutoff) {
            ++it;
            continue;
        }
        if (!order.broker_order_id.empty()) broker_to_client_.erase(order.broker_order_id);
        it = orders_.erase(it);
        pruned++;
    }

    if (pruned > 0) {
        spdlog::debug("Pruned {} terminal orders, {} tracked", pruned, orders_.size());
    }
    return pruned;
}

std::set<int> OrderLifecycleManager::pending_slots() const {
    std::set<int> slots;
    for (const auto& [slot_id, intent] : intents_) slots.insert(slot_id);
    return slots;
}

std::optional<DecisionTrigger> OrderLifecycleManager::pending_trigger(int slot_id) const {
    auto it = intents_.find(slot_id);
    if (it == intents_.end()) return std::nullopt;
    return it->second.trigger;
}

std::optional<DecisionAction> OrderLifecycleManager::pending_action(int slot_id) const {
    auto it = intents_.find(slot_id);
    if (it == intents_.end()) return std::nullopt;
    return it->second.action;
}

bool OrderLifecycleManager::is_unacknowledged(int slot_id) const {
    auto order = working_order(slot_id);
    return order && order->state == OrderState::SENT;
}

std::vector<ConditionReport> OrderLifecycleManager::take_reports() {
    std::vector<ConditionReport> out;
    out.swap(reports_);
    return out;
}

std::optional<Order> OrderLifecycleManager::get_order(const std::string& client_order_id) const {
    auto it = orders_.find(client_order_id);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

std::optional<Order> OrderLifecycleManager::working_order(int slot_id) const {
    auto it = intents_.find(slot_id);
    if (it == intents_.end()) return std::nullopt;
    return get_order(it->second.working_order_id);
}

std::vector<Order> OrderLifecycleManager::get_open_orders() const {
    std::vector<Order> result;
    for (const auto& [id, order] : orders_) {
        if (order.is_working()) result.push_back(order);
    }
    return result;
}

void OrderLifecycleManager::report(ConditionType type, int slot_id, const std::string& reason,
                                   SnapshotValues values, bool fatal) {
    ConditionReport r;
    r.type = type;
    r.slot_id = slot_id;
    r.reason = reason;
    r.snapshot = std::move(values);
    r.time = wall_now();
    r.is_fatal = fatal;
    reports_.push_back(std::move(r));
}

void OrderLifecycleManager::notify(const Order& order) const {
    if (on_order_update_) on_order_update_(order);
}

} // namespace wheel
