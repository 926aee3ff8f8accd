#include "execution/order.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace wheel {

Price Order::average_fill_price() const {
    if (filled_quantity <= 0) return 0.0;

    double total_value = 0.0;
    int total_qty = 0;
    for (const auto& fill : fills) {
        total_value += fill.price * fill.quantity;
        total_qty += fill.quantity;
    }
    return total_qty > 0 ? total_value / total_qty : 0.0;
}

bool Order::is_terminal() const {
    return state == OrderState::FILLED ||
           state == OrderState::CANCELED ||
           state == OrderState::REJECTED ||
           state == OrderState::EXPIRED;
}

Duration Order::time_to_ack() const {
    if (state == OrderState::PENDING || state == OrderState::SENT) {
        return Duration::zero();
    }
    return acked_at - sent_at;
}

void Order::mark_sent(const std::string& broker_id) {
    broker_order_id = broker_id;
    state = OrderState::SENT;
    sent_at = now();
    last_priced_at = sent_at;
}

void Order::mark_acknowledged() {
    // A fill may already have overtaken the ack
    if (state != OrderState::SENT) return;
    state = OrderState::ACKNOWLEDGED;
    acked_at = now();
    last_priced_at = acked_at;
}

void Order::apply_fill(int cumulative_quantity, Price average_price, WallClock time) {
    int increment = cumulative_quantity - filled_quantity;
    if (increment <= 0) return;

    // Recover this increment's price from the running average
    double prior_value = average_fill_price() * filled_quantity;
    double increment_price = (average_price * cumulative_quantity - prior_value) / increment;
    if (increment_price <= 0.0) increment_price = average_price;

    fills.push_back({increment_price, increment, time});
    filled_quantity = cumulative_quantity;
    last_fill_at = now();

    if (acked_at == Timestamp{}) acked_at = last_fill_at;

    if (filled_quantity >= quantity) {
        state = OrderState::FILLED;
        completed_at = now();
    } else {
        state = OrderState::PARTIAL;
    }
}

void Order::mark_filled() {
    state = OrderState::FILLED;
    completed_at = now();
}

void Order::mark_canceled() {
    state = OrderState::CANCELED;
    completed_at = now();
}

void Order::mark_rejected(const std::string& reason) {
    state = OrderState::REJECTED;
    reject_reason = reason;
    completed_at = now();
}

std::string generate_order_id() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    std::stringstream ss;
    ss << "ORD-" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return ss.str();
}

} // namespace wheel
