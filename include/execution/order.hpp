#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <vector>
#include "common/types.hpp"

namespace wheel {

struct Fill {
    Price price{0.0};
    int quantity{0};
    WallClock time;
};

// Why an order exists
enum class OrderPurpose {
    OPEN,         // Sell to open a slot
    CLOSE,        // Buy to close a slot
    ROLL_CLOSE,   // First leg of a roll
    ROLL_OPEN     // Second leg of a roll, sent after the close fills
};

inline std::string purpose_to_string(OrderPurpose p) {
    switch (p) {
        case OrderPurpose::OPEN: return "OPEN";
        case OrderPurpose::CLOSE: return "CLOSE";
        case OrderPurpose::ROLL_CLOSE: return "ROLL_CLOSE";
        case OrderPurpose::ROLL_OPEN: return "ROLL_OPEN";
    }
    return "UNKNOWN";
}

/**
 * Option order with full lifecycle tracking.
 */
struct Order {
    // Identifiers
    std::string client_order_id;   // Our internal ID
    std::string broker_order_id;   // Broker-assigned ID (after placement)
    int slot_id{-1};
    OrderPurpose purpose{OrderPurpose::OPEN};

    // Contract
    std::string contract_id;
    std::string symbol;
    OptionRight right{OptionRight::PUT};
    Price strike{0.0};
    Date expiration{};

    // Order details
    Side side{Side::SELL};
    OrderType type{OrderType::LIMIT};
    Price limit_price{0.0};
    int quantity{0};
    int filled_quantity{0};

    // State
    OrderState state{OrderState::PENDING};

    // Timing
    Timestamp created_at;
    Timestamp sent_at;
    Timestamp acked_at;
    Timestamp last_fill_at;
    Timestamp last_priced_at;
    Timestamp completed_at;

    // Fills
    std::vector<Fill> fills;

    // Error tracking
    std::string reject_reason;
    int modify_count{0};
    bool cancel_requested{false};

    // Computed values
    Price average_fill_price() const;
    int remaining() const { return quantity - filled_quantity; }
    bool is_terminal() const;
    bool is_working() const { return !is_terminal(); }
    Duration time_to_ack() const;

    // State transitions
    void mark_sent(const std::string& broker_id);
    void mark_acknowledged();
    // Broker reports cumulative filled quantity and average price
    void apply_fill(int cumulative_quantity, Price average_price, WallClock time);
    void mark_filled();
    void mark_canceled();
    void mark_rejected(const std::string& reason);
};

/**
 * Generate unique client order ID.
 */
std::string generate_order_id();

/**
 * Close-then-open pair for a roll. The open leg only exists once the close
 * leg has filled.
 */
struct RollOrder {
    std::string roll_id;
    int slot_id{-1};
    std::string close_order_id;                // Client order ids
    std::optional<std::string> open_order_id;
    std::string closing_contract_id;
    TargetContract replacement;

    enum class RollState {
        CLOSE_WORKING,
        OPEN_WORKING,
        COMPLETED,
        CLOSE_FAILED,   // Old leg still held
        OPEN_FAILED     // Old leg closed, replacement missing
    };

    RollState state{RollState::CLOSE_WORKING};
};

inline std::string roll_state_to_string(RollOrder::RollState s) {
    switch (s) {
        case RollOrder::RollState::CLOSE_WORKING: return "CLOSE_WORKING";
        case RollOrder::RollState::OPEN_WORKING: return "OPEN_WORKING";
        case RollOrder::RollState::COMPLETED: return "COMPLETED";
        case RollOrder::RollState::CLOSE_FAILED: return "CLOSE_FAILED";
        case RollOrder::RollState::OPEN_FAILED: return "OPEN_FAILED";
    }
    return "UNKNOWN";
}

} // namespace wheel
