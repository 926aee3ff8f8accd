#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <map>
#include <vector>
#include <cstdint>

namespace wheel {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;
using Date = std::chrono::sys_days;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

using Price = double;
using Notional = double;

// Named numeric values attached to decisions and reports so a decision can be
// reconstructed offline.
using SnapshotValues = std::map<std::string, double>;

// Order side
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "BUY" : "SELL";
}

// Option right
enum class OptionRight {
    PUT,
    CALL
};

inline std::string right_to_string(OptionRight r) {
    return r == OptionRight::PUT ? "PUT" : "CALL";
}

// Order types
enum class OrderType {
    LIMIT,
    MARKET
};

inline std::string order_type_to_string(OrderType t) {
    switch (t) {
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::MARKET: return "MARKET";
    }
    return "UNKNOWN";
}

// Client-side order state
enum class OrderState {
    PENDING,      // Created but not sent
    SENT,         // Sent to broker
    ACKNOWLEDGED, // Broker confirmed receipt
    PARTIAL,      // Partially filled
    FILLED,       // Fully filled
    CANCELED,     // Canceled
    REJECTED,     // Rejected by broker
    EXPIRED       // Never answered
};

inline std::string order_state_to_string(OrderState s) {
    switch (s) {
        case OrderState::PENDING: return "PENDING";
        case OrderState::SENT: return "SENT";
        case OrderState::ACKNOWLEDGED: return "ACKNOWLEDGED";
        case OrderState::PARTIAL: return "PARTIAL";
        case OrderState::FILLED: return "FILLED";
        case OrderState::CANCELED: return "CANCELED";
        case OrderState::REJECTED: return "REJECTED";
        case OrderState::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

// Status values reported by the broker event stream
enum class BrokerOrderStatus {
    ACKED,
    FILLED,
    PARTIALLY_FILLED,
    REJECTED,
    CANCELLED
};

inline std::string broker_status_to_string(BrokerOrderStatus s) {
    switch (s) {
        case BrokerOrderStatus::ACKED: return "ACKED";
        case BrokerOrderStatus::FILLED: return "FILLED";
        case BrokerOrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case BrokerOrderStatus::REJECTED: return "REJECTED";
        case BrokerOrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

// Trading mode
enum class TradingMode {
    DRY_RUN,  // Compute decisions only, no orders
    PAPER,    // Simulated broker
    LIVE      // Real orders
};

inline std::string mode_to_string(TradingMode m) {
    switch (m) {
        case TradingMode::DRY_RUN: return "DRY_RUN";
        case TradingMode::PAPER: return "PAPER";
        case TradingMode::LIVE: return "LIVE";
    }
    return "UNKNOWN";
}

// Connection status
enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    ERROR
};

inline std::string conn_status_to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
        case ConnectionStatus::CONNECTING: return "CONNECTING";
        case ConnectionStatus::CONNECTED: return "CONNECTED";
        case ConnectionStatus::RECONNECTING: return "RECONNECTING";
        case ConnectionStatus::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// Position lifecycle status
enum class PositionStatus {
    PENDING_OPEN,
    OPEN,
    PENDING_ROLL,
    PENDING_CLOSE,
    CLOSED
};

inline std::string position_status_to_string(PositionStatus s) {
    switch (s) {
        case PositionStatus::PENDING_OPEN: return "PENDING_OPEN";
        case PositionStatus::OPEN: return "OPEN";
        case PositionStatus::PENDING_ROLL: return "PENDING_ROLL";
        case PositionStatus::PENDING_CLOSE: return "PENDING_CLOSE";
        case PositionStatus::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

// Weekly slot state
enum class SlotState {
    EMPTY,
    PENDING_OPEN,
    OPEN,
    PENDING_ROLL,
    PENDING_CLOSE,
    CLOSED,
    HALTED        // Automation stopped, needs manual intervention
};

inline std::string slot_state_to_string(SlotState s) {
    switch (s) {
        case SlotState::EMPTY: return "EMPTY";
        case SlotState::PENDING_OPEN: return "PENDING_OPEN";
        case SlotState::OPEN: return "OPEN";
        case SlotState::PENDING_ROLL: return "PENDING_ROLL";
        case SlotState::PENDING_CLOSE: return "PENDING_CLOSE";
        case SlotState::CLOSED: return "CLOSED";
        case SlotState::HALTED: return "HALTED";
    }
    return "UNKNOWN";
}

// Engine output per slot
enum class DecisionAction {
    HOLD,
    ROLL,
    CLOSE,
    OPEN
};

inline std::string action_to_string(DecisionAction a) {
    switch (a) {
        case DecisionAction::HOLD: return "HOLD";
        case DecisionAction::ROLL: return "ROLL";
        case DecisionAction::CLOSE: return "CLOSE";
        case DecisionAction::OPEN: return "OPEN";
    }
    return "UNKNOWN";
}

// Rule that produced a decision
enum class DecisionTrigger {
    NONE,
    EMPTY_SLOT,
    DELTA_BREACH,
    EXPIRY_PROXIMITY,
    PROFIT_TARGET
};

inline std::string trigger_to_string(DecisionTrigger t) {
    switch (t) {
        case DecisionTrigger::NONE: return "NONE";
        case DecisionTrigger::EMPTY_SLOT: return "EMPTY_SLOT";
        case DecisionTrigger::DELTA_BREACH: return "DELTA_BREACH";
        case DecisionTrigger::EXPIRY_PROXIMITY: return "EXPIRY_PROXIMITY";
        case DecisionTrigger::PROFIT_TARGET: return "PROFIT_TARGET";
    }
    return "UNKNOWN";
}

// Reportable conditions
enum class ConditionType {
    NO_ELIGIBLE_CONTRACT,    // Recoverable: slot held, retried next cycle
    STALE_MARKET_DATA,       // Recoverable: position excluded from roll logic
    PARTIAL_ROLL_FAILURE,    // Recoverable: slot unhedged until re-opened
    BROKER_DISCONNECTED,     // HOLD-only until reconnected
    INVARIANT_VIOLATION,     // Fatal to the affected slot
    INSUFFICIENT_COLLATERAL, // Recoverable: not enough cash/shares to cover
    ORDER_REJECTED           // Recoverable: broker refused an order
};

inline std::string condition_to_string(ConditionType c) {
    switch (c) {
        case ConditionType::NO_ELIGIBLE_CONTRACT: return "NoEligibleContract";
        case ConditionType::STALE_MARKET_DATA: return "StaleMarketData";
        case ConditionType::PARTIAL_ROLL_FAILURE: return "PartialRollFailure";
        case ConditionType::BROKER_DISCONNECTED: return "BrokerDisconnected";
        case ConditionType::INVARIANT_VIOLATION: return "InvariantViolation";
        case ConditionType::INSUFFICIENT_COLLATERAL: return "InsufficientCollateral";
        case ConditionType::ORDER_REJECTED: return "OrderRejected";
    }
    return "Unknown";
}

// Option contract quote from a chain snapshot
struct OptionContract {
    std::string contract_id;
    std::string symbol;
    OptionRight right{OptionRight::PUT};
    Price strike{0.0};
    Date expiration{};
    Price bid{0.0};
    Price ask{0.0};
    Price last{0.0};
    int64_t open_interest{0};
    std::optional<double> delta;        // Signed, if the data source provides it
    std::optional<double> implied_vol;  // Annualized
    WallClock quote_time;

    Price mid() const {
        if (bid > 0.0 && ask > 0.0) return (bid + ask) / 2.0;
        return last;
    }

    Price spread() const { return ask - bid; }
};

// Full chain for the underlying at one instant
struct ChainSnapshot {
    std::string symbol;
    Price underlying_last{0.0};
    Price underlying_close{0.0};
    Price underlying_bid{0.0};
    Price underlying_ask{0.0};
    WallClock as_of;
    std::vector<OptionContract> contracts;

    // Last, then close, then bid/ask midpoint. 0 when nothing usable.
    Price underlying_price() const {
        if (underlying_last > 0.0) return underlying_last;
        if (underlying_close > 0.0) return underlying_close;
        if (underlying_bid > 0.0 && underlying_ask > 0.0) {
            return (underlying_bid + underlying_ask) / 2.0;
        }
        return 0.0;
    }
};

// One short option leg held (or pending) in a weekly slot
struct Position {
    int slot_id{-1};
    std::string contract_id;
    OptionRight right{OptionRight::PUT};
    Price strike{0.0};
    Date expiration{};
    int quantity{0};            // Negative = short
    double delta{0.0};          // Last observed, signed
    PositionStatus status{PositionStatus::PENDING_OPEN};
    Price open_price{0.0};      // Premium received per share
    Price mark_price{0.0};      // Last observed mid
    bool stale{false};
    WallClock opened_at;
    WallClock last_update;

    bool is_live() const { return status != PositionStatus::CLOSED; }
};

// Portfolio snapshot, recomputed at the start of every cycle
struct PortfolioState {
    double cash_balance{0.0};
    double shares_held{0.0};
    int target_shares{0};
    double allocation_bias{0.0};  // [-1, 1], negative = cash heavy
    Price underlying_price{0.0};
    double equity_value{0.0};
    double net_liquidation{0.0};
    double equity_ratio{0.0};     // equity / net liquidation
    WallClock as_of;
};

// Contract the engine wants opened
struct TargetContract {
    std::string contract_id;
    OptionRight right{OptionRight::PUT};
    Price strike{0.0};
    Date expiration{};
    double delta{0.0};
    Price limit_price{0.0};
};

struct RollDecision {
    int slot_id{-1};
    DecisionAction action{DecisionAction::HOLD};
    DecisionTrigger trigger{DecisionTrigger::NONE};
    std::optional<TargetContract> target_contract;
    std::string reason;
    SnapshotValues snapshot;
};

struct ConditionReport {
    ConditionType type{ConditionType::NO_ELIGIBLE_CONTRACT};
    int slot_id{-1};  // -1 = engine wide
    std::string reason;
    SnapshotValues snapshot;
    WallClock time;
    bool is_fatal{false};
};

// Order status update from the broker event stream
struct OrderStatusEvent {
    std::string broker_order_id;
    BrokerOrderStatus status{BrokerOrderStatus::ACKED};
    int filled_quantity{0};     // Cumulative contracts filled
    Price fill_price{0.0};      // Average fill price
    std::string message;
    WallClock time;
};

} // namespace wheel
