#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace wheel {

/**
 * Position book tracks the short option leg of every slot plus premium PnL.
 *
 * Holds at most one live (non-CLOSED) position per slot. CLOSED records stay
 * until the slot opens again or the window advances past it.
 */
class PositionBook {
public:
    explicit PositionBook(int contract_multiplier = 100);

    // New PENDING_OPEN leg; replaces an order-less placeholder and drops the slot's CLOSED records
    Position open_pending(int slot_id, const TargetContract& target, int quantity, WallClock time);

    // Open fill: PENDING_OPEN -> OPEN at the fill price
    bool record_open_fill(int slot_id, const std::string& contract_id, Price fill_price,
                          int filled_quantity, WallClock time);

    // Close fill: leg -> CLOSED, realizes premium minus buyback
    bool record_close_fill(int slot_id, const std::string& contract_id, Price fill_price,
                           int filled_quantity, WallClock time);

    bool set_status(int slot_id, const std::string& contract_id, PositionStatus status);

    // Expired worthless or settled: no buyback
    bool mark_expired(int slot_id, const std::string& contract_id, WallClock time);

    // Marks every live leg that expired before `today` CLOSED; returns how many
    int expire_positions(Date today, WallClock time);

    void clear_closed(int slot_id);

    // Copy delta, mark and stale flag from a refreshed snapshot
    void update_marks(const std::vector<Position>& refreshed);

    // Append a leg as reported by the broker, without touching the slot's other records
    void adopt(const Position& pos);

    // Replace everything, used when rebuilding from broker truth
    void load(std::vector<Position> positions);

    // Query positions
    std::optional<Position> live_position(int slot_id) const;
    std::vector<Position> positions() const;
    std::vector<Position> live_positions() const;
    int live_count(int slot_id) const;

    // PnL queries
    Notional premium_collected() const;
    Notional buyback_cost() const;
    Notional realized_pnl() const;
    Notional unrealized_pnl() const;

private:
    mutable std::mutex mutex_;
    std::vector<Position> positions_;
    int multiplier_;

    Notional premium_collected_{0.0};
    Notional buyback_cost_{0.0};
    Notional realized_pnl_{0.0};

    Position* find(int slot_id, const std::string& contract_id);
};

} // namespace wheel
