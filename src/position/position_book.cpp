#include "position/position_book.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace wheel {

PositionBook::PositionBook(int contract_multiplier)
    : multiplier_(contract_multiplier)
{
}

Position* PositionBook::find(int slot_id, const std::string& contract_id) {
    Position* closed = nullptr;
    for (auto& p : positions_) {
        if (p.slot_id != slot_id || p.contract_id != contract_id) continue;
        if (p.is_live()) return &p;
        closed = &p;
    }
    return closed;
}

Position PositionBook::open_pending(int slot_id, const TargetContract& target, int quantity, WallClock time) {
    std::lock_guard<std::mutex> lock(mutex_);

    positions_.erase(std::remove_if(positions_.begin(), positions_.end(), [slot_id](const Position& p) {
        return p.slot_id == slot_id &&
               (p.status == PositionStatus::CLOSED || p.status == PositionStatus::PENDING_OPEN);
    }), positions_.end());

    Position pos;
    pos.slot_id = slot_id;
    pos.contract_id = target.contract_id;
    pos.right = target.right;
    pos.strike = target.strike;
    pos.expiration = target.expiration;
    pos.quantity = quantity;
    pos.delta = target.delta;
    pos.status = PositionStatus::PENDING_OPEN;
    pos.mark_price = target.limit_price;
    pos.opened_at = time;
    pos.last_update = time;
    positions_.push_back(pos);

    spdlog::debug("Slot {} pending open: {} {} {} exp {}", slot_id, pos.contract_id,
                  right_to_string(pos.right), pos.strike, time_utils::format_date(pos.expiration));
    return pos;
}

bool PositionBook::record_open_fill(int slot_id, const std::string& contract_id, Price fill_price,
                                    int filled_quantity, WallClock time) {
    std::lock_guard<std::mutex> lock(mutex_);

    Position* pos = find(slot_id, contract_id);
    if (pos == nullptr || !pos->is_live()) return false;

    pos->status = PositionStatus::OPEN;
    pos->open_price = fill_price;
    pos->quantity = -std::abs(filled_quantity);
    pos->mark_price = fill_price;
    pos->opened_at = time;
    pos->last_update = time;

    Notional premium = fill_price * std::abs(filled_quantity) * multiplier_;
    premium_collected_ += premium;

    spdlog::debug("Slot {} opened {} x{} @ {:.2f}, premium {:.2f}", slot_id, contract_id,
                  filled_quantity, fill_price, premium);
    return true;
}

bool PositionBook::record_close_fill(int slot_id, const std::string& contract_id, Price fill_price,
                                     int filled_quantity, WallClock time) {
    std::lock_guard<std::mutex> lock(mutex_);

    Position* pos = find(slot_id, contract_id);
    if (pos == nullptr || !pos->is_live()) return false;

    int held = std::abs(pos->quantity);
    int closed = std::min(held, std::abs(filled_quantity));

    Notional cost = fill_price * closed * multiplier_;
    Notional realized = (pos->open_price - fill_price) * closed * multiplier_;
    buyback_cost_ += cost;
    realized_pnl_ += realized;

    pos->last_update = time;
    pos->mark_price = fill_price;

    if (closed >= held) {
        pos->status = PositionStatus::CLOSED;
        pos->quantity = 0;
    } else {
        pos->quantity = -(held - closed);
    }

    spdlog::debug("Slot {} bought back {} x{} @ {:.2f}, realized {:.2f}", slot_id, contract_id,
                  closed, fill_price, realized);
    return true;
}

bool PositionBook::set_status(int slot_id, const std::string& contract_id, PositionStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);

    Position* pos = find(slot_id, contract_id);
    if (pos == nullptr) return false;
    pos->status = status;
    return true;
}

bool PositionBook::mark_expired(int slot_id, const std::string& contract_id, WallClock time) {
    std::lock_guard<std::mutex> lock(mutex_);

    Position* pos = find(slot_id, contract_id);
    if (pos == nullptr || !pos->is_live()) return false;

    if (pos->status != PositionStatus::PENDING_OPEN) {
        realized_pnl_ += pos->open_price * std::abs(pos->quantity) * multiplier_;
    }
    pos->status = PositionStatus::CLOSED;
    pos->quantity = 0;
    pos->last_update = time;
    return true;
}

int PositionBook::expire_positions(Date today, WallClock time) {
    std::vector<std::pair<int, std::string>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& p : positions_) {
            if (p.is_live() && p.expiration < today) {
                expired.emplace_back(p.slot_id, p.contract_id);
            }
        }
    }

    for (const auto& [slot_id, contract_id] : expired) {
        mark_expired(slot_id, contract_id, time);
        spdlog::info("Slot {} {} expired", slot_id, contract_id);
    }
    return static_cast<int>(expired.size());
}

void PositionBook::clear_closed(int slot_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    positions_.erase(std::remove_if(positions_.begin(), positions_.end(), [slot_id](const Position& p) {
        return p.slot_id == slot_id && p.status == PositionStatus::CLOSED;
    }), positions_.end());
}

void PositionBook::update_marks(const std::vector<Position>& refreshed) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& r : refreshed) {
        Position* pos = find(r.slot_id, r.contract_id);
        if (pos == nullptr || !pos->is_live()) continue;
        pos->delta = r.delta;
        pos->stale = r.stale;
        pos->mark_price = r.mark_price;
        pos->last_update = r.last_update;
    }
}

void PositionBook::adopt(const Position& pos) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_.push_back(pos);
}

void PositionBook::load(std::vector<Position> positions) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_ = std::move(positions);
}

std::optional<Position> PositionBook::live_position(int slot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& p : positions_) {
        if (p.slot_id == slot_id && p.is_live()) return p;
    }
    return std::nullopt;
}

std::vector<Position> PositionBook::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_;
}

std::vector<Position> PositionBook::live_positions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Position> result;
    for (const auto& p : positions_) {
        if (p.is_live()) result.push_back(p);
    }
    return result;
}

int PositionBook::live_count(int slot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    return static_cast<int>(std::count_if(positions_.begin(), positions_.end(), [slot_id](const Position& p) {
        return p.slot_id == slot_id && p.is_live();
    }));
}

Notional PositionBook::premium_collected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return premium_collected_;
}

Notional PositionBook::buyback_cost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buyback_cost_;
}

Notional PositionBook::realized_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return realized_pnl_;
}

Notional PositionBook::unrealized_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Notional total = 0.0;
    for (const auto& p : positions_) {
        if (p.status == PositionStatus::CLOSED || p.status == PositionStatus::PENDING_OPEN) continue;
        total += (p.open_price - p.mark_price) * std::abs(p.quantity) * multiplier_;
    }
    return total;
}

} // namespace wheel
