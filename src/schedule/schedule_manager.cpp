#include "schedule/schedule_manager.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace wheel {

namespace {
constexpr std::chrono::days kWeek{7};
}

const ScheduleSlot* ScheduleWindow::find(int slot_id) const {
    for (const auto& s : slots) {
        if (s.slot_id == slot_id) return &s;
    }
    return nullptr;
}

std::vector<int> ScheduleWindow::slot_ids() const {
    std::vector<int> ids;
    ids.reserve(slots.size());
    for (const auto& s : slots) ids.push_back(s.slot_id);
    return ids;
}

bool ScheduleWindow::is_earliest(int slot_id) const {
    return !slots.empty() && slots.front().slot_id == slot_id;
}

Date ScheduleWindow::earliest() const {
    return slots.empty() ? Date{} : slots.front().target_expiration;
}

Date ScheduleWindow::farthest() const {
    return slots.empty() ? Date{} : slots.back().target_expiration;
}

ScheduleManager::ScheduleManager(int num_slots, unsigned expiry_weekday, int match_tolerance_days)
    : num_slots_(num_slots)
    , expiry_weekday_(expiry_weekday)
    , match_tolerance_days_(match_tolerance_days)
    , targets_(static_cast<size_t>(std::max(num_slots, 0)))
{
    if (num_slots < 1) {
        throw std::invalid_argument("ScheduleManager needs at least one slot");
    }
}

Date ScheduleManager::default_anchor(Date today) const {
    return time_utils::first_weekly_expiration(today, expiry_weekday_, 7);
}

void ScheduleManager::initialize(Date anchor) {
    for (int i = 0; i < num_slots_; ++i) {
        targets_[i] = anchor + kWeek * i;
    }
    head_ = 0;
    initialized_ = true;

    spdlog::info("Schedule initialized: {} slots from {} to {}",
                 num_slots_, time_utils::format_date(anchor),
                 time_utils::format_date(farthest()));
}

ScheduleWindow ScheduleManager::window() const {
    ScheduleWindow w;
    if (!initialized_) return w;

    w.slots.reserve(num_slots_);
    for (int i = 0; i < num_slots_; ++i) {
        int id = (head_ + i) % num_slots_;
        w.slots.push_back({id, targets_[id]});
    }
    return w;
}

std::optional<Date> ScheduleManager::target_for(int slot_id) const {
    if (!initialized_ || slot_id < 0 || slot_id >= num_slots_) return std::nullopt;
    return targets_[slot_id];
}

Date ScheduleManager::farthest() const {
    return targets_[(head_ + num_slots_ - 1) % num_slots_];
}

Date ScheduleManager::next_expiration() const {
    return farthest() + kWeek;
}

void ScheduleManager::retire_earliest() {
    Date next = next_expiration();
    int retired = head_;
    targets_[retired] = next;
    head_ = (head_ + 1) % num_slots_;

    spdlog::info("Schedule advanced: slot {} re-targeted to {}",
                 retired, time_utils::format_date(next));
}

std::vector<int> ScheduleManager::advance(Date today, const std::vector<Position>& positions) {
    std::vector<int> retired;
    if (!initialized_) return retired;

    std::set<int> retired_this_call;

    // Each retirement moves the slot a week forward, so the date rule runs
    // out; the record rules apply at most once per slot per call.
    while (true) {
        int id = head_;
        Date target = targets_[id];

        const Position* live = nullptr;
        bool has_closed = false;
        for (const auto& p : positions) {
            if (p.slot_id != id) continue;
            if (p.is_live()) live = &p;
            else has_closed = true;
        }

        bool already = retired_this_call.count(id) > 0;
        bool closed_out = !already && has_closed && live == nullptr;
        bool passed = live == nullptr && today > target;
        bool rolled_out = !already && live != nullptr &&
            time_utils::days_between(target, live->expiration) > match_tolerance_days_;

        if (!(closed_out || passed || rolled_out)) break;

        if (rolled_out) {
            spdlog::debug("Slot {} rolled out to {}, retiring target {}", id,
                          time_utils::format_date(live->expiration),
                          time_utils::format_date(target));
        }

        retire_earliest();
        retired.push_back(id);
        retired_this_call.insert(id);
    }

    return retired;
}

bool ScheduleManager::is_valid() const {
    if (!initialized_) return false;

    auto w = window();
    if (static_cast<int>(w.slots.size()) != num_slots_) return false;

    std::set<int> ids;
    for (size_t i = 0; i < w.slots.size(); ++i) {
        ids.insert(w.slots[i].slot_id);
        if (i > 0 && w.slots[i].target_expiration - w.slots[i - 1].target_expiration != kWeek) {
            return false;
        }
    }
    return static_cast<int>(ids.size()) == num_slots_;
}

SlotState ScheduleManager::slot_state(int slot_id, const std::vector<Position>& positions) const {
    if (is_halted(slot_id)) return SlotState::HALTED;

    bool has_closed = false;
    for (const auto& p : positions) {
        if (p.slot_id != slot_id) continue;
        switch (p.status) {
            case PositionStatus::PENDING_OPEN: return SlotState::PENDING_OPEN;
            case PositionStatus::OPEN: return SlotState::OPEN;
            case PositionStatus::PENDING_ROLL: return SlotState::PENDING_ROLL;
            case PositionStatus::PENDING_CLOSE: return SlotState::PENDING_CLOSE;
            case PositionStatus::CLOSED: has_closed = true; break;
        }
    }
    return has_closed ? SlotState::CLOSED : SlotState::EMPTY;
}

void ScheduleManager::halt_slot(int slot_id, const std::string& reason) {
    if (halted_.count(slot_id)) return;
    halted_[slot_id] = reason;
    spdlog::critical("Slot {} halted, manual intervention required: {}", slot_id, reason);
}

void ScheduleManager::resume_slot(int slot_id) {
    if (halted_.erase(slot_id) > 0) {
        spdlog::warn("Slot {} resumed", slot_id);
    }
}

bool ScheduleManager::is_halted(int slot_id) const {
    return halted_.count(slot_id) > 0;
}

std::set<int> ScheduleManager::halted_slots() const {
    std::set<int> ids;
    for (const auto& [id, reason] : halted_) ids.insert(id);
    return ids;
}

std::string ScheduleManager::halt_reason(int slot_id) const {
    auto it = halted_.find(slot_id);
    return it != halted_.end() ? it->second : std::string{};
}

std::optional<int> ScheduleManager::slot_for_expiration(Date expiration) const {
    if (!initialized_) return std::nullopt;

    std::optional<int> best;
    int best_distance = match_tolerance_days_ + 1;
    for (int id = 0; id < num_slots_; ++id) {
        int distance = std::abs(time_utils::days_between(targets_[id], expiration));
        if (distance <= match_tolerance_days_ && distance < best_distance) {
            best = id;
            best_distance = distance;
        }
    }
    return best;
}

} // namespace wheel
