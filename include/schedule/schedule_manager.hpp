#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace wheel {

struct ScheduleSlot {
    int slot_id{-1};
    Date target_expiration{};
};

/**
 * Ordered view of the weekly slots, earliest expiration first.
 */
struct ScheduleWindow {
    std::vector<ScheduleSlot> slots;

    const ScheduleSlot* find(int slot_id) const;
    std::vector<int> slot_ids() const;
    bool is_earliest(int slot_id) const;
    Date earliest() const;
    Date farthest() const;
    size_t size() const { return slots.size(); }
    bool empty() const { return slots.empty(); }
};

/**
 * Schedule manager.
 *
 * Owns the N weekly slots as a fixed array of target expirations indexed by
 * slot_id plus a rotating head. Advancing the window retires the earliest
 * slot and re-appends the same slot_id one week after the farthest slot, so
 * it is an index rotation with one new trailing date.
 *
 * Invariant: exactly N slots whose target expirations increase by exactly
 * seven days from head to tail.
 */
class ScheduleManager {
public:
    ScheduleManager(int num_slots, unsigned expiry_weekday, int match_tolerance_days);

    int num_slots() const { return num_slots_; }
    bool initialized() const { return initialized_; }

    // First expiry weekday at least one week after `today`
    Date default_anchor(Date today) const;

    // Slots at anchor, anchor + 7, ... with slot 0 first
    void initialize(Date anchor);

    ScheduleWindow window() const;

    std::optional<Date> target_for(int slot_id) const;
    int earliest_slot() const { return head_; }

    // One week after the farthest slot; where an earliest-slot roll lands
    Date next_expiration() const;

    /**
     * Advance the window. While the earliest slot has a CLOSED record and no
     * live position, has no live position and its target date has passed,
     * or holds a live position expiring beyond its target (rolled out), it is
     * retired and re-appended at farthest + 7. Returns the retired slot ids
     * in retirement order.
     */
    std::vector<int> advance(Date today, const std::vector<Position>& positions);

    bool is_valid() const;

    SlotState slot_state(int slot_id, const std::vector<Position>& positions) const;

    // Automation stops for a halted slot until resumed
    void halt_slot(int slot_id, const std::string& reason);
    void resume_slot(int slot_id);
    bool is_halted(int slot_id) const;
    std::set<int> halted_slots() const;
    std::string halt_reason(int slot_id) const;

    // Slot whose target is within the match tolerance of `expiration`
    std::optional<int> slot_for_expiration(Date expiration) const;

private:
    int num_slots_;
    unsigned expiry_weekday_;
    int match_tolerance_days_;
    bool initialized_{false};

    std::vector<Date> targets_;     // Indexed by slot_id
    int head_{0};                   // slot_id with the earliest target

    std::map<int, std::string> halted_;

    Date farthest() const;
    void retire_earliest();
};

} // namespace wheel
