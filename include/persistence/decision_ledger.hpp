#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "execution/order.hpp"

namespace wheel {

/**
 * Decision journal.
 * Writes every cycle, decision, condition report and order update as one
 * JSON line so a decision can be reconstructed offline. Write-only from the
 * engine's point of view.
 */
class DecisionLedger {
public:
    static constexpr size_t DEFAULT_MAX_FILE_SIZE = 100 * 1024 * 1024;  // 100MB

    explicit DecisionLedger(const std::string& path, size_t max_file_size = DEFAULT_MAX_FILE_SIZE);
    ~DecisionLedger();

    void record_cycle(int64_t cycle, WallClock time, const PortfolioState& portfolio,
                      const std::vector<int>& retired_slots);
    void record_decision(int64_t cycle, const RollDecision& decision, WallClock time);
    void record_report(const ConditionReport& report);
    void record_order(const Order& order);

    // Generic event recording
    void record_event(const std::string& event_type, const nlohmann::json& data);

    // Entries of one type (all when empty), for audit tooling and tests
    std::vector<nlohmann::json> read_entries(const std::string& event_type = "") const;

    // Ledger management
    void flush();
    void rotate();  // Start a new timestamped file
    size_t file_size() const;
    std::string current_path() const;
    bool is_open() const;

private:
    std::string base_path_;
    std::string current_path_;
    std::ofstream file_;
    size_t max_file_size_;
    size_t bytes_written_{0};
    mutable std::mutex mutex_;

    void open_file();
    void rotate_locked();
    void write_line(const nlohmann::json& j);
};

// JSON serialization for journal records
void to_json(nlohmann::json& j, const TargetContract& t);
void to_json(nlohmann::json& j, const RollDecision& d);
void to_json(nlohmann::json& j, const ConditionReport& r);
void to_json(nlohmann::json& j, const Order& o);
void to_json(nlohmann::json& j, const Position& p);

} // namespace wheel
