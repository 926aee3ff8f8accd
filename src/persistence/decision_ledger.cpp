#include "persistence/decision_ledger.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace wheel {

void to_json(nlohmann::json& j, const TargetContract& t) {
    j = nlohmann::json{
        {"contract_id", t.contract_id},
        {"right", right_to_string(t.right)},
        {"strike", t.strike},
        {"expiration", time_utils::format_date(t.expiration)},
        {"delta", t.delta},
        {"limit_price", t.limit_price}
    };
}

void to_json(nlohmann::json& j, const RollDecision& d) {
    j = nlohmann::json{
        {"slot_id", d.slot_id},
        {"action", action_to_string(d.action)},
        {"trigger", trigger_to_string(d.trigger)},
        {"reason", d.reason},
        {"snapshot", d.snapshot}
    };
    if (d.target_contract) {
        j["target_contract"] = *d.target_contract;
    }
}

void to_json(nlohmann::json& j, const ConditionReport& r) {
    j = nlohmann::json{
        {"type", condition_to_string(r.type)},
        {"slot_id", r.slot_id},
        {"reason", r.reason},
        {"snapshot", r.snapshot},
        {"time", time_utils::to_iso8601(r.time)},
        {"fatal", r.is_fatal}
    };
}

void to_json(nlohmann::json& j, const Order& o) {
    j = nlohmann::json{
        {"client_order_id", o.client_order_id},
        {"broker_order_id", o.broker_order_id},
        {"slot_id", o.slot_id},
        {"purpose", purpose_to_string(o.purpose)},
        {"contract_id", o.contract_id},
        {"right", right_to_string(o.right)},
        {"strike", o.strike},
        {"expiration", time_utils::format_date(o.expiration)},
        {"side", side_to_string(o.side)},
        {"type", order_type_to_string(o.type)},
        {"limit_price", o.limit_price},
        {"quantity", o.quantity},
        {"filled_quantity", o.filled_quantity},
        {"average_fill_price", o.average_fill_price()},
        {"state", order_state_to_string(o.state)},
        {"modify_count", o.modify_count},
        {"reject_reason", o.reject_reason}
    };
}

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{
        {"slot_id", p.slot_id},
        {"contract_id", p.contract_id},
        {"right", right_to_string(p.right)},
        {"strike", p.strike},
        {"expiration", time_utils::format_date(p.expiration)},
        {"quantity", p.quantity},
        {"delta", p.delta},
        {"status", position_status_to_string(p.status)},
        {"open_price", p.open_price},
        {"mark_price", p.mark_price},
        {"stale", p.stale}
    };
}

DecisionLedger::DecisionLedger(const std::string& path, size_t max_file_size)
    : base_path_(path)
    , current_path_(path)
    , max_file_size_(max_file_size)
{
    open_file();
}

DecisionLedger::~DecisionLedger() {
    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void DecisionLedger::open_file() {
    std::filesystem::path p(current_path_);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create ledger directory {}: {}", p.parent_path().string(), ec.message());
        }
    }

    file_.open(current_path_, std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open decision ledger: {}", current_path_);
        return;
    }

    auto existing = std::filesystem::file_size(current_path_, ec);
    bytes_written_ = ec ? 0 : static_cast<size_t>(existing);
    spdlog::info("Decision ledger opened: {}", current_path_);
}

void DecisionLedger::write_line(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) return;

    std::string line = j.dump();
    file_ << line << "\n";
    bytes_written_ += line.size() + 1;

    if (bytes_written_ >= max_file_size_) {
        rotate_locked();
    }
}

void DecisionLedger::record_cycle(int64_t cycle, WallClock time, const PortfolioState& portfolio,
                                  const std::vector<int>& retired_slots) {
    nlohmann::json j;
    j["event_type"] = "cycle";
    j["timestamp"] = time_utils::to_iso8601(time);
    j["data"] = {
        {"cycle", cycle},
        {"cash", portfolio.cash_balance},
        {"shares", portfolio.shares_held},
        {"target_shares", portfolio.target_shares},
        {"bias", portfolio.allocation_bias},
        {"underlying", portfolio.underlying_price},
        {"net_liquidation", portfolio.net_liquidation},
        {"retired_slots", retired_slots}
    };
    write_line(j);
}

void DecisionLedger::record_decision(int64_t cycle, const RollDecision& decision, WallClock time) {
    nlohmann::json j;
    j["event_type"] = "decision";
    j["timestamp"] = time_utils::to_iso8601(time);
    j["cycle"] = cycle;
    j["data"] = decision;
    write_line(j);
}

void DecisionLedger::record_report(const ConditionReport& report) {
    nlohmann::json j;
    j["event_type"] = "report";
    j["timestamp"] = time_utils::to_iso8601(report.time);
    j["data"] = report;
    write_line(j);
}

void DecisionLedger::record_order(const Order& order) {
    nlohmann::json j;
    j["event_type"] = "order";
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = order;
    write_line(j);
}

void DecisionLedger::record_event(const std::string& event_type, const nlohmann::json& data) {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = data;
    write_line(j);
}

std::vector<nlohmann::json> DecisionLedger::read_entries(const std::string& event_type) const {
    std::vector<nlohmann::json> entries;

    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = current_path_;
    }

    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        try {
            auto j = nlohmann::json::parse(line);
            if (event_type.empty() || j.value("event_type", "") == event_type) {
                entries.push_back(std::move(j));
            }
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("Skipping malformed ledger line in {}: {}", path, e.what());
        }
    }
    return entries;
}

void DecisionLedger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void DecisionLedger::rotate() {
    std::lock_guard<std::mutex> lock(mutex_);
    rotate_locked();
}

void DecisionLedger::rotate_locked() {
    if (file_.is_open()) {
        file_.close();
    }

    // Move the full file aside so the base path always holds the newest entries
    auto now_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = *std::localtime(&now_time);

    std::ostringstream ss;
    ss << base_path_ << "." << std::put_time(&tm, "%Y%m%d_%H%M%S");

    std::error_code ec;
    std::filesystem::rename(base_path_, ss.str(), ec);
    if (ec) {
        spdlog::warn("Failed to rotate decision ledger {}: {}", base_path_, ec.message());
    } else {
        spdlog::info("Decision ledger rotated to {}", ss.str());
    }

    current_path_ = base_path_;
    open_file();
}

size_t DecisionLedger::file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    auto size = std::filesystem::file_size(current_path_, ec);
    return ec ? 0 : static_cast<size_t>(size);
}

std::string DecisionLedger::current_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_path_;
}

bool DecisionLedger::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

} // namespace wheel
