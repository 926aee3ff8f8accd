#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace wheel {

struct StrategyConfig {
    std::string symbol{"F"};
    int target_shares{1000};                 // Long exposure to keep near
    double funding_amount{0.0};              // If > 0 and target_shares <= 0, derive target from funding
    int num_slots{5};                        // Weekly slots in the rolling window
    int contracts_per_slot{1};
    int contract_multiplier{100};

    double roll_delta_threshold{0.70};       // |delta| at or above this rolls the leg
    int min_days_to_expiry{1};               // Time-based roll threshold

    double neutral_band{0.05};               // |bias| inside this band allows either side
    double base_target_delta{0.20};          // Target |delta| at bias 0
    double max_target_delta{0.40};           // Target |delta| at |bias| 1
    double delta_band{0.05};                 // Acceptable distance from target
    double delta_floor{0.10};
    double delta_cap{0.45};
    double min_candidate_delta{0.05};        // Ignore far OTM contracts below this
    double max_strike_distance{0.15};        // Max fractional distance of strike from spot
    bool clean_strikes_only{false};          // Whole or half dollar strikes only

    double close_profit_fraction{0.0};       // Close when this fraction of credit is captured; 0 = off
    bool enforce_collateral{true};           // Cash-secured puts, covered calls
    int expiry_weekday{5};                   // 0 = Sunday, 5 = Friday
};

struct ChainFilterConfig {
    int expiry_tolerance_days{2};
    int64_t min_open_interest{0};
    double min_bid{0.01};
    double max_spread_abs{0.50};
    double max_spread_fraction{0.50};        // spread / mid
};

struct MarketDataConfig {
    int staleness_seconds{300};
    double risk_free_rate{0.045};
};

struct LoopConfig {
    int evaluation_interval_seconds{60};
    int reprice_after_seconds{120};          // Modify working orders to mid after this
    bool market_hours_only{false};           // Skip dispatch outside the regular session
    int order_retention_seconds{3600};       // Terminal orders kept for late broker reports
};

struct BrokerConfig {
    std::string host{"127.0.0.1"};
    int port{4002};                          // IB Gateway paper port
    int client_id{3};

    // Paper simulation
    double paper_starting_cash{50000.0};
    double paper_starting_shares{0.0};
    double paper_spot_price{12.0};
    double paper_implied_vol{0.35};
    double paper_strike_increment{0.5};
    int paper_strikes_per_side{10};
    int paper_weeks{8};
    bool paper_provide_greeks{true};
    bool paper_async_fills{false};           // Fill on a worker thread instead of process_pending()
    int paper_fill_latency_ms{50};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    TradingMode mode{TradingMode::DRY_RUN};

    StrategyConfig strategy;
    ChainFilterConfig chain_filter;
    MarketDataConfig market_data;
    LoopConfig loop;
    BrokerConfig broker;
    LoggingConfig logging;

    std::string decision_ledger_path{"./data/decisions.jsonl"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace wheel
