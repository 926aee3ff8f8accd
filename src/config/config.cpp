#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace wheel {

void to_json(nlohmann::json& j, const StrategyConfig& c) {
    j = nlohmann::json{
        {"symbol", c.symbol},
        {"target_shares", c.target_shares},
        {"funding_amount", c.funding_amount},
        {"num_slots", c.num_slots},
        {"contracts_per_slot", c.contracts_per_slot},
        {"contract_multiplier", c.contract_multiplier},
        {"roll_delta_threshold", c.roll_delta_threshold},
        {"min_days_to_expiry", c.min_days_to_expiry},
        {"neutral_band", c.neutral_band},
        {"base_target_delta", c.base_target_delta},
        {"max_target_delta", c.max_target_delta},
        {"delta_band", c.delta_band},
        {"delta_floor", c.delta_floor},
        {"delta_cap", c.delta_cap},
        {"min_candidate_delta", c.min_candidate_delta},
        {"max_strike_distance", c.max_strike_distance},
        {"clean_strikes_only", c.clean_strikes_only},
        {"close_profit_fraction", c.close_profit_fraction},
        {"enforce_collateral", c.enforce_collateral},
        {"expiry_weekday", c.expiry_weekday}
    };
}

void from_json(const nlohmann::json& j, StrategyConfig& c) {
    if (j.contains("symbol")) j.at("symbol").get_to(c.symbol);
    if (j.contains("target_shares")) j.at("target_shares").get_to(c.target_shares);
    if (j.contains("funding_amount")) j.at("funding_amount").get_to(c.funding_amount);
    if (j.contains("num_slots")) j.at("num_slots").get_to(c.num_slots);
    if (j.contains("contracts_per_slot")) j.at("contracts_per_slot").get_to(c.contracts_per_slot);
    if (j.contains("contract_multiplier")) j.at("contract_multiplier").get_to(c.contract_multiplier);
    if (j.contains("roll_delta_threshold")) j.at("roll_delta_threshold").get_to(c.roll_delta_threshold);
    if (j.contains("min_days_to_expiry")) j.at("min_days_to_expiry").get_to(c.min_days_to_expiry);
    if (j.contains("neutral_band")) j.at("neutral_band").get_to(c.neutral_band);
    if (j.contains("base_target_delta")) j.at("base_target_delta").get_to(c.base_target_delta);
    if (j.contains("max_target_delta")) j.at("max_target_delta").get_to(c.max_target_delta);
    if (j.contains("delta_band")) j.at("delta_band").get_to(c.delta_band);
    if (j.contains("delta_floor")) j.at("delta_floor").get_to(c.delta_floor);
    if (j.contains("delta_cap")) j.at("delta_cap").get_to(c.delta_cap);
    if (j.contains("min_candidate_delta")) j.at("min_candidate_delta").get_to(c.min_candidate_delta);
    if (j.contains("max_strike_distance")) j.at("max_strike_distance").get_to(c.max_strike_distance);
    if (j.contains("clean_strikes_only")) j.at("clean_strikes_only").get_to(c.clean_strikes_only);
    if (j.contains("close_profit_fraction")) j.at("close_profit_fraction").get_to(c.close_profit_fraction);
    if (j.contains("enforce_collateral")) j.at("enforce_collateral").get_to(c.enforce_collateral);
    if (j.contains("expiry_weekday")) j.at("expiry_weekday").get_to(c.expiry_weekday);
}

void to_json(nlohmann::json& j, const ChainFilterConfig& c) {
    j = nlohmann::json{
        {"expiry_tolerance_days", c.expiry_tolerance_days},
        {"min_open_interest", c.min_open_interest},
        {"min_bid", c.min_bid},
        {"max_spread_abs", c.max_spread_abs},
        {"max_spread_fraction", c.max_spread_fraction}
    };
}

void from_json(const nlohmann::json& j, ChainFilterConfig& c) {
    if (j.contains("expiry_tolerance_days")) j.at("expiry_tolerance_days").get_to(c.expiry_tolerance_days);
    if (j.contains("min_open_interest")) j.at("min_open_interest").get_to(c.min_open_interest);
    if (j.contains("min_bid")) j.at("min_bid").get_to(c.min_bid);
    if (j.contains("max_spread_abs")) j.at("max_spread_abs").get_to(c.max_spread_abs);
    if (j.contains("max_spread_fraction")) j.at("max_spread_fraction").get_to(c.max_spread_fraction);
}

void to_json(nlohmann::json& j, const MarketDataConfig& c) {
    j = nlohmann::json{
        {"staleness_seconds", c.staleness_seconds},
        {"risk_free_rate", c.risk_free_rate}
    };
}

void from_json(const nlohmann::json& j, MarketDataConfig& c) {
    if (j.contains("staleness_seconds")) j.at("staleness_seconds").get_to(c.staleness_seconds);
    if (j.contains("risk_free_rate")) j.at("risk_free_rate").get_to(c.risk_free_rate);
}

void to_json(nlohmann::json& j, const LoopConfig& c) {
    j = nlohmann::json{
        {"evaluation_interval_seconds", c.evaluation_interval_seconds},
        {"reprice_after_seconds", c.reprice_after_seconds},
        {"market_hours_only", c.market_hours_only},
        {"order_retention_seconds", c.order_retention_seconds}
    };
}

void from_json(const nlohmann::json& j, LoopConfig& c) {
    if (j.contains("evaluation_interval_seconds")) j.at("evaluation_interval_seconds").get_to(c.evaluation_interval_seconds);
    if (j.contains("reprice_after_seconds")) j.at("reprice_after_seconds").get_to(c.reprice_after_seconds);
    if (j.contains("market_hours_only")) j.at("market_hours_only").get_to(c.market_hours_only);
    if (j.contains("order_retention_seconds")) j.at("order_retention_seconds").get_to(c.order_retention_seconds);
}

void to_json(nlohmann::json& j, const BrokerConfig& c) {
    j = nlohmann::json{
        {"host", c.host},
        {"port", c.port},
        {"client_id", c.client_id},
        {"paper_starting_cash", c.paper_starting_cash},
        {"paper_starting_shares", c.paper_starting_shares},
        {"paper_spot_price", c.paper_spot_price},
        {"paper_implied_vol", c.paper_implied_vol},
        {"paper_strike_increment", c.paper_strike_increment},
        {"paper_strikes_per_side", c.paper_strikes_per_side},
        {"paper_weeks", c.paper_weeks},
        {"paper_provide_greeks", c.paper_provide_greeks},
        {"paper_async_fills", c.paper_async_fills},
        {"paper_fill_latency_ms", c.paper_fill_latency_ms}
    };
}

void from_json(const nlohmann::json& j, BrokerConfig& c) {
    if (j.contains("host")) j.at("host").get_to(c.host);
    if (j.contains("port")) j.at("port").get_to(c.port);
    if (j.contains("client_id")) j.at("client_id").get_to(c.client_id);
    if (j.contains("paper_starting_cash")) j.at("paper_starting_cash").get_to(c.paper_starting_cash);
    if (j.contains("paper_starting_shares")) j.at("paper_starting_shares").get_to(c.paper_starting_shares);
    if (j.contains("paper_spot_price")) j.at("paper_spot_price").get_to(c.paper_spot_price);
    if (j.contains("paper_implied_vol")) j.at("paper_implied_vol").get_to(c.paper_implied_vol);
    if (j.contains("paper_strike_increment")) j.at("paper_strike_increment").get_to(c.paper_strike_increment);
    if (j.contains("paper_strikes_per_side")) j.at("paper_strikes_per_side").get_to(c.paper_strikes_per_side);
    if (j.contains("paper_weeks")) j.at("paper_weeks").get_to(c.paper_weeks);
    if (j.contains("paper_provide_greeks")) j.at("paper_provide_greeks").get_to(c.paper_provide_greeks);
    if (j.contains("paper_async_fills")) j.at("paper_async_fills").get_to(c.paper_async_fills);
    if (j.contains("paper_fill_latency_ms")) j.at("paper_fill_latency_ms").get_to(c.paper_fill_latency_ms);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    std::string mode_str;
    switch (c.mode) {
        case TradingMode::DRY_RUN: mode_str = "dry-run"; break;
        case TradingMode::PAPER: mode_str = "paper"; break;
        case TradingMode::LIVE: mode_str = "live"; break;
    }

    j = nlohmann::json{
        {"mode", mode_str},
        {"strategy", c.strategy},
        {"chain_filter", c.chain_filter},
        {"market_data", c.market_data},
        {"loop", c.loop},
        {"broker", c.broker},
        {"logging", c.logging},
        {"decision_ledger_path", c.decision_ledger_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("mode")) {
        std::string mode_str = j.at("mode").get<std::string>();
        if (mode_str == "dry-run" || mode_str == "dry_run") c.mode = TradingMode::DRY_RUN;
        else if (mode_str == "paper") c.mode = TradingMode::PAPER;
        else if (mode_str == "live") c.mode = TradingMode::LIVE;
        else throw std::runtime_error("Unknown mode: " + mode_str);
    }
    if (j.contains("strategy")) j.at("strategy").get_to(c.strategy);
    if (j.contains("chain_filter")) j.at("chain_filter").get_to(c.chain_filter);
    if (j.contains("market_data")) j.at("market_data").get_to(c.market_data);
    if (j.contains("loop")) j.at("loop").get_to(c.loop);
    if (j.contains("broker")) j.at("broker").get_to(c.broker);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("decision_ledger_path")) j.at("decision_ledger_path").get_to(c.decision_ledger_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    bool ok = true;

    if (strategy.symbol.empty()) {
        spdlog::error("strategy.symbol must not be empty");
        ok = false;
    }

    if (strategy.target_shares <= 0 && strategy.funding_amount <= 0) {
        spdlog::error("Either target_shares or funding_amount must be positive");
        ok = false;
    }

    if (strategy.num_slots < 1) {
        spdlog::error("num_slots must be at least 1");
        ok = false;
    }

    if (strategy.contracts_per_slot < 1 || strategy.contract_multiplier < 1) {
        spdlog::error("contracts_per_slot and contract_multiplier must be positive");
        ok = false;
    }

    if (strategy.roll_delta_threshold <= 0.0 || strategy.roll_delta_threshold > 1.0) {
        spdlog::error("roll_delta_threshold must be in (0, 1]");
        ok = false;
    }

    if (strategy.min_days_to_expiry < 0) {
        spdlog::error("min_days_to_expiry must be non-negative");
        ok = false;
    }

    if (strategy.neutral_band < 0.0 || strategy.neutral_band >= 1.0) {
        spdlog::error("neutral_band must be in [0, 1)");
        ok = false;
    }

    if (strategy.base_target_delta <= 0.0 || strategy.max_target_delta > 1.0 ||
        strategy.base_target_delta > strategy.max_target_delta) {
        spdlog::error("Target delta bounds must satisfy 0 < base <= max <= 1");
        ok = false;
    }

    if (strategy.delta_floor > strategy.delta_cap) {
        spdlog::error("delta_floor must not exceed delta_cap");
        ok = false;
    }

    if (strategy.max_target_delta >= strategy.roll_delta_threshold) {
        spdlog::warn("max_target_delta {} is at or above roll threshold {}, new legs may roll immediately",
                     strategy.max_target_delta, strategy.roll_delta_threshold);
    }

    if (strategy.expiry_weekday < 0 || strategy.expiry_weekday > 6) {
        spdlog::error("expiry_weekday must be 0-6");
        ok = false;
    }

    if (strategy.close_profit_fraction < 0.0 || strategy.close_profit_fraction >= 1.0) {
        spdlog::error("close_profit_fraction must be in [0, 1)");
        ok = false;
    }

    if (chain_filter.expiry_tolerance_days < 0 || chain_filter.expiry_tolerance_days > 3) {
        spdlog::error("expiry_tolerance_days must be in [0, 3] so adjacent weeks never match");
        ok = false;
    }

    if (market_data.staleness_seconds <= 0) {
        spdlog::error("staleness_seconds must be positive");
        ok = false;
    }

    if (loop.evaluation_interval_seconds <= 0) {
        spdlog::error("evaluation_interval_seconds must be positive");
        ok = false;
    }

    if (loop.order_retention_seconds < 0) {
        spdlog::error("order_retention_seconds must not be negative");
        ok = false;
    }

    return ok;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace wheel
