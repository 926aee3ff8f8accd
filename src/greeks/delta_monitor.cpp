#include "greeks/delta_monitor.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace wheel {

DeltaMonitor::DeltaMonitor(const StrategyConfig& strategy, const MarketDataConfig& market_data)
    : strategy_(strategy)
    , market_data_(market_data)
{
}

double DeltaMonitor::normal_cdf(double x) {
    return 0.5 * (1.0 + std::erf(x / std::sqrt(2.0)));
}

double DeltaMonitor::bs_d1(double S, double K, double T, double r, double sigma) {
    if (T <= 0 || sigma <= 0) return 0.0;
    return (std::log(S / K) + (r + 0.5 * sigma * sigma) * T) / (sigma * std::sqrt(T));
}

double DeltaMonitor::black_scholes_delta(OptionRight right, double S, double K, double T, double r, double sigma) {
    double call_delta = normal_cdf(bs_d1(S, K, T, r, sigma));
    return right == OptionRight::CALL ? call_delta : call_delta - 1.0;
}

std::optional<double> DeltaMonitor::contract_delta(const OptionContract& c, Price underlying, WallClock now) const {
    if (c.delta && std::isfinite(*c.delta)) {
        return std::clamp(*c.delta, -1.0, 1.0);
    }

    if (underlying <= 0.0 || c.strike <= 0.0) return std::nullopt;
    if (!c.implied_vol || !std::isfinite(*c.implied_vol) || *c.implied_vol <= 0.0) return std::nullopt;

    double T = time_utils::years_to_expiry(now, c.expiration);
    return black_scholes_delta(c.right, underlying, c.strike, T, market_data_.risk_free_rate, *c.implied_vol);
}

bool DeltaMonitor::is_stale(const OptionContract& c, WallClock now) const {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - c.quote_time).count();
    return age > market_data_.staleness_seconds;
}

DeltaClass DeltaMonitor::classify(double delta) const {
    return std::abs(delta) >= strategy_.roll_delta_threshold ? DeltaClass::NEAR_MONEY : DeltaClass::IN_RANGE;
}

DeltaReading DeltaMonitor::read(const OptionContract* quote, Price underlying, WallClock now) const {
    DeltaReading reading;

    if (quote == nullptr) {
        reading.reason = "no quote in chain";
        return reading;
    }

    reading.mark = quote->mid();

    if (is_stale(*quote, now)) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - quote->quote_time).count();
        reading.reason = fmt::format("quote age {}s exceeds {}s", age, market_data_.staleness_seconds);
        return reading;
    }

    if (underlying <= 0.0) {
        reading.reason = "no underlying price";
        return reading;
    }

    reading.delta = contract_delta(*quote, underlying, now);
    if (!reading.delta) {
        reading.reason = "no delta field and no implied vol";
        return reading;
    }

    reading.source = quote->delta ? DeltaSource::PROVIDED : DeltaSource::BLACK_SCHOLES;
    reading.classification = classify(*reading.delta);
    return reading;
}

std::map<int, DeltaReading> DeltaMonitor::update_positions(
    std::vector<Position>& positions,
    const ChainSnapshot& chain,
    WallClock now) const
{
    std::unordered_map<std::string, const OptionContract*> by_id;
    by_id.reserve(chain.contracts.size());
    for (const auto& c : chain.contracts) {
        by_id[c.contract_id] = &c;
    }

    Price underlying = chain.underlying_price();
    std::map<int, DeltaReading> readings;

    for (auto& pos : positions) {
        // Unfilled opens hold nothing to monitor
        if (!pos.is_live() || pos.status == PositionStatus::PENDING_OPEN) continue;

        auto it = by_id.find(pos.contract_id);
        const OptionContract* quote = it != by_id.end() ? it->second : nullptr;

        DeltaReading reading = read(quote, underlying, now);

        pos.stale = reading.classification == DeltaClass::STALE;
        if (reading.delta) pos.delta = *reading.delta;
        if (reading.mark > 0.0) pos.mark_price = reading.mark;
        pos.last_update = now;

        if (pos.stale) {
            spdlog::warn("Slot {} {} marked STALE: {}", pos.slot_id, pos.contract_id, reading.reason);
        } else {
            spdlog::debug("Slot {} {} delta {:.3f} ({}, {})", pos.slot_id, pos.contract_id, pos.delta,
                          delta_class_to_string(reading.classification),
                          delta_source_to_string(reading.source));
        }

        readings[pos.slot_id] = reading;
    }

    return readings;
}

} // namespace wheel
