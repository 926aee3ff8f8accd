#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"

namespace wheel {

enum class DeltaClass {
    IN_RANGE,
    NEAR_MONEY,
    STALE
};

inline std::string delta_class_to_string(DeltaClass c) {
    switch (c) {
        case DeltaClass::IN_RANGE: return "IN_RANGE";
        case DeltaClass::NEAR_MONEY: return "NEAR_MONEY";
        case DeltaClass::STALE: return "STALE";
    }
    return "UNKNOWN";
}

enum class DeltaSource {
    PROVIDED,
    BLACK_SCHOLES,
    NONE
};

inline std::string delta_source_to_string(DeltaSource s) {
    switch (s) {
        case DeltaSource::PROVIDED: return "PROVIDED";
        case DeltaSource::BLACK_SCHOLES: return "BLACK_SCHOLES";
        case DeltaSource::NONE: return "NONE";
    }
    return "UNKNOWN";
}

struct DeltaReading {
    std::optional<double> delta;    // Signed
    DeltaClass classification{DeltaClass::STALE};
    DeltaSource source{DeltaSource::NONE};
    Price mark{0.0};
    std::string reason;             // Set when STALE
};

/**
 * Delta monitor.
 *
 * Delta source order: the quote's own delta field, then Black-Scholes from
 * underlying price and implied vol, else STALE. A quote older than the
 * staleness limit, or a missing underlying price, is STALE regardless.
 */
class DeltaMonitor {
public:
    DeltaMonitor(const StrategyConfig& strategy, const MarketDataConfig& market_data);

    static double normal_cdf(double x);
    static double bs_d1(double S, double K, double T, double r, double sigma);

    // Signed: N(d1) for calls, N(d1) - 1 for puts
    static double black_scholes_delta(OptionRight right, double S, double K, double T, double r, double sigma);

    // Delta ignoring staleness; used to rank fresh chain candidates
    std::optional<double> contract_delta(const OptionContract& c, Price underlying, WallClock now) const;

    bool is_stale(const OptionContract& c, WallClock now) const;

    DeltaClass classify(double delta) const;

    // `quote` may be null when the chain has no quote for the position
    DeltaReading read(const OptionContract* quote, Price underlying, WallClock now) const;

    /**
     * Refresh delta, mark and stale flag on every held leg from the chain.
     * Returns the reading per slot_id.
     */
    std::map<int, DeltaReading> update_positions(
        std::vector<Position>& positions,
        const ChainSnapshot& chain,
        WallClock now) const;

private:
    StrategyConfig strategy_;
    MarketDataConfig market_data_;
};

} // namespace wheel
