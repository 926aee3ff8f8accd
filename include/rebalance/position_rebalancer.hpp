#pragma once

#include <functional>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"

namespace wheel {

// Which side the engine may sell for a given bias
enum class SidePreference {
    PUT,
    CALL,
    EITHER
};

inline std::string side_preference_to_string(SidePreference p) {
    switch (p) {
        case SidePreference::PUT: return "PUT";
        case SidePreference::CALL: return "CALL";
        case SidePreference::EITHER: return "EITHER";
    }
    return "UNKNOWN";
}

// Acceptable |delta| range around a target
struct DeltaBand {
    double target{0.0};
    double low{0.0};
    double high{0.0};

    bool contains(double abs_delta) const {
        return abs_delta >= low && abs_delta <= high;
    }
};

/**
 * Position rebalancer.
 *
 * Maps the cash/equity imbalance onto the tunables the decision engine
 * consumes. Every mapping is a function of `bias` and configuration only.
 *
 *   bias = clamp((shares_held - target_shares) / target_shares, -1, 1)
 *
 * Negative bias is cash heavy (sell puts to acquire shares), positive bias
 * is equity heavy (sell calls to shed shares). |bias| is the aggressiveness:
 * it moves the target delta toward the money and the expiration preference
 * toward the nearest slot.
 */
class PositionRebalancer {
public:
    // (|bias|, base, max) -> target |delta|
    using DeltaInterpolation = std::function<double(double, double, double)>;

    explicit PositionRebalancer(const StrategyConfig& config);

    static double allocation_bias(double shares_held, int target_shares);

    SidePreference side_preference(double bias) const;

    static double aggressiveness(double bias);

    double target_delta(double bias) const;

    DeltaBand delta_band(double target) const;

    // Weight in [0, 1] toward the nearest expiration
    static double nearest_expiry_weight(double bias);

    /**
     * Order in which slots claim collateral. `window_slot_ids` is earliest
     * first. Nearest-first once the expiry weight passes 0.5, farthest-first
     * otherwise.
     */
    std::vector<int> slot_priority(double bias, const std::vector<int>& window_slot_ids) const;

    // 50% of funding in shares, rounded down to a round lot, at least 100
    static int target_shares_for_funding(double funding, Price price);

    // Target shares from config, deriving it from the funding amount if needed
    int effective_target_shares(Price price) const;

    PortfolioState assess(double cash, double shares_held, double net_liquidation,
                          Price underlying_price, WallClock as_of) const;

    // Linear by default
    void set_interpolation(DeltaInterpolation fn) { interpolation_ = std::move(fn); }

    static double linear_interpolation(double abs_bias, double base, double max);

private:
    StrategyConfig config_;
    DeltaInterpolation interpolation_;
};

} // namespace wheel
