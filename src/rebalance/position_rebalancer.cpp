#include "rebalance/position_rebalancer.hpp"
#include <algorithm>
#include <cmath>

namespace wheel {

PositionRebalancer::PositionRebalancer(const StrategyConfig& config)
    : config_(config)
    , interpolation_(&PositionRebalancer::linear_interpolation)
{
}

double PositionRebalancer::allocation_bias(double shares_held, int target_shares) {
    if (target_shares <= 0) return 0.0;
    double raw = (shares_held - target_shares) / static_cast<double>(target_shares);
    return std::clamp(raw, -1.0, 1.0);
}

SidePreference PositionRebalancer::side_preference(double bias) const {
    if (bias < -config_.neutral_band) return SidePreference::PUT;
    if (bias > config_.neutral_band) return SidePreference::CALL;
    return SidePreference::EITHER;
}

double PositionRebalancer::aggressiveness(double bias) {
    return std::min(1.0, std::abs(bias));
}

double PositionRebalancer::linear_interpolation(double abs_bias, double base, double max) {
    return base + abs_bias * (max - base);
}

double PositionRebalancer::target_delta(double bias) const {
    double t = interpolation_(aggressiveness(bias), config_.base_target_delta, config_.max_target_delta);
    return std::clamp(t, 0.0, 1.0);
}

DeltaBand PositionRebalancer::delta_band(double target) const {
    DeltaBand band;
    band.target = target;
    band.low = std::max(config_.delta_floor, target - config_.delta_band);
    band.high = std::min(config_.delta_cap, target + config_.delta_band);
    if (band.low > band.high) {
        // Target outside [floor, cap]: collapse onto the nearest bound
        band.low = band.high = std::clamp(target, config_.delta_floor, config_.delta_cap);
    }
    return band;
}

double PositionRebalancer::nearest_expiry_weight(double bias) {
    return aggressiveness(bias);
}

std::vector<int> PositionRebalancer::slot_priority(double bias, const std::vector<int>& window_slot_ids) const {
    std::vector<int> order = window_slot_ids;
    if (nearest_expiry_weight(bias) <= 0.5) {
        std::reverse(order.begin(), order.end());
    }
    return order;
}

int PositionRebalancer::target_shares_for_funding(double funding, Price price) {
    if (!(price > 0.0) || !std::isfinite(price)) return 100;
    int shares = static_cast<int>((funding * 0.5) / price);
    return std::max(100, (shares / 100) * 100);
}

int PositionRebalancer::effective_target_shares(Price price) const {
    if (config_.target_shares > 0) return config_.target_shares;
    return target_shares_for_funding(config_.funding_amount, price);
}

PortfolioState PositionRebalancer::assess(double cash, double shares_held, double net_liquidation,
                                          Price underlying_price, WallClock as_of) const {
    PortfolioState state;
    state.cash_balance = cash;
    state.shares_held = shares_held;
    state.underlying_price = underlying_price;
    state.target_shares = effective_target_shares(underlying_price);
    state.allocation_bias = allocation_bias(shares_held, state.target_shares);
    state.equity_value = shares_held * underlying_price;
    state.net_liquidation = net_liquidation > 0.0 ? net_liquidation : cash + state.equity_value;
    state.equity_ratio = state.net_liquidation > 0.0 ? state.equity_value / state.net_liquidation : 0.0;
    state.as_of = as_of;
    return state;
}

} // namespace wheel
