#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "broker/paper_broker.hpp"
#include "utils/time_utils.hpp"

namespace wheel {
namespace testing_support {

// Midday UTC on `d`, inside the US session
inline WallClock at_noon(Date d) {
    return WallClock(d.time_since_epoch()) + std::chrono::hours(15);
}

inline OptionContract make_option(OptionRight right, Price strike, Date expiration,
                                  double delta, Price bid, Price ask, WallClock quote_time) {
    OptionContract c;
    c.contract_id = make_contract_id("F", expiration, right, strike);
    c.symbol = "F";
    c.right = right;
    c.strike = strike;
    c.expiration = expiration;
    c.bid = bid;
    c.ask = ask;
    c.last = (bid + ask) / 2.0;
    c.open_interest = 1000;
    c.delta = delta;
    c.implied_vol = 0.35;
    c.quote_time = quote_time;
    return c;
}

/**
 * Strikes around a 12.00 spot with fixed deltas:
 *   puts  11.5 (-0.40)  11.0 (-0.32)  10.5 (-0.22)
 *   calls 12.5 (0.38)   13.0 (0.28)   13.5 (0.18)
 */
inline std::vector<OptionContract> weekly_ladder(Date expiration, WallClock quote_time) {
    return {
        make_option(OptionRight::PUT, 11.5, expiration, -0.40, 0.40, 0.44, quote_time),
        make_option(OptionRight::PUT, 11.0, expiration, -0.32, 0.24, 0.28, quote_time),
        make_option(OptionRight::PUT, 10.5, expiration, -0.22, 0.12, 0.16, quote_time),
        make_option(OptionRight::CALL, 12.5, expiration, 0.38, 0.36, 0.40, quote_time),
        make_option(OptionRight::CALL, 13.0, expiration, 0.28, 0.20, 0.24, quote_time),
        make_option(OptionRight::CALL, 13.5, expiration, 0.18, 0.10, 0.14, quote_time),
    };
}

inline ChainSnapshot make_chain(const std::vector<Date>& expirations, WallClock as_of, Price spot = 12.0) {
    ChainSnapshot chain;
    chain.symbol = "F";
    chain.underlying_last = spot;
    chain.underlying_close = spot;
    chain.underlying_bid = spot - 0.01;
    chain.underlying_ask = spot + 0.01;
    chain.as_of = as_of;
    for (Date exp : expirations) {
        auto ladder = weekly_ladder(exp, as_of);
        chain.contracts.insert(chain.contracts.end(), ladder.begin(), ladder.end());
    }
    return chain;
}

inline Position make_position(int slot_id, OptionRight right, Price strike, Date expiration,
                              double delta, PositionStatus status = PositionStatus::OPEN) {
    Position p;
    p.slot_id = slot_id;
    p.contract_id = make_contract_id("F", expiration, right, strike);
    p.right = right;
    p.strike = strike;
    p.expiration = expiration;
    p.quantity = -1;
    p.delta = delta;
    p.status = status;
    p.open_price = 0.30;
    p.mark_price = 0.30;
    return p;
}

} // namespace testing_support
} // namespace wheel
