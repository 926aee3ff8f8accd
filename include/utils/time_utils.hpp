#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace wheel {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string.
 */
std::string to_iso8601(WallClock t);

/**
 * Get current timestamp as ISO 8601.
 */
std::string now_iso8601();

// Calendar helpers. Dates are UTC calendar days.
Date make_date(int year, unsigned month, unsigned day);
Date to_date(WallClock t);

// "2026-10-23"
std::string format_date(Date d);

// "20261023", the broker's expiration format
std::string format_expiry(Date d);

// Signed number of calendar days from `from` to `to`
int days_between(Date from, Date to);

// 0 = Sunday ... 6 = Saturday
unsigned weekday_of(Date d);

/**
 * First date on or after `from` that falls on `weekday` (0 = Sunday).
 */
Date next_weekday_on_or_after(Date from, unsigned weekday);

/**
 * First weekly expiration at least `min_days_out` after `today`.
 */
Date first_weekly_expiration(Date today, unsigned weekday, int min_days_out);

/**
 * Years between `now` and the 16:00 ET close on `expiration`, floored at
 * a minute so pricing stays finite on expiration day.
 */
double years_to_expiry(WallClock now, Date expiration);

// Calendar date in New York at instant `t`. Trading days roll over at
// local midnight, not at 00:00 UTC.
Date market_date(WallClock t);

/**
 * US equity regular session check: weekdays 09:30-16:00 America/New_York,
 * using the US daylight saving rule (second Sunday of March to first
 * Sunday of November). Exchange holidays are not modelled.
 */
bool is_us_equity_market_hours(WallClock t);

} // namespace time_utils
} // namespace wheel
