#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>

namespace wheel {
namespace time_utils {

using namespace std::chrono;

std::string to_iso8601(WallClock t) {
    auto time_t = system_clock::to_time_t(t);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm = *std::gmtime(&time_t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

Date make_date(int year, unsigned month, unsigned day) {
    return sys_days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

Date to_date(WallClock t) {
    return floor<days>(t);
}

std::string format_date(Date d) {
    year_month_day ymd{d};
    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << static_cast<int>(ymd.year()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.day());
    return ss.str();
}

std::string format_expiry(Date d) {
    std::string s = format_date(d);
    s.erase(std::remove(s.begin(), s.end(), '-'), s.end());
    return s;
}

int days_between(Date from, Date to) {
    return static_cast<int>((to - from).count());
}

unsigned weekday_of(Date d) {
    return weekday{d}.c_encoding();
}

Date next_weekday_on_or_after(Date from, unsigned wd) {
    unsigned current = weekday_of(from);
    unsigned offset = (wd + 7 - current) % 7;
    return from + days{offset};
}

Date first_weekly_expiration(Date today, unsigned wd, int min_days_out) {
    return next_weekday_on_or_after(today + days{min_days_out}, wd);
}

namespace {

// Offset of New York local time from UTC on the given UTC instant.
hours new_york_offset(WallClock t) {
    Date d = to_date(t);
    year_month_day ymd{d};
    auto y = ymd.year();

    // DST starts 02:00 local on the second Sunday of March (07:00 UTC)
    // and ends 02:00 local on the first Sunday of November (06:00 UTC).
    sys_days dst_start{y / March / Sunday[2]};
    sys_days dst_end{y / November / Sunday[1]};
    auto start = dst_start + hours{7};
    auto end = dst_end + hours{6};

    if (t >= start && t < end) {
        return hours{-4};
    }
    return hours{-5};
}

} // namespace

double years_to_expiry(WallClock now, Date expiration) {
    // Close is 16:00 New York time on the expiration date.
    WallClock close_utc = WallClock{expiration.time_since_epoch()} + hours{16};
    close_utc -= new_york_offset(close_utc);

    auto remaining = duration_cast<seconds>(close_utc - now).count();
    constexpr double seconds_per_year = 365.0 * 24.0 * 3600.0;
    return std::max(60.0, static_cast<double>(remaining)) / seconds_per_year;
}

Date market_date(WallClock t) {
    return to_date(t + new_york_offset(t));
}

bool is_us_equity_market_hours(WallClock t) {
    auto local = t + new_york_offset(t);
    Date local_day = floor<days>(local);
    unsigned wd = weekday_of(local_day);
    if (wd == 0 || wd == 6) return false;

    auto minutes_into_day = duration_cast<minutes>(local - local_day).count();
    return minutes_into_day >= 9 * 60 + 30 && minutes_into_day < 16 * 60;
}

} // namespace time_utils
} // namespace wheel
