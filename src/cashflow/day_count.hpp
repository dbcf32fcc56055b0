// SPDX-License-Identifier: MIT
/**
 * @file day_count.hpp
 * @brief Calendar dates and the Actual/365 day-count convention
 */

#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace yieldsolve {

/// Calendar date (days since the Unix epoch, no time of day)
using Date = std::chrono::sys_days;

/// Denominator of the Actual/365 Fixed convention
inline constexpr double kDaysPerYear = 365.0;

/// Build a date from year, month (1-12) and day (1-31)
///
/// No validation: out-of-range components produce a normalized but
/// meaningless date. Use parse_iso_date() for untrusted input.
constexpr Date make_date(int year, unsigned month, unsigned day) {
    return Date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

/// Parse a "YYYY-MM-DD" date
///
/// Rejects malformed strings and impossible calendar dates (e.g. 2023-02-29).
[[nodiscard]] std::expected<Date, std::string> parse_iso_date(std::string_view s);

/// Signed number of calendar days from `from` to `to`
constexpr long days_between(Date from, Date to) {
    return static_cast<long>((to - from).count());
}

/// Actual/365 year fraction: actual days elapsed divided by 365
///
/// Leap days count as ordinary days, so a leap year spans 366/365 years.
constexpr double year_fraction_act365(Date from, Date to) {
    return static_cast<double>(days_between(from, to)) / kDaysPerYear;
}

}  // namespace yieldsolve
