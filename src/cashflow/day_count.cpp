// SPDX-License-Identifier: MIT
#include "yieldsolve/cashflow/day_count.hpp"
#include <charconv>

namespace yieldsolve {

std::expected<Date, std::string> parse_iso_date(std::string_view s) {
    if (s.length() != 10 || s[4] != '-' || s[7] != '-') {
        return std::unexpected("ISO date must have the form YYYY-MM-DD: " + std::string(s));
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    auto r1 = std::from_chars(s.data(), s.data() + 4, year);
    auto r2 = std::from_chars(s.data() + 5, s.data() + 7, month);
    auto r3 = std::from_chars(s.data() + 8, s.data() + 10, day);

    if (r1.ec != std::errc{} || r1.ptr != s.data() + 4 ||
        r2.ec != std::errc{} || r2.ptr != s.data() + 7 ||
        r3.ec != std::errc{} || r3.ptr != s.data() + 10) {
        return std::unexpected("Failed to parse ISO date: " + std::string(s));
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::unexpected("Invalid calendar date: " + std::string(s));
    }

    return Date{ymd};
}

}  // namespace yieldsolve
