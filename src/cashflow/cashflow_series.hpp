// SPDX-License-Identifier: MIT
/**
 * @file cashflow_series.hpp
 * @brief Normalized (amount, time offset) cash-flow schedules
 */

#pragma once

#include "yieldsolve/cashflow/day_count.hpp"
#include "yieldsolve/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace yieldsolve {

/// Single cash flow: amount and time from the reference point in years/periods
///
/// Sign convention: negative = outflow (investment), positive = inflow.
struct CashFlow {
    double amount;
    double time_offset;  ///< >= 0
};

/// Immutable cash-flow schedule ready for discounting
///
/// Built once per solve through one of the validating factories:
/// - periodic(): evenly spaced flows, offset[i] = i
/// - dated(): irregular flows, offset[i] = (date[i] - min(dates)) / 365
///
/// The reference date of a dated series is the earliest date, not the first
/// array element, so dates may arrive in any order.
///
/// No sign-pattern validation is done: a series without a sign change is
/// accepted and simply fails to converge in the rate solver.
class CashflowSeries {
public:
    /// Evenly spaced series (period 0 is "now")
    ///
    /// @return Series, or ValidationError{EmptyCashflows} for empty input
    static std::expected<CashflowSeries, ValidationError>
    periodic(std::span<const double> amounts);

    /// Date-stamped series with Actual/365 offsets
    ///
    /// @return Series, or ValidationError{EmptyCashflows | LengthMismatch}
    static std::expected<CashflowSeries, ValidationError>
    dated(std::span<const double> amounts, std::span<const Date> dates);

    /// Date-stamped series from ISO "YYYY-MM-DD" strings
    ///
    /// @return Series, or ValidationError{EmptyCashflows | LengthMismatch |
    ///         InvalidDate (index of the offending string)}
    static std::expected<CashflowSeries, ValidationError>
    dated(std::span<const double> amounts, std::span<const std::string> dates);

    size_t size() const { return flows_.size(); }
    const CashFlow& operator[](size_t i) const { return flows_[i]; }

    auto begin() const { return flows_.begin(); }
    auto end() const { return flows_.end(); }

    /// True for series built by dated()
    bool is_dated() const { return reference_date_.has_value(); }

    /// Earliest date of a dated series (nullopt for periodic series)
    std::optional<Date> reference_date() const { return reference_date_; }

private:
    CashflowSeries(std::vector<CashFlow> flows, std::optional<Date> reference_date)
        : flows_(std::move(flows)), reference_date_(reference_date) {}

    std::vector<CashFlow> flows_;
    std::optional<Date> reference_date_;
};

}  // namespace yieldsolve
