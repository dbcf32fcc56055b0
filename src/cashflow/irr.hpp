// SPDX-License-Identifier: MIT
/**
 * @file irr.hpp
 * @brief IRR, XIRR, NPV and XNPV entry points
 *
 * API (C++23):
 * - irr()  → std::expected<RateResult, ValidationError>
 * - xirr() → std::expected<RateResult, ValidationError>
 * - npv()  → double
 * - xnpv() → std::expected<double, ValidationError>
 *
 * Error Handling:
 * - Malformed input (empty series, amounts/dates length mismatch, bad date
 *   strings) is the only failure reported through the error channel
 * - Numerical failure is a successful call with converged == false and an
 *   empty rate
 *
 * Example:
 * @code
 * std::vector<double> flows{-100.0, 39.0, 59.0, 55.0, 20.0};
 * auto result = yieldsolve::irr(flows);
 *
 * if (!result.has_value()) {
 *     std::cerr << "Invalid input: " << result.error() << "\n";
 * } else if (result->converged) {
 *     std::cout << "IRR: " << *result->rate << "\n";   // 0.2809484211
 * }
 * @endcode
 */

#pragma once

#include "yieldsolve/cashflow/cashflow_series.hpp"
#include "yieldsolve/cashflow/day_count.hpp"
#include "yieldsolve/cashflow/rate_solver.hpp"
#include "yieldsolve/support/error_types.hpp"
#include <expected>
#include <span>
#include <string>

namespace yieldsolve {

/// Internal rate of return of evenly spaced cash flows
///
/// Finds r with sum cf[i] / (1+r)^i = 0. Period 0 is "now".
///
/// @param cashflows Amounts per period (negative = outflow)
/// @param config Guess, tolerance and step policy
/// @return RateResult (possibly not converged) or ValidationError{EmptyCashflows}
std::expected<RateResult, ValidationError>
irr(std::span<const double> cashflows, const RateSolverConfig& config = {});

/// Internal rate of return of date-stamped cash flows (Actual/365)
///
/// Finds r with sum cf[i] / (1+r)^((d[i] - min(d)) / 365) = 0.
///
/// @return RateResult or ValidationError{EmptyCashflows | LengthMismatch}
std::expected<RateResult, ValidationError>
xirr(std::span<const double> cashflows, std::span<const Date> dates,
     const RateSolverConfig& config = {});

/// XIRR with ISO "YYYY-MM-DD" date strings
std::expected<RateResult, ValidationError>
xirr(std::span<const double> cashflows, std::span<const std::string> dates,
     const RateSolverConfig& config = {});

/// Net present value of evenly spaced flows, first flow undiscounted
///
/// Returns 0 for an empty series and NaN for rate == -1. Below -1 the
/// integer powers of the negative base are evaluated as usual.
double npv(double rate, std::span<const double> cashflows);

/// Date-weighted net present value (Actual/365 from the earliest date)
std::expected<double, ValidationError>
xnpv(double rate, std::span<const double> cashflows, std::span<const Date> dates);

/// XNPV with ISO "YYYY-MM-DD" date strings
std::expected<double, ValidationError>
xnpv(double rate, std::span<const double> cashflows, std::span<const std::string> dates);

}  // namespace yieldsolve
