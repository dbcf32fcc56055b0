// SPDX-License-Identifier: MIT
/**
 * @file irr_batch.hpp
 * @brief Parallel IRR/XIRR over many independent cash-flow series
 */

#ifndef YIELDSOLVE_IRR_BATCH_HPP
#define YIELDSOLVE_IRR_BATCH_HPP

#include "yieldsolve/cashflow/day_count.hpp"
#include "yieldsolve/cashflow/rate_solver.hpp"
#include "yieldsolve/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace yieldsolve {

/// Amounts and their dates for one XIRR query
struct DatedCashflows {
    std::vector<double> amounts;
    std::vector<Date> dates;
};

/// Amounts and ISO "YYYY-MM-DD" date strings for one XIRR query
struct IsoDatedCashflows {
    std::vector<double> amounts;
    std::vector<std::string> dates;
};

/**
 * Batch result containing individual results and aggregate statistics.
 *
 * results[i] corresponds to input i. An entry holds a ValidationError only
 * for malformed input; non-convergence is a RateResult with converged == false.
 */
struct BatchRateResult {
    std::vector<std::expected<RateResult, ValidationError>> results;
    size_t failed_count = 0;       ///< Inputs rejected by validation
    size_t unconverged_count = 0;  ///< Valid inputs that did not converge

    /// Check if every series was valid and converged
    bool all_succeeded() const { return failed_count == 0 && unconverged_count == 0; }
};

/// Solve IRR for each series in parallel
///
/// Solves are independent pure functions, so the batch is split statically
/// across OpenMP threads with no coordination besides the two counters.
/// Without OpenMP the loop runs sequentially with identical results.
///
/// ```cpp
/// std::vector<std::vector<double>> portfolios = load_portfolios();
/// auto batch = solve_irr_batch(portfolios);
/// for (size_t i = 0; i < batch.results.size(); ++i) {
///     if (batch.results[i] && batch.results[i]->converged) {
///         std::cout << i << ": " << *batch.results[i]->rate << "\n";
///     }
/// }
/// ```
BatchRateResult solve_irr_batch(std::span<const std::vector<double>> series,
                                const RateSolverConfig& config = {});

/// Solve XIRR for each dated series in parallel
BatchRateResult solve_xirr_batch(std::span<const DatedCashflows> series,
                                 const RateSolverConfig& config = {});

/// Solve XIRR for each series of date strings in parallel
///
/// Dates are parsed per series: an unparseable date fails only its own slot
/// with ValidationError{InvalidDate, index}.
BatchRateResult solve_xirr_batch(std::span<const IsoDatedCashflows> series,
                                 const RateSolverConfig& config = {});

}  // namespace yieldsolve

#endif  // YIELDSOLVE_IRR_BATCH_HPP
