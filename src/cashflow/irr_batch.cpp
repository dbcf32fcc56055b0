// SPDX-License-Identifier: MIT
#include "yieldsolve/cashflow/irr_batch.hpp"
#include "yieldsolve/cashflow/irr.hpp"
#include "yieldsolve/support/parallel.hpp"
#include "yieldsolve/support/yieldsolve_trace.h"

namespace yieldsolve {

namespace {

/// Run `solve_one(i)` for every index and tally outcomes
template <typename SolveOne>
BatchRateResult run_batch(size_t n, [[maybe_unused]] const RateSolverConfig& config,
                          SolveOne&& solve_one) {
    YIELDSOLVE_TRACE_ALGO_START(MODULE_BATCH_SOLVER, n, config.guess, config.tolerance);

    // Sentinel value, overwritten by each thread's own slots
    std::vector<std::expected<RateResult, ValidationError>> results(n, RateResult{});
    size_t failed_count = 0;
    size_t unconverged_count = 0;

    YIELDSOLVE_PRAGMA_PARALLEL
    {
        // Static scheduling: each thread owns a contiguous block of results
        YIELDSOLVE_PRAGMA_FOR_STATIC
        for (size_t i = 0; i < n; ++i) {
            results[i] = solve_one(i);

            if (!results[i].has_value()) {
                YIELDSOLVE_PRAGMA_ATOMIC
                ++failed_count;
            } else if (!results[i]->converged) {
                YIELDSOLVE_PRAGMA_ATOMIC
                ++unconverged_count;
            }
        }
    }

    YIELDSOLVE_TRACE_ALGO_COMPLETE(MODULE_BATCH_SOLVER, n, failed_count + unconverged_count);

    return BatchRateResult{
        .results = std::move(results),
        .failed_count = failed_count,
        .unconverged_count = unconverged_count
    };
}

}  // namespace

BatchRateResult solve_irr_batch(std::span<const std::vector<double>> series,
                                const RateSolverConfig& config) {
    return run_batch(series.size(), config, [&](size_t i) {
        return irr(series[i], config);
    });
}

BatchRateResult solve_xirr_batch(std::span<const DatedCashflows> series,
                                 const RateSolverConfig& config) {
    return run_batch(series.size(), config, [&](size_t i) {
        return xirr(series[i].amounts, series[i].dates, config);
    });
}

BatchRateResult solve_xirr_batch(std::span<const IsoDatedCashflows> series,
                                 const RateSolverConfig& config) {
    return run_batch(series.size(), config, [&](size_t i) {
        return xirr(series[i].amounts, series[i].dates, config);
    });
}

}  // namespace yieldsolve
