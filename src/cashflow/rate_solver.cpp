// SPDX-License-Identifier: MIT
#include "yieldsolve/cashflow/rate_solver.hpp"
#include "yieldsolve/cashflow/residual.hpp"
#include "yieldsolve/support/yieldsolve_trace.h"
#include <cmath>

namespace yieldsolve {

double round_rate(double rate) {
    static constexpr double kScale = 1e10;
    static_assert(kRateDecimalDigits == 10, "kScale must match kRateDecimalDigits");
    return std::round(rate * kScale) / kScale;
}

RateResult classify(const NewtonState& final_state, double tolerance, size_t iterations) {
    const double error = std::abs(final_state.fx);
    const bool converged = error < tolerance;  // false for NaN

    return RateResult{
        .rate = converged ? std::optional<double>(round_rate(final_state.x)) : std::nullopt,
        .iterations = iterations,
        .converged = converged,
        .final_error = error
    };
}

RateResult solve_rate(const CashflowSeries& series, const RateSolverConfig& config) {
    [[maybe_unused]] const int module_id = series.is_dated() ? MODULE_XIRR : MODULE_IRR;
    YIELDSOLVE_TRACE_ALGO_START(module_id, series.size(), config.guess, config.tolerance);

    auto objective = [&series](double rate) -> NewtonEvaluation {
        const NpvResidual r = evaluate_residual(rate, series);
        return NewtonEvaluation{.value = r.value, .derivative = r.derivative};
    };

    const NewtonConfig newton_config{
        .max_iter = config.max_iter,
        .tolerance = config.tolerance,
        .early_exit = config.early_exit
    };

    const NewtonRun run = newton_iterate(objective, config.guess, newton_config);
    RateResult result = classify(run.state, config.tolerance, run.iterations);

    if (result.converged) {
        YIELDSOLVE_TRACE_CONVERGENCE_SUCCESS(module_id, result.iterations, result.final_error);
    } else {
        YIELDSOLVE_TRACE_CONVERGENCE_FAILED(module_id, result.iterations, result.final_error);
    }
    YIELDSOLVE_TRACE_ALGO_COMPLETE(module_id, result.iterations, run.state.x);

    return result;
}

}  // namespace yieldsolve
