// SPDX-License-Identifier: MIT
/**
 * @file rate_solver.hpp
 * @brief Newton-Raphson rate solver shared by IRR and XIRR
 *
 * solve_rate() drives newton_iterate() over the NPV residual of a
 * CashflowSeries and classifies the last state with classify().
 *
 * Numeric pathologies never throw:
 * - zero derivative at an iterate -> NaN state -> not converged
 * - rate == -1, or rate < -1 with fractional offsets -> NaN residual
 *   -> not converged
 * - budget exhausted             -> not converged
 *
 * USDT Tracing: emits convergence_success / convergence_failed under
 * MODULE_IRR or MODULE_XIRR depending on the series kind.
 */

#pragma once

#include "yieldsolve/cashflow/cashflow_series.hpp"
#include "yieldsolve/math/root_finding.hpp"
#include <cstddef>
#include <optional>

namespace yieldsolve {

/// Decimal digits kept in a converged rate
inline constexpr int kRateDecimalDigits = 10;

/// Configuration for IRR/XIRR solves
struct RateSolverConfig {
    double guess = 0.1;                         ///< Starting rate
    double tolerance = 1e-7;                    ///< Converged when |NPV(r)| < tolerance
    size_t max_iter = kMaxNewtonIterations;     ///< Clamped to kMaxNewtonIterations
    bool early_exit = true;                     ///< See NewtonConfig::early_exit
};

/// Terminal result of a rate solve
struct RateResult {
    std::optional<double> rate;   ///< Solved rate (nullopt unless converged)
    size_t iterations = 0;        ///< Newton updates applied (bound in fixed-step mode)
    bool converged = false;       ///< |residual| < tolerance at the last state
    double final_error = 0.0;     ///< |residual| at the last state (NaN if undefined)
};

/// Round a rate to kRateDecimalDigits decimal places
double round_rate(double rate);

/// Classify the last Newton state
///
/// converged = |residual| < tolerance; the rate is reported (rounded) only
/// when converged.
RateResult classify(const NewtonState& final_state, double tolerance, size_t iterations);

/// Solve NPV(r) = 0 for the series by bounded Newton-Raphson
RateResult solve_rate(const CashflowSeries& series, const RateSolverConfig& config);

}  // namespace yieldsolve
