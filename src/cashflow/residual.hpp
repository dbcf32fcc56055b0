// SPDX-License-Identifier: MIT
/**
 * @file residual.hpp
 * @brief Net-present-value residual and its rate derivative
 */

#pragma once

#include "yieldsolve/cashflow/cashflow_series.hpp"

namespace yieldsolve {

/// NPV residual f(r) and derivative f'(r) at one trial rate
struct NpvResidual {
    double value;       ///< f(r)  = sum cf[i] / (1+r)^t[i]
    double derivative;  ///< f'(r) = sum -t[i] * cf[i] / (1+r)^(t[i]+1)
};

/// Evaluate the NPV residual and its derivative in a single pass
///
/// Each call is independent; nothing is cached between rates.
///
/// Both fields are NaN where the discount factor is undefined: at rate == -1,
/// for a non-finite rate, and for rate < -1 when some offset is fractional
/// (a negative base has no real fractional power). Below -1 with whole-number
/// offsets, as in every periodic series, the residual is evaluated normally.
/// Callers see the NaN as a non-converged solve.
NpvResidual evaluate_residual(double rate, const CashflowSeries& series) noexcept;

/// Discounted value of the series at `rate` (the residual without derivative)
double npv_at(double rate, const CashflowSeries& series) noexcept;

}  // namespace yieldsolve
