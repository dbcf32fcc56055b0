// SPDX-License-Identifier: MIT
#pragma once

#include "yieldsolve/support/yieldsolve_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>

namespace yieldsolve {

/// Hard cap on Newton steps for every rate solve
///
/// The step count is a compile-time constant of the library: a solve always
/// terminates after at most this many residual evaluations (plus the initial
/// one), independent of the input. Configurations may ask for fewer steps,
/// never more.
inline constexpr size_t kMaxNewtonIterations = 16;

/// Configuration for bounded Newton-Raphson
struct NewtonConfig {
    /// Requested step bound (clamped to kMaxNewtonIterations)
    size_t max_iter = kMaxNewtonIterations;

    /// Absolute residual tolerance: converged when |f(x)| < tolerance
    double tolerance = 1e-7;

    /// Stop as soon as the residual is within tolerance (or non-finite).
    ///
    /// When false, exactly the bound number of steps is run and convergence
    /// is checked once at the end, reproducing the fixed-step reference
    /// behaviour step for step.
    bool early_exit = true;
};

/// Function value and first derivative at one point
struct NewtonEvaluation {
    double value;
    double derivative;
};

/// Concept for Newton objectives: callables returning value and derivative
/// from a single evaluation
///
/// Computing both in one pass lets an objective share its expensive terms
/// (e.g. discount factors) between f and f'.
template<typename F>
concept NewtonObjective = requires(F f, double x) {
    { f(x) } -> std::convertible_to<NewtonEvaluation>;
};

/// One point of the Newton iteration: iterate, residual, derivative
///
/// States are never updated in place; each step builds a new state from the
/// previous one, so the residual computed while advancing is exactly the one
/// used for the next convergence check.
struct NewtonState {
    double x;
    double fx;
    double dfx;
};

/// Outcome of a bounded Newton run, before classification
struct NewtonRun {
    NewtonState state;  ///< Last computed state
    size_t iterations;  ///< Newton updates applied
};

/// True when the Newton update x - f/f' is undefined at this state
inline bool has_degenerate_derivative(const NewtonState& state) {
    return state.dfx == 0.0 || !std::isfinite(state.dfx);
}

/// Evaluate the objective at x and package the result as a state
template<NewtonObjective F>
NewtonState evaluate_state(F& f, double x) {
    const NewtonEvaluation eval = f(x);
    return NewtonState{.x = x, .fx = eval.value, .dfx = eval.derivative};
}

/// Advance one Newton step: x_{k+1} = x_k - f(x_k)/f'(x_k)
///
/// A zero or non-finite derivative makes the update undefined. The step then
/// yields an all-NaN state instead of raising, so a fixed-length chain of
/// steps can always complete; the NaN ends up as a non-converged result.
template<NewtonObjective F>
NewtonState newton_step(const NewtonState& state, F& f) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    if (has_degenerate_derivative(state)) {
        return NewtonState{.x = nan, .fx = nan, .dfx = nan};
    }
    const double next = state.x - state.fx / state.dfx;
    if (!std::isfinite(next)) {
        return NewtonState{.x = nan, .fx = nan, .dfx = nan};
    }
    return evaluate_state(f, next);
}

/// Run bounded Newton-Raphson from an initial guess
///
/// Performs one objective evaluation per step and carries (x, f, f') forward,
/// so total work is (steps + 1) evaluations.
///
/// **Termination:**
/// - early_exit: stops when |f| < tolerance, when f is non-finite, or after
///   min(max_iter, kMaxNewtonIterations) steps
/// - fixed-step: always runs min(max_iter, kMaxNewtonIterations) steps
///
/// **Failure modes** (never thrown, visible in the returned state):
/// - Degenerate derivative: state becomes NaN
/// - Objective undefined at an iterate: objective returns NaN
/// - Budget exhausted: |f| still >= tolerance
///
/// @tparam F Objective satisfying NewtonObjective
/// @param f Objective returning value and derivative
/// @param x0 Initial guess
/// @param config Step bound, tolerance and exit policy
/// @return Last state and number of updates applied
///
/// **Example:**
/// ```cpp
/// auto f = [](double x) { return NewtonEvaluation{x*x - 2.0, 2.0*x}; };
/// auto run = newton_iterate(f, 1.0, NewtonConfig{.tolerance = 1e-12});
/// // run.state.x ≈ 1.414213...
/// ```
template<NewtonObjective F>
NewtonRun newton_iterate(F&& f, double x0, const NewtonConfig& config) {
    const size_t bound = std::min(config.max_iter, kMaxNewtonIterations);

    YIELDSOLVE_TRACE_NEWTON_START(x0, config.tolerance, bound);

    NewtonState state = evaluate_state(f, x0);
    size_t iter = 0;

    for (; iter < bound; ++iter) {
        if (config.early_exit) {
            if (!std::isfinite(state.fx)) {
                YIELDSOLVE_TRACE_RUNTIME_ERROR(MODULE_NEWTON_ROOT,
                                               RUNTIME_ERROR_NON_FINITE_RESIDUAL, iter);
                break;
            }
            if (std::abs(state.fx) < config.tolerance) {
                break;
            }
        }

        if (std::isfinite(state.fx) && has_degenerate_derivative(state)) {
            YIELDSOLVE_TRACE_RUNTIME_ERROR(MODULE_NEWTON_ROOT,
                                           RUNTIME_ERROR_DEGENERATE_DERIVATIVE, iter + 1);
        }

        state = newton_step(state, f);

        YIELDSOLVE_TRACE_NEWTON_ITER(iter + 1, state.x, state.fx, state.dfx);
        YIELDSOLVE_TRACE_CONVERGENCE_ITER(MODULE_NEWTON_ROOT, iter + 1,
                                          std::abs(state.fx), config.tolerance);
    }

    [[maybe_unused]] const int converged = std::abs(state.fx) < config.tolerance ? 1 : 0;
    YIELDSOLVE_TRACE_NEWTON_COMPLETE(state.x, iter, converged);

    return NewtonRun{.state = state, .iterations = iter};
}

}  // namespace yieldsolve
