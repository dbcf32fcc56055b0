// SPDX-License-Identifier: MIT
/**
 * @file yieldsolve_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for yieldsolve library
 *
 * This header provides zero-overhead tracing points that can be dynamically
 * enabled at runtime using tools like bpftrace, systemtap, or perf.
 *
 * When tracing is disabled (default), probes compile to single NOP instructions.
 * When enabled via tracing tools, probes capture structured data without
 * modifying the library binary.
 *
 * The tracing system is module-agnostic and is shared by all components:
 * Newton root finding, IRR, XIRR, TVM formulas, amortization, batch solving.
 *
 * Example usage with bpftrace:
 *   # Trace every Newton step of every rate solve
 *   sudo bpftrace -e 'usdt:./lib*.so:yieldsolve:newton_iter { printf("%d %f\n", arg0, arg2); }'
 *
 *   # Monitor non-convergence across all modules
 *   sudo bpftrace -e 'usdt:./lib*.so:yieldsolve:convergence_failed { ... }'
 */

#ifndef YIELDSOLVE_TRACE_H
#define YIELDSOLVE_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all yieldsolve library probes
 */
#define YIELDSOLVE_PROVIDER yieldsolve

/**
 * Module identifiers for multi-module tracing
 * These are passed as the first parameter to many probes
 */
#define MODULE_IRR           1
#define MODULE_XIRR          2
#define MODULE_NEWTON_ROOT   3
#define MODULE_TVM           4
#define MODULE_AMORTIZATION  5
#define MODULE_BATCH_SOLVER  6

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., series length, batch size)
 * @param param2: Module-specific parameter (e.g., guess, tolerance)
 * @param param3: Module-specific parameter
 */
#define YIELDSOLVE_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(YIELDSOLVE_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Number of iterations/items completed
 * @param final_metric: Final metric value (e.g., solved rate, failure count)
 */
#define YIELDSOLVE_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(YIELDSOLVE_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param iter: Current iteration number
 * @param error: Current error metric (|residual|)
 * @param tolerance: Convergence threshold
 */
#define YIELDSOLVE_TRACE_CONVERGENCE_ITER(module_id, iter, error, tolerance) \
    DTRACE_PROBE4(YIELDSOLVE_PROVIDER, convergence_iter, module_id, iter, error, tolerance)

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param final_error: Final error achieved
 */
#define YIELDSOLVE_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_error) \
    DTRACE_PROBE3(YIELDSOLVE_PROVIDER, convergence_success, module_id, final_iter, final_error)

/**
 * Fired when convergence fails
 * @param module_id: Module identifier
 * @param max_iter: Iterations attempted
 * @param final_error: Final error at failure (NaN for undefined iterates)
 */
#define YIELDSOLVE_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_error) \
    DTRACE_PROBE3(YIELDSOLVE_PROVIDER, convergence_failed, module_id, max_iter, final_error)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode as integer
 * @param param1: Relevant parameter value
 * @param param2: Relevant parameter value or index
 */
#define YIELDSOLVE_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(YIELDSOLVE_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Runtime error codes passed to YIELDSOLVE_TRACE_RUNTIME_ERROR
 */
#define RUNTIME_ERROR_DEGENERATE_DERIVATIVE  1
#define RUNTIME_ERROR_NON_FINITE_RESIDUAL    2

/**
 * Fired when a numerical pathology is absorbed into the result
 * @param module_id: Module identifier
 * @param error_code: RUNTIME_ERROR_* constant
 * @param context: Context value (iteration number)
 */
#define YIELDSOLVE_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(YIELDSOLVE_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Newton Root Finder Probes
 * ============================================================================
 */

/**
 * Fired when Newton iteration begins
 * @param x0: Initial guess
 * @param tolerance: Residual tolerance
 * @param max_iter: Step bound
 */
#define YIELDSOLVE_TRACE_NEWTON_START(x0, tolerance, max_iter) \
    YIELDSOLVE_TRACE_ALGO_START(MODULE_NEWTON_ROOT, max_iter, tolerance, x0)

/**
 * Fired on each Newton step, after the residual at the new iterate is known
 * @param iter: Step number (1-based)
 * @param x: Current iterate
 * @param fx: Residual at x
 * @param dfx: Derivative at x
 */
#define YIELDSOLVE_TRACE_NEWTON_ITER(iter, x, fx, dfx) \
    DTRACE_PROBE4(YIELDSOLVE_PROVIDER, newton_iter, iter, x, fx, dfx)

/**
 * Fired when Newton iteration completes
 * @param root: Final iterate
 * @param iterations: Steps applied
 * @param converged: 1 if converged, 0 if not
 */
#define YIELDSOLVE_TRACE_NEWTON_COMPLETE(root, iterations, converged) \
    DTRACE_PROBE3(YIELDSOLVE_PROVIDER, newton_complete, root, iterations, converged)

#endif // YIELDSOLVE_TRACE_H
