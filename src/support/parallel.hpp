// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Batch solvers write through these macros instead of raw pragmas so the
 * library builds unchanged with or without OpenMP:
 *
 *   YIELDSOLVE_PRAGMA_PARALLEL
 *   {
 *       YIELDSOLVE_PRAGMA_FOR_STATIC
 *       for (size_t i = 0; i < n; ++i) { ... }
 *   }
 */

#if defined(_OPENMP)
    #define YIELDSOLVE_PRAGMA_PARALLEL               _Pragma("omp parallel")
    #define YIELDSOLVE_PRAGMA_FOR_STATIC             _Pragma("omp for schedule(static)")
    #define YIELDSOLVE_PRAGMA_ATOMIC                 _Pragma("omp atomic")
#else
    // Sequential execution (no parallelization)
    #define YIELDSOLVE_PRAGMA_PARALLEL
    #define YIELDSOLVE_PRAGMA_FOR_STATIC
    #define YIELDSOLVE_PRAGMA_ATOMIC
#endif

/**
 * Design notes:
 *
 * 1. _Pragma is used instead of #pragma so the pragma can live inside a macro.
 *
 * 2. FOR_STATIC hands each thread a contiguous block of the result vector,
 *    avoiding false sharing on adjacent result slots.
 */
