// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Episode-level work (backtests, policy evaluation) is embarrassingly
 * parallel: every iteration owns its generator, strategy and result slot.
 *
 * Usage:
 *   HEDGELAB_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 */

#if defined(_OPENMP)
    #define HEDGELAB_PRAGMA_PARALLEL_FOR        _Pragma("omp parallel for schedule(static)")
#else
    // Sequential execution (no parallelization)
    #define HEDGELAB_PRAGMA_PARALLEL_FOR
#endif

/**
 * Design notes:
 *
 * 1. Static scheduling keeps each thread on a contiguous block of the
 *    results vector, avoiding false sharing on neighbouring slots.
 *
 * 2. _Pragma is used instead of #pragma so the directive can live inside
 *    a macro definition.
 */
