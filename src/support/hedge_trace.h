// SPDX-License-Identifier: MIT
/**
 * @file hedge_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for hedgelab
 *
 * Zero-overhead tracing points that can be enabled at runtime with
 * bpftrace, systemtap or perf. When tracing is disabled (default) the
 * probes compile to single NOP instructions.
 *
 * Example usage with bpftrace:
 *   # Follow every environment step
 *   sudo bpftrace -e 'usdt:./lib*.so:hedgelab:env_step { printf("%d %f\n", arg0, arg1); }'
 *
 *   # Watch minimum-variance fallbacks across a backtest
 *   sudo bpftrace -e 'usdt:./lib*.so:hedgelab:minvar_fallback { @[arg0] = count(); }'
 */

#ifndef HEDGELAB_HEDGE_TRACE_H
#define HEDGELAB_HEDGE_TRACE_H

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
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all hedgelab probes
 */
#define HEDGELAB_PROVIDER hedgelab

/**
 * Module identifiers, passed as the first argument of shared probes
 */
#define MODULE_OPTION_SPEC      1
#define MODULE_STRATEGY         2
#define MODULE_ENVIRONMENT      3
#define MODULE_EVALUATOR        4
#define MODULE_AGENT_EVALUATOR  5

/**
 * ============================================================================
 * Validation Probes
 * ============================================================================
 */

/**
 * Fired when configuration or input validation fails
 * @param module_id: Module identifier (MODULE_* constant)
 * @param error_code: ValidationErrorCode cast to int
 * @param value: Offending value
 */
#define HEDGELAB_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    DTRACE_PROBE3(HEDGELAB_PROVIDER, validation_error, module_id, error_code, value)

/**
 * ============================================================================
 * Environment Probes
 * ============================================================================
 */

/**
 * Fired when an episode is reset
 * @param seed: Seed used for the episode generator
 * @param premium: Premium credited to cash
 * @param n_steps: Episode horizon
 */
#define HEDGELAB_TRACE_ENV_RESET(seed, premium, n_steps) \
    DTRACE_PROBE3(HEDGELAB_PROVIDER, env_reset, seed, premium, n_steps)

/**
 * Fired after every environment step
 * @param step: Step counter after the transition
 * @param spot: Underlying price after the GBM move
 * @param position: Hedge position held over the step
 * @param reward: Reward returned to the caller
 */
#define HEDGELAB_TRACE_ENV_STEP(step, spot, position, reward) \
    DTRACE_PROBE4(HEDGELAB_PROVIDER, env_step, step, spot, position, reward)

/**
 * Fired when an episode reaches its horizon
 * @param steps: Number of steps taken
 * @param final_pnl: Final PnL relative to the initial premium
 * @param total_costs: Accumulated transaction costs
 */
#define HEDGELAB_TRACE_ENV_TERMINATED(steps, final_pnl, total_costs) \
    DTRACE_PROBE3(HEDGELAB_PROVIDER, env_terminated, steps, final_pnl, total_costs)

/**
 * ============================================================================
 * Strategy Probes
 * ============================================================================
 */

/**
 * Fired on every strategy rebalance
 * @param kind: Strategy kind index
 * @param spot: Spot price at rebalance
 * @param trade: Signed stock trade
 * @param cost: Transaction cost charged
 */
#define HEDGELAB_TRACE_STRATEGY_REBALANCE(kind, spot, trade, cost) \
    DTRACE_PROBE4(HEDGELAB_PROVIDER, strategy_rebalance, kind, spot, trade, cost)

/**
 * Fired when minimum-variance hedging falls back to delta hedging
 * @param history_size: Number of observations currently in the window
 */
#define HEDGELAB_TRACE_MINVAR_FALLBACK(history_size) \
    DTRACE_PROBE1(HEDGELAB_PROVIDER, minvar_fallback, history_size)

/**
 * ============================================================================
 * Evaluation Probes
 * ============================================================================
 */

/**
 * Fired when a backtest begins
 * @param module_id: MODULE_EVALUATOR or MODULE_AGENT_EVALUATOR
 * @param num_episodes: Number of episodes requested
 * @param seed: Base seed
 */
#define HEDGELAB_TRACE_BACKTEST_START(module_id, num_episodes, seed) \
    DTRACE_PROBE3(HEDGELAB_PROVIDER, backtest_start, module_id, num_episodes, seed)

/**
 * Fired when a backtest completes
 * @param module_id: MODULE_EVALUATOR or MODULE_AGENT_EVALUATOR
 * @param num_episodes: Number of episodes evaluated
 * @param mean_pnl: Mean final PnL across episodes
 */
#define HEDGELAB_TRACE_BACKTEST_COMPLETE(module_id, num_episodes, mean_pnl) \
    DTRACE_PROBE3(HEDGELAB_PROVIDER, backtest_complete, module_id, num_episodes, mean_pnl)

#endif // HEDGELAB_HEDGE_TRACE_H
