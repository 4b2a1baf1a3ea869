// SPDX-License-Identifier: MIT
/**
 * @file zdte_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the zdte library
 *
 * Tracing points that can be enabled at runtime with bpftrace, systemtap or
 * perf. When tracing is disabled (default), probes compile to NOPs.
 *
 * The decision engine never prints; every diagnostic a caller would want in a
 * log (aborted cycles, rejected candidates, non-converged solvers) fires one
 * of the probes below.
 *
 * Example usage with bpftrace:
 *   # Why was no trade recommended today?
 *   sudo bpftrace -e 'usdt:./example_daily_decision:zdte:cycle_aborted { printf("%d\n", arg0); }'
 *
 *   # Candidate rejections with reason codes
 *   sudo bpftrace -e 'usdt:./example_daily_decision:zdte:candidate_rejected { ... }'
 */

#ifndef ZDTE_TRACE_H
#define ZDTE_TRACE_H

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
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all zdte library probes
 */
#define ZDTE_PROVIDER zdte

/**
 * Module identifiers, passed as the first parameter to most probes
 */
#define ZDTE_MODULE_PRICING        1
#define ZDTE_MODULE_IMPLIED_VOL    2
#define ZDTE_MODULE_STRIKE_SOLVER  3
#define ZDTE_MODULE_PROBABILITY    4
#define ZDTE_MODULE_SPREAD_BUILDER 5
#define ZDTE_MODULE_SELECTOR       6
#define ZDTE_MODULE_VALIDATION     7

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (ZDTE_MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., max_iter)
 * @param param2: Module-specific parameter (e.g., tolerance)
 * @param param3: Module-specific parameter (e.g., initial guess)
 */
#define ZDTE_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(ZDTE_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Number of iterations completed
 * @param final_metric: Final metric value (e.g., solution, residual)
 */
#define ZDTE_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(ZDTE_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param final_error: Final error achieved
 */
#define ZDTE_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_error) \
    DTRACE_PROBE3(ZDTE_PROVIDER, convergence_success, module_id, final_iter, final_error)

/**
 * Fired when an iteration ceiling is hit or the step degenerates
 * @param module_id: Module identifier
 * @param max_iter: Iterations attempted
 * @param final_error: Final error at failure
 * @param last_value: Best approximate value returned to the caller
 */
#define ZDTE_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_error, last_value) \
    DTRACE_PROBE4(ZDTE_PROVIDER, convergence_failed, module_id, max_iter, final_error, last_value)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: Error code (module-specific enum value)
 * @param param1: Offending value
 * @param param2: Threshold or secondary value
 */
#define ZDTE_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(ZDTE_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * ============================================================================
 * Strategy Selection Probes
 * ============================================================================
 */

/**
 * Fired when a decision cycle is abandoned because the snapshot is unusable
 * @param error_code: SnapshotErrorCode value
 * @param value: Offending field value (0 for missing fields)
 */
#define ZDTE_TRACE_CYCLE_ABORTED(error_code, value) \
    DTRACE_PROBE2(ZDTE_PROVIDER, cycle_aborted, error_code, value)

/**
 * Fired when a candidate structure fails an acceptance gate
 * @param kind: StrategyKind value
 * @param reason: RejectionReason value
 * @param target_delta: Target delta of the attempt (0 if not applicable)
 * @param value: Quantity that failed the gate
 */
#define ZDTE_TRACE_CANDIDATE_REJECTED(kind, reason, target_delta, value) \
    DTRACE_PROBE4(ZDTE_PROVIDER, candidate_rejected, kind, reason, target_delta, value)

/**
 * Fired for each scored iron-condor grid candidate
 * @param target_delta: Short-strike target delta
 * @param score: Optimization score (0-100)
 * @param prob_profit: Probability of profit used in the score
 */
#define ZDTE_TRACE_CANDIDATE_SCORED(target_delta, score, prob_profit) \
    DTRACE_PROBE3(ZDTE_PROVIDER, candidate_scored, target_delta, score, prob_profit)

/**
 * Fired when a recommendation is emitted
 * @param kind: StrategyKind value
 * @param action: Action value
 * @param prob_profit: Probability of profit
 */
#define ZDTE_TRACE_RECOMMENDATION(kind, action, prob_profit) \
    DTRACE_PROBE3(ZDTE_PROVIDER, recommendation, kind, action, prob_profit)

/**
 * Fired when the trade validator decides on a recommendation
 * @param kind: StrategyKind value
 * @param approved: 1 if approved, 0 if rejected
 * @param reasons: Number of rejection reasons
 * @param size: Recommended position size
 */
#define ZDTE_TRACE_TRADE_VALIDATED(kind, approved, reasons, size) \
    DTRACE_PROBE4(ZDTE_PROVIDER, trade_validated, kind, approved, reasons, size)

#endif // ZDTE_TRACE_H
