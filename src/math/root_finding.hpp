// SPDX-License-Identifier: MIT
#pragma once

#include "zdte/support/zdte_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace zdte {

/// Configuration for all root-finding methods
///
/// Each method uses only its relevant parameters.
struct RootFindingConfig {
    /// Maximum iterations for any method
    size_t max_iter = 100;

    /// Absolute convergence tolerance on |f(x)|
    double tolerance = 1e-6;

    /// Newton: derivative magnitude at or below which the step is abandoned
    double min_derivative = 1e-12;

    /// Trace module reported by the convergence trace points
    int trace_module = 0;
};

/// Result from any root-finding method
///
/// A non-converged result still carries the best approximate root in
/// `root`; callers decide whether an approximation is acceptable.
struct RootFindingResult {
    /// Convergence status
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// Final |f(root)|
    double final_error;

    /// Optional failure diagnostic message
    std::optional<std::string> failure_reason;

    /// Last iterate (approximate when !converged, absent on invalid input)
    std::optional<double> root;
};

/// Concept for objective functions (scalar functions f: R -> R)
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for derivative functions (scalar functions df: R -> R)
template<typename DF>
concept DerivativeFunction = requires(DF df, double x) {
    { df(x) } -> std::convertible_to<double>;
};

/// Direction of a monotone objective over the bracket
enum class Monotonicity {
    Increasing,
    Decreasing
};

/// Find root using bisection on a monotone function
///
/// Halves [lo, hi] until |f(mid)| < tolerance. The side that is discarded
/// is chosen from the sign of f(mid) and the declared monotonicity, so no
/// sign change at the endpoints is required: if the root lies outside the
/// bracket, the midpoint walks toward the nearer endpoint and the last
/// midpoint is returned unconverged.
///
/// @param f Monotone function to find root of
/// @param lo Left bracket
/// @param hi Right bracket
/// @param monotonicity Whether f increases or decreases over [lo, hi]
/// @param config Root-finding configuration (uses max_iter, tolerance)
/// @return Result with last midpoint and convergence status
template<ObjectiveFunction F>
RootFindingResult bisection_find_root(F&& f, double lo, double hi,
                                      Monotonicity monotonicity,
                                      const RootFindingConfig& config) {
    if (!(lo < hi) || !std::isfinite(lo) || !std::isfinite(hi)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Invalid bracket: lo must be < hi",
            .root = std::nullopt
        };
    }

    ZDTE_TRACE_ALGO_START(config.trace_module, config.max_iter, config.tolerance, lo);

    double mid = 0.5 * (lo + hi);
    double error = std::numeric_limits<double>::infinity();

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        mid = 0.5 * (lo + hi);
        const double fm = f(mid);

        if (!std::isfinite(fm)) {
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = std::numeric_limits<double>::quiet_NaN(),
                .failure_reason = "Function returned non-finite value (NaN or Inf)",
                .root = mid
            };
        }

        error = std::abs(fm);
        if (error < config.tolerance) {
            ZDTE_TRACE_CONVERGENCE_SUCCESS(config.trace_module, iter + 1, error);
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = error,
                .failure_reason = std::nullopt,
                .root = mid
            };
        }

        // Root lies to the right when an increasing f is still negative,
        // or a decreasing f is still positive.
        const bool root_right = (monotonicity == Monotonicity::Increasing) ? (fm < 0.0)
                                                                           : (fm > 0.0);
        if (root_right) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    ZDTE_TRACE_CONVERGENCE_FAILED(config.trace_module, config.max_iter, error, mid);
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = error,
        .failure_reason = "Maximum iterations reached without convergence",
        .root = mid
    };
}

/// Find root using Newton-Raphson with a lower floor
///
/// Update rule: x_{n+1} = max(x_n - f(x_n)/f'(x_n), x_floor).
/// Stops early, unconverged, when |f'(x)| underflows below
/// config.min_derivative, returning the current iterate.
///
/// @param f Function to find root of (finds x where f(x) = 0)
/// @param df Derivative of f (df/dx)
/// @param x0 Initial guess
/// @param x_floor Lower bound applied after every step
/// @param config Root-finding configuration (uses max_iter, tolerance, min_derivative)
/// @return Result with last iterate and convergence status
///
/// **Example:**
/// ```cpp
/// auto f = [](double x) { return x*x - 2.0; };  // Find sqrt(2)
/// auto df = [](double x) { return 2.0*x; };
/// auto result = newton_find_root(f, df, 1.0, 0.0, config);
/// ```
template<ObjectiveFunction F, DerivativeFunction DF>
RootFindingResult newton_find_root(F&& f, DF&& df,
                                   double x0,
                                   double x_floor,
                                   const RootFindingConfig& config) {
    double x = std::max(x0, x_floor);

    ZDTE_TRACE_ALGO_START(config.trace_module, config.max_iter, config.tolerance, x);

    double error_abs = std::numeric_limits<double>::infinity();

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        const double fx = f(x);
        const double dfx = df(x);

        if (!std::isfinite(fx) || !std::isfinite(dfx)) {
            ZDTE_TRACE_CONVERGENCE_FAILED(config.trace_module, iter + 1,
                                          std::numeric_limits<double>::quiet_NaN(), x);
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = std::numeric_limits<double>::quiet_NaN(),
                .failure_reason = "Function or derivative returned non-finite value",
                .root = x
            };
        }

        error_abs = std::abs(fx);

        if (error_abs < config.tolerance) {
            ZDTE_TRACE_CONVERGENCE_SUCCESS(config.trace_module, iter + 1, error_abs);
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = error_abs,
                .failure_reason = std::nullopt,
                .root = x
            };
        }

        if (std::abs(dfx) <= config.min_derivative) {
            ZDTE_TRACE_CONVERGENCE_FAILED(config.trace_module, iter + 1, error_abs, x);
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = error_abs,
                .failure_reason = "Derivative too small (flat region)",
                .root = x
            };
        }

        x = std::max(x - fx / dfx, x_floor);
    }

    error_abs = std::abs(f(x));
    ZDTE_TRACE_CONVERGENCE_FAILED(config.trace_module, config.max_iter, error_abs, x);
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = error_abs,
        .failure_reason = "Maximum iterations reached without convergence",
        .root = x
    };
}

}  // namespace zdte
