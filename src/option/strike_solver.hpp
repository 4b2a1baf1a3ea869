// SPDX-License-Identifier: MIT
/**
 * @file strike_solver.hpp
 * @brief Inverse-delta strike search
 */

#pragma once

#include "zdte/option/pricing_model.hpp"
#include "zdte/support/error_types.hpp"
#include <cstddef>
#include <expected>

namespace zdte {

/// Bisection configuration for delta-targeted strikes
struct StrikeSolverConfig {
    double lower_multiple = 0.5;    ///< Bracket low = lower_multiple × spot
    double upper_multiple = 1.5;    ///< Bracket high = upper_multiple × spot
    size_t max_iter = 50;
    double delta_tolerance = 0.01;  ///< Accept |Δ(K) - target| below this
};

/// Solved strike
///
/// `converged == false` means the iteration ceiling was hit and `strike`
/// is the last bisection midpoint: `delta` then differs from the target
/// by more than the tolerance.
struct StrikeSolution {
    double strike;
    double delta;       ///< Delta at `strike`
    size_t iterations;
    bool converged;
};

/**
 * @brief Find the strike whose delta equals target_delta
 *
 * Both call and put deltas decrease as the strike rises, so the bracket
 * [lower_multiple·S, upper_multiple·S] is halved toward higher strikes
 * whenever the computed delta is above target.
 *
 * @param model Pricing model (supplies the rate)
 * @param spot Underlying price
 * @param target_delta Signed target: in (-1, 0) for puts, (0, 1) for calls
 * @param tau Time to expiry in years
 * @param vol Volatility
 * @param type PUT or CALL
 * @return Solution, or ValidationError for unusable inputs
 */
std::expected<StrikeSolution, ValidationError> solve_strike_for_delta(
    const PricingModel& model, double spot, double target_delta, double tau, double vol,
    OptionType type, const StrikeSolverConfig& config = {});

/// Strike for target_delta; the last midpoint when unconverged, and
/// `spot` itself when the inputs are rejected
double find_strike_by_delta(const PricingModel& model, double spot, double target_delta,
                            double tau, double vol, OptionType type,
                            const StrikeSolverConfig& config = {});

}  // namespace zdte
