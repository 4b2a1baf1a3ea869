// SPDX-License-Identifier: MIT
#include "zdte/option/strike_solver.hpp"
#include "zdte/math/root_finding.hpp"
#include "zdte/support/zdte_trace.h"
#include <cmath>

namespace zdte {

namespace {

std::expected<void, ValidationError> validate_strike_query(
    double spot, double target_delta, double tau, double vol, OptionType type,
    const StrikeSolverConfig& config) {
    if (spot <= 0.0 || !std::isfinite(spot)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidSpotPrice, spot));
    }
    if (tau <= 0.0 || !std::isfinite(tau)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidMaturity, tau));
    }
    if (vol <= 0.0 || !std::isfinite(vol)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidVolatility, vol));
    }

    const bool delta_ok = (type == OptionType::PUT) ? (target_delta > -1.0 && target_delta < 0.0)
                                                    : (target_delta > 0.0 && target_delta < 1.0);
    if (!delta_ok) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidDelta, target_delta));
    }

    if (!(config.lower_multiple > 0.0) || !(config.lower_multiple < config.upper_multiple)) {
        return std::unexpected(
            ValidationError(ValidationErrorCode::InvalidBounds, config.lower_multiple));
    }
    if (config.max_iter == 0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidGridSize, 0.0));
    }
    return {};
}

}  // namespace

std::expected<StrikeSolution, ValidationError> solve_strike_for_delta(
    const PricingModel& model, double spot, double target_delta, double tau, double vol,
    OptionType type, const StrikeSolverConfig& config) {
    auto validation = validate_strike_query(spot, target_delta, tau, vol, type, config);
    if (!validation) {
        ZDTE_TRACE_VALIDATION_ERROR(ZDTE_MODULE_STRIKE_SOLVER,
                                    static_cast<int>(validation.error().code),
                                    validation.error().value, target_delta);
        return std::unexpected(validation.error());
    }

    auto delta_gap = [&](double strike) {
        return model.delta(spot, strike, tau, vol, type) - target_delta;
    };

    RootFindingConfig root_config{
        .max_iter = config.max_iter,
        .tolerance = config.delta_tolerance,
        .trace_module = ZDTE_MODULE_STRIKE_SOLVER
    };

    auto result = bisection_find_root(delta_gap,
                                      config.lower_multiple * spot,
                                      config.upper_multiple * spot,
                                      Monotonicity::Decreasing, root_config);

    // The bracket was validated above, so bisection always yields a midpoint
    const double strike = result.root.value_or(spot);
    return StrikeSolution{
        .strike = strike,
        .delta = model.delta(spot, strike, tau, vol, type),
        .iterations = result.iterations,
        .converged = result.converged
    };
}

double find_strike_by_delta(const PricingModel& model, double spot, double target_delta,
                            double tau, double vol, OptionType type,
                            const StrikeSolverConfig& config) {
    auto solution = solve_strike_for_delta(model, spot, target_delta, tau, vol, type, config);
    return solution.has_value() ? solution->strike : spot;
}

}  // namespace zdte
