// SPDX-License-Identifier: MIT
#include "zdte/strategy/probability_model.hpp"
#include "zdte/math/black_scholes_analytics.hpp"
#include "zdte/support/zdte_trace.h"
#include <algorithm>
#include <cmath>

namespace zdte {

namespace {

std::expected<void, ValidationError> validate_region_query(
    double spot, const PriceRegion& region, double tau, double vol, double rate) {
    if (!(spot > 0.0) || !std::isfinite(spot)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidSpotPrice, spot));
    }
    if (!(tau > 0.0) || !std::isfinite(tau)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidMaturity, tau));
    }
    if (!(vol > 0.0) || !std::isfinite(vol)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidVolatility, vol));
    }
    if (!std::isfinite(rate)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidRate, rate));
    }
    if (!region.lower && !region.upper) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds));
    }
    if (region.lower && !std::isfinite(*region.lower)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds, *region.lower));
    }
    if (region.upper && !std::isfinite(*region.upper)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds, *region.upper));
    }
    if (region.lower && region.upper && *region.lower > *region.upper) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds, *region.lower));
    }
    return {};
}

/// Φ(z(B)); 0 for a bound at or below zero
double cdf_at_bound(double spot, double bound, double tau, double vol, double rate) {
    if (bound <= 0.0) {
        return 0.0;
    }
    const double sigma_sqrt_t = vol * std::sqrt(tau);
    const double drift = (rate - 0.5 * vol * vol) * tau;
    const double z = (std::log(bound / spot) - drift) / sigma_sqrt_t;
    return norm_cdf(z);
}

}  // namespace

std::expected<double, ValidationError> probability_in_region(
    double spot, const PriceRegion& region, double tau, double vol, double rate) {
    auto validation = validate_region_query(spot, region, tau, vol, rate);
    if (!validation) {
        ZDTE_TRACE_VALIDATION_ERROR(ZDTE_MODULE_PROBABILITY,
                                    static_cast<int>(validation.error().code),
                                    validation.error().value, spot);
        return std::unexpected(validation.error());
    }

    const double cdf_lower = region.lower ? cdf_at_bound(spot, *region.lower, tau, vol, rate) : 0.0;
    const double cdf_upper = region.upper ? cdf_at_bound(spot, *region.upper, tau, vol, rate) : 1.0;

    return std::clamp(cdf_upper - cdf_lower, 0.0, 1.0);
}

double probability_in_range(double spot, double lower, std::optional<double> upper,
                            double tau, double vol, double rate) {
    PriceRegion region{.lower = lower, .upper = upper};
    return probability_in_region(spot, region, tau, vol, rate).value_or(kNeutralProbability);
}

double apply_regime_adjustment(double probability, const MarketRegime& regime) {
    double adjusted = probability;

    if (regime.vix_level < 20.0) {
        adjusted *= 1.10;
    } else if (regime.vix_level > 30.0) {
        adjusted *= 0.90;
    }

    if (regime.rsi >= 45.0 && regime.rsi <= 55.0) {
        adjusted *= 1.05;
    }

    if (regime.volume_ratio > 1.3) {
        adjusted *= 0.95;
    }

    return std::clamp(adjusted, 0.0, kRegimeProbabilityCeiling);
}

}  // namespace zdte
