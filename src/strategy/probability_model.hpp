// SPDX-License-Identifier: MIT
/**
 * @file probability_model.hpp
 * @brief Lognormal probability that the underlying finishes in a price region
 *
 * Terminal log-price is normal with drift (r - σ²/2)T and standard
 * deviation σ√T. For a boundary B:
 *
 *   z(B) = (ln(B/S) - (r - σ²/2)T) / (σ√T)
 *
 * - lower bound only: P = 1 - Φ(z(L))
 * - upper bound only: P = Φ(z(U))
 * - both bounds:      P = Φ(z(U)) - Φ(z(L))
 *
 * A non-positive bound lies below every reachable price.
 */

#pragma once

#include "zdte/support/error_types.hpp"
#include <expected>
#include <optional>

namespace zdte {

/// Probability reported when a region query cannot be evaluated
inline constexpr double kNeutralProbability = 0.5;

/// Ceiling applied after the regime adjustment
inline constexpr double kRegimeProbabilityCeiling = 0.95;

/// Price region, open on either side when a bound is absent
struct PriceRegion {
    std::optional<double> lower;
    std::optional<double> upper;

    static PriceRegion above(double bound) { return {.lower = bound, .upper = std::nullopt}; }
    static PriceRegion below(double bound) { return {.lower = std::nullopt, .upper = bound}; }
    static PriceRegion between(double lo, double hi) { return {.lower = lo, .upper = hi}; }
};

/**
 * @brief Probability that the terminal price falls inside `region`
 *
 * @param spot Current underlying price (> 0)
 * @param region At least one finite bound; lower <= upper when both set
 * @param tau Time to expiry in years (> 0)
 * @param vol Volatility (> 0)
 * @param rate Risk-free rate (finite)
 * @return Probability in [0, 1], or ValidationError
 */
std::expected<double, ValidationError> probability_in_region(
    double spot, const PriceRegion& region, double tau, double vol, double rate);

/// Probability of finishing above `lower` (and below `upper` when given)
///
/// Degenerate inputs yield kNeutralProbability.
double probability_in_range(double spot, double lower, std::optional<double> upper,
                            double tau, double vol, double rate);

/// Market regime observed for the cycle
struct MarketRegime {
    double vix_level;
    double rsi;
    double volume_ratio;
};

/**
 * @brief Scale a model probability by the market regime
 *
 * Multiplicative factors:
 * - VIX < 20: ×1.10, VIX > 30: ×0.90
 * - RSI in [45, 55]: ×1.05
 * - volume ratio > 1.3: ×0.95
 *
 * The result is clamped to [0, kRegimeProbabilityCeiling].
 */
double apply_regime_adjustment(double probability, const MarketRegime& regime);

}  // namespace zdte
