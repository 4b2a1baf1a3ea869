// SPDX-License-Identifier: MIT
/**
 * @file market_inputs.hpp
 * @brief Volatility and risk-free-rate inputs derived from market data
 */

#pragma once

#include <cstddef>
#include <optional>
#include <span>

namespace zdte {

/// Volatility used when nothing better is known
inline constexpr double kFallbackVolatility = 0.20;

/// Lower bound on any volatility estimate
inline constexpr double kVolatilityFloor = 0.10;

/// Trading days per year for annualizing realized volatility
inline constexpr double kTradingDaysPerYear = 252.0;

/// Closes required before realized volatility is blended in
inline constexpr std::size_t kMinClosesForRealizedVol = 21;

/// Annualized sample standard deviation of daily log returns
///
/// Returns std::nullopt with fewer than two usable closes or when any
/// close is non-positive.
std::optional<double> realized_volatility(std::span<const double> closes);

/**
 * @brief Pricing volatility for one cycle
 *
 * VIX/100, blended 70/30 with realized volatility when at least
 * kMinClosesForRealizedVol closes are supplied, floored at
 * kVolatilityFloor. Non-finite or negative VIX yields kFallbackVolatility.
 *
 * @param vix_level Volatility-index level in percent
 * @param closes Daily closes, oldest first (may be empty)
 */
double estimate_volatility(double vix_level, std::span<const double> closes);

/// Annualized risk-free rate from a quoted Treasury yield in percent
///
/// A missing, non-finite or negative quote yields kDefaultRiskFreeRate.
double risk_free_rate_from_yield_percent(std::optional<double> yield_percent);

}  // namespace zdte
