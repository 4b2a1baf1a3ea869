// SPDX-License-Identifier: MIT
/**
 * @file black_scholes_analytics.hpp
 * @brief Normal distribution and closed-form lognormal pricing terms
 *
 * No dividend-yield term.
 */

#pragma once

#include <algorithm>
#include <cmath>

#include "zdte/option/option_spec.hpp"

namespace zdte {

/// φ(x)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Φ(x), via erfc so the far tails keep their precision
inline double norm_cdf(double x) {
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// d1 = [ln(S/K) + (r + σ²/2)τ] / (σ√τ)
inline double bs_d1(double spot, double strike, double tau, double sigma, double rate) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate + 0.5 * sigma * sigma) * tau) / sigma_sqrt_tau;
}

/// d2 = d1 - σ√τ
///
/// Φ(d2) is the risk-neutral probability that a call finishes in the money.
inline double bs_d2(double d1, double tau, double sigma) {
    return d1 - sigma * std::sqrt(tau);
}

/// ∂V/∂σ = S·√τ·φ(d1), per unit of volatility (identical for puts and calls)
///
/// Zero when τ or σ is not positive. Newton-Raphson for implied
/// volatility treats that as a flat derivative.
inline double bs_vega(double spot, double strike, double tau, double sigma, double rate) {
    if (tau <= 0.0 || sigma <= 0.0) {
        return 0.0;
    }
    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    return spot * std::sqrt(tau) * norm_pdf(d1);
}

/// Lognormal (Black-Scholes) price of a European put or call
///
/// Expired options are worth intrinsic value; zero volatility gives the
/// intrinsic value against the discounted strike.
inline double bs_price(double spot, double strike, double tau, double sigma, double rate,
                       OptionType option_type) {
    if (tau <= 0.0 || sigma <= 0.0) {
        if (tau <= 0.0) {
            return intrinsic_value(spot, strike, option_type);
        }
        double K_disc = strike * std::exp(-rate * tau);
        return intrinsic_value(spot, K_disc, option_type);
    }

    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    double d2 = bs_d2(d1, tau, sigma);
    double exp_rt = std::exp(-rate * tau);

    if (option_type == OptionType::PUT) {
        return strike * exp_rt * norm_cdf(-d2) - spot * norm_cdf(-d1);
    }
    return spot * norm_cdf(d1) - strike * exp_rt * norm_cdf(d2);
}

}  // namespace zdte
