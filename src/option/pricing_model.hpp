// SPDX-License-Identifier: MIT
/**
 * @file pricing_model.hpp
 * @brief Closed-form lognormal option pricing, Greeks and implied volatility
 *
 * Greeks are reported in trading units:
 * - delta, gamma per unit of underlying
 * - theta per calendar day (annual theta / 365)
 * - vega, rho per one percentage point (÷100)
 */

#pragma once

#include "zdte/math/root_finding.hpp"
#include "zdte/option/option_spec.hpp"
#include "zdte/support/error_types.hpp"
#include <cstddef>
#include <expected>

namespace zdte {

/// Volatility returned when implied volatility cannot be solved at all
inline constexpr double kDefaultVolatility = 0.20;

/// Option sensitivities (see file comment for units)
struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double rho = 0.0;
};

/// Newton-Raphson configuration for implied volatility
struct ImpliedVolConfig {
    double initial_guess = kDefaultVolatility;  ///< Seed volatility
    double vol_floor = 0.01;                    ///< Applied after every step
    RootFindingConfig root_config{.max_iter = 100, .tolerance = 1e-6};
};

/// Success result from IV solver
struct IVSuccess {
    double implied_vol;              ///< Solved implied volatility
    size_t iterations;               ///< Number of iterations taken
    double final_error;              ///< |Price(σ) - Market_Price|
};

/// Black-Scholes price; 0.0 when the parameters fail validation
double option_price(const PricingParams& params);

/// Black-Scholes delta; 0.0 when the parameters fail validation
double option_delta(const PricingParams& params);

/// Analytic Greeks; all zero when the parameters fail validation
/// or any sensitivity is non-finite
Greeks option_greeks(const PricingParams& params);

/**
 * @brief Solve for implied volatility with Newton-Raphson
 *
 * Seeded at config.initial_guess, step σ -= (price(σ) - market)/vega(σ),
 * floored at config.vol_floor after every step.
 *
 * Failure modes:
 * - Invalid spot/strike/maturity/price: IVError without last_vol
 * - Iteration ceiling: MaxIterationsExceeded with last_vol
 * - Vega underflow: NumericalInstability with last_vol
 */
std::expected<IVSuccess, IVError> solve_implied_volatility(
    const IVQuery& query, const ImpliedVolConfig& config = {});

/// Collapse an IV result to a usable volatility
///
/// Returns the solved volatility, else the last Newton iterate, else
/// kDefaultVolatility.
double implied_volatility_or_default(const std::expected<IVSuccess, IVError>& result);

/**
 * @brief Option pricer bound to one risk-free rate snapshot
 *
 * The rate is fixed at construction: a decision cycle builds its own
 * model from the rate it refreshed, and no later refresh can alter an
 * in-flight calculation.
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class PricingModel {
public:
    explicit PricingModel(double risk_free_rate = kDefaultRiskFreeRate)
        : rate_(risk_free_rate) {}

    double risk_free_rate() const { return rate_; }

    /// Price; 0.0 for degenerate inputs
    double price(double spot, double strike, double tau, double vol, OptionType type) const;

    /// Delta only (hot path of the strike solver)
    double delta(double spot, double strike, double tau, double vol, OptionType type) const;

    /// Full Greeks; all zero for degenerate inputs
    Greeks greeks(double spot, double strike, double tau, double vol, OptionType type) const;

    /// Implied volatility at this model's rate
    std::expected<IVSuccess, IVError> implied_volatility(
        double spot, double strike, double tau, double observed_price, OptionType type,
        const ImpliedVolConfig& config = {}) const;

private:
    PricingParams params(double spot, double strike, double tau, double vol,
                         OptionType type) const;

    double rate_;
};

}  // namespace zdte
