// SPDX-License-Identifier: MIT
#include "zdte/option/pricing_model.hpp"
#include "zdte/math/black_scholes_analytics.hpp"
#include "zdte/support/zdte_trace.h"
#include <algorithm>
#include <cmath>

namespace zdte {

namespace {

constexpr double kDaysPerYear = 365.0;
constexpr double kPercent = 100.0;

bool valid_for_pricing(const PricingParams& params) {
    auto validation = validate_pricing_params(params);
    if (!validation) {
        ZDTE_TRACE_VALIDATION_ERROR(ZDTE_MODULE_PRICING,
                                    static_cast<int>(validation.error().code),
                                    validation.error().value, 0.0);
        return false;
    }
    return true;
}

/// Option-spec validation reports only spot, strike, maturity and rate
IVErrorCode iv_error_code(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidStrike: return IVErrorCode::NegativeStrike;
        case ValidationErrorCode::InvalidMaturity: return IVErrorCode::NegativeMaturity;
        case ValidationErrorCode::InvalidRate: return IVErrorCode::InvalidRate;
        case ValidationErrorCode::InvalidSpotPrice:
        default:
            return IVErrorCode::NegativeSpot;
    }
}

}  // namespace

// ===========================================================================
// Free functions
// ===========================================================================

double option_price(const PricingParams& params) {
    if (!valid_for_pricing(params)) {
        return 0.0;
    }
    double price = bs_price(params.spot, params.strike, params.maturity,
                            params.volatility, params.rate, params.option_type);
    if (!std::isfinite(price)) {
        return 0.0;
    }
    // Deep OTM prices can round a hair below zero
    return std::max(price, 0.0);
}

double option_delta(const PricingParams& params) {
    if (!valid_for_pricing(params)) {
        return 0.0;
    }
    double d1 = bs_d1(params.spot, params.strike, params.maturity,
                      params.volatility, params.rate);
    double delta = (params.option_type == OptionType::PUT) ? -norm_cdf(-d1) : norm_cdf(d1);
    return std::isfinite(delta) ? delta : 0.0;
}

Greeks option_greeks(const PricingParams& params) {
    if (!valid_for_pricing(params)) {
        return Greeks{};
    }

    const double S = params.spot;
    const double K = params.strike;
    const double tau = params.maturity;
    const double sigma = params.volatility;
    const double r = params.rate;

    const double sqrt_tau = std::sqrt(tau);
    const double d1 = bs_d1(S, K, tau, sigma, r);
    const double d2 = bs_d2(d1, tau, sigma);
    const double exp_rt = std::exp(-r * tau);
    const double pdf_d1 = norm_pdf(d1);

    // Common theta term: -S·φ(d1)·σ/(2√τ)
    const double theta_common = -S * pdf_d1 * sigma / (2.0 * sqrt_tau);

    Greeks g;
    g.gamma = pdf_d1 / (S * sigma * sqrt_tau);
    g.vega = S * sqrt_tau * pdf_d1 / kPercent;

    if (params.option_type == OptionType::PUT) {
        g.delta = -norm_cdf(-d1);
        g.theta = (theta_common + r * K * exp_rt * norm_cdf(-d2)) / kDaysPerYear;
        g.rho = -K * tau * exp_rt * norm_cdf(-d2) / kPercent;
    } else {
        g.delta = norm_cdf(d1);
        g.theta = (theta_common - r * K * exp_rt * norm_cdf(d2)) / kDaysPerYear;
        g.rho = K * tau * exp_rt * norm_cdf(d2) / kPercent;
    }

    if (!std::isfinite(g.delta) || !std::isfinite(g.gamma) || !std::isfinite(g.theta) ||
        !std::isfinite(g.vega) || !std::isfinite(g.rho)) {
        ZDTE_TRACE_VALIDATION_ERROR(ZDTE_MODULE_PRICING, -1, S, K);
        return Greeks{};
    }
    return g;
}

std::expected<IVSuccess, IVError> solve_implied_volatility(
    const IVQuery& query, const ImpliedVolConfig& config) {
    auto spec_validation = validate_option_spec(static_cast<const OptionSpec&>(query));
    if (!spec_validation) {
        const IVErrorCode code = iv_error_code(spec_validation.error().code);
        ZDTE_TRACE_VALIDATION_ERROR(ZDTE_MODULE_IMPLIED_VOL, static_cast<int>(code),
                                    spec_validation.error().value, 0.0);
        return std::unexpected(IVError{.code = code});
    }

    if (query.market_price < 0.0 || !std::isfinite(query.market_price)) {
        ZDTE_TRACE_VALIDATION_ERROR(ZDTE_MODULE_IMPLIED_VOL,
                                    static_cast<int>(IVErrorCode::NegativeMarketPrice),
                                    query.market_price, 0.0);
        return std::unexpected(IVError{.code = IVErrorCode::NegativeMarketPrice});
    }

    auto residual = [&query](double sigma) {
        return bs_price(query.spot, query.strike, query.maturity, sigma, query.rate,
                        query.option_type) - query.market_price;
    };
    auto vega = [&query](double sigma) {
        return bs_vega(query.spot, query.strike, query.maturity, sigma, query.rate);
    };

    RootFindingConfig root_config = config.root_config;
    root_config.trace_module = ZDTE_MODULE_IMPLIED_VOL;

    auto result = newton_find_root(residual, vega, config.initial_guess, config.vol_floor,
                                   root_config);

    if (result.converged) {
        return IVSuccess{
            .implied_vol = *result.root,
            .iterations = result.iterations,
            .final_error = result.final_error
        };
    }

    const IVErrorCode code = (result.iterations < root_config.max_iter)
                                 ? IVErrorCode::NumericalInstability
                                 : IVErrorCode::MaxIterationsExceeded;
    return std::unexpected(IVError{
        .code = code,
        .iterations = result.iterations,
        .final_error = result.final_error,
        .last_vol = result.root
    });
}

double implied_volatility_or_default(const std::expected<IVSuccess, IVError>& result) {
    if (result.has_value()) {
        return result->implied_vol;
    }
    const auto& last = result.error().last_vol;
    if (last.has_value() && std::isfinite(*last) && *last > 0.0) {
        return *last;
    }
    return kDefaultVolatility;
}

// ===========================================================================
// PricingModel
// ===========================================================================

PricingParams PricingModel::params(double spot, double strike, double tau, double vol,
                                   OptionType type) const {
    return PricingParams(
        OptionSpec{.spot = spot, .strike = strike, .maturity = tau,
                   .rate = rate_, .option_type = type},
        vol);
}

double PricingModel::price(double spot, double strike, double tau, double vol,
                           OptionType type) const {
    return option_price(params(spot, strike, tau, vol, type));
}

double PricingModel::delta(double spot, double strike, double tau, double vol,
                           OptionType type) const {
    return option_delta(params(spot, strike, tau, vol, type));
}

Greeks PricingModel::greeks(double spot, double strike, double tau, double vol,
                            OptionType type) const {
    return option_greeks(params(spot, strike, tau, vol, type));
}

std::expected<IVSuccess, IVError> PricingModel::implied_volatility(
    double spot, double strike, double tau, double observed_price, OptionType type,
    const ImpliedVolConfig& config) const {
    IVQuery query(OptionSpec{.spot = spot, .strike = strike, .maturity = tau,
                             .rate = rate_, .option_type = type},
                  observed_price);
    return solve_implied_volatility(query, config);
}

}  // namespace zdte
