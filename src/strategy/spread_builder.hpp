// SPDX-License-Identifier: MIT
/**
 * @file spread_builder.hpp
 * @brief Assemble priced multi-leg structures from delta-targeted strikes
 *
 * The builder solves strikes, prices every leg, computes net Greeks and
 * probability of profit. It does not apply acceptance gates: a structure
 * that prices consistently is returned even if it is a poor trade.
 */

#pragma once

#include "zdte/option/pricing_model.hpp"
#include "zdte/option/strike_solver.hpp"
#include "zdte/strategy/probability_model.hpp"
#include "zdte/strategy/strategy_config.hpp"
#include "zdte/strategy/strategy_structure.hpp"
#include "zdte/support/error_types.hpp"
#include <expected>
#include <optional>
#include <utility>

namespace zdte {

/// Market inputs shared by every structure built in one cycle
struct BuildInputs {
    double spot;
    double volatility;
    double short_tau;   ///< Same-day expiry, years
    double long_tau;    ///< Diagonal long-leg expiry, years
};

/// Metrics of a two-leg, single-expiry vertical spread
struct VerticalSpread {
    OptionLeg short_leg;
    OptionLeg long_leg;
    double width;           ///< |short strike - long strike|
    double net_credit;      ///< short price - long price (negative for a debit)
    bool is_credit;         ///< Short leg is the more expensive strike
    double max_profit;
    double max_loss;
    double breakeven;
    NetGreeks net;
};

/**
 * @brief Builds option structures at one rate, configuration and solver setup
 *
 * Example:
 * @code
 * SpreadBuilder builder(PricingModel(0.045), StrategyConfig{});
 * BuildInputs inputs{.spot = 5000.0, .volatility = 0.15,
 *                    .short_tau = 1.0 / 365.25, .long_tau = 7.0 / 365.25};
 * auto spread = builder.build_put_credit_spread(inputs, 0.15);
 * if (spread.has_value()) {
 *     double credit = spread->net_credit_or_debit;
 * }
 * @endcode
 */
class SpreadBuilder {
public:
    SpreadBuilder(PricingModel model, StrategyConfig config,
                  StrikeSolverConfig solver_config = {})
        : model_(model)
        , config_(std::move(config))
        , solver_config_(solver_config) {}

    const PricingModel& model() const { return model_; }
    const StrategyConfig& config() const { return config_; }

    /**
     * @brief Price a vertical spread from explicit strikes
     *
     * Put credit (short above long): breakeven = short - credit.
     * Call credit (short below long): breakeven = short + credit.
     * Debit verticals: max profit = width - debit, max loss = debit,
     * breakeven = long strike + debit (calls) or long strike - debit (puts).
     */
    std::expected<VerticalSpread, BuildError> build_vertical(
        double spot, double short_strike, double long_strike, double tau, double vol,
        OptionType type) const;

    /// Short put at -target_delta, long put spread_width below
    ///
    /// @param target_delta Short-put delta magnitude in (0, 1)
    std::expected<StrategyStructure, BuildError> build_put_credit_spread(
        const BuildInputs& inputs, double target_delta) const;

    /// Same-day short call at diagonal_short_delta, long call
    /// diagonal_strike_offset higher expiring at inputs.long_tau
    std::expected<StrategyStructure, BuildError> build_call_diagonal(
        const BuildInputs& inputs) const;

    /**
     * @brief Four-leg iron condor with symmetric short deltas
     *
     * @param target_delta Short-strike delta magnitude for both sides
     * @param regime When set, probability of profit is regime-adjusted
     */
    std::expected<StrategyStructure, BuildError> build_iron_condor(
        const BuildInputs& inputs, double target_delta,
        const std::optional<MarketRegime>& regime = std::nullopt) const;

    /// Single iron condor at iron_condor_target_delta, unadjusted probability
    std::expected<StrategyStructure, BuildError> build_iron_condor(
        const BuildInputs& inputs) const;

private:
    OptionLeg price_leg(double spot, double strike, double tau, double vol,
                        OptionType type) const;

    std::expected<double, BuildError> solve_strike(double spot, double signed_delta,
                                                   double tau, double vol,
                                                   OptionType type) const;

    PricingModel model_;
    StrategyConfig config_;
    StrikeSolverConfig solver_config_;
};

/// Position Greeks of a long leg minus a short leg
NetGreeks net_greeks(const OptionLeg& long_leg, const OptionLeg& short_leg);

}  // namespace zdte
