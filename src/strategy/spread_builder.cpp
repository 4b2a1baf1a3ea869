// SPDX-License-Identifier: MIT
#include "zdte/strategy/spread_builder.hpp"
#include "zdte/support/zdte_trace.h"
#include <cmath>

namespace zdte {

namespace {

std::expected<void, BuildError> validate_inputs(double spot, double tau, double vol) {
    if (!(spot > 0.0) || !std::isfinite(spot)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::InvalidInputs, .value = spot});
    }
    if (!(tau > 0.0) || !std::isfinite(tau)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::InvalidInputs, .value = tau});
    }
    if (!(vol > 0.0) || !std::isfinite(vol)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::InvalidInputs, .value = vol});
    }
    return {};
}

NetGreeks sum_greeks(const NetGreeks& a, const NetGreeks& b) {
    return NetGreeks{
        .delta = a.delta + b.delta,
        .gamma = a.gamma + b.gamma,
        .theta = a.theta + b.theta,
        .vega = a.vega + b.vega
    };
}

}  // namespace

NetGreeks net_greeks(const OptionLeg& long_leg, const OptionLeg& short_leg) {
    return NetGreeks{
        .delta = long_leg.greeks.delta - short_leg.greeks.delta,
        .gamma = long_leg.greeks.gamma - short_leg.greeks.gamma,
        .theta = long_leg.greeks.theta - short_leg.greeks.theta,
        .vega = long_leg.greeks.vega - short_leg.greeks.vega
    };
}

OptionLeg SpreadBuilder::price_leg(double spot, double strike, double tau, double vol,
                                   OptionType type) const {
    return OptionLeg{
        .strike = strike,
        .type = type,
        .time_to_expiry = tau,
        .implied_vol = vol,
        .price = model_.price(spot, strike, tau, vol, type),
        .greeks = model_.greeks(spot, strike, tau, vol, type)
    };
}

std::expected<double, BuildError> SpreadBuilder::solve_strike(double spot, double signed_delta,
                                                              double tau, double vol,
                                                              OptionType type) const {
    auto solution = solve_strike_for_delta(model_, spot, signed_delta, tau, vol, type,
                                           solver_config_);
    if (!solution) {
        return std::unexpected(BuildError{.code = BuildErrorCode::StrikeSolveFailed,
                                          .value = signed_delta});
    }
    // An unconverged solution is still a usable approximate strike
    if (!std::isfinite(solution->strike) || solution->strike <= 0.0) {
        return std::unexpected(BuildError{.code = BuildErrorCode::DegenerateStrike,
                                          .value = solution->strike});
    }
    return solution->strike;
}

std::expected<VerticalSpread, BuildError> SpreadBuilder::build_vertical(
    double spot, double short_strike, double long_strike, double tau, double vol,
    OptionType type) const {
    if (auto valid = validate_inputs(spot, tau, vol); !valid) {
        return std::unexpected(valid.error());
    }
    for (double strike : {short_strike, long_strike}) {
        if (!(strike > 0.0) || !std::isfinite(strike)) {
            return std::unexpected(BuildError{.code = BuildErrorCode::DegenerateStrike,
                                              .value = strike});
        }
    }

    const double width = std::abs(short_strike - long_strike);
    if (!(width > 0.0)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::NonPositiveWidth,
                                          .value = width});
    }

    OptionLeg short_leg = price_leg(spot, short_strike, tau, vol, type);
    OptionLeg long_leg = price_leg(spot, long_strike, tau, vol, type);
    const double net_credit = short_leg.price - long_leg.price;

    // For puts the higher strike is the richer leg; for calls the lower one
    const bool is_credit = (type == OptionType::PUT) ? (short_strike > long_strike)
                                                     : (short_strike < long_strike);

    double max_profit;
    double max_loss;
    double breakeven;
    if (is_credit) {
        max_profit = net_credit;
        max_loss = width - net_credit;
        breakeven = (type == OptionType::PUT) ? short_strike - net_credit
                                              : short_strike + net_credit;
    } else {
        const double debit = -net_credit;
        max_profit = width - debit;
        max_loss = debit;
        breakeven = (type == OptionType::PUT) ? long_strike - debit : long_strike + debit;
    }

    if (!(max_loss > 0.0)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::NonPositiveMaxLoss,
                                          .value = max_loss});
    }

    return VerticalSpread{
        .short_leg = short_leg,
        .long_leg = long_leg,
        .width = width,
        .net_credit = net_credit,
        .is_credit = is_credit,
        .max_profit = max_profit,
        .max_loss = max_loss,
        .breakeven = breakeven,
        .net = net_greeks(long_leg, short_leg)
    };
}

std::expected<StrategyStructure, BuildError> SpreadBuilder::build_put_credit_spread(
    const BuildInputs& inputs, double target_delta) const {
    if (auto valid = validate_inputs(inputs.spot, inputs.short_tau, inputs.volatility); !valid) {
        return std::unexpected(valid.error());
    }
    ZDTE_TRACE_ALGO_START(ZDTE_MODULE_SPREAD_BUILDER,
                          static_cast<int>(StrategyKind::PUT_CREDIT_SPREAD),
                          inputs.spot, target_delta);

    auto short_strike = solve_strike(inputs.spot, -target_delta, inputs.short_tau,
                                     inputs.volatility, OptionType::PUT);
    if (!short_strike) {
        return std::unexpected(short_strike.error());
    }

    const double long_strike = *short_strike - config_.spread_width;
    if (!(long_strike > 0.0)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::DegenerateStrike,
                                          .value = long_strike});
    }

    auto vertical = build_vertical(inputs.spot, *short_strike, long_strike, inputs.short_tau,
                                   inputs.volatility, OptionType::PUT);
    if (!vertical) {
        return std::unexpected(vertical.error());
    }

    const double prob = probability_in_region(inputs.spot, PriceRegion::above(*short_strike),
                                              inputs.short_tau, inputs.volatility,
                                              model_.risk_free_rate())
                            .value_or(kNeutralProbability);

    return StrategyStructure{
        .legs = PutCreditSpread{
            .short_put = vertical->short_leg,
            .long_put = vertical->long_leg,
            .width = vertical->width,
            .target_delta = target_delta,
            .breakeven = vertical->breakeven
        },
        .spot_price = inputs.spot,
        .volatility = inputs.volatility,
        .net_credit_or_debit = vertical->net_credit,
        .max_profit = vertical->max_profit,
        .max_loss = vertical->max_loss,
        .prob_profit = prob,
        .net = vertical->net
    };
}

std::expected<StrategyStructure, BuildError> SpreadBuilder::build_call_diagonal(
    const BuildInputs& inputs) const {
    if (auto valid = validate_inputs(inputs.spot, inputs.short_tau, inputs.volatility); !valid) {
        return std::unexpected(valid.error());
    }
    if (!(inputs.long_tau > 0.0) || !std::isfinite(inputs.long_tau)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::InvalidInputs,
                                          .value = inputs.long_tau});
    }
    ZDTE_TRACE_ALGO_START(ZDTE_MODULE_SPREAD_BUILDER,
                          static_cast<int>(StrategyKind::CALL_DIAGONAL),
                          inputs.spot, config_.diagonal_short_delta);

    auto short_strike = solve_strike(inputs.spot, config_.diagonal_short_delta, inputs.short_tau,
                                     inputs.volatility, OptionType::CALL);
    if (!short_strike) {
        return std::unexpected(short_strike.error());
    }
    const double long_strike = *short_strike + config_.diagonal_strike_offset;

    OptionLeg short_call = price_leg(inputs.spot, *short_strike, inputs.short_tau,
                                     inputs.volatility, OptionType::CALL);
    OptionLeg long_call = price_leg(inputs.spot, long_strike, inputs.long_tau,
                                    inputs.volatility, OptionType::CALL);

    const double debit = long_call.price - short_call.price;
    if (!(debit > 0.0)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::NonPositiveDebit,
                                          .value = debit});
    }

    // Rough cap: the long leg's residual time value has no closed form here
    const double max_profit = 0.8 * short_call.price;

    const double prob = probability_in_region(inputs.spot, PriceRegion::below(*short_strike),
                                              inputs.short_tau, inputs.volatility,
                                              model_.risk_free_rate())
                            .value_or(kNeutralProbability);

    return StrategyStructure{
        .legs = CallDiagonal{
            .short_call = short_call,
            .long_call = long_call,
            .strike_offset = config_.diagonal_strike_offset,
            .target_delta = config_.diagonal_short_delta,
            .breakeven = *short_strike + debit
        },
        .spot_price = inputs.spot,
        .volatility = inputs.volatility,
        .net_credit_or_debit = -debit,
        .max_profit = max_profit,
        .max_loss = debit,
        .prob_profit = prob,
        .net = net_greeks(long_call, short_call)
    };
}

std::expected<StrategyStructure, BuildError> SpreadBuilder::build_iron_condor(
    const BuildInputs& inputs, double target_delta,
    const std::optional<MarketRegime>& regime) const {
    if (auto valid = validate_inputs(inputs.spot, inputs.short_tau, inputs.volatility); !valid) {
        return std::unexpected(valid.error());
    }
    ZDTE_TRACE_ALGO_START(ZDTE_MODULE_SPREAD_BUILDER,
                          static_cast<int>(StrategyKind::IRON_CONDOR),
                          inputs.spot, target_delta);

    // Both sides are solved independently at the same delta magnitude
    auto short_put_strike = solve_strike(inputs.spot, -target_delta, inputs.short_tau,
                                         inputs.volatility, OptionType::PUT);
    if (!short_put_strike) {
        return std::unexpected(short_put_strike.error());
    }
    auto short_call_strike = solve_strike(inputs.spot, target_delta, inputs.short_tau,
                                          inputs.volatility, OptionType::CALL);
    if (!short_call_strike) {
        return std::unexpected(short_call_strike.error());
    }

    const double wing = config_.iron_condor_wing_width;
    const double long_put_strike = *short_put_strike - wing;
    const double long_call_strike = *short_call_strike + wing;

    if (!(long_put_strike > 0.0)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::DegenerateStrike,
                                          .value = long_put_strike});
    }
    if (!(*short_put_strike < inputs.spot && inputs.spot < *short_call_strike)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::StrikeOrdering,
                                          .value = *short_put_strike});
    }

    auto put_side = build_vertical(inputs.spot, *short_put_strike, long_put_strike,
                                   inputs.short_tau, inputs.volatility, OptionType::PUT);
    if (!put_side) {
        return std::unexpected(put_side.error());
    }
    auto call_side = build_vertical(inputs.spot, *short_call_strike, long_call_strike,
                                    inputs.short_tau, inputs.volatility, OptionType::CALL);
    if (!call_side) {
        return std::unexpected(call_side.error());
    }

    const double credit = put_side->net_credit + call_side->net_credit;
    const double max_loss = wing - credit;
    if (!(max_loss > 0.0)) {
        return std::unexpected(BuildError{.code = BuildErrorCode::NonPositiveMaxLoss,
                                          .value = max_loss});
    }

    const double lower_breakeven = *short_put_strike - credit;
    const double upper_breakeven = *short_call_strike + credit;

    double prob = probability_in_region(inputs.spot,
                                        PriceRegion::between(lower_breakeven, upper_breakeven),
                                        inputs.short_tau, inputs.volatility,
                                        model_.risk_free_rate())
                      .value_or(kNeutralProbability);
    if (regime.has_value()) {
        prob = apply_regime_adjustment(prob, *regime);
    }

    return StrategyStructure{
        .legs = IronCondor{
            .long_put = put_side->long_leg,
            .short_put = put_side->short_leg,
            .short_call = call_side->short_leg,
            .long_call = call_side->long_leg,
            .wing_width = wing,
            .target_delta = target_delta,
            .lower_breakeven = lower_breakeven,
            .upper_breakeven = upper_breakeven
        },
        .spot_price = inputs.spot,
        .volatility = inputs.volatility,
        .net_credit_or_debit = credit,
        .max_profit = credit,
        .max_loss = max_loss,
        .prob_profit = prob,
        .net = sum_greeks(put_side->net, call_side->net)
    };
}

std::expected<StrategyStructure, BuildError> SpreadBuilder::build_iron_condor(
    const BuildInputs& inputs) const {
    return build_iron_condor(inputs, config_.iron_condor_target_delta);
}

}  // namespace zdte
