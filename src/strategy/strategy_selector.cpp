// SPDX-License-Identifier: MIT
#include "zdte/strategy/strategy_selector.hpp"
#include "zdte/option/time_to_expiry.hpp"
#include "zdte/strategy/market_inputs.hpp"
#include "zdte/support/zdte_trace.h"
#include <cmath>
#include <utility>

namespace zdte {

const char* to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::BuildFailed: return "BuildFailed";
        case RejectionReason::CreditBelowMinimum: return "CreditBelowMinimum";
        case RejectionReason::ProbabilityBelowMinimum: return "ProbabilityBelowMinimum";
        case RejectionReason::MaxLossAboveLimit: return "MaxLossAboveLimit";
        case RejectionReason::DebitAboveLimit: return "DebitAboveLimit";
        case RejectionReason::DeltaNotNeutral: return "DeltaNotNeutral";
        case RejectionReason::ThetaNotPositive: return "ThetaNotPositive";
        case RejectionReason::ShortThetaTooSmall: return "ShortThetaTooSmall";
        case RejectionReason::ScoreBelowMinimum: return "ScoreBelowMinimum";
        case RejectionReason::SuitabilityFailed: return "SuitabilityFailed";
    }
    return "Unknown";
}

namespace {

void reject(std::vector<Rejection>& rejections, Rejection rejection) {
    ZDTE_TRACE_CANDIDATE_REJECTED(static_cast<int>(rejection.kind),
                                  static_cast<int>(rejection.reason),
                                  rejection.target_delta, rejection.value);
    rejections.push_back(std::move(rejection));
}

void reject_build(std::vector<Rejection>& rejections, StrategyKind kind, double target_delta,
                  const BuildError& error) {
    reject(rejections, Rejection{
        .kind = kind,
        .reason = RejectionReason::BuildFailed,
        .target_delta = target_delta,
        .value = error.value,
        .build_error = error
    });
}

Recommendation make_recommendation(StrategyStructure structure, Action action,
                                   std::optional<double> score, const MarketState& market) {
    ZDTE_TRACE_RECOMMENDATION(static_cast<int>(structure.kind()), static_cast<int>(action),
                              structure.prob_profit);
    return Recommendation{
        .structure = std::move(structure),
        .action = action,
        .optimization_score = score,
        .market = market
    };
}

}  // namespace

BuildInputs cycle_inputs(const MarketState& market, const StrategyConfig& config) {
    const auto now = market.timestamp;
    return BuildInputs{
        .spot = market.spot_price,
        .volatility = estimate_volatility(market.vix_level, market.recent_closes),
        .short_tau = time_to_expiry(expiry_date(now, 0), now),
        .long_tau = time_to_expiry(expiry_date(now, config.diagonal_long_expiry_days), now)
    };
}

std::optional<Rejection> screen_put_credit_spread(const StrategyStructure& spread,
                                                  const StrategyConfig& config,
                                                  double min_probability) {
    constexpr auto kind = StrategyKind::PUT_CREDIT_SPREAD;
    const PutCreditSpread* legs = spread.put_credit_spread();
    const double target = legs ? legs->target_delta : 0.0;

    if (spread.net_credit_or_debit < config.min_credit) {
        return Rejection{.kind = kind, .reason = RejectionReason::CreditBelowMinimum,
                         .target_delta = target, .value = spread.net_credit_or_debit};
    }
    if (spread.prob_profit < min_probability) {
        return Rejection{.kind = kind, .reason = RejectionReason::ProbabilityBelowMinimum,
                         .target_delta = target, .value = spread.prob_profit};
    }
    if (spread.max_loss > config.max_risk_per_trade) {
        return Rejection{.kind = kind, .reason = RejectionReason::MaxLossAboveLimit,
                         .target_delta = target, .value = spread.max_loss};
    }
    return std::nullopt;
}

std::optional<Rejection> screen_call_diagonal(const StrategyStructure& diagonal,
                                              const StrategyConfig& config) {
    constexpr auto kind = StrategyKind::CALL_DIAGONAL;
    const CallDiagonal* legs = diagonal.call_diagonal();
    const double target = legs ? legs->target_delta : 0.0;

    const double debit = -diagonal.net_credit_or_debit;
    if (debit > config.diagonal_max_debit_fraction * config.max_risk_per_trade) {
        return Rejection{.kind = kind, .reason = RejectionReason::DebitAboveLimit,
                         .target_delta = target, .value = debit};
    }
    if (diagonal.prob_profit < config.diagonal_min_probability) {
        return Rejection{.kind = kind, .reason = RejectionReason::ProbabilityBelowMinimum,
                         .target_delta = target, .value = diagonal.prob_profit};
    }

    const double short_theta = legs ? legs->short_call.greeks.theta : 0.0;
    if (!(short_theta < config.diagonal_max_short_theta)) {
        return Rejection{.kind = kind, .reason = RejectionReason::ShortThetaTooSmall,
                         .target_delta = target, .value = short_theta};
    }
    return std::nullopt;
}

std::optional<Rejection> screen_iron_condor(const StrategyStructure& condor,
                                            const StrategyConfig& config) {
    constexpr auto kind = StrategyKind::IRON_CONDOR;
    const IronCondor* legs = condor.iron_condor();
    const double target = legs ? legs->target_delta : 0.0;

    if (condor.net_credit_or_debit < config.min_iron_condor_credit) {
        return Rejection{.kind = kind, .reason = RejectionReason::CreditBelowMinimum,
                         .target_delta = target, .value = condor.net_credit_or_debit};
    }
    if (condor.prob_profit < config.min_iron_condor_probability) {
        return Rejection{.kind = kind, .reason = RejectionReason::ProbabilityBelowMinimum,
                         .target_delta = target, .value = condor.prob_profit};
    }
    if (condor.max_loss > config.max_risk_per_trade) {
        return Rejection{.kind = kind, .reason = RejectionReason::MaxLossAboveLimit,
                         .target_delta = target, .value = condor.max_loss};
    }
    if (std::abs(condor.net.delta) > config.max_net_delta) {
        return Rejection{.kind = kind, .reason = RejectionReason::DeltaNotNeutral,
                         .target_delta = target, .value = condor.net.delta};
    }
    if (!(condor.net.theta > 0.0)) {
        return Rejection{.kind = kind, .reason = RejectionReason::ThetaNotPositive,
                         .target_delta = target, .value = condor.net.theta};
    }
    return std::nullopt;
}

StrategySelector::StrategySelector()
    : StrategySelector(StrategyConfig{}, IronCondorSuitability{}, StrikeSolverConfig{}) {}

StrategySelector::StrategySelector(StrategyConfig config, IronCondorSuitability suitability,
                                   StrikeSolverConfig solver_config)
    : config_(std::move(config))
    , suitability_(suitability)
    , solver_config_(solver_config) {}

std::expected<StrategySelector, ConfigError> StrategySelector::create(
    StrategyConfig config, IronCondorSuitability suitability,
    StrikeSolverConfig solver_config) {
    if (auto valid = validate_strategy_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_suitability(suitability); !valid) {
        return std::unexpected(valid.error());
    }
    return StrategySelector(std::move(config), suitability, solver_config);
}

SelectionReport StrategySelector::evaluate(const MarketSnapshot& snapshot,
                                           double risk_free_rate) const {
    SelectionReport report;

    auto market = validate_market_snapshot(snapshot);
    if (!market) {
        ZDTE_TRACE_CYCLE_ABORTED(static_cast<int>(market.error().code), market.error().value);
        report.abort_reason = market.error();
        return report;
    }

    const double rate = std::isfinite(risk_free_rate) ? risk_free_rate : kDefaultRiskFreeRate;
    const SpreadBuilder builder(PricingModel(rate), config_, solver_config_);
    const BuildInputs inputs = cycle_inputs(*market, config_);

    ZDTE_TRACE_ALGO_START(ZDTE_MODULE_SELECTOR, static_cast<int>(market->direction),
                          inputs.spot, inputs.volatility);

    switch (market->direction) {
        case Direction::BULLISH: {
            if (auto rec = select_put_credit_spread(*market, builder, inputs,
                                                    config_.min_probability, false,
                                                    report.rejections)) {
                report.recommendations.push_back(std::move(*rec));
            }
            break;
        }
        case Direction::SIDEWAYS: {
            if (auto rec = select_iron_condor(*market, builder, inputs, report.rejections)) {
                report.recommendations.push_back(std::move(*rec));
            } else if (auto diag = select_call_diagonal(*market, builder, inputs,
                                                        report.rejections)) {
                report.recommendations.push_back(std::move(*diag));
            } else if (auto fallback = select_put_credit_spread(
                           *market, builder, inputs, config_.fallback_put_spread_probability,
                           true, report.rejections)) {
                report.recommendations.push_back(std::move(*fallback));
            }
            break;
        }
        case Direction::BEARISH:
        case Direction::UNKNOWN:
            // No bear-market structure is defined
            break;
    }

    ZDTE_TRACE_ALGO_COMPLETE(ZDTE_MODULE_SELECTOR, report.recommendations.size(),
                             report.rejections.size());
    return report;
}

std::vector<Recommendation> StrategySelector::generate_recommendations(
    const MarketSnapshot& snapshot, double risk_free_rate) const {
    return evaluate(snapshot, risk_free_rate).recommendations;
}

std::optional<Recommendation> StrategySelector::select_put_credit_spread(
    const MarketState& market, const SpreadBuilder& builder, const BuildInputs& inputs,
    double min_probability, bool force_monitor, std::vector<Rejection>& rejections) const {
    constexpr auto kind = StrategyKind::PUT_CREDIT_SPREAD;
    const double target = config_.put_spread_target_delta;

    auto spread = builder.build_put_credit_spread(inputs, target);
    if (!spread) {
        reject_build(rejections, kind, target, spread.error());
        return std::nullopt;
    }

    if (auto rejection = screen_put_credit_spread(*spread, config_, min_probability)) {
        reject(rejections, std::move(*rejection));
        return std::nullopt;
    }

    const Action action = force_monitor
        ? Action::MONITOR
        : recommend_by_probability(spread->prob_profit, config_.put_spread_execute_probability);
    return make_recommendation(std::move(*spread), action, std::nullopt, market);
}

std::optional<Recommendation> StrategySelector::select_call_diagonal(
    const MarketState& market, const SpreadBuilder& builder, const BuildInputs& inputs,
    std::vector<Rejection>& rejections) const {
    constexpr auto kind = StrategyKind::CALL_DIAGONAL;
    const double target = config_.diagonal_short_delta;

    auto diagonal = builder.build_call_diagonal(inputs);
    if (!diagonal) {
        reject_build(rejections, kind, target, diagonal.error());
        return std::nullopt;
    }

    if (auto rejection = screen_call_diagonal(*diagonal, config_)) {
        reject(rejections, std::move(*rejection));
        return std::nullopt;
    }

    const Action action = recommend_by_probability(diagonal->prob_profit,
                                                   config_.diagonal_execute_probability);
    return make_recommendation(std::move(*diagonal), action, std::nullopt, market);
}

std::optional<Recommendation> StrategySelector::select_iron_condor(
    const MarketState& market, const SpreadBuilder& builder, const BuildInputs& inputs,
    std::vector<Rejection>& rejections) const {
    constexpr auto kind = StrategyKind::IRON_CONDOR;

    if (auto suitable = check_iron_condor_suitability(market, suitability_); !suitable) {
        reject(rejections, {.kind = kind, .reason = RejectionReason::SuitabilityFailed,
                            .criterion = suitable.error()});
        return std::nullopt;
    }

    std::optional<MarketRegime> regime;
    if (config_.apply_regime_adjustment) {
        regime = MarketRegime{.vix_level = market.vix_level, .rsi = market.rsi,
                              .volume_ratio = market.volume_ratio};
    }

    std::optional<StrategyStructure> best;
    double best_score = 0.0;

    for (double target : config_.iron_condor_delta_grid) {
        auto condor = builder.build_iron_condor(inputs, target, regime);
        if (!condor) {
            reject_build(rejections, kind, target, condor.error());
            continue;
        }

        if (auto rejection = screen_iron_condor(*condor, config_)) {
            reject(rejections, std::move(*rejection));
            continue;
        }

        const double score = score_iron_condor(*condor, market).total();
        ZDTE_TRACE_CANDIDATE_SCORED(target, score, condor->prob_profit);

        // Earlier grid entries win ties
        if (!best.has_value() || score > best_score) {
            best = std::move(*condor);
            best_score = score;
        }
    }

    if (!best.has_value()) {
        return std::nullopt;
    }
    if (best_score < config_.iron_condor_min_score) {
        reject(rejections, {.kind = kind, .reason = RejectionReason::ScoreBelowMinimum,
                            .target_delta = best->iron_condor()->target_delta,
                            .value = best_score});
        return std::nullopt;
    }

    const Action action = recommend_iron_condor(best_score, best->prob_profit);
    return make_recommendation(std::move(*best), action, best_score, market);
}

}  // namespace zdte
