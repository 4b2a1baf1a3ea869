// SPDX-License-Identifier: MIT
#include "zdte/strategy/strategy_config.hpp"
#include "zdte/support/zdte_trace.h"
#include <cmath>

namespace zdte {

namespace {

bool is_probability(double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 1.0;
}

bool is_open_delta(double d) {
    return std::isfinite(d) && d > 0.0 && d < 1.0;
}

bool is_positive(double v) {
    return std::isfinite(v) && v > 0.0;
}

std::expected<void, ConfigError> fail(ConfigErrorCode code, double value) {
    ZDTE_TRACE_VALIDATION_ERROR(ZDTE_MODULE_VALIDATION, static_cast<int>(code), value, 0.0);
    return std::unexpected(ConfigError{.code = code, .value = value});
}

}  // namespace

std::expected<void, ConfigError> validate_strategy_config(const StrategyConfig& config) {
    for (double width : {config.spread_width, config.iron_condor_wing_width,
                         config.diagonal_strike_offset}) {
        if (!is_positive(width)) return fail(ConfigErrorCode::NonPositiveWidth, width);
    }

    for (double credit : {config.min_credit, config.min_iron_condor_credit}) {
        if (!is_positive(credit)) return fail(ConfigErrorCode::NonPositiveCredit, credit);
    }

    if (!is_positive(config.max_risk_per_trade)) {
        return fail(ConfigErrorCode::NonPositiveRisk, config.max_risk_per_trade);
    }
    if (!is_positive(config.diagonal_max_debit_fraction)) {
        return fail(ConfigErrorCode::NonPositiveRisk, config.diagonal_max_debit_fraction);
    }

    for (double delta : {config.put_spread_target_delta, config.diagonal_short_delta,
                         config.iron_condor_target_delta}) {
        if (!is_open_delta(delta)) return fail(ConfigErrorCode::DeltaOutOfRange, delta);
    }
    if (config.iron_condor_delta_grid.empty()) {
        return fail(ConfigErrorCode::EmptyDeltaGrid, 0.0);
    }
    for (double delta : config.iron_condor_delta_grid) {
        if (!is_open_delta(delta)) return fail(ConfigErrorCode::DeltaOutOfRange, delta);
    }
    if (!is_positive(config.max_net_delta)) {
        return fail(ConfigErrorCode::DeltaOutOfRange, config.max_net_delta);
    }

    for (double p : {config.min_probability, config.fallback_put_spread_probability,
                     config.put_spread_execute_probability, config.diagonal_min_probability,
                     config.diagonal_execute_probability, config.min_iron_condor_probability}) {
        if (!is_probability(p)) return fail(ConfigErrorCode::ProbabilityOutOfRange, p);
    }

    if (!std::isfinite(config.iron_condor_min_score) || config.iron_condor_min_score < 0.0 ||
        config.iron_condor_min_score > 100.0) {
        return fail(ConfigErrorCode::ScoreOutOfRange, config.iron_condor_min_score);
    }

    if (config.diagonal_long_expiry_days < 1) {
        return fail(ConfigErrorCode::InvalidExpiry, config.diagonal_long_expiry_days);
    }
    if (!std::isfinite(config.diagonal_max_short_theta)) {
        return fail(ConfigErrorCode::InvalidRange, config.diagonal_max_short_theta);
    }
    return {};
}

std::expected<void, ConfigError> validate_suitability(const IronCondorSuitability& s) {
    if (!(s.min_vix <= s.max_vix)) return fail(ConfigErrorCode::InvalidRange, s.min_vix);
    if (!(s.min_rsi <= s.max_rsi)) return fail(ConfigErrorCode::InvalidRange, s.min_rsi);
    if (!(s.min_bb_position <= s.max_bb_position)) {
        return fail(ConfigErrorCode::InvalidRange, s.min_bb_position);
    }
    if (!is_positive(s.max_volume_ratio)) {
        return fail(ConfigErrorCode::InvalidRange, s.max_volume_ratio);
    }
    return {};
}

std::expected<void, ConfigError> validate_risk_limits(const RiskLimits& limits) {
    if (!is_positive(limits.max_daily_loss)) {
        return fail(ConfigErrorCode::NonPositiveRisk, limits.max_daily_loss);
    }
    if (!is_positive(limits.max_account_risk_fraction) || limits.max_account_risk_fraction > 1.0) {
        return fail(ConfigErrorCode::NonPositiveRisk, limits.max_account_risk_fraction);
    }
    for (int count : {limits.max_trades_per_day, limits.max_positions_per_kind,
                      limits.max_total_positions, limits.max_position_size}) {
        if (count < 1) return fail(ConfigErrorCode::InvalidRange, count);
    }
    for (double p : {limits.min_put_spread_probability, limits.min_iron_condor_probability,
                     limits.min_diagonal_probability}) {
        if (!is_probability(p)) return fail(ConfigErrorCode::ProbabilityOutOfRange, p);
    }
    return {};
}

}  // namespace zdte
