// SPDX-License-Identifier: MIT
/**
 * @file strategy_config.hpp
 * @brief Tunable thresholds for strategy construction and selection
 */

#pragma once

#include "zdte/support/error_types.hpp"
#include <expected>
#include <vector>

namespace zdte {

/// Strategy construction and acceptance parameters
struct StrategyConfig {
    // Put credit spread
    double spread_width = 10.0;              ///< Short strike - long strike
    double put_spread_target_delta = 0.15;   ///< |delta| of the short put
    double min_credit = 2.0;
    double min_probability = 0.70;
    double fallback_put_spread_probability = 0.60;
    double put_spread_execute_probability = 0.75;

    // Shared risk limit
    double max_risk_per_trade = 1000.0;

    // Call diagonal
    double diagonal_short_delta = 0.25;
    double diagonal_strike_offset = 20.0;     ///< Long strike - short strike
    int diagonal_long_expiry_days = 7;        ///< Calendar days to the long leg's expiry
    double diagonal_max_debit_fraction = 0.5; ///< Of max_risk_per_trade
    double diagonal_min_probability = 0.60;
    double diagonal_max_short_theta = -0.5;   ///< Short-leg theta must be below this
    double diagonal_execute_probability = 0.65;

    // Iron condor
    double iron_condor_wing_width = 30.0;
    double iron_condor_target_delta = 0.10;   ///< Single-shot builds
    double min_iron_condor_credit = 5.0;
    double min_iron_condor_probability = 0.65;
    std::vector<double> iron_condor_delta_grid{0.05, 0.08, 0.10, 0.12, 0.15};
    double iron_condor_min_score = 75.0;
    double max_net_delta = 0.10;
    bool apply_regime_adjustment = true;      ///< Regime-adjust grid probabilities
};

/// Market conditions under which iron condors are attempted
struct IronCondorSuitability {
    double min_vix = 12.0;
    double max_vix = 40.0;
    double min_rsi = 25.0;
    double max_rsi = 75.0;
    double min_bb_position = 0.15;
    double max_bb_position = 0.85;
    double max_volume_ratio = 2.0;
};

/// Account-level limits applied by the trade validator
struct RiskLimits {
    double max_daily_loss = 5000.0;
    int max_trades_per_day = 5;
    int max_positions_per_kind = 3;
    int max_total_positions = 5;
    double max_account_risk_fraction = 0.02;  ///< Of net liquidation per trade
    int max_position_size = 10;

    // Minimum probability of profit per strategy kind
    double min_put_spread_probability = 0.70;
    double min_iron_condor_probability = 0.65;
    double min_diagonal_probability = 0.60;

    // Risk/reward ratios below these raise warnings
    double warn_put_spread_risk_reward = 0.2;
    double warn_diagonal_risk_reward = 0.3;
    double warn_iron_condor_risk_reward = 0.25;

    double warn_abs_net_delta = 0.5;
    double warn_abs_net_vega = 50.0;
};

std::expected<void, ConfigError> validate_strategy_config(const StrategyConfig& config);
std::expected<void, ConfigError> validate_suitability(const IronCondorSuitability& suitability);
std::expected<void, ConfigError> validate_risk_limits(const RiskLimits& limits);

}  // namespace zdte
