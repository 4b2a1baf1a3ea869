// SPDX-License-Identifier: MIT
/**
 * @file trade_validator.hpp
 * @brief Account-level risk checks and position sizing for a recommendation
 *
 * validate_trade() is a pure predicate. Daily counters and open
 * positions are maintained by the caller and passed in.
 */

#pragma once

#include "zdte/strategy/strategy_config.hpp"
#include "zdte/strategy/strategy_structure.hpp"
#include <optional>
#include <string>
#include <vector>

namespace zdte {

/// Account figures used for sizing
struct AccountInfo {
    double net_liquidation;
    double available_funds;
};

/// Today's trading activity
struct DailyRiskState {
    double daily_pnl = 0.0;
    int trades_today = 0;
    std::vector<StrategyKind> open_positions;
};

/// Outcome of validate_trade
struct TradeValidation {
    bool approved = true;
    std::vector<std::string> reasons;   ///< Why the trade was rejected
    std::vector<std::string> warnings;  ///< Concerns that do not block the trade
    int recommended_size = 0;           ///< Contracts
};

/// Contracts allowed by account risk and available funds
///
/// min(floor(f·NL / max_loss), floor(AF / (2·max_loss)), max_position_size),
/// never negative; 1 without account information.
int position_size(const StrategyStructure& structure, const RiskLimits& limits,
                  const std::optional<AccountInfo>& account);

/**
 * @brief Check a recommendation against risk limits
 *
 * Rejects on: non-positive max loss or max profit, probability outside
 * (0, 1], probability below the kind's minimum, zero size, daily loss or
 * trade-count limits, and position concentration. Warns on weak
 * risk/reward, large net delta or vega, non-positive put-spread theta,
 * and market conditions hostile to the structure.
 */
TradeValidation validate_trade(const Recommendation& recommendation, const RiskLimits& limits,
                               const DailyRiskState& state,
                               const std::optional<AccountInfo>& account = std::nullopt);

}  // namespace zdte
