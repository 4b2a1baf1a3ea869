// SPDX-License-Identifier: MIT
/**
 * @file condor_scoring.hpp
 * @brief Iron-condor suitability filter, 0-100 score and action mapping
 */

#pragma once

#include "zdte/strategy/market_snapshot.hpp"
#include "zdte/strategy/strategy_config.hpp"
#include "zdte/strategy/strategy_structure.hpp"
#include <expected>

namespace zdte {

/// Market condition that ruled out an iron condor
enum class SuitabilityCriterion {
    Direction,
    VolatilityIndex,
    Rsi,
    BollingerPosition,
    VolumeRatio
};

const char* to_string(SuitabilityCriterion criterion);

/// Pass when the market is range-bound enough for an iron condor
///
/// Requires SIDEWAYS direction and VIX, RSI, Bollinger position and
/// volume ratio inside their configured ranges (all bounds inclusive).
/// The first failing criterion is returned.
std::expected<void, SuitabilityCriterion> check_iron_condor_suitability(
    const MarketState& market, const IronCondorSuitability& suitability = {});

/// Score components; each is computed independently
struct ScoreBreakdown {
    double probability = 0.0;       ///< min(prob·40, 40)
    double risk_reward = 0.0;       ///< min(max_profit/max_loss·40, 20)
    double delta_neutrality = 0.0;  ///< max(0, 15 - |net delta|·100)
    double theta = 0.0;             ///< min(net theta·2, 15) when net theta > 0
    double market_alignment = 0.0;  ///< +5 VIX in [20, 25], +5 RSI in [45, 55]

    double total() const {
        return probability + risk_reward + delta_neutrality + theta + market_alignment;
    }
};

/// Score an iron condor in [0, 100] against the cycle's market
ScoreBreakdown score_iron_condor(const StrategyStructure& structure, const MarketState& market);

/**
 * @brief Map an iron-condor score to an action
 *
 * - score >= 85 and prob >= 0.75: EXECUTE
 * - score >= 75 and prob >= 0.65: EXECUTE
 * - score >= 65: MONITOR
 * - otherwise: SKIP
 *
 * The grid search only accepts candidates scoring at least
 * StrategyConfig::iron_condor_min_score, so with default settings the
 * SKIP branch is unreachable from the selector.
 */
Action recommend_iron_condor(double score, double prob_profit);

/// EXECUTE at or above the threshold, MONITOR below it
Action recommend_by_probability(double prob_profit, double execute_threshold);

}  // namespace zdte
