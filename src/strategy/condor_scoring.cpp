// SPDX-License-Identifier: MIT
#include "zdte/strategy/condor_scoring.hpp"
#include <algorithm>
#include <cmath>

namespace zdte {

const char* to_string(SuitabilityCriterion criterion) {
    switch (criterion) {
        case SuitabilityCriterion::Direction: return "Direction";
        case SuitabilityCriterion::VolatilityIndex: return "VolatilityIndex";
        case SuitabilityCriterion::Rsi: return "Rsi";
        case SuitabilityCriterion::BollingerPosition: return "BollingerPosition";
        case SuitabilityCriterion::VolumeRatio: return "VolumeRatio";
    }
    return "Unknown";
}

std::expected<void, SuitabilityCriterion> check_iron_condor_suitability(
    const MarketState& market, const IronCondorSuitability& s) {
    if (market.direction != Direction::SIDEWAYS) {
        return std::unexpected(SuitabilityCriterion::Direction);
    }
    if (market.vix_level < s.min_vix || market.vix_level > s.max_vix) {
        return std::unexpected(SuitabilityCriterion::VolatilityIndex);
    }
    if (market.rsi < s.min_rsi || market.rsi > s.max_rsi) {
        return std::unexpected(SuitabilityCriterion::Rsi);
    }
    if (market.bb_position < s.min_bb_position || market.bb_position > s.max_bb_position) {
        return std::unexpected(SuitabilityCriterion::BollingerPosition);
    }
    if (market.volume_ratio > s.max_volume_ratio) {
        return std::unexpected(SuitabilityCriterion::VolumeRatio);
    }
    return {};
}

ScoreBreakdown score_iron_condor(const StrategyStructure& structure, const MarketState& market) {
    ScoreBreakdown score;

    score.probability = std::min(structure.prob_profit * 100.0 * 0.4, 40.0);

    if (structure.max_loss > 0.0) {
        score.risk_reward = std::min(structure.max_profit / structure.max_loss * 40.0, 20.0);
    }

    score.delta_neutrality = std::max(0.0, 15.0 - std::abs(structure.net.delta) * 100.0);

    if (structure.net.theta > 0.0) {
        score.theta = std::min(structure.net.theta * 2.0, 15.0);
    }

    if (market.vix_level >= 20.0 && market.vix_level <= 25.0) {
        score.market_alignment += 5.0;
    }
    if (market.rsi >= 45.0 && market.rsi <= 55.0) {
        score.market_alignment += 5.0;
    }

    return score;
}

Action recommend_iron_condor(double score, double prob_profit) {
    if (score >= 85.0 && prob_profit >= 0.75) {
        return Action::EXECUTE;
    }
    if (score >= 75.0 && prob_profit >= 0.65) {
        return Action::EXECUTE;
    }
    if (score >= 65.0) {
        return Action::MONITOR;
    }
    return Action::SKIP;
}

Action recommend_by_probability(double prob_profit, double execute_threshold) {
    return prob_profit >= execute_threshold ? Action::EXECUTE : Action::MONITOR;
}

}  // namespace zdte
