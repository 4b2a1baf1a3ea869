// SPDX-License-Identifier: MIT
#include "zdte/strategy/trade_validator.hpp"
#include "zdte/support/zdte_trace.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace zdte {

namespace {

std::string describe(const char* label, double value, int precision = 2) {
    std::ostringstream os;
    os << label << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

double min_probability(StrategyKind kind, const RiskLimits& limits) {
    switch (kind) {
        case StrategyKind::PUT_CREDIT_SPREAD: return limits.min_put_spread_probability;
        case StrategyKind::IRON_CONDOR: return limits.min_iron_condor_probability;
        case StrategyKind::CALL_DIAGONAL: return limits.min_diagonal_probability;
    }
    return 1.0;
}

double warn_risk_reward(StrategyKind kind, const RiskLimits& limits) {
    switch (kind) {
        case StrategyKind::PUT_CREDIT_SPREAD: return limits.warn_put_spread_risk_reward;
        case StrategyKind::IRON_CONDOR: return limits.warn_iron_condor_risk_reward;
        case StrategyKind::CALL_DIAGONAL: return limits.warn_diagonal_risk_reward;
    }
    return 0.0;
}

void check_market_conditions(const Recommendation& rec, std::vector<std::string>& warnings) {
    const MarketState& market = rec.market;
    switch (rec.structure.kind()) {
        case StrategyKind::PUT_CREDIT_SPREAD:
            if (market.vix_level > 35.0) {
                warnings.push_back(describe("High VIX for put credit spread: ",
                                            market.vix_level, 1));
            }
            if (market.rsi < 30.0) {
                warnings.push_back(describe("Oversold market (RSI) for put credit spread: ",
                                            market.rsi, 1));
            }
            break;
        case StrategyKind::CALL_DIAGONAL:
            if (market.vix_level < 15.0 || market.vix_level > 40.0) {
                warnings.push_back(describe("VIX outside diagonal range [15, 40]: ",
                                            market.vix_level, 1));
            }
            break;
        case StrategyKind::IRON_CONDOR:
            break;
    }
}

}  // namespace

int position_size(const StrategyStructure& structure, const RiskLimits& limits,
                  const std::optional<AccountInfo>& account) {
    if (!account.has_value()) {
        return 1;
    }
    if (!(structure.max_loss > 0.0)) {
        return 0;
    }
    const double by_account = std::floor(account->net_liquidation *
                                         limits.max_account_risk_fraction / structure.max_loss);
    const double by_funds = std::floor(account->available_funds / (2.0 * structure.max_loss));
    const double size = std::min({by_account, by_funds,
                                  static_cast<double>(limits.max_position_size)});
    if (!std::isfinite(size) || size < 0.0) {
        return 0;
    }
    return static_cast<int>(size);
}

TradeValidation validate_trade(const Recommendation& recommendation, const RiskLimits& limits,
                               const DailyRiskState& state,
                               const std::optional<AccountInfo>& account) {
    const StrategyStructure& s = recommendation.structure;
    const StrategyKind kind = s.kind();
    TradeValidation result;
    ZDTE_TRACE_ALGO_START(ZDTE_MODULE_VALIDATION, static_cast<int>(kind), s.max_loss,
                          s.prob_profit);

    // Basic requirements
    if (!(s.max_loss > 0.0)) {
        result.reasons.push_back(describe("Invalid max loss: ", s.max_loss));
    }
    if (!(s.max_profit > 0.0)) {
        result.reasons.push_back(describe("Invalid max profit: ", s.max_profit));
    }
    if (!(s.prob_profit > 0.0 && s.prob_profit <= 1.0)) {
        result.reasons.push_back(describe("Invalid probability: ", s.prob_profit, 4));
    }

    // Strategy-specific requirements
    if (s.prob_profit < min_probability(kind, limits)) {
        result.reasons.push_back(describe("Probability of profit too low: ",
                                          s.prob_profit * 100.0, 1) + "%");
    }
    if (s.max_loss > 0.0) {
        const double risk_reward = s.max_profit / s.max_loss;
        if (risk_reward < warn_risk_reward(kind, limits)) {
            result.warnings.push_back(describe("Low risk/reward ratio: ", risk_reward));
        }
    }

    // Greeks
    if (std::abs(s.net.delta) > limits.warn_abs_net_delta) {
        result.warnings.push_back(describe("High delta exposure: ", s.net.delta, 3));
    }
    if (kind == StrategyKind::PUT_CREDIT_SPREAD && s.net.theta <= 0.0) {
        result.warnings.push_back(describe("Non-positive theta for credit spread: ",
                                           s.net.theta, 3));
    }
    if (std::abs(s.net.vega) > limits.warn_abs_net_vega) {
        result.warnings.push_back(describe("High vega exposure: ", s.net.vega, 3));
    }

    check_market_conditions(recommendation, result.warnings);

    // Sizing
    result.recommended_size = position_size(s, limits, account);
    if (account.has_value() && result.recommended_size == 0) {
        result.reasons.push_back("Position size would be zero");
    }

    // Daily limits
    if (std::abs(state.daily_pnl) >= limits.max_daily_loss) {
        result.reasons.push_back(describe("Daily loss limit reached: ", state.daily_pnl));
    }
    if (state.trades_today >= limits.max_trades_per_day) {
        result.reasons.push_back("Daily trade limit reached: " +
                                 std::to_string(state.trades_today));
    }

    // Concentration
    const auto same_kind = std::count(state.open_positions.begin(),
                                      state.open_positions.end(), kind);
    if (same_kind >= limits.max_positions_per_kind) {
        result.reasons.push_back(std::string("Too many open ") + to_string(kind) +
                                 " positions: " + std::to_string(same_kind));
    }
    if (static_cast<int>(state.open_positions.size()) >= limits.max_total_positions) {
        result.reasons.push_back("Too many open positions: " +
                                 std::to_string(state.open_positions.size()));
    }

    result.approved = result.reasons.empty();
    ZDTE_TRACE_TRADE_VALIDATED(static_cast<int>(kind), result.approved ? 1 : 0,
                               result.reasons.size(), result.recommended_size);
    return result;
}

}  // namespace zdte
