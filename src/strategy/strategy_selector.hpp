// SPDX-License-Identifier: MIT
/**
 * @file strategy_selector.hpp
 * @brief One decision cycle: market snapshot in, ranked recommendations out
 *
 * Direction gate:
 * - BULLISH: put credit spread only
 * - SIDEWAYS: iron condor (grid search), else call diagonal, else a put
 *   credit spread at the fallback probability with action MONITOR
 * - BEARISH, UNKNOWN: no candidates
 *
 * A snapshot that fails validation aborts the cycle with an empty list.
 * Nothing is thrown; every abort and rejection is recorded in the
 * SelectionReport and fired as a trace point.
 */

#pragma once

#include "zdte/option/option_spec.hpp"
#include "zdte/option/strike_solver.hpp"
#include "zdte/strategy/condor_scoring.hpp"
#include "zdte/strategy/market_snapshot.hpp"
#include "zdte/strategy/spread_builder.hpp"
#include "zdte/strategy/strategy_config.hpp"
#include "zdte/strategy/strategy_structure.hpp"
#include "zdte/support/error_types.hpp"
#include <expected>
#include <optional>
#include <vector>

namespace zdte {

/// Why a candidate structure was not recommended
enum class RejectionReason {
    BuildFailed,
    CreditBelowMinimum,
    ProbabilityBelowMinimum,
    MaxLossAboveLimit,
    DebitAboveLimit,
    DeltaNotNeutral,
    ThetaNotPositive,
    ShortThetaTooSmall,
    ScoreBelowMinimum,
    SuitabilityFailed
};

const char* to_string(RejectionReason reason);

/// One rejected candidate
struct Rejection {
    StrategyKind kind;
    RejectionReason reason;
    double target_delta = 0.0;                      ///< Delta the candidate was built at
    double value = 0.0;                             ///< Metric that failed its gate
    std::optional<BuildError> build_error;          ///< Set for BuildFailed
    std::optional<SuitabilityCriterion> criterion;  ///< Set for SuitabilityFailed
};

/// Everything one cycle produced
struct SelectionReport {
    std::vector<Recommendation> recommendations;    ///< Selection priority order
    std::vector<Rejection> rejections;
    std::optional<SnapshotError> abort_reason;      ///< Set when the snapshot was rejected
};

/**
 * @brief Builder inputs for one cycle
 *
 * Volatility from estimate_volatility(); the short leg expires at the
 * snapshot's calendar day, the diagonal's long leg
 * diagonal_long_expiry_days later.
 */
BuildInputs cycle_inputs(const MarketState& market, const StrategyConfig& config);

/**
 * @brief Acceptance gates applied to a built candidate
 *
 * Each returns the first gate the candidate fails, or nullopt when it
 * is acceptable. Gates run in this order:
 * - put credit spread: credit, probability (against `min_probability`),
 *   max loss
 * - call diagonal: debit as a fraction of max risk, probability,
 *   short-leg theta below diagonal_max_short_theta
 * - iron condor: credit, probability, max loss, |net delta| within
 *   max_net_delta, net theta > 0
 */
std::optional<Rejection> screen_put_credit_spread(const StrategyStructure& spread,
                                                  const StrategyConfig& config,
                                                  double min_probability);
std::optional<Rejection> screen_call_diagonal(const StrategyStructure& diagonal,
                                              const StrategyConfig& config);
std::optional<Rejection> screen_iron_condor(const StrategyStructure& condor,
                                            const StrategyConfig& config);

/**
 * @brief Strategy selection for a single decision cycle
 *
 * Holds configuration only; the risk-free rate is supplied per call and
 * each call prices with its own PricingModel.
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class StrategySelector {
public:
    /// Selector with the default configuration
    StrategySelector();

    /// Construct after validating both configurations; custom settings
    /// are only accepted through here
    static std::expected<StrategySelector, ConfigError> create(
        StrategyConfig config, IronCondorSuitability suitability = {},
        StrikeSolverConfig solver_config = {});

    const StrategyConfig& config() const { return config_; }
    const IronCondorSuitability& suitability() const { return suitability_; }

    /// Run one cycle and report recommendations, rejections and any abort
    ///
    /// @param risk_free_rate Annualized rate; a non-finite value is replaced
    ///        by kDefaultRiskFreeRate
    SelectionReport evaluate(const MarketSnapshot& snapshot,
                             double risk_free_rate = kDefaultRiskFreeRate) const;

    /// Recommendations of evaluate(), primary strategy first
    std::vector<Recommendation> generate_recommendations(
        const MarketSnapshot& snapshot, double risk_free_rate = kDefaultRiskFreeRate) const;

private:
    StrategySelector(StrategyConfig config, IronCondorSuitability suitability,
                     StrikeSolverConfig solver_config);

    std::optional<Recommendation> select_put_credit_spread(
        const MarketState& market, const SpreadBuilder& builder, const BuildInputs& inputs,
        double min_probability, bool force_monitor, std::vector<Rejection>& rejections) const;

    std::optional<Recommendation> select_call_diagonal(
        const MarketState& market, const SpreadBuilder& builder, const BuildInputs& inputs,
        std::vector<Rejection>& rejections) const;

    std::optional<Recommendation> select_iron_condor(
        const MarketState& market, const SpreadBuilder& builder, const BuildInputs& inputs,
        std::vector<Rejection>& rejections) const;

    StrategyConfig config_;
    IronCondorSuitability suitability_;
    StrikeSolverConfig solver_config_;
};

}  // namespace zdte
