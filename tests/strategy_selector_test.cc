// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "zdte/strategy/strategy_selector.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace zdte {
namespace {

MarketSnapshot snapshot(const char* direction, double vix, double rsi = 50.0,
                        double bb = 0.5, double volume = 1.0) {
    return MarketSnapshot{
        .spot_price = 5000.0,
        .vix_level = vix,
        .direction = direction,
        .rsi = rsi,
        .bb_position = bb,
        .volume_ratio = volume,
        .recent_closes = {},
        .timestamp = {}
    };
}

OptionLeg leg(double strike, OptionType type) {
    return OptionLeg{.strike = strike, .type = type, .time_to_expiry = 1.0 / 365.25,
                     .implied_vol = 0.20, .price = 1.0, .greeks = {}};
}

StrategyStructure condor(double credit, double prob, double max_loss, double delta,
                         double theta) {
    return StrategyStructure{
        .legs = IronCondor{
            .long_put = leg(4920.0, OptionType::PUT),
            .short_put = leg(4950.0, OptionType::PUT),
            .short_call = leg(5050.0, OptionType::CALL),
            .long_call = leg(5080.0, OptionType::CALL),
            .wing_width = 30.0,
            .target_delta = 0.12,
            .lower_breakeven = 4950.0 - credit,
            .upper_breakeven = 5050.0 + credit
        },
        .spot_price = 5000.0,
        .volatility = 0.20,
        .net_credit_or_debit = credit,
        .max_profit = credit,
        .max_loss = max_loss,
        .prob_profit = prob,
        .net = NetGreeks{.delta = delta, .gamma = -0.01, .theta = theta, .vega = -1.0}
    };
}

const Rejection* find_rejection(const SelectionReport& report, StrategyKind kind,
                                RejectionReason reason) {
    auto it = std::find_if(report.rejections.begin(), report.rejections.end(),
        [&](const Rejection& r) { return r.kind == kind && r.reason == reason; });
    return it == report.rejections.end() ? nullptr : &*it;
}

size_t count_reason(const SelectionReport& report, RejectionReason reason) {
    return static_cast<size_t>(std::count_if(
        report.rejections.begin(), report.rejections.end(),
        [reason](const Rejection& r) { return r.reason == reason; }));
}

// ===========================================================================
// Cycle inputs
// ===========================================================================

TEST(CycleInputsTest, SameDayExpiryHitsFloor) {
    MarketState market{.spot_price = 5000.0, .vix_level = 20.0,
                       .direction = Direction::SIDEWAYS, .rsi = 50.0, .bb_position = 0.5,
                       .volume_ratio = 1.0, .recent_closes = {}, .timestamp = {}};
    BuildInputs inputs = cycle_inputs(market, StrategyConfig{});
    EXPECT_DOUBLE_EQ(inputs.spot, 5000.0);
    EXPECT_DOUBLE_EQ(inputs.volatility, 0.20);
    EXPECT_DOUBLE_EQ(inputs.short_tau, kMinTimeToExpiry);
    EXPECT_NEAR(inputs.long_tau, 7.0 / kDaysPerYearActual, 1e-12);
}

// ===========================================================================
// Sideways market
// ===========================================================================

TEST(StrategySelectorTest, SidewaysSelectsIronCondorFromGrid) {
    StrategySelector selector;
    SelectionReport report = selector.evaluate(snapshot("SIDEWAYS", 20.0));

    ASSERT_FALSE(report.abort_reason.has_value());
    ASSERT_EQ(report.recommendations.size(), 1u);

    const Recommendation& rec = report.recommendations.front();
    ASSERT_EQ(rec.structure.kind(), StrategyKind::IRON_CONDOR);
    EXPECT_DOUBLE_EQ(rec.structure.iron_condor()->target_delta, 0.15);
    EXPECT_GE(rec.structure.net_credit_or_debit, 5.0);
    EXPECT_GE(rec.structure.prob_profit, 0.65);
    EXPECT_LT(std::abs(rec.structure.net.delta), 0.10);
    EXPECT_GT(rec.structure.net.theta, 0.0);

    ASSERT_TRUE(rec.optimization_score.has_value());
    EXPECT_GE(*rec.optimization_score, 75.0);
    EXPECT_LE(*rec.optimization_score, 100.0);
    EXPECT_EQ(rec.action, Action::EXECUTE);
    EXPECT_EQ(rec.market.direction, Direction::SIDEWAYS);

    // Narrower deltas collect too little premium
    EXPECT_EQ(count_reason(report, RejectionReason::CreditBelowMinimum), 4u);
}

TEST(StrategySelectorTest, HighestScoringGridEntryWins) {
    StrategyConfig config;
    config.iron_condor_delta_grid = {0.15, 0.12};
    config.min_iron_condor_credit = 4.0;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    auto recs = selector->generate_recommendations(snapshot("SIDEWAYS", 20.0));
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_DOUBLE_EQ(recs.front().structure.iron_condor()->target_delta, 0.15);
}

TEST(StrategySelectorTest, LowScoreFallsBackToDiagonal) {
    StrategyConfig config;
    config.iron_condor_min_score = 90.0;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 20.0));
    EXPECT_EQ(count_reason(report, RejectionReason::ScoreBelowMinimum), 1u);

    ASSERT_EQ(report.recommendations.size(), 1u);
    const Recommendation& rec = report.recommendations.front();
    ASSERT_EQ(rec.structure.kind(), StrategyKind::CALL_DIAGONAL);
    EXPECT_LT(rec.structure.net_credit_or_debit, 0.0);
    EXPECT_LT(rec.structure.call_diagonal()->short_call.greeks.theta, -0.5);
    EXPECT_GE(rec.structure.prob_profit, 0.65);
    EXPECT_FALSE(rec.optimization_score.has_value());
    EXPECT_EQ(rec.action, Action::EXECUTE);
}

TEST(StrategySelectorTest, UnsuitableMarketFallsBackToMonitoredPutSpread) {
    StrategyConfig config;
    config.diagonal_max_debit_fraction = 0.01;
    config.min_credit = 1.0;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    // VIX 45 is outside the iron-condor range
    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 45.0));

    auto suitability = std::find_if(report.rejections.begin(), report.rejections.end(),
        [](const Rejection& r) { return r.reason == RejectionReason::SuitabilityFailed; });
    ASSERT_NE(suitability, report.rejections.end());
    ASSERT_TRUE(suitability->criterion.has_value());
    EXPECT_EQ(*suitability->criterion, SuitabilityCriterion::VolatilityIndex);
    EXPECT_EQ(count_reason(report, RejectionReason::DebitAboveLimit), 1u);

    ASSERT_EQ(report.recommendations.size(), 1u);
    const Recommendation& rec = report.recommendations.front();
    EXPECT_EQ(rec.structure.kind(), StrategyKind::PUT_CREDIT_SPREAD);
    EXPECT_GE(rec.structure.prob_profit, 0.60);
    EXPECT_EQ(rec.action, Action::MONITOR);
}

TEST(StrategySelectorTest, NothingQualifiesLeavesEmptyList) {
    StrategyConfig config;
    config.iron_condor_min_score = 99.0;
    config.diagonal_max_debit_fraction = 0.01;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 20.0));
    EXPECT_TRUE(report.recommendations.empty());
    EXPECT_FALSE(report.abort_reason.has_value());
    // Default minimum credit rules out the fallback spread
    EXPECT_EQ(report.rejections.back().kind, StrategyKind::PUT_CREDIT_SPREAD);
    EXPECT_EQ(report.rejections.back().reason, RejectionReason::CreditBelowMinimum);
}

TEST(StrategySelectorTest, IronCondorDeltaGate) {
    StrategyConfig config;
    config.max_net_delta = 1e-4;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 20.0));
    const Rejection* delta = find_rejection(report, StrategyKind::IRON_CONDOR,
                                            RejectionReason::DeltaNotNeutral);
    ASSERT_NE(delta, nullptr);
    EXPECT_DOUBLE_EQ(delta->target_delta, 0.15);
    EXPECT_GT(std::abs(delta->value), 1e-4);
    EXPECT_LT(std::abs(delta->value), 0.10);

    // Diagonal still qualifies
    ASSERT_EQ(report.recommendations.size(), 1u);
    EXPECT_EQ(report.recommendations.front().structure.kind(), StrategyKind::CALL_DIAGONAL);
}

TEST(StrategySelectorTest, IronCondorProbabilityGate) {
    StrategyConfig config;
    config.min_iron_condor_probability = 0.90;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 20.0));
    const Rejection* prob = find_rejection(report, StrategyKind::IRON_CONDOR,
                                           RejectionReason::ProbabilityBelowMinimum);
    ASSERT_NE(prob, nullptr);
    EXPECT_DOUBLE_EQ(prob->target_delta, 0.15);
    EXPECT_GT(prob->value, 0.65);
    EXPECT_LT(prob->value, 0.90);
    EXPECT_EQ(count_reason(report, RejectionReason::ScoreBelowMinimum), 0u);
}

TEST(StrategySelectorTest, IronCondorMaxLossGate) {
    StrategyConfig config;
    config.max_risk_per_trade = 20.0;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 20.0));
    const Rejection* loss = find_rejection(report, StrategyKind::IRON_CONDOR,
                                           RejectionReason::MaxLossAboveLimit);
    ASSERT_NE(loss, nullptr);
    EXPECT_GT(loss->value, 20.0);
    EXPECT_LT(loss->value, 30.0);

    // Same cap sizes the diagonal debit limit at 10
    const Rejection* debit = find_rejection(report, StrategyKind::CALL_DIAGONAL,
                                            RejectionReason::DebitAboveLimit);
    ASSERT_NE(debit, nullptr);
    EXPECT_GT(debit->value, 10.0);
    EXPECT_TRUE(report.recommendations.empty());
}

TEST(StrategySelectorTest, DiagonalProbabilityGate) {
    StrategyConfig config;
    config.iron_condor_min_score = 90.0;
    config.diagonal_min_probability = 0.90;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 20.0));
    const Rejection* prob = find_rejection(report, StrategyKind::CALL_DIAGONAL,
                                           RejectionReason::ProbabilityBelowMinimum);
    ASSERT_NE(prob, nullptr);
    EXPECT_DOUBLE_EQ(prob->target_delta, 0.25);
    EXPECT_GT(prob->value, 0.60);
    EXPECT_LT(prob->value, 0.90);
    EXPECT_TRUE(report.recommendations.empty());
}

TEST(StrategySelectorTest, DiagonalShortThetaGate) {
    StrategyConfig config;
    config.iron_condor_min_score = 90.0;
    config.diagonal_max_short_theta = -100.0;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("SIDEWAYS", 20.0));
    const Rejection* theta = find_rejection(report, StrategyKind::CALL_DIAGONAL,
                                            RejectionReason::ShortThetaTooSmall);
    ASSERT_NE(theta, nullptr);
    EXPECT_LT(theta->value, -0.5);
    EXPECT_GT(theta->value, -100.0);
    EXPECT_EQ(count_reason(report, RejectionReason::ProbabilityBelowMinimum), 0u);
}

TEST(AcceptanceGateTest, IronCondorNeedsPositiveTheta) {
    StrategyConfig config;
    EXPECT_FALSE(screen_iron_condor(condor(6.0, 0.80, 24.0, 0.01, 5.0), config).has_value());

    for (double theta : {0.0, -1.0}) {
        auto rejection = screen_iron_condor(condor(6.0, 0.80, 24.0, 0.01, theta), config);
        ASSERT_TRUE(rejection.has_value()) << theta;
        EXPECT_EQ(rejection->kind, StrategyKind::IRON_CONDOR);
        EXPECT_EQ(rejection->reason, RejectionReason::ThetaNotPositive);
        EXPECT_DOUBLE_EQ(rejection->target_delta, 0.12);
        EXPECT_DOUBLE_EQ(rejection->value, theta);
    }
}

TEST(AcceptanceGateTest, IronCondorGatesRunInOrder) {
    StrategyConfig config;
    config.max_risk_per_trade = 20.0;

    // Every gate fails; credit is reported
    auto all = screen_iron_condor(condor(1.0, 0.50, 29.0, 0.30, -1.0), config);
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->reason, RejectionReason::CreditBelowMinimum);

    auto prob = screen_iron_condor(condor(6.0, 0.50, 24.0, 0.30, -1.0), config);
    ASSERT_TRUE(prob.has_value());
    EXPECT_EQ(prob->reason, RejectionReason::ProbabilityBelowMinimum);

    auto loss = screen_iron_condor(condor(6.0, 0.80, 24.0, 0.30, -1.0), config);
    ASSERT_TRUE(loss.has_value());
    EXPECT_EQ(loss->reason, RejectionReason::MaxLossAboveLimit);
    EXPECT_DOUBLE_EQ(loss->value, 24.0);

    config.max_risk_per_trade = 1000.0;
    auto delta = screen_iron_condor(condor(6.0, 0.80, 24.0, -0.30, -1.0), config);
    ASSERT_TRUE(delta.has_value());
    EXPECT_EQ(delta->reason, RejectionReason::DeltaNotNeutral);
    EXPECT_DOUBLE_EQ(delta->value, -0.30);
}

// ===========================================================================
// Directional markets
// ===========================================================================

TEST(StrategySelectorTest, BullishSelectsPutCreditSpread) {
    StrategyConfig config;
    config.min_credit = 1.0;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    auto recs = selector->generate_recommendations(snapshot("BULLISH", 20.0, 60.0));
    ASSERT_EQ(recs.size(), 1u);
    const Recommendation& rec = recs.front();
    ASSERT_EQ(rec.structure.kind(), StrategyKind::PUT_CREDIT_SPREAD);
    EXPECT_LT(rec.structure.put_credit_spread()->short_put.strike, 5000.0);
    EXPECT_GE(rec.structure.prob_profit, 0.75);
    EXPECT_EQ(rec.action, Action::EXECUTE);
    EXPECT_FALSE(rec.optimization_score.has_value());
}

TEST(StrategySelectorTest, BullishWithThinCreditRejected) {
    StrategySelector selector;
    SelectionReport report = selector.evaluate(snapshot("BULLISH", 20.0, 60.0));
    EXPECT_TRUE(report.recommendations.empty());
    ASSERT_EQ(report.rejections.size(), 1u);
    EXPECT_EQ(report.rejections[0].reason, RejectionReason::CreditBelowMinimum);
    EXPECT_LT(report.rejections[0].value, 2.0);
}

TEST(StrategySelectorTest, BullishProbabilityGate) {
    StrategyConfig config;
    config.min_credit = 1.0;
    config.min_probability = 0.95;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("BULLISH", 20.0, 60.0));
    EXPECT_TRUE(report.recommendations.empty());
    EXPECT_EQ(count_reason(report, RejectionReason::ProbabilityBelowMinimum), 1u);
}

TEST(StrategySelectorTest, BullishMaxLossGate) {
    StrategyConfig config;
    config.min_credit = 1.0;
    config.max_risk_per_trade = 5.0;
    auto selector = StrategySelector::create(config);
    ASSERT_TRUE(selector.has_value()) << selector.error();

    SelectionReport report = selector->evaluate(snapshot("BULLISH", 20.0, 60.0));
    EXPECT_TRUE(report.recommendations.empty());
    ASSERT_EQ(report.rejections.size(), 1u);
    EXPECT_EQ(report.rejections[0].kind, StrategyKind::PUT_CREDIT_SPREAD);
    EXPECT_EQ(report.rejections[0].reason, RejectionReason::MaxLossAboveLimit);
    EXPECT_DOUBLE_EQ(report.rejections[0].target_delta, 0.15);
    EXPECT_GT(report.rejections[0].value, 5.0);
    EXPECT_LT(report.rejections[0].value, 10.0);
}

TEST(StrategySelectorTest, BearishAndUnknownProduceNothing) {
    StrategySelector selector;
    for (const char* direction : {"BEARISH", "UNKNOWN"}) {
        SelectionReport report = selector.evaluate(snapshot(direction, 20.0, 40.0));
        EXPECT_TRUE(report.recommendations.empty()) << direction;
        EXPECT_TRUE(report.rejections.empty()) << direction;
        EXPECT_FALSE(report.abort_reason.has_value()) << direction;
    }
}

// ===========================================================================
// Invalid input
// ===========================================================================

TEST(StrategySelectorTest, MissingVolatilityIndexAbortsCycle) {
    MarketSnapshot snap = snapshot("SIDEWAYS", 20.0);
    snap.vix_level.reset();

    StrategySelector selector;
    SelectionReport report = selector.evaluate(snap);
    EXPECT_TRUE(report.recommendations.empty());
    ASSERT_TRUE(report.abort_reason.has_value());
    EXPECT_EQ(report.abort_reason->code, SnapshotErrorCode::MissingVolatilityIndex);
    EXPECT_TRUE(selector.generate_recommendations(snap).empty());
}

TEST(StrategySelectorTest, UnknownDirectionLabelAbortsCycle) {
    StrategySelector selector;
    SelectionReport report = selector.evaluate(snapshot("sideways", 20.0));
    ASSERT_TRUE(report.abort_reason.has_value());
    EXPECT_EQ(report.abort_reason->code, SnapshotErrorCode::UnknownDirection);
}

TEST(StrategySelectorTest, NonFiniteRateUsesDefault) {
    StrategySelector selector;
    auto nan_rate = selector.generate_recommendations(snapshot("SIDEWAYS", 20.0),
                                                      std::numeric_limits<double>::quiet_NaN());
    auto default_rate = selector.generate_recommendations(snapshot("SIDEWAYS", 20.0));
    ASSERT_EQ(nan_rate.size(), 1u);
    ASSERT_EQ(default_rate.size(), 1u);
    EXPECT_DOUBLE_EQ(nan_rate[0].structure.net_credit_or_debit,
                     default_rate[0].structure.net_credit_or_debit);
}

TEST(StrategySelectorTest, CreateRejectsInvalidConfig) {
    StrategyConfig config;
    config.iron_condor_delta_grid.clear();
    auto selector = StrategySelector::create(config);
    ASSERT_FALSE(selector.has_value());
    EXPECT_EQ(selector.error().code, ConfigErrorCode::EmptyDeltaGrid);

    IronCondorSuitability inverted{.min_vix = 40.0, .max_vix = 12.0};
    auto inverted_selector = StrategySelector::create(StrategyConfig{}, inverted);
    ASSERT_FALSE(inverted_selector.has_value());
    EXPECT_EQ(inverted_selector.error().code, ConfigErrorCode::InvalidRange);

    StrategyConfig negative_width;
    negative_width.spread_width = -10.0;
    auto width_selector = StrategySelector::create(negative_width);
    ASSERT_FALSE(width_selector.has_value());
    EXPECT_EQ(width_selector.error().code, ConfigErrorCode::NonPositiveWidth);

    auto valid = StrategySelector::create(StrategyConfig{});
    ASSERT_TRUE(valid.has_value());
    EXPECT_DOUBLE_EQ(valid->config().spread_width, 10.0);
}

}  // namespace
}  // namespace zdte
