// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "zdte/strategy/spread_builder.hpp"
#include <cmath>

namespace zdte {
namespace {

constexpr double kOneDay = 1.0 / 365.25;

class SpreadBuilderTest : public ::testing::Test {
protected:
    SpreadBuilder builder{PricingModel(0.05), StrategyConfig{}};

    BuildInputs inputs(double vol) const {
        return BuildInputs{.spot = 5000.0, .volatility = vol,
                           .short_tau = kOneDay, .long_tau = 7.0 * kOneDay};
    }
};

// ===========================================================================
// Put credit spread
// ===========================================================================

TEST_F(SpreadBuilderTest, PutCreditSpreadAtFifteenDelta) {
    auto spread = builder.build_put_credit_spread(inputs(0.15), 0.15);
    ASSERT_TRUE(spread.has_value()) << spread.error();
    ASSERT_EQ(spread->kind(), StrategyKind::PUT_CREDIT_SPREAD);

    const PutCreditSpread* legs = spread->put_credit_spread();
    ASSERT_NE(legs, nullptr);
    EXPECT_LT(legs->short_put.strike, 5000.0);
    EXPECT_DOUBLE_EQ(legs->long_put.strike, legs->short_put.strike - 10.0);
    EXPECT_DOUBLE_EQ(legs->width, 10.0);

    EXPECT_GT(spread->net_credit_or_debit, 0.0);
    EXPECT_DOUBLE_EQ(spread->max_profit, spread->net_credit_or_debit);
    EXPECT_DOUBLE_EQ(spread->max_loss, 10.0 - spread->net_credit_or_debit);
    EXPECT_DOUBLE_EQ(legs->breakeven, legs->short_put.strike - spread->net_credit_or_debit);
    EXPECT_NEAR(legs->short_put.greeks.delta, -0.15, 0.01);
}

TEST_F(SpreadBuilderTest, PutCreditSpreadCollectsTheta) {
    auto spread = builder.build_put_credit_spread(inputs(0.20), 0.15);
    ASSERT_TRUE(spread.has_value());

    EXPECT_GT(spread->net.theta, 0.0);
    EXPECT_GT(spread->net.delta, 0.0);
    EXPECT_GT(spread->prob_profit, 0.80);
    EXPECT_LE(spread->prob_profit, 1.0);
    EXPECT_EQ(spread->breakevens().size(), 1u);
}

TEST_F(SpreadBuilderTest, PutCreditSpreadRejectsInvalidInputs) {
    BuildInputs bad = inputs(0.20);
    bad.spot = 0.0;
    auto spread = builder.build_put_credit_spread(bad, 0.15);
    ASSERT_FALSE(spread.has_value());
    EXPECT_EQ(spread.error().code, BuildErrorCode::InvalidInputs);

    auto delta = builder.build_put_credit_spread(inputs(0.20), 1.5);
    ASSERT_FALSE(delta.has_value());
    EXPECT_EQ(delta.error().code, BuildErrorCode::StrikeSolveFailed);
}

TEST_F(SpreadBuilderTest, PutCreditSpreadRejectsNegativeLongStrike) {
    SpreadBuilder wide(PricingModel(0.05), StrategyConfig{.spread_width = 6000.0});
    auto spread = wide.build_put_credit_spread(inputs(0.20), 0.15);
    ASSERT_FALSE(spread.has_value());
    EXPECT_EQ(spread.error().code, BuildErrorCode::DegenerateStrike);
}

// ===========================================================================
// Call diagonal
// ===========================================================================

TEST_F(SpreadBuilderTest, CallDiagonalMetrics) {
    auto diagonal = builder.build_call_diagonal(inputs(0.20));
    ASSERT_TRUE(diagonal.has_value()) << diagonal.error();
    ASSERT_EQ(diagonal->kind(), StrategyKind::CALL_DIAGONAL);

    const CallDiagonal* legs = diagonal->call_diagonal();
    ASSERT_NE(legs, nullptr);
    EXPECT_DOUBLE_EQ(legs->long_call.strike, legs->short_call.strike + 20.0);
    EXPECT_DOUBLE_EQ(legs->short_call.time_to_expiry, kOneDay);
    EXPECT_DOUBLE_EQ(legs->long_call.time_to_expiry, 7.0 * kOneDay);

    const double debit = legs->long_call.price - legs->short_call.price;
    EXPECT_GT(debit, 0.0);
    EXPECT_DOUBLE_EQ(diagonal->net_credit_or_debit, -debit);
    EXPECT_DOUBLE_EQ(diagonal->max_loss, debit);
    EXPECT_DOUBLE_EQ(diagonal->max_profit, 0.8 * legs->short_call.price);
    EXPECT_DOUBLE_EQ(legs->breakeven, legs->short_call.strike + debit);

    EXPECT_LT(legs->short_call.greeks.theta, -0.5);
    EXPECT_GT(diagonal->prob_profit, 0.60);
    EXPECT_NEAR(legs->short_call.greeks.delta, 0.25, 0.01);
}

TEST_F(SpreadBuilderTest, CallDiagonalNeedsALongerLongLeg) {
    BuildInputs same_day = inputs(0.20);
    same_day.long_tau = same_day.short_tau;
    auto diagonal = builder.build_call_diagonal(same_day);
    ASSERT_FALSE(diagonal.has_value());
    EXPECT_EQ(diagonal.error().code, BuildErrorCode::NonPositiveDebit);
}

// ===========================================================================
// Iron condor
// ===========================================================================

TEST_F(SpreadBuilderTest, IronCondorStrikeOrdering) {
    auto condor = builder.build_iron_condor(inputs(0.20), 0.10);
    ASSERT_TRUE(condor.has_value()) << condor.error();
    ASSERT_EQ(condor->kind(), StrategyKind::IRON_CONDOR);

    const IronCondor* ic = condor->iron_condor();
    ASSERT_NE(ic, nullptr);
    EXPECT_LT(ic->long_put.strike, ic->short_put.strike);
    EXPECT_LT(ic->short_put.strike, 5000.0);
    EXPECT_LT(5000.0, ic->short_call.strike);
    EXPECT_LT(ic->short_call.strike, ic->long_call.strike);
    EXPECT_DOUBLE_EQ(ic->short_put.strike - ic->long_put.strike, 30.0);
    EXPECT_DOUBLE_EQ(ic->long_call.strike - ic->short_call.strike, 30.0);
}

TEST_F(SpreadBuilderTest, IronCondorMetrics) {
    auto condor = builder.build_iron_condor(inputs(0.20), 0.15);
    ASSERT_TRUE(condor.has_value());
    const IronCondor* ic = condor->iron_condor();

    const double put_credit = ic->short_put.price - ic->long_put.price;
    const double call_credit = ic->short_call.price - ic->long_call.price;
    const double credit = put_credit + call_credit;

    EXPECT_NEAR(condor->net_credit_or_debit, credit, 1e-12);
    EXPECT_DOUBLE_EQ(condor->max_profit, condor->net_credit_or_debit);
    EXPECT_NEAR(condor->max_loss, 30.0 - credit, 1e-12);
    EXPECT_NEAR(ic->lower_breakeven, ic->short_put.strike - credit, 1e-9);
    EXPECT_NEAR(ic->upper_breakeven, ic->short_call.strike + credit, 1e-9);

    auto breakevens = condor->breakevens();
    ASSERT_EQ(breakevens.size(), 2u);
    EXPECT_LT(breakevens[0], breakevens[1]);
    EXPECT_EQ(condor->option_legs().size(), 4u);
}

TEST_F(SpreadBuilderTest, IronCondorIsDeltaNeutral) {
    for (double target : {0.05, 0.08, 0.10, 0.12, 0.15}) {
        auto condor = builder.build_iron_condor(inputs(0.20), target);
        ASSERT_TRUE(condor.has_value()) << "target=" << target;
        EXPECT_LT(std::abs(condor->net.delta), 0.03) << "target=" << target;
        EXPECT_GT(condor->net.theta, 0.0) << "target=" << target;
    }
}

TEST_F(SpreadBuilderTest, IronCondorNetGreeksArePositionGreeks) {
    auto condor = builder.build_iron_condor(inputs(0.20), 0.10);
    ASSERT_TRUE(condor.has_value());
    const IronCondor* ic = condor->iron_condor();

    const double expected_vega = ic->long_put.greeks.vega + ic->long_call.greeks.vega -
                                 ic->short_put.greeks.vega - ic->short_call.greeks.vega;
    EXPECT_NEAR(condor->net.vega, expected_vega, 1e-12);
    EXPECT_LT(condor->net.vega, 0.0);
    EXPECT_LT(condor->net.gamma, 0.0);
}

TEST_F(SpreadBuilderTest, IronCondorRegimeAdjustment) {
    MarketRegime regime{.vix_level = 20.0, .rsi = 50.0, .volume_ratio = 1.0};
    auto plain = builder.build_iron_condor(inputs(0.20), 0.10);
    auto adjusted = builder.build_iron_condor(inputs(0.20), 0.10, regime);
    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(adjusted.has_value());

    EXPECT_DOUBLE_EQ(adjusted->prob_profit, apply_regime_adjustment(plain->prob_profit, regime));
    EXPECT_LE(adjusted->prob_profit, kRegimeProbabilityCeiling);
}

TEST_F(SpreadBuilderTest, SingleIronCondorUsesConfiguredDelta) {
    auto single = builder.build_iron_condor(inputs(0.20));
    auto explicit_delta = builder.build_iron_condor(inputs(0.20), 0.10);
    ASSERT_TRUE(single.has_value()) << single.error();
    ASSERT_TRUE(explicit_delta.has_value());

    EXPECT_DOUBLE_EQ(single->iron_condor()->target_delta, 0.10);
    EXPECT_DOUBLE_EQ(single->iron_condor()->short_put.strike,
                     explicit_delta->iron_condor()->short_put.strike);
    EXPECT_DOUBLE_EQ(single->net_credit_or_debit, explicit_delta->net_credit_or_debit);
    EXPECT_DOUBLE_EQ(single->prob_profit, explicit_delta->prob_profit);

    SpreadBuilder wide{PricingModel(0.05), StrategyConfig{.iron_condor_target_delta = 0.20}};
    auto wider = wide.build_iron_condor(inputs(0.20));
    ASSERT_TRUE(wider.has_value()) << wider.error();
    EXPECT_DOUBLE_EQ(wider->iron_condor()->target_delta, 0.20);
    EXPECT_GT(wider->net_credit_or_debit, single->net_credit_or_debit);
}

TEST_F(SpreadBuilderTest, IronCondorRejectsInTheMoneyShorts) {
    auto condor = builder.build_iron_condor(inputs(0.20), 0.60);
    ASSERT_FALSE(condor.has_value());
    EXPECT_EQ(condor.error().code, BuildErrorCode::StrikeOrdering);
}

// ===========================================================================
// Generic verticals
// ===========================================================================

TEST_F(SpreadBuilderTest, CallCreditVertical) {
    auto v = builder.build_vertical(5000.0, 5050.0, 5060.0, kOneDay, 0.20, OptionType::CALL);
    ASSERT_TRUE(v.has_value()) << v.error();
    EXPECT_TRUE(v->is_credit);
    EXPECT_GT(v->net_credit, 0.0);
    EXPECT_DOUBLE_EQ(v->max_profit, v->net_credit);
    EXPECT_DOUBLE_EQ(v->max_loss, 10.0 - v->net_credit);
    EXPECT_DOUBLE_EQ(v->breakeven, 5050.0 + v->net_credit);
}

TEST_F(SpreadBuilderTest, PutDebitVertical) {
    auto v = builder.build_vertical(5000.0, 4950.0, 4960.0, kOneDay, 0.20, OptionType::PUT);
    ASSERT_TRUE(v.has_value()) << v.error();
    EXPECT_FALSE(v->is_credit);

    const double debit = -v->net_credit;
    EXPECT_GT(debit, 0.0);
    EXPECT_DOUBLE_EQ(v->max_loss, debit);
    EXPECT_DOUBLE_EQ(v->max_profit, 10.0 - debit);
    EXPECT_DOUBLE_EQ(v->breakeven, 4960.0 - debit);
}

TEST_F(SpreadBuilderTest, CallDebitVertical) {
    auto v = builder.build_vertical(5000.0, 5030.0, 5010.0, kOneDay, 0.20, OptionType::CALL);
    ASSERT_TRUE(v.has_value()) << v.error();
    EXPECT_FALSE(v->is_credit);
    EXPECT_DOUBLE_EQ(v->breakeven, 5010.0 - v->net_credit);
    EXPECT_DOUBLE_EQ(v->width, 20.0);
}

TEST_F(SpreadBuilderTest, VerticalRejectsDegenerateStrikes) {
    auto same = builder.build_vertical(5000.0, 4950.0, 4950.0, kOneDay, 0.20, OptionType::PUT);
    ASSERT_FALSE(same.has_value());
    EXPECT_EQ(same.error().code, BuildErrorCode::NonPositiveWidth);

    auto negative = builder.build_vertical(5000.0, 4950.0, -5.0, kOneDay, 0.20, OptionType::PUT);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, BuildErrorCode::DegenerateStrike);
}

}  // namespace
}  // namespace zdte
