// SPDX-License-Identifier: MIT
/// @file strategy_benchmark.cc
/// @brief Latency of the pricing primitives and one full decision cycle
///
/// Usage:
///   ./strategy_benchmark --benchmark_filter=Cycle

#include "zdte/option/pricing_model.hpp"
#include "zdte/option/strike_solver.hpp"
#include "zdte/strategy/spread_builder.hpp"
#include "zdte/strategy/strategy_selector.hpp"
#include <benchmark/benchmark.h>
#include <string>

using namespace zdte;

namespace {

constexpr double S = 5000.0, tau = 1.0 / 365.25, sigma = 0.20, rate = 0.05;

MarketSnapshot MakeSnapshot(const char* direction) {
    return MarketSnapshot{.spot_price = S, .vix_level = 20.0, .direction = direction,
                          .rsi = 50.0, .bb_position = 0.5, .volume_ratio = 1.0,
                          .recent_closes = {}, .timestamp = {}};
}

}  // namespace

// ===========================================================================
// Primitives
// ===========================================================================

static void BM_OptionPrice(benchmark::State& state) {
    PricingModel model(rate);
    for (auto _ : state) {
        benchmark::DoNotOptimize(model.price(S, 4950.0, tau, sigma, OptionType::PUT));
    }
}
BENCHMARK(BM_OptionPrice);

static void BM_OptionGreeks(benchmark::State& state) {
    PricingModel model(rate);
    for (auto _ : state) {
        benchmark::DoNotOptimize(model.greeks(S, 4950.0, tau, sigma, OptionType::PUT));
    }
}
BENCHMARK(BM_OptionGreeks);

static void BM_ImpliedVolatility(benchmark::State& state) {
    PricingModel model(rate);
    const double observed = model.price(S, 5000.0, tau, sigma, OptionType::CALL);
    for (auto _ : state) {
        auto result = model.implied_volatility(S, 5000.0, tau, observed, OptionType::CALL);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ImpliedVolatility);

static void BM_StrikeForDelta(benchmark::State& state) {
    PricingModel model(rate);
    const double target = -static_cast<double>(state.range(0)) / 100.0;
    for (auto _ : state) {
        auto result = solve_strike_for_delta(model, S, target, tau, sigma, OptionType::PUT);
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("put delta " + std::to_string(target));
}
BENCHMARK(BM_StrikeForDelta)->Arg(5)->Arg(15)->Arg(30);

// ===========================================================================
// Structures
// ===========================================================================

static void BM_BuildIronCondor(benchmark::State& state) {
    SpreadBuilder builder(PricingModel(rate), StrategyConfig{});
    const BuildInputs inputs{.spot = S, .volatility = sigma, .short_tau = tau,
                             .long_tau = 7.0 * tau};
    for (auto _ : state) {
        auto condor = builder.build_iron_condor(inputs);
        benchmark::DoNotOptimize(condor);
    }
}
BENCHMARK(BM_BuildIronCondor);

static void BM_CycleSideways(benchmark::State& state) {
    StrategySelector selector;
    const MarketSnapshot snapshot = MakeSnapshot("SIDEWAYS");
    for (auto _ : state) {
        auto report = selector.evaluate(snapshot, rate);
        benchmark::DoNotOptimize(report);
    }
}
BENCHMARK(BM_CycleSideways);

static void BM_CycleBullish(benchmark::State& state) {
    StrategySelector selector;
    const MarketSnapshot snapshot = MakeSnapshot("BULLISH");
    for (auto _ : state) {
        auto report = selector.evaluate(snapshot, rate);
        benchmark::DoNotOptimize(report);
    }
}
BENCHMARK(BM_CycleBullish);

BENCHMARK_MAIN();
