// SPDX-License-Identifier: MIT
/// @file example_daily_decision.cc
/// @brief Run one decision cycle from command-line market readings
///
/// Usage:
///   example_daily_decision SPOT VIX DIRECTION RSI BB_POSITION VOLUME_RATIO [YIELD_PERCENT]
///
///   example_daily_decision 5000 20 SIDEWAYS 50 0.5 1.0 4.3

#include "zdte/strategy/market_inputs.hpp"
#include "zdte/strategy/strategy_selector.hpp"
#include "zdte/strategy/trade_summary.hpp"
#include "zdte/strategy/trade_validator.hpp"
#include <charconv>
#include <iostream>
#include <optional>
#include <string_view>
#include <system_error>

namespace {

std::optional<double> parse_number(std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace zdte;

    if (argc < 7 || argc > 8) {
        std::cerr << "usage: " << argv[0]
                  << " SPOT VIX DIRECTION RSI BB_POSITION VOLUME_RATIO [YIELD_PERCENT]\n";
        return 2;
    }

    MarketSnapshot snapshot{
        .spot_price = parse_number(argv[1]),
        .vix_level = parse_number(argv[2]),
        .direction = argv[3],
        .rsi = parse_number(argv[4]),
        .bb_position = parse_number(argv[5]),
        .volume_ratio = parse_number(argv[6]),
        .recent_closes = {},
        .timestamp = SystemClock::now()
    };

    std::optional<double> yield_percent;
    if (argc == 8) {
        yield_percent = parse_number(argv[7]);
    }
    const double rate = risk_free_rate_from_yield_percent(yield_percent);

    auto selector = StrategySelector::create(StrategyConfig{});
    if (!selector.has_value()) {
        std::cerr << "Invalid configuration: " << selector.error() << "\n";
        return 1;
    }

    SelectionReport report = selector->evaluate(snapshot, rate);
    if (report.abort_reason.has_value()) {
        std::cerr << "Snapshot rejected: " << *report.abort_reason << "\n";
        return 1;
    }

    const RiskLimits limits;
    const DailyRiskState state;
    for (const Recommendation& rec : report.recommendations) {
        std::cout << format_summary(rec) << "\n";

        TradeValidation validation = validate_trade(rec, limits, state);
        std::cout << "Risk check: " << (validation.approved ? "APPROVED" : "REJECTED")
                  << " (size " << validation.recommended_size << ")\n";
        for (const auto& reason : validation.reasons) {
            std::cout << "  reason: " << reason << "\n";
        }
        for (const auto& warning : validation.warnings) {
            std::cout << "  warning: " << warning << "\n";
        }
        std::cout << "\n";
    }

    if (report.recommendations.empty()) {
        std::cout << "No strategy recommended for " << snapshot.direction << "\n";
    }
    for (const Rejection& r : report.rejections) {
        std::cout << "rejected " << to_string(r.kind) << " at delta " << r.target_delta
                  << ": " << to_string(r.reason);
        if (r.build_error.has_value()) {
            std::cout << " " << *r.build_error;
        } else if (r.criterion.has_value()) {
            std::cout << " " << to_string(*r.criterion);
        } else {
            std::cout << " (" << r.value << ")";
        }
        std::cout << "\n";
    }
    return 0;
}
