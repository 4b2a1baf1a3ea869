// SPDX-License-Identifier: MIT
#include "zdte/strategy/market_inputs.hpp"
#include "zdte/option/option_spec.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace zdte {

std::optional<double> realized_volatility(std::span<const double> closes) {
    if (closes.size() < 3) {
        return std::nullopt;
    }

    std::vector<double> returns;
    returns.reserve(closes.size() - 1);
    for (std::size_t i = 1; i < closes.size(); ++i) {
        if (!(closes[i - 1] > 0.0) || !(closes[i] > 0.0)) {
            return std::nullopt;
        }
        returns.push_back(std::log(closes[i] / closes[i - 1]));
    }

    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= static_cast<double>(returns.size());

    double ss = 0.0;
    for (double r : returns) ss += (r - mean) * (r - mean);
    const double variance = ss / static_cast<double>(returns.size() - 1);

    const double vol = std::sqrt(variance * kTradingDaysPerYear);
    if (!std::isfinite(vol)) {
        return std::nullopt;
    }
    return vol;
}

double estimate_volatility(double vix_level, std::span<const double> closes) {
    if (!std::isfinite(vix_level) || vix_level < 0.0) {
        return kFallbackVolatility;
    }

    double vol = vix_level / 100.0;
    if (closes.size() >= kMinClosesForRealizedVol) {
        if (auto realized = realized_volatility(closes)) {
            vol = 0.7 * vol + 0.3 * *realized;
        }
    }
    return std::max(vol, kVolatilityFloor);
}

double risk_free_rate_from_yield_percent(std::optional<double> yield_percent) {
    if (!yield_percent.has_value() || !std::isfinite(*yield_percent) || *yield_percent < 0.0) {
        return kDefaultRiskFreeRate;
    }
    return *yield_percent / 100.0;
}

}  // namespace zdte
