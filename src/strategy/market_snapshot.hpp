// SPDX-License-Identifier: MIT
/**
 * @file market_snapshot.hpp
 * @brief Per-cycle market observation consumed by the strategy selector
 */

#pragma once

#include "zdte/option/time_to_expiry.hpp"
#include "zdte/support/error_types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zdte {

/// Market-direction label produced by market analysis
enum class Direction {
    BULLISH,
    BEARISH,
    SIDEWAYS,
    UNKNOWN
};

const char* to_string(Direction direction);

/// Parse a direction label (case-sensitive, exactly one of the enum names)
std::expected<Direction, SnapshotError> parse_direction(std::string_view label);

/**
 * @brief Snapshot as delivered by the market-analysis collaborator
 *
 * Every numeric field may be missing; the selector validates the whole
 * snapshot before any pricing happens.
 */
struct MarketSnapshot {
    std::optional<double> spot_price;    ///< Underlying index level
    std::optional<double> vix_level;     ///< Volatility-index level (percent)
    std::string direction;               ///< "BULLISH", "BEARISH", "SIDEWAYS" or "UNKNOWN"
    std::optional<double> rsi;           ///< Relative strength index, [0, 100]
    std::optional<double> bb_position;   ///< 0 at lower Bollinger band, 1 at upper
    std::optional<double> volume_ratio;  ///< Recent / average volume
    std::vector<double> recent_closes;   ///< Daily closes, oldest first (may be empty)
    SystemClock::time_point timestamp{};
};

/// Validated, read-only view of one cycle's market
struct MarketState {
    double spot_price;
    double vix_level;
    Direction direction;
    double rsi;
    double bb_position;
    double volume_ratio;
    std::vector<double> recent_closes;
    SystemClock::time_point timestamp;
};

/**
 * @brief Validate a snapshot
 *
 * Requires: spot > 0, VIX >= 0, RSI in [0, 100], finite Bollinger
 * position, volume ratio >= 0, and a known direction label. The first
 * failing field is reported.
 */
std::expected<MarketState, SnapshotError> validate_market_snapshot(const MarketSnapshot& snapshot);

}  // namespace zdte
