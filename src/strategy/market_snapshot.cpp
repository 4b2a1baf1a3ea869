// SPDX-License-Identifier: MIT
#include "zdte/strategy/market_snapshot.hpp"
#include <cmath>
#include <limits>

namespace zdte {

const char* to_string(Direction direction) {
    switch (direction) {
        case Direction::BULLISH: return "BULLISH";
        case Direction::BEARISH: return "BEARISH";
        case Direction::SIDEWAYS: return "SIDEWAYS";
        case Direction::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::expected<Direction, SnapshotError> parse_direction(std::string_view label) {
    if (label == "BULLISH") return Direction::BULLISH;
    if (label == "BEARISH") return Direction::BEARISH;
    if (label == "SIDEWAYS") return Direction::SIDEWAYS;
    if (label == "UNKNOWN") return Direction::UNKNOWN;
    return std::unexpected(SnapshotError{.code = SnapshotErrorCode::UnknownDirection});
}

namespace {

/// Present, finite and inside [lo, hi]
std::expected<double, SnapshotError> require_field(const std::optional<double>& field,
                                                   SnapshotErrorCode missing,
                                                   SnapshotErrorCode invalid,
                                                   double lo, double hi) {
    if (!field.has_value()) {
        return std::unexpected(SnapshotError{.code = missing});
    }
    const double v = *field;
    if (!std::isfinite(v) || v < lo || v > hi) {
        return std::unexpected(SnapshotError{.code = invalid, .value = v});
    }
    return v;
}

}  // namespace

std::expected<MarketState, SnapshotError> validate_market_snapshot(const MarketSnapshot& snapshot) {
    constexpr double kInf = std::numeric_limits<double>::infinity();

    auto spot = require_field(snapshot.spot_price, SnapshotErrorCode::MissingSpotPrice,
                              SnapshotErrorCode::InvalidSpotPrice, 0.0, kInf);
    if (!spot) return std::unexpected(spot.error());
    if (*spot <= 0.0) {
        return std::unexpected(SnapshotError{.code = SnapshotErrorCode::InvalidSpotPrice,
                                             .value = *spot});
    }

    auto vix = require_field(snapshot.vix_level, SnapshotErrorCode::MissingVolatilityIndex,
                             SnapshotErrorCode::InvalidVolatilityIndex, 0.0, kInf);
    if (!vix) return std::unexpected(vix.error());

    auto direction = parse_direction(snapshot.direction);
    if (!direction) return std::unexpected(direction.error());

    auto rsi = require_field(snapshot.rsi, SnapshotErrorCode::MissingRsi,
                             SnapshotErrorCode::InvalidRsi, 0.0, 100.0);
    if (!rsi) return std::unexpected(rsi.error());

    auto bb = require_field(snapshot.bb_position, SnapshotErrorCode::MissingBollingerPosition,
                            SnapshotErrorCode::InvalidBollingerPosition, -kInf, kInf);
    if (!bb) return std::unexpected(bb.error());

    auto volume = require_field(snapshot.volume_ratio, SnapshotErrorCode::MissingVolumeRatio,
                                SnapshotErrorCode::InvalidVolumeRatio, 0.0, kInf);
    if (!volume) return std::unexpected(volume.error());

    return MarketState{
        .spot_price = *spot,
        .vix_level = *vix,
        .direction = *direction,
        .rsi = *rsi,
        .bb_position = *bb,
        .volume_ratio = *volume,
        .recent_closes = snapshot.recent_closes,
        .timestamp = snapshot.timestamp
    };
}

}  // namespace zdte
