// SPDX-License-Identifier: MIT
#include "zdte/support/error_types.hpp"

namespace zdte {

const char* to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidStrike: return "InvalidStrike";
        case ValidationErrorCode::InvalidSpotPrice: return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidMaturity: return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility: return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate: return "InvalidRate";
        case ValidationErrorCode::InvalidDelta: return "InvalidDelta";
        case ValidationErrorCode::InvalidBounds: return "InvalidBounds";
        case ValidationErrorCode::InvalidGridSize: return "InvalidGridSize";
    }
    return "Unknown";
}

const char* to_string(IVErrorCode code) {
    switch (code) {
        case IVErrorCode::NegativeSpot: return "NegativeSpot";
        case IVErrorCode::NegativeStrike: return "NegativeStrike";
        case IVErrorCode::NegativeMaturity: return "NegativeMaturity";
        case IVErrorCode::NegativeMarketPrice: return "NegativeMarketPrice";
        case IVErrorCode::InvalidRate: return "InvalidRate";
        case IVErrorCode::MaxIterationsExceeded: return "MaxIterationsExceeded";
        case IVErrorCode::NumericalInstability: return "NumericalInstability";
    }
    return "Unknown";
}

const char* to_string(BuildErrorCode code) {
    switch (code) {
        case BuildErrorCode::InvalidInputs: return "InvalidInputs";
        case BuildErrorCode::StrikeSolveFailed: return "StrikeSolveFailed";
        case BuildErrorCode::DegenerateStrike: return "DegenerateStrike";
        case BuildErrorCode::NonPositiveWidth: return "NonPositiveWidth";
        case BuildErrorCode::NonPositiveMaxLoss: return "NonPositiveMaxLoss";
        case BuildErrorCode::NonPositiveDebit: return "NonPositiveDebit";
        case BuildErrorCode::StrikeOrdering: return "StrikeOrdering";
    }
    return "Unknown";
}

const char* to_string(SnapshotErrorCode code) {
    switch (code) {
        case SnapshotErrorCode::MissingSpotPrice: return "MissingSpotPrice";
        case SnapshotErrorCode::InvalidSpotPrice: return "InvalidSpotPrice";
        case SnapshotErrorCode::MissingVolatilityIndex: return "MissingVolatilityIndex";
        case SnapshotErrorCode::InvalidVolatilityIndex: return "InvalidVolatilityIndex";
        case SnapshotErrorCode::MissingRsi: return "MissingRsi";
        case SnapshotErrorCode::InvalidRsi: return "InvalidRsi";
        case SnapshotErrorCode::MissingBollingerPosition: return "MissingBollingerPosition";
        case SnapshotErrorCode::InvalidBollingerPosition: return "InvalidBollingerPosition";
        case SnapshotErrorCode::MissingVolumeRatio: return "MissingVolumeRatio";
        case SnapshotErrorCode::InvalidVolumeRatio: return "InvalidVolumeRatio";
        case SnapshotErrorCode::UnknownDirection: return "UnknownDirection";
    }
    return "Unknown";
}

const char* to_string(ConfigErrorCode code) {
    switch (code) {
        case ConfigErrorCode::NonPositiveWidth: return "NonPositiveWidth";
        case ConfigErrorCode::NonPositiveCredit: return "NonPositiveCredit";
        case ConfigErrorCode::NonPositiveRisk: return "NonPositiveRisk";
        case ConfigErrorCode::DeltaOutOfRange: return "DeltaOutOfRange";
        case ConfigErrorCode::ProbabilityOutOfRange: return "ProbabilityOutOfRange";
        case ConfigErrorCode::EmptyDeltaGrid: return "EmptyDeltaGrid";
        case ConfigErrorCode::ScoreOutOfRange: return "ScoreOutOfRange";
        case ConfigErrorCode::InvalidExpiry: return "InvalidExpiry";
        case ConfigErrorCode::InvalidRange: return "InvalidRange";
    }
    return "Unknown";
}

}  // namespace zdte
