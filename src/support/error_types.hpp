// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace zdte {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidStrike,
    InvalidSpotPrice,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidDelta,
    InvalidBounds,
    InvalidGridSize
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided

    ValidationError(ValidationErrorCode code, double value = 0.0)
        : code(code), value(value) {}
};

/// IV solver error categories
enum class IVErrorCode {
    // Validation errors
    NegativeSpot,
    NegativeStrike,
    NegativeMaturity,
    NegativeMarketPrice,
    InvalidRate,

    // Convergence errors
    MaxIterationsExceeded,
    NumericalInstability
};

/// Detailed IV solver error with diagnostics
struct IVError {
    IVErrorCode code;
    size_t iterations = 0;           ///< Iterations before failure
    double final_error = 0.0;        ///< Residual at failure
    std::optional<double> last_vol;  ///< Last volatility candidate tried
};

/// Why a structure could not be built
enum class BuildErrorCode {
    InvalidInputs,        ///< Spot, volatility or maturity rejected by validation
    StrikeSolveFailed,    ///< Strike solver rejected its inputs
    DegenerateStrike,     ///< Solved strike is non-positive or non-finite
    NonPositiveWidth,     ///< Long/short strikes collapsed or crossed
    NonPositiveMaxLoss,   ///< Credit at or above the width
    NonPositiveDebit,     ///< Diagonal priced at zero or negative debit
    StrikeOrdering        ///< Iron-condor strikes do not straddle spot
};

/// Detailed structure build error
struct BuildError {
    BuildErrorCode code;
    double value = 0.0;  ///< Offending quantity (strike, width, max loss, ...)
};

/// Market snapshot validation failures
enum class SnapshotErrorCode {
    MissingSpotPrice,
    InvalidSpotPrice,
    MissingVolatilityIndex,
    InvalidVolatilityIndex,
    MissingRsi,
    InvalidRsi,
    MissingBollingerPosition,
    InvalidBollingerPosition,
    MissingVolumeRatio,
    InvalidVolumeRatio,
    UnknownDirection
};

/// Detailed snapshot error
struct SnapshotError {
    SnapshotErrorCode code;
    double value = 0.0;  ///< Offending value (0 for missing fields)
};

/// Configuration validation failures
enum class ConfigErrorCode {
    NonPositiveWidth,
    NonPositiveCredit,
    NonPositiveRisk,
    DeltaOutOfRange,
    ProbabilityOutOfRange,
    EmptyDeltaGrid,
    ScoreOutOfRange,
    InvalidExpiry,
    InvalidRange
};

/// Detailed configuration error
struct ConfigError {
    ConfigErrorCode code;
    double value = 0.0;
};

/// Combined error type for diagnostics that do not care about the family
using ErrorVariant = std::variant<
    ValidationError,
    IVError,
    BuildError,
    SnapshotError,
    ConfigError
>;

/// Get error code as integer for diagnostics
inline int error_code(const ErrorVariant& error) {
    return std::visit([](const auto& e) -> int {
        return static_cast<int>(e.code);
    }, error);
}

const char* to_string(ValidationErrorCode code);
const char* to_string(IVErrorCode code);
const char* to_string(BuildErrorCode code);
const char* to_string(SnapshotErrorCode code);
const char* to_string(ConfigErrorCode code);

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value << "}";
    return os;
}

/// Output stream operator for IVError
inline std::ostream& operator<<(std::ostream& os, const IVError& err) {
    os << "IVError{code=" << to_string(err.code)
       << ", iterations=" << err.iterations
       << ", final_error=" << err.final_error;
    if (err.last_vol) {
        os << ", last_vol=" << *err.last_vol;
    }
    os << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const BuildError& err) {
    return os << "BuildError{code=" << to_string(err.code) << ", value=" << err.value << "}";
}

inline std::ostream& operator<<(std::ostream& os, const SnapshotError& err) {
    return os << "SnapshotError{code=" << to_string(err.code) << ", value=" << err.value << "}";
}

inline std::ostream& operator<<(std::ostream& os, const ConfigError& err) {
    return os << "ConfigError{code=" << to_string(err.code) << ", value=" << err.value << "}";
}

} // namespace zdte
