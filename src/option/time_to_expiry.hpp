// SPDX-License-Identifier: MIT
/**
 * @file time_to_expiry.hpp
 * @brief Calendar-to-year conversion for option maturities
 */

#pragma once

#include <chrono>

namespace zdte {

using SystemClock = std::chrono::system_clock;

/// Days per year used for maturities
inline constexpr double kDaysPerYearActual = 365.25;

/// Shortest maturity handed to the pricer: one day
inline constexpr double kMinTimeToExpiry = 1.0 / kDaysPerYearActual;

/// Years from `now` until `expiry`, floored at kMinTimeToExpiry
double time_to_expiry(SystemClock::time_point expiry, SystemClock::time_point now);

/// Midnight (UTC) of the calendar day `days_ahead` days after `now`'s day
///
/// `expiry_date(now, 0)` is the same-day (0DTE) expiry.
SystemClock::time_point expiry_date(SystemClock::time_point now, int days_ahead);

}  // namespace zdte
