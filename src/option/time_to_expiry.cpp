// SPDX-License-Identifier: MIT
#include "zdte/option/time_to_expiry.hpp"
#include <algorithm>

namespace zdte {

double time_to_expiry(SystemClock::time_point expiry, SystemClock::time_point now) {
    using seconds_d = std::chrono::duration<double>;
    const double seconds = std::chrono::duration_cast<seconds_d>(expiry - now).count();
    constexpr double kSecondsPerYear = kDaysPerYearActual * 24.0 * 3600.0;
    return std::max(seconds / kSecondsPerYear, kMinTimeToExpiry);
}

SystemClock::time_point expiry_date(SystemClock::time_point now, int days_ahead) {
    const auto day = std::chrono::floor<std::chrono::days>(now);
    return day + std::chrono::days{days_ahead};
}

}  // namespace zdte
