// SPDX-License-Identifier: MIT
/**
 * @file trade_summary.hpp
 * @brief Human-readable rendering of a recommendation
 */

#pragma once

#include "zdte/strategy/strategy_structure.hpp"
#include <string>

namespace zdte {

/**
 * @brief Render a recommendation as a text block
 *
 * Kind-specific layout: header, market context, structure, financials,
 * Greeks, legs and the recommendation line. Every numeric field of the
 * structure appears at least once. Precision: prices and strikes 2
 * decimals, probabilities as percent with 1 decimal, net Greeks 3
 * decimals, leg Greeks 4 decimals, maturities in years with 6 decimals.
 */
std::string format_summary(const Recommendation& recommendation);

}  // namespace zdte
