// SPDX-License-Identifier: MIT
/**
 * @file strategy_structure.hpp
 * @brief Multi-leg option structures produced by the spread builder
 *
 * A StrategyStructure is built fresh for every selection attempt and is
 * never mutated after it is returned. Its kind-specific legs live in a
 * variant so consumers dispatch on the kind instead of probing optional
 * fields.
 *
 * Net Greeks are position Greeks: long legs contribute +Greek, short
 * legs -Greek. A premium-selling structure therefore carries positive
 * net theta. Desk reports that quote "short minus long" use the opposite
 * sign; this library keeps the long-minus-short convention throughout.
 */

#pragma once

#include "zdte/option/pricing_model.hpp"
#include "zdte/strategy/market_snapshot.hpp"
#include <cstddef>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace zdte {

/// Structure family
enum class StrategyKind {
    PUT_CREDIT_SPREAD,
    CALL_DIAGONAL,
    IRON_CONDOR
};

const char* to_string(StrategyKind kind);

/// What the caller should do with a recommendation
enum class Action {
    EXECUTE,
    MONITOR,
    SKIP
};

const char* to_string(Action action);

/// One priced option leg
struct OptionLeg {
    double strike;
    OptionType type;
    double time_to_expiry;   ///< Years
    double implied_vol;
    double price;            ///< Per-share premium, >= 0
    Greeks greeks;
};

/// Aggregate position Greeks
struct NetGreeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
};

/// Short put above a long put, same expiry
struct PutCreditSpread {
    OptionLeg short_put;
    OptionLeg long_put;
    double width;           ///< short strike - long strike
    double target_delta;    ///< |delta| the short put was solved at
    double breakeven;       ///< short strike - credit
};

/// Same-day short call against a further-dated, higher-strike long call
struct CallDiagonal {
    OptionLeg short_call;
    OptionLeg long_call;
    double strike_offset;   ///< long strike - short strike
    double target_delta;    ///< delta the short call was solved at
    double breakeven;       ///< short strike + debit
};

/// Put credit spread below spot plus call credit spread above it
struct IronCondor {
    OptionLeg long_put;
    OptionLeg short_put;
    OptionLeg short_call;
    OptionLeg long_call;
    double wing_width;
    double target_delta;        ///< |delta| both short strikes were solved at
    double lower_breakeven;     ///< short put - credit
    double upper_breakeven;     ///< short call + credit
};

/// Kind-specific payload; alternative order matches StrategyKind
using StrategyLegs = std::variant<PutCreditSpread, CallDiagonal, IronCondor>;

static_assert(std::is_same_v<std::variant_alternative_t<
    static_cast<std::size_t>(StrategyKind::PUT_CREDIT_SPREAD), StrategyLegs>, PutCreditSpread>);
static_assert(std::is_same_v<std::variant_alternative_t<
    static_cast<std::size_t>(StrategyKind::CALL_DIAGONAL), StrategyLegs>, CallDiagonal>);
static_assert(std::is_same_v<std::variant_alternative_t<
    static_cast<std::size_t>(StrategyKind::IRON_CONDOR), StrategyLegs>, IronCondor>);

/**
 * @brief A priced option structure
 *
 * Invariants: max_loss > 0, prob_profit in [0, 1], and for credit
 * structures net_credit_or_debit == max_profit.
 */
struct StrategyStructure {
    StrategyLegs legs;
    double spot_price;
    double volatility;              ///< Single volatility applied to every leg
    double net_credit_or_debit;     ///< > 0 credit received, < 0 debit paid
    double max_profit;
    double max_loss;
    double prob_profit;
    NetGreeks net;

    StrategyKind kind() const { return static_cast<StrategyKind>(legs.index()); }

    /// One breakeven for spreads, two (lower, upper) for the iron condor
    std::vector<double> breakevens() const;

    /// Every leg, ordered by strike
    std::vector<OptionLeg> option_legs() const;

    const PutCreditSpread* put_credit_spread() const { return std::get_if<PutCreditSpread>(&legs); }
    const CallDiagonal* call_diagonal() const { return std::get_if<CallDiagonal>(&legs); }
    const IronCondor* iron_condor() const { return std::get_if<IronCondor>(&legs); }
};

/// A structure with the selector's verdict and the market it was built for
struct Recommendation {
    StrategyStructure structure;
    Action action;
    std::optional<double> optimization_score;   ///< Iron-condor grid score
    MarketState market;
};

}  // namespace zdte
