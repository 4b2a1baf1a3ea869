// SPDX-License-Identifier: MIT
#include "zdte/strategy/trade_summary.hpp"
#include "zdte/option/time_to_expiry.hpp"
#include <iomanip>
#include <sstream>
#include <variant>

namespace zdte {

namespace {

struct Fixed {
    double value;
    int precision;
};

std::ostream& operator<<(std::ostream& os, Fixed f) {
    return os << std::fixed << std::setprecision(f.precision) << f.value;
}

Fixed money(double v) { return {v, 2}; }
Fixed percent(double fraction) { return {fraction * 100.0, 1}; }

const char* header(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::PUT_CREDIT_SPREAD: return "0DTE PUT CREDIT SPREAD";
        case StrategyKind::CALL_DIAGONAL: return "0DTE CALL DIAGONAL SPREAD";
        case StrategyKind::IRON_CONDOR: return "0DTE IRON CONDOR";
    }
    return "0DTE STRATEGY";
}

void write_structure(std::ostream& os, const PutCreditSpread& s) {
    os << "STRUCTURE:\n"
       << "  Sell " << money(s.short_put.strike) << " Put\n"
       << "  Buy  " << money(s.long_put.strike) << " Put\n"
       << "  Width: " << money(s.width) << "\n"
       << "  Target Delta: " << Fixed{s.target_delta, 2} << "\n"
       << "  Breakeven: " << money(s.breakeven) << "\n";
}

void write_structure(std::ostream& os, const CallDiagonal& d) {
    os << "STRUCTURE:\n"
       << "  Sell " << money(d.short_call.strike) << " Call (0DTE)\n"
       << "  Buy  " << money(d.long_call.strike) << " Call ("
       << Fixed{d.long_call.time_to_expiry * kDaysPerYearActual, 1} << " days)\n"
       << "  Strike Offset: " << money(d.strike_offset) << "\n"
       << "  Target Delta: " << Fixed{d.target_delta, 2} << "\n"
       << "  Breakeven: " << money(d.breakeven) << "\n";
}

void write_structure(std::ostream& os, const IronCondor& ic) {
    os << "STRUCTURE:\n"
       << "  PUT SIDE:  Buy " << money(ic.long_put.strike)
       << " / Sell " << money(ic.short_put.strike) << "\n"
       << "  CALL SIDE: Sell " << money(ic.short_call.strike)
       << " / Buy " << money(ic.long_call.strike) << "\n"
       << "  Profit Zone: " << money(ic.short_put.strike)
       << " - " << money(ic.short_call.strike) << "\n"
       << "  Wing Width: " << money(ic.wing_width) << "\n"
       << "  Target Delta: " << Fixed{ic.target_delta, 2} << "\n"
       << "  Breakevens: " << money(ic.lower_breakeven)
       << " / " << money(ic.upper_breakeven) << "\n";
}

void write_leg(std::ostream& os, const char* role, const OptionLeg& leg) {
    os << "  " << role << " " << to_string(leg.type) << " " << money(leg.strike)
       << " T=" << Fixed{leg.time_to_expiry, 6} << "y"
       << " IV=" << percent(leg.implied_vol) << "%"
       << " Px=" << money(leg.price)
       << " D=" << Fixed{leg.greeks.delta, 4}
       << " G=" << Fixed{leg.greeks.gamma, 4}
       << " T/day=" << Fixed{leg.greeks.theta, 4}
       << " V=" << Fixed{leg.greeks.vega, 4}
       << " R=" << Fixed{leg.greeks.rho, 4} << "\n";
}

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

}  // namespace

std::string format_summary(const Recommendation& recommendation) {
    const StrategyStructure& s = recommendation.structure;
    const MarketState& market = recommendation.market;
    std::ostringstream os;

    os << header(s.kind()) << "\n"
       << "==============================\n"
       << "MARKET:\n"
       << "  Spot: " << money(s.spot_price) << "\n"
       << "  VIX: " << Fixed{market.vix_level, 1} << "\n"
       << "  RSI: " << Fixed{market.rsi, 1} << "\n"
       << "  Direction: " << to_string(market.direction) << "\n"
       << "  Volatility: " << percent(s.volatility) << "%\n";

    std::visit([&os](const auto& legs) { write_structure(os, legs); }, s.legs);

    const bool credit = s.net_credit_or_debit >= 0.0;
    os << "FINANCIALS:\n"
       << "  " << (credit ? "Net Credit: " : "Net Debit: ")
       << money(credit ? s.net_credit_or_debit : -s.net_credit_or_debit) << "\n"
       << "  Max Profit: " << money(s.max_profit) << "\n"
       << "  Max Loss: " << money(s.max_loss) << "\n"
       << "  Probability of Profit: " << percent(s.prob_profit) << "%\n";

    os << "GREEKS:\n"
       << "  Delta: " << Fixed{s.net.delta, 3} << "\n"
       << "  Gamma: " << Fixed{s.net.gamma, 3} << "\n"
       << "  Theta: " << Fixed{s.net.theta, 3} << "\n"
       << "  Vega: " << Fixed{s.net.vega, 3} << "\n";

    os << "LEGS:\n";
    std::visit(overloaded{
        [&os](const PutCreditSpread& p) {
            write_leg(os, "Long ", p.long_put);
            write_leg(os, "Short", p.short_put);
        },
        [&os](const CallDiagonal& d) {
            write_leg(os, "Short", d.short_call);
            write_leg(os, "Long ", d.long_call);
        },
        [&os](const IronCondor& ic) {
            write_leg(os, "Long ", ic.long_put);
            write_leg(os, "Short", ic.short_put);
            write_leg(os, "Short", ic.short_call);
            write_leg(os, "Long ", ic.long_call);
        },
    }, s.legs);

    if (recommendation.optimization_score.has_value()) {
        os << "Optimization Score: " << Fixed{*recommendation.optimization_score, 1} << "/100\n";
    }
    os << "RECOMMENDATION: " << to_string(recommendation.action) << "\n";
    return os.str();
}

}  // namespace zdte
