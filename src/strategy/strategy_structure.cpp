// SPDX-License-Identifier: MIT
#include "zdte/strategy/strategy_structure.hpp"

namespace zdte {

const char* to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::PUT_CREDIT_SPREAD: return "PUT_CREDIT_SPREAD";
        case StrategyKind::CALL_DIAGONAL: return "CALL_DIAGONAL";
        case StrategyKind::IRON_CONDOR: return "IRON_CONDOR";
    }
    return "UNKNOWN";
}

const char* to_string(Action action) {
    switch (action) {
        case Action::EXECUTE: return "EXECUTE";
        case Action::MONITOR: return "MONITOR";
        case Action::SKIP: return "SKIP";
    }
    return "UNKNOWN";
}

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

}  // namespace

std::vector<double> StrategyStructure::breakevens() const {
    return std::visit(overloaded{
        [](const PutCreditSpread& s) { return std::vector<double>{s.breakeven}; },
        [](const CallDiagonal& d) { return std::vector<double>{d.breakeven}; },
        [](const IronCondor& ic) {
            return std::vector<double>{ic.lower_breakeven, ic.upper_breakeven};
        },
    }, legs);
}

std::vector<OptionLeg> StrategyStructure::option_legs() const {
    return std::visit(overloaded{
        [](const PutCreditSpread& s) { return std::vector<OptionLeg>{s.long_put, s.short_put}; },
        [](const CallDiagonal& d) { return std::vector<OptionLeg>{d.short_call, d.long_call}; },
        [](const IronCondor& ic) {
            return std::vector<OptionLeg>{ic.long_put, ic.short_put, ic.short_call, ic.long_call};
        },
    }, legs);
}

}  // namespace zdte
