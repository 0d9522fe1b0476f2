#pragma once

#include "fraudshield/core/Types.hpp"
#include "fraudshield/history/HistoryStats.hpp"
#include "fraudshield/infra/Calendar.hpp"

#include <string>

namespace fraudshield {

// Everything a rule may look at. References stay valid for one evaluation.
struct RuleContext {
    const Transaction& tx;
    const HistoryStats& stats;
    double combined_score;
    infra::CalendarFields calendar;
};

// Independent predicate with a risk floor. A rule only raises the score.
class Rule {
public:
    virtual ~Rule() = default;

    virtual const std::string& name() const = 0;

    // Must not throw for well-formed input; the engine still guards it.
    virtual RuleOutcome evaluate(const RuleContext& ctx) const = 0;
};

}
