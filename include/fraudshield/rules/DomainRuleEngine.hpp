#pragma once

#include "fraudshield/config/EngineConfig.hpp"
#include "fraudshield/rules/Rule.hpp"

#include <memory>
#include <vector>

namespace fraudshield {

struct RuleEvaluation {
    double final_score = 0.0;
    std::vector<RuleOutcome> triggered;  // in rule order
};

// Ordered rule list; final = max(combined, triggered floors).
class DomainRuleEngine {
public:
    DomainRuleEngine() = default;

    // Default table, each rule skipped when disabled.
    static DomainRuleEngine fromConfig(const RuleConfig& cfg);

    void addRule(std::unique_ptr<Rule> rule);

    // Never throws; a failing rule is logged and counted as not triggered.
    RuleEvaluation evaluate(const RuleContext& ctx) const;

    std::size_t size() const { return rules_.size(); }

private:
    std::vector<std::unique_ptr<Rule>> rules_;
};

}
