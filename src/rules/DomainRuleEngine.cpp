#include "fraudshield/rules/DomainRuleEngine.hpp"
#include "fraudshield/rules/DomainRules.hpp"

#include <algorithm>
#include <iostream>

namespace fraudshield {

DomainRuleEngine DomainRuleEngine::fromConfig(const RuleConfig& cfg) {
    DomainRuleEngine e;

    if (cfg.unknown_device.enabled) {
        e.addRule(std::make_unique<UnknownDeviceRule>(
            cfg.unknown_device, cfg.trusted_devices, cfg.high_amount_threshold));
    }
    if (cfg.high_velocity.enabled) {
        e.addRule(std::make_unique<HighVelocityRule>(cfg.high_velocity));
    }
    if (cfg.high_amount_unusual_hour.enabled) {
        e.addRule(std::make_unique<HighAmountUnusualHourRule>(
            cfg.high_amount_unusual_hour, cfg.high_amount_threshold));
    }
    if (cfg.critical_amount.enabled) {
        e.addRule(std::make_unique<CriticalAmountRule>(cfg.critical_amount));
    }
    if (cfg.impossible_travel.enabled) {
        e.addRule(std::make_unique<ImpossibleTravelRule>(cfg.impossible_travel));
    }

    return e;
}

void DomainRuleEngine::addRule(std::unique_ptr<Rule> rule) {
    if (rule) {
        rules_.push_back(std::move(rule));
    }
}

RuleEvaluation DomainRuleEngine::evaluate(const RuleContext& ctx) const {
    RuleEvaluation r;
    r.final_score = ctx.combined_score;

    for (const auto& rule : rules_) {
        try {
            RuleOutcome o = rule->evaluate(ctx);
            if (!o.triggered) continue;

            r.final_score = std::max(r.final_score, o.floor);
            r.triggered.push_back(std::move(o));
        } catch (const std::exception& e) {
            std::cerr << "[RULES] " << rule->name() << " failed: " << e.what()
                      << " (not triggered)" << std::endl;
        }
    }

    r.final_score = std::clamp(r.final_score, 0.0, 1.0);
    return r;
}

}
