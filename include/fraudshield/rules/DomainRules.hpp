#pragma once

#include "fraudshield/config/EngineConfig.hpp"
#include "fraudshield/rules/Rule.hpp"

#include <string>
#include <unordered_set>

namespace fraudshield {

class UnknownDeviceRule : public Rule {
public:
    UnknownDeviceRule(
        const UnknownDeviceRuleConfig& cfg,
        const std::vector<std::string>& trusted_devices,
        double high_amount_threshold
    );

    const std::string& name() const override { return name_; }
    RuleOutcome evaluate(const RuleContext& ctx) const override;

private:
    std::string name_ = "Unknown Device";
    UnknownDeviceRuleConfig cfg_;
    std::unordered_set<std::string> trusted_;
    double high_amount_;
};

// Counts the current transaction plus past ones in the trailing window.
class HighVelocityRule : public Rule {
public:
    explicit HighVelocityRule(const VelocityRuleConfig& cfg);

    const std::string& name() const override { return name_; }
    RuleOutcome evaluate(const RuleContext& ctx) const override;

private:
    std::string name_ = "High Velocity";
    VelocityRuleConfig cfg_;
};

class HighAmountUnusualHourRule : public Rule {
public:
    HighAmountUnusualHourRule(const UnusualHourRuleConfig& cfg, double high_amount_threshold);

    const std::string& name() const override { return name_; }
    RuleOutcome evaluate(const RuleContext& ctx) const override;

    // [start, end), wrapping past midnight when end < start.
    static bool inWindow(int hour, int start, int end);

private:
    std::string name_ = "High Amount + Unusual Hour";
    UnusualHourRuleConfig cfg_;
    double high_amount_;
};

class CriticalAmountRule : public Rule {
public:
    explicit CriticalAmountRule(const CriticalAmountRuleConfig& cfg);

    const std::string& name() const override { return name_; }
    RuleOutcome evaluate(const RuleContext& ctx) const override;

private:
    std::string name_ = "Critical Amount";
    CriticalAmountRuleConfig cfg_;
};

// Not triggered without a previous location or when timestamps run backwards.
class ImpossibleTravelRule : public Rule {
public:
    explicit ImpossibleTravelRule(const TravelRuleConfig& cfg);

    const std::string& name() const override { return name_; }
    RuleOutcome evaluate(const RuleContext& ctx) const override;

private:
    std::string name_ = "Impossible Travel";
    TravelRuleConfig cfg_;
};

}
