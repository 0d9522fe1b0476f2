#pragma once

#include "fraudshield/config/EngineConfig.hpp"
#include "fraudshield/core/Types.hpp"
#include "fraudshield/explain/ShapleyEngine.hpp"
#include "fraudshield/features/NormalizationParams.hpp"
#include "fraudshield/models/StaticRiskScorer.hpp"

#include <memory>
#include <vector>

namespace fraudshield {

// Ranked reasons for a verdict: per-feature Shapley attributions of the
// static probability against the baseline vector, merged with the floors
// of the rules that fired.
class ExplanationGenerator {
public:
    ExplanationGenerator(
        std::shared_ptr<const StaticRiskScorer> scorer,
        std::shared_ptr<const NormalizationParams> params,
        const ExplanationConfig& cfg = ExplanationConfig{}
    );

    // Never throws. If attribution fails only the rule entries are returned.
    std::vector<FactorAttribution> explain(
        const FeatureVector& x,
        const std::vector<RuleOutcome>& triggered
    ) const;

    // Signed per-feature attribution, in feature order. Sums to
    // f(x) - f(baseline). Throws on dimension mismatch.
    std::vector<double> featureAttributions(const FeatureVector& x) const;

private:
    std::shared_ptr<const StaticRiskScorer> scorer_;
    std::shared_ptr<const NormalizationParams> params_;
    ExplanationConfig cfg_;
    ShapleyEngine shapley_;
};

}
