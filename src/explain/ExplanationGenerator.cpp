#include "fraudshield/explain/ExplanationGenerator.hpp"
#include "fraudshield/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace fraudshield {

namespace {

constexpr double kNegligible = 1e-12;

}

ExplanationGenerator::ExplanationGenerator(
    std::shared_ptr<const StaticRiskScorer> scorer,
    std::shared_ptr<const NormalizationParams> params,
    const ExplanationConfig& cfg
) : scorer_(std::move(scorer)),
    params_(std::move(params)),
    cfg_(cfg) {
    if (!scorer_ || !params_) {
        throw ModelUnavailableError("explanation: scorer and normalization tables required");
    }
}

std::vector<double> ExplanationGenerator::featureAttributions(const FeatureVector& x) const {
    const FeatureVector& baseline = params_->baseline();
    if (x.size() != baseline.size()) {
        throw std::invalid_argument("explanation: vector does not match baseline");
    }

    const int n = static_cast<int>(x.size());

    // Interventional value function: absent features take the baseline value
    auto value = [&](const std::vector<bool>& mask) {
        FeatureVector z = baseline;
        for (int i = 0; i < n; ++i) {
            if (mask[i]) z[i] = x[i];
        }
        return scorer_->probability(z);
    };

    if (static_cast<std::size_t>(n) <= cfg_.max_exact_features) {
        return shapley_.computeAllExact(n, value);
    }
    return shapley_.computeAllSampled(n, value, cfg_.sample_permutations, cfg_.seed);
}

std::vector<FactorAttribution> ExplanationGenerator::explain(
    const FeatureVector& x,
    const std::vector<RuleOutcome>& triggered
) const {
    std::vector<double> phi;
    try {
        phi = featureAttributions(x);
    } catch (const std::exception& e) {
        std::cerr << "[EXPLAIN] attribution failed: " << e.what() << std::endl;
        phi.clear();
    }

    std::vector<FactorAttribution> out;
    try {
        const auto& features = params_->features();

        for (std::size_t i = 0; i < phi.size() && i < features.size(); ++i) {
            if (!std::isfinite(phi[i]) || std::fabs(phi[i]) < kNegligible) continue;

            const FeatureSpec& f = features[i];
            FactorAttribution a;
            a.name = f.name;
            a.value = phi[i];
            a.description = (f.label.empty() ? f.name : f.label) +
                            (phi[i] > 0 ? " raised the risk" : " lowered the risk");
            out.push_back(std::move(a));
        }

        for (const auto& r : triggered) {
            FactorAttribution a;
            a.name = r.rule;
            a.value = r.floor;
            a.description = r.description;
            out.push_back(std::move(a));
        }

        std::stable_sort(out.begin(), out.end(),
            [](const FactorAttribution& a, const FactorAttribution& b) {
                return std::fabs(a.value) > std::fabs(b.value);
            });

        if (out.size() > cfg_.top_k) {
            out.resize(cfg_.top_k);
        }
    } catch (const std::exception& e) {
        std::cerr << "[EXPLAIN] factor ranking failed: " << e.what() << std::endl;
        out.clear();
    }

    return out;
}

}
