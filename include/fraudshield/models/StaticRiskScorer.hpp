#pragma once

#include "fraudshield/core/Types.hpp"
#include "fraudshield/models/TreeEnsemble.hpp"

#include <memory>

namespace fraudshield {

// Point-in-time risk from a single feature vector.
class StaticRiskScorer {
public:
    explicit StaticRiskScorer(std::shared_ptr<const TreeEnsemble> model);

    // Throws std::invalid_argument on a dimension mismatch.
    ScoreResult score(const FeatureVector& x) const;

    double probability(const FeatureVector& x) const;

    std::size_t dimension() const { return model_->numFeatures(); }
    const TreeEnsemble& model() const { return *model_; }

private:
    std::shared_ptr<const TreeEnsemble> model_;
};

}
