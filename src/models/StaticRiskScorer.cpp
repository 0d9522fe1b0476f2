#include "fraudshield/models/StaticRiskScorer.hpp"
#include "fraudshield/core/Errors.hpp"

namespace fraudshield {

StaticRiskScorer::StaticRiskScorer(std::shared_ptr<const TreeEnsemble> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw ModelUnavailableError("static scorer: no model");
    }
}

double StaticRiskScorer::probability(const FeatureVector& x) const {
    return model_->probability(x);
}

ScoreResult StaticRiskScorer::score(const FeatureVector& x) const {
    ScoreResult r;
    r.source = ScoreSource::STATIC;
    r.probability = model_->probability(x);
    return r;
}

}
