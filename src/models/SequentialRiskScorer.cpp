#include "fraudshield/models/SequentialRiskScorer.hpp"
#include "fraudshield/core/Errors.hpp"

namespace fraudshield {

SequentialRiskScorer::SequentialRiskScorer(std::shared_ptr<const RecurrentModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw ModelUnavailableError("sequential scorer: no model");
    }
}

ScoreResult SequentialRiskScorer::score(const std::vector<FeatureVector>& sequence) const {
    ScoreResult r;
    r.source = ScoreSource::SEQUENTIAL;
    r.probability = model_->probability(sequence);
    return r;
}

std::vector<FeatureVector> SequentialRiskScorer::buildSequence(
    const std::vector<FeatureVector>& past,
    const FeatureVector& current,
    std::size_t window
) {
    if (past.size() < window) {
        return std::vector<FeatureVector>(window, current);
    }
    return std::vector<FeatureVector>(
        past.end() - static_cast<std::ptrdiff_t>(window), past.end());
}

}
