#pragma once

#include "fraudshield/core/Types.hpp"
#include "fraudshield/models/RecurrentModel.hpp"

#include <memory>
#include <vector>

namespace fraudshield {

// Behavioural risk from the identity's last W feature vectors.
class SequentialRiskScorer {
public:
    explicit SequentialRiskScorer(std::shared_ptr<const RecurrentModel> model);

    // Throws std::invalid_argument unless the sequence is exactly window() long.
    ScoreResult score(const std::vector<FeatureVector>& sequence) const;

    std::size_t window() const { return model_->window(); }
    std::size_t dimension() const { return model_->inputSize(); }

    // W copies of current when the past is shorter than W, otherwise the
    // most recent W past vectors. The current vector is never mixed into
    // a full window.
    static std::vector<FeatureVector> buildSequence(
        const std::vector<FeatureVector>& past,
        const FeatureVector& current,
        std::size_t window
    );

private:
    std::shared_ptr<const RecurrentModel> model_;
};

}
