#pragma once

#include "fraudshield/config/EngineConfig.hpp"
#include "fraudshield/core/Types.hpp"

namespace fraudshield {

// Weighted fusion of the two model scores and the verdict thresholds.
class HybridAggregator {
public:
    // Throws ConfigError on weights or thresholds out of range.
    explicit HybridAggregator(const AggregatorConfig& cfg = AggregatorConfig{});

    // Clamped to [0, 1].
    double combine(double static_score, double sequential_score) const;

    // [0, flag) ALLOW, [flag, block) FLAG, [block, 1] BLOCK.
    Verdict classify(double score) const;

    const AggregatorConfig& config() const { return cfg_; }

    // Non-finite model output counts as maximum risk.
    static double sanitize(double probability, const char* source);

private:
    AggregatorConfig cfg_;
};

}
