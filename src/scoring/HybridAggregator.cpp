#include "fraudshield/scoring/HybridAggregator.hpp"
#include "fraudshield/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace fraudshield {

namespace {

bool unitInterval(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

}

HybridAggregator::HybridAggregator(const AggregatorConfig& cfg) : cfg_(cfg) {
    if (!unitInterval(cfg_.static_weight)) {
        throw ConfigError("aggregator.static_weight", "must lie in [0, 1]");
    }
    if (!unitInterval(cfg_.sequential_weight)) {
        throw ConfigError("aggregator.sequential_weight", "must lie in [0, 1]");
    }
    if (std::fabs(cfg_.static_weight + cfg_.sequential_weight - 1.0) > 1e-6) {
        throw ConfigError("aggregator", "weights must sum to 1");
    }
    if (!(cfg_.flag_threshold > 0.0 && cfg_.flag_threshold < cfg_.block_threshold &&
          cfg_.block_threshold <= 1.0)) {
        throw ConfigError("aggregator", "need 0 < flag_threshold < block_threshold <= 1");
    }
}

double HybridAggregator::sanitize(double probability, const char* source) {
    if (!std::isfinite(probability)) {
        std::cerr << "[AGGREGATOR] non-finite " << source
                  << " score, treating as 1.0" << std::endl;
        return 1.0;
    }
    return std::clamp(probability, 0.0, 1.0);
}

double HybridAggregator::combine(double static_score, double sequential_score) const {
    const double s = sanitize(static_score, "static");
    const double q = sanitize(sequential_score, "sequential");
    return std::clamp(cfg_.static_weight * s + cfg_.sequential_weight * q, 0.0, 1.0);
}

Verdict HybridAggregator::classify(double score) const {
    if (score >= cfg_.block_threshold) return Verdict::BLOCK;
    if (score >= cfg_.flag_threshold) return Verdict::FLAG;
    return Verdict::ALLOW;
}

}
