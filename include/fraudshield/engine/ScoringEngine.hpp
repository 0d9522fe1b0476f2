#pragma once

#include "fraudshield/audit/AuditSink.hpp"
#include "fraudshield/config/EngineConfig.hpp"
#include "fraudshield/core/Types.hpp"
#include "fraudshield/explain/ExplanationGenerator.hpp"
#include "fraudshield/features/FeatureTransformer.hpp"
#include "fraudshield/history/IdentityHistoryStore.hpp"
#include "fraudshield/models/RecurrentModel.hpp"
#include "fraudshield/models/SequentialRiskScorer.hpp"
#include "fraudshield/models/StaticRiskScorer.hpp"
#include "fraudshield/rules/DomainRuleEngine.hpp"
#include "fraudshield/scoring/HybridAggregator.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace fraudshield {

// Set by the caller to abandon a request. Only honoured before scoring starts.
using CancelToken = std::atomic<bool>;

// Pre-built immutable pieces handed to the engine. Audit is optional.
struct EngineComponents {
    std::shared_ptr<const NormalizationParams> normalization;
    std::shared_ptr<const TreeEnsemble> static_model;
    std::shared_ptr<const RecurrentModel> sequential_model;
    std::shared_ptr<HistoryBackend> history_backend;
    std::shared_ptr<AuditSink> audit;
};

class ScoringEngine {
public:
    // Throws ModelUnavailableError when a model is missing or the shapes of
    // the artifacts disagree, ConfigError on invalid configuration.
    ScoringEngine(const EngineConfig& cfg, EngineComponents parts);

    ScoringEngine(const ScoringEngine&) = delete;
    ScoringEngine& operator=(const ScoringEngine&) = delete;

    // Loads and verifies every artifact named by cfg.artifacts.
    static std::unique_ptr<ScoringEngine> create(const EngineConfig& cfg);

    // Thread-safe. Requests for the same sender are serialized.
    // Throws ValidationError, RequestCancelled.
    ScoreResponse score(const Transaction& tx, const CancelToken* cancel = nullptr);

    IdentityHistoryStore& history() { return history_; }
    const EngineConfig& config() const { return cfg_; }
    const FeatureTransformer& transformer() const { return transformer_; }

    uint64_t scoredCount() const { return scored_.load(std::memory_order_relaxed); }

private:
    static std::string newTransactionId();

    EngineConfig cfg_;

    std::shared_ptr<const NormalizationParams> params_;
    FeatureTransformer transformer_;
    std::shared_ptr<const StaticRiskScorer> static_;
    SequentialRiskScorer sequential_;
    HybridAggregator aggregator_;
    DomainRuleEngine rules_;
    ExplanationGenerator explainer_;
    IdentityHistoryStore history_;
    std::shared_ptr<AuditSink> audit_;

    std::atomic<uint64_t> scored_{0};
};

}
