#include "fraudshield/engine/ScoringEngine.hpp"
#include "fraudshield/core/Errors.hpp"
#include "fraudshield/history/HistoryStats.hpp"
#include "fraudshield/infra/Clock.hpp"
#include "fraudshield/models/ModelIntegrity.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <future>
#include <iomanip>
#include <iostream>

namespace fraudshield {

namespace {

template<typename T>
std::shared_ptr<T> require(std::shared_ptr<T> p, const char* what) {
    if (!p) {
        throw ModelUnavailableError(std::string("engine: ") + what + " not loaded");
    }
    return p;
}

bool cancelled(const CancelToken* cancel) {
    return cancel && cancel->load(std::memory_order_acquire);
}

}

ScoringEngine::ScoringEngine(const EngineConfig& cfg, EngineComponents parts)
    : cfg_(cfg),
      params_(require(parts.normalization, "normalization tables")),
      transformer_(params_, cfg.rules.timezone_offset_minutes, cfg.validation.max_amount),
      static_(std::make_shared<const StaticRiskScorer>(
          require(parts.static_model, "static model"))),
      sequential_(require(parts.sequential_model, "sequential model")),
      aggregator_(cfg.aggregator),
      rules_(DomainRuleEngine::fromConfig(cfg.rules)),
      explainer_(static_, params_, cfg.explanation),
      history_(require(parts.history_backend, "history backend"),
               cfg.history.window, cfg.history.store_retries),
      audit_(std::move(parts.audit)) {

    validateEngineConfig(cfg_);

    if (static_->dimension() != params_->size()) {
        throw ModelUnavailableError(
            "engine: static model expects " + std::to_string(static_->dimension()) +
            " features, normalization produces " + std::to_string(params_->size()));
    }
    if (sequential_.dimension() != params_->size()) {
        throw ModelUnavailableError(
            "engine: sequential model expects " + std::to_string(sequential_.dimension()) +
            " features, normalization produces " + std::to_string(params_->size()));
    }
    if (sequential_.window() != cfg_.history.window) {
        throw ModelUnavailableError(
            "engine: sequential model window " + std::to_string(sequential_.window()) +
            " does not match history.window " + std::to_string(cfg_.history.window));
    }

    std::cout << "[ENGINE] ready: features=" << params_->size()
              << " window=" << cfg_.history.window
              << " rules=" << rules_.size()
              << " audit=" << (audit_ ? "on" : "off") << std::endl;
}

std::unique_ptr<ScoringEngine> ScoringEngine::create(const EngineConfig& cfg) {
    validateEngineConfig(cfg);

    const ArtifactPaths& a = cfg.artifacts;
    if (a.static_model.empty()) {
        throw ModelUnavailableError("engine: artifacts.static_model not configured");
    }
    if (a.sequential_model.empty()) {
        throw ModelUnavailableError("engine: artifacts.sequential_model not configured");
    }
    if (a.normalization.empty()) {
        throw ModelUnavailableError("engine: artifacts.normalization not configured");
    }

    if (!a.checksums.empty()) {
        const ChecksumManifest manifest = loadManifest(a.checksums);
        verifyArtifacts(manifest, {a.static_model, a.sequential_model, a.normalization});
    } else {
        std::cout << "[ENGINE] no checksum manifest configured, skipping integrity check"
                  << std::endl;
    }

    EngineComponents parts;
    parts.normalization = std::make_shared<const NormalizationParams>(
        NormalizationParams::load(a.normalization));
    parts.static_model = std::make_shared<const TreeEnsemble>(
        TreeEnsemble::load(a.static_model));
    parts.sequential_model = std::make_shared<const RecurrentModel>(
        RecurrentModel::load(a.sequential_model));
    parts.history_backend = std::make_shared<MemoryHistoryBackend>();

    if (cfg.audit.enabled) {
        parts.audit = std::make_shared<JsonlAuditSink>(cfg.audit.path);
    }

    return std::make_unique<ScoringEngine>(cfg, std::move(parts));
}

std::string ScoringEngine::newTransactionId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

ScoreResponse ScoringEngine::score(const Transaction& tx, const CancelToken* cancel) {
    const infra::MonoTime t0 = infra::now();

    transformer_.validator().validate(tx);

    ScoreResponse resp;
    resp.transaction_id = tx.transaction_id.empty() ? newTransactionId() : tx.transaction_id;

    if (cancelled(cancel)) {
        throw RequestCancelled(resp.transaction_id);
    }

    FeatureVector x;
    std::vector<RuleOutcome> triggered;

    {
        IdentityHistoryStore::Session session = history_.open(tx.sender);

        if (cancelled(cancel)) {
            throw RequestCancelled(resp.transaction_id);
        }

        HistoryWindow past;
        try {
            past = session.snapshot();
        } catch (const HistoryStoreError& e) {
            std::cerr << "[ENGINE] " << resp.transaction_id
                      << " history unavailable, scoring on a padded window: "
                      << e.what() << std::endl;
            resp.history_degraded = true;
        }
        resp.history_length = past.size();

        // Lag features from the sender's most recent transaction
        Transaction enriched = tx;
        enriched.transaction_id = resp.transaction_id;
        if (!past.empty()) {
            const HistoryEntry& last = past.back();
            if (!enriched.time_since_last) {
                const int64_t gap = tx.timestamp - last.timestamp;
                enriched.time_since_last = static_cast<double>(gap > 0 ? gap : 0);
            }
            if (!enriched.amount_delta) {
                enriched.amount_delta = tx.amount - last.amount;
            }
        }

        x = transformer_.transform(enriched);

        std::vector<FeatureVector> past_vectors;
        past_vectors.reserve(past.size());
        for (const auto& e : past) {
            past_vectors.push_back(e.features);
        }
        const auto sequence = SequentialRiskScorer::buildSequence(
            past_vectors, x, cfg_.history.window);

        ScoreResult s;
        ScoreResult q;
        if (cfg_.engine.parallel_scoring) {
            auto fut = std::async(std::launch::async, [&]() {
                return sequential_.score(sequence);
            });
            s = static_->score(x);
            q = fut.get();
        } else {
            s = static_->score(x);
            q = sequential_.score(sequence);
        }

        resp.static_score = HybridAggregator::sanitize(s.probability, "static");
        resp.sequential_score = HybridAggregator::sanitize(q.probability, "sequential");
        resp.combined_score = aggregator_.combine(resp.static_score, resp.sequential_score);

        const HistoryStats stats = HistoryStats::compute(
            past, tx.timestamp, cfg_.rules.high_velocity.window_seconds);

        const RuleContext ctx{
            enriched, stats, resp.combined_score, transformer_.temporalFields(enriched)};
        RuleEvaluation eval = rules_.evaluate(ctx);

        resp.risk_score = eval.final_score;
        resp.verdict = aggregator_.classify(eval.final_score);
        triggered = std::move(eval.triggered);

        // Runs even when the caller has since given up on the request
        HistoryEntry entry;
        entry.features = x;
        entry.timestamp = tx.timestamp;
        entry.amount = tx.amount;
        entry.latitude = tx.latitude;
        entry.longitude = tx.longitude;
        entry.device_id = tx.device_id;
        try {
            session.append(entry);
        } catch (const HistoryStoreError& e) {
            std::cerr << "[ENGINE] " << resp.transaction_id
                      << " history append lost: " << e.what() << std::endl;
            resp.history_degraded = true;
        }
    }

    resp.factors = explainer_.explain(x, triggered);
    resp.triggered_rules = std::move(triggered);

    if (audit_) {
        AuditRecord rec;
        rec.timestamp = tx.timestamp;
        rec.amount = tx.amount;
        rec.risk_score = resp.risk_score;
        rec.verdict = resp.verdict;
        audit_->record(rec);
    }

    resp.latency_us = infra::elapsed_us(t0);
    scored_.fetch_add(1, std::memory_order_relaxed);

    if (cfg_.engine.log_decisions) {
        std::cout << "[ENGINE] " << resp.transaction_id
                  << " verdict=" << verdictToStr(resp.verdict)
                  << " risk=" << std::fixed << std::setprecision(4) << resp.risk_score
                  << " rules=" << resp.triggered_rules.size()
                  << " latency_us=" << resp.latency_us << std::endl;
    }

    return resp;
}

}
