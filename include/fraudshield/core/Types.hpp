#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fraudshield {

using FeatureVector = std::vector<double>;

// One payment as submitted by the caller. Derived temporal fields are
// optional; the engine fills the ones that are absent.
struct Transaction {
    std::string transaction_id;
    std::string sender;
    std::string receiver;
    double amount = 0.0;
    std::string device_id;
    double latitude = 0.0;
    double longitude = 0.0;
    int64_t timestamp = 0;  // UTC epoch seconds

    std::optional<int> hour;
    std::optional<int> day_of_week;   // Monday = 0
    std::optional<int> day_of_month;
    std::optional<double> time_since_last;
    std::optional<double> amount_delta;
};

enum class Verdict : uint8_t {
    ALLOW = 0,
    FLAG  = 1,
    BLOCK = 2
};

inline const char* verdictToStr(Verdict v) {
    switch (v) {
        case Verdict::ALLOW: return "ALLOW";
        case Verdict::FLAG:  return "FLAG";
        case Verdict::BLOCK: return "BLOCK";
    }
    return "UNKNOWN";
}

enum class ScoreSource : uint8_t {
    STATIC     = 0,
    SEQUENTIAL = 1
};

struct ScoreResult {
    ScoreSource source = ScoreSource::STATIC;
    double probability = 0.0;
};

struct RuleOutcome {
    std::string rule;
    std::string description;
    bool triggered = false;
    double floor = 0.0;
};

struct FactorAttribution {
    std::string name;
    double value = 0.0;
    std::string description;
};

struct ScoreResponse {
    std::string transaction_id;
    double risk_score = 0.0;
    Verdict verdict = Verdict::ALLOW;
    double static_score = 0.0;
    double sequential_score = 0.0;
    double combined_score = 0.0;

    std::vector<FactorAttribution> factors;
    std::vector<RuleOutcome> triggered_rules;

    // Set when the history store could not be read or written and the
    // sequential score was computed from a padded window.
    bool history_degraded = false;
    std::size_t history_length = 0;
    uint64_t latency_us = 0;
};

}
