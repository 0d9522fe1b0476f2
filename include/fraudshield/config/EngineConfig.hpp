#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fraudshield {

struct ArtifactPaths {
    std::string static_model;
    std::string sequential_model;
    std::string normalization;
    std::string checksums;  // optional manifest
};

struct HistoryConfig {
    std::size_t window = 10;
    int store_retries = 1;
};

struct AggregatorConfig {
    double static_weight = 0.5;
    double sequential_weight = 0.5;
    double flag_threshold = 0.5;
    double block_threshold = 0.8;
};

struct UnknownDeviceRuleConfig {
    bool enabled = true;
    double floor = 0.60;
    double elevated_floor = 0.95;
    double elevate_above_score = 0.4;
    bool trust_history_devices = false;
};

struct VelocityRuleConfig {
    bool enabled = true;
    int max_transactions = 5;
    int64_t window_seconds = 3600;
    double floor = 0.85;
};

struct UnusualHourRuleConfig {
    bool enabled = true;
    int start_hour = 0;  // inclusive
    int end_hour = 5;    // exclusive; may be < start_hour to wrap midnight
    double floor = 0.60;
};

struct CriticalAmountRuleConfig {
    bool enabled = true;
    double threshold = 50000.0;
    double floor = 0.80;
};

struct TravelRuleConfig {
    bool enabled = true;
    double max_speed_kmh = 800.0;
    double min_distance_km = 50.0;
    double floor = 0.90;
};

struct RuleConfig {
    std::vector<std::string> trusted_devices;
    double high_amount_threshold = 10000.0;
    int timezone_offset_minutes = 0;

    UnknownDeviceRuleConfig unknown_device;
    VelocityRuleConfig high_velocity;
    UnusualHourRuleConfig high_amount_unusual_hour;
    CriticalAmountRuleConfig critical_amount;
    TravelRuleConfig impossible_travel;
};

struct ExplanationConfig {
    std::size_t top_k = 5;
    std::size_t max_exact_features = 12;
    std::size_t sample_permutations = 256;
    uint32_t seed = 42;
};

struct ValidationConfig {
    double max_amount = 10000000.0;
};

struct AuditConfig {
    bool enabled = false;
    std::string path;
};

struct EngineOptions {
    bool parallel_scoring = true;
    bool log_decisions = false;
};

struct EngineConfig {
    ArtifactPaths artifacts;
    HistoryConfig history;
    AggregatorConfig aggregator;
    RuleConfig rules;
    ExplanationConfig explanation;
    ValidationConfig validation;
    AuditConfig audit;
    EngineOptions engine;
};

// Parse a JSON document. Relative paths resolve against base_dir.
EngineConfig parseEngineConfig(
    const std::string& json_text,
    const std::string& base_dir
);

// Read and parse a config file; relative paths resolve against its directory.
EngineConfig loadEngineConfig(const std::string& path);

// Throws ConfigError naming the first offending key.
void validateEngineConfig(const EngineConfig& cfg);

}
