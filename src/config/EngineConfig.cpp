#include "fraudshield/config/EngineConfig.hpp"
#include "fraudshield/core/Errors.hpp"

#include <boost/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>

namespace json = boost::json;
namespace fs = std::filesystem;

namespace fraudshield {

namespace {

const json::object* section(const json::object& root, const char* key) {
    const json::value* v = root.if_contains(key);
    if (!v) return nullptr;
    if (!v->is_object()) {
        throw ConfigError(key, "expected an object");
    }
    return &v->get_object();
}

double readDouble(
    const json::object& obj,
    const char* key,
    const std::string& path,
    double fallback
) {
    const json::value* v = obj.if_contains(key);
    if (!v) return fallback;
    if (!v->is_number()) {
        throw ConfigError(path + "." + key, "expected a number");
    }
    return v->to_number<double>();
}

int64_t readInt(
    const json::object& obj,
    const char* key,
    const std::string& path,
    int64_t fallback
) {
    const json::value* v = obj.if_contains(key);
    if (!v) return fallback;
    if (v->is_int64()) return v->get_int64();
    if (v->is_uint64()) {
        if (v->get_uint64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw ConfigError(path + "." + key, "out of range");
        }
        return static_cast<int64_t>(v->get_uint64());
    }
    if (v->is_double() && std::floor(v->get_double()) == v->get_double()) {
        // [-2^63, 2^63)
        const double d = v->get_double();
        if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            throw ConfigError(path + "." + key, "out of range");
        }
        return static_cast<int64_t>(d);
    }
    throw ConfigError(path + "." + key, "expected an integer");
}

// readInt narrowed to int; values that do not fit are rejected, not wrapped.
int readInt32(
    const json::object& obj,
    const char* key,
    const std::string& path,
    int fallback
) {
    const int64_t v = readInt(obj, key, path, fallback);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError(path + "." + key, "out of range");
    }
    return static_cast<int>(v);
}

bool readBool(
    const json::object& obj,
    const char* key,
    const std::string& path,
    bool fallback
) {
    const json::value* v = obj.if_contains(key);
    if (!v) return fallback;
    if (!v->is_bool()) {
        throw ConfigError(path + "." + key, "expected true or false");
    }
    return v->get_bool();
}

std::string readString(
    const json::object& obj,
    const char* key,
    const std::string& path,
    const std::string& fallback
) {
    const json::value* v = obj.if_contains(key);
    if (!v) return fallback;
    if (!v->is_string()) {
        throw ConfigError(path + "." + key, "expected a string");
    }
    return std::string(v->get_string().c_str());
}

std::size_t readCount(
    const json::object& obj,
    const char* key,
    const std::string& path,
    std::size_t fallback
) {
    int64_t v = readInt(obj, key, path, static_cast<int64_t>(fallback));
    if (v < 0) {
        throw ConfigError(path + "." + key, "must not be negative");
    }
    return static_cast<std::size_t>(v);
}

std::string resolvePath(const std::string& p, const std::string& base_dir) {
    if (p.empty()) return p;
    fs::path path(p);
    if (path.is_absolute() || base_dir.empty()) return p;
    return (fs::path(base_dir) / path).lexically_normal().string();
}

void parseRules(const json::object& obj, RuleConfig& r) {
    if (const json::value* v = obj.if_contains("trusted_devices")) {
        if (!v->is_array()) {
            throw ConfigError("rules.trusted_devices", "expected an array of strings");
        }
        r.trusted_devices.clear();
        for (const auto& d : v->get_array()) {
            if (!d.is_string()) {
                throw ConfigError("rules.trusted_devices", "expected an array of strings");
            }
            r.trusted_devices.emplace_back(d.get_string().c_str());
        }
    }

    r.high_amount_threshold =
        readDouble(obj, "high_amount_threshold", "rules", r.high_amount_threshold);
    r.timezone_offset_minutes =
        readInt32(obj, "timezone_offset_minutes", "rules", r.timezone_offset_minutes);

    if (auto* s = section(obj, "unknown_device")) {
        auto& c = r.unknown_device;
        const std::string p = "rules.unknown_device";
        c.enabled = readBool(*s, "enabled", p, c.enabled);
        c.floor = readDouble(*s, "floor", p, c.floor);
        c.elevated_floor = readDouble(*s, "elevated_floor", p, c.elevated_floor);
        c.elevate_above_score = readDouble(*s, "elevate_above_score", p, c.elevate_above_score);
        c.trust_history_devices = readBool(*s, "trust_history_devices", p, c.trust_history_devices);
    }

    if (auto* s = section(obj, "high_velocity")) {
        auto& c = r.high_velocity;
        const std::string p = "rules.high_velocity";
        c.enabled = readBool(*s, "enabled", p, c.enabled);
        c.max_transactions = readInt32(*s, "max_transactions", p, c.max_transactions);
        c.window_seconds = readInt(*s, "window_seconds", p, c.window_seconds);
        c.floor = readDouble(*s, "floor", p, c.floor);
    }

    if (auto* s = section(obj, "high_amount_unusual_hour")) {
        auto& c = r.high_amount_unusual_hour;
        const std::string p = "rules.high_amount_unusual_hour";
        c.enabled = readBool(*s, "enabled", p, c.enabled);
        c.start_hour = readInt32(*s, "start_hour", p, c.start_hour);
        c.end_hour = readInt32(*s, "end_hour", p, c.end_hour);
        c.floor = readDouble(*s, "floor", p, c.floor);
    }

    if (auto* s = section(obj, "critical_amount")) {
        auto& c = r.critical_amount;
        const std::string p = "rules.critical_amount";
        c.enabled = readBool(*s, "enabled", p, c.enabled);
        c.threshold = readDouble(*s, "threshold", p, c.threshold);
        c.floor = readDouble(*s, "floor", p, c.floor);
    }

    if (auto* s = section(obj, "impossible_travel")) {
        auto& c = r.impossible_travel;
        const std::string p = "rules.impossible_travel";
        c.enabled = readBool(*s, "enabled", p, c.enabled);
        c.max_speed_kmh = readDouble(*s, "max_speed_kmh", p, c.max_speed_kmh);
        c.min_distance_km = readDouble(*s, "min_distance_km", p, c.min_distance_km);
        c.floor = readDouble(*s, "floor", p, c.floor);
    }
}

void requireUnit(double v, const char* key) {
    if (!(v >= 0.0 && v <= 1.0)) {
        throw ConfigError(key, "must lie in [0, 1]");
    }
}

}

EngineConfig parseEngineConfig(
    const std::string& json_text,
    const std::string& base_dir
) {
    json::value doc;
    try {
        doc = json::parse(json_text);
    } catch (const std::exception& e) {
        throw ConfigError("document", e.what());
    }

    if (!doc.is_object()) {
        throw ConfigError("document", "expected a JSON object");
    }
    const json::object& root = doc.get_object();

    EngineConfig cfg;

    if (auto* s = section(root, "artifacts")) {
        auto& a = cfg.artifacts;
        a.static_model = resolvePath(readString(*s, "static_model", "artifacts", ""), base_dir);
        a.sequential_model = resolvePath(readString(*s, "sequential_model", "artifacts", ""), base_dir);
        a.normalization = resolvePath(readString(*s, "normalization", "artifacts", ""), base_dir);
        a.checksums = resolvePath(readString(*s, "checksums", "artifacts", ""), base_dir);
    }

    if (auto* s = section(root, "history")) {
        cfg.history.window = readCount(*s, "window", "history", cfg.history.window);
        cfg.history.store_retries =
            readInt32(*s, "store_retries", "history", cfg.history.store_retries);
    }

    if (auto* s = section(root, "aggregator")) {
        auto& g = cfg.aggregator;
        g.static_weight = readDouble(*s, "static_weight", "aggregator", g.static_weight);
        g.sequential_weight = readDouble(*s, "sequential_weight", "aggregator", g.sequential_weight);
        g.flag_threshold = readDouble(*s, "flag_threshold", "aggregator", g.flag_threshold);
        g.block_threshold = readDouble(*s, "block_threshold", "aggregator", g.block_threshold);
    }

    if (auto* s = section(root, "rules")) {
        parseRules(*s, cfg.rules);
    }

    if (auto* s = section(root, "explanation")) {
        auto& x = cfg.explanation;
        x.top_k = readCount(*s, "top_k", "explanation", x.top_k);
        x.max_exact_features = readCount(*s, "max_exact_features", "explanation", x.max_exact_features);
        x.sample_permutations = readCount(*s, "sample_permutations", "explanation", x.sample_permutations);
        const std::size_t seed = readCount(*s, "seed", "explanation", x.seed);
        if (seed > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError("explanation.seed", "out of range");
        }
        x.seed = static_cast<uint32_t>(seed);
    }

    if (auto* s = section(root, "validation")) {
        cfg.validation.max_amount =
            readDouble(*s, "max_amount", "validation", cfg.validation.max_amount);
    }

    if (auto* s = section(root, "audit")) {
        cfg.audit.enabled = readBool(*s, "enabled", "audit", cfg.audit.enabled);
        cfg.audit.path = resolvePath(readString(*s, "path", "audit", cfg.audit.path), base_dir);
    }

    if (auto* s = section(root, "engine")) {
        cfg.engine.parallel_scoring =
            readBool(*s, "parallel_scoring", "engine", cfg.engine.parallel_scoring);
        cfg.engine.log_decisions =
            readBool(*s, "log_decisions", "engine", cfg.engine.log_decisions);
    }

    validateEngineConfig(cfg);
    return cfg;
}

EngineConfig loadEngineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("file", "cannot open " + path);
    }

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );

    const std::string base = fs::path(path).parent_path().string();
    return parseEngineConfig(data, base);
}

void validateEngineConfig(const EngineConfig& cfg) {
    if (cfg.history.window == 0 || cfg.history.window > 1000) {
        throw ConfigError("history.window", "must be between 1 and 1000");
    }
    if (cfg.history.store_retries < 0 || cfg.history.store_retries > 5) {
        throw ConfigError("history.store_retries", "must be between 0 and 5");
    }

    const auto& g = cfg.aggregator;
    requireUnit(g.static_weight, "aggregator.static_weight");
    requireUnit(g.sequential_weight, "aggregator.sequential_weight");
    if (std::fabs(g.static_weight + g.sequential_weight - 1.0) > 1e-6) {
        throw ConfigError("aggregator", "static_weight + sequential_weight must equal 1");
    }
    if (!(g.flag_threshold > 0.0 && g.flag_threshold < g.block_threshold &&
          g.block_threshold <= 1.0)) {
        throw ConfigError("aggregator", "thresholds must satisfy 0 < flag < block <= 1");
    }

    const auto& r = cfg.rules;
    if (!(r.high_amount_threshold > 0.0)) {
        throw ConfigError("rules.high_amount_threshold", "must be positive");
    }
    if (r.timezone_offset_minutes < -720 || r.timezone_offset_minutes > 840) {
        throw ConfigError("rules.timezone_offset_minutes", "must be between -720 and 840");
    }

    requireUnit(r.unknown_device.floor, "rules.unknown_device.floor");
    requireUnit(r.unknown_device.elevated_floor, "rules.unknown_device.elevated_floor");
    requireUnit(r.unknown_device.elevate_above_score, "rules.unknown_device.elevate_above_score");
    if (r.unknown_device.elevated_floor < r.unknown_device.floor) {
        throw ConfigError("rules.unknown_device.elevated_floor", "must not be below floor");
    }

    requireUnit(r.high_velocity.floor, "rules.high_velocity.floor");
    if (r.high_velocity.max_transactions < 1) {
        throw ConfigError("rules.high_velocity.max_transactions", "must be at least 1");
    }
    if (r.high_velocity.window_seconds <= 0) {
        throw ConfigError("rules.high_velocity.window_seconds", "must be positive");
    }
    if (r.high_velocity.enabled &&
        static_cast<std::size_t>(r.high_velocity.max_transactions) >= cfg.history.window) {
        throw ConfigError("rules.high_velocity.max_transactions",
                          "must be smaller than history.window");
    }

    requireUnit(r.high_amount_unusual_hour.floor, "rules.high_amount_unusual_hour.floor");
    const auto& uh = r.high_amount_unusual_hour;
    if (uh.start_hour < 0 || uh.start_hour > 23 || uh.end_hour < 0 || uh.end_hour > 24 ||
        uh.start_hour == uh.end_hour) {
        throw ConfigError("rules.high_amount_unusual_hour",
                          "start_hour in [0,23], end_hour in [0,24], start != end");
    }

    requireUnit(r.critical_amount.floor, "rules.critical_amount.floor");
    if (!(r.critical_amount.threshold > 0.0)) {
        throw ConfigError("rules.critical_amount.threshold", "must be positive");
    }

    requireUnit(r.impossible_travel.floor, "rules.impossible_travel.floor");
    if (!(r.impossible_travel.max_speed_kmh > 0.0)) {
        throw ConfigError("rules.impossible_travel.max_speed_kmh", "must be positive");
    }
    if (!(r.impossible_travel.min_distance_km >= 0.0)) {
        throw ConfigError("rules.impossible_travel.min_distance_km", "must not be negative");
    }

    const auto& x = cfg.explanation;
    if (x.top_k == 0) {
        throw ConfigError("explanation.top_k", "must be at least 1");
    }
    if (x.max_exact_features == 0 || x.max_exact_features > 20) {
        throw ConfigError("explanation.max_exact_features", "must be between 1 and 20");
    }
    if (x.sample_permutations == 0) {
        throw ConfigError("explanation.sample_permutations", "must be at least 1");
    }

    if (!(cfg.validation.max_amount > 0.0)) {
        throw ConfigError("validation.max_amount", "must be positive");
    }

    if (cfg.audit.enabled && cfg.audit.path.empty()) {
        throw ConfigError("audit.path", "required when audit is enabled");
    }
}

}
