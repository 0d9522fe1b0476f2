#include "fraudshield/features/NormalizationParams.hpp"
#include "fraudshield/core/Errors.hpp"

#include <boost/json.hpp>

#include <cmath>
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace json = boost::json;

namespace fraudshield {

namespace {

struct SourceName {
    const char* name;
    FeatureSource source;
};

constexpr SourceName kSources[] = {
    {"amount",          FeatureSource::AMOUNT},
    {"latitude",        FeatureSource::LATITUDE},
    {"longitude",       FeatureSource::LONGITUDE},
    {"hour",            FeatureSource::HOUR},
    {"day_of_week",     FeatureSource::DAY_OF_WEEK},
    {"day_of_month",    FeatureSource::DAY_OF_MONTH},
    {"time_since_last", FeatureSource::TIME_SINCE_LAST},
    {"amount_delta",    FeatureSource::AMOUNT_DELTA},
    {"sender",          FeatureSource::SENDER},
    {"receiver",        FeatureSource::RECEIVER},
    {"device_id",       FeatureSource::DEVICE_ID},
};

FeatureSource parseSource(const std::string& s, const std::string& feature) {
    for (const auto& e : kSources) {
        if (s == e.name) return e.source;
    }
    throw ModelUnavailableError(
        "normalization: feature '" + feature + "' has unknown source '" + s + "'");
}

FeatureEncoding parseEncoding(const std::string& s, const std::string& feature) {
    if (s == "raw") return FeatureEncoding::RAW;
    if (s == "minmax") return FeatureEncoding::MINMAX;
    if (s == "label") return FeatureEncoding::LABEL;
    throw ModelUnavailableError(
        "normalization: feature '" + feature + "' has unknown type '" + s + "'");
}

double number(const json::object& o, const char* key, const std::string& feature) {
    const json::value* v = o.if_contains(key);
    if (!v || !v->is_number()) {
        throw ModelUnavailableError(
            "normalization: feature '" + feature + "' needs numeric '" + key + "'");
    }
    return v->to_number<double>();
}

std::string text(const json::object& o, const char* key, const std::string& fallback) {
    const json::value* v = o.if_contains(key);
    if (!v) return fallback;
    if (!v->is_string()) {
        throw ModelUnavailableError(
            std::string("normalization: '") + key + "' must be a string");
    }
    return std::string(v->get_string().c_str());
}

}

bool isCategorical(FeatureSource s) {
    return s == FeatureSource::SENDER ||
           s == FeatureSource::RECEIVER ||
           s == FeatureSource::DEVICE_ID;
}

NormalizationParams::NormalizationParams(
    std::vector<FeatureSpec> features,
    FeatureVector baseline
) : features_(std::move(features)),
    baseline_(std::move(baseline)) {

    if (features_.empty()) {
        throw ModelUnavailableError("normalization: no features declared");
    }

    std::unordered_set<std::string> names;
    for (const auto& f : features_) {
        if (f.name.empty()) {
            throw ModelUnavailableError("normalization: feature without a name");
        }
        if (!names.insert(f.name).second) {
            throw ModelUnavailableError("normalization: duplicate feature '" + f.name + "'");
        }

        const bool categorical = isCategorical(f.source);
        if (categorical != (f.encoding == FeatureEncoding::LABEL)) {
            throw ModelUnavailableError(
                "normalization: feature '" + f.name +
                "' encoding does not match its source");
        }
        if (f.encoding == FeatureEncoding::MINMAX &&
            !(std::isfinite(f.min) && std::isfinite(f.max) && f.min <= f.max)) {
            throw ModelUnavailableError(
                "normalization: feature '" + f.name + "' needs finite min <= max");
        }
    }

    if (baseline_.empty()) {
        baseline_.assign(features_.size(), 0.0);
    } else if (baseline_.size() != features_.size()) {
        throw ModelUnavailableError(
            "normalization: baseline has " + std::to_string(baseline_.size()) +
            " values for " + std::to_string(features_.size()) + " features");
    }
}

NormalizationParams NormalizationParams::parse(const std::string& json_text) {
    json::value doc;
    try {
        doc = json::parse(json_text);
    } catch (const std::exception& e) {
        throw ModelUnavailableError(std::string("normalization: ") + e.what());
    }

    const json::object* root = doc.if_object();
    const json::value* feats = root ? root->if_contains("features") : nullptr;
    if (!feats || !feats->is_array()) {
        throw ModelUnavailableError("normalization: missing 'features' array");
    }

    std::vector<FeatureSpec> specs;
    for (const auto& item : feats->get_array()) {
        const json::object* o = item.if_object();
        if (!o) {
            throw ModelUnavailableError("normalization: feature entries must be objects");
        }

        FeatureSpec f;
        f.name = text(*o, "name", "");
        f.label = text(*o, "label", f.name);
        f.source = parseSource(text(*o, "source", f.name), f.name);
        f.encoding = parseEncoding(
            text(*o, "type", isCategorical(f.source) ? "label" : "raw"), f.name);

        if (f.encoding == FeatureEncoding::MINMAX) {
            f.min = number(*o, "min", f.name);
            f.max = number(*o, "max", f.name);
        } else if (f.encoding == FeatureEncoding::LABEL) {
            const json::value* classes = o->if_contains("classes");
            if (!classes || !classes->is_array()) {
                throw ModelUnavailableError(
                    "normalization: feature '" + f.name + "' needs a 'classes' array");
            }
            // LabelEncoder semantics: code = position in the fitted class list
            double code = 0.0;
            for (const auto& c : classes->get_array()) {
                if (!c.is_string()) {
                    throw ModelUnavailableError(
                        "normalization: feature '" + f.name + "' classes must be strings");
                }
                f.codes.emplace(std::string(c.get_string().c_str()), code);
                code += 1.0;
            }
            if (o->if_contains("unknown")) {
                f.unknown_code = number(*o, "unknown", f.name);
            }
        }

        specs.push_back(std::move(f));
    }

    FeatureVector baseline;
    if (const json::value* b = root->if_contains("baseline")) {
        if (!b->is_array()) {
            throw ModelUnavailableError("normalization: 'baseline' must be an array");
        }
        for (const auto& v : b->get_array()) {
            if (!v.is_number()) {
                throw ModelUnavailableError("normalization: 'baseline' must hold numbers");
            }
            baseline.push_back(v.to_number<double>());
        }
    }

    return NormalizationParams(std::move(specs), std::move(baseline));
}

NormalizationParams NormalizationParams::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ModelUnavailableError("normalization: cannot open " + path);
    }

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );

    return parse(data);
}

}
