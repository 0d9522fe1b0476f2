#pragma once

#include "fraudshield/core/Types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace fraudshield {

enum class FeatureSource : uint8_t {
    AMOUNT,
    LATITUDE,
    LONGITUDE,
    HOUR,
    DAY_OF_WEEK,
    DAY_OF_MONTH,
    TIME_SINCE_LAST,
    AMOUNT_DELTA,
    SENDER,
    RECEIVER,
    DEVICE_ID
};

enum class FeatureEncoding : uint8_t {
    RAW,
    MINMAX,
    LABEL
};

bool isCategorical(FeatureSource s);

struct FeatureSpec {
    std::string name;
    std::string label;  // human readable, used in explanations
    FeatureSource source = FeatureSource::AMOUNT;
    FeatureEncoding encoding = FeatureEncoding::RAW;

    // MINMAX
    double min = 0.0;
    double max = 1.0;

    // LABEL
    std::unordered_map<std::string, double> codes;
    double unknown_code = 0.0;
};

// Scale and encode tables fitted at training time. Read-only after load.
class NormalizationParams {
public:
    NormalizationParams(
        std::vector<FeatureSpec> features,
        FeatureVector baseline
    );

    // Throws ModelUnavailableError on unreadable or malformed tables.
    static NormalizationParams load(const std::string& path);
    static NormalizationParams parse(const std::string& json_text);

    const std::vector<FeatureSpec>& features() const { return features_; }
    const FeatureVector& baseline() const { return baseline_; }
    std::size_t size() const { return features_.size(); }

private:
    std::vector<FeatureSpec> features_;
    FeatureVector baseline_;
};

}
