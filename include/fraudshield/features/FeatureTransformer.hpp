#pragma once

#include "fraudshield/core/Types.hpp"
#include "fraudshield/features/NormalizationParams.hpp"
#include "fraudshield/infra/Calendar.hpp"

#include <memory>
#include <string>

namespace fraudshield {

// Checks the declared domain of every Transaction field.
class TransactionValidator {
public:
    // 9999-12-31T23:59:59Z
    static constexpr int64_t kMaxTimestamp = 253402300799;

    explicit TransactionValidator(double max_amount = 10000000.0);

    // Throws ValidationError naming the offending field.
    void validate(const Transaction& tx) const;

    static bool isValidIdentity(const std::string& id);
    static bool isValidDevice(const std::string& device);

private:
    double max_amount_;
};

// Raw transaction -> fixed-length feature vector. Pure; no I/O, no state
// beyond the immutable normalization tables.
class FeatureTransformer {
public:
    FeatureTransformer(
        std::shared_ptr<const NormalizationParams> params,
        int timezone_offset_minutes = 0,
        double max_amount = 10000000.0
    );

    FeatureVector transform(const Transaction& tx) const;

    // Hour, weekday and day of month: explicit fields win over the timestamp.
    infra::CalendarFields temporalFields(const Transaction& tx) const;

    const NormalizationParams& params() const { return *params_; }
    const TransactionValidator& validator() const { return validator_; }
    std::size_t dimension() const { return params_->size(); }

private:
    double encode(const FeatureSpec& f, const Transaction& tx,
                  const infra::CalendarFields& cal) const;

    std::shared_ptr<const NormalizationParams> params_;
    int tz_offset_minutes_;
    TransactionValidator validator_;
};

}
