#include "fraudshield/features/FeatureTransformer.hpp"
#include "fraudshield/core/Errors.hpp"

#include <cmath>

namespace fraudshield {

namespace {

bool isAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isLocalChar(char c) {
    return isAlnum(c) || c == '.' || c == '_' || c == '-';
}

}

TransactionValidator::TransactionValidator(double max_amount)
    : max_amount_(max_amount) {}

bool TransactionValidator::isValidIdentity(const std::string& id) {
    const auto at = id.find('@');
    if (at == std::string::npos || id.find('@', at + 1) != std::string::npos) {
        return false;
    }

    const std::size_t local_len = at;
    const std::size_t handle_len = id.size() - at - 1;
    if (local_len < 1 || local_len > 64 || handle_len < 2 || handle_len > 64) {
        return false;
    }

    for (std::size_t i = 0; i < at; ++i) {
        if (!isLocalChar(id[i])) return false;
    }
    for (std::size_t i = at + 1; i < id.size(); ++i) {
        if (!isAlnum(id[i])) return false;
    }
    return true;
}

bool TransactionValidator::isValidDevice(const std::string& device) {
    if (device.empty() || device.size() > 128) return false;
    for (char c : device) {
        if (c < 0x21 || c > 0x7E) return false;
    }
    return true;
}

void TransactionValidator::validate(const Transaction& tx) const {
    if (!isValidIdentity(tx.sender)) {
        throw ValidationError("sender", "expected an identity of the form name@handle");
    }
    if (!isValidIdentity(tx.receiver)) {
        throw ValidationError("receiver", "expected an identity of the form name@handle");
    }
    if (!std::isfinite(tx.amount) || tx.amount <= 0.0) {
        throw ValidationError("amount", "must be greater than 0");
    }
    if (tx.amount > max_amount_) {
        throw ValidationError("amount", "exceeds the maximum of " + std::to_string(max_amount_));
    }
    if (!isValidDevice(tx.device_id)) {
        throw ValidationError("device_id", "must be 1-128 printable characters");
    }
    if (!std::isfinite(tx.latitude) || tx.latitude < -90.0 || tx.latitude > 90.0) {
        throw ValidationError("latitude", "must lie in [-90, 90]");
    }
    if (!std::isfinite(tx.longitude) || tx.longitude < -180.0 || tx.longitude > 180.0) {
        throw ValidationError("longitude", "must lie in [-180, 180]");
    }
    if (tx.timestamp < 0) {
        throw ValidationError("timestamp", "must not be negative");
    }
    if (tx.timestamp > kMaxTimestamp) {
        throw ValidationError("timestamp", "must not be later than year 9999");
    }
    if (tx.hour && (*tx.hour < 0 || *tx.hour > 23)) {
        throw ValidationError("hour", "must lie in [0, 23]");
    }
    if (tx.day_of_week && (*tx.day_of_week < 0 || *tx.day_of_week > 6)) {
        throw ValidationError("day_of_week", "must lie in [0, 6]");
    }
    if (tx.day_of_month && (*tx.day_of_month < 1 || *tx.day_of_month > 31)) {
        throw ValidationError("day_of_month", "must lie in [1, 31]");
    }
    if (tx.time_since_last &&
        (!std::isfinite(*tx.time_since_last) || *tx.time_since_last < 0.0)) {
        throw ValidationError("time_since_last", "must be a non-negative number");
    }
    if (tx.amount_delta && !std::isfinite(*tx.amount_delta)) {
        throw ValidationError("amount_delta", "must be finite");
    }
}

FeatureTransformer::FeatureTransformer(
    std::shared_ptr<const NormalizationParams> params,
    int timezone_offset_minutes,
    double max_amount
) : params_(std::move(params)),
    tz_offset_minutes_(timezone_offset_minutes),
    validator_(max_amount) {
    if (!params_) {
        throw ModelUnavailableError("feature transformer: normalization tables not loaded");
    }
}

infra::CalendarFields FeatureTransformer::temporalFields(const Transaction& tx) const {
    infra::CalendarFields cal = infra::calendarFields(tx.timestamp, tz_offset_minutes_);
    if (tx.hour) cal.hour = *tx.hour;
    if (tx.day_of_week) cal.day_of_week = *tx.day_of_week;
    if (tx.day_of_month) cal.day_of_month = *tx.day_of_month;
    return cal;
}

double FeatureTransformer::encode(
    const FeatureSpec& f,
    const Transaction& tx,
    const infra::CalendarFields& cal
) const {
    if (f.encoding == FeatureEncoding::LABEL) {
        const std::string* key = nullptr;
        switch (f.source) {
            case FeatureSource::SENDER:    key = &tx.sender; break;
            case FeatureSource::RECEIVER:  key = &tx.receiver; break;
            case FeatureSource::DEVICE_ID: key = &tx.device_id; break;
            default: break;
        }
        if (!key) return f.unknown_code;
        auto it = f.codes.find(*key);
        return it == f.codes.end() ? f.unknown_code : it->second;
    }

    double raw = 0.0;
    switch (f.source) {
        case FeatureSource::AMOUNT:          raw = tx.amount; break;
        case FeatureSource::LATITUDE:        raw = tx.latitude; break;
        case FeatureSource::LONGITUDE:       raw = tx.longitude; break;
        case FeatureSource::HOUR:            raw = cal.hour; break;
        case FeatureSource::DAY_OF_WEEK:     raw = cal.day_of_week; break;
        case FeatureSource::DAY_OF_MONTH:    raw = cal.day_of_month; break;
        case FeatureSource::TIME_SINCE_LAST: raw = tx.time_since_last.value_or(0.0); break;
        case FeatureSource::AMOUNT_DELTA:    raw = tx.amount_delta.value_or(0.0); break;
        default: break;
    }

    if (f.encoding == FeatureEncoding::MINMAX) {
        // Zero range scales by 1, as the fitted scaler does
        const double range = f.max - f.min;
        return range > 0.0 ? (raw - f.min) / range : raw - f.min;
    }
    return raw;
}

FeatureVector FeatureTransformer::transform(const Transaction& tx) const {
    validator_.validate(tx);

    const infra::CalendarFields cal = temporalFields(tx);

    FeatureVector out;
    out.reserve(params_->size());
    for (const auto& f : params_->features()) {
        out.push_back(encode(f, tx, cal));
    }
    return out;
}

}
