#include "fraudshield/rules/DomainRules.hpp"
#include "fraudshield/infra/Geo.hpp"

#include <iomanip>
#include <sstream>

namespace fraudshield {

namespace {

RuleOutcome outcome(const std::string& rule, bool triggered, double floor, std::string why) {
    RuleOutcome o;
    o.rule = rule;
    o.triggered = triggered;
    o.floor = triggered ? floor : 0.0;
    o.description = std::move(why);
    return o;
}

std::string fixed(double v, int prec) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(prec) << v;
    return ss.str();
}

}

// Unknown Device

UnknownDeviceRule::UnknownDeviceRule(
    const UnknownDeviceRuleConfig& cfg,
    const std::vector<std::string>& trusted_devices,
    double high_amount_threshold
) : cfg_(cfg),
    trusted_(trusted_devices.begin(), trusted_devices.end()),
    high_amount_(high_amount_threshold) {}

RuleOutcome UnknownDeviceRule::evaluate(const RuleContext& ctx) const {
    const std::string& dev = ctx.tx.device_id;

    bool known = trusted_.count(dev) > 0;
    if (!known && cfg_.trust_history_devices) {
        known = ctx.stats.devices.count(dev) > 0;
    }
    if (known) {
        return outcome(name_, false, 0.0, "device is recognised");
    }

    const bool elevate =
        ctx.combined_score > cfg_.elevate_above_score || ctx.tx.amount > high_amount_;
    const double floor = elevate ? cfg_.elevated_floor : cfg_.floor;

    return outcome(name_, true, floor,
        elevate ? "transaction from an unrecognised device with elevated risk"
                : "transaction from an unrecognised device");
}

// High Velocity

HighVelocityRule::HighVelocityRule(const VelocityRuleConfig& cfg) : cfg_(cfg) {}

RuleOutcome HighVelocityRule::evaluate(const RuleContext& ctx) const {
    const std::size_t count = ctx.stats.recent_count + 1;
    const bool hit = count > static_cast<std::size_t>(cfg_.max_transactions);

    return outcome(name_, hit, cfg_.floor,
        std::to_string(count) + " transactions in the last " +
        std::to_string(cfg_.window_seconds) + " s (limit " +
        std::to_string(cfg_.max_transactions) + ")");
}

// High Amount + Unusual Hour

HighAmountUnusualHourRule::HighAmountUnusualHourRule(
    const UnusualHourRuleConfig& cfg,
    double high_amount_threshold
) : cfg_(cfg), high_amount_(high_amount_threshold) {}

bool HighAmountUnusualHourRule::inWindow(int hour, int start, int end) {
    if (start == end) return false;
    if (start < end) return hour >= start && hour < end;
    return hour >= start || hour < end;
}

RuleOutcome HighAmountUnusualHourRule::evaluate(const RuleContext& ctx) const {
    const int hour = ctx.calendar.hour;
    const bool hit = ctx.tx.amount > high_amount_ &&
                     inWindow(hour, cfg_.start_hour, cfg_.end_hour);

    return outcome(name_, hit, cfg_.floor,
        "amount " + fixed(ctx.tx.amount, 2) + " at hour " + std::to_string(hour));
}

// Critical Amount

CriticalAmountRule::CriticalAmountRule(const CriticalAmountRuleConfig& cfg) : cfg_(cfg) {}

RuleOutcome CriticalAmountRule::evaluate(const RuleContext& ctx) const {
    const bool hit = ctx.tx.amount > cfg_.threshold;
    return outcome(name_, hit, cfg_.floor,
        "amount " + fixed(ctx.tx.amount, 2) + " exceeds " + fixed(cfg_.threshold, 2));
}

// Impossible Travel

ImpossibleTravelRule::ImpossibleTravelRule(const TravelRuleConfig& cfg) : cfg_(cfg) {}

RuleOutcome ImpossibleTravelRule::evaluate(const RuleContext& ctx) const {
    const HistoryStats& s = ctx.stats;
    if (!s.last_timestamp || !s.last_latitude || !s.last_longitude) {
        return outcome(name_, false, 0.0, "no previous location");
    }

    const int64_t elapsed = ctx.tx.timestamp - *s.last_timestamp;
    if (elapsed < 0) {
        return outcome(name_, false, 0.0, "previous transaction is newer");
    }

    const double km = infra::haversineKm(
        *s.last_latitude, *s.last_longitude, ctx.tx.latitude, ctx.tx.longitude);
    if (km < cfg_.min_distance_km) {
        return outcome(name_, false, 0.0, fixed(km, 1) + " km from previous location");
    }

    if (elapsed == 0) {
        return outcome(name_, true, cfg_.floor,
            fixed(km, 1) + " km from previous location with no time elapsed");
    }

    const double kmh = km / (static_cast<double>(elapsed) / 3600.0);
    const bool hit = kmh > cfg_.max_speed_kmh;
    return outcome(name_, hit, cfg_.floor,
        fixed(km, 1) + " km in " + std::to_string(elapsed) + " s (" +
        fixed(kmh, 0) + " km/h)");
}

}
