#include "TestFixtures.hpp"

#include "fraudshield/rules/DomainRuleEngine.hpp"
#include "fraudshield/rules/DomainRules.hpp"

#include <boost/test/unit_test.hpp>

#include <stdexcept>

using namespace fraudshield;
using namespace fraudshield::test;

namespace {

struct RuleFixture {
    RuleConfig cfg;
    HistoryWindow window;

    RuleFixture() {
        cfg.trusted_devices = {kTrustedDevice};
    }

    RuleEvaluation run(const Transaction& tx, double combined) {
        const DomainRuleEngine engine = DomainRuleEngine::fromConfig(cfg);
        const HistoryStats stats = HistoryStats::compute(
            window, tx.timestamp, cfg.high_velocity.window_seconds);
        const RuleContext ctx{tx, stats, combined,
                              infra::calendarFields(tx.timestamp, cfg.timezone_offset_minutes)};
        return engine.evaluate(ctx);
    }

    void addPast(int64_t ts, double lat = 12.9716, double lon = 77.5946) {
        HistoryEntry e;
        e.timestamp = ts;
        e.latitude = lat;
        e.longitude = lon;
        e.device_id = kTrustedDevice;
        window.push_back(e);
    }
};

bool fired(const RuleEvaluation& r, const std::string& name) {
    for (const auto& o : r.triggered) {
        if (o.rule == name) return true;
    }
    return false;
}

class ThrowingRule : public Rule {
public:
    const std::string& name() const override { return name_; }
    RuleOutcome evaluate(const RuleContext&) const override {
        throw std::runtime_error("boom");
    }

private:
    std::string name_ = "Throwing";
};

class FixedRule : public Rule {
public:
    explicit FixedRule(double floor) : floor_(floor) {}
    const std::string& name() const override { return name_; }
    RuleOutcome evaluate(const RuleContext&) const override {
        RuleOutcome o;
        o.rule = name_;
        o.triggered = true;
        o.floor = floor_;
        return o;
    }

private:
    std::string name_ = "Fixed";
    double floor_;
};

}

BOOST_FIXTURE_TEST_SUITE(rules_tests, RuleFixture)

BOOST_AUTO_TEST_CASE(quiet_transaction_triggers_nothing)
{
    const RuleEvaluation r = run(makeTx(1200.0), 0.2);
    BOOST_CHECK(r.triggered.empty());
    BOOST_CHECK_CLOSE(r.final_score, 0.2, 1e-9);
}

BOOST_AUTO_TEST_CASE(unknown_device_floors)
{
    RuleEvaluation r = run(makeTx(1200.0, "ff:ff:ff:ff:ff:ff"), 0.2);
    BOOST_REQUIRE(fired(r, "Unknown Device"));
    BOOST_CHECK_CLOSE(r.final_score, 0.60, 1e-9);

    // elevated by the model score
    r = run(makeTx(1200.0, "ff:ff:ff:ff:ff:ff"), 0.45);
    BOOST_CHECK_CLOSE(r.final_score, 0.95, 1e-9);

    // elevated by the amount
    r = run(makeTx(12000.0, "ff:ff:ff:ff:ff:ff"), 0.1);
    BOOST_CHECK_CLOSE(r.final_score, 0.95, 1e-9);
}

BOOST_AUTO_TEST_CASE(history_devices_trusted_when_enabled)
{
    HistoryEntry e;
    e.timestamp = kAfternoon - 86400;
    e.device_id = "ff:ff:ff:ff:ff:ff";
    window.push_back(e);

    BOOST_CHECK(fired(run(makeTx(1200.0, "ff:ff:ff:ff:ff:ff"), 0.2), "Unknown Device"));

    cfg.unknown_device.trust_history_devices = true;
    BOOST_CHECK(!fired(run(makeTx(1200.0, "ff:ff:ff:ff:ff:ff"), 0.2), "Unknown Device"));
}

BOOST_AUTO_TEST_CASE(high_velocity_on_sixth_in_hour)
{
    for (int i = 0; i < 4; ++i) addPast(kAfternoon - 600 * (i + 1));
    BOOST_CHECK(!fired(run(makeTx(), 0.1), "High Velocity"));

    addPast(kAfternoon - 3000);
    const RuleEvaluation r = run(makeTx(), 0.1);
    BOOST_REQUIRE(fired(r, "High Velocity"));
    BOOST_CHECK_CLOSE(r.final_score, 0.85, 1e-9);
}

BOOST_AUTO_TEST_CASE(velocity_ignores_old_entries)
{
    for (int i = 0; i < 8; ++i) addPast(kAfternoon - 3600 - 60 * i);
    BOOST_CHECK(!fired(run(makeTx(), 0.1), "High Velocity"));
}

BOOST_AUTO_TEST_CASE(high_amount_at_night)
{
    RuleEvaluation r = run(makeTx(15000.0, kTrustedDevice, kNight), 0.2);
    BOOST_REQUIRE(fired(r, "High Amount + Unusual Hour"));
    BOOST_CHECK_CLOSE(r.final_score, 0.60, 1e-9);

    // boundary: exactly the threshold is not above it
    BOOST_CHECK(!fired(run(makeTx(10000.0, kTrustedDevice, kNight), 0.2),
                       "High Amount + Unusual Hour"));
    BOOST_CHECK(!fired(run(makeTx(15000.0, kTrustedDevice, kAfternoon), 0.2),
                       "High Amount + Unusual Hour"));
}

BOOST_AUTO_TEST_CASE(unusual_hour_window_wraps)
{
    BOOST_CHECK(HighAmountUnusualHourRule::inWindow(23, 22, 4));
    BOOST_CHECK(HighAmountUnusualHourRule::inWindow(2, 22, 4));
    BOOST_CHECK(!HighAmountUnusualHourRule::inWindow(4, 22, 4));
    BOOST_CHECK(HighAmountUnusualHourRule::inWindow(0, 0, 5));
    BOOST_CHECK(!HighAmountUnusualHourRule::inWindow(5, 0, 5));
}

BOOST_AUTO_TEST_CASE(critical_amount)
{
    const RuleEvaluation r = run(makeTx(60000.0), 0.1);
    BOOST_REQUIRE(fired(r, "Critical Amount"));
    BOOST_CHECK_CLOSE(r.final_score, 0.80, 1e-9);
}

BOOST_AUTO_TEST_CASE(impossible_travel)
{
    // Bengaluru an hour ago, Delhi now: ~1740 km
    HistoryEntry prev;
    prev.timestamp = kAfternoon - 3600;
    prev.latitude = 12.9716;
    prev.longitude = 77.5946;
    prev.device_id = kTrustedDevice;
    window.push_back(prev);

    Transaction tx = makeTx();
    tx.latitude = 28.6139;
    tx.longitude = 77.2090;

    RuleEvaluation r = run(tx, 0.1);
    BOOST_REQUIRE(fired(r, "Impossible Travel"));
    BOOST_CHECK_CLOSE(r.final_score, 0.90, 1e-9);

    // a day is plenty of time
    window.back().timestamp = kAfternoon - 86400;
    BOOST_CHECK(!fired(run(tx, 0.1), "Impossible Travel"));

    // zero elapsed counts as impossible
    window.back().timestamp = kAfternoon;
    BOOST_CHECK(fired(run(tx, 0.1), "Impossible Travel"));

    // out of order is not evaluated
    window.back().timestamp = kAfternoon + 60;
    BOOST_CHECK(!fired(run(tx, 0.1), "Impossible Travel"));
}

BOOST_AUTO_TEST_CASE(short_hops_never_impossible)
{
    addPast(kAfternoon);
    Transaction tx = makeTx();
    tx.latitude += 0.1;
    BOOST_CHECK(!fired(run(tx, 0.1), "Impossible Travel"));
}

BOOST_AUTO_TEST_CASE(no_history_means_no_travel_rule)
{
    Transaction tx = makeTx();
    tx.latitude = -33.8688;
    tx.longitude = 151.2093;
    BOOST_CHECK(!fired(run(tx, 0.1), "Impossible Travel"));
}

BOOST_AUTO_TEST_CASE(multiple_rules_take_the_max)
{
    const RuleEvaluation r = run(makeTx(60000.0, "ff:ff:ff:ff:ff:ff", kNight), 0.1);
    BOOST_CHECK(fired(r, "Unknown Device"));
    BOOST_CHECK(fired(r, "High Amount + Unusual Hour"));
    BOOST_CHECK(fired(r, "Critical Amount"));
    BOOST_CHECK_CLOSE(r.final_score, 0.95, 1e-9);
}

BOOST_AUTO_TEST_CASE(rules_never_lower_risk)
{
    for (double combined : {0.0, 0.3, 0.7, 0.99}) {
        const RuleEvaluation with = run(makeTx(60000.0), combined);
        cfg.critical_amount.enabled = false;
        const RuleEvaluation without = run(makeTx(60000.0), combined);
        cfg.critical_amount.enabled = true;

        BOOST_CHECK(with.final_score >= without.final_score);
        BOOST_CHECK(with.final_score >= combined);
    }
}

BOOST_AUTO_TEST_CASE(disabled_rules_are_skipped)
{
    cfg.unknown_device.enabled = false;
    cfg.critical_amount.enabled = false;
    BOOST_CHECK_EQUAL(DomainRuleEngine::fromConfig(cfg).size(), 3u);
    BOOST_CHECK(run(makeTx(60000.0, "ff:ff:ff:ff:ff:ff"), 0.1).triggered.empty());
}

BOOST_AUTO_TEST_CASE(failing_rule_is_not_triggered)
{
    DomainRuleEngine engine;
    engine.addRule(std::make_unique<ThrowingRule>());
    engine.addRule(std::make_unique<FixedRule>(0.7));

    const Transaction tx = makeTx();
    const HistoryStats stats{};
    const RuleContext ctx{tx, stats, 0.1, infra::calendarFields(tx.timestamp, 0)};

    RuleEvaluation r;
    BOOST_CHECK_NO_THROW(r = engine.evaluate(ctx));
    BOOST_REQUIRE_EQUAL(r.triggered.size(), 1u);
    BOOST_CHECK_EQUAL(r.triggered[0].rule, "Fixed");
    BOOST_CHECK_CLOSE(r.final_score, 0.7, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
