#include "TestFixtures.hpp"

#include <boost/test/unit_test.hpp>

using namespace fraudshield;
using namespace fraudshield::test;

namespace {

std::string errorKey(const std::string& json_text) {
    try {
        parseEngineConfig(json_text, "");
    } catch (const ConfigError& e) {
        return e.what();
    }
    return "";
}

}

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(empty_document_gives_defaults)
{
    const EngineConfig cfg = parseEngineConfig("{}", "");
    BOOST_CHECK_EQUAL(cfg.history.window, 10u);
    BOOST_CHECK_CLOSE(cfg.aggregator.static_weight, 0.5, 1e-9);
    BOOST_CHECK_CLOSE(cfg.aggregator.flag_threshold, 0.5, 1e-9);
    BOOST_CHECK_CLOSE(cfg.aggregator.block_threshold, 0.8, 1e-9);
    BOOST_CHECK_EQUAL(cfg.rules.high_velocity.max_transactions, 5);
    BOOST_CHECK_EQUAL(cfg.rules.high_velocity.window_seconds, 3600);
    BOOST_CHECK_CLOSE(cfg.rules.impossible_travel.max_speed_kmh, 800.0, 1e-9);
    BOOST_CHECK_EQUAL(cfg.explanation.top_k, 5u);
    BOOST_CHECK(!cfg.audit.enabled);
}

BOOST_AUTO_TEST_CASE(relative_paths_resolve_against_base)
{
    const EngineConfig cfg = parseEngineConfig(R"({
        "artifacts": {"static_model": "models/gbt.json", "normalization": "/abs/norm.json"}
    })", "/etc/fraudshield");

    BOOST_CHECK_EQUAL(cfg.artifacts.static_model, "/etc/fraudshield/models/gbt.json");
    BOOST_CHECK_EQUAL(cfg.artifacts.normalization, "/abs/norm.json");
    BOOST_CHECK(cfg.artifacts.checksums.empty());
}

BOOST_AUTO_TEST_CASE(rule_table_overrides)
{
    const EngineConfig cfg = parseEngineConfig(R"({
        "history": {"window": 20},
        "rules": {
            "trusted_devices": ["a", "b"],
            "high_amount_threshold": 5000,
            "high_velocity": {"max_transactions": 8, "floor": 0.9},
            "impossible_travel": {"enabled": false}
        }
    })", "");

    BOOST_CHECK_EQUAL(cfg.rules.trusted_devices.size(), 2u);
    BOOST_CHECK_CLOSE(cfg.rules.high_amount_threshold, 5000.0, 1e-9);
    BOOST_CHECK_EQUAL(cfg.rules.high_velocity.max_transactions, 8);
    BOOST_CHECK_CLOSE(cfg.rules.high_velocity.floor, 0.9, 1e-9);
    BOOST_CHECK(!cfg.rules.impossible_travel.enabled);
}

BOOST_AUTO_TEST_CASE(invalid_values_name_their_key)
{
    BOOST_CHECK(errorKey(R"({"aggregator": {"static_weight": 0.9}})")
                    .find("aggregator") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"aggregator": {"flag_threshold": 0.9}})")
                    .find("aggregator") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"history": {"window": 0}})")
                    .find("history.window") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"history": {"window": 4}})")
                    .find("rules.high_velocity.max_transactions") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"rules": {"critical_amount": {"floor": 1.5}}})")
                    .find("rules.critical_amount.floor") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"audit": {"enabled": true}})")
                    .find("audit.path") != std::string::npos);
    BOOST_CHECK(!errorKey("[1, 2]").empty());
    BOOST_CHECK(!errorKey("{").empty());
}

BOOST_AUTO_TEST_CASE(wrong_types_rejected)
{
    BOOST_CHECK_THROW(parseEngineConfig(R"({"history": {"window": "ten"}})", ""), ConfigError);
    BOOST_CHECK_THROW(parseEngineConfig(R"({"rules": {"trusted_devices": "abc"}})", ""),
                      ConfigError);
}

BOOST_AUTO_TEST_CASE(oversized_integers_rejected_not_wrapped)
{
    // 2^32 + 5 would wrap to 5 in an int
    BOOST_CHECK(errorKey(R"({"rules": {"high_velocity": {"max_transactions": 4294967301}}})")
                    .find("rules.high_velocity.max_transactions: out of range") !=
                std::string::npos);
    BOOST_CHECK(errorKey(R"({"rules": {"timezone_offset_minutes": 4294967656}})")
                    .find("rules.timezone_offset_minutes: out of range") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"rules": {"high_amount_unusual_hour": {"start_hour": -4294967295}}})")
                    .find("rules.high_amount_unusual_hour.start_hour: out of range") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"history": {"store_retries": 1e12}})")
                    .find("history.store_retries: out of range") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"explanation": {"seed": 4294967296}})")
                    .find("explanation.seed: out of range") != std::string::npos);
    BOOST_CHECK(errorKey(R"({"rules": {"high_velocity": {"window_seconds": 18446744073709551615}}})")
                    .find("rules.high_velocity.window_seconds: out of range") !=
                std::string::npos);
    BOOST_CHECK(errorKey(R"({"rules": {"high_velocity": {"window_seconds": 1e30}}})")
                    .find("rules.high_velocity.window_seconds: out of range") !=
                std::string::npos);

    const EngineConfig cfg = parseEngineConfig(R"({"explanation": {"seed": 4294967295}})", "");
    BOOST_CHECK_EQUAL(cfg.explanation.seed, 4294967295u);
}

BOOST_AUTO_TEST_CASE(load_from_file)
{
    TempDir dir;
    const std::string path = dir.file("engine.json", R"({
        "artifacts": {"static_model": "gbt.json"},
        "engine": {"parallel_scoring": false}
    })");

    const EngineConfig cfg = loadEngineConfig(path);
    BOOST_CHECK(!cfg.engine.parallel_scoring);
    BOOST_CHECK_EQUAL(cfg.artifacts.static_model,
                      (std::filesystem::path(dir.path()) / "gbt.json").lexically_normal().string());

    BOOST_CHECK_THROW(loadEngineConfig(dir.path() + "/missing.json"), ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()
