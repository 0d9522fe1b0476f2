#include "TestFixtures.hpp"

#include "fraudshield/audit/AuditSink.hpp"

#include <boost/json.hpp>
#include <boost/test/unit_test.hpp>

using namespace fraudshield;
using namespace fraudshield::test;

namespace json = boost::json;

BOOST_AUTO_TEST_SUITE(audit_tests)

BOOST_AUTO_TEST_CASE(record_carries_only_anonymous_fields)
{
    AuditRecord r;
    r.timestamp = kEvening;
    r.amount = 1200.0;
    r.risk_score = 0.6;
    r.verdict = Verdict::FLAG;

    const json::object o = json::parse(JsonlAuditSink::toJson(r)).as_object();
    BOOST_CHECK_EQUAL(o.size(), 4u);
    BOOST_CHECK_EQUAL(o.at("timestamp").as_int64(), kEvening);
    BOOST_CHECK_EQUAL(o.at("verdict").as_string().c_str(), "FLAG");
}

BOOST_AUTO_TEST_CASE(lines_are_appended)
{
    TempDir dir;
    const std::string path = dir.path() + "/audit.jsonl";
    {
        JsonlAuditSink sink(path);
        AuditRecord r;
        r.amount = 1.0;
        sink.record(r);
        r.amount = 2.0;
        sink.record(r);
    }

    std::ifstream in(path);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        const json::object o = json::parse(line).as_object();
        BOOST_CHECK_CLOSE(o.at("amount").to_number<double>(), count + 1.0, 1e-9);
        ++count;
    }
    BOOST_CHECK_EQUAL(count, 2);
}

BOOST_AUTO_TEST_CASE(unwritable_path_is_a_config_error)
{
    BOOST_CHECK_THROW(JsonlAuditSink("/nonexistent-dir/audit.jsonl"), ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()
