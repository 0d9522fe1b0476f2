#include "TestFixtures.hpp"

#include "fraudshield/history/HistoryStats.hpp"
#include "fraudshield/history/IdentityHistoryStore.hpp"

#include <boost/test/unit_test.hpp>

#include <thread>

using namespace fraudshield;
using namespace fraudshield::test;

namespace {

HistoryEntry entryAt(int64_t ts, double amount = 10.0, const std::string& device = "d") {
    HistoryEntry e;
    e.features = {amount};
    e.timestamp = ts;
    e.amount = amount;
    e.device_id = device;
    return e;
}

}

BOOST_AUTO_TEST_SUITE(history_tests)

BOOST_AUTO_TEST_CASE(window_evicts_oldest_first)
{
    IdentityHistoryStore store(std::make_shared<MemoryHistoryBackend>(), 3);

    for (int i = 0; i < 5; ++i) {
        store.append("alice@okbank", entryAt(1000 + i, i));
    }

    const HistoryWindow w = store.snapshot("alice@okbank");
    BOOST_REQUIRE_EQUAL(w.size(), 3u);
    BOOST_CHECK_EQUAL(w[0].timestamp, 1002);
    BOOST_CHECK_EQUAL(w[2].timestamp, 1004);
}

BOOST_AUTO_TEST_CASE(identities_are_independent)
{
    IdentityHistoryStore store(std::make_shared<MemoryHistoryBackend>(), 5);
    store.append("alice@okbank", entryAt(1));
    store.append("bob@paytm", entryAt(2));
    store.append("bob@paytm", entryAt(3));

    BOOST_CHECK_EQUAL(store.snapshot("alice@okbank").size(), 1u);
    BOOST_CHECK_EQUAL(store.snapshot("bob@paytm").size(), 2u);
    BOOST_CHECK(store.snapshot("carol@ybl").empty());
    BOOST_CHECK_EQUAL(store.identityCount(), 2u);
}

BOOST_AUTO_TEST_CASE(session_snapshot_excludes_own_append)
{
    IdentityHistoryStore store(std::make_shared<MemoryHistoryBackend>(), 5);
    auto s = store.open("alice@okbank");
    const HistoryWindow before = s.snapshot();
    s.append(entryAt(10));
    BOOST_CHECK(before.empty());
    BOOST_CHECK_EQUAL(s.snapshot().size(), 1u);
}

BOOST_AUTO_TEST_CASE(concurrent_sessions_lose_no_updates)
{
    const std::size_t window = 64;
    IdentityHistoryStore store(std::make_shared<MemoryHistoryBackend>(), window);

    const int n = 32;
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.emplace_back([&store, i]() {
            auto s = store.open("alice@okbank");
            const HistoryWindow w = s.snapshot();
            std::this_thread::yield();
            HistoryEntry e = entryAt(1000 + i);
            e.amount = static_cast<double>(w.size());
            s.append(e);
        });
    }
    for (auto& t : threads) t.join();

    const HistoryWindow w = store.snapshot("alice@okbank");
    BOOST_REQUIRE_EQUAL(w.size(), static_cast<std::size_t>(n));

    // Each session saw exactly the appends linearized before it
    for (std::size_t i = 0; i < w.size(); ++i) {
        BOOST_CHECK_EQUAL(w[i].amount, static_cast<double>(i));
    }
}

BOOST_AUTO_TEST_CASE(transient_failure_is_retried)
{
    auto backend = std::make_shared<FlakyBackend>(1, 1);
    IdentityHistoryStore store(backend, 5, 1);

    BOOST_CHECK_NO_THROW(store.append("alice@okbank", entryAt(1)));
    BOOST_CHECK_EQUAL(store.snapshot("alice@okbank").size(), 1u);
}

BOOST_AUTO_TEST_CASE(persistent_failure_surfaces)
{
    auto backend = std::make_shared<FlakyBackend>(2, 0);
    IdentityHistoryStore store(backend, 5, 1);
    BOOST_CHECK_THROW(store.snapshot("alice@okbank"), HistoryStoreError);
}

BOOST_AUTO_TEST_CASE(stats_count_trailing_window)
{
    HistoryWindow w;
    w.push_back(entryAt(1000, 5.0, "a"));
    w.push_back(entryAt(5000, 6.0, "b"));
    w.back().latitude = 10.0;
    w.back().longitude = 20.0;
    w.push_back(entryAt(6000, 7.0, "b"));

    const HistoryStats s = HistoryStats::compute(w, 7000, 3600);
    BOOST_CHECK_EQUAL(s.length, 3u);
    // 1000 is older than 7000 - 3600
    BOOST_CHECK_EQUAL(s.recent_count, 2u);
    BOOST_REQUIRE(s.last_timestamp);
    BOOST_CHECK_EQUAL(*s.last_timestamp, 6000);
    BOOST_CHECK_EQUAL(*s.last_amount, 7.0);
    BOOST_CHECK_EQUAL(s.devices.size(), 2u);

    const HistoryStats empty = HistoryStats::compute({}, 7000, 3600);
    BOOST_CHECK(!empty.last_timestamp);
    BOOST_CHECK_EQUAL(empty.recent_count, 0u);
}

BOOST_AUTO_TEST_SUITE_END()
