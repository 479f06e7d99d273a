#include <catch2/catch.hpp>
#include "dedup.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace rconbridge;
using Clock = EventDeduplicator::Clock;

TEST_CASE("EventDeduplicator: first sighting passes, repeat is a duplicate", "[dedup]") {
    EventDeduplicator d(600, 100);
    REQUIRE(d.check_and_insert("msg:1"));
    REQUIRE_FALSE(d.check_and_insert("msg:1"));
    REQUIRE(d.check_and_insert("msg:2"));
    REQUIRE(d.size() == 2);
}

TEST_CASE("EventDeduplicator: entries expire after the retention window", "[dedup]") {
    EventDeduplicator d(600, 100);
    auto t0 = Clock::now();
    REQUIRE(d.check_and_insert("msg:1", t0));
    REQUIRE_FALSE(d.check_and_insert("msg:1", t0 + std::chrono::seconds(600)));
    REQUIRE(d.check_and_insert("msg:1", t0 + std::chrono::seconds(601)));
    // Refreshed by the last insert
    REQUIRE_FALSE(d.check_and_insert("msg:1", t0 + std::chrono::seconds(700)));
}

TEST_CASE("EventDeduplicator: expired entries are evicted on insert", "[dedup]") {
    EventDeduplicator d(10, 100);
    auto t0 = Clock::now();
    d.check_and_insert("a", t0);
    d.check_and_insert("b", t0);
    d.check_and_insert("c", t0 + std::chrono::seconds(11));
    REQUIRE(d.size() == 1);
}

TEST_CASE("EventDeduplicator: size cap evicts the oldest", "[dedup]") {
    EventDeduplicator d(600, 3);
    auto t0 = Clock::now();
    d.check_and_insert("a", t0);
    d.check_and_insert("b", t0 + std::chrono::seconds(1));
    d.check_and_insert("c", t0 + std::chrono::seconds(2));
    d.check_and_insert("d", t0 + std::chrono::seconds(3));

    REQUIRE(d.size() == 3);
    // "a" was dropped, so it is new again; "d" is still remembered
    REQUIRE_FALSE(d.check_and_insert("d", t0 + std::chrono::seconds(4)));
    REQUIRE(d.check_and_insert("a", t0 + std::chrono::seconds(4)));
}

TEST_CASE("EventDeduplicator: the cap follows insertion order after forget and refresh", "[dedup]") {
    EventDeduplicator d(10, 2);
    auto t0 = Clock::now();
    auto at = [&](int s) { return t0 + std::chrono::seconds(s); };

    REQUIRE(d.check_and_insert("a", at(0)));
    REQUIRE(d.check_and_insert("b", at(1)));
    REQUIRE(d.forget("a"));
    REQUIRE(d.check_and_insert("c", at(2)));
    // "a" is gone already, so nothing live had to make room
    REQUIRE(d.size() == 2);
    REQUIRE_FALSE(d.check_and_insert("b", at(3)));

    // "b" expires and is re-recorded as the newest entry; "c" expires too
    REQUIRE(d.check_and_insert("b", at(13)));
    REQUIRE(d.size() == 1);
    REQUIRE(d.check_and_insert("e", at(14)));
    REQUIRE(d.check_and_insert("f", at(15)));
    // Cap of two drops the refreshed "b", the oldest live entry
    REQUIRE(d.size() == 2);
    REQUIRE_FALSE(d.check_and_insert("e", at(15)));
    REQUIRE(d.check_and_insert("b", at(16)));
}

TEST_CASE("EventDeduplicator: many forgotten entries do not pile up", "[dedup]") {
    EventDeduplicator d(600, 5);
    auto t0 = Clock::now();
    REQUIRE(d.check_and_insert("keep", t0));
    for (int i = 0; i < 10000; ++i) {
        std::string fp = "gone:" + std::to_string(i);
        REQUIRE(d.check_and_insert(fp, t0 + std::chrono::milliseconds(i)));
        REQUIRE(d.forget(fp));
    }
    REQUIRE(d.size() == 1);
    REQUIRE_FALSE(d.check_and_insert("keep", t0 + std::chrono::seconds(20)));
}

TEST_CASE("EventDeduplicator: forget allows redelivery", "[dedup]") {
    EventDeduplicator d(600, 100);
    REQUIRE(d.check_and_insert("msg:1"));
    REQUIRE(d.forget("msg:1"));
    REQUIRE_FALSE(d.forget("msg:1"));
    REQUIRE(d.check_and_insert("msg:1"));
}

TEST_CASE("EventDeduplicator: clear empties the set", "[dedup]") {
    EventDeduplicator d(600, 100);
    d.check_and_insert("x");
    d.clear();
    REQUIRE(d.size() == 0);
    REQUIRE(d.check_and_insert("x"));
}

TEST_CASE("EventDeduplicator: concurrent callers, exactly one winner", "[dedup]") {
    EventDeduplicator d(600, 1000);
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int n = 0; n < 50; ++n) {
                if (d.check_and_insert("msg:" + std::to_string(n))) winners++;
            }
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(winners.load() == 50);
}
