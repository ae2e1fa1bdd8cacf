#include <catch2/catch_test_macros.hpp>
#include "security/denial_cache.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace rbagate;
using namespace std::chrono_literals;

TEST_CASE("DenialCache: unknown principal is not denied", "[denial_cache]") {
    DenialCache cache;
    CHECK_FALSE(cache.is_currently_denied("alice"));
    CHECK(cache.size() == 0);
    CHECK(cache.ttl() == 3600s);
}

TEST_CASE("DenialCache: denial is live for just under one hour", "[denial_cache]") {
    DenialCache cache;
    const auto t0 = DenialCache::Clock::now();
    cache.record_denial("alice", t0);

    CHECK(cache.is_currently_denied("alice", t0));
    CHECK(cache.is_currently_denied("alice", t0 + 10min));
    CHECK(cache.is_currently_denied("alice", t0 + 59min + 59s));
    CHECK(cache.is_currently_denied("alice", t0 + 1h - 1ns));
    CHECK(cache.size() == 1);
    CHECK(cache.total_blocks() == 4);
}

TEST_CASE("DenialCache: denial expires at exactly one hour and is evicted", "[denial_cache]") {
    DenialCache cache;
    const auto t0 = DenialCache::Clock::now();
    cache.record_denial("alice", t0);

    CHECK_FALSE(cache.is_currently_denied("alice", t0 + 1h));
    CHECK(cache.size() == 0);
    CHECK_FALSE(cache.last_denial("alice").has_value());
    CHECK(cache.total_expired() == 1);
}

TEST_CASE("DenialCache: stale record is evicted on lookup past expiry", "[denial_cache]") {
    DenialCache cache;
    const auto now = DenialCache::Clock::now();
    cache.record_denial("alice", now - 61min);

    // Not yet looked up: the record is still held
    CHECK(cache.last_denial("alice").has_value());

    CHECK_FALSE(cache.is_currently_denied("alice", now));
    CHECK_FALSE(cache.last_denial("alice").has_value());
}

TEST_CASE("DenialCache: clear removes the record immediately", "[denial_cache]") {
    DenialCache cache;
    const auto t0 = DenialCache::Clock::now();
    cache.record_denial("alice", t0);
    cache.record_denial("bob", t0);

    cache.clear("alice");
    CHECK_FALSE(cache.is_currently_denied("alice", t0));
    CHECK(cache.is_currently_denied("bob", t0));

    // Clearing an unknown principal is a no-op
    cache.clear("nobody");
    CHECK(cache.size() == 1);
}

TEST_CASE("DenialCache: principals are case-sensitive", "[denial_cache]") {
    DenialCache cache;
    cache.record_denial("Alice");
    CHECK(cache.is_currently_denied("Alice"));
    CHECK_FALSE(cache.is_currently_denied("alice"));
}

TEST_CASE("DenialCache: repeated denial refreshes the timestamp", "[denial_cache]") {
    DenialCache cache;
    const auto t0 = DenialCache::Clock::now();
    cache.record_denial("alice", t0);
    cache.record_denial("alice", t0 + 50min);

    CHECK(cache.is_currently_denied("alice", t0 + 90min));
    CHECK_FALSE(cache.is_currently_denied("alice", t0 + 110min));
    CHECK(cache.total_denials() == 2);
}

TEST_CASE("DenialCache: older timestamp never overwrites a newer one", "[denial_cache]") {
    DenialCache cache;
    const auto t0 = DenialCache::Clock::now();
    cache.record_denial("alice", t0 + 30min);
    cache.record_denial("alice", t0);

    REQUIRE(cache.last_denial("alice").has_value());
    CHECK(*cache.last_denial("alice") == t0 + 30min);
}

TEST_CASE("DenialCache: custom TTL", "[denial_cache]") {
    DenialCache::Config cfg;
    cfg.ttl = 30s;
    DenialCache cache(cfg);

    const auto t0 = DenialCache::Clock::now();
    cache.record_denial("alice", t0);
    CHECK(cache.is_currently_denied("alice", t0 + 29s));
    CHECK_FALSE(cache.is_currently_denied("alice", t0 + 30s));
}

TEST_CASE("DenialCache: purge_expired removes only expired records", "[denial_cache]") {
    DenialCache cache;
    const auto now = DenialCache::Clock::now();
    cache.record_denial("old-1", now - 2h);
    cache.record_denial("old-2", now - 1h);
    cache.record_denial("fresh", now - 5min);

    CHECK(cache.purge_expired(now) == 2);
    CHECK(cache.size() == 1);
    CHECK(cache.is_currently_denied("fresh", now));
    CHECK(cache.purge_expired(now) == 0);
}

TEST_CASE("DenialCache: empty principal is a valid key", "[denial_cache]") {
    DenialCache cache;
    cache.record_denial("");
    CHECK(cache.is_currently_denied(""));
    cache.clear("");
    CHECK_FALSE(cache.is_currently_denied(""));
}

TEST_CASE("DenialCache: concurrent record and lookup", "[denial_cache][concurrency]") {
    DenialCache cache;
    constexpr int kThreads = 8;
    constexpr int kIterations = 5000;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&cache, t] {
            const std::string own = "user-" + std::to_string(t);
            for (int i = 0; i < kIterations; ++i) {
                cache.record_denial("shared");
                (void)cache.is_currently_denied("shared");
                cache.record_denial(own);
                if (i % 3 == 0) cache.clear(own);
                (void)cache.is_currently_denied(own);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(cache.is_currently_denied("shared"));
    CHECK(cache.size() <= kThreads + 1);
    CHECK(cache.total_denials() == static_cast<uint64_t>(2 * kThreads * kIterations));
}

TEST_CASE("DenialCache: renewal racing an expiring lookup is never lost", "[denial_cache][concurrency]") {
    // Readers observe the record as expired while writers keep renewing it.
    // After every writer has finished, the last renewal must still be live.
    constexpr int kRounds = 200;
    constexpr int kReaders = 4;

    for (int round = 0; round < kRounds; ++round) {
        DenialCache cache;
        const auto base = DenialCache::Clock::now();
        cache.record_denial("alice", base - 2h);

        std::atomic<bool> go{false};
        std::vector<std::thread> readers;
        for (int r = 0; r < kReaders; ++r) {
            readers.emplace_back([&] {
                while (!go.load()) {}
                for (int i = 0; i < 50; ++i) {
                    (void)cache.is_currently_denied("alice", base);
                }
            });
        }
        std::thread writer([&] {
            while (!go.load()) {}
            for (int i = 0; i < 50; ++i) {
                cache.record_denial("alice", base);
            }
        });

        go.store(true);
        writer.join();
        for (auto& th : readers) th.join();

        INFO("round " << round);
        REQUIRE(cache.is_currently_denied("alice", base));
    }
}
