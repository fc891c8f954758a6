/**
 * @file test_warm_pool.cpp
 * @brief Unit tests for WarmPool with scripted sandbox instances.
 */

#include "sandbox/warm_pool.hpp"
#include "support/fakes.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace sandbox_orchestrator;
using namespace sandbox_orchestrator::testing;

class WarmPoolTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    FakeSandboxFactory factory_;

    static PoolConfig config(uint32_t max_size) {
        PoolConfig cfg;
        cfg.max_size = max_size;
        cfg.max_uses = 0;
        cfg.idle_ttl_ms = 0;
        cfg.replenish_backoff_initial_ms = 5;
        cfg.replenish_backoff_max_ms = 20;
        return cfg;
    }
};

TEST_F(WarmPoolTest, WarmUpFillsToMaxSize) {
    WarmPool pool(config(3), factory_, logger_);
    EXPECT_EQ(pool.warm_up(), 3u);

    auto stats = pool.stats();
    EXPECT_EQ(stats.size, 3u);
    EXPECT_EQ(stats.available, 3u);
    EXPECT_EQ(stats.max_size, 3u);
    EXPECT_EQ(factory_.state().initialized.load(), 3);

    // Already full
    EXPECT_EQ(pool.warm_up(), 0u);
}

TEST_F(WarmPoolTest, WarmUpStopsAtFirstFailure) {
    factory_.fail_next_inits(1);
    WarmPool pool(config(3), factory_, logger_);
    EXPECT_EQ(pool.warm_up(), 0u);
    EXPECT_EQ(pool.counters().init_failures, 1u);
    EXPECT_EQ(pool.stats().size, 0u);
}

TEST_F(WarmPoolTest, AcquireIsNonBlocking) {
    WarmPool pool(config(1), factory_, logger_);
    pool.warm_up();

    auto first = pool.acquire();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(pool.acquire(), nullptr);

    auto stats = pool.stats();
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.available, 0u);
    EXPECT_EQ(pool.counters().misses, 1u);
}

TEST_F(WarmPoolTest, EmptyPoolReturnsNothing) {
    WarmPool pool(config(2), factory_, logger_);
    EXPECT_EQ(pool.acquire(), nullptr);
}

TEST_F(WarmPoolTest, HealthyReleaseResetsAndRecycles) {
    WarmPool pool(config(1), factory_, logger_);
    pool.warm_up();

    auto instance = pool.acquire();
    ASSERT_NE(instance, nullptr);
    pool.release(instance, true);

    EXPECT_EQ(factory_.state().resets.load(), 1);
    EXPECT_EQ(pool.stats().available, 1u);
    EXPECT_EQ(pool.acquire(), instance);
}

TEST_F(WarmPoolTest, UnhealthyReleaseDiscards) {
    WarmPool pool(config(2), factory_, logger_);
    pool.warm_up();

    auto instance = pool.acquire();
    pool.release(instance, false);

    EXPECT_EQ(factory_.state().resets.load(), 0);
    EXPECT_EQ(factory_.state().terminations.load(), 1);
    EXPECT_EQ(pool.counters().discarded, 1u);
    auto stats = pool.stats();
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.available, 1u);
}

TEST_F(WarmPoolTest, FailedResetDiscards) {
    WarmPool pool(config(1), factory_, logger_);
    pool.warm_up();
    factory_.set_fail_reset(true);

    pool.release(pool.acquire(), true);
    EXPECT_EQ(pool.counters().discarded, 1u);
    EXPECT_EQ(pool.stats().size, 0u);
}

TEST_F(WarmPoolTest, WornOutAfterMaxUses) {
    auto cfg = config(1);
    cfg.max_uses = 2;
    WarmPool pool(cfg, factory_, logger_);
    pool.warm_up();

    pool.release(pool.acquire(), true);
    EXPECT_EQ(pool.stats().available, 1u);

    pool.release(pool.acquire(), true);
    EXPECT_EQ(pool.stats().size, 0u);
    EXPECT_EQ(pool.counters().discarded, 1u);
}

TEST_F(WarmPoolTest, ReleaseOfUnknownInstanceIgnored) {
    WarmPool pool(config(1), factory_, logger_);
    pool.warm_up();

    InstanceHandle stranger = std::make_shared<FakeSandbox>("stranger", nullptr);
    pool.release(stranger, true);
    pool.release(nullptr, true);

    auto stats = pool.stats();
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.available, 1u);
}

TEST_F(WarmPoolTest, ReplenisherFillsInBackground) {
    WarmPool pool(config(3), factory_, logger_);
    pool.start();
    EXPECT_TRUE(wait_until([&] { return pool.stats().available == 3; }));
    pool.stop();
}

TEST_F(WarmPoolTest, ReplenisherReplacesDiscardedInstance) {
    WarmPool pool(config(2), factory_, logger_);
    pool.start();
    ASSERT_TRUE(wait_until([&] { return pool.stats().available == 2; }));

    pool.release(pool.acquire(), false);
    EXPECT_TRUE(wait_until([&] { return pool.stats().available == 2; }));
    EXPECT_EQ(factory_.state().created.load(), 3);
    pool.stop();
}

TEST_F(WarmPoolTest, InitFailuresAreRetriedWithBackoff) {
    factory_.fail_next_inits(3);
    WarmPool pool(config(2), factory_, logger_);
    pool.start();

    // acquire() keeps returning nothing instead of surfacing the failures
    EXPECT_EQ(pool.acquire(), nullptr);
    EXPECT_TRUE(wait_until([&] { return pool.stats().available == 2; }));
    EXPECT_EQ(pool.counters().init_failures, 3u);
    EXPECT_EQ(pool.counters().created, 2u);
    pool.stop();
}

TEST_F(WarmPoolTest, IdleInstancesExpire) {
    auto cfg = config(1);
    cfg.idle_ttl_ms = 40;
    WarmPool pool(cfg, factory_, logger_);
    pool.start();

    EXPECT_TRUE(wait_until([&] { return pool.counters().expired >= 1; }));
    // Expired instances are replaced
    EXPECT_TRUE(wait_until([&] { return factory_.state().created.load() >= 2; }));
    pool.stop();
}

TEST_F(WarmPoolTest, AvailabilityCallbackFiresOnRelease) {
    WarmPool pool(config(1), factory_, logger_);
    pool.warm_up();

    std::atomic<int> notified{0};
    auto token = pool.on_available([&] { ++notified; });

    pool.release(pool.acquire(), true);
    EXPECT_EQ(notified.load(), 1);

    pool.remove_available_callback(token);
    pool.release(pool.acquire(), true);
    EXPECT_EQ(notified.load(), 1);
}

TEST_F(WarmPoolTest, StatsStayConsistentUnderContention) {
    WarmPool pool(config(4), factory_, logger_);
    pool.start();
    ASSERT_TRUE(wait_until([&] { return pool.stats().available == 4; }));

    std::atomic<bool> done{false};
    std::atomic<int> violations{0};
    std::jthread observer([&] {
        while (!done.load()) {
            auto s = pool.stats();
            if (s.available > s.size || s.size > s.max_size) ++violations;
        }
    });

    std::vector<std::jthread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&pool, t] {
            for (int i = 0; i < 200; ++i) {
                if (auto instance = pool.acquire()) pool.release(instance, (i + t) % 7 != 0);
            }
        });
    }
    workers.clear();
    done.store(true);
    observer.join();

    EXPECT_EQ(violations.load(), 0);
    pool.stop();
}

TEST_F(WarmPoolTest, StopTerminatesIdleInstances) {
    WarmPool pool(config(2), factory_, logger_);
    pool.warm_up();
    pool.stop();

    EXPECT_EQ(factory_.state().terminations.load(), 2);
    EXPECT_EQ(pool.stats().available, 0u);
}
