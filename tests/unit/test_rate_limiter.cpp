/**
 * @file test_rate_limiter.cpp
 * @brief Tests for the fixed-window limiter, presets and identity resolution.
 */

#include "ratelimit/rate_limit_policy.hpp"
#include "ratelimit/rate_limiter.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace sandbox_orchestrator;

namespace {

RateLimitRule rule(uint32_t window_ms, uint32_t max_requests) {
    return RateLimitRule{window_ms, max_requests, "slow down"};
}

}  // namespace

// ═══════════════════════════════════════════════
// Fixed window
// ═══════════════════════════════════════════════

TEST(RateLimiter, AllowsUpToQuotaThenRejects) {
    ManualClock clock(1'000'000);
    BasicRateLimiter<ManualClock> limiter(clock);
    auto r = rule(60000, 3);

    for (uint32_t i = 1; i <= 3; ++i) {
        auto decision = limiter.check("alice", "api", r);
        EXPECT_TRUE(decision.allowed) << "request " << i;
        EXPECT_EQ(decision.limit, 3u);
        EXPECT_EQ(decision.remaining, 3u - i);
        EXPECT_EQ(decision.reset_at_ms, 1'060'000);
    }

    clock.advance(15000);
    auto rejected = limiter.check("alice", "api", r);
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.remaining, 0u);
    EXPECT_EQ(rejected.retry_after_s, 45u);
    EXPECT_EQ(rejected.message, "slow down");
    EXPECT_EQ(limiter.rejections("api"), 1u);
}

TEST(RateLimiter, RetryAfterRoundsUp) {
    ManualClock clock(0);
    BasicRateLimiter<ManualClock> limiter(clock);
    auto r = rule(10000, 1);

    limiter.check("bob", "ai", r);
    clock.advance(8500);
    auto rejected = limiter.check("bob", "ai", r);
    ASSERT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.retry_after_s, 2u);
}

TEST(RateLimiter, WindowResetsAtBoundary) {
    ManualClock clock(0);
    BasicRateLimiter<ManualClock> limiter(clock);
    auto r = rule(1000, 1);

    EXPECT_TRUE(limiter.check("carol", "api", r).allowed);
    clock.advance(999);
    EXPECT_FALSE(limiter.check("carol", "api", r).allowed);
    clock.advance(1);
    auto fresh = limiter.check("carol", "api", r);
    EXPECT_TRUE(fresh.allowed);
    EXPECT_EQ(fresh.remaining, 0u);
    EXPECT_EQ(fresh.reset_at_ms, 2000);
}

TEST(RateLimiter, RoutesAndIdentitiesCountedIndependently) {
    ManualClock clock(0);
    BasicRateLimiter<ManualClock> limiter(clock);
    auto r = rule(60000, 1);

    EXPECT_TRUE(limiter.check("dave", "api", r).allowed);
    EXPECT_TRUE(limiter.check("dave", "ai", r).allowed);
    EXPECT_TRUE(limiter.check("erin", "api", r).allowed);
    EXPECT_FALSE(limiter.check("dave", "api", r).allowed);
    EXPECT_EQ(limiter.size(), 3u);
}

TEST(RateLimiter, DisabledAlwaysAllowsAndKeepsNoState) {
    ManualClock clock(0);
    BasicRateLimiter<ManualClock> limiter(clock);
    limiter.set_enabled(false);
    auto r = rule(60000, 1);

    for (int i = 0; i < 5; ++i) {
        auto decision = limiter.check("frank", "api", r);
        EXPECT_TRUE(decision.allowed);
        EXPECT_EQ(decision.remaining, 1u);
    }
    EXPECT_EQ(limiter.size(), 0u);
    EXPECT_FALSE(limiter.enabled());
}

TEST(RateLimiter, PurgeDropsOnlyExpiredWindows) {
    ManualClock clock(0);
    BasicRateLimiter<ManualClock> limiter(clock);

    limiter.check("short", "api", rule(1000, 5));
    limiter.check("long", "api", rule(60000, 5));
    clock.advance(5000);

    EXPECT_EQ(limiter.purge_expired(), 1u);
    EXPECT_EQ(limiter.size(), 1u);
}

TEST(RateLimiter, RejectionCountsPerRoute) {
    ManualClock clock(0);
    BasicRateLimiter<ManualClock> limiter(clock);
    auto r = rule(60000, 1);

    limiter.check("x", "api", r);
    limiter.check("x", "api", r);
    limiter.check("x", "api", r);
    limiter.check("x", "ai", r);
    limiter.check("x", "ai", r);

    auto counts = limiter.rejection_counts();
    EXPECT_EQ(counts["api"], 2u);
    EXPECT_EQ(counts["ai"], 1u);
    EXPECT_EQ(limiter.rejections("payment"), 0u);
}

TEST(RateLimiter, ConcurrentChecksNeverExceedQuota) {
    ManualClock clock(0);
    BasicRateLimiter<ManualClock> limiter(clock);
    auto r = rule(60000, 50);

    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                if (limiter.check("shared", "ai", r).allowed) ++allowed;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(allowed.load(), 50);
    EXPECT_EQ(limiter.rejections("ai"), 150u);
}

// ═══════════════════════════════════════════════
// Presets
// ═══════════════════════════════════════════════

TEST(RateLimitPolicy, BuiltInPresets) {
    RateLimitPolicy policy;
    EXPECT_TRUE(policy.enabled());

    EXPECT_EQ(policy.rule(RouteCategory::GeneralApi).window_ms, 60000u);
    EXPECT_EQ(policy.rule(RouteCategory::GeneralApi).max_requests, 100u);
    EXPECT_EQ(policy.rule(RouteCategory::Authentication).window_ms, 15u * 60 * 1000);
    EXPECT_EQ(policy.rule(RouteCategory::Authentication).max_requests, 10u);
    EXPECT_EQ(policy.rule(RouteCategory::CredentialAccess).max_requests, 5u);
    EXPECT_EQ(policy.rule(RouteCategory::SandboxExecution).max_requests, 20u);
    EXPECT_EQ(policy.rule(RouteCategory::Billing).max_requests, 10u);
    EXPECT_FALSE(policy.rule(RouteCategory::SandboxExecution).message.empty());
}

TEST(RateLimitPolicy, CategoryNames) {
    EXPECT_EQ(to_string(RouteCategory::SandboxExecution), "ai");
    EXPECT_EQ(parse_route_category("payment"), RouteCategory::Billing);
    EXPECT_EQ(parse_route_category("stripe"), RouteCategory::Billing);
    EXPECT_EQ(parse_route_category("credential"), RouteCategory::CredentialAccess);
    EXPECT_FALSE(parse_route_category("graphql").has_value());
}

TEST(RateLimitPolicy, ConfigOverridesApplyPerField) {
    RateLimitConfig config;
    config.presets["ai"].max_requests = 3;
    config.presets["auth"].message = "nope";

    auto policy = RateLimitPolicy::from_config(config);
    ASSERT_TRUE(policy.has_value()) << policy.error().message;
    EXPECT_EQ(policy->rule(RouteCategory::SandboxExecution).max_requests, 3u);
    EXPECT_EQ(policy->rule(RouteCategory::SandboxExecution).window_ms, 60000u);
    EXPECT_EQ(policy->rule(RouteCategory::Authentication).message, "nope");
    EXPECT_EQ(policy->rule(RouteCategory::Authentication).max_requests, 10u);
}

TEST(RateLimitPolicy, RejectsUnknownOrZeroPresets) {
    RateLimitConfig unknown;
    unknown.presets["graphql"].max_requests = 1;
    auto bad_name = RateLimitPolicy::from_config(unknown);
    ASSERT_FALSE(bad_name.has_value());
    EXPECT_EQ(bad_name.error().code, ErrorCode::InvalidArgument);

    RateLimitConfig zero;
    zero.presets["api"].window_ms = 0;
    EXPECT_FALSE(RateLimitPolicy::from_config(zero).has_value());
}

TEST(RateLimitPolicy, DisabledFlagCarriesOver) {
    RateLimitConfig config;
    config.enabled = false;
    auto policy = RateLimitPolicy::from_config(config);
    ASSERT_TRUE(policy.has_value());
    EXPECT_FALSE(policy->enabled());
}

// ═══════════════════════════════════════════════
// Identity
// ═══════════════════════════════════════════════

TEST(ResolveIdentity, PrefersSessionThenTokenThenAddress) {
    RequestIdentity identity;
    EXPECT_EQ(resolve_identity(identity), "anonymous");

    identity.remote_address = "10.0.0.7";
    EXPECT_EQ(resolve_identity(identity), "10.0.0.7");

    identity.token_subject = "token-user";
    EXPECT_EQ(resolve_identity(identity), "token-user");

    identity.session_user = "session-user";
    EXPECT_EQ(resolve_identity(identity), "session-user");
}

TEST(ResolveIdentity, EmptyValuesCountAsAbsent) {
    RequestIdentity identity;
    identity.session_user = "";
    identity.token_subject = "";
    identity.remote_address = "192.168.1.1";
    EXPECT_EQ(resolve_identity(identity), "192.168.1.1");
}
