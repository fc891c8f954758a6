/**
 * @file rate_limiter.hpp
 * @brief Sharded fixed-window rate limiter keyed by (identity, route).
 *
 * Template-parameterized on the clock (ClockLike) so tests drive windows
 * with a ManualClock; production uses SystemClock.
 */

#pragma once

#include "core/concepts.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sandbox_orchestrator {

/**
 * @brief Window length, quota, and rejection message for one route category.
 */
struct RateLimitRule {
    uint32_t window_ms{60000};
    uint32_t max_requests{100};
    std::string message{"Too many requests, please try again later"};
};

/**
 * @brief Outcome of one check; always carries the header values.
 */
struct RateLimitDecision {
    bool allowed{true};
    uint32_t limit{0};
    uint32_t remaining{0};
    int64_t reset_at_ms{0};      ///< Epoch ms at which the current window ends
    uint32_t retry_after_s{0};   ///< Set when rejected
    std::string message;         ///< Set when rejected
};

template <ClockLike ClockT = SystemClock>
class BasicRateLimiter {
public:
    static constexpr size_t kShardCount = 16;

    explicit BasicRateLimiter(ClockT clock = ClockT{}) : clock_(std::move(clock)) {}

    BasicRateLimiter(const BasicRateLimiter&) = delete;
    BasicRateLimiter& operator=(const BasicRateLimiter&) = delete;

    /**
     * @brief Count one request for (identity, route) against @p rule.
     *
     * A key whose window is missing or expired (now - start >= window)
     * starts a fresh window with count 1. Otherwise the count is
     * incremented and the request is rejected once it exceeds the quota.
     */
    RateLimitDecision check(std::string_view identity, std::string_view route,
                            const RateLimitRule& rule);

    /// Drop counters whose window has expired. Returns how many were removed.
    size_t purge_expired();

    void set_enabled(bool enabled) noexcept { enabled_.store(enabled); }
    [[nodiscard]] bool enabled() const noexcept { return enabled_.load(); }

    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t rejections(std::string_view route) const;
    [[nodiscard]] std::map<std::string, uint64_t> rejection_counts() const;

    [[nodiscard]] const ClockT& clock() const noexcept { return clock_; }

private:
    struct Counter {
        int64_t window_start_ms{0};
        uint32_t window_ms{0};
        uint32_t count{0};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Counter> counters;
    };

    Shard& shard_for(const std::string& key) {
        return shards_[std::hash<std::string>{}(key) % kShardCount];
    }

    void count_rejection(std::string_view route);

    ClockT clock_;
    std::array<Shard, kShardCount> shards_;
    std::atomic<bool> enabled_{true};

    mutable std::mutex rejections_mutex_;
    std::map<std::string, uint64_t, std::less<>> rejections_;
};

using RateLimiter = BasicRateLimiter<SystemClock>;

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ClockLike ClockT>
RateLimitDecision BasicRateLimiter<ClockT>::check(std::string_view identity,
                                                  std::string_view route,
                                                  const RateLimitRule& rule) {
    const int64_t now = clock_.now_ms();

    RateLimitDecision decision;
    decision.limit = rule.max_requests;

    if (!enabled_.load()) {
        decision.remaining = rule.max_requests;
        decision.reset_at_ms = now + rule.window_ms;
        return decision;
    }

    std::string key;
    key.reserve(identity.size() + route.size() + 1);
    key.append(identity).append(":").append(route);

    uint32_t count = 0;
    int64_t window_start = 0;
    {
        auto& shard = shard_for(key);
        std::lock_guard lock(shard.mutex);
        auto [it, inserted] = shard.counters.try_emplace(std::move(key));
        auto& counter = it->second;
        if (inserted || now - counter.window_start_ms >= counter.window_ms) {
            counter = Counter{now, rule.window_ms, 1};
        } else {
            ++counter.count;
        }
        count = counter.count;
        window_start = counter.window_start_ms;
    }

    decision.remaining = count >= rule.max_requests ? 0 : rule.max_requests - count;
    decision.reset_at_ms = window_start + rule.window_ms;

    if (count > rule.max_requests) {
        decision.allowed = false;
        const int64_t left_ms = std::max<int64_t>(0, decision.reset_at_ms - now);
        decision.retry_after_s = static_cast<uint32_t>((left_ms + 999) / 1000);
        decision.message = rule.message;
        count_rejection(route);
    }
    return decision;
}

template <ClockLike ClockT>
size_t BasicRateLimiter<ClockT>::purge_expired() {
    const int64_t now = clock_.now_ms();
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        removed += std::erase_if(shard.counters, [now](const auto& item) {
            return now - item.second.window_start_ms >= item.second.window_ms;
        });
    }
    return removed;
}

template <ClockLike ClockT>
size_t BasicRateLimiter<ClockT>::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        total += shard.counters.size();
    }
    return total;
}

template <ClockLike ClockT>
void BasicRateLimiter<ClockT>::count_rejection(std::string_view route) {
    std::lock_guard lock(rejections_mutex_);
    auto it = rejections_.find(route);
    if (it == rejections_.end()) {
        rejections_.emplace(std::string{route}, 1);
    } else {
        ++it->second;
    }
}

template <ClockLike ClockT>
uint64_t BasicRateLimiter<ClockT>::rejections(std::string_view route) const {
    std::lock_guard lock(rejections_mutex_);
    auto it = rejections_.find(route);
    return it == rejections_.end() ? 0 : it->second;
}

template <ClockLike ClockT>
std::map<std::string, uint64_t> BasicRateLimiter<ClockT>::rejection_counts() const {
    std::lock_guard lock(rejections_mutex_);
    return {rejections_.begin(), rejections_.end()};
}

}  // namespace sandbox_orchestrator
