/**
 * @file warm_pool.hpp
 * @brief Bounded pool of pre-initialized sandbox instances.
 *
 * acquire() never blocks and never initializes inline: it hands out an idle
 * instance or nothing. A dedicated replenisher thread (std::jthread) keeps
 * the warm set trending toward max_size, retrying failed initializations
 * with exponential backoff, and recycles instances idle past their TTL.
 *
 * Stats are published as one packed atomic word so that readers never take
 * the pool lock and always observe available <= size <= max_size.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "sandbox/sandbox.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sandbox_orchestrator {

using InstanceHandle = std::shared_ptr<ISandboxInstance>;

/**
 * @brief Point-in-time pool occupancy.
 */
struct PoolStats {
    uint32_t size{0};        ///< Initialized instances, idle or leased
    uint32_t available{0};   ///< Idle instances ready for acquire()
    uint32_t max_size{0};
};

/**
 * @brief Lifetime counters, for metrics and tests.
 */
struct PoolCounters {
    uint64_t acquired{0};
    uint64_t misses{0};          ///< acquire() calls that returned nothing
    uint64_t created{0};
    uint64_t discarded{0};       ///< Unhealthy, failed reset, or worn out
    uint64_t expired{0};         ///< Recycled by the idle TTL sweep
    uint64_t init_failures{0};
};

class WarmPool {
public:
    using AvailabilityCallback = std::function<void()>;

    WarmPool(PoolConfig config, ISandboxFactory& factory, Logger& logger,
             MetricsCollector* metrics = nullptr);
    ~WarmPool();

    WarmPool(const WarmPool&) = delete;
    WarmPool& operator=(const WarmPool&) = delete;

    // ── Lifecycle ────────────────────────────
    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Initialize instances on the calling thread until full or one fails.
    size_t warm_up();

    // ── Checkout / checkin ───────────────────
    [[nodiscard]] InstanceHandle acquire();
    void release(const InstanceHandle& instance, bool healthy);

    // ── Observation ──────────────────────────
    [[nodiscard]] PoolStats stats() const noexcept;
    [[nodiscard]] PoolCounters counters() const;

    /// Invoked (outside the pool lock) whenever an instance becomes idle.
    /// Callbacks must be cheap; they run on the releasing or replenishing thread.
    uint64_t on_available(AvailabilityCallback callback);

    /// Once this returns, the callback is not running and will not run again.
    void remove_available_callback(uint64_t token);

    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

private:
    struct Slot {
        InstanceHandle instance;
        SteadyTime created_at;
        SteadyTime last_used;
        uint32_t uses{0};
    };

    void replenish_loop(std::stop_token stop);
    bool reserve_slot(InstanceId& id);
    bool create_instance(const InstanceId& id);
    void sweep_idle();
    void discard(const InstanceHandle& instance, std::string_view reason);
    void wake_replenisher();
    void notify_available();
    void publish_locked() noexcept;
    [[nodiscard]] std::chrono::milliseconds sweep_interval() const noexcept;

    PoolConfig config_;
    ISandboxFactory& factory_;
    LogContext log_;
    MetricsCollector* metrics_;

    mutable std::mutex mutex_;
    std::deque<Slot> idle_;                              ///< Most recently used at the back
    std::unordered_map<InstanceId, Slot> leased_;
    uint32_t initializing_{0};
    PoolCounters counters_;
    bool wake_pending_{false};
    std::condition_variable_any wake_cv_;

    std::atomic<uint64_t> packed_stats_{0};              ///< size << 32 | available
    std::atomic<uint64_t> next_instance_{1};
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{true};

    std::mutex callback_mutex_;
    uint64_t next_callback_{1};
    std::vector<std::pair<uint64_t, AvailabilityCallback>> callbacks_;

    std::jthread replenisher_;
};

}  // namespace sandbox_orchestrator
