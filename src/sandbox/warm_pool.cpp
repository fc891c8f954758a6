/**
 * @file warm_pool.cpp
 * @brief WarmPool implementation.
 */

#include "sandbox/warm_pool.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace sandbox_orchestrator {

namespace {

constexpr uint64_t pack_stats(uint32_t size, uint32_t available) noexcept {
    return (static_cast<uint64_t>(size) << 32) | available;
}

}  // namespace

WarmPool::WarmPool(PoolConfig config, ISandboxFactory& factory, Logger& logger,
                   MetricsCollector* metrics)
    : config_(std::move(config))
    , factory_(factory)
    , log_(logger, "warm_pool")
    , metrics_(metrics) {
    publish_locked();
}

WarmPool::~WarmPool() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void WarmPool::start() {
    if (running_.exchange(true)) return;
    accepting_.store(true);
    replenisher_ = std::jthread([this](std::stop_token stop) { replenish_loop(stop); });
    log_.info("Warm pool started", {{"max_size", std::to_string(config_.max_size)}});
}

void WarmPool::stop() {
    accepting_.store(false);
    if (running_.exchange(false)) {
        replenisher_.request_stop();
        wake_cv_.notify_all();
        if (replenisher_.joinable()) replenisher_.join();
    }

    std::deque<Slot> drained;
    {
        std::lock_guard lock(mutex_);
        drained.swap(idle_);
        publish_locked();
    }
    for (auto& slot : drained) {
        slot.instance->terminate();
    }
    if (!drained.empty()) {
        log_.info("Warm pool stopped", {{"released", std::to_string(drained.size())}});
    }
}

size_t WarmPool::warm_up() {
    size_t created = 0;
    InstanceId id;
    while (accepting_.load() && reserve_slot(id)) {
        if (!create_instance(id)) break;
        ++created;
    }
    return created;
}

// ─────────────────────────────────────────────
// Checkout / checkin
// ─────────────────────────────────────────────

InstanceHandle WarmPool::acquire() {
    InstanceHandle handle;
    {
        std::lock_guard lock(mutex_);
        if (idle_.empty()) {
            ++counters_.misses;
            return nullptr;
        }
        Slot slot = std::move(idle_.back());
        idle_.pop_back();
        handle = slot.instance;
        leased_.emplace(handle->id(), std::move(slot));
        ++counters_.acquired;
        publish_locked();
    }
    return handle;
}

void WarmPool::release(const InstanceHandle& instance, bool healthy) {
    if (!instance) return;

    uint32_t uses = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = leased_.find(instance->id());
        if (it == leased_.end() || it->second.instance != instance) {
            log_.warn("Release of an instance that is not leased", {{"instance", instance->id()}});
            return;
        }
        uses = ++it->second.uses;
    }

    // The slot stays leased (and counted in size) while it is being reset
    std::string reason;
    bool recycle = healthy && accepting_.load();
    if (!healthy) {
        reason = "unhealthy";
    } else if (!accepting_.load()) {
        reason = "pool stopped";
    } else if (config_.max_uses > 0 && uses >= config_.max_uses) {
        recycle = false;
        reason = "max uses reached";
    } else if (auto reset = instance->reset(); !reset) {
        recycle = false;
        reason = "reset failed: " + reset.error().message;
    }

    {
        std::lock_guard lock(mutex_);
        auto it = leased_.find(instance->id());
        if (it != leased_.end()) {
            if (recycle) {
                it->second.last_used = std::chrono::steady_clock::now();
                idle_.push_back(std::move(it->second));
            }
            leased_.erase(it);
        }
        if (!recycle) ++counters_.discarded;
        publish_locked();
    }

    if (recycle) {
        notify_available();
    } else {
        discard(instance, reason);
    }
}

void WarmPool::discard(const InstanceHandle& instance, std::string_view reason) {
    instance->terminate();
    log_.info("Instance discarded", {{"instance", instance->id()}, {"reason", reason}});
    if (metrics_) metrics_->record_pool_event(instance->id(), "instance_discarded", reason);
    wake_replenisher();
}

// ─────────────────────────────────────────────
// Observation
// ─────────────────────────────────────────────

PoolStats WarmPool::stats() const noexcept {
    uint64_t packed = packed_stats_.load(std::memory_order_acquire);
    return PoolStats{
        .size = static_cast<uint32_t>(packed >> 32),
        .available = static_cast<uint32_t>(packed & 0xFFFFFFFFu),
        .max_size = config_.max_size,
    };
}

PoolCounters WarmPool::counters() const {
    std::lock_guard lock(mutex_);
    return counters_;
}

uint64_t WarmPool::on_available(AvailabilityCallback callback) {
    std::lock_guard lock(callback_mutex_);
    uint64_t token = next_callback_++;
    callbacks_.emplace_back(token, std::move(callback));
    return token;
}

void WarmPool::remove_available_callback(uint64_t token) {
    std::lock_guard lock(callback_mutex_);
    std::erase_if(callbacks_, [token](const auto& entry) { return entry.first == token; });
}

void WarmPool::notify_available() {
    // Held while invoking so that removal waits for in-flight callbacks
    std::lock_guard lock(callback_mutex_);
    for (auto& [token, cb] : callbacks_) {
        cb();
    }
}

void WarmPool::publish_locked() noexcept {
    auto size = static_cast<uint32_t>(idle_.size() + leased_.size());
    auto available = static_cast<uint32_t>(idle_.size());
    packed_stats_.store(pack_stats(size, available), std::memory_order_release);
}

// ─────────────────────────────────────────────
// Replenishment
// ─────────────────────────────────────────────

bool WarmPool::reserve_slot(InstanceId& id) {
    std::lock_guard lock(mutex_);
    auto occupied = idle_.size() + leased_.size() + initializing_;
    if (occupied >= config_.max_size) return false;
    ++initializing_;
    id = "sbx-" + std::to_string(next_instance_.fetch_add(1));
    return true;
}

bool WarmPool::create_instance(const InstanceId& id) {
    InstanceHandle instance;
    Result<void> init = Error{ErrorCode::PoolInitFailure, "Factory returned no instance"};
    try {
        instance = factory_.create(id);
        if (instance) init = instance->initialize();
    } catch (const std::exception& e) {
        init = Error{ErrorCode::PoolInitFailure, e.what()};
    }

    if (!init) {
        {
            std::lock_guard lock(mutex_);
            --initializing_;
            ++counters_.init_failures;
        }
        if (instance) instance->terminate();
        log_.warn("Instance initialization failed",
                  {{"code", to_string(ErrorCode::PoolInitFailure)},
                   {"instance", id},
                   {"error", init.error().message}});
        if (metrics_) metrics_->record_pool_event(id, "init_failure", init.error().message);
        return false;
    }

    {
        std::lock_guard lock(mutex_);
        --initializing_;
        auto now = std::chrono::steady_clock::now();
        idle_.push_back(Slot{instance, now, now, 0});
        ++counters_.created;
        publish_locked();
    }
    log_.debug("Instance created", {{"instance", id}});
    if (metrics_) metrics_->record_pool_event(id, "instance_created");
    notify_available();
    return true;
}

void WarmPool::sweep_idle() {
    if (config_.idle_ttl_ms == 0) return;

    auto ttl = std::chrono::milliseconds(config_.idle_ttl_ms);
    auto now = std::chrono::steady_clock::now();
    std::vector<InstanceHandle> expired;
    {
        std::lock_guard lock(mutex_);
        // Oldest idle instances sit at the front
        while (!idle_.empty() && now - idle_.front().last_used >= ttl) {
            expired.push_back(std::move(idle_.front().instance));
            idle_.pop_front();
        }
        if (expired.empty()) return;
        counters_.expired += expired.size();
        publish_locked();
    }

    for (auto& instance : expired) {
        instance->terminate();
        log_.debug("Idle instance expired", {{"instance", instance->id()}});
        if (metrics_) metrics_->record_pool_event(instance->id(), "instance_expired");
    }
}

std::chrono::milliseconds WarmPool::sweep_interval() const noexcept {
    if (config_.idle_ttl_ms == 0) return std::chrono::milliseconds(1000);
    return std::chrono::milliseconds(std::clamp<uint32_t>(config_.idle_ttl_ms / 4, 10, 1000));
}

void WarmPool::wake_replenisher() {
    {
        std::lock_guard lock(mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_all();
}

void WarmPool::replenish_loop(std::stop_token stop) {
    const auto initial = std::chrono::milliseconds(std::max<uint32_t>(1, config_.replenish_backoff_initial_ms));
    const auto ceiling = std::chrono::milliseconds(
        std::max(config_.replenish_backoff_max_ms, config_.replenish_backoff_initial_ms));
    auto backoff = initial;

    while (!stop.stop_requested()) {
        sweep_idle();

        InstanceId id;
        if (reserve_slot(id)) {
            if (create_instance(id)) {
                backoff = initial;
                continue;
            }

            std::unique_lock lock(mutex_);
            wake_cv_.wait_for(lock, stop, backoff, [] { return false; });
            backoff = std::min(backoff * 2, ceiling);
            continue;
        }

        std::unique_lock lock(mutex_);
        wake_cv_.wait_for(lock, stop, sweep_interval(), [this] { return wake_pending_; });
        wake_pending_ = false;
    }
}

}  // namespace sandbox_orchestrator
