/**
 * @file health_aggregator.hpp
 * @brief Liveness, readiness and Prometheus metrics for the daemon.
 *
 * Read-only: the aggregator observes the pool, orchestrator, feature flags,
 * rate limiter and request metrics through the pointers in HealthSources and
 * never mutates them. Dependency probes run in parallel, each on a thread of
 * its own, so that a hung or throwing probe only affects its own entry and
 * never holds up another round or the aggregator's destruction.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "health/feature_flags.hpp"
#include "health/probe.hpp"
#include "orchestrator/orchestrator.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "sandbox/warm_pool.hpp"
#include "telemetry/request_metrics.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <future>
#include <mutex>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandbox_orchestrator {

inline constexpr std::string_view kPrometheusContentType =
    "text/plain; version=0.0.4; charset=utf-8";

/// Broker topics whose consumer lag is reported (label, topic name).
inline constexpr std::array<std::pair<std::string_view, std::string_view>, 3> kConsumerTopics{{
    {"EXECUTION", "agent-execution"},
    {"RESULTS", "execution-results"},
    {"NOTIFICATIONS", "notifications"},
}};

/**
 * @brief Observed state of one dependency after a probe round.
 */
struct ComponentHealth {
    std::string component;
    bool available{false};   ///< Configured at all
    ProbeHealth probe;

    /// Healthy if connected, or if absent (nothing to be unhealthy about).
    [[nodiscard]] bool healthy() const noexcept { return probe.connected || !available; }
};

/**
 * @brief Status code, content type and body of one health endpoint.
 */
struct HealthResponse {
    int status_code{200};
    std::string content_type{"application/json"};
    std::string body;
};

/**
 * @brief Services the aggregator reports on. Null members are omitted.
 */
struct HealthSources {
    const WarmPool* pool = nullptr;
    const ExecutionOrchestrator* orchestrator = nullptr;
    const FeatureFlagService* flags = nullptr;
    const RateLimiter* rate_limiter = nullptr;
    const RequestMetrics* requests = nullptr;
};

class HealthAggregator {
public:
    HealthAggregator(HealthConfig config, HealthSources sources, Logger& logger);

    HealthAggregator(const HealthAggregator&) = delete;
    HealthAggregator& operator=(const HealthAggregator&) = delete;

    // ── Registration (before serving) ────────
    void add_probe(std::shared_ptr<IHealthProbe> probe);
    /// Lag is queried only while the probe named "broker" is available.
    void set_consumer_lag_source(std::shared_ptr<IConsumerLagSource> source);
    /// Without a readiness check the instance always reports ready.
    void set_readiness_check(std::shared_ptr<IReadinessCheck> check);

    // ── Endpoints ────────────────────────────
    /// Full dependency breakdown; 200 when healthy, 503 when degraded.
    [[nodiscard]] HealthResponse liveness();
    /// `{status: ready|not_ready, timestamp, checks:{database}}`; 200 or 503.
    [[nodiscard]] HealthResponse readiness();
    /// Prometheus text exposition.
    [[nodiscard]] HealthResponse metrics();

    /**
     * @brief Run every probe in parallel, each bounded by probe_timeout_ms.
     *
     * A probe whose previous check is still running is not started again;
     * this round waits on that same check instead.
     */
    [[nodiscard]] std::vector<ComponentHealth> check_components();

    /// Liveness payload without the status-code mapping, for tests and logs.
    [[nodiscard]] nlohmann::json liveness_payload();

private:
    std::map<std::string, std::optional<int64_t>> consumer_lag(
        const std::vector<ComponentHealth>& components);
    [[nodiscard]] nlohmann::json memory_json() const;

    HealthConfig config_;
    HealthSources sources_;
    LogContext log_;
    std::chrono::steady_clock::time_point started_at_;

    struct ProbeSlot {
        std::shared_ptr<IHealthProbe> probe;
        std::shared_future<ProbeHealth> last_check;
    };

    std::shared_future<ProbeHealth> start_or_join(ProbeSlot& slot);

    std::vector<ProbeSlot> probes_;
    std::mutex probes_mutex_;
    std::shared_ptr<IConsumerLagSource> lag_source_;
    std::shared_ptr<IReadinessCheck> readiness_;
};

}  // namespace sandbox_orchestrator
