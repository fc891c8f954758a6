/**
 * @file probe.hpp
 * @brief Capability interfaces the health aggregator consumes.
 *
 * Every infrastructure dependency (cache, broker, object storage, database)
 * is seen through the same two calls; the aggregator iterates them without
 * knowing which is which.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_orchestrator {

/**
 * @brief Result of one dependency health check.
 */
struct ProbeHealth {
    bool connected{false};
    std::optional<double> latency_ms;
    std::optional<std::string> error;
};

/**
 * @brief Health probe for one infrastructure dependency.
 */
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    /// Stable component name used in payloads and metric labels.
    [[nodiscard]] virtual std::string_view component() const = 0;

    /// May block up to the probe's own timeout; may throw.
    virtual ProbeHealth health_check() = 0;

    /// False when the dependency is not configured at all.
    [[nodiscard]] virtual bool is_available() const = 0;
};

/**
 * @brief Per-topic consumer lag of the message broker.
 */
class IConsumerLagSource {
public:
    virtual ~IConsumerLagSource() = default;

    /// nullopt when the lag for that topic cannot be determined.
    virtual std::optional<int64_t> consumer_lag(std::string_view topic,
                                                std::string_view group) = 0;
};

/**
 * @brief Narrow "can this instance take traffic" check.
 */
class IReadinessCheck {
public:
    virtual ~IReadinessCheck() = default;

    virtual Result<void> check_ready() = 0;
};

}  // namespace sandbox_orchestrator
