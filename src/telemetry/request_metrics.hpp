/**
 * @file request_metrics.hpp
 * @brief Request duration and status statistics per (method, normalized path).
 */

#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sandbox_orchestrator {

/// Upper bounds (ms) of the finite histogram buckets; +Inf is implicit.
inline constexpr std::array<double, 11> kDurationBucketsMs{
    5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

struct EndpointMetrics {
    uint64_t count{0};
    double total_duration_ms{0.0};
    double min_duration_ms{std::numeric_limits<double>::infinity()};
    double max_duration_ms{0.0};
    std::array<uint64_t, kDurationBucketsMs.size()> buckets{};  ///< Non-cumulative
    uint64_t error_count{0};                                     ///< Status >= 400
    std::map<int, uint64_t> status_codes;

    [[nodiscard]] double average_ms() const noexcept {
        return count > 0 ? total_duration_ms / static_cast<double>(count) : 0.0;
    }
    [[nodiscard]] double error_rate() const noexcept {
        return count > 0 ? static_cast<double>(error_count) * 100.0 / static_cast<double>(count) : 0.0;
    }
};

/**
 * @brief Thread-safe collector fed by the API layer after every response.
 */
class RequestMetrics {
public:
    using Key = std::pair<std::string, std::string>;  ///< method, normalized path

    /// Numeric segments become "/:id", UUID segments "/:uuid".
    [[nodiscard]] static std::string normalize_path(std::string_view path);

    void record(std::string_view method, std::string_view path, double duration_ms, int status);

    [[nodiscard]] std::optional<EndpointMetrics> endpoint(std::string_view method,
                                                          std::string_view path) const;
    [[nodiscard]] std::map<Key, EndpointMetrics> snapshot() const;
    void reset();

    /// Prometheus text exposition; empty when nothing was recorded.
    [[nodiscard]] std::string render_prometheus(std::string_view prefix) const;

private:
    mutable std::mutex mutex_;
    std::map<Key, EndpointMetrics> endpoints_;
};

}  // namespace sandbox_orchestrator
