/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace sandbox_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_execution_event(const ExecutionRecord& record);
    void record_pool_event(const InstanceId& instance, std::string_view event_type,
                           std::string_view detail = {});
    void record_rate_limited(std::string_view identity, std::string_view route);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace sandbox_orchestrator
