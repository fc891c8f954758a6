/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include "core/concepts.hpp"

#include <chrono>
#include <sstream>

namespace sandbox_orchestrator {

namespace {

std::string timestamp_now() {
    return format_iso8601(std::chrono::system_clock::now());
}

}  // namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_execution_event(const ExecutionRecord& record) {
    std::ostringstream oss;
    oss << R"({"event":"execution_state_change")"
        << R"(,"ts":")" << timestamp_now() << "\""
        << R"(,"execution":")" << json_escape(record.id) << "\""
        << R"(,"agent":")" << json_escape(record.agent_id) << "\""
        << R"(,"status":")" << to_string(record.status) << "\""
        << R"(,"attempt":)" << (record.retry_count + 1);
    if (auto ms = record.execution_time_ms()) {
        oss << R"(,"duration_ms":)" << *ms;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_pool_event(const InstanceId& instance,
                                         std::string_view event_type,
                                         std::string_view detail) {
    std::ostringstream oss;
    oss << R"({"event":"pool_)" << event_type << "\""
        << R"(,"ts":")" << timestamp_now() << "\""
        << R"(,"instance":")" << json_escape(instance) << "\"";
    if (!detail.empty()) {
        oss << R"(,"detail":")" << json_escape(detail) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_rate_limited(std::string_view identity, std::string_view route) {
    std::ostringstream oss;
    oss << R"({"event":"rate_limited")"
        << R"(,"ts":")" << timestamp_now() << "\""
        << R"(,"identity":")" << json_escape(identity) << "\""
        << R"(,"route":")" << json_escape(route) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"ts":")" << timestamp_now() << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace sandbox_orchestrator
