/**
 * @file request_metrics.cpp
 * @brief RequestMetrics implementation.
 */

#include "telemetry/request_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>

namespace sandbox_orchestrator {

namespace {

const std::regex& uuid_segment() {
    static const std::regex re(
        "/[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}(?=/|$)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& numeric_segment() {
    static const std::regex re("/[0-9]+(?=/|$)");
    return re;
}

std::string labels(const RequestMetrics::Key& key) {
    return "method=\"" + key.first + "\",path=\"" + key.second + "\"";
}

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string bound(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

std::string RequestMetrics::normalize_path(std::string_view path) {
    std::string normalized = std::regex_replace(std::string(path), uuid_segment(), "/:uuid");
    return std::regex_replace(normalized, numeric_segment(), "/:id");
}

void RequestMetrics::record(std::string_view method, std::string_view path,
                            double duration_ms, int status) {
    Key key{std::string(method), normalize_path(path)};

    std::lock_guard lock(mutex_);
    auto& m = endpoints_[std::move(key)];
    ++m.count;
    m.total_duration_ms += duration_ms;
    m.min_duration_ms = std::min(m.min_duration_ms, duration_ms);
    m.max_duration_ms = std::max(m.max_duration_ms, duration_ms);
    for (size_t i = 0; i < kDurationBucketsMs.size(); ++i) {
        if (duration_ms <= kDurationBucketsMs[i]) {
            ++m.buckets[i];
            break;
        }
    }
    ++m.status_codes[status];
    if (status >= 400) ++m.error_count;
}

std::optional<EndpointMetrics> RequestMetrics::endpoint(std::string_view method,
                                                        std::string_view path) const {
    Key key{std::string(method), normalize_path(path)};
    std::lock_guard lock(mutex_);
    auto it = endpoints_.find(key);
    if (it == endpoints_.end()) return std::nullopt;
    return it->second;
}

std::map<RequestMetrics::Key, EndpointMetrics> RequestMetrics::snapshot() const {
    std::lock_guard lock(mutex_);
    return endpoints_;
}

void RequestMetrics::reset() {
    std::lock_guard lock(mutex_);
    endpoints_.clear();
}

// ─────────────────────────────────────────────
// Prometheus rendering
// ─────────────────────────────────────────────

std::string RequestMetrics::render_prometheus(std::string_view prefix_view) const {
    auto endpoints = snapshot();
    if (endpoints.empty()) return {};

    const std::string prefix(prefix_view);
    std::ostringstream out;
    auto header = [&](const std::string& name, std::string_view help, std::string_view type) {
        out << "# HELP " << name << ' ' << help << '\n'
            << "# TYPE " << name << ' ' << type << '\n';
    };

    const std::string requests = prefix + "_http_requests_total";
    header(requests, "Total number of HTTP requests", "counter");
    for (const auto& [key, m] : endpoints) {
        out << requests << '{' << labels(key) << "} " << m.count << '\n';
    }

    const std::string duration = prefix + "_http_request_duration_ms";
    header(duration, "HTTP request duration in milliseconds", "histogram");
    for (const auto& [key, m] : endpoints) {
        uint64_t cumulative = 0;
        for (size_t i = 0; i < kDurationBucketsMs.size(); ++i) {
            cumulative += m.buckets[i];
            out << duration << "_bucket{" << labels(key) << ",le=\""
                << bound(kDurationBucketsMs[i]) << "\"} " << cumulative << '\n';
        }
        out << duration << "_bucket{" << labels(key) << ",le=\"+Inf\"} " << m.count << '\n';
        out << duration << "_sum{" << labels(key) << "} " << fixed(m.total_duration_ms, 3) << '\n';
        out << duration << "_count{" << labels(key) << "} " << m.count << '\n';
    }

    const std::string min_name = prefix + "_http_request_duration_min_ms";
    header(min_name, "Minimum HTTP request duration", "gauge");
    for (const auto& [key, m] : endpoints) {
        if (std::isinf(m.min_duration_ms)) continue;
        out << min_name << '{' << labels(key) << "} " << fixed(m.min_duration_ms, 3) << '\n';
    }

    const std::string max_name = prefix + "_http_request_duration_max_ms";
    header(max_name, "Maximum HTTP request duration", "gauge");
    for (const auto& [key, m] : endpoints) {
        out << max_name << '{' << labels(key) << "} " << fixed(m.max_duration_ms, 3) << '\n';
    }

    const std::string avg_name = prefix + "_http_request_duration_avg_ms";
    header(avg_name, "Average HTTP request duration", "gauge");
    for (const auto& [key, m] : endpoints) {
        out << avg_name << '{' << labels(key) << "} " << fixed(m.average_ms(), 3) << '\n';
    }

    const std::string errors = prefix + "_http_errors_total";
    header(errors, "Total number of HTTP errors (4xx and 5xx)", "counter");
    for (const auto& [key, m] : endpoints) {
        out << errors << '{' << labels(key) << "} " << m.error_count << '\n';
    }

    const std::string rate = prefix + "_http_error_rate";
    header(rate, "Error rate as percentage (0-100)", "gauge");
    for (const auto& [key, m] : endpoints) {
        out << rate << '{' << labels(key) << "} " << fixed(m.error_rate(), 2) << '\n';
    }

    const std::string responses = prefix + "_http_responses_total";
    header(responses, "Total HTTP responses by status code", "counter");
    for (const auto& [key, m] : endpoints) {
        for (const auto& [status, count] : m.status_codes) {
            out << responses << '{' << labels(key) << ",status=\"" << status << "\"} "
                << count << '\n';
        }
    }
    return out.str();
}

}  // namespace sandbox_orchestrator
