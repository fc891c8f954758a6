/**
 * @file health_aggregator.cpp
 * @brief HealthAggregator implementation.
 */

#include "health/health_aggregator.hpp"

#include "core/concepts.hpp"
#include "resource_monitor/process_monitor.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <sstream>
#include <system_error>
#include <thread>

namespace sandbox_orchestrator {

namespace {

/**
 * @brief Start one probe check on a detached thread.
 *
 * The thread owns the probe and the promise, so a probe that never returns
 * pins nothing but itself.
 */
std::future<ProbeHealth> launch_check(std::shared_ptr<IHealthProbe> probe) {
    std::promise<ProbeHealth> promise;
    auto future = promise.get_future();
    std::thread([probe = std::move(probe), promise = std::move(promise)]() mutable {
        try {
            promise.set_value(probe->health_check());
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }).detach();
    return future;
}

nlohmann::json probe_json(const ComponentHealth& component) {
    nlohmann::json j{
        {"available", component.available},
        {"connected", component.probe.connected},
        {"healthy", component.healthy()},
    };
    if (component.probe.latency_ms) j["latencyMs"] = *component.probe.latency_ms;
    if (component.probe.error) j["error"] = *component.probe.error;
    return j;
}

nlohmann::json orchestrator_json(const OrchestratorStats& stats) {
    return {
        {"total", stats.total},
        {"queued", stats.queued},
        {"initializing", stats.initializing},
        {"running", stats.running},
        {"completed", stats.completed},
        {"failed", stats.failed},
        {"timeout", stats.timed_out},
        {"cancelled", stats.cancelled},
        {"queueDepth", stats.queue_depth},
    };
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

HealthAggregator::HealthAggregator(HealthConfig config, HealthSources sources, Logger& logger)
    : config_(std::move(config))
    , sources_(sources)
    , log_(logger, "health")
    , started_at_(std::chrono::steady_clock::now()) {}

void HealthAggregator::add_probe(std::shared_ptr<IHealthProbe> probe) {
    if (!probe) return;
    std::lock_guard lock(probes_mutex_);
    probes_.push_back(ProbeSlot{std::move(probe), {}});
}

void HealthAggregator::set_consumer_lag_source(std::shared_ptr<IConsumerLagSource> source) {
    lag_source_ = std::move(source);
}

void HealthAggregator::set_readiness_check(std::shared_ptr<IReadinessCheck> check) {
    readiness_ = std::move(check);
}

// ─────────────────────────────────────────────
// Probing
// ─────────────────────────────────────────────

std::shared_future<ProbeHealth> HealthAggregator::start_or_join(ProbeSlot& slot) {
    using namespace std::chrono_literals;
    if (slot.last_check.valid() && slot.last_check.wait_for(0ms) != std::future_status::ready) {
        return slot.last_check;
    }
    slot.last_check = launch_check(slot.probe).share();
    return slot.last_check;
}

std::vector<ComponentHealth> HealthAggregator::check_components() {
    struct Pending {
        ComponentHealth health;
        std::shared_future<ProbeHealth> future;
    };

    std::vector<Pending> pending;
    {
        std::lock_guard lock(probes_mutex_);
        pending.reserve(probes_.size());
        for (auto& slot : probes_) {
            Pending p;
            p.health.component = std::string(slot.probe->component());
            p.health.available = slot.probe->is_available();
            if (p.health.available) {
                try {
                    p.future = start_or_join(slot);
                } catch (const std::system_error& e) {
                    p.health.probe.error = std::string("Cannot start health check: ") + e.what();
                    log_.error("Probe thread failed to start",
                               {{"component", p.health.component}, {"error", e.what()}});
                }
            }
            pending.push_back(std::move(p));
        }
    }

    const auto deadline = std::chrono::steady_clock::now()
                        + std::chrono::milliseconds(config_.probe_timeout_ms);

    std::vector<ComponentHealth> result;
    result.reserve(pending.size());
    for (auto& p : pending) {
        if (p.future.valid()) {
            if (p.future.wait_until(deadline) != std::future_status::ready) {
                p.health.probe.error = "Health check timed out after "
                                     + std::to_string(config_.probe_timeout_ms) + " ms";
                log_.warn("Probe timed out", {{"component", p.health.component}});
            } else {
                try {
                    p.health.probe = p.future.get();
                } catch (const std::exception& e) {
                    p.health.probe = ProbeHealth{false, std::nullopt, std::string(e.what())};
                    log_.warn("Probe threw", {{"component", p.health.component},
                                              {"error", e.what()}});
                }
            }
        }
        result.push_back(std::move(p.health));
    }
    return result;
}

std::map<std::string, std::optional<int64_t>> HealthAggregator::consumer_lag(
    const std::vector<ComponentHealth>& components) {
    std::map<std::string, std::optional<int64_t>> lag;
    if (!lag_source_) return lag;

    auto broker = std::find_if(components.begin(), components.end(),
                               [](const ComponentHealth& c) { return c.component == "broker"; });
    if (broker == components.end() || !broker->available) return lag;

    for (const auto& [label, topic] : kConsumerTopics) {
        try {
            lag[std::string(label)] = lag_source_->consumer_lag(topic, config_.consumer_group);
        } catch (const std::exception& e) {
            lag[std::string(label)] = std::nullopt;
            log_.warn("Consumer lag query failed", {{"topic", topic}, {"error", e.what()}});
        }
    }
    return lag;
}

nlohmann::json HealthAggregator::memory_json() const {
    auto memory = read_process_memory();
    if (!memory) {
        return {{"error", memory.error().message}};
    }
    constexpr uint64_t kMiB = 1024 * 1024;
    return {
        {"rssMB", memory->rss_bytes / kMiB},
        {"virtualMB", memory->virtual_bytes / kMiB},
        {"peakRssMB", memory->peak_rss_bytes / kMiB},
    };
}

// ─────────────────────────────────────────────
// Liveness
// ─────────────────────────────────────────────

nlohmann::json HealthAggregator::liveness_payload() {
    auto components = check_components();
    bool healthy = std::all_of(components.begin(), components.end(),
                               [](const ComponentHealth& c) { return c.healthy(); });

    auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_);

    nlohmann::json body{
        {"status", healthy ? "healthy" : "degraded"},
        {"timestamp", format_iso8601(std::chrono::system_clock::now())},
        {"uptime", uptime.count()},
        {"version", std::string(kServiceVersion)},
        {"memory", memory_json()},
    };

    nlohmann::json services = nlohmann::json::object();
    for (const auto& component : components) {
        services[component.component] = probe_json(component);
    }
    body["services"] = std::move(services);

    if (sources_.pool) {
        auto stats = sources_.pool->stats();
        body["sandboxPool"] = {
            {"size", stats.size}, {"available", stats.available}, {"maxSize", stats.max_size}};
    }
    if (sources_.orchestrator) {
        body["executions"] = orchestrator_json(sources_.orchestrator->stats());
    }
    if (sources_.flags) {
        nlohmann::json flags = nlohmann::json::object();
        for (const auto& [name, flag] : sources_.flags->snapshot()) {
            flags[name] = {
                {"enabled", flag.enabled},
                {"rolloutPercentage", flag.rollout_percentage},
                {"description", flag.description},
                {"overrideCount", flag.override_count},
            };
        }
        body["featureFlags"] = std::move(flags);
    }
    if (sources_.rate_limiter) {
        body["rateLimiter"] = {{"enabled", sources_.rate_limiter->enabled()},
                               {"trackedKeys", sources_.rate_limiter->size()}};
    }

    auto lag = consumer_lag(components);
    if (!lag.empty()) {
        nlohmann::json lag_json = nlohmann::json::object();
        for (const auto& [label, value] : lag) {
            lag_json[label] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
        }
        body["consumerLag"] = std::move(lag_json);
    }
    return body;
}

HealthResponse HealthAggregator::liveness() {
    auto body = liveness_payload();
    bool healthy = body["status"] == "healthy";
    if (!healthy) {
        log_.warn("Liveness degraded");
    }
    return HealthResponse{healthy ? 200 : 503, "application/json", body.dump()};
}

// ─────────────────────────────────────────────
// Readiness
// ─────────────────────────────────────────────

HealthResponse HealthAggregator::readiness() {
    bool database_ready = true;
    std::optional<std::string> error;

    if (readiness_) {
        try {
            auto check = readiness_->check_ready();
            if (!check) {
                database_ready = false;
                error = check.error().message;
            }
        } catch (const std::exception& e) {
            database_ready = false;
            error = e.what();
        }
    }

    nlohmann::json body{
        {"status", database_ready ? "ready" : "not_ready"},
        {"timestamp", format_iso8601(std::chrono::system_clock::now())},
        {"checks", {{"database", database_ready}}},
    };
    if (error) {
        body["error"] = "Readiness check failed";
        log_.warn("Readiness check failed", {{"error", *error}});
    }
    return HealthResponse{database_ready ? 200 : 503, "application/json", body.dump()};
}

// ─────────────────────────────────────────────
// Prometheus exposition
// ─────────────────────────────────────────────

HealthResponse HealthAggregator::metrics() {
    auto components = check_components();
    const std::string& prefix = config_.metrics_prefix;

    std::ostringstream out;
    auto header = [&](std::string_view name, std::string_view help, std::string_view type) {
        out << "# HELP " << prefix << name << ' ' << help << '\n'
            << "# TYPE " << prefix << name << ' ' << type << '\n';
    };

    header("_up", "Whether the service is up (1) or down (0)", "gauge");
    out << prefix << "_up 1\n";

    bool any_available = std::any_of(components.begin(), components.end(),
                                     [](const ComponentHealth& c) { return c.available; });
    if (any_available) {
        header("_component_healthy", "Component health status", "gauge");
        for (const auto& c : components) {
            if (!c.available) continue;
            out << prefix << "_component_healthy{component=\"" << c.component << "\"} "
                << (c.probe.connected ? 1 : 0) << '\n';
        }

        header("_component_latency_ms", "Component response latency in milliseconds", "gauge");
        for (const auto& c : components) {
            if (!c.available || !c.probe.latency_ms) continue;
            out << prefix << "_component_latency_ms{component=\"" << c.component << "\"} "
                << format_number(*c.probe.latency_ms) << '\n';
        }
    }

    if (auto memory = read_process_memory()) {
        header("_memory_bytes", "Memory usage in bytes", "gauge");
        out << prefix << "_memory_bytes{type=\"rss\"} " << memory->rss_bytes << '\n'
            << prefix << "_memory_bytes{type=\"virtual\"} " << memory->virtual_bytes << '\n'
            << prefix << "_memory_bytes{type=\"peak_rss\"} " << memory->peak_rss_bytes << '\n';
    }

    if (sources_.pool) {
        auto stats = sources_.pool->stats();
        header("_sandbox_pool_size", "Sandbox warm pool size", "gauge");
        out << prefix << "_sandbox_pool_size " << stats.size << '\n';
        header("_sandbox_pool_available", "Sandbox available instances", "gauge");
        out << prefix << "_sandbox_pool_available " << stats.available << '\n';
        header("_sandbox_pool_max", "Sandbox pool max size", "gauge");
        out << prefix << "_sandbox_pool_max " << stats.max_size << '\n';
    }

    if (sources_.orchestrator) {
        auto stats = sources_.orchestrator->stats();
        header("_executions", "Execution records by status", "gauge");
        const std::array<std::pair<std::string_view, uint64_t>, 7> by_status{{
            {"queued", stats.queued},
            {"initializing", stats.initializing},
            {"running", stats.running},
            {"completed", stats.completed},
            {"failed", stats.failed},
            {"timeout", stats.timed_out},
            {"cancelled", stats.cancelled},
        }};
        for (const auto& [status, count] : by_status) {
            out << prefix << "_executions{status=\"" << status << "\"} " << count << '\n';
        }
        header("_execution_queue_depth", "Queued executions waiting for an instance", "gauge");
        out << prefix << "_execution_queue_depth " << stats.queue_depth << '\n';
    }

    if (sources_.flags) {
        header("_feature_flag_enabled", "Whether a feature flag is enabled", "gauge");
        for (const auto& [name, flag] : sources_.flags->snapshot()) {
            out << prefix << "_feature_flag_enabled{flag=\"" << name << "\"} "
                << (flag.enabled ? 1 : 0) << '\n';
        }
    }

    if (sources_.rate_limiter) {
        auto rejections = sources_.rate_limiter->rejection_counts();
        if (!rejections.empty()) {
            header("_rate_limit_rejections_total", "Requests rejected by the rate limiter", "counter");
            for (const auto& [route, count] : rejections) {
                out << prefix << "_rate_limit_rejections_total{route=\"" << route << "\"} "
                    << count << '\n';
            }
        }
    }

    auto lag = consumer_lag(components);
    if (!lag.empty()) {
        header("_consumer_lag", "Message broker consumer lag per topic", "gauge");
        for (const auto& [label, value] : lag) {
            if (!value) continue;
            out << prefix << "_consumer_lag{topic=\"" << label << "\"} " << *value << '\n';
        }
    }

    if (sources_.requests) {
        out << sources_.requests->render_prometheus(prefix);
    }

    return HealthResponse{200, std::string(kPrometheusContentType), out.str()};
}

}  // namespace sandbox_orchestrator
