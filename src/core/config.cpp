/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace sandbox_orchestrator {

namespace {

template <typename T>
T as_uint(toml::node_view<toml::node> node, T fallback) {
    auto value = node.value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<T>(*value);
}

std::optional<uint32_t> optional_uint(toml::node_view<toml::node> node) {
    auto value = node.value<int64_t>();
    if (!value || *value < 0) return std::nullopt;
    return static_cast<uint32_t>(*value);
}

void read_rate_limit(toml::table& tbl, RateLimitConfig& out) {
    auto section = tbl["rate_limit"];
    if (!section.is_table()) return;

    out.enabled = section["enabled"].value_or(true);

    if (auto* presets = section["presets"].as_table()) {
        for (auto&& [name, node] : *presets) {
            auto* preset = node.as_table();
            if (!preset) continue;
            RateLimitOverride override_cfg;
            override_cfg.window_ms = optional_uint((*preset)["window_ms"]);
            override_cfg.max_requests = optional_uint((*preset)["max_requests"]);
            if (auto msg = (*preset)["message"].value<std::string>()) {
                override_cfg.message = *msg;
            }
            out.presets[std::string{name.str()}] = std::move(override_cfg);
        }
    }
}

void read_health(toml::table& tbl, HealthConfig& out) {
    if (auto health = tbl["health"]; health.is_table()) {
        out.probe_timeout_ms = as_uint<uint32_t>(health["probe_timeout_ms"], 2000);
        out.metrics_prefix = health["metrics_prefix"].value_or(std::string{"sandbox_orchestrator"});
        out.consumer_group = health["consumer_group"].value_or(std::string{"execution-service"});
    }

    // [dependencies.<name>]; entries without host and port are skipped
    if (auto* deps = tbl["dependencies"].as_table()) {
        for (auto&& [name, node] : *deps) {
            auto* dep = node.as_table();
            if (!dep) continue;
            DependencyEndpoint endpoint;
            endpoint.host = (*dep)["host"].value_or(std::string{});
            endpoint.port = as_uint<uint16_t>((*dep)["port"], 0);
            if (endpoint.host.empty() || endpoint.port == 0) continue;
            out.dependencies[std::string{name.str()}] = std::move(endpoint);
        }
    }
}

Result<Config> build_config(toml::table& tbl) {
    Config config;

    // [service]
    if (auto service = tbl["service"]; service.is_table()) {
        config.service.id = service["id"].value_or(std::string{"sandboxd-01"});
        config.service.bind_address = service["bind_address"].value_or(std::string{"0.0.0.0"});
        config.service.port = as_uint<uint16_t>(service["port"], 7400);
        config.service.api_threads = as_uint<uint32_t>(service["api_threads"], 4);
        config.service.max_connections = as_uint<uint32_t>(service["max_connections"], 256);
    }

    // [orchestrator]
    if (auto orch = tbl["orchestrator"]; orch.is_table()) {
        auto& o = config.orchestrator;
        o.worker_threads = as_uint<uint32_t>(orch["worker_threads"], 0);
        o.default_timeout_ms = as_uint<uint32_t>(orch["default_timeout_ms"], 30000);
        o.max_timeout_ms = as_uint<uint32_t>(orch["max_timeout_ms"], 300000);
        o.max_retries = as_uint<uint32_t>(orch["max_retries"], 3);
        o.max_queue_depth = as_uint<uint32_t>(orch["max_queue_depth"], 1000);
        o.scheduler_tick_ms = as_uint<uint32_t>(orch["scheduler_tick_ms"], 50);
    }

    // [pool]
    if (auto pool = tbl["pool"]; pool.is_table()) {
        auto& p = config.pool;
        p.max_size = as_uint<uint32_t>(pool["max_size"], 10);
        p.max_uses = as_uint<uint32_t>(pool["max_uses"], 100);
        p.idle_ttl_ms = as_uint<uint32_t>(pool["idle_ttl_ms"], 60000);
        p.replenish_backoff_initial_ms = as_uint<uint32_t>(pool["replenish_backoff_initial_ms"], 100);
        p.replenish_backoff_max_ms = as_uint<uint32_t>(pool["replenish_backoff_max_ms"], 10000);
        p.root_dir = pool["root_dir"].value_or(std::string{"/tmp/sandbox_orchestrator"});
    }

    // [sandbox]
    if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
        auto& s = config.sandbox;
        s.interpreter = sandbox["interpreter"].value_or(std::string{"/usr/bin/python3"});
        if (auto* args = sandbox["interpreter_args"].as_array()) {
            for (auto&& arg : *args) {
                if (auto text = arg.value<std::string>()) s.interpreter_args.push_back(*text);
            }
        }
        s.entry_file = sandbox["entry_file"].value_or(std::string{"main.py"});
        s.memory_limit_mb = as_uint<uint64_t>(sandbox["memory_limit_mb"], 128);
        s.max_output_bytes = as_uint<uint64_t>(sandbox["max_output_bytes"], 1024 * 1024);
        s.max_code_bytes = as_uint<uint64_t>(sandbox["max_code_bytes"], 512 * 1024);
        s.max_input_bytes = as_uint<uint64_t>(sandbox["max_input_bytes"], 1024 * 1024);
        s.max_open_files = as_uint<uint32_t>(sandbox["max_open_files"], 64);
        s.cancel_grace_ms = as_uint<uint32_t>(sandbox["cancel_grace_ms"], 2000);
        s.isolate_network = sandbox["isolate_network"].value_or(false);
    }

    // [agents]
    if (auto agents = tbl["agents"]; agents.is_table()) {
        config.agents.dir = agents["dir"].value_or(std::string{"./agents"});
    }

    read_rate_limit(tbl, config.rate_limit);
    read_health(tbl, config.health);

    // [feature_flags.<NAME>]
    if (auto* flags = tbl["feature_flags"].as_table()) {
        for (auto&& [name, node] : *flags) {
            auto* flag = node.as_table();
            if (!flag) continue;
            FeatureFlagConfig flag_cfg;
            flag_cfg.enabled = (*flag)["enabled"].value_or(false);
            flag_cfg.rollout_percentage = as_uint<uint32_t>((*flag)["rollout_percentage"], 0);
            flag_cfg.description = (*flag)["description"].value_or(std::string{});
            config.feature_flags[std::string{name.str()}] = std::move(flag_cfg);
        }
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        config.telemetry.max_file_size_mb = as_uint<uint32_t>(telemetry["max_file_size_mb"], 50);
        config.telemetry.rotate_count = as_uint<uint32_t>(telemetry["rotate_count"], 5);
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
    }

    if (config.pool.max_size == 0) {
        return Error{ErrorCode::InvalidArgument, "pool.max_size must be at least 1"};
    }
    if (config.orchestrator.default_timeout_ms == 0
        || config.orchestrator.default_timeout_ms > config.orchestrator.max_timeout_ms) {
        return Error{ErrorCode::InvalidArgument,
                     "orchestrator.default_timeout_ms must be in (0, max_timeout_ms]"};
    }

    return config;
}

}  // namespace

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace sandbox_orchestrator
