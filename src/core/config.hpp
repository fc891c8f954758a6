/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"

namespace sandbox_orchestrator {

struct ServiceConfig {
    std::string id = "sandboxd-01";
    std::string bind_address = "0.0.0.0";
    uint16_t port = 7400;
    uint32_t api_threads = 4;
    uint32_t max_connections = 256;         ///< open API sockets; extra ones are closed
};

struct OrchestratorConfig {
    uint32_t worker_threads = 0;            ///< 0 = hardware_concurrency
    uint32_t default_timeout_ms = 30000;
    uint32_t max_timeout_ms = 300000;
    uint32_t max_retries = 3;
    uint32_t max_queue_depth = 1000;        ///< 0 = unbounded
    uint32_t scheduler_tick_ms = 50;
};

struct PoolConfig {
    uint32_t max_size = 10;
    uint32_t max_uses = 100;                ///< 0 = never recycle by use count
    uint32_t idle_ttl_ms = 60000;           ///< 0 = never recycle by idle time
    uint32_t replenish_backoff_initial_ms = 100;
    uint32_t replenish_backoff_max_ms = 10000;
    std::filesystem::path root_dir = "/tmp/sandbox_orchestrator";
};

struct SandboxConfig {
    std::string interpreter = "/usr/bin/python3";
    std::vector<std::string> interpreter_args;
    std::string entry_file = "main.py";
    uint64_t memory_limit_mb = 128;
    uint64_t max_output_bytes = 1024 * 1024;
    uint64_t max_code_bytes = 512 * 1024;
    uint64_t max_input_bytes = 1024 * 1024;
    uint32_t max_open_files = 64;
    uint32_t cancel_grace_ms = 2000;
    bool isolate_network = false;
};

struct AgentsConfig {
    std::filesystem::path dir = "./agents";
};

/// Overrides for one rate-limit preset; unset fields keep the built-in value.
struct RateLimitOverride {
    std::optional<uint32_t> window_ms;
    std::optional<uint32_t> max_requests;
    std::optional<std::string> message;
};

struct RateLimitConfig {
    bool enabled = true;
    std::map<std::string, RateLimitOverride> presets;   ///< keyed by preset name
};

struct DependencyEndpoint {
    std::string host;
    uint16_t port = 0;
};

struct HealthConfig {
    uint32_t probe_timeout_ms = 2000;
    std::string metrics_prefix = "sandbox_orchestrator";
    std::string consumer_group = "execution-service";
    std::map<std::string, DependencyEndpoint> dependencies;  ///< cache, broker, storage, database
};

struct FeatureFlagConfig {
    bool enabled = false;
    uint32_t rollout_percentage = 0;
    std::string description;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    ServiceConfig service;
    OrchestratorConfig orchestrator;
    PoolConfig pool;
    SandboxConfig sandbox;
    AgentsConfig agents;
    RateLimitConfig rate_limit;
    HealthConfig health;
    std::map<std::string, FeatureFlagConfig> feature_flags;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace sandbox_orchestrator
