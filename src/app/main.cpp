/**
 * @file main.cpp
 * @brief SandboxOrchestrator daemon entry point.
 *
 * Wires all modules into the execution service:
 *   Config → Logger → Pool → Orchestrator → Rate Limiter → Health → API server
 */

#include "api/api_router.hpp"
#include "api/api_server.hpp"
#include "api/json_codec.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "health/feature_flags.hpp"
#include "health/health_aggregator.hpp"
#include "health/tcp_probe.hpp"
#include "orchestrator/orchestrator.hpp"
#include "ratelimit/rate_limit_policy.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "sandbox/agent_catalog.hpp"
#include "sandbox/process_sandbox.hpp"
#include "sandbox/warm_pool.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/request_metrics.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace sandbox_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║       SandboxOrchestrator v1.0.0          ║
  ║   Warm-Pool Execution Service for         ║
  ║   Untrusted Agent Code                    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint16_t port = 0;
    std::string log_dir;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            args.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: sandbox_orchestrator [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --port <port>      TCP port for the API server\n"
                      << "  --log-dir <path>   Log output directory (empty: stdout)\n"
                      << "  --demo             Run one sample agent end to end, then exit\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

constexpr std::string_view kDemoAgentId = "demo-echo";

/// Echoes its input back inside a JSON object and logs to stderr.
constexpr std::string_view kDemoAgentSource =
    "#!/bin/sh\n"
    "input=$(cat)\n"
    "echo \"demo agent received ${#input} bytes\" >&2\n"
    "printf '{\"agent\":\"demo-echo\",\"input\":%s}\\n' \"$input\"\n";

/**
 * @brief Run a single demo: register a shell agent, submit one execution,
 *        wait for a terminal status, and print the record.
 */
int run_demo(Config config, Logger& logger) {
    logger.info("=== Demo Mode ===");

    config.sandbox.interpreter = "/bin/sh";
    config.sandbox.interpreter_args.clear();
    config.sandbox.entry_file = "main.sh";
    config.pool.max_size = 2;
    config.pool.root_dir /= "demo";

    InMemoryAgentCatalog catalog;
    catalog.put(AgentId(kDemoAgentId), std::string(kDemoAgentSource));

    MetricsCollector metrics(std::make_unique<NullSink>());
    ProcessSandboxFactory factory(config.sandbox, config.pool.root_dir);
    WarmPool pool(config.pool, factory, logger, &metrics);
    pool.start();
    size_t warmed = pool.warm_up();
    logger.info("Warm pool ready: " + std::to_string(warmed) + " instances");

    ExecutionOrchestrator orchestrator(config.orchestrator, pool, catalog, logger, &metrics);
    orchestrator.start();

    auto submitted = orchestrator.submit(SubmitRequest{
        .agent_id = AgentId(kDemoAgentId),
        .input = R"({"question":"ping"})",
        .timeout_ms = 5000,
    });
    if (!submitted) {
        logger.error("Demo submit failed: " + submitted.error().message);
        orchestrator.stop();
        pool.stop();
        return 1;
    }
    logger.info("Submitted execution " + submitted->id);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(15);
    Result<ExecutionRecord> current = *submitted;
    while (std::chrono::steady_clock::now() < deadline && !g_shutdown_requested) {
        current = orchestrator.get(submitted->id);
        if (!current || is_terminal(current->status)) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    int exit_code = 0;
    if (!current) {
        logger.error("Demo lookup failed: " + current.error().message);
        exit_code = 1;
    } else {
        std::cout << to_json(*current).dump(2) << std::endl;
        logger.info("Execution " + current->id + " finished as "
                    + std::string(to_string(current->status)));
        if (current->status != ExecutionStatus::Completed) exit_code = 1;
    }

    orchestrator.stop();
    pool.stop();
    logger.info("=== Demo Complete ===");
    return exit_code;
}

/// Dependencies always listed in the health payload, configured or not.
constexpr std::array<std::string_view, 4> kKnownDependencies{
    "cache", "broker", "storage", "database"};

void register_probes(const HealthConfig& config, HealthAggregator& health, Logger& logger) {
    auto add = [&](const std::string& name, const DependencyEndpoint& endpoint) {
        auto probe = std::make_shared<TcpEndpointProbe>(name, endpoint, config.probe_timeout_ms);
        if (name == "database" && probe->is_available()) {
            health.set_readiness_check(probe);
        }
        if (probe->is_available()) {
            logger.info("Health probe: " + name + " -> " + endpoint.host + ":"
                        + std::to_string(endpoint.port));
        }
        health.add_probe(std::move(probe));
    };

    for (auto known : kKnownDependencies) {
        std::string name(known);
        auto it = config.dependencies.find(name);
        add(name, it != config.dependencies.end() ? it->second : DependencyEndpoint{});
    }
    for (const auto& [name, endpoint] : config.dependencies) {
        if (std::find(kKnownDependencies.begin(), kKnownDependencies.end(), name)
            == kKnownDependencies.end()) {
            add(name, endpoint);
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.port != 0) config.service.port = args.port;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "sandbox_orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level);
    logger.info("SandboxOrchestrator starting...");
    logger.info("Service ID: " + config.service.id);
    logger.info("API: " + config.service.bind_address + ":" + std::to_string(config.service.port));
    logger.info("Interpreter: " + config.sandbox.interpreter);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(config, logger);
    }

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> telemetry_sink;
    if (!config.telemetry.log_dir.empty()) {
        telemetry_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "events",
                                                        config.telemetry.max_file_size_mb,
                                                        config.telemetry.rotate_count);
    } else {
        telemetry_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(telemetry_sink));
    RequestMetrics request_metrics;

    // ── Initialize Sandbox Pool ──────────────
    DirectoryAgentCatalog catalog(config.agents.dir, config.sandbox.entry_file);
    ProcessSandboxFactory factory(config.sandbox, config.pool.root_dir);
    WarmPool pool(config.pool, factory, logger, &metrics);
    pool.start();
    size_t warmed = pool.warm_up();
    logger.info("Warm pool: " + std::to_string(warmed) + "/"
                + std::to_string(config.pool.max_size) + " instances ready");

    // ── Initialize Orchestrator ──────────────
    ExecutionOrchestrator orchestrator(config.orchestrator, pool, catalog, logger, &metrics);
    orchestrator.start();
    logger.info("Orchestrator started (default timeout "
                + std::to_string(config.orchestrator.default_timeout_ms) + "ms, max retries "
                + std::to_string(config.orchestrator.max_retries) + ")");

    // ── Initialize Rate Limiter ──────────────
    auto policy = RateLimitPolicy::from_config(config.rate_limit);
    if (!policy) {
        logger.error("Invalid rate limit configuration: " + policy.error().message);
        orchestrator.stop();
        pool.stop();
        return 1;
    }
    RateLimiter limiter;
    limiter.set_enabled(policy->enabled());

    // ── Initialize Health ────────────────────
    FeatureFlagService flags(config.feature_flags);
    HealthAggregator health(config.health,
                            HealthSources{.pool = &pool,
                                          .orchestrator = &orchestrator,
                                          .flags = &flags,
                                          .rate_limiter = &limiter,
                                          .requests = &request_metrics},
                            logger);
    register_probes(config.health, health, logger);

    // ── Initialize API Server ────────────────
    ApiRouter router(ApiServices{.orchestrator = orchestrator,
                                 .limiter = limiter,
                                 .policy = *policy,
                                 .health = &health,
                                 .request_metrics = &request_metrics,
                                 .metrics = &metrics},
                     logger);
    ApiServer server(router, logger, config.service.api_threads,
                     config.service.max_connections);
    auto started = server.start(config.service.bind_address, config.service.port);
    if (!started) {
        logger.error("Could not start API server: " + started.error().message);
        orchestrator.stop();
        pool.stop();
        return 1;
    }
    logger.info("API server listening on port " + std::to_string(server.port()));

    // ── Maintenance Loop ─────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Rate-limit purge every 60 seconds at 100ms intervals
        if (loop_count % 600 == 0 && loop_count > 0) {
            size_t purged = limiter.purge_expired();
            if (purged > 0) {
                logger.debug("Purged " + std::to_string(purged) + " expired rate-limit counters");
            }
        }

        // Periodic status logging (every 30 seconds)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto pool_stats = pool.stats();
            auto exec_stats = orchestrator.stats();
            logger.info("Status: pool " + std::to_string(pool_stats.available) + "/"
                        + std::to_string(pool_stats.size) + " idle, "
                        + std::to_string(exec_stats.queue_depth) + " queued, "
                        + std::to_string(exec_stats.running) + " running, "
                        + std::to_string(limiter.size()) + " rate-limit keys");
            metrics.flush();
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    server.stop();
    orchestrator.stop();
    pool.stop();
    metrics.flush();

    logger.info("SandboxOrchestrator stopped.");
    logger.flush();
    return 0;
}
