/**
 * @file test_end_to_end.cpp
 * @brief Integration tests running real /bin/sh agents through the whole stack.
 *
 * Agents are shell scripts on disk, loaded by the directory catalog, staged
 * into process sandboxes from a warm pool, and driven by the orchestrator.
 * The last tests go through the TCP API server as a client would.
 */

#include "api/api_router.hpp"
#include "api/api_server.hpp"
#include "network/transport.hpp"
#include "orchestrator/orchestrator.hpp"
#include "sandbox/agent_catalog.hpp"
#include "sandbox/process_sandbox.hpp"
#include "sandbox/warm_pool.hpp"
#include "support/fakes.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace sandbox_orchestrator;
using namespace sandbox_orchestrator::testing;
using namespace std::chrono_literals;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "so_test_end_to_end";
        std::filesystem::remove_all(root_);

        write_agent("echo", "input=$(cat)\n"
                            "echo \"echo agent invoked\" >&2\n"
                            "printf '{\"echo\":%s}\\n' \"$input\"\n");
        write_agent("sleeper", "sleep 30\necho '{}'\n");
        write_agent("crasher", "echo 'fatal: bad input' >&2\nexit 3\n");
        write_agent("chatty", "echo 'this is not json'\n");

        sandbox_.interpreter = "/bin/sh";
        sandbox_.entry_file = "main.sh";
        sandbox_.cancel_grace_ms = 500;
    }

    void TearDown() override {
        server_.reset();
        router_.reset();
        orchestrator_.reset();
        pool_.reset();
        std::filesystem::remove_all(root_);
    }

    void write_agent(const std::string& id, const std::string& script) {
        auto dir = root_ / "agents" / id;
        std::filesystem::create_directories(dir);
        std::ofstream(dir / "main.sh") << script;
    }

    void start_stack(uint32_t pool_size, uint32_t max_queue_depth = 100) {
        PoolConfig pool_cfg;
        pool_cfg.max_size = pool_size;
        pool_cfg.max_uses = 0;
        pool_cfg.idle_ttl_ms = 0;
        pool_cfg.replenish_backoff_initial_ms = 10;
        pool_cfg.root_dir = root_ / "instances";

        OrchestratorConfig orch_cfg;
        orch_cfg.default_timeout_ms = 10000;
        orch_cfg.max_queue_depth = max_queue_depth;
        orch_cfg.scheduler_tick_ms = 10;

        catalog_ = std::make_unique<DirectoryAgentCatalog>(root_ / "agents", "main.sh");
        factory_ = std::make_unique<ProcessSandboxFactory>(sandbox_, pool_cfg.root_dir);
        pool_ = std::make_unique<WarmPool>(pool_cfg, *factory_, logger_);
        pool_->start();
        ASSERT_EQ(pool_->warm_up(), pool_size);

        orchestrator_ = std::make_unique<ExecutionOrchestrator>(orch_cfg, *pool_, *catalog_, logger_);
        orchestrator_->start();
    }

    ExecutionRecord run_to_end(SubmitRequest request, std::chrono::milliseconds limit = 10s) {
        auto submitted = orchestrator_->submit(std::move(request));
        EXPECT_TRUE(submitted.has_value());
        const auto id = submitted->id;
        EXPECT_TRUE(wait_until([&] { return is_terminal(orchestrator_->get(id)->status); }, limit));
        return orchestrator_->get(id).value();
    }

    static SubmitRequest request(std::string agent, std::string input = "{}") {
        SubmitRequest req;
        req.agent_id = std::move(agent);
        req.input = std::move(input);
        return req;
    }

    std::filesystem::path root_;
    SandboxConfig sandbox_;
    Logger logger_{std::make_unique<NullSink>()};

    std::unique_ptr<DirectoryAgentCatalog> catalog_;
    std::unique_ptr<ProcessSandboxFactory> factory_;
    std::unique_ptr<WarmPool> pool_;
    std::unique_ptr<ExecutionOrchestrator> orchestrator_;

    RateLimiter limiter_;
    RateLimitPolicy policy_;
    std::unique_ptr<ApiRouter> router_;
    std::unique_ptr<ApiServer> server_;
};

// ═══════════════════════════════════════════════
// Orchestrator over real sandboxes
// ═══════════════════════════════════════════════

TEST_F(EndToEndTest, AgentOutputBecomesResult) {
    start_stack(2);

    auto record = run_to_end(request("echo", R"({"question":"ping"})"));
    ASSERT_EQ(record.status, ExecutionStatus::Completed) << record.error_message.value_or("");
    EXPECT_EQ(record.output, R"({"echo":{"question":"ping"}})");
    EXPECT_EQ(record.logs, "echo agent invoked\n");
    EXPECT_TRUE(record.execution_time_ms().has_value());

    // The instance was reset and returned, not replaced
    EXPECT_TRUE(wait_until([&] { return pool_->stats().available == 2; }));
    EXPECT_EQ(pool_->counters().created, 2u);
}

TEST_F(EndToEndTest, FailuresCarryReadableMessages) {
    start_stack(2);

    auto crashed = run_to_end(request("crasher"));
    EXPECT_EQ(crashed.status, ExecutionStatus::Failed);
    EXPECT_EQ(crashed.error_message, "Execution exited with code 3: fatal: bad input");

    auto chatty = run_to_end(request("chatty"));
    EXPECT_EQ(chatty.status, ExecutionStatus::Failed);
    EXPECT_EQ(chatty.error_message, "Execution produced malformed output");

    auto missing = run_to_end(request("ghost"));
    EXPECT_EQ(missing.status, ExecutionStatus::Failed);
    EXPECT_EQ(missing.error_message, "Agent not found: ghost");
}

TEST_F(EndToEndTest, RunawayAgentTimesOutAndInstanceIsReplaced) {
    start_stack(1);

    auto req = request("sleeper");
    req.timeout_ms = 300;
    auto start = std::chrono::steady_clock::now();
    auto record = run_to_end(std::move(req));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(record.status, ExecutionStatus::Timeout);
    EXPECT_EQ(record.error_message, "Execution timed out after 300 ms");
    EXPECT_FALSE(record.output.has_value());
    EXPECT_LT(elapsed, 5s);

    EXPECT_TRUE(wait_until([&] { return pool_->counters().discarded >= 1; }));
    EXPECT_TRUE(wait_until([&] { return pool_->stats().available == 1; }));

    // The fresh instance serves the next execution
    auto next = run_to_end(request("echo", "1"));
    EXPECT_EQ(next.status, ExecutionStatus::Completed);
    EXPECT_EQ(next.output, R"({"echo":1})");
}

TEST_F(EndToEndTest, CancelStopsRunningAgent) {
    start_stack(1);

    auto submitted = orchestrator_->submit(request("sleeper"));
    ASSERT_TRUE(submitted.has_value());
    const auto id = submitted->id;
    ASSERT_TRUE(wait_until([&] {
        return orchestrator_->get(id)->status == ExecutionStatus::Running;
    }));
    std::this_thread::sleep_for(100ms);

    auto cancelled = orchestrator_->cancel(id);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->status, ExecutionStatus::Cancelled);

    // Back in the pool well before the agent's own 30 s sleep ends
    EXPECT_TRUE(wait_until([&] { return pool_->stats().available == 1; }, 3s));
    EXPECT_EQ(orchestrator_->get(id)->status, ExecutionStatus::Cancelled);
}

TEST_F(EndToEndTest, BackpressureQueuesThenRejects) {
    start_stack(1, 2);

    auto first = orchestrator_->submit(request("sleeper"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(wait_until([&] {
        return orchestrator_->get(first->id)->status == ExecutionStatus::Running;
    }));

    auto second = orchestrator_->submit(request("echo", "2"));
    auto third = orchestrator_->submit(request("echo", "3"));
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(orchestrator_->stats().queue_depth, 2u);

    auto rejected = orchestrator_->submit(request("echo", "4"));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::CapacityExceeded);

    // Freeing the instance drains the queue in order
    ASSERT_TRUE(orchestrator_->cancel(first->id).has_value());
    EXPECT_TRUE(wait_until([&] {
        return orchestrator_->get(third->id)->status == ExecutionStatus::Completed;
    }, 10s));
    auto second_done = orchestrator_->get(second->id).value();
    auto third_done = orchestrator_->get(third->id).value();
    EXPECT_EQ(second_done.status, ExecutionStatus::Completed);
    EXPECT_LE(*second_done.started_at, *third_done.started_at);
}

TEST_F(EndToEndTest, RetryAfterTimeoutSucceedsWhenAgentIsFixed) {
    start_stack(1);

    auto req = request("sleeper");
    req.timeout_ms = 200;
    auto timed_out = run_to_end(std::move(req));
    ASSERT_EQ(timed_out.status, ExecutionStatus::Timeout);

    write_agent("sleeper", "echo '{\"fixed\":true}'\n");
    auto retried = orchestrator_->retry(timed_out.id);
    ASSERT_TRUE(retried.has_value()) << retried.error().message;

    ASSERT_TRUE(wait_until([&] { return is_terminal(orchestrator_->get(timed_out.id)->status); }));
    auto done = orchestrator_->get(timed_out.id).value();
    EXPECT_EQ(done.status, ExecutionStatus::Completed);
    EXPECT_EQ(done.output, R"({"fixed":true})");
    EXPECT_EQ(done.retry_count, 1u);
    ASSERT_EQ(done.attempts.size(), 1u);
    EXPECT_EQ(done.attempts[0].status, ExecutionStatus::Timeout);
}

// ═══════════════════════════════════════════════
// API over TCP
// ═══════════════════════════════════════════════

namespace {

nlohmann::json call(TcpTransport& client, const nlohmann::json& envelope) {
    auto text = envelope.dump();
    auto sent = client.send({text.begin(), text.end()});
    EXPECT_TRUE(sent.has_value());
    auto reply = client.receive(5000);
    EXPECT_TRUE(reply.has_value());
    if (!reply) return nlohmann::json{};
    return nlohmann::json::parse(reply->begin(), reply->end());
}

}  // namespace

TEST_F(EndToEndTest, SubmitAndPollThroughApiServer) {
    start_stack(1);
    router_ = std::make_unique<ApiRouter>(ApiServices{*orchestrator_, limiter_, policy_}, logger_);
    server_ = std::make_unique<ApiServer>(*router_, logger_, 2);
    ASSERT_TRUE(server_->start("127.0.0.1", 0).has_value());

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server_->port()).has_value());

    auto accepted = call(client, {
        {"method", "POST"},
        {"path", "/api/executions"},
        {"body", {{"agentId", "echo"}, {"input", {{"n", 7}}}}},
        {"identity", {{"sessionUser", "alice"}}},
    });
    ASSERT_EQ(accepted["status"], 202) << accepted.dump();
    EXPECT_EQ(accepted["headers"]["X-RateLimit-Limit"], "20");
    const auto id = accepted["body"]["id"].get<std::string>();

    nlohmann::json polled;
    ASSERT_TRUE(wait_until([&] {
        polled = call(client, {{"method", "GET"}, {"path", "/api/executions/" + id}});
        return polled["body"]["status"] == "completed";
    }));
    EXPECT_EQ(polled["status"], 200);
    EXPECT_EQ(polled["body"]["output"]["echo"]["n"], 7);
}

TEST_F(EndToEndTest, ApiServerRejectsMalformedEnvelope) {
    start_stack(1);
    router_ = std::make_unique<ApiRouter>(ApiServices{*orchestrator_, limiter_, policy_}, logger_);
    server_ = std::make_unique<ApiServer>(*router_, logger_, 2);
    ASSERT_TRUE(server_->start("127.0.0.1", 0).has_value());

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server_->port()).has_value());
    std::string garbage = "not an envelope";
    ASSERT_TRUE(client.send({garbage.begin(), garbage.end()}).has_value());
    auto reply = client.receive(5000);
    ASSERT_TRUE(reply.has_value());
    auto envelope = nlohmann::json::parse(reply->begin(), reply->end());
    EXPECT_EQ(envelope["status"], 400);
    EXPECT_EQ(envelope["body"]["error"], "InvalidArgument");

    // The connection stays usable
    auto health = call(client, {{"method", "GET"}, {"path", "/api/executions/exec-404"}});
    EXPECT_EQ(health["status"], 404);
}
