/**
 * @file orchestrator.hpp
 * @brief ExecutionOrchestrator: the execution-record state machine.
 *
 * Drives one logical execution from submission to a terminal status:
 *   1. submit() records the execution as queued and returns immediately
 *   2. advance() hands queued records a warm instance, oldest first
 *   3. a worker stages the agent code, runs it, and interprets the outcome
 *   4. the watchdog forces a timeout when an attempt outlives its budget
 *
 * Every terminal transition is a compare-and-set on the record's status
 * (under the record's mutex) keyed by attempt number, so exactly one of
 * natural completion, timeout and cancellation wins.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "orchestrator/execution_store.hpp"
#include "orchestrator/watchdog.hpp"
#include "sandbox/agent_catalog.hpp"
#include "sandbox/warm_pool.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief Caller-supplied parameters for a new execution.
 */
struct SubmitRequest {
    AgentId agent_id;
    std::string input;
    std::optional<uint32_t> timeout_ms;
    std::optional<uint32_t> max_retries;
    std::optional<std::string> submission_id;
    std::optional<std::string> bounty_id;
};

/**
 * @brief Record counts per status plus queue depth.
 */
struct OrchestratorStats {
    uint64_t total{0};
    uint64_t queued{0};
    uint64_t initializing{0};
    uint64_t running{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timed_out{0};
    uint64_t cancelled{0};
    uint64_t queue_depth{0};
};

class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(OrchestratorConfig config,
                          WarmPool& pool,
                          const IAgentCatalog& catalog,
                          Logger& logger,
                          MetricsCollector* metrics = nullptr);
    ~ExecutionOrchestrator();

    // Non-copyable, non-movable
    ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
    ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

    // ── Lifecycle ────────────────────────────
    /// Start the scheduler and watchdog threads.
    void start();
    /// Stop dispatching, cancel in-flight attempts, and drain workers.
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Caller operations ────────────────────
    Result<ExecutionRecord> submit(SubmitRequest request);
    Result<ExecutionRecord> cancel(const ExecutionId& id);
    Result<ExecutionRecord> retry(const ExecutionId& id);

    // ── Queries ──────────────────────────────
    [[nodiscard]] Result<ExecutionRecord> get(const ExecutionId& id) const;
    [[nodiscard]] std::vector<ExecutionRecord> list_by_agent(const AgentId& agent_id) const;
    [[nodiscard]] std::vector<ExecutionRecord> list_by_submission(const std::string& submission_id) const;
    [[nodiscard]] OrchestratorStats stats() const;
    /// Entries waiting in the dispatch queue. Cancelled records leave it at once.
    [[nodiscard]] size_t queue_length() const;

    /**
     * @brief Dispatch queued records while the pool has idle instances.
     *
     * Called by the scheduler thread on every tick and whenever the pool
     * reports availability; tests call it directly. Strict FIFO: the oldest
     * queued record waits at the head until an instance frees up.
     *
     * @return number of attempts dispatched.
     */
    size_t advance();

    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

private:
    struct QueueItem {
        ExecutionId id;
        uint32_t attempt;
    };

    enum class Dispatch { Started, Stale, NoInstance };

    Dispatch try_dispatch(const QueueItem& item);
    void run_attempt(const ExecutionStore::EntryPtr& entry, uint32_t attempt,
                     InstanceHandle instance, std::stop_token stop);
    void interpret(const ExecutionStore::EntryPtr& entry, uint32_t attempt,
                   const SandboxOutcome& outcome);

    /// Append captured stderr and peak memory to the record for @p attempt.
    void record_run(ExecutionEntry& entry, uint32_t attempt, const SandboxOutcome& outcome);

    /// Terminal transition from initializing/running for @p attempt. Losers get false.
    bool finish(ExecutionEntry& entry, uint32_t attempt, ExecutionStatus to,
                std::optional<std::string> output, std::optional<std::string> error);
    bool complete(ExecutionEntry& entry, uint32_t attempt, std::string output);
    bool fail(ExecutionEntry& entry, uint32_t attempt, std::string error);
    [[nodiscard]] bool timed_out(ExecutionEntry& entry, uint32_t attempt) const;

    void on_deadline(const ExecutionId& id, uint32_t attempt);
    void scheduler_loop(std::stop_token stop);
    void wake();
    void enqueue(QueueItem item);
    /// Remove @p item wherever it sits; no-op when already gone.
    void dequeue(const QueueItem& item);
    /// Count one more queued record unless max_queue_depth is reached.
    bool reserve_queue_slot() noexcept;
    ExecutionId next_id();
    void emit(const ExecutionRecord& record);

    OrchestratorConfig config_;
    WarmPool& pool_;
    const IAgentCatalog& catalog_;
    LogContext log_;
    MetricsCollector* metrics_;

    ExecutionStore store_;
    Watchdog watchdog_;

    mutable std::mutex queue_mutex_;
    std::deque<QueueItem> queue_;  // only records still queued; bounded by max_queue_depth
    std::atomic<uint64_t> queued_count_{0};
    std::mutex advance_mutex_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool wake_pending_{false};

    std::atomic<uint64_t> next_id_{1};
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{true};
    uint64_t pool_callback_{0};

    std::jthread scheduler_;
    ThreadPool workers_;  // declared last: drained before the members above go away
};

}  // namespace sandbox_orchestrator
