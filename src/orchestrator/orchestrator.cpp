/**
 * @file orchestrator.cpp
 * @brief ExecutionOrchestrator implementation.
 */

#include "orchestrator/orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <exception>

namespace sandbox_orchestrator {

namespace {

constexpr size_t kStderrTailBytes = 512;

size_t worker_count(const OrchestratorConfig& config, const WarmPool& pool) {
    if (config.worker_threads > 0) return config.worker_threads;
    // Every leased instance needs a worker to drive it
    size_t hw = std::max(1u, std::thread::hardware_concurrency());
    return std::max<size_t>(hw, pool.config().max_size);
}

std::string_view trim(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto begin = text.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(kSpace);
    return text.substr(begin, end - begin + 1);
}

std::string stderr_tail(const std::string& text) {
    auto trimmed = trim(text);
    if (trimmed.size() > kStderrTailBytes) {
        trimmed = trimmed.substr(trimmed.size() - kStderrTailBytes);
    }
    return std::string{trimmed};
}

}  // namespace

ExecutionOrchestrator::ExecutionOrchestrator(OrchestratorConfig config,
                                             WarmPool& pool,
                                             const IAgentCatalog& catalog,
                                             Logger& logger,
                                             MetricsCollector* metrics)
    : config_(std::move(config))
    , pool_(pool)
    , catalog_(catalog)
    , log_(logger, "orchestrator")
    , metrics_(metrics)
    , watchdog_([this](const ExecutionId& id, uint32_t attempt) { on_deadline(id, attempt); })
    , workers_(worker_count(config_, pool)) {
    workers_.set_error_handler([this](const std::string& message) {
        log_.error("Worker task raised", {{"error", message}});
    });
}

ExecutionOrchestrator::~ExecutionOrchestrator() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void ExecutionOrchestrator::start() {
    if (running_.exchange(true)) return;
    accepting_.store(true);

    pool_callback_ = pool_.on_available([this] { wake(); });
    watchdog_.start();
    scheduler_ = std::jthread([this](std::stop_token stop) { scheduler_loop(stop); });

    log_.info("Orchestrator started",
              {{"workers", std::to_string(workers_.thread_count())},
               {"tick_ms", std::to_string(config_.scheduler_tick_ms)}});
}

void ExecutionOrchestrator::stop() {
    accepting_.store(false);
    const bool was_running = running_.exchange(false);
    if (was_running) {
        pool_.remove_available_callback(pool_callback_);
        scheduler_.request_stop();
        wake_cv_.notify_all();
        if (scheduler_.joinable()) scheduler_.join();
    }

    // In-flight attempts are cancelled so their workers return promptly
    for (const auto& entry : store_.all()) {
        ExecutionId id;
        {
            std::lock_guard lock(entry->mutex);
            auto status = entry->record.status;
            if (status != ExecutionStatus::Initializing && status != ExecutionStatus::Running) continue;
            id = entry->record.id;
        }
        if (auto cancelled = cancel(id); !cancelled) {
            log_.warn("Cancel on shutdown failed", {{"execution", id}, {"error", cancelled.error().message}});
        }
    }

    workers_.shutdown();
    watchdog_.stop();
    if (was_running) log_.info("Orchestrator stopped");
}

// ─────────────────────────────────────────────
// Caller operations
// ─────────────────────────────────────────────

Result<ExecutionRecord> ExecutionOrchestrator::submit(SubmitRequest request) {
    if (!accepting_.load()) {
        return Error{ErrorCode::CapacityExceeded, "Orchestrator is shutting down"};
    }
    if (request.agent_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "agentId is required"};
    }

    uint32_t timeout_ms = request.timeout_ms.value_or(config_.default_timeout_ms);
    if (timeout_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "timeoutMs must be positive"};
    }
    timeout_ms = std::min(timeout_ms, config_.max_timeout_ms);

    if (!reserve_queue_slot()) {
        return Error{ErrorCode::CapacityExceeded,
                     "Execution queue is full (" + std::to_string(config_.max_queue_depth) + " queued)"};
    }

    ExecutionRecord record;
    record.id = next_id();
    record.agent_id = std::move(request.agent_id);
    record.submission_id = std::move(request.submission_id);
    record.bounty_id = std::move(request.bounty_id);
    record.status = ExecutionStatus::Queued;
    record.input = std::move(request.input);
    record.queued_at = std::chrono::system_clock::now();
    record.timeout_ms = timeout_ms;
    record.max_retries = request.max_retries.value_or(config_.max_retries);

    ExecutionRecord snapshot = record;
    if (!store_.insert(std::move(record))) {
        queued_count_.fetch_sub(1);
        return Error{ErrorCode::Internal, "Duplicate execution id " + snapshot.id};
    }

    enqueue(QueueItem{snapshot.id, 0});
    log_.info("Execution queued",
              {{"execution", snapshot.id}, {"agent", snapshot.agent_id},
               {"timeout_ms", std::to_string(timeout_ms)}});
    emit(snapshot);
    wake();
    return snapshot;
}

Result<ExecutionRecord> ExecutionOrchestrator::cancel(const ExecutionId& id) {
    auto entry = store_.find(id);
    if (!entry) {
        return Error{ErrorCode::NotFound, "Execution not found: " + id};
    }

    ExecutionRecord snapshot;
    ExecutionStatus previous;
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        previous = rec.status;
        if (is_terminal(rec.status)) {
            return rec;  // idempotent
        }

        if (rec.status == ExecutionStatus::Queued) {
            queued_count_.fetch_sub(1);
            dequeue(QueueItem{rec.id, rec.retry_count});
        } else {
            // The worker still holds its lease and releases it once run() returns
            entry->stop.request_stop();
            entry->instance.reset();
        }
        rec.status = ExecutionStatus::Cancelled;
        rec.completed_at = std::chrono::system_clock::now();
        snapshot = rec;
    }

    log_.info("Execution cancelled", {{"execution", id}, {"from", to_string(previous)}});
    emit(snapshot);
    return snapshot;
}

Result<ExecutionRecord> ExecutionOrchestrator::retry(const ExecutionId& id) {
    auto entry = store_.find(id);
    if (!entry) {
        return Error{ErrorCode::NotFound, "Execution not found: " + id};
    }

    ExecutionRecord snapshot;
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        if (!is_retryable(rec.status)) {
            return Error{ErrorCode::InvalidArgument,
                         "Execution " + id + " is " + std::string{to_string(rec.status)}
                         + "; only failed, timed out or cancelled executions can be retried"};
        }
        if (rec.retry_count >= rec.max_retries) {
            return Error{ErrorCode::RetryExhausted,
                         "Execution " + id + " has used all " + std::to_string(rec.max_retries)
                         + " retries; submit a new execution"};
        }
        if (!reserve_queue_slot()) {
            return Error{ErrorCode::CapacityExceeded,
                         "Execution queue is full (" + std::to_string(config_.max_queue_depth) + " queued)"};
        }

        rec.attempts.push_back(AttemptSummary{
            .attempt = rec.retry_count + 1,
            .status = rec.status,
            .error_message = rec.error_message,
            .started_at = rec.started_at,
            .completed_at = rec.completed_at,
            .execution_time_ms = rec.execution_time_ms(),
        });

        rec.status = ExecutionStatus::Queued;
        rec.output.reset();
        rec.error_message.reset();
        rec.started_at.reset();
        rec.completed_at.reset();
        rec.peak_memory_bytes.reset();
        rec.queued_at = std::chrono::system_clock::now();
        rec.retry_count += 1;
        snapshot = rec;

        enqueue(QueueItem{rec.id, rec.retry_count});
    }

    log_.info("Execution retried",
              {{"execution", id}, {"retry", std::to_string(snapshot.retry_count)},
               {"max_retries", std::to_string(snapshot.max_retries)}});
    emit(snapshot);
    wake();
    return snapshot;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<ExecutionRecord> ExecutionOrchestrator::get(const ExecutionId& id) const {
    auto entry = store_.find(id);
    if (!entry) {
        return Error{ErrorCode::NotFound, "Execution not found: " + id};
    }
    std::lock_guard lock(entry->mutex);
    return entry->record;
}

std::vector<ExecutionRecord> ExecutionOrchestrator::list_by_agent(const AgentId& agent_id) const {
    return store_.list_by_agent(agent_id);
}

std::vector<ExecutionRecord> ExecutionOrchestrator::list_by_submission(
    const std::string& submission_id) const {
    return store_.list_by_submission(submission_id);
}

OrchestratorStats ExecutionOrchestrator::stats() const {
    OrchestratorStats stats;
    for (const auto& entry : store_.all()) {
        ExecutionStatus status;
        {
            std::lock_guard lock(entry->mutex);
            status = entry->record.status;
        }
        ++stats.total;
        switch (status) {
            case ExecutionStatus::Queued:       ++stats.queued; break;
            case ExecutionStatus::Initializing: ++stats.initializing; break;
            case ExecutionStatus::Running:      ++stats.running; break;
            case ExecutionStatus::Completed:    ++stats.completed; break;
            case ExecutionStatus::Failed:       ++stats.failed; break;
            case ExecutionStatus::Timeout:      ++stats.timed_out; break;
            case ExecutionStatus::Cancelled:    ++stats.cancelled; break;
        }
    }
    stats.queue_depth = queued_count_.load();
    return stats;
}

// ─────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────

size_t ExecutionOrchestrator::advance() {
    std::lock_guard advance_lock(advance_mutex_);

    size_t dispatched = 0;
    while (accepting_.load()) {
        QueueItem head;
        {
            std::lock_guard lock(queue_mutex_);
            if (queue_.empty()) break;
            head = queue_.front();
        }

        auto outcome = try_dispatch(head);
        if (outcome == Dispatch::NoInstance) break;

        // cancel() may already have removed a stale head
        dequeue(head);
        if (outcome == Dispatch::Started) ++dispatched;
    }
    return dispatched;
}

ExecutionOrchestrator::Dispatch ExecutionOrchestrator::try_dispatch(const QueueItem& item) {
    auto entry = store_.find(item.id);
    if (!entry) return Dispatch::Stale;

    InstanceHandle instance;
    std::stop_token stop_token;
    SteadyTime deadline;
    ExecutionRecord snapshot;
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        // Cancelled or superseded while waiting; never touches the pool
        if (rec.status != ExecutionStatus::Queued || rec.retry_count != item.attempt) {
            return Dispatch::Stale;
        }

        instance = pool_.acquire();
        if (!instance) return Dispatch::NoInstance;

        rec.status = ExecutionStatus::Initializing;
        rec.started_at = std::chrono::system_clock::now();
        queued_count_.fetch_sub(1);
        entry->instance = instance;
        entry->stop = std::stop_source{};
        stop_token = entry->stop.get_token();
        deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(rec.timeout_ms);
        snapshot = rec;
    }

    watchdog_.arm(item.id, item.attempt, deadline);
    log_.debug("Execution dispatched", {{"execution", item.id}, {"instance", instance->id()}});
    emit(snapshot);

    bool posted = workers_.post([this, entry, attempt = item.attempt, instance, stop_token] {
        run_attempt(entry, attempt, instance, stop_token);
    });
    if (!posted) {
        fail(*entry, item.attempt, "Orchestrator is shutting down");
        pool_.release(instance, true);
    }
    return Dispatch::Started;
}

// ─────────────────────────────────────────────
// Worker
// ─────────────────────────────────────────────

void ExecutionOrchestrator::run_attempt(const ExecutionStore::EntryPtr& entry, uint32_t attempt,
                                        InstanceHandle instance, std::stop_token stop) {
    SandboxRequest request;
    AgentId agent_id;
    {
        std::lock_guard lock(entry->mutex);
        const auto& rec = entry->record;
        request.execution_id = rec.id;
        request.input = rec.input;
        request.timeout = Duration(rec.timeout_ms);
        agent_id = rec.agent_id;
    }

    auto code = catalog_.lookup(agent_id);
    if (!code) {
        fail(*entry, attempt, code.error().message);
        pool_.release(instance, !timed_out(*entry, attempt));
        return;
    }
    request.code = std::move(code->source);

    ExecutionRecord snapshot;
    bool proceed = false;
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        if (rec.retry_count == attempt
            && is_valid_transition(rec.status, ExecutionStatus::Running)) {
            rec.status = ExecutionStatus::Running;
            snapshot = rec;
            proceed = true;
        }
    }
    if (!proceed) {
        // Cancelled or timed out while initializing
        pool_.release(instance, !timed_out(*entry, attempt));
        return;
    }
    emit(snapshot);

    Result<SandboxOutcome> result = Error{ErrorCode::Internal, "Sandbox did not run"};
    try {
        result = instance->run(request, stop);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::ExecutionFailed, std::string{"Sandbox raised: "} + e.what()};
    }

    bool healthy = true;
    if (result) {
        record_run(*entry, attempt, *result);
        interpret(entry, attempt, *result);
        healthy = result->instance_healthy();
    } else {
        fail(*entry, attempt, result.error().message);
    }

    pool_.release(instance, healthy && !timed_out(*entry, attempt));
}

void ExecutionOrchestrator::interpret(const ExecutionStore::EntryPtr& entry, uint32_t attempt,
                                      const SandboxOutcome& outcome) {
    if (outcome.stop_requested) {
        // Stopped by cancel, which already owns the terminal transition
        return;
    }
    if (outcome.terminated) {
        fail(*entry, attempt, "Sandbox instance was terminated");
        return;
    }
    if (!outcome.exited_cleanly()) {
        std::string message = outcome.term_signal != 0
            ? "Execution terminated by signal " + std::to_string(outcome.term_signal)
            : "Execution exited with code " + std::to_string(outcome.exit_code);
        if (auto tail = stderr_tail(outcome.stderr_text); !tail.empty()) {
            message += ": " + tail;
        }
        fail(*entry, attempt, std::move(message));
        return;
    }

    auto payload = trim(outcome.stdout_text);
    if (payload.empty()) {
        fail(*entry, attempt, "Execution produced no result");
        return;
    }
    if (outcome.stdout_truncated || !nlohmann::json::accept(payload)) {
        fail(*entry, attempt, "Execution produced malformed output");
        return;
    }
    complete(*entry, attempt, std::string{payload});
}

void ExecutionOrchestrator::record_run(ExecutionEntry& entry, uint32_t attempt,
                                       const SandboxOutcome& outcome) {
    std::lock_guard lock(entry.mutex);
    auto& rec = entry.record;
    if (rec.retry_count != attempt) return;

    if (!outcome.stderr_text.empty()) {
        if (attempt > 0) {
            rec.logs += "--- attempt " + std::to_string(attempt + 1) + " ---\n";
        }
        rec.logs += outcome.stderr_text;
        if (rec.logs.back() != '\n') rec.logs += '\n';
    }
    if (outcome.peak_memory_bytes) {
        rec.peak_memory_bytes = outcome.peak_memory_bytes;
    }
}

// ─────────────────────────────────────────────
// Terminal transitions
// ─────────────────────────────────────────────

bool ExecutionOrchestrator::finish(ExecutionEntry& entry, uint32_t attempt, ExecutionStatus to,
                                   std::optional<std::string> output,
                                   std::optional<std::string> error) {
    ExecutionRecord snapshot;
    {
        std::lock_guard lock(entry.mutex);
        auto& rec = entry.record;
        if (rec.retry_count != attempt || !is_valid_transition(rec.status, to)) {
            return false;
        }
        rec.status = to;
        rec.output = std::move(output);
        rec.error_message = std::move(error);
        rec.completed_at = std::chrono::system_clock::now();
        entry.instance.reset();
        snapshot = rec;
    }

    if (to == ExecutionStatus::Completed) {
        log_.info("Execution completed",
                  {{"execution", snapshot.id},
                   {"duration_ms", std::to_string(snapshot.execution_time_ms().value_or(0))}});
    } else {
        log_.warn("Execution ended",
                  {{"execution", snapshot.id}, {"status", to_string(to)},
                   {"error", snapshot.error_message.value_or("")}});
    }
    emit(snapshot);
    return true;
}

bool ExecutionOrchestrator::complete(ExecutionEntry& entry, uint32_t attempt, std::string output) {
    return finish(entry, attempt, ExecutionStatus::Completed, std::move(output), std::nullopt);
}

bool ExecutionOrchestrator::fail(ExecutionEntry& entry, uint32_t attempt, std::string error) {
    return finish(entry, attempt, ExecutionStatus::Failed, std::nullopt, std::move(error));
}

bool ExecutionOrchestrator::timed_out(ExecutionEntry& entry, uint32_t attempt) const {
    std::lock_guard lock(entry.mutex);
    return entry.record.retry_count == attempt
        && entry.record.status == ExecutionStatus::Timeout;
}

void ExecutionOrchestrator::on_deadline(const ExecutionId& id, uint32_t attempt) {
    auto entry = store_.find(id);
    if (!entry) return;

    InstanceHandle instance;
    ExecutionRecord snapshot;
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        if (rec.retry_count != attempt
            || !is_valid_transition(rec.status, ExecutionStatus::Timeout)) {
            return;
        }
        rec.status = ExecutionStatus::Timeout;
        rec.output.reset();
        rec.error_message = "Execution timed out after " + std::to_string(rec.timeout_ms) + " ms";
        rec.completed_at = std::chrono::system_clock::now();
        instance = std::move(entry->instance);
        entry->stop.request_stop();
        snapshot = rec;
    }

    // Forced teardown; the worker releases the dead instance as unhealthy
    if (instance) instance->terminate();

    log_.warn("Execution timed out",
              {{"execution", id}, {"timeout_ms", std::to_string(snapshot.timeout_ms)}});
    emit(snapshot);
}

// ─────────────────────────────────────────────
// Scheduling
// ─────────────────────────────────────────────

void ExecutionOrchestrator::scheduler_loop(std::stop_token stop) {
    const auto tick = std::chrono::milliseconds(std::max<uint32_t>(1, config_.scheduler_tick_ms));
    while (!stop.stop_requested()) {
        try {
            advance();
        } catch (const std::exception& e) {
            log_.error("Scheduler tick failed", {{"error", e.what()}});
        }

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, tick, [this] { return wake_pending_; });
        wake_pending_ = false;
    }
}

void ExecutionOrchestrator::wake() {
    {
        std::lock_guard lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_all();
}

void ExecutionOrchestrator::enqueue(QueueItem item) {
    std::lock_guard lock(queue_mutex_);
    queue_.push_back(std::move(item));
}

void ExecutionOrchestrator::dequeue(const QueueItem& item) {
    std::lock_guard lock(queue_mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const QueueItem& queued) {
        return queued.attempt == item.attempt && queued.id == item.id;
    });
    if (it != queue_.end()) queue_.erase(it);
}

size_t ExecutionOrchestrator::queue_length() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

bool ExecutionOrchestrator::reserve_queue_slot() noexcept {
    if (config_.max_queue_depth == 0) {
        queued_count_.fetch_add(1);
        return true;
    }
    uint64_t current = queued_count_.load();
    do {
        if (current >= config_.max_queue_depth) return false;
    } while (!queued_count_.compare_exchange_weak(current, current + 1));
    return true;
}

ExecutionId ExecutionOrchestrator::next_id() {
    return "exec-" + std::to_string(next_id_.fetch_add(1));
}

void ExecutionOrchestrator::emit(const ExecutionRecord& record) {
    if (metrics_) metrics_->record_execution_event(record);
}

}  // namespace sandbox_orchestrator
