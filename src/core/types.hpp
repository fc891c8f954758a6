/**
 * @file types.hpp
 * @brief Fundamental types used throughout SandboxOrchestrator.
 *
 * Defines ExecutionId, ExecutionStatus, ExecutionRecord, and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_orchestrator {

inline constexpr std::string_view kServiceVersion = "1.0.0";

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ExecutionId = std::string;
using AgentId = std::string;
using InstanceId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Queued,        ///< Accepted, waiting for a pool instance
    Initializing,  ///< Instance acquired, agent code being staged
    Running,       ///< Sandboxed process executing
    Completed,     ///< Finished with well-formed output
    Failed,        ///< Errored or produced no usable output
    Timeout,       ///< Exceeded its wall-clock budget
    Cancelled      ///< Cancelled by the caller
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Queued:       return "queued";
        case ExecutionStatus::Initializing: return "initializing";
        case ExecutionStatus::Running:      return "running";
        case ExecutionStatus::Completed:    return "completed";
        case ExecutionStatus::Failed:       return "failed";
        case ExecutionStatus::Timeout:      return "timeout";
        case ExecutionStatus::Cancelled:    return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::Completed
        || status == ExecutionStatus::Failed
        || status == ExecutionStatus::Timeout
        || status == ExecutionStatus::Cancelled;
}

/// Terminal states a caller may retry from.
[[nodiscard]] constexpr bool is_retryable(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::Failed
        || status == ExecutionStatus::Timeout
        || status == ExecutionStatus::Cancelled;
}

/**
 * @brief Whether @p to is a legal successor of @p from within one attempt.
 *
 * Retry (terminal → queued) starts a new attempt and is not covered here.
 */
[[nodiscard]] constexpr bool is_valid_transition(ExecutionStatus from,
                                                 ExecutionStatus to) noexcept {
    switch (from) {
        case ExecutionStatus::Queued:
            return to == ExecutionStatus::Initializing || to == ExecutionStatus::Cancelled;
        case ExecutionStatus::Initializing:
            return to == ExecutionStatus::Running || to == ExecutionStatus::Cancelled
                || to == ExecutionStatus::Failed || to == ExecutionStatus::Timeout;
        case ExecutionStatus::Running:
            return to == ExecutionStatus::Completed || to == ExecutionStatus::Failed
                || to == ExecutionStatus::Timeout || to == ExecutionStatus::Cancelled;
        default:
            return false;
    }
}

// ─────────────────────────────────────────────
// Execution Record
// ─────────────────────────────────────────────

/**
 * @brief Summary of a finished attempt, kept when the record is retried.
 */
struct AttemptSummary {
    uint32_t attempt{0};
    ExecutionStatus status{ExecutionStatus::Failed};
    std::optional<std::string> error_message;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<int64_t> execution_time_ms;
};

/**
 * @brief One logical execution and the state of its current attempt.
 *
 * Invariants maintained by the orchestrator:
 *   output is set iff status == Completed,
 *   error_message is set iff status is Failed or Timeout,
 *   started_at is set only once a pool instance was acquired,
 *   retry_count <= max_retries.
 */
struct ExecutionRecord {
    ExecutionId id;
    AgentId agent_id;
    std::optional<std::string> submission_id;
    std::optional<std::string> bounty_id;

    ExecutionStatus status{ExecutionStatus::Queued};

    std::string input;                          ///< Caller payload (opaque JSON text)
    std::optional<std::string> output;          ///< Result JSON text
    std::string logs;                           ///< Captured stderr of the run
    std::optional<std::string> error_message;

    Timestamp queued_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    uint32_t timeout_ms{30000};
    uint32_t retry_count{0};
    uint32_t max_retries{3};
    std::optional<uint64_t> peak_memory_bytes;

    std::vector<AttemptSummary> attempts;       ///< Earlier attempts, oldest first

    /// completedAt - startedAt, when both are known.
    [[nodiscard]] std::optional<int64_t> execution_time_ms() const {
        if (!started_at || !completed_at) return std::nullopt;
        return std::chrono::duration_cast<Duration>(*completed_at - *started_at).count();
    }
};

}  // namespace sandbox_orchestrator
