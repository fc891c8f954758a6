/**
 * @file sandbox.hpp
 * @brief Sandbox instance and factory interfaces.
 *
 * A sandbox instance is one isolated, reusable execution environment. The
 * warm pool owns instances; the orchestrator only ever borrows one for the
 * duration of a single attempt.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace sandbox_orchestrator {

/**
 * @brief Everything an instance needs to run one attempt.
 */
struct SandboxRequest {
    ExecutionId execution_id;
    std::string code;     ///< Agent source staged into the instance
    std::string input;    ///< Caller payload, fed on stdin
    Duration timeout{30000};
};

/**
 * @brief What the sandboxed process did.
 *
 * A non-zero exit or a signal is still a successful run() as far as the
 * instance is concerned; interpreting the outcome is the orchestrator's job.
 */
struct SandboxOutcome {
    int exit_code{0};
    int term_signal{0};             ///< Signal that ended the process, 0 if it exited
    bool stop_requested{false};     ///< Cooperative stop was observed
    bool forced_kill{false};        ///< Process ignored SIGTERM and was SIGKILLed
    bool terminated{false};         ///< Killed through terminate()
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    Duration duration{0};
    std::optional<uint64_t> peak_memory_bytes;

    /// Whether the instance is in a known state and may be recycled.
    [[nodiscard]] bool instance_healthy() const noexcept {
        return !forced_kill && !terminated;
    }

    [[nodiscard]] bool exited_cleanly() const noexcept {
        return term_signal == 0 && exit_code == 0 && !stop_requested && !terminated;
    }
};

// ─────────────────────────────────────────────
// ISandboxInstance (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief One isolated execution environment.
 *
 * initialize(), run() and reset() are called by one owner at a time.
 * terminate() may be called from any thread, including while run() is in
 * progress, and leaves the instance unusable.
 */
class ISandboxInstance {
public:
    virtual ~ISandboxInstance() = default;

    [[nodiscard]] virtual const InstanceId& id() const noexcept = 0;

    virtual Result<void> initialize() = 0;
    virtual Result<SandboxOutcome> run(const SandboxRequest& request, std::stop_token stop) = 0;
    virtual Result<void> reset() = 0;
    virtual void terminate() noexcept = 0;
};

/**
 * @brief Creates uninitialized instances for the warm pool.
 */
class ISandboxFactory {
public:
    virtual ~ISandboxFactory() = default;

    virtual std::unique_ptr<ISandboxInstance> create(InstanceId id) = 0;
};

}  // namespace sandbox_orchestrator
