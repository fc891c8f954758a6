/**
 * @file process_sandbox.hpp
 * @brief Sandbox instances backed by a scratch directory and a child process.
 *
 * Each attempt stages the agent code into the instance directory and runs the
 * configured interpreter in its own process group under rlimits. stdout is
 * the result payload, stderr the run's logs.
 */

#pragma once

#include "core/config.hpp"
#include "sandbox/sandbox.hpp"

#include <sys/types.h>

#include <atomic>
#include <filesystem>
#include <mutex>

namespace sandbox_orchestrator {

/**
 * @brief ISandboxInstance running agents as rlimited child processes.
 */
class ProcessSandbox final : public ISandboxInstance {
public:
    ProcessSandbox(InstanceId id, SandboxConfig config, const std::filesystem::path& root_dir);
    ~ProcessSandbox() override;

    ProcessSandbox(const ProcessSandbox&) = delete;
    ProcessSandbox& operator=(const ProcessSandbox&) = delete;

    [[nodiscard]] const InstanceId& id() const noexcept override { return id_; }

    /// Create the scratch directory and verify the interpreter is executable.
    Result<void> initialize() override;

    Result<SandboxOutcome> run(const SandboxRequest& request, std::stop_token stop) override;

    /// Wipe the scratch directory.
    Result<void> reset() override;

    /// SIGKILL the running process group (if any); the instance is dead afterwards.
    void terminate() noexcept override;

    [[nodiscard]] const std::filesystem::path& work_dir() const noexcept { return work_dir_; }
    [[nodiscard]] bool is_terminated() const noexcept { return terminated_.load(); }

private:
    Result<void> stage(const SandboxRequest& request);

    InstanceId id_;
    SandboxConfig config_;
    std::filesystem::path work_dir_;

    std::mutex pid_mutex_;
    pid_t child_pid_{-1};
    std::atomic<bool> terminated_{false};
};

/**
 * @brief Factory handing out ProcessSandbox instances under one root directory.
 */
class ProcessSandboxFactory final : public ISandboxFactory {
public:
    ProcessSandboxFactory(SandboxConfig config, std::filesystem::path root_dir);

    std::unique_ptr<ISandboxInstance> create(InstanceId id) override;

private:
    SandboxConfig config_;
    std::filesystem::path root_dir_;
};

}  // namespace sandbox_orchestrator
