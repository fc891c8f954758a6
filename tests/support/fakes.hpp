/**
 * @file fakes.hpp
 * @brief Scriptable sandbox doubles and polling helpers shared by the tests.
 */

#pragma once

#include "core/result.hpp"
#include "sandbox/sandbox.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace sandbox_orchestrator::testing {

using RunScript = std::function<Result<SandboxOutcome>(const SandboxRequest&, std::stop_token)>;

/// A run that exited with @p exit_code after printing @p out / @p err.
inline SandboxOutcome exited(std::string out, int exit_code = 0, std::string err = {}) {
    SandboxOutcome outcome;
    outcome.exit_code = exit_code;
    outcome.stdout_text = std::move(out);
    outcome.stderr_text = std::move(err);
    outcome.duration = Duration{1};
    return outcome;
}

/// Block until the stop token fires (or @p limit passes), like a hung agent.
inline SandboxOutcome hang_until_stopped(std::stop_token stop,
                                         std::chrono::milliseconds limit = std::chrono::seconds(10)) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, limit, [] { return false; });

    SandboxOutcome outcome = exited("{\"late\":true}");
    outcome.stop_requested = stop.stop_requested();
    return outcome;
}

/**
 * @brief State shared by a FakeSandboxFactory and every instance it made.
 */
struct FakeSandboxState {
    std::mutex mutex;
    RunScript script;
    int init_failures_remaining{0};
    bool fail_reset{false};

    std::atomic<int> created{0};
    std::atomic<int> initialized{0};
    std::atomic<int> runs{0};
    std::atomic<int> resets{0};
    std::atomic<int> terminations{0};
};

class FakeSandbox final : public ISandboxInstance {
public:
    FakeSandbox(InstanceId id, std::shared_ptr<FakeSandboxState> state)
        : id_(std::move(id)), state_(std::move(state)) {}

    [[nodiscard]] const InstanceId& id() const noexcept override { return id_; }

    Result<void> initialize() override {
        std::lock_guard lock(state_->mutex);
        if (state_->init_failures_remaining > 0) {
            --state_->init_failures_remaining;
            return Error{ErrorCode::PoolInitFailure, "fake init failure"};
        }
        ++state_->initialized;
        return {};
    }

    Result<SandboxOutcome> run(const SandboxRequest& request, std::stop_token stop) override {
        ++state_->runs;
        RunScript script;
        {
            std::lock_guard lock(state_->mutex);
            script = state_->script;
        }
        if (!script) return exited("{\"ok\":true}");
        return script(request, stop);
    }

    Result<void> reset() override {
        ++state_->resets;
        std::lock_guard lock(state_->mutex);
        if (state_->fail_reset) return Error{ErrorCode::Internal, "fake reset failure"};
        return {};
    }

    void terminate() noexcept override {
        if (!terminated_.exchange(true)) ++state_->terminations;
    }

    [[nodiscard]] bool is_terminated() const noexcept { return terminated_.load(); }

private:
    InstanceId id_;
    std::shared_ptr<FakeSandboxState> state_;
    std::atomic<bool> terminated_{false};
};

class FakeSandboxFactory final : public ISandboxFactory {
public:
    FakeSandboxFactory() : state_(std::make_shared<FakeSandboxState>()) {}

    std::unique_ptr<ISandboxInstance> create(InstanceId id) override {
        ++state_->created;
        return std::make_unique<FakeSandbox>(std::move(id), state_);
    }

    void set_script(RunScript script) {
        std::lock_guard lock(state_->mutex);
        state_->script = std::move(script);
    }

    void fail_next_inits(int count) {
        std::lock_guard lock(state_->mutex);
        state_->init_failures_remaining = count;
    }

    void set_fail_reset(bool fail) {
        std::lock_guard lock(state_->mutex);
        state_->fail_reset = fail;
    }

    [[nodiscard]] FakeSandboxState& state() noexcept { return *state_; }

private:
    std::shared_ptr<FakeSandboxState> state_;
};

/// Poll @p pred every few milliseconds until it holds or @p timeout passes.
template <typename Pred>
bool wait_until(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}  // namespace sandbox_orchestrator::testing
