/**
 * @file watchdog.hpp
 * @brief Deadline timer enforcing per-attempt timeouts.
 *
 * Runs on its own thread, independent of the workers driving sandboxes, so a
 * runaway execution is timed out even if nothing else makes progress.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sandbox_orchestrator {

class Watchdog {
public:
    /// Called once per armed deadline, on the watchdog thread.
    using ExpiryHandler = std::function<void(const ExecutionId&, uint32_t attempt)>;

    explicit Watchdog(ExpiryHandler handler);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void start();
    void stop();

    /// Schedule @p handler for (id, attempt) at @p deadline. Stale deadlines
    /// are filtered by the handler, so there is no disarm.
    void arm(ExecutionId id, uint32_t attempt, SteadyTime deadline);

    [[nodiscard]] size_t pending() const;

private:
    struct Deadline {
        SteadyTime at;
        ExecutionId id;
        uint32_t attempt;

        bool operator>(const Deadline& other) const noexcept { return at > other.at; }
    };

    void run(std::stop_token stop);

    ExpiryHandler handler_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::priority_queue<Deadline, std::vector<Deadline>, std::greater<>> deadlines_;
    std::jthread thread_;
};

}  // namespace sandbox_orchestrator
