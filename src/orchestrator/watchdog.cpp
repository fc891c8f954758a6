/**
 * @file watchdog.cpp
 * @brief Watchdog implementation.
 */

#include "orchestrator/watchdog.hpp"

namespace sandbox_orchestrator {

Watchdog::Watchdog(ExpiryHandler handler)
    : handler_(std::move(handler)) {}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void Watchdog::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    cv_.notify_all();
    thread_.join();
}

void Watchdog::arm(ExecutionId id, uint32_t attempt, SteadyTime deadline) {
    {
        std::lock_guard lock(mutex_);
        deadlines_.push(Deadline{deadline, std::move(id), attempt});
    }
    cv_.notify_all();
}

size_t Watchdog::pending() const {
    std::lock_guard lock(mutex_);
    return deadlines_.size();
}

void Watchdog::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (deadlines_.empty()) {
            cv_.wait(lock, stop, [this] { return !deadlines_.empty(); });
            continue;
        }

        auto next_at = deadlines_.top().at;
        if (std::chrono::steady_clock::now() < next_at) {
            // Re-evaluate when an earlier deadline is armed
            cv_.wait_until(lock, stop, next_at, [this, next_at] {
                return !deadlines_.empty() && deadlines_.top().at < next_at;
            });
            continue;
        }

        Deadline due = deadlines_.top();
        deadlines_.pop();
        lock.unlock();
        handler_(due.id, due.attempt);
        lock.lock();
    }
}

}  // namespace sandbox_orchestrator
