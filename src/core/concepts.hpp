/**
 * @file concepts.hpp
 * @brief C++20 concept definitions and the clocks that satisfy them.
 *
 * Time sources on hot paths (every rate-limit check) are injected as
 * template parameters rather than virtual interfaces.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// ClockLike
// ─────────────────────────────────────────────

/**
 * @concept ClockLike
 * @brief Constrains types that report wall-clock time in epoch milliseconds.
 */
template <typename T>
concept ClockLike = requires(const T clock) {
    { clock.now_ms() } -> std::convertible_to<int64_t>;
};

/**
 * @brief Wall clock backed by std::chrono::system_clock.
 */
struct SystemClock {
    [[nodiscard]] int64_t now_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/**
 * @brief Manually advanced clock for deterministic tests.
 *
 * Copies share one time source, so a component holding a copy observes
 * every advance() made through the test's instance.
 */
class ManualClock {
public:
    explicit ManualClock(int64_t start_ms = 0)
        : now_(std::make_shared<std::atomic<int64_t>>(start_ms)) {}

    [[nodiscard]] int64_t now_ms() const noexcept { return now_->load(); }
    void advance(int64_t delta_ms) noexcept { now_->fetch_add(delta_ms); }
    void set(int64_t now_ms) noexcept { now_->store(now_ms); }

private:
    std::shared_ptr<std::atomic<int64_t>> now_;
};

static_assert(ClockLike<SystemClock>);
static_assert(ClockLike<ManualClock>);

// ─────────────────────────────────────────────
// Time formatting
// ─────────────────────────────────────────────

[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

/**
 * @brief Format a timestamp as ISO 8601 UTC with millisecond precision.
 */
[[nodiscard]] inline std::string format_iso8601(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace sandbox_orchestrator
