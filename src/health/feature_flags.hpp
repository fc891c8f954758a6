/**
 * @file feature_flags.hpp
 * @brief Runtime feature flags with percentage rollout and per-user overrides.
 *
 * Evaluation order for is_enabled(flag, user):
 *   1. unknown flag              -> false
 *   2. override for that user    -> override value
 *   3. flag disabled             -> false
 *   4. rollout >= 100 / <= 0     -> true / false
 *   5. rollout_bucket(flag, user) < rollout
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sandbox_orchestrator {

enum class FlagReason : uint8_t {
    Default,        ///< Flag not registered
    UserOverride,
    Rollout,
    Disabled
};

[[nodiscard]] constexpr std::string_view to_string(FlagReason reason) noexcept {
    switch (reason) {
        case FlagReason::Default:      return "default";
        case FlagReason::UserOverride: return "user_override";
        case FlagReason::Rollout:      return "rollout";
        case FlagReason::Disabled:     return "disabled";
    }
    return "default";
}

struct FlagEvaluation {
    std::string flag;
    bool enabled{false};
    FlagReason reason{FlagReason::Default};
    std::optional<std::string> user_id;
    Timestamp timestamp;
};

/// Externally visible state of one flag.
struct FlagSnapshot {
    bool enabled{false};
    uint32_t rollout_percentage{0};
    std::string description;
    size_t override_count{0};
};

class FeatureFlagService {
public:
    static constexpr size_t kMaxLogSize = 1000;

    /// Registers the built-in flags, all disabled.
    FeatureFlagService();

    /// Built-in flags, then `[feature_flags.<NAME>]` entries applied on top.
    explicit FeatureFlagService(const std::map<std::string, FeatureFlagConfig>& config);

    [[nodiscard]] bool is_enabled(std::string_view flag,
                                  std::optional<std::string_view> user_id = std::nullopt);

    bool set_enabled(std::string_view flag, bool enabled);
    /// Clamped to 0..100.
    bool set_rollout_percentage(std::string_view flag, int percentage);
    bool set_user_override(std::string_view flag, std::string_view user_id, bool enabled);
    /// False if the flag or the override does not exist.
    bool remove_user_override(std::string_view flag, std::string_view user_id);

    /// No-op when a flag of that name already exists.
    void register_flag(std::string name, FeatureFlagConfig config);

    [[nodiscard]] std::map<std::string, FlagSnapshot> snapshot() const;
    [[nodiscard]] std::optional<FlagSnapshot> flag(std::string_view name) const;

    /// Most recent @p limit evaluations, oldest first.
    [[nodiscard]] std::vector<FlagEvaluation> evaluation_log(size_t limit = 100) const;
    void clear_evaluation_log();

    /**
     * @brief Deterministic bucket in [0, 100) for @p flag and @p user_id.
     *
     * 31-multiplier hash over the UTF-16 code units of "flag:user" in 32-bit
     * two's complement, then absolute value, then modulo 100.
     */
    [[nodiscard]] static uint32_t rollout_bucket(std::string_view flag, std::string_view user_id);

private:
    struct Flag {
        bool enabled{false};
        uint32_t rollout_percentage{0};
        std::string description;
        std::unordered_map<std::string, bool> user_overrides;
    };

    Flag* find_locked(std::string_view name);
    void log_locked(std::string_view flag, bool enabled, FlagReason reason,
                    std::optional<std::string_view> user_id);

    mutable std::mutex mutex_;
    std::map<std::string, Flag, std::less<>> flags_;
    std::deque<FlagEvaluation> log_;
};

}  // namespace sandbox_orchestrator
