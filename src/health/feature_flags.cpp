/**
 * @file feature_flags.cpp
 * @brief FeatureFlagService implementation.
 */

#include "health/feature_flags.hpp"

#include "core/concepts.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace sandbox_orchestrator {

namespace {

struct BuiltinFlag {
    std::string_view name;
    std::string_view description;
};

constexpr std::array<BuiltinFlag, 4> kBuiltinFlags{{
    {"USE_WASMTIME_SANDBOX", "Use Wasmtime for agent sandbox execution"},
    {"USE_UPSTASH_REDIS", "Use Upstash Redis for caching and rate limiting"},
    {"USE_UPSTASH_KAFKA", "Use Upstash Kafka for job queue processing"},
    {"USE_R2_STORAGE", "Use Cloudflare R2 for file storage"},
}};

/**
 * @brief Call @p emit with each UTF-16 code unit of the UTF-8 @p text.
 *
 * Code points above U+FFFF become surrogate pairs. A byte that does not
 * start a well-formed sequence is emitted as a unit of its own.
 */
template <typename Emit>
void for_each_utf16_unit(std::string_view text, Emit&& emit) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            emit(static_cast<uint32_t>(lead));
            ++i;
            continue;
        }
        size_t extra = lead >= 0xF0 && lead <= 0xF4 ? 3
                     : lead >= 0xE0 && lead <= 0xEF ? 2
                     : lead >= 0xC2 && lead <= 0xDF ? 1
                                                    : 0;
        uint32_t code_point = extra == 3 ? lead & 0x07u : extra == 2 ? lead & 0x0Fu : lead & 0x1Fu;
        bool well_formed = extra > 0 && i + extra < text.size();
        for (size_t k = 1; well_formed && k <= extra; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            well_formed = (next & 0xC0u) == 0x80u;
            code_point = (code_point << 6) | (next & 0x3Fu);
        }
        if (well_formed && ((extra == 2 && (code_point < 0x800 || (code_point >= 0xD800
                                                                   && code_point <= 0xDFFF)))
                            || (extra == 3 && (code_point < 0x10000 || code_point > 0x10FFFF)))) {
            well_formed = false;
        }

        if (!well_formed) {
            emit(static_cast<uint32_t>(lead));
            ++i;
            continue;
        }
        if (code_point > 0xFFFF) {
            code_point -= 0x10000;
            emit(0xD800u + (code_point >> 10));
            emit(0xDC00u + (code_point & 0x3FFu));
        } else {
            emit(code_point);
        }
        i += extra + 1;
    }
}

uint32_t clamp_percentage(int64_t percentage) {
    return static_cast<uint32_t>(std::clamp<int64_t>(percentage, 0, 100));
}

}  // namespace

FeatureFlagService::FeatureFlagService() {
    for (const auto& builtin : kBuiltinFlags) {
        Flag flag;
        flag.description = std::string(builtin.description);
        flags_.emplace(std::string(builtin.name), std::move(flag));
    }
}

FeatureFlagService::FeatureFlagService(const std::map<std::string, FeatureFlagConfig>& config)
    : FeatureFlagService() {
    for (const auto& [name, flag_cfg] : config) {
        auto it = flags_.find(name);
        if (it == flags_.end()) {
            register_flag(name, flag_cfg);
            continue;
        }
        it->second.enabled = flag_cfg.enabled;
        it->second.rollout_percentage = clamp_percentage(flag_cfg.rollout_percentage);
        if (!flag_cfg.description.empty()) it->second.description = flag_cfg.description;
    }
}

// ─────────────────────────────────────────────
// Evaluation
// ─────────────────────────────────────────────

bool FeatureFlagService::is_enabled(std::string_view name,
                                    std::optional<std::string_view> user_id) {
    std::lock_guard lock(mutex_);
    Flag* flag = find_locked(name);
    if (!flag) {
        log_locked(name, false, FlagReason::Default, user_id);
        return false;
    }

    if (user_id) {
        auto it = flag->user_overrides.find(std::string(*user_id));
        if (it != flag->user_overrides.end()) {
            log_locked(name, it->second, FlagReason::UserOverride, user_id);
            return it->second;
        }
    }

    if (!flag->enabled) {
        log_locked(name, false, FlagReason::Disabled, user_id);
        return false;
    }

    bool enabled = false;
    if (flag->rollout_percentage >= 100) {
        enabled = true;
    } else if (flag->rollout_percentage > 0) {
        // Anonymous callers land in a time-derived bucket
        std::string seed = user_id ? std::string(*user_id)
                                   : std::to_string(SystemClock{}.now_ms());
        enabled = rollout_bucket(name, seed) < flag->rollout_percentage;
    }
    log_locked(name, enabled, FlagReason::Rollout, user_id);
    return enabled;
}

uint32_t FeatureFlagService::rollout_bucket(std::string_view flag, std::string_view user_id) {
    std::string seed;
    seed.reserve(flag.size() + user_id.size() + 1);
    seed.append(flag).append(":").append(user_id);

    uint32_t hash = 0;
    for_each_utf16_unit(seed, [&hash](uint32_t unit) { hash = (hash << 5) - hash + unit; });
    auto magnitude = std::llabs(static_cast<int64_t>(static_cast<int32_t>(hash)));
    return static_cast<uint32_t>(magnitude % 100);
}

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

bool FeatureFlagService::set_enabled(std::string_view name, bool enabled) {
    std::lock_guard lock(mutex_);
    Flag* flag = find_locked(name);
    if (!flag) return false;
    flag->enabled = enabled;
    return true;
}

bool FeatureFlagService::set_rollout_percentage(std::string_view name, int percentage) {
    std::lock_guard lock(mutex_);
    Flag* flag = find_locked(name);
    if (!flag) return false;
    flag->rollout_percentage = clamp_percentage(percentage);
    return true;
}

bool FeatureFlagService::set_user_override(std::string_view name, std::string_view user_id,
                                           bool enabled) {
    std::lock_guard lock(mutex_);
    Flag* flag = find_locked(name);
    if (!flag) return false;
    flag->user_overrides[std::string(user_id)] = enabled;
    return true;
}

bool FeatureFlagService::remove_user_override(std::string_view name, std::string_view user_id) {
    std::lock_guard lock(mutex_);
    Flag* flag = find_locked(name);
    if (!flag) return false;
    return flag->user_overrides.erase(std::string(user_id)) > 0;
}

void FeatureFlagService::register_flag(std::string name, FeatureFlagConfig config) {
    std::lock_guard lock(mutex_);
    if (flags_.contains(name)) return;

    Flag flag;
    flag.enabled = config.enabled;
    flag.rollout_percentage = clamp_percentage(config.rollout_percentage);
    flag.description = std::move(config.description);
    flags_.emplace(std::move(name), std::move(flag));
}

// ─────────────────────────────────────────────
// Observation
// ─────────────────────────────────────────────

std::map<std::string, FlagSnapshot> FeatureFlagService::snapshot() const {
    std::lock_guard lock(mutex_);
    std::map<std::string, FlagSnapshot> result;
    for (const auto& [name, flag] : flags_) {
        result.emplace(name, FlagSnapshot{flag.enabled, flag.rollout_percentage,
                                          flag.description, flag.user_overrides.size()});
    }
    return result;
}

std::optional<FlagSnapshot> FeatureFlagService::flag(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = flags_.find(name);
    if (it == flags_.end()) return std::nullopt;
    const Flag& f = it->second;
    return FlagSnapshot{f.enabled, f.rollout_percentage, f.description, f.user_overrides.size()};
}

std::vector<FlagEvaluation> FeatureFlagService::evaluation_log(size_t limit) const {
    std::lock_guard lock(mutex_);
    size_t count = std::min(limit, log_.size());
    return {log_.end() - static_cast<std::ptrdiff_t>(count), log_.end()};
}

void FeatureFlagService::clear_evaluation_log() {
    std::lock_guard lock(mutex_);
    log_.clear();
}

FeatureFlagService::Flag* FeatureFlagService::find_locked(std::string_view name) {
    auto it = flags_.find(name);
    return it == flags_.end() ? nullptr : &it->second;
}

void FeatureFlagService::log_locked(std::string_view flag, bool enabled, FlagReason reason,
                                    std::optional<std::string_view> user_id) {
    FlagEvaluation evaluation{std::string(flag), enabled, reason, std::nullopt,
                              std::chrono::system_clock::now()};
    if (user_id) evaluation.user_id = std::string(*user_id);
    log_.push_back(std::move(evaluation));

    // Past the cap, keep only the most recent half
    if (log_.size() > kMaxLogSize) {
        log_.erase(log_.begin(), log_.end() - static_cast<std::ptrdiff_t>(kMaxLogSize / 2));
    }
}

}  // namespace sandbox_orchestrator
