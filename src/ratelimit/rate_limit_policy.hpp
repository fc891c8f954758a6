/**
 * @file rate_limit_policy.hpp
 * @brief Route categories, their presets, and caller identity resolution.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "ratelimit/rate_limiter.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// Route categories
// ─────────────────────────────────────────────

/// Each category is counted independently for the same identity.
enum class RouteCategory : uint8_t {
    GeneralApi,
    Authentication,
    CredentialAccess,
    SandboxExecution,
    Billing
};

inline constexpr size_t kRouteCategoryCount = 5;

/// Preset name, also used as the route component of the counter key.
[[nodiscard]] constexpr std::string_view to_string(RouteCategory category) noexcept {
    switch (category) {
        case RouteCategory::GeneralApi:       return "api";
        case RouteCategory::Authentication:   return "auth";
        case RouteCategory::CredentialAccess: return "credential";
        case RouteCategory::SandboxExecution: return "ai";
        case RouteCategory::Billing:          return "payment";
    }
    return "api";
}

/// Accepts the preset names above; "stripe" is an alias for "payment".
[[nodiscard]] std::optional<RouteCategory> parse_route_category(std::string_view name) noexcept;

/// Built-in window, quota and message for @p category.
[[nodiscard]] RateLimitRule default_rule(RouteCategory category);

/**
 * @brief Rules for every route category, after configuration overrides.
 */
class RateLimitPolicy {
public:
    RateLimitPolicy();

    /// Apply `[rate_limit.presets.<name>]` overrides. Unknown names and zero
    /// windows or quotas are rejected.
    static Result<RateLimitPolicy> from_config(const RateLimitConfig& config);

    [[nodiscard]] const RateLimitRule& rule(RouteCategory category) const noexcept {
        return rules_[static_cast<size_t>(category)];
    }

    void set_rule(RouteCategory category, RateLimitRule rule);

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

private:
    std::array<RateLimitRule, kRouteCategoryCount> rules_;
    bool enabled_ = true;
};

// ─────────────────────────────────────────────
// Identity
// ─────────────────────────────────────────────

/**
 * @brief What the transport knows about the caller.
 */
struct RequestIdentity {
    std::optional<std::string> session_user;    ///< Authenticated session principal
    std::optional<std::string> token_subject;   ///< Subject of a bearer token payload
    std::optional<std::string> remote_address;  ///< Peer network address
};

/**
 * @brief First present of session user, token subject, remote address;
 *        otherwise "anonymous". Empty strings count as absent.
 */
[[nodiscard]] std::string resolve_identity(const RequestIdentity& identity);

}  // namespace sandbox_orchestrator
