/**
 * @file rate_limit_policy.cpp
 * @brief Rate-limit presets and identity resolution.
 */

#include "ratelimit/rate_limit_policy.hpp"

namespace sandbox_orchestrator {

std::optional<RouteCategory> parse_route_category(std::string_view name) noexcept {
    if (name == "api")        return RouteCategory::GeneralApi;
    if (name == "auth")       return RouteCategory::Authentication;
    if (name == "credential") return RouteCategory::CredentialAccess;
    if (name == "ai")         return RouteCategory::SandboxExecution;
    if (name == "payment" || name == "stripe") return RouteCategory::Billing;
    return std::nullopt;
}

RateLimitRule default_rule(RouteCategory category) {
    switch (category) {
        case RouteCategory::GeneralApi:
            return {60 * 1000, 100,
                    "API rate limit exceeded. Please wait before making more requests."};
        case RouteCategory::Authentication:
            return {15 * 60 * 1000, 10,
                    "Too many authentication attempts. Please try again later."};
        case RouteCategory::CredentialAccess:
            return {60 * 1000, 5, "Too many credential access attempts. Please wait."};
        case RouteCategory::SandboxExecution:
            return {60 * 1000, 20, "AI execution rate limit exceeded. Please wait."};
        case RouteCategory::Billing:
            return {60 * 1000, 10, "Too many payment requests. Please wait."};
    }
    return RateLimitRule{};
}

RateLimitPolicy::RateLimitPolicy() {
    for (size_t i = 0; i < kRouteCategoryCount; ++i) {
        rules_[i] = default_rule(static_cast<RouteCategory>(i));
    }
}

Result<RateLimitPolicy> RateLimitPolicy::from_config(const RateLimitConfig& config) {
    RateLimitPolicy policy;
    policy.enabled_ = config.enabled;

    for (const auto& [name, override_cfg] : config.presets) {
        auto category = parse_route_category(name);
        if (!category) {
            return Error{ErrorCode::InvalidArgument, "Unknown rate limit preset: " + name};
        }

        RateLimitRule rule = policy.rule(*category);
        if (override_cfg.window_ms) rule.window_ms = *override_cfg.window_ms;
        if (override_cfg.max_requests) rule.max_requests = *override_cfg.max_requests;
        if (override_cfg.message) rule.message = *override_cfg.message;

        if (rule.window_ms == 0 || rule.max_requests == 0) {
            return Error{ErrorCode::InvalidArgument,
                         "Rate limit preset " + name + " needs a positive window_ms and max_requests"};
        }
        policy.set_rule(*category, std::move(rule));
    }
    return policy;
}

void RateLimitPolicy::set_rule(RouteCategory category, RateLimitRule rule) {
    rules_[static_cast<size_t>(category)] = std::move(rule);
}

std::string resolve_identity(const RequestIdentity& identity) {
    if (identity.session_user && !identity.session_user->empty()) return *identity.session_user;
    if (identity.token_subject && !identity.token_subject->empty()) return *identity.token_subject;
    if (identity.remote_address && !identity.remote_address->empty()) return *identity.remote_address;
    return "anonymous";
}

}  // namespace sandbox_orchestrator
