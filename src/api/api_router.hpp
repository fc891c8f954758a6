/**
 * @file api_router.hpp
 * @brief Maps API requests onto orchestrator operations.
 *
 * Routes:
 *   POST /api/executions                          submit        (ai preset)
 *   POST /api/executions/{id}/cancel              cancel        (api preset)
 *   POST /api/executions/{id}/retry               retry         (ai preset)
 *   GET  /api/executions/{id}                     get           (api preset)
 *   GET  /api/agents/{agentId}/executions         list by agent (api preset)
 *   GET  /api/submissions/{id}/executions         list by submission (api preset)
 *   GET  /api/health | /api/ready | /api/metrics  health        (not limited)
 *
 * The rate-limit check runs before any orchestrator work. List routes take
 * ?limit=N&cursor=<last id> and answer {"data", "nextCursor", "hasMore"}.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "health/health_aggregator.hpp"
#include "orchestrator/orchestrator.hpp"
#include "ratelimit/rate_limit_policy.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/request_metrics.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_orchestrator {

struct ApiRequest {
    std::string method;
    std::string path;
    nlohmann::json body;
    RequestIdentity identity;
};

struct ApiResponse {
    int status{200};
    std::map<std::string, std::string> headers;
    std::string content_type{"application/json"};
    std::string body;
};

/// NotFound 404, RateLimited 429, CapacityExceeded 503, RetryExhausted 409,
/// InvalidArgument 400, anything else 500.
[[nodiscard]] int status_for(ErrorCode code) noexcept;

/**
 * @brief Everything the router dispatches to. Health and metrics members
 *        may be null; the matching routes then answer 404 / skip recording.
 */
struct ApiServices {
    ExecutionOrchestrator& orchestrator;
    RateLimiter& limiter;
    const RateLimitPolicy& policy;
    HealthAggregator* health = nullptr;
    RequestMetrics* request_metrics = nullptr;
    MetricsCollector* metrics = nullptr;
};

class ApiRouter {
public:
    ApiRouter(ApiServices services, Logger& logger);

    /// Never throws; internal failures become 500 responses.
    [[nodiscard]] ApiResponse handle(const ApiRequest& request);

private:
    struct Route {
        enum class Kind {
            Submit, Cancel, Retry, Get, ListByAgent, ListBySubmission,
            Health, Ready, Metrics, MethodNotAllowed, Unknown
        };
        Kind kind{Kind::Unknown};
        std::string param;
        std::optional<RouteCategory> category;  ///< nullopt = not rate limited
    };

    [[nodiscard]] static Route match(std::string_view method, std::string_view path);
    ApiResponse dispatch(const Route& route, const ApiRequest& request);
    std::optional<ApiResponse> enforce_rate_limit(RouteCategory category,
                                                  const RequestIdentity& identity,
                                                  std::map<std::string, std::string>& headers);

    static ApiResponse json_response(int status, const nlohmann::json& body);
    static ApiResponse error_response(const Error& error);

    ApiServices services_;
    LogContext log_;
};

}  // namespace sandbox_orchestrator
