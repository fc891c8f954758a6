/**
 * @file api_router.cpp
 * @brief ApiRouter implementation.
 */

#include "api/api_router.hpp"

#include "api/json_codec.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <exception>
#include <iterator>

namespace sandbox_orchestrator {

namespace {

/**
 * @brief Split "/api/a/b" into {"api", "a", "b"}, ignoring any query string.
 */
std::vector<std::string_view> split_path(std::string_view path) {
    if (auto query = path.find('?'); query != std::string_view::npos) {
        path = path.substr(0, query);
    }
    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        if (next > pos) segments.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }
    return segments;
}

constexpr size_t kDefaultPageSize = 20;
constexpr size_t kMaxPageSize = 100;
// Keeps one page well inside a transport frame
constexpr size_t kMaxPageBytes = 4 * 1024 * 1024;

struct PageRequest {
    size_t limit = kDefaultPageSize;
    std::optional<std::string> cursor;  ///< id of the last record of the previous page
};

/**
 * @brief Read "limit" and "cursor" from the query string. Other keys are ignored.
 *
 * limit=0 means the default page size; larger values are capped at kMaxPageSize.
 */
Result<PageRequest> parse_page(std::string_view path) {
    PageRequest page;
    auto mark = path.find('?');
    if (mark == std::string_view::npos) return page;

    std::string_view query = path.substr(mark + 1);
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        auto eq = pair.find('=');
        auto key = pair.substr(0, eq);
        auto value = eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);

        if (key == "limit") {
            size_t limit = 0;
            const char* end = value.data() + value.size();
            auto [ptr, ec] = std::from_chars(value.data(), end, limit);
            if (value.empty() || ec != std::errc{} || ptr != end) {
                return Error{ErrorCode::InvalidArgument, "limit must be a non-negative integer"};
            }
            page.limit = limit == 0 ? kDefaultPageSize : std::min(limit, kMaxPageSize);
        } else if (key == "cursor" && !value.empty()) {
            page.cursor = std::string(value);
        }
    }
    return page;
}

/**
 * @brief One page of @p records as {"data", "nextCursor", "hasMore"}.
 *
 * A page stops at page.limit records or kMaxPageBytes of encoded records,
 * whichever comes first, but always holds at least one record.
 */
Result<nlohmann::json> records_page(const std::vector<ExecutionRecord>& records,
                                    const PageRequest& page) {
    auto it = records.begin();
    if (page.cursor) {
        it = std::find_if(records.begin(), records.end(),
                          [&](const ExecutionRecord& r) { return r.id == *page.cursor; });
        if (it == records.end()) {
            return Error{ErrorCode::InvalidArgument, "Invalid cursor " + *page.cursor};
        }
        ++it;
    }

    nlohmann::json data = nlohmann::json::array();
    size_t bytes = 0;
    for (; it != records.end() && data.size() < page.limit; ++it) {
        auto item = to_json(*it);
        bytes += item.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size();
        if (!data.empty() && bytes > kMaxPageBytes) break;
        data.push_back(std::move(item));
    }

    const bool has_more = it != records.end();
    nlohmann::json body{{"data", std::move(data)}, {"hasMore", has_more}, {"nextCursor", nullptr}};
    if (has_more) body["nextCursor"] = std::prev(it)->id;
    return body;
}

}  // namespace

int status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:         return 404;
        case ErrorCode::RateLimited:      return 429;
        case ErrorCode::CapacityExceeded: return 503;
        case ErrorCode::RetryExhausted:   return 409;
        case ErrorCode::InvalidArgument:  return 400;
        default:                          return 500;
    }
}

ApiRouter::ApiRouter(ApiServices services, Logger& logger)
    : services_(services), log_(logger, "api") {}

// ─────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────

ApiRouter::Route ApiRouter::match(std::string_view method, std::string_view path) {
    using Kind = Route::Kind;
    auto seg = split_path(path);
    Route route;

    if (seg.size() < 2 || seg[0] != "api") return route;

    const bool get = method == "GET";
    const bool post = method == "POST";
    const std::string_view resource = seg[1];

    if (seg.size() == 2 && (resource == "health" || resource == "ready" || resource == "metrics")) {
        if (!get) {
            route.kind = Kind::MethodNotAllowed;
        } else if (resource == "health") {
            route.kind = Kind::Health;
        } else if (resource == "ready") {
            route.kind = Kind::Ready;
        } else {
            route.kind = Kind::Metrics;
        }
        return route;
    }

    if (resource != "executions" && resource != "agents" && resource != "submissions") {
        return route;
    }
    route.category = RouteCategory::GeneralApi;

    if (resource == "executions") {
        if (seg.size() == 2) {
            route.kind = post ? Kind::Submit : Kind::MethodNotAllowed;
            if (post) route.category = RouteCategory::SandboxExecution;
        } else if (seg.size() == 3) {
            route.kind = get ? Kind::Get : Kind::MethodNotAllowed;
            route.param = std::string(seg[2]);
        } else if (seg.size() == 4 && (seg[3] == "cancel" || seg[3] == "retry")) {
            route.param = std::string(seg[2]);
            if (!post) {
                route.kind = Kind::MethodNotAllowed;
            } else if (seg[3] == "cancel") {
                route.kind = Kind::Cancel;
            } else {
                route.kind = Kind::Retry;
                route.category = RouteCategory::SandboxExecution;
            }
        }
        return route;
    }

    if (seg.size() == 4 && seg[3] == "executions") {
        route.param = std::string(seg[2]);
        if (!get) {
            route.kind = Kind::MethodNotAllowed;
        } else {
            route.kind = resource == "agents" ? Kind::ListByAgent : Kind::ListBySubmission;
        }
    }
    return route;
}

ApiResponse ApiRouter::handle(const ApiRequest& request) {
    auto start = std::chrono::steady_clock::now();
    auto route = match(request.method, request.path);

    ApiResponse response;
    try {
        std::map<std::string, std::string> headers;
        std::optional<ApiResponse> rejected;
        if (route.category) {
            rejected = enforce_rate_limit(*route.category, request.identity, headers);
        }
        response = rejected ? std::move(*rejected) : dispatch(route, request);
        response.headers.insert(headers.begin(), headers.end());
    } catch (const std::exception& e) {
        log_.error("Request handler failed", {{"path", request.path}, {"error", e.what()}});
        response = error_response(Error{ErrorCode::Internal, "Internal server error"});
    }

    if (services_.request_metrics) {
        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        services_.request_metrics->record(request.method, request.path, elapsed_ms,
                                          response.status);
    }
    return response;
}

std::optional<ApiResponse> ApiRouter::enforce_rate_limit(
    RouteCategory category, const RequestIdentity& identity,
    std::map<std::string, std::string>& headers) {
    if (!services_.policy.enabled()) return std::nullopt;

    const std::string principal = resolve_identity(identity);
    const auto route_name = to_string(category);
    auto decision = services_.limiter.check(principal, route_name, services_.policy.rule(category));

    headers["X-RateLimit-Limit"] = std::to_string(decision.limit);
    headers["X-RateLimit-Remaining"] = std::to_string(decision.remaining);
    headers["X-RateLimit-Reset"] = std::to_string(decision.reset_at_ms);

    if (decision.allowed) return std::nullopt;

    headers["Retry-After"] = std::to_string(decision.retry_after_s);
    log_.warn("Rate limit exceeded", {{"identity", principal}, {"route", route_name}});
    if (services_.metrics) services_.metrics->record_rate_limited(principal, route_name);

    return json_response(429, {
        {"error", std::string(to_string(ErrorCode::RateLimited))},
        {"message", decision.message},
        {"retryAfter", decision.retry_after_s},
    });
}

ApiResponse ApiRouter::dispatch(const Route& route, const ApiRequest& request) {
    using Kind = Route::Kind;
    auto& orchestrator = services_.orchestrator;

    auto record_response = [](int status, const Result<ExecutionRecord>& result) {
        if (!result) return error_response(result.error());
        return json_response(status, to_json(*result));
    };

    switch (route.kind) {
        case Kind::Submit: {
            auto submit = parse_submit_request(request.body);
            if (!submit) return error_response(submit.error());
            return record_response(202, orchestrator.submit(std::move(*submit)));
        }
        case Kind::Cancel:
            return record_response(200, orchestrator.cancel(route.param));
        case Kind::Retry:
            return record_response(202, orchestrator.retry(route.param));
        case Kind::Get:
            return record_response(200, orchestrator.get(route.param));
        case Kind::ListByAgent:
        case Kind::ListBySubmission: {
            auto page = parse_page(request.path);
            if (!page) return error_response(page.error());
            auto listed = records_page(route.kind == Kind::ListByAgent
                                           ? orchestrator.list_by_agent(route.param)
                                           : orchestrator.list_by_submission(route.param),
                                       *page);
            if (!listed) return error_response(listed.error());
            return json_response(200, *listed);
        }
        case Kind::Health:
        case Kind::Ready:
        case Kind::Metrics: {
            if (!services_.health) break;
            HealthResponse health = route.kind == Kind::Health ? services_.health->liveness()
                                  : route.kind == Kind::Ready  ? services_.health->readiness()
                                                               : services_.health->metrics();
            return ApiResponse{health.status_code, {}, std::move(health.content_type),
                               std::move(health.body)};
        }
        case Kind::MethodNotAllowed:
            return json_response(405, {{"error", "MethodNotAllowed"},
                                       {"message", "Method " + request.method + " not allowed"}});
        case Kind::Unknown:
            break;
    }
    return error_response(Error{ErrorCode::NotFound, "No route for " + request.method + " "
                                                     + request.path});
}

ApiResponse ApiRouter::json_response(int status, const nlohmann::json& body) {
    return ApiResponse{status, {}, "application/json",
                       body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
}

ApiResponse ApiRouter::error_response(const Error& error) {
    return json_response(status_for(error.code), error_body(error));
}

}  // namespace sandbox_orchestrator
