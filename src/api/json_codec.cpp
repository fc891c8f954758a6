/**
 * @file json_codec.cpp
 * @brief ExecutionRecord <-> JSON.
 */

#include "api/json_codec.hpp"

#include "core/concepts.hpp"

#include <limits>
#include <string>

namespace sandbox_orchestrator {

namespace {

nlohmann::json optional_time(const std::optional<Timestamp>& ts) {
    return ts ? nlohmann::json(format_iso8601(*ts)) : nlohmann::json(nullptr);
}

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

/**
 * @brief Read an optional non-negative integer field that fits in uint32_t.
 */
Result<std::optional<uint32_t>> read_uint32(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::optional<uint32_t>{};
    if (!it->is_number_integer() || it->get<int64_t>() < 0
        || it->get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorCode::InvalidArgument,
                     std::string(key) + " must be a non-negative integer"};
    }
    return std::optional<uint32_t>{static_cast<uint32_t>(it->get<int64_t>())};
}

Result<std::optional<std::string>> read_string(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::optional<std::string>{};
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidArgument, std::string(key) + " must be a string"};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

}  // namespace

nlohmann::json embed_json_text(std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) return std::string(text);
    return parsed;
}

nlohmann::json to_json(const AttemptSummary& attempt) {
    return {
        {"attempt", attempt.attempt},
        {"status", std::string(to_string(attempt.status))},
        {"errorMessage", optional_value(attempt.error_message)},
        {"startedAt", optional_time(attempt.started_at)},
        {"completedAt", optional_time(attempt.completed_at)},
        {"executionTimeMs", optional_value(attempt.execution_time_ms)},
    };
}

nlohmann::json to_json(const ExecutionRecord& record) {
    nlohmann::json attempts = nlohmann::json::array();
    for (const auto& attempt : record.attempts) {
        attempts.push_back(to_json(attempt));
    }

    return {
        {"id", record.id},
        {"agentId", record.agent_id},
        {"submissionId", optional_value(record.submission_id)},
        {"bountyId", optional_value(record.bounty_id)},
        {"status", std::string(to_string(record.status))},
        {"input", embed_json_text(record.input)},
        {"output", record.output ? embed_json_text(*record.output) : nlohmann::json(nullptr)},
        {"logs", record.logs},
        {"errorMessage", optional_value(record.error_message)},
        {"queuedAt", format_iso8601(record.queued_at)},
        {"startedAt", optional_time(record.started_at)},
        {"completedAt", optional_time(record.completed_at)},
        {"executionTimeMs", optional_value(record.execution_time_ms())},
        {"timeoutMs", record.timeout_ms},
        {"retryCount", record.retry_count},
        {"maxRetries", record.max_retries},
        {"peakMemoryBytes", optional_value(record.peak_memory_bytes)},
        {"attempts", std::move(attempts)},
    };
}

Result<SubmitRequest> parse_submit_request(const nlohmann::json& body) {
    if (!body.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Request body must be a JSON object"};
    }

    SubmitRequest request;
    auto agent = body.find("agentId");
    if (agent == body.end() || !agent->is_string() || agent->get<std::string>().empty()) {
        return Error{ErrorCode::InvalidArgument, "agentId is required"};
    }
    request.agent_id = agent->get<std::string>();

    auto input = body.find("input");
    request.input = (input == body.end() || input->is_null())
        ? std::string("{}")
        : input->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    auto timeout = read_uint32(body, "timeoutMs");
    if (!timeout) return timeout.error();
    request.timeout_ms = *timeout;

    auto max_retries = read_uint32(body, "maxRetries");
    if (!max_retries) return max_retries.error();
    request.max_retries = *max_retries;

    auto submission = read_string(body, "submissionId");
    if (!submission) return submission.error();
    request.submission_id = *submission;

    auto bounty = read_string(body, "bountyId");
    if (!bounty) return bounty.error();
    request.bounty_id = *bounty;

    return request;
}

nlohmann::json error_body(const Error& error) {
    return {{"error", std::string(to_string(error.code))}, {"message", error.message}};
}

}  // namespace sandbox_orchestrator
