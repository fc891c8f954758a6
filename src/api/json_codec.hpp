/**
 * @file json_codec.hpp
 * @brief JSON encoding of execution records and decoding of API bodies.
 *
 * Field names are camelCase on the wire; timestamps are ISO 8601 UTC.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace sandbox_orchestrator {

[[nodiscard]] nlohmann::json to_json(const ExecutionRecord& record);
[[nodiscard]] nlohmann::json to_json(const AttemptSummary& attempt);

/**
 * @brief Decode `{agentId, input, timeoutMs?, maxRetries?, submissionId?, bountyId?}`.
 *
 * `input` may be any JSON value and is stored as its serialized text;
 * a missing input becomes `{}`.
 */
[[nodiscard]] Result<SubmitRequest> parse_submit_request(const nlohmann::json& body);

/**
 * @brief Embed stored JSON text as a value; text that does not parse is
 *        embedded as a string.
 */
[[nodiscard]] nlohmann::json embed_json_text(std::string_view text);

/// `{error: <code>, message}`.
[[nodiscard]] nlohmann::json error_body(const Error& error);

}  // namespace sandbox_orchestrator
