/**
 * @file api_server.cpp
 * @brief ApiServer implementation and envelope codec.
 */

#include "api/api_server.hpp"

#include "api/json_codec.hpp"

#include <exception>
#include <limits>
#include <string>

namespace sandbox_orchestrator {

namespace {

std::optional<std::string> identity_field(const nlohmann::json& identity, const char* key) {
    auto it = identity.find(key);
    if (it == identity.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

}  // namespace

// ─────────────────────────────────────────────
// Envelope codec
// ─────────────────────────────────────────────

Result<ApiRequest> decode_request(const std::vector<uint8_t>& frame, const std::string& peer) {
    auto envelope = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Request envelope is not a JSON object"};
    }

    auto method = envelope.find("method");
    auto path = envelope.find("path");
    if (method == envelope.end() || !method->is_string()
        || path == envelope.end() || !path->is_string()) {
        return Error{ErrorCode::InvalidArgument, "Request envelope needs method and path"};
    }

    ApiRequest request;
    request.method = method->get<std::string>();
    request.path = path->get<std::string>();
    if (auto body = envelope.find("body"); body != envelope.end()) {
        request.body = *body;
    }
    if (auto identity = envelope.find("identity");
        identity != envelope.end() && identity->is_object()) {
        request.identity.session_user = identity_field(*identity, "sessionUser");
        request.identity.token_subject = identity_field(*identity, "tokenSubject");
    }
    if (!peer.empty()) request.identity.remote_address = peer;
    return request;
}

std::vector<uint8_t> encode_response(const ApiResponse& response, size_t max_bytes) {
    nlohmann::json envelope{
        {"status", response.status},
        {"headers", response.headers},
        {"contentType", response.content_type},
    };
    if (response.content_type.starts_with("application/json")) {
        envelope["body"] = embed_json_text(response.body);
    } else {
        envelope["body"] = response.body;
    }
    auto text = envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() <= max_bytes) return {text.begin(), text.end()};

    Error too_large{ErrorCode::Internal, "Response of " + std::to_string(text.size())
                                         + " bytes exceeds the " + std::to_string(max_bytes)
                                         + " byte frame limit"};
    nlohmann::json fallback{
        {"status", status_for(too_large.code)},
        {"headers", nlohmann::json::object()},
        {"contentType", "application/json"},
        {"body", error_body(too_large)},
    };
    text = fallback.dump();
    return {text.begin(), text.end()};
}

// ─────────────────────────────────────────────
// Server
// ─────────────────────────────────────────────

ApiServer::ApiServer(ApiRouter& router, Logger& logger, size_t connection_threads,
                     size_t max_connections)
    : router_(router)
    , log_(logger, "api_server")
    , connections_(connection_threads) {
    transport_.set_connection_limit(max_connections);
    connections_.set_error_handler([this](const std::string& message) {
        log_.error("Connection handler failed", {{"error", message}});
    });
}

ApiServer::~ApiServer() {
    stop();
}

Result<void> ApiServer::start(const std::string& bind_address, uint16_t port) {
    auto listening = transport_.listen(bind_address, port);
    if (!listening) {
        return listening.error();
    }
    transport_.serve([this](const std::vector<uint8_t>& frame, const std::string& peer) {
        return handle_frame(frame, peer);
    }, connections_);

    log_.info("API server listening", {{"address", bind_address},
                                       {"port", std::to_string(transport_.bound_port())}});
    return Result<void>{};
}

void ApiServer::stop() {
    bool was_listening = transport_.is_listening();
    transport_.stop_serving();
    connections_.shutdown();
    if (was_listening) log_.info("API server stopped");
}

std::vector<uint8_t> ApiServer::handle_frame(const std::vector<uint8_t>& frame,
                                             const std::string& peer) {
    auto request = decode_request(frame, peer);
    if (!request) {
        log_.warn("Rejected malformed request", {{"peer", peer},
                                                 {"error", request.error().message}});
        ApiResponse bad{400, {}, "application/json", error_body(request.error()).dump()};
        return encode_response(bad);
    }
    auto response = router_.handle(*request);
    auto encoded = encode_response(response, std::numeric_limits<size_t>::max());
    if (encoded.size() <= TcpTransport::MAX_MESSAGE_SIZE) return encoded;

    log_.error("Response exceeds the frame limit", {{"path", request->path},
                                                    {"bytes", std::to_string(encoded.size())}});
    return encode_response(response);
}

}  // namespace sandbox_orchestrator
