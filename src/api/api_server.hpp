/**
 * @file api_server.hpp
 * @brief Serves the ApiRouter over the length-prefixed TCP transport.
 *
 * Request envelope (one frame):
 *   {"method": "POST", "path": "/api/executions", "body": {...},
 *    "identity": {"sessionUser": "...", "tokenSubject": "..."}}
 * Response envelope (one frame):
 *   {"status": 202, "headers": {...}, "contentType": "...", "body": <json or text>}
 *
 * The remote address used for rate limiting is the accepted socket's peer,
 * never a value supplied in the envelope.
 */

#pragma once

#include "api/api_router.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "network/transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief Decode a request envelope; @p peer becomes the remote address.
 */
[[nodiscard]] Result<ApiRequest> decode_request(const std::vector<uint8_t>& frame,
                                                const std::string& peer);

/**
 * @brief Encode a response envelope. One that would exceed @p max_bytes is
 * replaced by a 500 envelope naming its size, so the peer always gets a frame.
 */
[[nodiscard]] std::vector<uint8_t> encode_response(
    const ApiResponse& response, size_t max_bytes = TcpTransport::MAX_MESSAGE_SIZE);

class ApiServer {
public:
    ApiServer(ApiRouter& router, Logger& logger, size_t connection_threads = 4,
              size_t max_connections = TcpTransport::DEFAULT_CONNECTION_LIMIT);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /// Bind and start accepting. Port 0 picks an ephemeral port.
    Result<void> start(const std::string& bind_address, uint16_t port);
    /// Stop accepting, let open connections wind down, and join workers.
    void stop();

    [[nodiscard]] uint16_t port() const noexcept { return transport_.bound_port(); }
    [[nodiscard]] bool is_running() const noexcept { return transport_.is_listening(); }

private:
    std::vector<uint8_t> handle_frame(const std::vector<uint8_t>& frame, const std::string& peer);

    ApiRouter& router_;
    LogContext log_;
    ThreadPool connections_;
    TcpTransport transport_;  // declared after the pool: stopped and destroyed first
};

}  // namespace sandbox_orchestrator
