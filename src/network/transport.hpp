/**
 * @file transport.hpp
 * @brief TCP transport for API requests with length-prefixed framing.
 *
 * Provides both client (connect + send/receive) and server (accept + handle)
 * sides. Messages are framed as [4-byte big-endian length][payload].
 * Uses non-blocking I/O with poll() for cooperative scheduling. On the
 * server side one event loop owns every accepted socket and buffers inbound
 * bytes; only a complete request frame is handed to the ThreadPool, so an
 * idle or slow peer never holds a worker. A connection may carry any number
 * of request/response exchanges until the peer closes it.
 */

#pragma once

#include "core/result.hpp"
#include "executor/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief Length-prefixed TCP transport.
 *
 * Wire format per message:
 *   [uint32_t big-endian length][payload bytes]
 *
 * Maximum message size: 16 MB.
 */
class TcpTransport {
public:
    static constexpr uint32_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16 MB
    static constexpr int DEFAULT_BACKLOG = 64;
    static constexpr uint32_t IDLE_CONNECTION_TIMEOUT_MS = 30000;
    static constexpr uint32_t FRAME_TIMEOUT_MS = 10000;      ///< first byte to last byte
    static constexpr size_t DEFAULT_CONNECTION_LIMIT = 256;

    TcpTransport();
    ~TcpTransport();

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // ── Client-side ──────────────────────────
    /// @p host may be a dotted IPv4 address or a resolvable name.
    Result<void> connect(const std::string& host, uint16_t port,
                         uint32_t timeout_ms = 5000);
    Result<void> send(const std::vector<uint8_t>& data);
    Result<std::vector<uint8_t>> receive(uint32_t timeout_ms = 10000);
    void disconnect();

    // ── Server-side ──────────────────────────
    /// Receives one request payload and the peer's address; returns the response.
    using MessageHandler =
        std::function<std::vector<uint8_t>(const std::vector<uint8_t>&, const std::string&)>;

    /// Port 0 binds an ephemeral port; see bound_port().
    Result<void> listen(const std::string& bind_address, uint16_t port,
                        int backlog = DEFAULT_BACKLOG);
    /// Run the event loop on a dedicated thread; complete requests run on
    /// @p workers, which must be drained before this transport is destroyed.
    void serve(MessageHandler handler, ThreadPool& workers);
    void stop_serving();

    /// Connections beyond @p limit are accepted and closed at once. Set before serve().
    void set_connection_limit(size_t limit) noexcept { connection_limit_ = limit; }

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }
    [[nodiscard]] uint64_t connections_accepted() const noexcept { return accepted_.load(); }
    [[nodiscard]] uint64_t connections_rejected() const noexcept { return rejected_.load(); }
    [[nodiscard]] size_t open_connections() const noexcept { return open_.load(); }

private:
    void run_event_loop(std::stop_token stop,
                        const std::shared_ptr<const MessageHandler>& handler,
                        ThreadPool& workers);

    // Wire helpers; every timeout bounds the whole frame, not each poll
    static Result<void> write_frame(int fd, const std::vector<uint8_t>& payload,
                                    uint32_t timeout_ms = 5000);
    static Result<std::vector<uint8_t>> read_frame(int fd, uint32_t timeout_ms);
    static Result<void> write_exact(int fd, const uint8_t* data, size_t len,
                                    std::chrono::steady_clock::time_point deadline);
    static Result<void> read_exact(int fd, uint8_t* data, size_t len,
                                   std::chrono::steady_clock::time_point deadline);

    int client_fd_ = -1;
    int server_fd_ = -1;
    int wake_fd_ = -1;  // eventfd; workers signal finished exchanges
    uint16_t bound_port_ = 0;
    size_t connection_limit_ = DEFAULT_CONNECTION_LIMIT;
    std::jthread serve_thread_;
    std::atomic<bool> serving_{false};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<size_t> open_{0};
};

}  // namespace sandbox_orchestrator
