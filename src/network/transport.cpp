/**
 * @file transport.cpp
 * @brief TcpTransport implementation: framed request/response over TCP.
 *
 * Frames are [uint32_t big-endian length][payload]. All sockets are
 * non-blocking; every wait goes through poll() against a deadline. A served
 * connection is owned by the event loop while it waits for a request and by
 * one worker while that request is handled; Connection::phase records which.
 */

#include "network/transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <unordered_map>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sandbox_orchestrator {

namespace {

constexpr int kPollSliceMs = 100;
constexpr size_t kHeaderBytes = sizeof(uint32_t);

using Clock = std::chrono::steady_clock;

std::string errno_text(int err) {
    return std::string(::strerror(err));
}

void tune_socket(int fd) {
    const int on = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
}

/**
 * @brief poll() @p fd for @p events until @p deadline.
 * @return true once anything is reported, errors and hangups included, so
 *         the following syscall surfaces them; false on timeout.
 */
bool wait_ready(int fd, short events, Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) return false;

    pollfd pfd{fd, events, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
    return rc > 0 && pfd.revents != 0;
}

Clock::time_point deadline_after(uint32_t timeout_ms) {
    return Clock::now() + std::chrono::milliseconds(timeout_ms);
}

/**
 * @brief Resolve @p host (dotted quad or name) to an IPv4 address.
 */
Result<in_addr> resolve_ipv4(const std::string& host) {
    in_addr addr{};
    if (::inet_pton(AF_INET, host.c_str(), &addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
        return Error{ErrorCode::InvalidArgument,
                     "Cannot resolve " + host + ": " + std::string(::gai_strerror(rc))};
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(found, &::freeaddrinfo);
    return reinterpret_cast<const sockaddr_in*>(found->ai_addr)->sin_addr;
}

sockaddr_in make_address(in_addr ip, uint16_t port) {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr = ip;
    return address;
}

std::string peer_text(const sockaddr_in& peer) {
    char text[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, &peer.sin_addr, text, sizeof(text)) == nullptr) {
        return {};
    }
    return text;
}

void close_socket(int fd) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

// ── Server connection state ──────────────────

/// Who currently owns a connection's socket.
enum Phase : int {
    kReading,    ///< event loop: polling for the next request
    kBusy,       ///< a worker is running the handler and writing the reply
    kDone,       ///< reply written; the event loop takes the socket back
    kFailed,     ///< reply could not be written; the event loop closes it
    kAbandoned,  ///< event loop exited mid-exchange; the worker closes it
};

struct Connection {
    int fd = -1;
    std::string peer;
    std::vector<uint8_t> inbox;
    Clock::time_point last_activity;
    Clock::time_point frame_deadline;
    std::atomic<int> phase{kReading};
};

/**
 * @brief Returns a connection to the event loop when a worker's exchange ends,
 *        whether the handler returned, failed to write, or threw.
 */
class ExchangeGuard {
public:
    ExchangeGuard(std::shared_ptr<Connection> conn, int wake_fd)
        : conn_(std::move(conn)), wake_fd_(wake_fd) {}

    ExchangeGuard(const ExchangeGuard&) = delete;
    ExchangeGuard& operator=(const ExchangeGuard&) = delete;

    ~ExchangeGuard() {
        int expected = kBusy;
        if (!conn_->phase.compare_exchange_strong(expected, outcome_)) {
            close_socket(conn_->fd);
            return;
        }
        // A lost wake-up only delays settling to the next poll slice
        const uint64_t one = 1;
        [[maybe_unused]] auto written = ::write(wake_fd_, &one, sizeof(one));
    }

    void succeed() noexcept { outcome_ = kDone; }

private:
    std::shared_ptr<Connection> conn_;
    int wake_fd_;
    int outcome_ = kFailed;
};

/**
 * @brief Read whatever the socket holds without blocking.
 * @return false once the peer has closed or the socket failed.
 */
bool drain_socket(Connection& conn) {
    uint8_t chunk[16 * 1024];
    while (conn.inbox.size() < kHeaderBytes + TcpTransport::MAX_MESSAGE_SIZE) {
        auto n = ::recv(conn.fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            if (conn.inbox.empty()) {
                conn.frame_deadline = deadline_after(TcpTransport::FRAME_TIMEOUT_MS);
            }
            conn.inbox.insert(conn.inbox.end(), chunk, chunk + n);
            conn.last_activity = Clock::now();
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
    return true;
}

/**
 * @brief Pop one complete frame off the connection's inbox.
 * @return nullopt inside the Result while the frame is incomplete; an error
 *         when the header announces more than MAX_MESSAGE_SIZE.
 */
Result<std::optional<std::vector<uint8_t>>> take_frame(Connection& conn) {
    auto& inbox = conn.inbox;
    if (inbox.size() < kHeaderBytes) return std::optional<std::vector<uint8_t>>{};

    uint32_t length = 0;
    std::memcpy(&length, inbox.data(), kHeaderBytes);
    length = ntohl(length);
    if (length > TcpTransport::MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidArgument,
                     "Frame announces " + std::to_string(length) + " bytes, over the limit"};
    }
    if (inbox.size() < kHeaderBytes + length) return std::optional<std::vector<uint8_t>>{};

    const auto body = inbox.begin() + static_cast<std::ptrdiff_t>(kHeaderBytes);
    std::vector<uint8_t> frame(body, body + length);
    inbox.erase(inbox.begin(), body + length);
    if (!inbox.empty()) conn.frame_deadline = deadline_after(TcpTransport::FRAME_TIMEOUT_MS);
    return std::optional<std::vector<uint8_t>>{std::move(frame)};
}

}  // anonymous namespace

TcpTransport::TcpTransport() = default;

TcpTransport::~TcpTransport() {
    stop_serving();
    disconnect();
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

// ─────────────────────────────────────────────
// Client
// ─────────────────────────────────────────────

Result<void> TcpTransport::connect(const std::string& host, uint16_t port,
                                   uint32_t timeout_ms) {
    if (client_fd_ >= 0) {
        return Error{"Already connected"};
    }

    auto ip = resolve_ipv4(host);
    if (!ip) {
        return ip.error();
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Error{"socket() failed: " + errno_text(errno)};
    }
    client_fd_ = fd;

    const sockaddr_in target = make_address(*ip, port);
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&target), sizeof(target)) < 0) {
        if (errno != EINPROGRESS) {
            int err = errno;
            disconnect();
            return Error{"Connect to " + host + ":" + std::to_string(port) + " failed: "
                         + errno_text(err)};
        }

        if (!wait_ready(fd, POLLOUT, deadline_after(timeout_ms))) {
            disconnect();
            return Error{ErrorCode::Timeout, "Connect to " + host + ":" + std::to_string(port)
                                             + " timed out"};
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        if (so_error != 0) {
            disconnect();
            return Error{"Connect to " + host + ":" + std::to_string(port) + " failed: "
                         + errno_text(so_error)};
        }
    }

    tune_socket(fd);
    return Result<void>{};
}

Result<void> TcpTransport::send(const std::vector<uint8_t>& data) {
    if (client_fd_ < 0) return Error{"Not connected"};
    return write_frame(client_fd_, data);
}

Result<std::vector<uint8_t>> TcpTransport::receive(uint32_t timeout_ms) {
    if (client_fd_ < 0) return Error{"Not connected"};
    return read_frame(client_fd_, timeout_ms);
}

void TcpTransport::disconnect() {
    if (client_fd_ < 0) return;
    close_socket(client_fd_);
    client_fd_ = -1;
}

// ─────────────────────────────────────────────
// Server
// ─────────────────────────────────────────────

Result<void> TcpTransport::listen(const std::string& bind_address, uint16_t port, int backlog) {
    if (server_fd_ >= 0) {
        return Error{"Already listening"};
    }

    auto ip = resolve_ipv4(bind_address);
    if (!ip) {
        return ip.error();
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Error{"socket() failed: " + errno_text(errno)};
    }

    const int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    const sockaddr_in local = make_address(*ip, port);
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0
        || ::listen(fd, backlog) < 0) {
        int err = errno;
        ::close(fd);
        return Error{"Cannot listen on " + bind_address + ":" + std::to_string(port) + ": "
                     + errno_text(err)};
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }
    server_fd_ = fd;
    return Result<void>{};
}

void TcpTransport::serve(MessageHandler handler, ThreadPool& workers) {
    if (server_fd_ < 0 || serving_.exchange(true)) return;

    if (wake_fd_ < 0) {
        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    }
    auto shared_handler = std::make_shared<const MessageHandler>(std::move(handler));
    serve_thread_ = std::jthread([this, shared_handler, &workers](std::stop_token stop) {
        run_event_loop(stop, shared_handler, workers);
    });
}

void TcpTransport::run_event_loop(std::stop_token stop,
                                  const std::shared_ptr<const MessageHandler>& handler,
                                  ThreadPool& workers) {
    std::unordered_map<int, std::shared_ptr<Connection>> open;
    std::vector<pollfd> fds;

    auto drop = [&](auto it) {
        close_socket(it->first);
        open_.fetch_sub(1);
        return open.erase(it);
    };

    // Hand the next buffered frame to a worker. False means close the connection.
    auto dispatch = [&](const std::shared_ptr<Connection>& conn) {
        auto frame = take_frame(*conn);
        if (!frame) return false;
        if (!frame->has_value()) return true;

        conn->phase.store(kBusy);
        bool queued = workers.post([conn, handler, wake = wake_fd_,
                                    request = std::move(**frame)] {
            ExchangeGuard guard(conn, wake);
            if (write_frame(conn->fd, (*handler)(request, conn->peer))) {
                guard.succeed();
            }
        });
        if (!queued) {
            conn->phase.store(kReading);
            return false;
        }
        return true;
    };

    const auto idle_limit = std::chrono::milliseconds(IDLE_CONNECTION_TIMEOUT_MS);

    while (!stop.stop_requested() && serving_.load()) {
        const auto now = Clock::now();

        // Settle finished exchanges and expire idle or stalled connections
        for (auto it = open.begin(); it != open.end();) {
            auto& conn = it->second;
            bool keep = true;
            switch (conn->phase.load()) {
                case kFailed:
                    keep = false;
                    break;
                case kDone:
                    conn->phase.store(kReading);
                    conn->last_activity = now;
                    if (!conn->inbox.empty()) {
                        conn->frame_deadline = deadline_after(FRAME_TIMEOUT_MS);
                    }
                    keep = dispatch(conn);
                    break;
                case kReading:
                    keep = conn->inbox.empty() ? now - conn->last_activity < idle_limit
                                               : now < conn->frame_deadline;
                    break;
                default:
                    break;
            }
            it = keep ? std::next(it) : drop(it);
        }

        fds.clear();
        fds.push_back({wake_fd_, POLLIN, 0});
        fds.push_back({server_fd_, POLLIN, 0});
        for (const auto& [fd, conn] : open) {
            if (conn->phase.load() == kReading) fds.push_back({fd, POLLIN, 0});
        }

        // Short slices so stop_serving() and deadlines are noticed promptly
        if (::poll(fds.data(), fds.size(), kPollSliceMs) <= 0) continue;

        if (fds[0].revents != 0) {
            uint64_t signals = 0;
            [[maybe_unused]] auto drained = ::read(wake_fd_, &signals, sizeof(signals));
        }

        if (fds[1].revents != 0) {
            while (true) {
                sockaddr_in peer{};
                socklen_t peer_len = sizeof(peer);
                int fd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len,
                                   SOCK_NONBLOCK | SOCK_CLOEXEC);
                if (fd < 0) break;

                if (open.size() >= connection_limit_) {
                    rejected_.fetch_add(1);
                    close_socket(fd);
                    continue;
                }
                tune_socket(fd);
                accepted_.fetch_add(1);
                open_.fetch_add(1);

                auto conn = std::make_shared<Connection>();
                conn->fd = fd;
                conn->peer = peer_text(peer);
                conn->last_activity = Clock::now();
                open.emplace(fd, std::move(conn));
            }
        }

        for (size_t i = 2; i < fds.size(); ++i) {
            if (fds[i].revents == 0) continue;
            auto it = open.find(fds[i].fd);
            if (it == open.end()) continue;

            bool keep = drain_socket(*it->second) && dispatch(it->second);
            if (!keep) drop(it);
        }
    }

    // Sockets with an exchange in flight now belong to their worker
    for (auto& [fd, conn] : open) {
        int expected = kBusy;
        if (!conn->phase.compare_exchange_strong(expected, kAbandoned)) {
            close_socket(fd);
        }
    }
    open_.store(0);
}

void TcpTransport::stop_serving() {
    serving_.store(false);
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

bool TcpTransport::is_connected() const noexcept {
    return client_fd_ >= 0;
}

bool TcpTransport::is_listening() const noexcept {
    return server_fd_ >= 0;
}

// ─────────────────────────────────────────────
// Framing
// ─────────────────────────────────────────────

Result<void> TcpTransport::write_frame(int fd, const std::vector<uint8_t>& payload,
                                       uint32_t timeout_ms) {
    if (payload.size() > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidArgument,
                     "Message too large: " + std::to_string(payload.size()) + " bytes"};
    }

    // Header and payload go out as one buffer
    std::vector<uint8_t> frame(kHeaderBytes + payload.size());
    const uint32_t length = htonl(static_cast<uint32_t>(payload.size()));
    std::memcpy(frame.data(), &length, kHeaderBytes);
    if (!payload.empty()) {
        std::memcpy(frame.data() + kHeaderBytes, payload.data(), payload.size());
    }
    return write_exact(fd, frame.data(), frame.size(), deadline_after(timeout_ms));
}

Result<std::vector<uint8_t>> TcpTransport::read_frame(int fd, uint32_t timeout_ms) {
    const auto deadline = deadline_after(timeout_ms);

    uint32_t length = 0;
    if (auto header = read_exact(fd, reinterpret_cast<uint8_t*>(&length), kHeaderBytes, deadline);
        !header) {
        return header.error();
    }
    length = ntohl(length);
    if (length > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidArgument,
                     "Frame announces " + std::to_string(length) + " bytes, over the limit"};
    }

    std::vector<uint8_t> payload(length);
    if (length > 0) {
        if (auto body = read_exact(fd, payload.data(), length, deadline); !body) {
            return body.error();
        }
    }
    return payload;
}

Result<void> TcpTransport::write_exact(int fd, const uint8_t* data, size_t len,
                                       Clock::time_point deadline) {
    size_t done = 0;
    while (done < len) {
        if (!wait_ready(fd, POLLOUT, deadline)) {
            return Error{ErrorCode::Timeout, "Timed out writing frame"};
        }
        auto n = ::send(fd, data + done, len - done, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{"send() failed: " + errno_text(errno)};
        }
        done += static_cast<size_t>(n);
    }
    return Result<void>{};
}

Result<void> TcpTransport::read_exact(int fd, uint8_t* data, size_t len,
                                      Clock::time_point deadline) {
    size_t done = 0;
    while (done < len) {
        if (!wait_ready(fd, POLLIN, deadline)) {
            return Error{ErrorCode::Timeout, "Timed out reading frame"};
        }
        auto n = ::recv(fd, data + done, len - done, 0);
        if (n == 0) {
            return Error{"Connection closed by peer"};
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{"recv() failed: " + errno_text(errno)};
        }
        done += static_cast<size_t>(n);
    }
    return Result<void>{};
}

}  // namespace sandbox_orchestrator
