/**
 * @file tcp_probe.cpp
 * @brief TcpEndpointProbe implementation.
 */

#include "health/tcp_probe.hpp"

#include "network/transport.hpp"

#include <chrono>

namespace sandbox_orchestrator {

TcpEndpointProbe::TcpEndpointProbe(std::string component, DependencyEndpoint endpoint,
                                   uint32_t timeout_ms)
    : component_(std::move(component))
    , endpoint_(std::move(endpoint))
    , timeout_ms_(timeout_ms) {}

bool TcpEndpointProbe::is_available() const {
    return !endpoint_.host.empty() && endpoint_.port != 0;
}

ProbeHealth TcpEndpointProbe::health_check() {
    ProbeHealth health;
    if (!is_available()) {
        health.error = "Not configured";
        return health;
    }

    TcpTransport transport;
    auto start = std::chrono::steady_clock::now();
    auto connected = transport.connect(endpoint_.host, endpoint_.port, timeout_ms_);
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (!connected) {
        health.error = connected.error().message;
        return health;
    }
    transport.disconnect();
    health.connected = true;
    health.latency_ms = elapsed;
    return health;
}

Result<void> TcpEndpointProbe::check_ready() {
    auto health = health_check();
    if (!health.connected) {
        return Error{ErrorCode::Internal,
                     component_ + " unreachable: " + health.error.value_or("unknown error")};
    }
    return Result<void>{};
}

}  // namespace sandbox_orchestrator
