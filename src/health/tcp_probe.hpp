/**
 * @file tcp_probe.hpp
 * @brief Health probe measuring a TCP connect round-trip to an endpoint.
 */

#pragma once

#include "core/config.hpp"
#include "health/probe.hpp"

#include <cstdint>
#include <string>

namespace sandbox_orchestrator {

/**
 * @brief Probes any `[dependencies.<name>]` endpoint by opening a connection.
 *
 * Also usable as the readiness check for the database: ready means the
 * endpoint accepted a connection within the timeout.
 */
class TcpEndpointProbe : public IHealthProbe, public IReadinessCheck {
public:
    TcpEndpointProbe(std::string component, DependencyEndpoint endpoint, uint32_t timeout_ms);

    [[nodiscard]] std::string_view component() const override { return component_; }
    ProbeHealth health_check() override;
    [[nodiscard]] bool is_available() const override;

    Result<void> check_ready() override;

private:
    std::string component_;
    DependencyEndpoint endpoint_;
    uint32_t timeout_ms_;
};

}  // namespace sandbox_orchestrator
