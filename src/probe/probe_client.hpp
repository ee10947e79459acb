/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Probe Client - Chaos control and routing observation over HTTP
 */

#ifndef BGCTL_PROBE_PROBE_CLIENT_HPP
#define BGCTL_PROBE_PROBE_CLIENT_HPP

#include "probe/http_client.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bgctl::probe {

/**
 * Probe endpoints and headers
 */
struct ProbeConfig {
    std::string pool_host{"localhost"};          // Host the pools' ports are published on
    std::string proxy_host{"localhost"};         // Host the proxy's public port is published on
    std::string chaos_start_path{"/chaos/start"};
    std::string chaos_stop_path{"/chaos/stop"};
    std::string routing_path{"/version"};        // Probed with HEAD through the proxy
    std::string pool_header{"X-App-Pool"};
    std::string release_header{"X-Release-Id"};
};

/**
 * What the proxy's public endpoint reported
 */
struct RoutingObservation {
    bool reachable{false};
    int status_code{0};
    std::optional<std::string> served_pool;   // pool header value, if present
    std::optional<std::string> release;       // release header value, if present
    std::string error_message;
};

/**
 * Probe Client - the only component that speaks HTTP to pools and proxy
 */
class ProbeClient {
public:
    ProbeClient(std::shared_ptr<HttpClient> http, const ProbeConfig& config = {});

    /**
     * POST <chaos_start_path>?mode=<mode> to a pool's published port
     */
    HttpResult start_chaos(std::uint16_t pool_port, const std::string& mode);

    /**
     * POST <chaos_stop_path> to a pool's published port
     */
    HttpResult stop_chaos(std::uint16_t pool_port);

    /**
     * HEAD <routing_path> through the proxy's public port.
     * Never throws; an unreachable proxy yields reachable=false.
     */
    RoutingObservation observe_routing(std::uint16_t public_port);

    const ProbeConfig& config() const { return config_; }

private:
    std::shared_ptr<HttpClient> http_;
    ProbeConfig config_;
};

} // namespace bgctl::probe

#endif // BGCTL_PROBE_PROBE_CLIENT_HPP
