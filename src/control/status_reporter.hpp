/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Status Reporter - Persisted intent next to observed live routing
 */

#ifndef BGCTL_CONTROL_STATUS_REPORTER_HPP
#define BGCTL_CONTROL_STATUS_REPORTER_HPP

#include "lifecycle/deployment_lifecycle.hpp"
#include "probe/probe_client.hpp"
#include "store/config_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bgctl::control {

/**
 * Deployment status snapshot
 */
struct StatusView {
    std::string active_pool;                // as persisted, verbatim
    std::uint16_t public_port{0};

    bool containers_listed{false};
    std::vector<std::string> containers;    // opaque rows from the container runtime
    std::string containers_error;

    probe::RoutingObservation routing;

    /**
     * Proxy answered with a pool header that differs from ACTIVE_POOL
     */
    bool drift{false};

    /**
     * Pool header value, or "unknown"
     */
    std::string observed_pool() const;
};

class StatusReporter {
public:
    /**
     * @param lifecycle May be null; containers are then reported as not listed
     */
    StatusReporter(std::shared_ptr<store::ConfigStore> store,
                   std::shared_ptr<probe::ProbeClient> probe,
                   std::shared_ptr<lifecycle::DeploymentLifecycle> lifecycle);

    /**
     * Collect a snapshot. Probe and container listing failures are folded
     * into the view; only an unreadable record throws.
     * @throws core::NotFoundError, core::MalformedConfigError, core::PersistError
     */
    StatusView snapshot();

    /**
     * Emit the view as STATUS log lines
     */
    void report(const StatusView& view, std::string_view record_location) const;

private:
    std::shared_ptr<store::ConfigStore> store_;
    std::shared_ptr<probe::ProbeClient> probe_;
    std::shared_ptr<lifecycle::DeploymentLifecycle> lifecycle_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const StatusView& view);

} // namespace bgctl::control

#endif // BGCTL_CONTROL_STATUS_REPORTER_HPP
