/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Chaos Driver - Implementation
 */

#include "control/chaos_driver.hpp"
#include "core/errors.hpp"
#include "core/keys.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace bgctl::control {

using util::log_component::Chaos;

ChaosDriver::ChaosDriver(std::shared_ptr<store::ConfigStore> store,
                         std::shared_ptr<probe::ProbeClient> probe,
                         const ChaosConfig& config)
    : store_(std::move(store))
    , probe_(std::move(probe))
    , config_(config)
{
    if (!store_ || !probe_) {
        throw std::invalid_argument("ChaosDriver requires a store and a probe client");
    }
}

ChaosResult ChaosDriver::induce_chaos(core::Pool pool) {
    ChaosResult result;
    result.pool = pool;
    result.port = store_->port(core::port_key(pool));

    auto name = core::to_string(pool);
    BGCTL_LOG_WARN(Chaos, "Attempting to induce chaos on the {} pool via port {}...", name, result.port);

    auto response = probe_->start_chaos(result.port, config_.mode);
    result.status_code = response.status_code;

    if (!response.success) {
        throw core::ChaosInjectionError(pool,
            "Failed to trigger chaos on " + name + ": " + response.error_message +
            ". Check if the container is running on port " + std::to_string(result.port) + ".");
    }
    if (config_.strict_status && !response.is_2xx()) {
        throw core::ChaosInjectionError(pool,
            "Chaos request to " + name + " was rejected with HTTP " +
            std::to_string(response.status_code) + ".");
    }

    result.success = true;
    result.message = "Chaos successfully triggered on " + name +
                     ". Proxy should now fail over to the backup pool.";
    BGCTL_LOG_SUCCESS(Chaos, "{} (HTTP {})", result.message, response.status_code);
    return result;
}

ChaosResult ChaosDriver::heal_chaos(core::Pool pool) {
    ChaosResult result;
    result.pool = pool;
    result.port = store_->port(core::port_key(pool));

    auto name = core::to_string(pool);
    BGCTL_LOG_INFO(Chaos, "Attempting to stop chaos on the {} pool (port {}) to allow automatic recovery...",
                   name, result.port);

    auto response = probe_->stop_chaos(result.port);
    result.status_code = response.status_code;

    if (!response.success) {
        result.message = "Could not connect to " + name + " app to stop chaos (" + response.error_message +
                         "). It may not have been running or in chaos mode.";
        BGCTL_LOG_WARN(Chaos, "{}", result.message);
        return result;
    }
    if (config_.strict_status && !response.is_2xx()) {
        result.message = "Stop-chaos request to " + name + " answered HTTP " +
                         std::to_string(response.status_code) + "; it may not have been in chaos mode.";
        BGCTL_LOG_WARN(Chaos, "{}", result.message);
        return result;
    }

    result.success = true;
    result.message = "Chaos stopped on " + name + " pool. Proxy should eventually route traffic back to it.";
    BGCTL_LOG_SUCCESS(Chaos, "{}", result.message);
    return result;
}

core::Pool ChaosDriver::resolve_heal_target() {
    if (config_.heal_target == core::HealTargetMode::fixed) {
        BGCTL_LOG_DEBUG(Chaos, "Heal target fixed to {}", core::to_string(config_.fixed_heal_pool));
        return config_.fixed_heal_pool;
    }

    auto snapshot = store_->snapshot();
    auto active = snapshot.active_pool();
    if (!snapshot.find(core::keys::NginxPort)) {
        BGCTL_LOG_DEBUG(Chaos, "No NGINX_PORT in record, healing active pool {}", core::to_string(active));
        return active;
    }

    auto observation = probe_->observe_routing(snapshot.port(core::keys::NginxPort));
    std::optional<core::Pool> serving;
    if (observation.served_pool) {
        serving = core::parse_pool(*observation.served_pool);
    }

    if (!serving) {
        BGCTL_LOG_INFO(Chaos, "Serving pool not observable ({}), healing active pool {}",
                       observation.reachable ? "no pool header" : observation.error_message,
                       core::to_string(active));
        return active;
    }

    // Traffic has failed away from (or never reached) the other pool
    auto target = core::other(*serving);
    BGCTL_LOG_INFO(Chaos, "Proxy is serving from {}, healing {}", core::to_string(*serving),
                   core::to_string(target));
    return target;
}

} // namespace bgctl::control
