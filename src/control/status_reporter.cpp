/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Status Reporter - Implementation
 */

#include "control/status_reporter.hpp"
#include "core/errors.hpp"
#include "core/keys.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace bgctl::control {

using util::log_component::Status;

std::string StatusView::observed_pool() const {
    return routing.served_pool.value_or("unknown");
}

void to_json(nlohmann::json& j, const StatusView& view) {
    nlohmann::json routing{
        {"reachable", view.routing.reachable},
        {"status_code", view.routing.status_code},
        {"served_pool", view.observed_pool()},
        {"release", view.routing.release ? nlohmann::json(*view.routing.release) : nlohmann::json(nullptr)}
    };
    if (!view.routing.error_message.empty()) {
        routing["error"] = view.routing.error_message;
    }

    nlohmann::json containers{
        {"listed", view.containers_listed},
        {"rows", view.containers}
    };
    if (!view.containers_error.empty()) {
        containers["error"] = view.containers_error;
    }

    j = nlohmann::json{
        {"active_pool", view.active_pool},
        {"public_port", view.public_port},
        {"containers", containers},
        {"routing", routing},
        {"drift", view.drift}
    };
}

StatusReporter::StatusReporter(std::shared_ptr<store::ConfigStore> store,
                               std::shared_ptr<probe::ProbeClient> probe,
                               std::shared_ptr<lifecycle::DeploymentLifecycle> lifecycle)
    : store_(std::move(store))
    , probe_(std::move(probe))
    , lifecycle_(std::move(lifecycle))
{
    if (!store_ || !probe_) {
        throw std::invalid_argument("StatusReporter requires a store and a probe client");
    }
}

StatusView StatusReporter::snapshot() {
    auto record = store_->snapshot();

    StatusView view;
    view.active_pool = record.get(core::keys::ActivePool);
    view.public_port = record.port(core::keys::NginxPort);

    if (lifecycle_) {
        try {
            view.containers = lifecycle_->list_status();
            view.containers_listed = true;
        } catch (const core::LifecycleError& e) {
            view.containers_error = e.what();
            BGCTL_LOG_DEBUG(Status, "Container listing failed: {}", e.what());
        }
    } else {
        view.containers_error = "no container runtime configured";
    }

    view.routing = probe_->observe_routing(view.public_port);
    view.drift = view.routing.served_pool.has_value() && *view.routing.served_pool != view.active_pool;
    return view;
}

void StatusReporter::report(const StatusView& view, std::string_view record_location) const {
    BGCTL_LOG_STATUS(Status, "--- Blue/Green Deployment Status ---");
    BGCTL_LOG_STATUS(Status, "Active Pool in {}: {}", record_location, view.active_pool);
    BGCTL_LOG_STATUS(Status, "Public Proxy Port: {}", view.public_port);

    if (view.containers_listed) {
        BGCTL_LOG_INFO(Status, "Containers:");
        for (const auto& row : view.containers) {
            BGCTL_LOG_STATUS(Status, "  {}", row);
        }
    } else {
        BGCTL_LOG_WARN(Status, "Containers: unknown ({})", view.containers_error);
    }

    const auto& probe_config = probe_->config();
    BGCTL_LOG_INFO(Status, "Testing current traffic routing via http://{}:{}{}",
                   probe_config.proxy_host, view.public_port, probe_config.routing_path);
    if (view.routing.reachable) {
        BGCTL_LOG_STATUS(Status, "HTTP {}", view.routing.status_code);
        BGCTL_LOG_STATUS(Status, "{}: {}", probe_config.pool_header, view.observed_pool());
        if (view.routing.release) {
            BGCTL_LOG_STATUS(Status, "{}: {}", probe_config.release_header, *view.routing.release);
        }
    } else {
        BGCTL_LOG_WARN(Status, "Routing probe failed, serving pool unknown: {}", view.routing.error_message);
    }

    if (view.drift) {
        BGCTL_LOG_WARN(Status, "Drift: persisted ACTIVE_POOL={} but proxy is serving from {}",
                       view.active_pool, view.observed_pool());
    }
    BGCTL_LOG_STATUS(Status, "-------------------------------------");
}

} // namespace bgctl::control
