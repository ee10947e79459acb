/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Pool Switcher - Implementation
 */

#include "control/pool_switcher.hpp"
#include "core/errors.hpp"
#include "core/keys.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace bgctl::control {

using util::log_component::Switch;

PoolSwitcher::PoolSwitcher(std::shared_ptr<store::ConfigStore> store,
                           std::shared_ptr<proxy::ProxyController> proxy)
    : store_(std::move(store))
    , proxy_(std::move(proxy))
{
    if (!store_ || !proxy_) {
        throw std::invalid_argument("PoolSwitcher requires a store and a proxy controller");
    }
}

SwitchResult PoolSwitcher::switch_to(std::string_view requested) {
    auto pool = core::parse_pool(requested);
    if (!pool) {
        throw core::InvalidPoolError(std::string(requested));
    }
    return switch_to(*pool);
}

SwitchResult PoolSwitcher::switch_to(core::Pool requested) {
    std::lock_guard<std::mutex> lock(switch_mutex_);

    auto current = store_->active_pool();

    SwitchResult result;
    result.previous = current;
    result.current = requested;

    if (current == requested) {
        BGCTL_LOG_WARN(Switch, "Pool is already set to {}. Skipping switch.", core::to_string(requested));
        return result;
    }

    BGCTL_LOG_INFO(Switch, "Switching ACTIVE_POOL from {} to {} in {}",
                   core::to_string(current), core::to_string(requested), store_->location());

    auto from = core::to_string(current);
    auto to = core::to_string(requested);
    if (!store_->compare_and_set(core::keys::ActivePool, from, to)) {
        // Someone else wrote ACTIVE_POOL between our read and our write
        auto now = store_->find(core::keys::ActivePool).value_or("");
        if (now == to) {
            BGCTL_LOG_WARN(Switch, "ACTIVE_POOL was concurrently switched to {}. Skipping switch.", to);
            result.previous = requested;
            return result;
        }
        throw core::ConcurrentSwitchError(
            "ACTIVE_POOL changed concurrently (expected " + from + ", found '" + now +
            "'); nothing written, retry the switch");
    }

    try {
        proxy_->reload();
    } catch (const core::ControlError& e) {
        // Record already names the new pool; only the reload is outstanding
        throw core::SwitchNotLiveError(requested, e.what());
    } catch (const std::exception& e) {
        throw core::SwitchNotLiveError(requested, e.what());
    }

    result.changed = true;
    BGCTL_LOG_SUCCESS(Switch, "Pool switched to {} and proxy reloaded successfully.", to);
    return result;
}

} // namespace bgctl::control
