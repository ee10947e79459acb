/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Pool Switcher - Moves live traffic between the blue and green pools
 *
 * A switch is one atomic write of ACTIVE_POOL followed by a best-effort
 * proxy reload. The two steps are not transactional: when the reload fails
 * the record already names the new pool and SwitchNotLiveError says so.
 * Retrying only the reload (ProxyController::reload) closes the gap.
 */

#ifndef BGCTL_CONTROL_POOL_SWITCHER_HPP
#define BGCTL_CONTROL_POOL_SWITCHER_HPP

#include "core/pool.hpp"
#include "proxy/proxy_controller.hpp"
#include "store/config_store.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace bgctl::control {

/**
 * Outcome of a switch request
 */
struct SwitchResult {
    bool changed{false};
    core::Pool previous{core::Pool::blue};
    core::Pool current{core::Pool::blue};
};

class PoolSwitcher {
public:
    PoolSwitcher(std::shared_ptr<store::ConfigStore> store,
                 std::shared_ptr<proxy::ProxyController> proxy);

    // Non-copyable
    PoolSwitcher(const PoolSwitcher&) = delete;
    PoolSwitcher& operator=(const PoolSwitcher&) = delete;

    /**
     * Switch live traffic to `requested` ("blue" or "green")
     *
     * @throws core::InvalidPoolError before any side effect on a bad name
     * @throws core::ConcurrentSwitchError if another writer changed ACTIVE_POOL meanwhile
     * @throws core::SwitchNotLiveError if the record changed but the reload failed
     * @throws core::NotFoundError, core::MalformedConfigError, core::PersistError
     */
    SwitchResult switch_to(std::string_view requested);

    SwitchResult switch_to(core::Pool requested);

private:
    std::shared_ptr<store::ConfigStore> store_;
    std::shared_ptr<proxy::ProxyController> proxy_;
    std::mutex switch_mutex_;
};

} // namespace bgctl::control

#endif // BGCTL_CONTROL_POOL_SWITCHER_HPP
