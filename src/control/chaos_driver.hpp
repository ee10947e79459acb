/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Chaos Driver - Failure injection and recovery against a pool
 *
 * Failure policy:
 * - induce_chaos() throws ChaosInjectionError when the pool cannot be told
 *   to fail
 * - heal_chaos() only warns when the pool does not acknowledge recovery
 */

#ifndef BGCTL_CONTROL_CHAOS_DRIVER_HPP
#define BGCTL_CONTROL_CHAOS_DRIVER_HPP

#include "core/pool.hpp"
#include "probe/probe_client.hpp"
#include "store/config_store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bgctl::control {

/**
 * Chaos settings
 */
struct ChaosConfig {
    std::string mode{"error"};                  // ?mode= sent with /chaos/start
    bool strict_status{false};                  // treat non-2xx acknowledgements as failures
    core::HealTargetMode heal_target{core::HealTargetMode::observed};
    core::Pool fixed_heal_pool{core::Pool::blue};
};

/**
 * Outcome of one chaos command
 */
struct ChaosResult {
    core::Pool pool{core::Pool::blue};
    std::uint16_t port{0};
    bool success{false};
    int status_code{0};
    std::string message;
};

class ChaosDriver {
public:
    ChaosDriver(std::shared_ptr<store::ConfigStore> store,
                std::shared_ptr<probe::ProbeClient> probe,
                const ChaosConfig& config = {});

    /**
     * Put `pool` into error mode
     * @throws core::ChaosInjectionError when the pool did not acknowledge
     * @throws core::NotFoundError, core::MalformedConfigError on a bad port record
     */
    ChaosResult induce_chaos(core::Pool pool);

    /**
     * Take `pool` out of error mode. Transport failures are logged as
     * warnings and reported through ChaosResult::success.
     */
    ChaosResult heal_chaos(core::Pool pool);

    /**
     * Pool `heal` targets when the operator names none
     */
    core::Pool resolve_heal_target();

    const ChaosConfig& config() const { return config_; }

private:
    std::shared_ptr<store::ConfigStore> store_;
    std::shared_ptr<probe::ProbeClient> probe_;
    ChaosConfig config_;
};

} // namespace bgctl::control

#endif // BGCTL_CONTROL_CHAOS_DRIVER_HPP
