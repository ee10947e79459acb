/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Command Dispatcher - Routes one CLI command to its component
 *
 * The dispatcher is the only place that turns errors into process exit
 * codes. Components throw core::ControlError subclasses; run() logs them at
 * ERROR level and returns the code they carry.
 */

#ifndef BGCTL_CLI_COMMAND_DISPATCHER_HPP
#define BGCTL_CLI_COMMAND_DISPATCHER_HPP

#include "config/config.hpp"
#include "control/chaos_driver.hpp"
#include "control/pool_switcher.hpp"
#include "control/status_reporter.hpp"
#include "lifecycle/deployment_lifecycle.hpp"
#include "proxy/proxy_controller.hpp"
#include "store/config_store.hpp"

#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace bgctl::cli {

/**
 * Wired component graph for one invocation
 */
struct Components {
    std::shared_ptr<store::ConfigStore> store;
    std::shared_ptr<proxy::ProxyController> proxy;
    std::shared_ptr<control::PoolSwitcher> switcher;
    std::shared_ptr<control::ChaosDriver> chaos;
    std::shared_ptr<control::StatusReporter> status;
    std::shared_ptr<lifecycle::DeploymentLifecycle> lifecycle;
};

/**
 * Production wiring: file-backed record, Beast HTTP, docker via Boost.Process
 */
Components build_components(const config::Config& config);

/**
 * Chaos settings from the tool configuration
 * @throws std::runtime_error on an unknown heal target
 */
control::ChaosConfig make_chaos_config(const config::ChaosSettings& settings);

class CommandDispatcher {
public:
    /**
     * @param out Destination for command output meant for stdout (usage,
     *            rendered config, JSON status)
     */
    CommandDispatcher(const config::Config& config, Components components, std::ostream& out = std::cout);

    // Non-copyable
    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /**
     * Run `args` (command first) and return the process exit code
     */
    int run(const std::vector<std::string>& args);

    static void print_usage(std::ostream& out);

private:
    /**
     * Required files must be present before any component runs
     * @throws core::ConfigMissingError
     */
    void validate_files() const;

    int execute(const std::string& command, const std::vector<std::string>& args);

    int start();
    int stop();
    int status();
    int switch_pool(const std::string& pool);
    int chaos();
    int heal(const std::vector<std::string>& args);
    int reload();
    int render();

    config::Config config_;
    Components components_;
    std::ostream& out_;
};

} // namespace bgctl::cli

#endif // BGCTL_CLI_COMMAND_DISPATCHER_HPP
