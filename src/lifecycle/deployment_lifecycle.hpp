/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Deployment Lifecycle - Brings the container set up and down
 */

#ifndef BGCTL_LIFECYCLE_DEPLOYMENT_LIFECYCLE_HPP
#define BGCTL_LIFECYCLE_DEPLOYMENT_LIFECYCLE_HPP

#include "util/process.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace bgctl::lifecycle {

/**
 * Container lifecycle interface
 */
class DeploymentLifecycle {
public:
    virtual ~DeploymentLifecycle() = default;

    /**
     * @throws core::LifecycleError
     */
    virtual void up() = 0;

    /**
     * @throws core::LifecycleError
     */
    virtual void down() = 0;

    /**
     * One opaque line per container row, as reported by the runtime
     * @throws core::LifecycleError
     */
    virtual std::vector<std::string> list_status() = 0;
};

/**
 * docker compose settings
 */
struct ComposeConfig {
    std::string docker_binary{"docker"};
    std::filesystem::path env_file{"blue-green.env"};
    std::filesystem::path compose_file{"docker-compose.yml"};
    std::string project_name;                       // Empty: compose default
    std::chrono::seconds timeout{120};
};

/**
 * docker compose implementation
 */
class ComposeLifecycle : public DeploymentLifecycle {
public:
    ComposeLifecycle(std::shared_ptr<util::CommandRunner> runner, const ComposeConfig& config = {});

    void up() override;
    void down() override;
    std::vector<std::string> list_status() override;

    /**
     * `docker compose --env-file .. -f .. [-p ..] <subcommand...>`
     */
    util::CommandSpec build_command(const std::vector<std::string>& subcommand) const;

private:
    util::CommandResult run_checked(const std::vector<std::string>& subcommand, const std::string& action);

    std::shared_ptr<util::CommandRunner> runner_;
    ComposeConfig config_;
};

} // namespace bgctl::lifecycle

#endif // BGCTL_LIFECYCLE_DEPLOYMENT_LIFECYCLE_HPP
