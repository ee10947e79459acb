/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Deployment Lifecycle - Implementation
 */

#include "lifecycle/deployment_lifecycle.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace bgctl::lifecycle {

using util::log_component::Lifecycle;

ComposeLifecycle::ComposeLifecycle(std::shared_ptr<util::CommandRunner> runner,
                                   const ComposeConfig& config)
    : runner_(std::move(runner))
    , config_(config)
{
    if (!runner_) {
        throw std::invalid_argument("ComposeLifecycle requires a command runner");
    }
}

util::CommandSpec ComposeLifecycle::build_command(const std::vector<std::string>& subcommand) const {
    util::CommandSpec spec;
    spec.program = config_.docker_binary;
    spec.args = {"compose", "--env-file", config_.env_file.string(), "-f", config_.compose_file.string()};
    if (!config_.project_name.empty()) {
        spec.args.push_back("-p");
        spec.args.push_back(config_.project_name);
    }
    spec.args.insert(spec.args.end(), subcommand.begin(), subcommand.end());
    spec.timeout = config_.timeout;
    return spec;
}

util::CommandResult ComposeLifecycle::run_checked(const std::vector<std::string>& subcommand,
                                                  const std::string& action) {
    auto spec = build_command(subcommand);
    BGCTL_LOG_DEBUG(Lifecycle, "Running {}", util::to_display_string(spec));

    auto result = runner_->run(spec);
    if (!result.ok()) {
        throw core::LifecycleError("Failed to " + action + ": " + result.describe_failure());
    }
    return result;
}

void ComposeLifecycle::up() {
    run_checked({"up", "-d"}, "start deployment services");
}

void ComposeLifecycle::down() {
    run_checked({"down"}, "stop deployment services");
}

std::vector<std::string> ComposeLifecycle::list_status() {
    auto result = run_checked({"ps"}, "list deployment containers");

    std::vector<std::string> lines;
    std::istringstream stream(result.stdout_data);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        lines.push_back(line);
    }
    return lines;
}

} // namespace bgctl::lifecycle
