/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Proxy Runtime - Implementation
 */

#include "proxy/proxy_runtime.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace bgctl::proxy {

namespace {

// $1 is the config path inside the container
constexpr const char* install_and_reload =
    "cat > \"$1\" && nginx -s reload";

constexpr const char* install_validate_and_reload =
    "if [ -f \"$1\" ]; then cp \"$1\" \"$1.bgctl-prev\"; fi; "
    "cat > \"$1\" || exit 1; "
    "if nginx -t -q; then nginx -s reload; "
    "else if [ -f \"$1.bgctl-prev\" ]; then cp \"$1.bgctl-prev\" \"$1\"; fi; exit 65; fi";

} // namespace

DockerProxyRuntime::DockerProxyRuntime(std::shared_ptr<util::CommandRunner> runner,
                                       const DockerProxyConfig& config)
    : runner_(std::move(runner))
    , config_(config)
{
    if (!runner_) {
        throw std::invalid_argument("DockerProxyRuntime requires a command runner");
    }
}

util::CommandSpec DockerProxyRuntime::build_command(const std::string& rendered_config) const {
    util::CommandSpec spec;
    spec.program = config_.docker_binary;
    spec.args = {
        "exec", "-i", config_.container,
        "/bin/sh", "-c",
        config_.validate_before_reload ? install_validate_and_reload : install_and_reload,
        "sh", config_.config_path
    };
    spec.stdin_data = rendered_config;
    spec.timeout = config_.timeout;
    return spec;
}

void DockerProxyRuntime::apply(const std::string& rendered_config) {
    auto spec = build_command(rendered_config);
    auto result = runner_->run(spec);

    if (result.ok()) {
        spdlog::debug("Proxy container {} accepted new config ({} bytes)",
                      config_.container, rendered_config.size());
        return;
    }

    if (result.started && !result.timed_out && result.exit_code == RejectedConfigExit) {
        throw core::TemplateError("Proxy rejected the rendered configuration (nginx -t failed), "
                                  "previous configuration kept: " + result.describe_failure());
    }

    throw core::ProxyUnreachableError("Could not reload proxy container '" + config_.container +
                                      "': " + result.describe_failure());
}

std::string DockerProxyRuntime::describe() const {
    return "docker container " + config_.container;
}

} // namespace bgctl::proxy
