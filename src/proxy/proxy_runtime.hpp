/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Proxy Runtime - Installs a rendered routing config into the live proxy and
 * reloads it gracefully
 */

#ifndef BGCTL_PROXY_PROXY_RUNTIME_HPP
#define BGCTL_PROXY_PROXY_RUNTIME_HPP

#include "util/process.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace bgctl::proxy {

/**
 * Proxy runtime interface
 */
class ProxyRuntime {
public:
    virtual ~ProxyRuntime() = default;

    /**
     * Install `rendered_config` and hot-reload the proxy (no restart)
     * @throws core::ProxyUnreachableError if the proxy cannot be reached
     * @throws core::TemplateError if the proxy rejects the configuration
     */
    virtual void apply(const std::string& rendered_config) = 0;

    virtual std::string describe() const = 0;
};

/**
 * Docker runtime settings
 */
struct DockerProxyConfig {
    std::string docker_binary{"docker"};
    std::string container{"nginx_proxy"};
    std::string config_path{"/etc/nginx/conf.d/default.conf"};
    bool validate_before_reload{true};     // nginx -t, restore previous config on failure
    std::chrono::seconds timeout{30};
};

/**
 * Nginx inside a container, driven through `docker exec`
 *
 * The rendered config is streamed on stdin so nothing is written on the
 * host. With validation enabled the previous config is restored when
 * `nginx -t` rejects the new one, so a bad render never reaches the
 * running workers.
 */
class DockerProxyRuntime : public ProxyRuntime {
public:
    DockerProxyRuntime(std::shared_ptr<util::CommandRunner> runner, const DockerProxyConfig& config = {});

    void apply(const std::string& rendered_config) override;
    std::string describe() const override;

    /**
     * Command apply() runs (exposed for inspection)
     */
    util::CommandSpec build_command(const std::string& rendered_config) const;

    // Exit status the install script uses when nginx -t rejects the config
    static constexpr int RejectedConfigExit = 65;

private:
    std::shared_ptr<util::CommandRunner> runner_;
    DockerProxyConfig config_;
};

} // namespace bgctl::proxy

#endif // BGCTL_PROXY_PROXY_RUNTIME_HPP
