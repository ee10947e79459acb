/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Proxy Controller - Regenerates the proxy routing config from the deployment
 * record and hot-reloads the proxy
 */

#ifndef BGCTL_PROXY_PROXY_CONTROLLER_HPP
#define BGCTL_PROXY_PROXY_CONTROLLER_HPP

#include "proxy/proxy_runtime.hpp"
#include "proxy/template_renderer.hpp"
#include "store/config_store.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace bgctl::proxy {

/**
 * Supplies the raw routing template; throws core::TemplateError when it
 * cannot be loaded
 */
using TemplateLoader = std::function<std::string()>;

/**
 * Loader reading the template file on every call
 */
TemplateLoader file_template(std::filesystem::path path);

/**
 * Proxy Controller
 *
 * reload() is idempotent: with unchanged inputs the proxy ends up with the
 * same configuration and a graceful reload is a no-op for traffic.
 */
class ProxyController {
public:
    ProxyController(std::shared_ptr<store::ConfigStore> store,
                    std::shared_ptr<ProxyRuntime> runtime,
                    TemplateLoader load_template,
                    TemplateRenderer renderer = TemplateRenderer{});

    // Non-copyable
    ProxyController(const ProxyController&) = delete;
    ProxyController& operator=(const ProxyController&) = delete;

    /**
     * Render from a fresh read of the record and apply it to the proxy
     * @throws core::TemplateError, core::ProxyUnreachableError
     * @throws core::NotFoundError, core::MalformedConfigError on a bad record
     */
    void reload();

    /**
     * Rendered configuration for the current record, without applying it
     */
    std::string render() const;

    /**
     * Template parameters from a fresh read of the record.
     * APP_INTERNAL_PORT falls back to the active pool's published port.
     */
    RoutingParams current_params() const;

private:
    std::shared_ptr<store::ConfigStore> store_;
    std::shared_ptr<ProxyRuntime> runtime_;
    TemplateLoader load_template_;
    TemplateRenderer renderer_;
};

} // namespace bgctl::proxy

#endif // BGCTL_PROXY_PROXY_CONTROLLER_HPP
