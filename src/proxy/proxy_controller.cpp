/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Proxy Controller - Implementation
 */

#include "proxy/proxy_controller.hpp"
#include "core/errors.hpp"
#include "core/keys.hpp"
#include "util/logger.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bgctl::proxy {

using util::log_component::Proxy;

TemplateLoader file_template(std::filesystem::path path) {
    return [path = std::move(path)]() {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw core::TemplateError("Cannot open proxy template: " + path.string());
        }
        std::ostringstream content;
        content << file.rdbuf();
        if (file.bad()) {
            throw core::TemplateError("Cannot read proxy template: " + path.string());
        }
        return content.str();
    };
}

ProxyController::ProxyController(std::shared_ptr<store::ConfigStore> store,
                                 std::shared_ptr<ProxyRuntime> runtime,
                                 TemplateLoader load_template,
                                 TemplateRenderer renderer)
    : store_(std::move(store))
    , runtime_(std::move(runtime))
    , load_template_(std::move(load_template))
    , renderer_(std::move(renderer))
{
    if (!store_ || !runtime_ || !load_template_) {
        throw std::invalid_argument("ProxyController requires a store, a runtime and a template loader");
    }
}

RoutingParams ProxyController::current_params() const {
    auto snapshot = store_->snapshot();

    RoutingParams params;
    params.active_pool = snapshot.active_pool();
    params.public_port = snapshot.port(core::keys::NginxPort);
    if (snapshot.find(core::keys::InternalPort)) {
        params.internal_port = snapshot.port(core::keys::InternalPort);
    } else {
        params.internal_port = snapshot.port(core::port_key(params.active_pool));
    }
    return params;
}

std::string ProxyController::render() const {
    auto params = current_params();
    return renderer_.render(load_template_(), params);
}

void ProxyController::reload() {
    auto params = current_params();
    auto rendered = renderer_.render(load_template_(), params);

    BGCTL_LOG_INFO(Proxy, "Reloading proxy via {} (pool={}, public_port={}, internal_port={})",
                   runtime_->describe(), core::to_string(params.active_pool),
                   params.public_port, params.internal_port);

    runtime_->apply(rendered);

    BGCTL_LOG_DEBUG(Proxy, "Proxy reload complete");
}

} // namespace bgctl::proxy
