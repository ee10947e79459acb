/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Template Renderer - envsubst-style substitution for the proxy routing template
 *
 * Only the listed variables are substituted, in both `$NAME` and `${NAME}`
 * form. Every other `$` expression (nginx's own $host, $upstream_addr, ...)
 * is copied through untouched.
 */

#ifndef BGCTL_PROXY_TEMPLATE_RENDERER_HPP
#define BGCTL_PROXY_TEMPLATE_RENDERER_HPP

#include "core/pool.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bgctl::proxy {

/**
 * Values the routing template is parameterized by
 */
struct RoutingParams {
    std::uint16_t public_port{80};
    core::Pool active_pool{core::Pool::blue};
    std::uint16_t internal_port{3000};

    /**
     * NGINX_PORT / ACTIVE_POOL / APP_INTERNAL_PORT
     */
    std::map<std::string, std::string> variables() const;

    bool operator==(const RoutingParams&) const = default;
};

class TemplateRenderer {
public:
    /**
     * @param variables Names eligible for substitution
     */
    explicit TemplateRenderer(std::vector<std::string> variables = default_variables());

    /**
     * Render `tmpl` with `values`
     * @throws core::TemplateError on an empty template, an unterminated
     *         `${NAME`, or a listed variable with no value
     */
    std::string render(std::string_view tmpl, const std::map<std::string, std::string>& values) const;

    std::string render(std::string_view tmpl, const RoutingParams& params) const {
        return render(tmpl, params.variables());
    }

    static std::vector<std::string> default_variables();

private:
    bool is_listed(std::string_view name) const;

    std::vector<std::string> variables_;
};

} // namespace bgctl::proxy

#endif // BGCTL_PROXY_TEMPLATE_RENDERER_HPP
