/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Template Renderer - Implementation
 */

#include "proxy/template_renderer.hpp"
#include "core/errors.hpp"
#include "core/keys.hpp"

#include <algorithm>
#include <cctype>

namespace bgctl::proxy {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Length of the identifier starting at `pos` (0 if none)
std::size_t ident_length(std::string_view text, std::size_t pos) {
    if (pos >= text.size() || !is_ident_start(text[pos])) return 0;
    std::size_t end = pos + 1;
    while (end < text.size() && is_ident_char(text[end])) ++end;
    return end - pos;
}

std::size_t line_of(std::string_view text, std::size_t pos) {
    return static_cast<std::size_t>(std::count(text.begin(), text.begin() + pos, '\n')) + 1;
}

} // namespace

std::map<std::string, std::string> RoutingParams::variables() const {
    return {
        {std::string(core::keys::NginxPort), std::to_string(public_port)},
        {std::string(core::keys::ActivePool), core::to_string(active_pool)},
        {std::string(core::keys::InternalPort), std::to_string(internal_port)}
    };
}

TemplateRenderer::TemplateRenderer(std::vector<std::string> variables)
    : variables_(std::move(variables))
{
}

std::vector<std::string> TemplateRenderer::default_variables() {
    return {
        std::string(core::keys::NginxPort),
        std::string(core::keys::ActivePool),
        std::string(core::keys::InternalPort)
    };
}

std::string TemplateRenderer::render(std::string_view tmpl,
                                     const std::map<std::string, std::string>& values) const {
    if (tmpl.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        throw core::TemplateError("Proxy template is empty");
    }

    auto value_of = [&](std::string_view name, std::size_t pos) -> const std::string& {
        auto it = values.find(std::string(name));
        if (it == values.end()) {
            throw core::TemplateError("Missing value for template parameter " + std::string(name) +
                                      " (line " + std::to_string(line_of(tmpl, pos)) + ")");
        }
        return it->second;
    };

    std::string out;
    out.reserve(tmpl.size() + 64);

    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        auto dollar = tmpl.find('$', pos);
        if (dollar == std::string_view::npos) {
            out.append(tmpl.substr(pos));
            break;
        }
        out.append(tmpl.substr(pos, dollar - pos));

        // ${NAME}
        if (dollar + 1 < tmpl.size() && tmpl[dollar + 1] == '{') {
            auto name_len = ident_length(tmpl, dollar + 2);
            auto close = dollar + 2 + name_len;
            if (name_len > 0 && (close >= tmpl.size() || tmpl[close] != '}')) {
                throw core::TemplateError("Unterminated '${" + std::string(tmpl.substr(dollar + 2, name_len)) +
                                          "' in proxy template (line " +
                                          std::to_string(line_of(tmpl, dollar)) + ")");
            }
            auto name = tmpl.substr(dollar + 2, name_len);
            if (name_len > 0 && is_listed(name)) {
                out.append(value_of(name, dollar));
                pos = close + 1;
            } else {
                out.push_back('$');
                pos = dollar + 1;
            }
            continue;
        }

        // $NAME
        auto name_len = ident_length(tmpl, dollar + 1);
        auto name = tmpl.substr(dollar + 1, name_len);
        if (name_len > 0 && is_listed(name)) {
            out.append(value_of(name, dollar));
            pos = dollar + 1 + name_len;
        } else {
            out.push_back('$');
            pos = dollar + 1;
        }
    }

    return out;
}

bool TemplateRenderer::is_listed(std::string_view name) const {
    return std::find(variables_.begin(), variables_.end(), name) != variables_.end();
}

} // namespace bgctl::proxy
