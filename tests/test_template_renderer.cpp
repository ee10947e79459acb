#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "proxy/template_renderer.hpp"

using namespace bgctl;
using namespace bgctl::proxy;

namespace {

const char* nginx_template =
    "upstream app_backend {\n"
    "    server app_${ACTIVE_POOL}:${APP_INTERNAL_PORT} max_fails=1 fail_timeout=5s;\n"
    "}\n"
    "server {\n"
    "    listen $NGINX_PORT;\n"
    "    location / {\n"
    "        proxy_set_header Host $host;\n"
    "        proxy_set_header X-Real-IP ${remote_addr};\n"
    "        proxy_pass http://app_backend;\n"
    "    }\n"
    "}\n";

RoutingParams green_params() {
    RoutingParams params;
    params.public_port = 8080;
    params.active_pool = core::Pool::green;
    params.internal_port = 3000;
    return params;
}

} // namespace

TEST(TemplateRendererTest, SubstitutesListedVariablesOnly) {
    TemplateRenderer renderer;
    auto rendered = renderer.render(nginx_template, green_params());

    EXPECT_NE(rendered.find("server app_green:3000 max_fails=1"), std::string::npos);
    EXPECT_NE(rendered.find("listen 8080;"), std::string::npos);
    EXPECT_NE(rendered.find("proxy_set_header Host $host;"), std::string::npos);
    EXPECT_NE(rendered.find("X-Real-IP ${remote_addr};"), std::string::npos);
    EXPECT_EQ(rendered.find("ACTIVE_POOL"), std::string::npos);
}

TEST(TemplateRendererTest, BareNameUsesLongestIdentifier) {
    TemplateRenderer renderer;
    auto rendered = renderer.render("$NGINX_PORT $NGINX_PORTS $ACTIVE_POOL_X", green_params());
    EXPECT_EQ(rendered, "8080 $NGINX_PORTS $ACTIVE_POOL_X");
}

TEST(TemplateRendererTest, LoneDollarIsCopied) {
    TemplateRenderer renderer;
    EXPECT_EQ(renderer.render("cost $5 and $", green_params()), "cost $5 and $");
}

TEST(TemplateRendererTest, RejectsEmptyTemplate) {
    TemplateRenderer renderer;
    EXPECT_THROW(renderer.render("", green_params()), core::TemplateError);
    EXPECT_THROW(renderer.render(" \n\t\n", green_params()), core::TemplateError);
}

TEST(TemplateRendererTest, RejectsUnterminatedBrace) {
    TemplateRenderer renderer;
    try {
        renderer.render("server {\n    listen ${NGINX_PORT;\n}\n", green_params());
        FAIL() << "expected TemplateError";
    } catch (const core::TemplateError& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
        EXPECT_EQ(e.exit_code(), core::exit_code::Proxy);
    }
}

TEST(TemplateRendererTest, RejectsMissingValue) {
    TemplateRenderer renderer;
    std::map<std::string, std::string> values{{"NGINX_PORT", "80"}};
    EXPECT_THROW(renderer.render("listen $NGINX_PORT; pool $ACTIVE_POOL;", values), core::TemplateError);
}

TEST(TemplateRendererTest, CustomVariableList) {
    TemplateRenderer renderer({"NGINX_PORT"});
    auto rendered = renderer.render("$NGINX_PORT ${ACTIVE_POOL}", green_params());
    EXPECT_EQ(rendered, "8080 ${ACTIVE_POOL}");
}

TEST(TemplateRendererTest, RenderingIsDeterministic) {
    TemplateRenderer renderer;
    EXPECT_EQ(renderer.render(nginx_template, green_params()),
              renderer.render(nginx_template, green_params()));
}
