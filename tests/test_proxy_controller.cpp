#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "proxy/proxy_controller.hpp"
#include "proxy/proxy_runtime.hpp"
#include "fakes.hpp"

using namespace bgctl;
using namespace bgctl::proxy;
using bgctl::testing::FakeCommandRunner;
using bgctl::testing::FakeProxyRuntime;
using bgctl::testing::TempDir;
using bgctl::testing::default_record;

namespace {

const std::string routing_template =
    "listen ${NGINX_PORT};\nproxy_pass http://app_${ACTIVE_POOL}:${APP_INTERNAL_PORT};\n"
    "add_header X-Upstream $upstream_addr;\n";

TemplateLoader fixed_template(std::string text) {
    return [text = std::move(text)]() { return text; };
}

} // namespace

class ProxyControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<store::MemoryBackend>(default_record);
        store_ = std::make_shared<store::ConfigStore>(backend_);
        runtime_ = std::make_shared<FakeProxyRuntime>();
    }

    std::shared_ptr<ProxyController> make_controller(TemplateLoader loader) {
        return std::make_shared<ProxyController>(store_, runtime_, std::move(loader));
    }

    std::shared_ptr<store::MemoryBackend> backend_;
    std::shared_ptr<store::ConfigStore> store_;
    std::shared_ptr<FakeProxyRuntime> runtime_;
};

TEST_F(ProxyControllerTest, ReloadAppliesRenderedConfig) {
    auto controller = make_controller(fixed_template(routing_template));
    controller->reload();

    ASSERT_EQ(runtime_->applied.size(), 1u);
    EXPECT_EQ(runtime_->applied[0],
              "listen 8080;\nproxy_pass http://app_blue:3000;\nadd_header X-Upstream $upstream_addr;\n");
}

TEST_F(ProxyControllerTest, ReloadReadsFreshRecord) {
    auto controller = make_controller(fixed_template(routing_template));
    store_->set("ACTIVE_POOL", "green");
    controller->reload();

    ASSERT_EQ(runtime_->applied.size(), 1u);
    EXPECT_NE(runtime_->applied[0].find("app_green:3000"), std::string::npos);
}

TEST_F(ProxyControllerTest, InternalPortFallsBackToActivePoolPort) {
    backend_ = std::make_shared<store::MemoryBackend>(
        "ACTIVE_POOL=green\nNGINX_PORT=80\nBLUE_APP_PORT=8081\nGREEN_APP_PORT=8082\n");
    store_ = std::make_shared<store::ConfigStore>(backend_);
    auto controller = make_controller(fixed_template(routing_template));

    auto params = controller->current_params();
    EXPECT_EQ(params.active_pool, core::Pool::green);
    EXPECT_EQ(params.public_port, 80);
    EXPECT_EQ(params.internal_port, 8082);
}

TEST_F(ProxyControllerTest, ReloadIsIdempotent) {
    auto controller = make_controller(fixed_template(routing_template));
    controller->reload();
    controller->reload();

    ASSERT_EQ(runtime_->applied.size(), 2u);
    EXPECT_EQ(runtime_->applied[0], runtime_->applied[1]);
}

TEST_F(ProxyControllerTest, RenderDoesNotApply) {
    auto controller = make_controller(fixed_template(routing_template));
    auto rendered = controller->render();
    EXPECT_NE(rendered.find("listen 8080;"), std::string::npos);
    EXPECT_EQ(runtime_->attempts, 0);
}

TEST_F(ProxyControllerTest, TemplateErrorsStopBeforeRuntime) {
    auto controller = make_controller(fixed_template("listen ${NGINX_PORT\n"));
    EXPECT_THROW(controller->reload(), core::TemplateError);
    EXPECT_EQ(runtime_->attempts, 0);
}

TEST_F(ProxyControllerTest, MissingTemplateFileIsTemplateError) {
    TempDir dir;
    auto controller = make_controller(file_template(dir.path() / "missing.template"));
    EXPECT_THROW(controller->reload(), core::TemplateError);
}

TEST_F(ProxyControllerTest, TemplateFileIsReadOnEveryReload) {
    TempDir dir;
    auto path = dir.write("nginx.conf.template", "listen $NGINX_PORT;\n");
    auto controller = make_controller(file_template(path));

    controller->reload();
    dir.write("nginx.conf.template", "listen $NGINX_PORT; # v2\n");
    controller->reload();

    ASSERT_EQ(runtime_->applied.size(), 2u);
    EXPECT_EQ(runtime_->applied[0], "listen 8080;\n");
    EXPECT_EQ(runtime_->applied[1], "listen 8080; # v2\n");
}

TEST_F(ProxyControllerTest, RuntimeFailurePropagates) {
    runtime_->failures_remaining = 1;
    auto controller = make_controller(fixed_template(routing_template));
    EXPECT_THROW(controller->reload(), core::ProxyUnreachableError);
}

TEST(DockerProxyRuntimeTest, BuildsExecCommandWithConfigOnStdin) {
    auto runner = std::make_shared<FakeCommandRunner>();
    DockerProxyConfig config;
    config.container = "edge";
    config.validate_before_reload = false;
    DockerProxyRuntime runtime(runner, config);

    auto spec = runtime.build_command("server {}\n");
    EXPECT_EQ(spec.program, "docker");
    ASSERT_EQ(spec.args.size(), 8u);
    EXPECT_EQ(spec.args[0], "exec");
    EXPECT_EQ(spec.args[1], "-i");
    EXPECT_EQ(spec.args[2], "edge");
    EXPECT_EQ(spec.args[5], "cat > \"$1\" && nginx -s reload");
    EXPECT_EQ(spec.args[7], "/etc/nginx/conf.d/default.conf");
    ASSERT_TRUE(spec.stdin_data.has_value());
    EXPECT_EQ(*spec.stdin_data, "server {}\n");
}

TEST(DockerProxyRuntimeTest, ValidatingScriptTestsBeforeReload) {
    auto runner = std::make_shared<FakeCommandRunner>();
    DockerProxyRuntime runtime(runner);

    auto script = runtime.build_command("x").args[5];
    EXPECT_NE(script.find("nginx -t"), std::string::npos);
    EXPECT_LT(script.find("nginx -t"), script.find("nginx -s reload"));
    EXPECT_NE(script.find("exit 65"), std::string::npos);
}

TEST(DockerProxyRuntimeTest, MapsFailures) {
    auto runner = std::make_shared<FakeCommandRunner>();
    DockerProxyRuntime runtime(runner);

    runner->push_exit(DockerProxyRuntime::RejectedConfigExit, "", "nginx: [emerg] unexpected end of file");
    EXPECT_THROW(runtime.apply("bad"), core::TemplateError);

    runner->push_exit(1, "", "Error: No such container: nginx_proxy");
    try {
        runtime.apply("good");
        FAIL() << "expected ProxyUnreachableError";
    } catch (const core::ProxyUnreachableError& e) {
        EXPECT_NE(std::string(e.what()).find("No such container"), std::string::npos);
    }

    util::CommandResult not_started;
    not_started.error_message = "'docker' not found in PATH";
    runner->results.push_back(not_started);
    EXPECT_THROW(runtime.apply("good"), core::ProxyUnreachableError);

    EXPECT_NO_THROW(runtime.apply("good"));
    EXPECT_EQ(runner->commands.size(), 4u);
}
