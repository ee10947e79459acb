#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "lifecycle/deployment_lifecycle.hpp"
#include "util/process.hpp"
#include "fakes.hpp"

using namespace bgctl;
using namespace bgctl::lifecycle;
using bgctl::testing::FakeCommandRunner;

namespace {

std::vector<std::string> args_of(const util::CommandSpec& spec) {
    return spec.args;
}

} // namespace

TEST(ComposeLifecycleTest, UpAndDownDelegateToCompose) {
    auto runner = std::make_shared<FakeCommandRunner>();
    ComposeConfig config;
    config.env_file = "deploy/blue-green.env";
    config.compose_file = "deploy/docker-compose.yml";
    ComposeLifecycle lifecycle(runner, config);

    lifecycle.up();
    lifecycle.down();

    ASSERT_EQ(runner->commands.size(), 2u);
    EXPECT_EQ(runner->commands[0].program, "docker");
    EXPECT_EQ(args_of(runner->commands[0]),
              (std::vector<std::string>{"compose", "--env-file", "deploy/blue-green.env",
                                        "-f", "deploy/docker-compose.yml", "up", "-d"}));
    EXPECT_EQ(args_of(runner->commands[1]),
              (std::vector<std::string>{"compose", "--env-file", "deploy/blue-green.env",
                                        "-f", "deploy/docker-compose.yml", "down"}));
}

TEST(ComposeLifecycleTest, ProjectNameIsPassed) {
    auto runner = std::make_shared<FakeCommandRunner>();
    ComposeConfig config;
    config.project_name = "shop";
    ComposeLifecycle lifecycle(runner, config);

    auto spec = lifecycle.build_command({"ps"});
    EXPECT_EQ(spec.args,
              (std::vector<std::string>{"compose", "--env-file", "blue-green.env",
                                        "-f", "docker-compose.yml", "-p", "shop", "ps"}));
}

TEST(ComposeLifecycleTest, ListStatusReturnsNonEmptyRows) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->push_exit(0,
        "NAME          STATUS\r\n"
        "app_blue      Up 2 minutes\n"
        "\n"
        "app_green     Up 2 minutes\n"
        "   \n");
    ComposeLifecycle lifecycle(runner);

    auto rows = lifecycle.list_status();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], "NAME          STATUS");
    EXPECT_EQ(rows[2], "app_green     Up 2 minutes");
}

TEST(ComposeLifecycleTest, FailureCarriesStderr) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->push_exit(1, "", "no configuration file provided: not found\n");
    ComposeLifecycle lifecycle(runner);

    try {
        lifecycle.up();
        FAIL() << "expected LifecycleError";
    } catch (const core::LifecycleError& e) {
        EXPECT_EQ(e.exit_code(), core::exit_code::Lifecycle);
        EXPECT_NE(std::string(e.what()).find("no configuration file provided"), std::string::npos);
    }
}

TEST(ComposeLifecycleTest, TimeoutIsFailure) {
    auto runner = std::make_shared<FakeCommandRunner>();
    util::CommandResult timed_out;
    timed_out.started = true;
    timed_out.timed_out = true;
    runner->results.push_back(timed_out);
    ComposeLifecycle lifecycle(runner);

    EXPECT_THROW(lifecycle.down(), core::LifecycleError);
}

TEST(CommandResultTest, DescribesFailures) {
    util::CommandResult not_started;
    EXPECT_EQ(not_started.describe_failure(), "command could not be started");
    EXPECT_FALSE(not_started.ok());

    util::CommandResult exited;
    exited.started = true;
    exited.exit_code = 2;
    exited.stderr_data = "boom\n";
    EXPECT_EQ(exited.describe_failure(), "exit code 2: boom");

    util::CommandSpec spec;
    spec.program = "docker";
    spec.args = {"exec", "nginx_proxy", "sh", "-c", "nginx -s reload"};
    EXPECT_EQ(util::to_display_string(spec), "docker exec nginx_proxy sh -c 'nginx -s reload'");
}

TEST(ProcessRunnerTest, RunsCommandAndCapturesOutput) {
    util::ProcessRunner runner;
    util::CommandSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", "cat; echo err >&2; exit 3"};
    spec.stdin_data = "hello";

    auto result = runner.run(spec);
    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_data, "hello");
    EXPECT_EQ(result.stderr_data, "err\n");
}

TEST(ProcessRunnerTest, MissingProgramIsNotStarted) {
    util::ProcessRunner runner;
    util::CommandSpec spec;
    spec.program = "bgctl-no-such-program";

    auto result = runner.run(spec);
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.describe_failure().find("not found"), std::string::npos);
}

TEST(ProcessRunnerTest, TimeoutTerminatesChild) {
    util::ProcessRunner runner;
    util::CommandSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", "sleep 30"};
    spec.timeout = std::chrono::seconds(1);

    auto start = std::chrono::steady_clock::now();
    auto result = runner.run(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}
