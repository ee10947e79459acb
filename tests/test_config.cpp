#include <gtest/gtest.h>
#include "config/config.hpp"
#include "fakes.hpp"

#include <cstdlib>

using namespace bgctl::config;
using bgctl::testing::TempDir;

namespace {

/**
 * Owns argv storage for ConfigManager::load
 */
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"BGCTL_CONFIG", "BGCTL_ENV_FILE", "BGCTL_COMPOSE_FILE", "BGCTL_HEAL_TARGET",
                                 "BGCTL_HTTP_TIMEOUT_MS", "BGCTL_LOG_LEVEL", "BGCTL_LOG_FILE",
                                 "BGCTL_PROXY_CONTAINER", "BGCTL_CHAOS_MODE"}) {
            unsetenv(name);
        }
    }

    void TearDown() override {
        SetUp();
    }

    TempDir dir_;
};

TEST_F(ConfigManagerTest, DefaultsMatchDeploymentLayout) {
    Args args{"bgctl", "status"};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    const auto& config = manager.get_config();
    EXPECT_EQ(config.deployment.env_file, "blue-green.env");
    EXPECT_EQ(config.deployment.compose_file, "docker-compose.yml");
    EXPECT_EQ(config.proxy.container, "nginx_proxy");
    EXPECT_EQ(config.proxy.probe_path, "/version");
    EXPECT_EQ(config.chaos.mode, "error");
    EXPECT_EQ(config.chaos.heal_target, "observed");
    EXPECT_EQ(config.http.connect_timeout_ms, 2000u);
    EXPECT_EQ(config.docker.command_timeout_seconds, 120u);
    EXPECT_FALSE(config.json_output);
    EXPECT_EQ(manager.positional(), std::vector<std::string>{"status"});
}

TEST_F(ConfigManagerTest, CliOptionsAndPositionals) {
    Args args{"bgctl", "--env-file", "/srv/bg.env", "--compose-file=/srv/compose.yml",
              "-v", "--json", "--log-file", "", "switch", "green"};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    const auto& config = manager.get_config();
    EXPECT_EQ(config.deployment.env_file, "/srv/bg.env");
    EXPECT_EQ(config.deployment.compose_file, "/srv/compose.yml");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "");
    EXPECT_TRUE(config.json_output);
    EXPECT_EQ(manager.positional(), (std::vector<std::string>{"switch", "green"}));
}

TEST_F(ConfigManagerTest, HelpReturnsFalse) {
    Args args{"bgctl", "--help"};
    ConfigManager manager;
    EXPECT_FALSE(manager.load(args.argc(), args.argv()));
}

TEST_F(ConfigManagerTest, UnknownOptionThrows) {
    Args args{"bgctl", "--colour", "status"};
    ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigManagerTest, MissingOptionValueThrows) {
    Args args{"bgctl", "--env-file"};
    ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigManagerTest, MissingConfigPathThrows) {
    Args args{"bgctl", "status", "-c"};
    ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigManagerTest, DoubleDashEndsOptions) {
    Args args{"bgctl", "--", "heal", "-x"};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));
    EXPECT_EQ(manager.positional(), (std::vector<std::string>{"heal", "-x"}));
}

TEST_F(ConfigManagerTest, FileThenEnvironmentThenCli) {
    auto path = dir_.write("bgctl.json", R"({
        "deployment": {"env_file": "from-file.env", "compose_file": "from-file.yml"},
        "proxy": {"container": "edge_proxy", "validate_before_reload": false},
        "chaos": {"mode": "timeout", "heal_target": "blue"},
        "http": {"request_timeout_ms": 1500},
        "logging": {"level": "warn"}
    })");

    setenv("BGCTL_COMPOSE_FILE", "from-env.yml", 1);
    setenv("BGCTL_ENV_FILE", "from-env.env", 1);

    Args args{"bgctl", "-c", path.string(), "--env-file", "from-cli.env", "status"};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    const auto& config = manager.get_config();
    EXPECT_EQ(config.deployment.env_file, "from-cli.env");
    EXPECT_EQ(config.deployment.compose_file, "from-env.yml");
    EXPECT_EQ(config.proxy.container, "edge_proxy");
    EXPECT_FALSE(config.proxy.validate_before_reload);
    EXPECT_EQ(config.proxy.host, "localhost");
    EXPECT_EQ(config.chaos.mode, "timeout");
    EXPECT_EQ(config.chaos.heal_target, "blue");
    EXPECT_EQ(config.http.request_timeout_ms, 1500u);
    EXPECT_EQ(config.http.connect_timeout_ms, 2000u);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_EQ(manager.get_config_path(), path);
}

TEST_F(ConfigManagerTest, InvalidJsonThrows) {
    auto path = dir_.write("broken.json", "{ \"deployment\": ");
    Args args{"bgctl", "--config=" + path.string(), "status"};
    ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigManagerTest, MissingConfigFileThrows) {
    Args args{"bgctl", "-c", (dir_.path() / "absent.json").string()};
    ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigManagerTest, InvalidEnvironmentNumberThrows) {
    setenv("BGCTL_HTTP_TIMEOUT_MS", "soon", 1);
    Args args{"bgctl", "status"};
    ConfigManager manager;
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST(ConfigValidateTest, RejectsBadSettings) {
    Config heal;
    heal.chaos.heal_target = "purple";
    EXPECT_THROW(heal.validate(), std::runtime_error);

    Config level;
    level.logging.level = "loud";
    EXPECT_THROW(level.validate(), std::runtime_error);

    Config timeout;
    timeout.http.connect_timeout_ms = 0;
    EXPECT_THROW(timeout.validate(), std::runtime_error);

    Config probe;
    probe.proxy.probe_path = "version";
    EXPECT_THROW(probe.validate(), std::runtime_error);

    Config env;
    env.deployment.env_file.clear();
    EXPECT_THROW(env.validate(), std::runtime_error);

    EXPECT_NO_THROW(Config{}.validate());
}

TEST(ConfigJsonTest, SerializesAllSections) {
    Config config;
    config.chaos.heal_target = "green";
    nlohmann::json j = config;

    EXPECT_EQ(j["deployment"]["env_file"], "blue-green.env");
    EXPECT_EQ(j["chaos"]["heal_target"], "green");
    EXPECT_EQ(j["docker"]["reload_timeout_seconds"], 30);

    auto parsed = j.get<Config>();
    EXPECT_EQ(parsed.chaos.heal_target, "green");
    EXPECT_EQ(parsed.proxy.template_path, config.proxy.template_path);
}
