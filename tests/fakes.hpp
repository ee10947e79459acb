/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Test doubles shared by the unit tests
 */

#ifndef BGCTL_TESTS_FAKES_HPP
#define BGCTL_TESTS_FAKES_HPP

#include "core/errors.hpp"
#include "lifecycle/deployment_lifecycle.hpp"
#include "probe/http_client.hpp"
#include "proxy/proxy_runtime.hpp"
#include "util/process.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace bgctl::testing {

inline const std::string default_record =
    "# Blue/green deployment\n"
    "ACTIVE_POOL=blue\n"
    "NGINX_PORT=8080\n"
    "BLUE_APP_PORT=8081\n"
    "GREEN_APP_PORT=8082\n"
    "APP_INTERNAL_PORT=3000\n";

/**
 * Scripted HTTP client: answers per "host:port" key, records every request
 */
class FakeHttpClient : public probe::HttpClient {
public:
    probe::HttpResult send(const probe::HttpRequestSpec& request) override {
        requests.push_back(request);
        auto it = responses.find(key(request.host, request.port));
        if (it == responses.end()) {
            probe::HttpResult refused;
            refused.error_message = "Connect failed: Connection refused";
            return refused;
        }
        return it->second;
    }

    void respond(const std::string& host, std::uint16_t port, int status,
                 std::vector<std::pair<std::string, std::string>> headers = {}) {
        probe::HttpResult result;
        result.success = true;
        result.status_code = status;
        result.headers = std::move(headers);
        responses[key(host, port)] = result;
    }

    static std::string key(const std::string& host, std::uint16_t port) {
        return host + ":" + std::to_string(port);
    }

    std::map<std::string, probe::HttpResult> responses;
    std::vector<probe::HttpRequestSpec> requests;
};

/**
 * Records applied configs; can be told to fail the next N applies
 */
class FakeProxyRuntime : public proxy::ProxyRuntime {
public:
    void apply(const std::string& rendered_config) override {
        ++attempts;
        if (failures_remaining > 0) {
            --failures_remaining;
            throw core::ProxyUnreachableError("Could not reload proxy container 'nginx_proxy': exit code 1");
        }
        applied.push_back(rendered_config);
    }

    std::string describe() const override { return "fake proxy"; }

    int failures_remaining{0};
    int attempts{0};
    std::vector<std::string> applied;
};

/**
 * Records commands and replays queued results (success by default)
 */
class FakeCommandRunner : public util::CommandRunner {
public:
    util::CommandResult run(const util::CommandSpec& spec) override {
        commands.push_back(spec);
        if (results.empty()) {
            util::CommandResult ok;
            ok.started = true;
            ok.exit_code = 0;
            return ok;
        }
        auto result = results.front();
        results.pop_front();
        return result;
    }

    void push_exit(int exit_code, std::string stdout_data = {}, std::string stderr_data = {}) {
        util::CommandResult result;
        result.started = true;
        result.exit_code = exit_code;
        result.stdout_data = std::move(stdout_data);
        result.stderr_data = std::move(stderr_data);
        results.push_back(result);
    }

    std::vector<util::CommandSpec> commands;
    std::deque<util::CommandResult> results;
};

class FakeLifecycle : public lifecycle::DeploymentLifecycle {
public:
    void up() override {
        ++up_calls;
        if (fail) throw core::LifecycleError("Failed to start deployment services: exit code 1");
    }

    void down() override {
        ++down_calls;
        if (fail) throw core::LifecycleError("Failed to stop deployment services: exit code 1");
    }

    std::vector<std::string> list_status() override {
        if (fail) throw core::LifecycleError("Failed to list deployment containers: exit code 1");
        return rows;
    }

    bool fail{false};
    int up_calls{0};
    int down_calls{0};
    std::vector<std::string> rows{"app_blue   running", "app_green  running", "nginx_proxy running"};
};

/**
 * Unique scratch directory removed on destruction
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("bgctl_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

    static std::string read(const std::filesystem::path& file) {
        std::ifstream in(file, std::ios::binary);
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

private:
    std::filesystem::path path_;
};

} // namespace bgctl::testing

#endif // BGCTL_TESTS_FAKES_HPP
