/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * These are bgctl's own settings (where the deployment record lives, how to
 * reach the proxy, timeouts, logging). The deployment record itself
 * (ACTIVE_POOL, ports) is owned by store::ConfigStore.
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (BGCTL_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef BGCTL_CONFIG_CONFIG_HPP
#define BGCTL_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bgctl::config {

/**
 * Deployment files
 */
struct DeploymentSettings {
    std::string env_file{"blue-green.env"};          // Deployment record (KEY=VALUE)
    std::string compose_file{"docker-compose.yml"};
    std::string project_name;                        // docker compose -p, empty for default
};

/**
 * Reverse proxy access
 */
struct ProxySettings {
    std::string host{"localhost"};                   // Host the public port is published on
    std::string container{"nginx_proxy"};
    std::string template_path{"nginx/nginx.conf.template"};
    std::string config_path{"/etc/nginx/conf.d/default.conf"};  // Inside the container
    bool validate_before_reload{true};
    std::string probe_path{"/version"};
    std::string pool_header{"X-App-Pool"};
    std::string release_header{"X-Release-Id"};
};

/**
 * Chaos injection
 */
struct ChaosSettings {
    std::string host{"localhost"};                   // Host the pool ports are published on
    std::string mode{"error"};
    std::string heal_target{"observed"};             // observed | blue | green
    bool strict_status{false};
};

/**
 * HTTP probe timeouts
 */
struct HttpSettings {
    std::uint32_t connect_timeout_ms{2000};
    std::uint32_t request_timeout_ms{3000};
};

/**
 * Container runtime CLI
 */
struct DockerSettings {
    std::string binary{"docker"};
    std::uint32_t command_timeout_seconds{120};
    std::uint32_t reload_timeout_seconds{30};
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file{"bgctl.log"};                   // Empty for terminal only
    std::size_t max_file_size_mb{10};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    DeploymentSettings deployment;
    ProxySettings proxy;
    ChaosSettings chaos;
    HttpSettings http;
    DockerSettings docker;
    LogSettings logging;

    bool json_output{false};    // status as JSON (CLI only)

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration manager - handles loading and parsing
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    const Config& get_config() const { return config_; }

    /**
     * Non-option arguments in order (command and its arguments)
     */
    const std::vector<std::string>& positional() const { return positional_; }

    std::filesystem::path get_config_path() const { return config_path_; }

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();
    void apply_cli_overrides(int argc, char* argv[]);

    static std::optional<std::string> get_env(const std::string& name);

    Config config_;
    std::filesystem::path config_path_;
    std::vector<std::string> positional_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const DeploymentSettings& d);
void from_json(const nlohmann::json& j, DeploymentSettings& d);
void to_json(nlohmann::json& j, const ProxySettings& p);
void from_json(const nlohmann::json& j, ProxySettings& p);
void to_json(nlohmann::json& j, const ChaosSettings& c);
void from_json(const nlohmann::json& j, ChaosSettings& c);
void to_json(nlohmann::json& j, const HttpSettings& h);
void from_json(const nlohmann::json& j, HttpSettings& h);
void to_json(nlohmann::json& j, const DockerSettings& d);
void from_json(const nlohmann::json& j, DockerSettings& d);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace bgctl::config

#endif // BGCTL_CONFIG_CONFIG_HPP
