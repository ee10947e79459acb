/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Configuration System Implementation
 */

#include "config/config.hpp"
#include "core/pool.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace bgctl::config {

// JSON serialization implementations
void to_json(nlohmann::json& j, const DeploymentSettings& d) {
    j = nlohmann::json{
        {"env_file", d.env_file},
        {"compose_file", d.compose_file},
        {"project_name", d.project_name}
    };
}

void from_json(const nlohmann::json& j, DeploymentSettings& d) {
    if (j.contains("env_file")) j.at("env_file").get_to(d.env_file);
    if (j.contains("compose_file")) j.at("compose_file").get_to(d.compose_file);
    if (j.contains("project_name")) j.at("project_name").get_to(d.project_name);
}

void to_json(nlohmann::json& j, const ProxySettings& p) {
    j = nlohmann::json{
        {"host", p.host},
        {"container", p.container},
        {"template_path", p.template_path},
        {"config_path", p.config_path},
        {"validate_before_reload", p.validate_before_reload},
        {"probe_path", p.probe_path},
        {"pool_header", p.pool_header},
        {"release_header", p.release_header}
    };
}

void from_json(const nlohmann::json& j, ProxySettings& p) {
    if (j.contains("host")) j.at("host").get_to(p.host);
    if (j.contains("container")) j.at("container").get_to(p.container);
    if (j.contains("template_path")) j.at("template_path").get_to(p.template_path);
    if (j.contains("config_path")) j.at("config_path").get_to(p.config_path);
    if (j.contains("validate_before_reload")) j.at("validate_before_reload").get_to(p.validate_before_reload);
    if (j.contains("probe_path")) j.at("probe_path").get_to(p.probe_path);
    if (j.contains("pool_header")) j.at("pool_header").get_to(p.pool_header);
    if (j.contains("release_header")) j.at("release_header").get_to(p.release_header);
}

void to_json(nlohmann::json& j, const ChaosSettings& c) {
    j = nlohmann::json{
        {"host", c.host},
        {"mode", c.mode},
        {"heal_target", c.heal_target},
        {"strict_status", c.strict_status}
    };
}

void from_json(const nlohmann::json& j, ChaosSettings& c) {
    if (j.contains("host")) j.at("host").get_to(c.host);
    if (j.contains("mode")) j.at("mode").get_to(c.mode);
    if (j.contains("heal_target")) j.at("heal_target").get_to(c.heal_target);
    if (j.contains("strict_status")) j.at("strict_status").get_to(c.strict_status);
}

void to_json(nlohmann::json& j, const HttpSettings& h) {
    j = nlohmann::json{
        {"connect_timeout_ms", h.connect_timeout_ms},
        {"request_timeout_ms", h.request_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, HttpSettings& h) {
    if (j.contains("connect_timeout_ms")) j.at("connect_timeout_ms").get_to(h.connect_timeout_ms);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(h.request_timeout_ms);
}

void to_json(nlohmann::json& j, const DockerSettings& d) {
    j = nlohmann::json{
        {"binary", d.binary},
        {"command_timeout_seconds", d.command_timeout_seconds},
        {"reload_timeout_seconds", d.reload_timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, DockerSettings& d) {
    if (j.contains("binary")) j.at("binary").get_to(d.binary);
    if (j.contains("command_timeout_seconds")) j.at("command_timeout_seconds").get_to(d.command_timeout_seconds);
    if (j.contains("reload_timeout_seconds")) j.at("reload_timeout_seconds").get_to(d.reload_timeout_seconds);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"deployment", c.deployment},
        {"proxy", c.proxy},
        {"chaos", c.chaos},
        {"http", c.http},
        {"docker", c.docker},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("deployment")) j.at("deployment").get_to(c.deployment);
    if (j.contains("proxy")) j.at("proxy").get_to(c.proxy);
    if (j.contains("chaos")) j.at("chaos").get_to(c.chaos);
    if (j.contains("http")) j.at("http").get_to(c.http);
    if (j.contains("docker")) j.at("docker").get_to(c.docker);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Config validation
void Config::validate() const {
    if (deployment.env_file.empty()) {
        throw std::runtime_error("Configuration error: deployment.env_file cannot be empty");
    }
    if (deployment.compose_file.empty()) {
        throw std::runtime_error("Configuration error: deployment.compose_file cannot be empty");
    }

    if (proxy.host.empty()) {
        throw std::runtime_error("Configuration error: proxy.host cannot be empty");
    }
    if (proxy.container.empty()) {
        throw std::runtime_error("Configuration error: proxy.container cannot be empty");
    }
    if (proxy.template_path.empty()) {
        throw std::runtime_error("Configuration error: proxy.template_path cannot be empty");
    }
    if (proxy.config_path.empty()) {
        throw std::runtime_error("Configuration error: proxy.config_path cannot be empty");
    }
    if (proxy.probe_path.empty() || proxy.probe_path.front() != '/') {
        throw std::runtime_error("Configuration error: proxy.probe_path must start with '/'");
    }
    if (proxy.pool_header.empty()) {
        throw std::runtime_error("Configuration error: proxy.pool_header cannot be empty");
    }

    if (chaos.host.empty()) {
        throw std::runtime_error("Configuration error: chaos.host cannot be empty");
    }
    if (!core::parse_heal_target(chaos.heal_target)) {
        throw std::runtime_error("Configuration error: chaos.heal_target must be 'observed', 'blue' or 'green', got '" +
                                 chaos.heal_target + "'");
    }

    if (http.connect_timeout_ms == 0 || http.request_timeout_ms == 0) {
        throw std::runtime_error("Configuration error: http timeouts must be non-zero");
    }

    if (docker.binary.empty()) {
        throw std::runtime_error("Configuration error: docker.binary cannot be empty");
    }
    if (docker.command_timeout_seconds == 0 || docker.reload_timeout_seconds == 0) {
        throw std::runtime_error("Configuration error: docker timeouts must be non-zero");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + logging.level + "'");
    }
    if (!logging.file.empty() && (logging.max_file_size_mb == 0 || logging.max_files == 0)) {
        throw std::runtime_error("Configuration error: logging rotation limits must be non-zero");
    }

    spdlog::debug("Configuration validated successfully");
}

// ConfigManager implementation

bool ConfigManager::load(int argc, char* argv[]) {
    // Start with defaults
    config_ = Config{};
    positional_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--") break;

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        } else if (arg.starts_with("-c=")) {
            config_path_ = arg.substr(3);
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides();

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Validate final configuration
    config_.validate();

    spdlog::debug("Configuration loaded successfully");
    return true;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "bgctl - Blue/Green Deployment Control Plane\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  start             Start the entire deployment (docker compose up -d)\n"
              << "  stop              Stop and remove the entire deployment (docker compose down)\n"
              << "  status            Display container status, active pool and live routing\n"
              << "  switch <pool>     Switch the active pool ('blue' or 'green') and reload the proxy\n"
              << "  chaos             Induce failure (chaos) on the currently active pool\n"
              << "  heal [pool]       Stop chaos mode (default target per chaos.heal_target)\n"
              << "  reload            Re-render the proxy config from the record and reload it\n"
              << "  render            Print the proxy config the record currently renders to\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  --env-file FILE         Deployment record (default: blue-green.env)\n"
              << "  --compose-file FILE     Compose file (default: docker-compose.yml)\n"
              << "  --log-file FILE         Durable log file (default: bgctl.log, '' to disable)\n"
              << "  --log-level LEVEL       trace/debug/info/warn/error/critical/off\n"
              << "  -v, --verbose           Same as --log-level debug\n"
              << "  --json                  Print status as JSON\n"
              << "\n"
              << "Environment Variables:\n"
              << "  BGCTL_CONFIG            Path to configuration file\n"
              << "  BGCTL_ENV_FILE          Deployment record path\n"
              << "  BGCTL_COMPOSE_FILE      Compose file path\n"
              << "  BGCTL_PROXY_CONTAINER   Proxy container name\n"
              << "  BGCTL_PROXY_TEMPLATE    Proxy routing template path\n"
              << "  BGCTL_PROXY_HOST        Host the proxy's public port is published on\n"
              << "  BGCTL_CHAOS_HOST        Host the pools' ports are published on\n"
              << "  BGCTL_CHAOS_MODE        Chaos mode sent to /chaos/start\n"
              << "  BGCTL_HEAL_TARGET       observed | blue | green\n"
              << "  BGCTL_HTTP_TIMEOUT_MS   HTTP request timeout\n"
              << "  BGCTL_DOCKER            docker binary\n"
              << "  BGCTL_LOG_LEVEL         Log level\n"
              << "  BGCTL_LOG_FILE          Log file path\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"deployment\": {\"env_file\": \"blue-green.env\", \"compose_file\": \"docker-compose.yml\"},\n"
              << "    \"proxy\": {\"container\": \"nginx_proxy\", \"template_path\": \"nginx/nginx.conf.template\"},\n"
              << "    \"chaos\": {\"mode\": \"error\", \"heal_target\": \"observed\"},\n"
              << "    \"http\": {\"connect_timeout_ms\": 2000, \"request_timeout_ms\": 3000},\n"
              << "    \"docker\": {\"binary\": \"docker\", \"command_timeout_seconds\": 120},\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"bgctl.log\"}\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("BGCTL_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    if (auto env = get_env("BGCTL_ENV_FILE")) {
        config_.deployment.env_file = *env;
        spdlog::debug("Applied BGCTL_ENV_FILE={}", config_.deployment.env_file);
    }

    if (auto env = get_env("BGCTL_COMPOSE_FILE")) {
        config_.deployment.compose_file = *env;
        spdlog::debug("Applied BGCTL_COMPOSE_FILE={}", config_.deployment.compose_file);
    }

    if (auto env = get_env("BGCTL_PROXY_CONTAINER")) {
        config_.proxy.container = *env;
        spdlog::debug("Applied BGCTL_PROXY_CONTAINER={}", config_.proxy.container);
    }

    if (auto env = get_env("BGCTL_PROXY_TEMPLATE")) {
        config_.proxy.template_path = *env;
        spdlog::debug("Applied BGCTL_PROXY_TEMPLATE={}", config_.proxy.template_path);
    }

    if (auto env = get_env("BGCTL_PROXY_HOST")) {
        config_.proxy.host = *env;
        spdlog::debug("Applied BGCTL_PROXY_HOST={}", config_.proxy.host);
    }

    if (auto env = get_env("BGCTL_CHAOS_HOST")) {
        config_.chaos.host = *env;
        spdlog::debug("Applied BGCTL_CHAOS_HOST={}", config_.chaos.host);
    }

    if (auto env = get_env("BGCTL_CHAOS_MODE")) {
        config_.chaos.mode = *env;
        spdlog::debug("Applied BGCTL_CHAOS_MODE={}", config_.chaos.mode);
    }

    if (auto env = get_env("BGCTL_HEAL_TARGET")) {
        config_.chaos.heal_target = *env;
        spdlog::debug("Applied BGCTL_HEAL_TARGET={}", config_.chaos.heal_target);
    }

    if (auto env = get_env("BGCTL_HTTP_TIMEOUT_MS")) {
        try {
            config_.http.request_timeout_ms = static_cast<std::uint32_t>(std::stoul(*env));
            spdlog::debug("Applied BGCTL_HTTP_TIMEOUT_MS={}", config_.http.request_timeout_ms);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid BGCTL_HTTP_TIMEOUT_MS value: " + *env);
        }
    }

    if (auto env = get_env("BGCTL_DOCKER")) {
        config_.docker.binary = *env;
        spdlog::debug("Applied BGCTL_DOCKER={}", config_.docker.binary);
    }

    if (auto env = get_env("BGCTL_LOG_LEVEL")) {
        config_.logging.level = *env;
        spdlog::debug("Applied BGCTL_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("BGCTL_LOG_FILE")) {
        config_.logging.file = *env;
        spdlog::debug("Applied BGCTL_LOG_FILE={}", config_.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    // Value of `--name VALUE` or `--name=VALUE`; advances i for the split form
    auto option_value = [&](const std::string& arg, const std::string& name, int& i)
        -> std::optional<std::string> {
        if (arg == name) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + name);
            }
            return std::string(argv[++i]);
        }
        if (arg.starts_with(name + "=")) {
            return arg.substr(name.size() + 1);
        }
        return std::nullopt;
    };

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (options_done || arg.empty() || arg.front() != '-' || arg == "-") {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        // Skip already processed args
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=") || arg.starts_with("-c=")) continue;

        if (auto value = option_value(arg, "--env-file", i)) {
            config_.deployment.env_file = *value;
        } else if (auto value = option_value(arg, "--compose-file", i)) {
            config_.deployment.compose_file = *value;
        } else if (auto value = option_value(arg, "--log-file", i)) {
            config_.logging.file = *value;
        } else if (auto value = option_value(arg, "--log-level", i)) {
            config_.logging.level = *value;
        } else if (arg == "--verbose" || arg == "-v") {
            config_.logging.level = "debug";
        } else if (arg == "--json") {
            config_.json_output = true;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace bgctl::config
