/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Command Dispatcher - Implementation
 */

#include "cli/command_dispatcher.hpp"
#include "core/errors.hpp"
#include "core/keys.hpp"
#include "probe/http_client.hpp"
#include "probe/probe_client.hpp"
#include "proxy/proxy_runtime.hpp"
#include "store/storage_backend.hpp"
#include "util/logger.hpp"
#include "util/process.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace bgctl::cli {

using util::log_component::Main;

control::ChaosConfig make_chaos_config(const config::ChaosSettings& settings) {
    auto target = core::parse_heal_target(settings.heal_target);
    if (!target) {
        throw std::runtime_error("Unknown heal target: " + settings.heal_target);
    }

    control::ChaosConfig chaos_config;
    chaos_config.mode = settings.mode;
    chaos_config.strict_status = settings.strict_status;
    chaos_config.heal_target = target->first;
    chaos_config.fixed_heal_pool = target->second;
    return chaos_config;
}

Components build_components(const config::Config& config) {
    Components components;

    auto backend = std::make_shared<store::FileBackend>(config.deployment.env_file);
    components.store = std::make_shared<store::ConfigStore>(backend);

    auto runner = std::make_shared<util::ProcessRunner>();

    // Proxy: rendered on the host, installed with docker exec
    proxy::DockerProxyConfig runtime_config;
    runtime_config.docker_binary = config.docker.binary;
    runtime_config.container = config.proxy.container;
    runtime_config.config_path = config.proxy.config_path;
    runtime_config.validate_before_reload = config.proxy.validate_before_reload;
    runtime_config.timeout = std::chrono::seconds(config.docker.reload_timeout_seconds);
    auto runtime = std::make_shared<proxy::DockerProxyRuntime>(runner, runtime_config);

    components.proxy = std::make_shared<proxy::ProxyController>(
        components.store, runtime, proxy::file_template(config.proxy.template_path));
    components.switcher = std::make_shared<control::PoolSwitcher>(components.store, components.proxy);

    // Probes
    probe::HttpClientConfig http_config;
    http_config.connect_timeout = std::chrono::milliseconds(config.http.connect_timeout_ms);
    http_config.request_timeout = std::chrono::milliseconds(config.http.request_timeout_ms);
    auto http = std::make_shared<probe::BeastHttpClient>(http_config);

    probe::ProbeConfig probe_config;
    probe_config.pool_host = config.chaos.host;
    probe_config.proxy_host = config.proxy.host;
    probe_config.routing_path = config.proxy.probe_path;
    probe_config.pool_header = config.proxy.pool_header;
    probe_config.release_header = config.proxy.release_header;
    auto probe = std::make_shared<probe::ProbeClient>(http, probe_config);

    components.chaos = std::make_shared<control::ChaosDriver>(
        components.store, probe, make_chaos_config(config.chaos));

    // Container lifecycle
    lifecycle::ComposeConfig compose_config;
    compose_config.docker_binary = config.docker.binary;
    compose_config.env_file = config.deployment.env_file;
    compose_config.compose_file = config.deployment.compose_file;
    compose_config.project_name = config.deployment.project_name;
    compose_config.timeout = std::chrono::seconds(config.docker.command_timeout_seconds);
    components.lifecycle = std::make_shared<lifecycle::ComposeLifecycle>(runner, compose_config);

    components.status = std::make_shared<control::StatusReporter>(components.store, probe, components.lifecycle);
    return components;
}

CommandDispatcher::CommandDispatcher(const config::Config& config, Components components, std::ostream& out)
    : config_(config)
    , components_(std::move(components))
    , out_(out)
{
}

void CommandDispatcher::print_usage(std::ostream& out) {
    out << "Usage: bgctl [options] {start|stop|status|switch <blue|green>|chaos|heal [blue|green]|reload|render}\n"
        << "\n"
        << "  start             Start the entire deployment\n"
        << "  stop              Stop and remove the entire deployment\n"
        << "  status            Display container status, active pool and live routing\n"
        << "  switch <pool>     Switch the active pool to 'blue' or 'green'\n"
        << "  chaos             Induce failure (chaos) on the currently active pool\n"
        << "  heal [pool]       Stop chaos mode on a pool\n"
        << "  reload            Re-apply the proxy config from the deployment record\n"
        << "  render            Print the proxy config without applying it\n"
        << "\n"
        << "Run 'bgctl --help' for options.\n";
}

int CommandDispatcher::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage(out_);
        return core::exit_code::Failure;
    }

    const auto& command = args.front();
    std::vector<std::string> command_args(args.begin() + 1, args.end());

    static const std::vector<std::string> known{
        "start", "stop", "status", "switch", "chaos", "heal", "reload", "render"
    };
    if (std::find(known.begin(), known.end(), command) == known.end()) {
        BGCTL_LOG_ERROR(Main, "Unknown command: {}", command);
        print_usage(out_);
        return core::exit_code::Failure;
    }

    try {
        validate_files();
        return execute(command, command_args);
    } catch (const core::ControlError& e) {
        BGCTL_LOG_ERROR(Main, "{}", e.what());
        return e.exit_code();
    } catch (const std::exception& e) {
        BGCTL_LOG_ERROR(Main, "Command '{}' failed: {}", command, e.what());
        return core::exit_code::Failure;
    }
}

void CommandDispatcher::validate_files() const {
    BGCTL_LOG_INFO(Main, "Validating configuration files...");

    const auto& env_file = config_.deployment.env_file;
    if (!std::filesystem::exists(env_file)) {
        throw core::ConfigMissingError("Configuration file not found: " + env_file +
                                       ". Please create it with ACTIVE_POOL, NGINX_PORT, "
                                       "BLUE_APP_PORT and GREEN_APP_PORT.");
    }

    const auto& compose_file = config_.deployment.compose_file;
    if (!std::filesystem::exists(compose_file)) {
        throw core::ConfigMissingError("Compose file not found: " + compose_file + ".");
    }

    BGCTL_LOG_SUCCESS(Main, "Configuration files found.");
}

int CommandDispatcher::execute(const std::string& command, const std::vector<std::string>& args) {
    if (command == "switch") {
        if (args.size() != 1) {
            BGCTL_LOG_ERROR(Main, "Usage: bgctl switch <blue|green>");
            return core::exit_code::Failure;
        }
        return switch_pool(args.front());
    }
    if (command == "heal") {
        if (args.size() > 1) {
            BGCTL_LOG_ERROR(Main, "Usage: bgctl heal [blue|green]");
            return core::exit_code::Failure;
        }
        return heal(args);
    }

    if (!args.empty()) {
        BGCTL_LOG_ERROR(Main, "Command '{}' takes no arguments", command);
        return core::exit_code::Failure;
    }

    if (command == "start") return start();
    if (command == "stop") return stop();
    if (command == "status") return status();
    if (command == "chaos") return chaos();
    if (command == "reload") return reload();
    return render();
}

int CommandDispatcher::start() {
    BGCTL_LOG_INFO(Main, "Starting deployment from {}...", config_.deployment.compose_file);
    components_.lifecycle->up();
    BGCTL_LOG_SUCCESS(Main, "Deployment started. Active pool: {}",
                      components_.store->find(core::keys::ActivePool).value_or("<unset>"));
    return core::exit_code::Ok;
}

int CommandDispatcher::stop() {
    BGCTL_LOG_INFO(Main, "Stopping and removing deployment...");
    components_.lifecycle->down();
    BGCTL_LOG_SUCCESS(Main, "Deployment stopped.");
    return core::exit_code::Ok;
}

int CommandDispatcher::status() {
    auto view = components_.status->snapshot();
    if (config_.json_output) {
        nlohmann::json j = view;
        j["record"] = components_.store->location();
        out_ << j.dump(2) << "\n";
    } else {
        components_.status->report(view, components_.store->location());
    }
    return core::exit_code::Ok;
}

int CommandDispatcher::switch_pool(const std::string& pool) {
    auto result = components_.switcher->switch_to(pool);
    if (result.changed) {
        BGCTL_LOG_INFO(Main, "Traffic moved from {} to {}",
                       core::to_string(result.previous), core::to_string(result.current));
    }
    return core::exit_code::Ok;
}

int CommandDispatcher::chaos() {
    auto pool = components_.store->active_pool();
    components_.chaos->induce_chaos(pool);
    return core::exit_code::Ok;
}

int CommandDispatcher::heal(const std::vector<std::string>& args) {
    core::Pool target;
    if (!args.empty()) {
        auto pool = core::parse_pool(args.front());
        if (!pool) {
            throw core::InvalidPoolError(args.front());
        }
        target = *pool;
    } else {
        target = components_.chaos->resolve_heal_target();
    }

    // Heal failures are reported by the driver as warnings
    components_.chaos->heal_chaos(target);
    return core::exit_code::Ok;
}

int CommandDispatcher::reload() {
    components_.proxy->reload();
    BGCTL_LOG_SUCCESS(Main, "Proxy configuration reloaded for active pool {}",
                      components_.store->find(core::keys::ActivePool).value_or("<unset>"));
    return core::exit_code::Ok;
}

int CommandDispatcher::render() {
    out_ << components_.proxy->render();
    return core::exit_code::Ok;
}

} // namespace bgctl::cli
