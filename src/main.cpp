/**
 * BGCTL - Blue/Green Deployment Control Plane
 *
 * Operator CLI that starts, stops, inspects, switches and fault-injects a
 * blue/green deployment behind a reverse proxy.
 */

#include "cli/command_dispatcher.hpp"
#include "config/config.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>

int main(int argc, char* argv[]) {
    // Writes to a child's stdin must fail with EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    bgctl::config::ConfigManager config_manager;
    try {
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return bgctl::core::exit_code::Ok;
        }
    } catch (const std::exception& e) {
        std::cerr << "bgctl: " << e.what() << "\n";
        bgctl::cli::CommandDispatcher::print_usage(std::cerr);
        return bgctl::core::exit_code::Failure;
    }

    const auto& config = config_manager.get_config();

    bgctl::util::LogConfig log_config;
    log_config.level = bgctl::util::Logger::parse_level(config.logging.level).value_or(bgctl::util::LogLevel::Info);
    log_config.file_path = config.logging.file;
    log_config.max_file_size_mb = config.logging.max_file_size_mb;
    log_config.max_files = config.logging.max_files;
    log_config.enable_console = config.logging.enable_console;
    log_config.enable_colors = config.logging.enable_colors;
    bgctl::util::Logger::init(log_config);

    if (!config_manager.get_config_path().empty()) {
        BGCTL_LOG_DEBUG(bgctl::util::log_component::Config, "Settings loaded from {}",
                        config_manager.get_config_path().string());
    }

    int exit_code = bgctl::core::exit_code::Failure;
    try {
        bgctl::cli::CommandDispatcher dispatcher(config, bgctl::cli::build_components(config));
        exit_code = dispatcher.run(config_manager.positional());
    } catch (const std::exception& e) {
        BGCTL_LOG_ERROR(bgctl::util::log_component::Main, "Fatal error: {}", e.what());
    }

    bgctl::util::Logger::instance().shutdown();
    return exit_code;
}
