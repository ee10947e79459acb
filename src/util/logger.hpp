/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Logger - Structured logging with spdlog
 *
 * Provides:
 * - Leveled logging (DEBUG, INFO, WARN, ERROR) plus SUCCESS and STATUS markers
 * - Log format: timestamp, level, component, message
 * - Operator terminal (colored stdout) and a durable rotating log file
 * - Configurable log level via config/environment
 */

#ifndef BGCTL_UTIL_LOGGER_HPP
#define BGCTL_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace bgctl::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for terminal only
    std::size_t max_file_size_mb{10};  // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};         // Log to stdout
    bool enable_colors{true};          // Colored console output
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton that manages application-wide logging.
 *
 * Note: Destructor is public to allow std::unique_ptr to clean up the singleton.
 * The singleton pattern is maintained by keeping the constructor private.
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration
     * Must be called before any logging occurs
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    // Component-tagged logging methods
    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, {}, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, {}, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, {}, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, {}, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, {}, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, {}, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Completed operation (logged at info level, marked SUCCESS)
     */
    template<typename... Args>
    void success(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, "SUCCESS", component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Status report line (logged at info level, marked STATUS)
     */
    template<typename... Args>
    void status(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, "STATUS", component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Shutdown and flush all logs
     */
    void shutdown();

private:
    Logger() = default;

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view marker, std::string_view component,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_) return;

        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        auto full_msg = marker.empty()
            ? fmt::format("[{}] {}", component, msg)
            : fmt::format("[{}] {}: {}", component, marker, msg);

        switch (level) {
            case LogLevel::Trace:    logger_->trace(full_msg); break;
            case LogLevel::Debug:    logger_->debug(full_msg); break;
            case LogLevel::Info:     logger_->info(full_msg); break;
            case LogLevel::Warn:     logger_->warn(full_msg); break;
            case LogLevel::Error:    logger_->error(full_msg); break;
            case LogLevel::Critical: logger_->critical(full_msg); break;
            default: break;
        }
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging with automatic component tagging
#define BGCTL_LOG_TRACE(component, ...) \
    ::bgctl::util::Logger::instance().trace(component, __VA_ARGS__)
#define BGCTL_LOG_DEBUG(component, ...) \
    ::bgctl::util::Logger::instance().debug(component, __VA_ARGS__)
#define BGCTL_LOG_INFO(component, ...) \
    ::bgctl::util::Logger::instance().info(component, __VA_ARGS__)
#define BGCTL_LOG_WARN(component, ...) \
    ::bgctl::util::Logger::instance().warn(component, __VA_ARGS__)
#define BGCTL_LOG_ERROR(component, ...) \
    ::bgctl::util::Logger::instance().error(component, __VA_ARGS__)
#define BGCTL_LOG_SUCCESS(component, ...) \
    ::bgctl::util::Logger::instance().success(component, __VA_ARGS__)
#define BGCTL_LOG_STATUS(component, ...) \
    ::bgctl::util::Logger::instance().status(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Main = "main";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Store = "store";
    constexpr std::string_view Proxy = "proxy";
    constexpr std::string_view Switch = "switch";
    constexpr std::string_view Chaos = "chaos";
    constexpr std::string_view Status = "status";
    constexpr std::string_view Lifecycle = "lifecycle";
}

} // namespace bgctl::util

#endif // BGCTL_UTIL_LOGGER_HPP
