/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Process runner - External commands (docker, docker compose) with Boost.Process
 */

#ifndef BGCTL_UTIL_PROCESS_HPP
#define BGCTL_UTIL_PROCESS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace bgctl::util {

/**
 * Command to execute (no shell involved)
 */
struct CommandSpec {
    std::string program;                        // Resolved through PATH unless it contains '/'
    std::vector<std::string> args;
    std::optional<std::string> stdin_data;      // Written to the child's stdin, then closed
    std::chrono::seconds timeout{120};
};

/**
 * Outcome of a command
 */
struct CommandResult {
    bool started{false};        // false: program not found or spawn failed
    bool timed_out{false};      // child was terminated after the timeout
    int exit_code{-1};
    std::string stdout_data;
    std::string stderr_data;
    std::string error_message;  // spawn error, if any

    bool ok() const noexcept { return started && !timed_out && exit_code == 0; }

    /**
     * Short description of a failure for log and error messages
     */
    std::string describe_failure() const;
};

/**
 * Render a command line for logging
 */
std::string to_display_string(const CommandSpec& spec);

/**
 * Command runner interface
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * Run a command to completion (or timeout). Never throws for command
     * failures; they are reported in CommandResult.
     */
    virtual CommandResult run(const CommandSpec& spec) = 0;
};

/**
 * Boost.Process implementation
 */
class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const CommandSpec& spec) override;
};

} // namespace bgctl::util

#endif // BGCTL_UTIL_PROCESS_HPP
