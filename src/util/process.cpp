/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Process runner - Implementation
 */

#include "util/process.hpp"

#include <utility>  // must precede Boost.Asio 1.74 (awaitable.hpp uses std::exchange)

#include <boost/asio.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <future>
#include <system_error>

namespace bgctl::util {

namespace asio = boost::asio;
namespace bp = boost::process;

namespace {

// Grace period for the pipes to drain after a timed-out child is killed
constexpr std::chrono::seconds drain_timeout{2};

std::string trim(std::string value) {
    auto end = value.find_last_not_of(" \t\r\n");
    value.erase(end == std::string::npos ? 0 : end + 1);
    return value;
}

std::string take_if_ready(std::future<std::string>& future) {
    if (future.valid() &&
        future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return future.get();
    }
    return {};
}

} // namespace

std::string CommandResult::describe_failure() const {
    if (!started) {
        return error_message.empty() ? "command could not be started" : error_message;
    }
    if (timed_out) {
        return "command timed out";
    }
    auto detail = trim(stderr_data);
    if (detail.empty()) {
        detail = trim(stdout_data);
    }
    auto message = "exit code " + std::to_string(exit_code);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

std::string to_display_string(const CommandSpec& spec) {
    std::string line = spec.program;
    for (const auto& arg : spec.args) {
        line += ' ';
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            line += '\'' + arg + '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

CommandResult ProcessRunner::run(const CommandSpec& spec) {
    CommandResult result;

    boost::filesystem::path executable = spec.program;
    if (spec.program.find('/') == std::string::npos) {
        executable = bp::search_path(spec.program);
    }
    if (executable.empty()) {
        result.error_message = "'" + spec.program + "' not found in PATH";
        spdlog::debug("Command not started: {}", result.error_message);
        return result;
    }

    spdlog::debug("Running: {}", to_display_string(spec));

    asio::io_context io_context;
    bp::async_pipe input(io_context);
    std::future<std::string> output;
    std::future<std::string> errors;

    bp::child child;
    try {
        child = bp::child(executable, bp::args(spec.args),
                          bp::std_in < input,
                          bp::std_out > output,
                          bp::std_err > errors,
                          io_context);
    } catch (const bp::process_error& e) {
        result.error_message = "failed to start '" + spec.program + "': " + e.what();
        spdlog::debug("Command not started: {}", result.error_message);
        return result;
    }
    result.started = true;

    if (spec.stdin_data) {
        asio::async_write(input, asio::buffer(*spec.stdin_data),
            [&input](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    spdlog::debug("Writing child stdin failed: {}", ec.message());
                }
                input.close();
            });
    } else {
        input.close();
    }

    io_context.run_for(spec.timeout);

    if (!io_context.stopped()) {
        // Still has pending work: the child outlived its timeout
        result.timed_out = true;
        std::error_code ec;
        child.terminate(ec);
        if (ec) {
            spdlog::warn("Could not terminate '{}': {}", spec.program, ec.message());
        }
        io_context.run_for(drain_timeout);
    }

    std::error_code wait_ec;
    child.wait(wait_ec);
    if (wait_ec) {
        spdlog::debug("Waiting for '{}' failed: {}", spec.program, wait_ec.message());
    }
    result.exit_code = child.exit_code();
    result.stdout_data = take_if_ready(output);
    result.stderr_data = take_if_ready(errors);

    spdlog::debug("Command '{}' finished: exit_code={}, timed_out={}",
                  spec.program, result.exit_code, result.timed_out);
    return result;
}

} // namespace bgctl::util
