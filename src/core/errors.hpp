/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Error taxonomy
 *
 * Every failure a command can report derives from ControlError and carries
 * the process exit code the dispatcher uses for it. Components throw; only
 * the command dispatcher decides how the process terminates.
 */

#ifndef BGCTL_CORE_ERRORS_HPP
#define BGCTL_CORE_ERRORS_HPP

#include "core/pool.hpp"

#include <stdexcept>
#include <string>

namespace bgctl::core {

/**
 * Process exit codes
 */
namespace exit_code {
    constexpr int Ok = 0;
    constexpr int Failure = 1;          // usage, missing configuration, generic
    constexpr int InvalidPool = 2;
    constexpr int NotLive = 3;          // switch persisted, proxy not reloaded
    constexpr int ChaosFailed = 4;
    constexpr int Proxy = 5;
    constexpr int Store = 6;
    constexpr int Lifecycle = 7;
}

class ControlError : public std::runtime_error {
public:
    explicit ControlError(const std::string& message, int exit_code = exit_code::Failure)
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const noexcept { return exit_code_; }

private:
    int exit_code_;
};

/**
 * Required configuration files are absent (pre-flight)
 */
class ConfigMissingError : public ControlError {
public:
    explicit ConfigMissingError(const std::string& message)
        : ControlError(message, exit_code::Failure) {}
};

/**
 * Key absent from the deployment record
 */
class NotFoundError : public ControlError {
public:
    explicit NotFoundError(const std::string& key)
        : ControlError("Key '" + key + "' not found in deployment record", exit_code::Store)
        , key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/**
 * Deployment record could not be read or written
 */
class PersistError : public ControlError {
public:
    explicit PersistError(const std::string& message)
        : ControlError(message, exit_code::Store) {}
};

/**
 * Deployment record holds a value outside its domain (bad pool name, bad port)
 */
class MalformedConfigError : public ControlError {
public:
    explicit MalformedConfigError(const std::string& message)
        : ControlError(message, exit_code::Store) {}
};

/**
 * Caller asked for a pool other than blue/green
 */
class InvalidPoolError : public ControlError {
public:
    explicit InvalidPoolError(const std::string& requested)
        : ControlError("Invalid pool specified: " + requested + ". Must be 'blue' or 'green'.",
                       exit_code::InvalidPool)
        , requested_(requested) {}

    const std::string& requested() const noexcept { return requested_; }

private:
    std::string requested_;
};

/**
 * Another writer changed ACTIVE_POOL between our read and our write
 */
class ConcurrentSwitchError : public ControlError {
public:
    explicit ConcurrentSwitchError(const std::string& message)
        : ControlError(message, exit_code::Store) {}
};

class ProxyUnreachableError : public ControlError {
public:
    explicit ProxyUnreachableError(const std::string& message)
        : ControlError(message, exit_code::Proxy) {}
};

class TemplateError : public ControlError {
public:
    explicit TemplateError(const std::string& message)
        : ControlError(message, exit_code::Proxy) {}
};

/**
 * ACTIVE_POOL was persisted but the proxy reload failed.
 * Live routing lags the record until `bgctl reload` succeeds.
 */
class SwitchNotLiveError : public ControlError {
public:
    SwitchNotLiveError(Pool persisted, const std::string& cause)
        : ControlError("ACTIVE_POOL updated to " + to_string(persisted) +
                       " but proxy reload failed, state updated but not yet live: " + cause +
                       ". Run 'bgctl reload' to retry the reload step.",
                       exit_code::NotLive)
        , persisted_(persisted)
        , cause_(cause) {}

    Pool persisted_pool() const noexcept { return persisted_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    Pool persisted_;
    std::string cause_;
};

class ChaosInjectionError : public ControlError {
public:
    ChaosInjectionError(Pool pool, const std::string& message)
        : ControlError(message, exit_code::ChaosFailed)
        , pool_(pool) {}

    Pool pool() const noexcept { return pool_; }

private:
    Pool pool_;
};

/**
 * Container runtime delegation (compose up/down/ps) failed
 */
class LifecycleError : public ControlError {
public:
    explicit LifecycleError(const std::string& message)
        : ControlError(message, exit_code::Lifecycle) {}
};

} // namespace bgctl::core

#endif // BGCTL_CORE_ERRORS_HPP
