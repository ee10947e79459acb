/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Pool identity - the two interchangeable application pools
 */

#ifndef BGCTL_CORE_POOL_HPP
#define BGCTL_CORE_POOL_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bgctl::core {

/**
 * Application pool identity
 */
enum class Pool {
    blue,
    green
};

inline constexpr std::array<Pool, 2> all_pools{Pool::blue, Pool::green};

/**
 * Convert Pool to its persisted / wire name
 */
inline std::string to_string(Pool pool) {
    switch (pool) {
        case Pool::blue: return "blue";
        case Pool::green: return "green";
        default: return "unknown";
    }
}

/**
 * Parse a pool name (exact, case-sensitive)
 * @return std::nullopt for anything other than "blue" or "green"
 */
std::optional<Pool> parse_pool(std::string_view name);

/**
 * The pool that is not `pool`
 */
constexpr Pool other(Pool pool) noexcept {
    return pool == Pool::blue ? Pool::green : Pool::blue;
}

/**
 * Env record key holding the host port of a pool (BLUE_APP_PORT / GREEN_APP_PORT)
 */
std::string_view port_key(Pool pool);

/**
 * How `heal` picks its target when no pool is given
 */
enum class HealTargetMode {
    observed,   // the pool traffic is not being served from, per the proxy
    fixed       // always the configured pool (legacy behavior: blue)
};

/**
 * Parse "observed" / "blue" / "green" into a mode and fixed pool
 */
std::optional<std::pair<HealTargetMode, Pool>> parse_heal_target(std::string_view value);

} // namespace bgctl::core

#endif // BGCTL_CORE_POOL_HPP
