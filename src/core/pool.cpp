/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Pool identity - Implementation
 */

#include "core/pool.hpp"
#include "core/keys.hpp"

namespace bgctl::core {

std::optional<Pool> parse_pool(std::string_view name) {
    if (name == "blue") return Pool::blue;
    if (name == "green") return Pool::green;
    return std::nullopt;
}

std::string_view port_key(Pool pool) {
    return pool == Pool::blue ? keys::BluePort : keys::GreenPort;
}

std::optional<std::pair<HealTargetMode, Pool>> parse_heal_target(std::string_view value) {
    if (value == "observed") {
        return std::make_pair(HealTargetMode::observed, Pool::blue);
    }
    if (auto pool = parse_pool(value)) {
        return std::make_pair(HealTargetMode::fixed, *pool);
    }
    return std::nullopt;
}

} // namespace bgctl::core
