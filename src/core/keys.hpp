/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Deployment record keys
 */

#ifndef BGCTL_CORE_KEYS_HPP
#define BGCTL_CORE_KEYS_HPP

#include <string_view>

namespace bgctl::core::keys {

constexpr std::string_view ActivePool = "ACTIVE_POOL";
constexpr std::string_view NginxPort = "NGINX_PORT";
constexpr std::string_view BluePort = "BLUE_APP_PORT";
constexpr std::string_view GreenPort = "GREEN_APP_PORT";
constexpr std::string_view InternalPort = "APP_INTERNAL_PORT";  // optional

} // namespace bgctl::core::keys

#endif // BGCTL_CORE_KEYS_HPP
