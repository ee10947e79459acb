/**
 * BGCTL - Blue/Green Deployment Control Plane
 * Probe Client - Implementation
 */

#include "probe/probe_client.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace bgctl::probe {

ProbeClient::ProbeClient(std::shared_ptr<HttpClient> http, const ProbeConfig& config)
    : http_(std::move(http))
    , config_(config)
{
    if (!http_) {
        throw std::invalid_argument("ProbeClient requires an HTTP client");
    }
}

HttpResult ProbeClient::start_chaos(std::uint16_t pool_port, const std::string& mode) {
    HttpRequestSpec request;
    request.method = http::verb::post;
    request.host = config_.pool_host;
    request.port = pool_port;
    request.target = config_.chaos_start_path;
    if (!mode.empty()) {
        request.target += "?mode=" + mode;
    }
    return http_->send(request);
}

HttpResult ProbeClient::stop_chaos(std::uint16_t pool_port) {
    HttpRequestSpec request;
    request.method = http::verb::post;
    request.host = config_.pool_host;
    request.port = pool_port;
    request.target = config_.chaos_stop_path;
    return http_->send(request);
}

RoutingObservation ProbeClient::observe_routing(std::uint16_t public_port) {
    HttpRequestSpec request;
    request.method = http::verb::head;
    request.host = config_.proxy_host;
    request.port = public_port;
    request.target = config_.routing_path;

    auto result = http_->send(request);

    RoutingObservation observation;
    observation.reachable = result.success;
    observation.status_code = result.status_code;
    observation.error_message = result.error_message;
    if (result.success) {
        observation.served_pool = result.header(config_.pool_header);
        observation.release = result.header(config_.release_header);
    }

    spdlog::debug("Routing probe {}:{}{}: reachable={}, status={}, pool={}",
                  config_.proxy_host, public_port, config_.routing_path,
                  observation.reachable, observation.status_code,
                  observation.served_pool.value_or("-"));
    return observation;
}

} // namespace bgctl::probe
