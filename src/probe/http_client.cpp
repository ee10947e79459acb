/**
 * BGCTL - Blue/Green Deployment Control Plane
 * HTTP Client - Implementation
 */

#include "probe/http_client.hpp"

#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace bgctl::probe {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

} // namespace

std::optional<std::string> HttpResult::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

BeastHttpClient::BeastHttpClient(const HttpClientConfig& config)
    : config_(config)
{
    spdlog::debug("HttpClient created with connect_timeout={}ms, request_timeout={}ms",
                  config_.connect_timeout.count(), config_.request_timeout.count());
}

HttpResult BeastHttpClient::send(const HttpRequestSpec& request) {
    HttpResult result;
    auto start_time = std::chrono::steady_clock::now();

    auto finish = [&](const beast::error_code& ec, std::string_view stage) {
        result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        if (!ec) return;

        result.success = false;
        result.timed_out = (ec == beast::error::timeout);
        if (result.timed_out) {
            result.error_message = std::string(stage) + " timed out";
        } else {
            result.error_message = std::string(stage) + " failed: " + ec.message();
        }
        spdlog::debug("HTTP {} {}:{}{} - {}",
                      std::string(http::to_string(request.method)),
                      request.host, request.port, request.target, result.error_message);
    };

    // Each stage is run to completion on our private io_context so that
    // tcp_stream's expiry applies; synchronous Beast calls ignore it.
    auto run = [this]() {
        io_context_.restart();
        io_context_.run();
    };

    beast::error_code ec;

    // The resolve handler may outlive this call if the lookup is abandoned,
    // so its outputs are shared rather than captured by reference.
    struct ResolveState {
        bool done{false};
        beast::error_code error;
        tcp::resolver::results_type endpoints;
    };
    auto resolved = std::make_shared<ResolveState>();

    tcp::resolver resolver(io_context_);
    resolver.async_resolve(request.host, std::to_string(request.port),
        [resolved](beast::error_code e, tcp::resolver::results_type results) {
            resolved->done = true;
            resolved->error = e;
            resolved->endpoints = std::move(results);
        });
    io_context_.restart();
    io_context_.run_for(config_.connect_timeout);
    if (!resolved->done) {
        resolver.cancel();
        finish(beast::error::timeout, "DNS resolution");
        return result;
    }
    if (resolved->error) {
        finish(resolved->error, "DNS resolution");
        return result;
    }
    auto endpoints = std::move(resolved->endpoints);

    beast::tcp_stream stream(io_context_);
    stream.expires_after(config_.connect_timeout);
    stream.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run();
    if (ec) {
        finish(ec, "Connect");
        return result;
    }

    http::request<http::empty_body> req{request.method, request.target, 11};
    req.set(http::field::host, request.host + ":" + std::to_string(request.port));
    req.set(http::field::user_agent, config_.user_agent);
    req.set(http::field::connection, "close");
    req.prepare_payload();

    stream.expires_after(config_.request_timeout);
    http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    run();
    if (ec) {
        finish(ec, "Request write");
        return result;
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    if (request.method == http::verb::head) {
        parser.skip(true);  // HEAD responses carry Content-Length but no body
    }
    http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
    run();
    if (ec) {
        finish(ec, "Response read");
        return result;
    }

    auto response = parser.release();
    result.success = true;
    result.status_code = static_cast<int>(response.result_int());
    for (const auto& field : response) {
        result.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    result.body = std::move(response.body());
    finish({}, "");

    spdlog::debug("HTTP {} {}:{}{} -> {} in {}ms",
                  std::string(http::to_string(request.method)),
                  request.host, request.port, request.target,
                  result.status_code, result.latency.count());

    beast::error_code close_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, close_ec);
    stream.close();

    return result;
}

} // namespace bgctl::probe
