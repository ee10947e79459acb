/**
 * BGCTL - Blue/Green Deployment Control Plane
 * HTTP Client - Synchronous requests to pools and the proxy with Boost.Beast
 */

#ifndef BGCTL_PROBE_HTTP_CLIENT_HPP
#define BGCTL_PROBE_HTTP_CLIENT_HPP

#include <utility>  // must precede Boost.Asio 1.74 (awaitable.hpp uses std::exchange)

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bgctl::probe {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Outgoing request description
 */
struct HttpRequestSpec {
    http::verb method{http::verb::get};
    std::string host{"localhost"};
    std::uint16_t port{80};
    std::string target{"/"};
};

/**
 * Result of one request
 *
 * success is true whenever an HTTP response was received, whatever its
 * status; transport failures (resolve, connect, timeout, reset) leave it
 * false with error_message set.
 */
struct HttpResult {
    bool success{false};
    int status_code{0};
    std::vector<std::pair<std::string, std::string>> headers{};
    std::string body;
    std::string error_message;
    bool timed_out{false};
    std::chrono::milliseconds latency{0};

    /**
     * Case-insensitive header lookup
     */
    std::optional<std::string> header(std::string_view name) const;

    bool is_2xx() const noexcept { return status_code >= 200 && status_code < 300; }
};

/**
 * HTTP client interface
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * Perform a request. Never throws for transport failures.
     */
    virtual HttpResult send(const HttpRequestSpec& request) = 0;
};

/**
 * Timeouts for BeastHttpClient
 */
struct HttpClientConfig {
    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds request_timeout{3000};   // write + read of one exchange
    std::string user_agent{"bgctl/1.0"};
};

/**
 * Boost.Beast implementation over a fresh connection per request
 */
class BeastHttpClient : public HttpClient {
public:
    explicit BeastHttpClient(const HttpClientConfig& config = {});

    // Non-copyable
    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    HttpResult send(const HttpRequestSpec& request) override;

    const HttpClientConfig& config() const { return config_; }

private:
    asio::io_context io_context_;
    HttpClientConfig config_;
};

} // namespace bgctl::probe

#endif // BGCTL_PROBE_HTTP_CLIENT_HPP
