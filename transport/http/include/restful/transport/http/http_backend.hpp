#pragma once

/**
 * @file http_backend.hpp
 * @brief Abstract HTTP transport interface
 *
 * Defines the request/response types exchanged with a transport and the
 * interface every transport implements. The production implementation is
 * the libcurl backend; tests plug in scripted backends.
 *
 * A transport Response may hold a ConnectionLease. The connection stays
 * checked out until the lease is released, either for reuse once the body
 * has been consumed, or closed when the caller abandons it.
 */

#include <restful/common/error.hpp>
#include <restful/common/headers.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restful::transport::http {

//=============================================================================
// HTTP Methods and Status
//=============================================================================

enum class Method : uint8_t { GET, POST, PUT, PATCH, DELETE_, HEAD, OPTIONS };

constexpr std::string_view method_to_string(Method method) noexcept {
    constexpr std::string_view NAMES[] = {"GET", "POST", "PUT", "PATCH", "DELETE", "HEAD",
                                          "OPTIONS"};
    auto index = static_cast<size_t>(method);
    return index < std::size(NAMES) ? NAMES[index] : "GET";
}

/// Verbs whose responses may be cached
constexpr bool is_read_method(Method method) noexcept {
    return method == Method::GET || method == Method::HEAD || method == Method::OPTIONS;
}

/// Verbs that carry a payload and a Content-Type
constexpr bool is_content_method(Method method) noexcept {
    return method == Method::POST || method == Method::PUT || method == Method::PATCH;
}

/// First digit of the status code; anything outside 1xx..4xx counts as a server error
enum class StatusCategory : uint8_t {
    INFORMATIONAL,
    SUCCESS,
    REDIRECTION,
    CLIENT_ERROR,
    SERVER_ERROR,
};

constexpr StatusCategory status_category(int code) noexcept {
    switch (code / 100) {
        case 1:  return StatusCategory::INFORMATIONAL;
        case 2:  return StatusCategory::SUCCESS;
        case 3:  return StatusCategory::REDIRECTION;
        case 4:  return StatusCategory::CLIENT_ERROR;
        default: return StatusCategory::SERVER_ERROR;
    }
}

//=============================================================================
// Request and Response
//=============================================================================

using Headers = common::HeaderMap;

using CancellationFlag = std::shared_ptr<const std::atomic<bool>>;

/**
 * @brief HTTP Request
 */
struct Request {
    using Clock = std::chrono::steady_clock;

    Method method = Method::GET;
    std::string url;
    Headers headers;
    std::vector<uint8_t> body;

    // Zero means no limit. `timeout` bounds the whole exchange, connect included.
    // Unset values fall back to the transport's TransportConfig.
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> timeout;

    // Absolute point after which the transfer is aborted
    std::optional<Clock::time_point> deadline;

    // Set to true by the caller to abort the transfer
    CancellationFlag cancelled;

    // Redirects
    bool follow_redirects = true;
    int max_redirects     = 10;

    bool is_cancelled() const noexcept {
        return cancelled && cancelled->load(std::memory_order_acquire);
    }

    bool deadline_expired() const noexcept { return deadline && Clock::now() >= *deadline; }
};

/**
 * @brief Connection phase durations for one transfer
 *
 * Phases that did not happen (DNS on a reused connection, TLS on plain
 * HTTP) are left empty.
 */
struct TransferTiming {
    using Duration = std::chrono::microseconds;

    std::optional<Duration> dns;
    std::optional<Duration> tcp_connect;
    std::optional<Duration> tls_handshake;
    std::optional<Duration> request_written;
    std::optional<Duration> first_byte;
    Duration total{0};
};

/**
 * @brief A checked-out connection
 *
 * release() is idempotent; only the first call has an effect. Leases not
 * released explicitly are returned for reuse on destruction.
 */
class ConnectionLease {
public:
    virtual ~ConnectionLease() = default;

    virtual void release(bool reusable) = 0;
    virtual bool released() const noexcept = 0;
};

/**
 * @brief HTTP Response
 */
struct Response {
    int status_code = 0;
    std::string status_message;
    Headers headers;
    std::vector<uint8_t> body;

    TransferTiming timing;
    bool connection_reused = false;

    // Transport failure; status_code is meaningless when set
    std::optional<common::Error> error;

    std::shared_ptr<ConnectionLease> lease;

    bool has_error() const noexcept { return error.has_value(); }

    bool is_success() const noexcept { return !error && status_code >= 200 && status_code < 300; }

    StatusCategory category() const noexcept { return status_category(status_code); }

    std::string_view header(std::string_view name) const {
        return common::header_value(headers, name);
    }

    std::string_view body_string() const noexcept {
        return std::string_view(reinterpret_cast<const char*>(body.data()), body.size());
    }
};

//=============================================================================
// Transport Configuration
//=============================================================================

/**
 * @brief Settings shared by every request sent through one transport
 */
struct TransportConfig {
    std::string name;

    // Defaults for requests that carry no timeouts of their own. A request
    // without a total timeout gets connect + response, or no limit when
    // response_timeout is zero.
    std::chrono::milliseconds connect_timeout{1500};
    std::chrono::milliseconds response_timeout{500};

    // Idle connections kept for reuse; extra connections are closed on release
    size_t max_idle_per_host = 2;

    // Empty: honor http_proxy / https_proxy / no_proxy from the environment
    std::string proxy_url;

    bool verify_ssl = true;
};

//=============================================================================
// Backend Statistics
//=============================================================================

struct BackendStats {
    uint64_t requests_sent      = 0;
    uint64_t responses_received = 0;
    uint64_t errors             = 0;
    uint64_t timeouts           = 0;
    uint64_t cancellations      = 0;
    uint64_t connections_opened = 0;
    uint64_t connections_reused = 0;
    uint64_t bytes_sent         = 0;
    uint64_t bytes_received     = 0;

    // Leases currently checked out
    uint64_t active_leases = 0;
    // Connections parked for reuse
    uint64_t idle_connections = 0;
};

//=============================================================================
// Backend Interface
//=============================================================================

/**
 * @brief Abstract HTTP transport
 *
 * Implementations must be safe to call from many threads at once.
 */
class IHTTPBackend {
public:
    virtual ~IHTTPBackend() = default;

    virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Execute one HTTP exchange (blocking)
     *
     * Never throws; failures are reported in Response::error.
     */
    virtual Response execute(const Request& request) = 0;

    /**
     * @brief Close every idle connection
     */
    virtual void close_idle() = 0;

    virtual BackendStats stats() const = 0;
    virtual void reset_stats() = 0;
};

}  // namespace restful::transport::http
