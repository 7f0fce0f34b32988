#pragma once

/**
 * @file request_builder.hpp
 * @brief Request engine: defaults for one remote API plus the call path
 *
 * A RequestBuilder carries everything shared by calls to one target
 * (base URL, content type, timeouts, caching, retry and breaker policy,
 * pool selection) and executes logical requests against it. One logical
 * request goes through:
 *
 * 1. circuit breaker admission (denied calls fail with status 500)
 * 2. cache lookup for read verbs, fresh hits return immediately
 * 3. body marshalling
 * 4. attempt loop: send, record metrics, consult the retry strategy
 * 5. 304 handling, gzip decoding, cache metadata and storage
 * 6. breaker outcome report: success is no error and a non-5xx status
 *
 * Builders are immutable after construction and safe to share between
 * threads. The transport is taken from the pool registry on first use.
 *
 * Usage:
 * @code
 * RequestBuilderConfig config;
 * config.base_url     = "https://api.example.com";
 * config.enable_cache = true;
 * config.retry_strategy = std::make_shared<SimpleRetryStrategy>(2, 50ms);
 *
 * RequestBuilder items(config, ClientResources::create());
 * auto response = items.get("/items/42");
 * if (response->is_success()) {
 *     auto json = response->json();
 * }
 * @endcode
 */

#include "restful/client/body_codec.hpp"
#include "restful/client/metrics_port.hpp"
#include "restful/client/request_options.hpp"
#include "restful/client/resource_cache.hpp"
#include "restful/client/response.hpp"
#include "restful/client/retry_strategy.hpp"
#include "restful/client/tracing_port.hpp"

#include <restful/common/circuit_breaker.hpp>
#include <restful/common/concurrency_limiter.hpp>
#include <restful/transport/http/connection_pool.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace restful::client {

using transport::http::Method;

constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{500};
constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{1500};
constexpr size_t DEFAULT_MAX_IDLE_PER_HOST = 2;

//=============================================================================
// Configuration
//=============================================================================

struct BasicAuth {
    std::string username;
    std::string password;
};

struct PoolSettings {
    // Empty selects PoolRegistry::DEFAULT_POOL_NAME
    std::string name;
    size_t max_idle_per_host = DEFAULT_MAX_IDLE_PER_HOST;
    std::string proxy_url;
    bool verify_ssl = true;
};

struct MetricsSettings {
    std::string target_id;
    bool disable_api_call_metrics   = false;
    bool disable_connection_metrics = false;
};

/**
 * @brief How attempts after the first are admitted
 *
 * DIRECT: retries go out unconditionally (a circuit breaker guards the
 * target). LIMITED: each retry needs a permit from the shared retry
 * limiter and the loop ends when none is free.
 */
enum class RetryMode : uint8_t { DIRECT, LIMITED };

struct RequestBuilderConfig {
    std::string base_url;
    ContentType content_type = ContentType::JSON;

    // Sent on every request, before the engine's own headers
    Headers headers;

    // Zero selects the defaults
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connect_timeout{0};
    bool disable_timeout = false;

    bool enable_cache        = false;
    bool uncompress_response = false;
    bool follow_redirect     = false;

    // Empty selects DEFAULT_USER_AGENT
    std::string user_agent;
    std::optional<BasicAuth> basic_auth;

    PoolSettings pool;
    MetricsSettings metrics;

    std::shared_ptr<const IRetryStrategy> retry_strategy;
    std::shared_ptr<common::ICircuitBreaker> circuit_breaker;
};

//=============================================================================
// Shared collaborators
//=============================================================================

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief State shared by builders of one client
 *
 * Null members are replaced with fresh defaults by the builder, so two
 * builders only share what they are explicitly given.
 */
struct ClientResources {
    std::shared_ptr<ResourceCache> cache;
    std::shared_ptr<transport::http::PoolRegistry> pools;
    std::shared_ptr<IMetricsPort> metrics;
    std::shared_ptr<const ITracingPort> tracing;
    std::shared_ptr<common::ConcurrencyLimiter> retry_limiter;

    // Waits between attempts; std::this_thread::sleep_for when empty
    Sleeper sleep;

    /**
     * @brief Complete set: own cache, libcurl pools, MetricRegistry-backed
     *        metrics, pass-through tracing and a default retry limiter
     */
    static ClientResources create();
};

//=============================================================================
// Request Builder
//=============================================================================

class RequestBuilder {
public:
    explicit RequestBuilder(RequestBuilderConfig config, ClientResources resources = {});
    ~RequestBuilder();

    RequestBuilder(const RequestBuilder&)            = delete;
    RequestBuilder& operator=(const RequestBuilder&) = delete;
    RequestBuilder(RequestBuilder&&) noexcept;
    RequestBuilder& operator=(RequestBuilder&&) noexcept;

    /**
     * @brief Execute one logical request
     *
     * Never returns null and never throws on network, protocol or decoding
     * failures: those are reported in Response::error.
     * @param url appended verbatim to the base URL
     */
    std::shared_ptr<const Response> execute(Method method, const std::string& url,
                                            const RequestBody& body = {},
                                            const RequestOptions& options = {}) const;

    std::shared_ptr<const Response> get(const std::string& url,
                                        const RequestOptions& options = {}) const {
        return execute(Method::GET, url, {}, options);
    }

    std::shared_ptr<const Response> post(const std::string& url, const RequestBody& body,
                                         const RequestOptions& options = {}) const {
        return execute(Method::POST, url, body, options);
    }

    std::shared_ptr<const Response> put(const std::string& url, const RequestBody& body,
                                        const RequestOptions& options = {}) const {
        return execute(Method::PUT, url, body, options);
    }

    std::shared_ptr<const Response> patch(const std::string& url, const RequestBody& body,
                                          const RequestOptions& options = {}) const {
        return execute(Method::PATCH, url, body, options);
    }

    std::shared_ptr<const Response> del(const std::string& url,
                                        const RequestOptions& options = {}) const {
        return execute(Method::DELETE_, url, {}, options);
    }

    std::shared_ptr<const Response> head(const std::string& url,
                                         const RequestOptions& options = {}) const {
        return execute(Method::HEAD, url, {}, options);
    }

    std::shared_ptr<const Response> options(const std::string& url,
                                            const RequestOptions& options = {}) const {
        return execute(Method::OPTIONS, url, {}, options);
    }

    //=========================================================================
    // Effective settings
    //=========================================================================

    const RequestBuilderConfig& config() const noexcept;
    const ClientResources& resources() const noexcept;

    /**
     * @brief Per-attempt response timeout, zero when timeouts are disabled
     */
    std::chrono::milliseconds request_timeout() const noexcept;
    std::chrono::milliseconds connect_timeout() const noexcept;

    std::string pool_name() const;
    RetryMode retry_mode() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace restful::client
