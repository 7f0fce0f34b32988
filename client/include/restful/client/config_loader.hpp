#pragma once

/**
 * @file config_loader.hpp
 * @brief YAML client configuration
 *
 * Example:
 * @code{.yaml}
 * base_url: https://api.example.com
 * content_type: json            # json | xml | bytes
 * timeout_ms: 500
 * connect_timeout_ms: 1500
 * disable_timeout: false
 * enable_cache: true
 * uncompress_response: true
 * follow_redirect: false
 * user_agent: items-service/2.1
 * headers:
 *   X-Caller: items-service
 * basic_auth:
 *   username: svc
 *   password: secret
 * pool:
 *   name: items
 *   max_idle_per_host: 10
 *   proxy: http://proxy.internal:3128
 *   verify_ssl: true
 * metrics:
 *   target_id: items-api
 *   disable_api_call_metrics: false
 *   disable_connection_metrics: false
 * retry:
 *   type: backoff               # none | simple | backoff
 *   max_retries: 3
 *   delay_ms: 100               # simple
 *   min_wait_ms: 100            # backoff
 *   max_wait_ms: 2000
 *   growth: 2.0
 *   retry_on_server_error: true
 *   limiter_capacity: 100
 * circuit_breaker:
 *   name: items
 *   consecutive_failures: 5
 *   failure_ratio: 0.5
 *   window_size: 20
 *   min_requests: 10
 *   cooldown_ms: 30000
 *   half_open_max_calls: 1
 * logging:
 *   level: info
 * @endcode
 *
 * Every key is optional. Unknown keys are ignored.
 */

#include "restful/client/request_builder.hpp"

#include <restful/common/circuit_breaker.hpp>
#include <restful/common/debug.hpp>
#include <restful/common/error.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace restful::client {

enum class RetryKind : uint8_t { NONE, SIMPLE, BACKOFF };

struct RetrySettings {
    RetryKind kind       = RetryKind::NONE;
    uint32_t max_retries = 3;
    std::chrono::milliseconds delay{100};
    BackoffConfig backoff;
    bool retry_on_server_error = true;

    // Capacity of the retry limiter used when no circuit breaker is set
    size_t limiter_capacity = common::ConcurrencyLimiter::DEFAULT_CAPACITY;
};

struct ClientConfig {
    // Plain settings; retry_strategy and circuit_breaker stay unset here
    RequestBuilderConfig builder;

    RetrySettings retry;

    std::optional<common::CircuitBreakerConfig> circuit_breaker;
    std::string circuit_breaker_name;

    std::optional<common::debug::LogLevel> log_level;

    /**
     * @brief Strategy described by `retry`, nullptr for RetryKind::NONE
     */
    std::shared_ptr<const IRetryStrategy> make_retry_strategy() const;

    /**
     * @brief Builder configuration with strategy and breaker instantiated
     */
    RequestBuilderConfig make_builder_config() const;
};

class ClientConfigLoader {
public:
    static common::Result<ClientConfig> load_file(const std::filesystem::path& path);

    static common::Result<ClientConfig> load_string(std::string_view yaml);
};

}  // namespace restful::client
