#pragma once

/**
 * @file retry_strategy.hpp
 * @brief Retry policies consulted after every attempt
 *
 * Strategies are stateless across requests; the attempt counter is owned
 * by the request engine and starts at 0 for the first attempt. A strategy
 * with max_retries = N therefore allows N + 1 attempts in total.
 *
 * Cancelled requests are never retried, whatever the strategy.
 */

#include <restful/common/error.hpp>
#include <restful/transport/http/http_backend.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace restful::client {

struct RetryDecision {
    bool retry = false;
    std::chrono::milliseconds delay{0};

    static RetryDecision stop() noexcept { return {}; }
    static RetryDecision after(std::chrono::milliseconds delay) noexcept { return {true, delay}; }
};

/**
 * @brief Retry policy
 *
 * `response.error` carries the transport failure, if any; `status_code` is
 * only meaningful without one.
 */
class IRetryStrategy {
public:
    virtual ~IRetryStrategy() = default;

    virtual RetryDecision should_retry(const transport::http::Request& request,
                                       const transport::http::Response& response,
                                       uint32_t attempt) const = 0;
};

/**
 * @brief Optional capability: describe configuration for reporting
 *
 * Probed with dynamic_cast; strategies without it are reported as
 * "customRetryStrategy".
 */
class IExposesParameters {
public:
    virtual ~IExposesParameters() = default;

    virtual std::string_view strategy_name() const = 0;
    virtual std::map<std::string, std::string> parameters() const = 0;
};

/**
 * @brief Common retry condition: a transport failure other than
 *        cancellation, or a 5xx when enabled
 */
bool is_retryable_outcome(const transport::http::Response& response, bool retry_on_server_error);

//=============================================================================
// Simple
//=============================================================================

class SimpleRetryStrategy : public IRetryStrategy, public IExposesParameters {
public:
    static constexpr std::string_view NAME = "simpleRetryStrategy";

    SimpleRetryStrategy(uint32_t max_retries, std::chrono::milliseconds delay,
                        bool retry_on_server_error = true)
        : max_retries_(max_retries), delay_(delay), retry_on_server_error_(retry_on_server_error) {}

    RetryDecision should_retry(const transport::http::Request& request,
                               const transport::http::Response& response,
                               uint32_t attempt) const override;

    std::string_view strategy_name() const override { return NAME; }
    std::map<std::string, std::string> parameters() const override;

    uint32_t max_retries() const noexcept { return max_retries_; }
    std::chrono::milliseconds delay() const noexcept { return delay_; }

private:
    uint32_t max_retries_;
    std::chrono::milliseconds delay_;
    bool retry_on_server_error_;
};

//=============================================================================
// Backoff
//=============================================================================

struct BackoffConfig {
    std::chrono::milliseconds min_wait{100};
    std::chrono::milliseconds max_wait{2000};
    uint32_t max_retries = 3;

    // delay = clamp(base * growth^attempt, min_wait, max_wait); zero base means min_wait
    std::chrono::milliseconds base{0};
    double growth = 2.0;

    bool retry_on_server_error = true;
};

class BackoffRetryStrategy : public IRetryStrategy, public IExposesParameters {
public:
    static constexpr std::string_view NAME = "backoffRetryStrategy";

    explicit BackoffRetryStrategy(BackoffConfig config = {});

    RetryDecision should_retry(const transport::http::Request& request,
                               const transport::http::Response& response,
                               uint32_t attempt) const override;

    /**
     * @brief Delay before the retry that follows `attempt`
     */
    std::chrono::milliseconds delay_for(uint32_t attempt) const noexcept;

    std::string_view strategy_name() const override { return NAME; }
    std::map<std::string, std::string> parameters() const override;

    const BackoffConfig& config() const noexcept { return config_; }

private:
    BackoffConfig config_;
};

}  // namespace restful::client
