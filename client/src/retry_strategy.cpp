/**
 * @file retry_strategy.cpp
 * @brief Simple and exponential backoff retry strategies
 */

#include "restful/client/retry_strategy.hpp"

#include <algorithm>
#include <cmath>

namespace restful::client {

using common::ErrorCode;

bool is_retryable_outcome(const transport::http::Response& response, bool retry_on_server_error) {
    if (response.error) {
        return response.error->code() != ErrorCode::OPERATION_CANCELLED;
    }
    return retry_on_server_error && response.status_code >= 500;
}

//=============================================================================
// Simple
//=============================================================================

RetryDecision SimpleRetryStrategy::should_retry(const transport::http::Request& request,
                                                const transport::http::Response& response,
                                                uint32_t attempt) const {
    if (attempt >= max_retries_ || request.is_cancelled() ||
        !is_retryable_outcome(response, retry_on_server_error_)) {
        return RetryDecision::stop();
    }
    return RetryDecision::after(delay_);
}

std::map<std::string, std::string> SimpleRetryStrategy::parameters() const {
    return {{"max_retries", std::to_string(max_retries_)},
            {"delay", std::to_string(delay_.count())}};
}

//=============================================================================
// Backoff
//=============================================================================

BackoffRetryStrategy::BackoffRetryStrategy(BackoffConfig config) : config_(config) {
    if (config_.max_wait < config_.min_wait) {
        config_.max_wait = config_.min_wait;
    }
    if (config_.base.count() <= 0) {
        config_.base = config_.min_wait;
    }
    if (config_.growth < 1.0) {
        config_.growth = 1.0;
    }
}

std::chrono::milliseconds BackoffRetryStrategy::delay_for(uint32_t attempt) const noexcept {
    double raw = static_cast<double>(config_.base.count()) *
                 std::pow(config_.growth, static_cast<double>(attempt));
    double lo = static_cast<double>(config_.min_wait.count());
    double hi = static_cast<double>(config_.max_wait.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::clamp(raw, lo, hi)));
}

RetryDecision BackoffRetryStrategy::should_retry(const transport::http::Request& request,
                                                 const transport::http::Response& response,
                                                 uint32_t attempt) const {
    if (attempt >= config_.max_retries || request.is_cancelled() ||
        !is_retryable_outcome(response, config_.retry_on_server_error)) {
        return RetryDecision::stop();
    }
    return RetryDecision::after(delay_for(attempt));
}

std::map<std::string, std::string> BackoffRetryStrategy::parameters() const {
    return {{"min_wait", std::to_string(config_.min_wait.count())},
            {"max_wait", std::to_string(config_.max_wait.count())},
            {"max_retries", std::to_string(config_.max_retries)}};
}

}  // namespace restful::client
