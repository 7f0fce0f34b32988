#pragma once

/**
 * @file circuit_breaker.hpp
 * @brief Per-target circuit breaker
 *
 * Closed admits every call and tracks outcomes in a rolling window.
 * The breaker opens when either rule trips:
 * - `consecutive_failures` failures in a row, or
 * - at least `min_requests` outcomes in the window with a failure ratio
 *   of `failure_ratio` or more.
 * Open denies calls with CIRCUIT_OPEN until `cooldown` elapses. The next
 * allow() moves to half-open and admits up to `half_open_max_calls` trial
 * calls; a trial success closes the breaker, a trial failure reopens it.
 *
 * Outcomes reported by calls admitted in an earlier phase are ignored, so
 * a slow call started while closed cannot close a breaker that has since
 * opened.
 */

#include <restful/common/error.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace restful::common {

enum class CircuitState : uint8_t { CLOSED = 0, OPEN = 1, HALF_OPEN = 2 };

constexpr std::string_view circuit_state_name(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::CLOSED:
            return "closed";
        case CircuitState::OPEN:
            return "open";
        case CircuitState::HALF_OPEN:
            return "half-open";
    }
    return "unknown";
}

struct CircuitBreakerConfig {
    uint32_t consecutive_failures = 5;    // 0 disables the rule
    double failure_ratio          = 0.5;  // 0 disables the rule
    uint32_t window_size          = 20;
    uint32_t min_requests         = 10;
    std::chrono::milliseconds cooldown{30000};
    uint32_t half_open_max_calls = 1;
};

/**
 * @brief Invoked exactly once per admitted call with its outcome
 */
using CompletionCallback = std::function<void(bool success)>;

/**
 * @brief Gate consulted once per logical request
 */
class ICircuitBreaker {
public:
    virtual ~ICircuitBreaker() = default;

    /**
     * @brief Admit or deny a call
     * @return completion callback on admission, CIRCUIT_OPEN error on denial
     */
    virtual Result<CompletionCallback> allow() = 0;

    virtual CircuitState state() const = 0;
    virtual const std::string& name() const noexcept = 0;
};

struct CircuitBreakerStats {
    uint64_t allowed     = 0;
    uint64_t rejected    = 0;
    uint64_t successes   = 0;
    uint64_t failures    = 0;
    uint64_t times_opened = 0;
};

class CircuitBreaker : public ICircuitBreaker {
public:
    using Clock   = std::chrono::steady_clock;
    using NowFunc = std::function<Clock::time_point()>;

    explicit CircuitBreaker(std::string name, CircuitBreakerConfig config = {},
                            NowFunc now = {});

    Result<CompletionCallback> allow() override;

    CircuitState state() const override;
    const std::string& name() const noexcept override { return name_; }
    const CircuitBreakerConfig& config() const noexcept { return config_; }

    CircuitBreakerStats stats() const;

    /**
     * @brief Force the breaker back to closed with an empty window
     */
    void reset();

private:
    void on_complete(bool success, uint64_t generation);

    // Callers hold mutex_
    void transition(CircuitState next);
    bool should_trip() const;

    std::string name_;
    CircuitBreakerConfig config_;
    NowFunc now_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint64_t generation_ = 0;
    Clock::time_point opened_at_{};
    uint32_t half_open_in_flight_ = 0;
    uint32_t consecutive_failures_ = 0;
    std::deque<bool> window_;
    uint32_t window_failures_ = 0;
    CircuitBreakerStats stats_;
};

}  // namespace restful::common
