/**
 * @file test_circuit_breaker.cpp
 * @brief Unit tests for the circuit breaker state machine
 */

#include <restful/common/circuit_breaker.hpp>

#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace restful::common;
using namespace std::chrono_literals;

// ============================================================================
// Fixture with a manual clock
// ============================================================================

class CircuitBreakerTest : public ::testing::Test {
protected:
    CircuitBreaker::Clock::time_point now_ = CircuitBreaker::Clock::time_point{} + 1h;

    CircuitBreaker make(CircuitBreakerConfig config) {
        return CircuitBreaker("items", config, [this] { return now_; });
    }

    static void call(CircuitBreaker& breaker, bool success) {
        auto admission = breaker.allow();
        ASSERT_TRUE(admission.is_success());
        admission.value()(success);
    }
};

// ============================================================================
// Closed state
// ============================================================================

TEST_F(CircuitBreakerTest, StartsClosedAndAdmits) {
    CircuitBreakerConfig config;
    auto breaker = make(config);

    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    EXPECT_TRUE(breaker.allow().is_success());
    EXPECT_EQ(breaker.name(), "items");
}

TEST_F(CircuitBreakerTest, OpensAfterConsecutiveFailures) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 3;
    config.failure_ratio        = 0.0;
    auto breaker                = make(config);

    call(breaker, false);
    call(breaker, false);
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    call(breaker, false);
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveCount) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 2;
    config.failure_ratio        = 0.0;
    auto breaker                = make(config);

    call(breaker, false);
    call(breaker, true);
    call(breaker, false);
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, OpensOnFailureRatioOnceMinRequestsSeen) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 0;
    config.failure_ratio        = 0.5;
    config.window_size          = 10;
    config.min_requests         = 4;
    auto breaker                = make(config);

    call(breaker, false);
    call(breaker, true);
    call(breaker, false);
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);  // only 3 outcomes
    call(breaker, true);
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);  // 2 of 4
}

// ============================================================================
// Open and half-open states
// ============================================================================

TEST_F(CircuitBreakerTest, OpenDeniesWithCircuitOpen) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 1;
    auto breaker                = make(config);
    call(breaker, false);

    auto denied = breaker.allow();
    ASSERT_TRUE(denied.is_error());
    EXPECT_EQ(denied.code(), ErrorCode::CIRCUIT_OPEN);
    EXPECT_EQ(breaker.stats().rejected, 1u);
}

TEST_F(CircuitBreakerTest, HalfOpenTrialSuccessCloses) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 1;
    config.cooldown             = 5s;
    auto breaker                = make(config);
    call(breaker, false);

    now_ += 5s;
    auto trial = breaker.allow();
    ASSERT_TRUE(trial.is_success());
    EXPECT_EQ(breaker.state(), CircuitState::HALF_OPEN);

    // Only one trial call at a time
    EXPECT_TRUE(breaker.allow().is_error());

    trial.value()(true);
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, HalfOpenTrialFailureReopens) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 1;
    config.cooldown             = 5s;
    auto breaker                = make(config);
    call(breaker, false);

    now_ += 6s;
    call(breaker, false);
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
    EXPECT_EQ(breaker.stats().times_opened, 2u);

    now_ += 1s;
    EXPECT_TRUE(breaker.allow().is_error());
}

TEST_F(CircuitBreakerTest, StaleOutcomeIsIgnored) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 1;
    config.cooldown             = 5s;
    auto breaker                = make(config);

    auto slow = breaker.allow();  // admitted while closed
    ASSERT_TRUE(slow.is_success());
    call(breaker, false);
    ASSERT_EQ(breaker.state(), CircuitState::OPEN);

    slow.value()(true);
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
}

TEST_F(CircuitBreakerTest, CallbackReportsOnlyOnce) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 2;
    config.failure_ratio        = 0.0;
    auto breaker                = make(config);

    auto admission = breaker.allow();
    ASSERT_TRUE(admission.is_success());
    auto report = admission.value();
    report(false);
    report(false);

    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker.stats().failures, 1u);
}

TEST_F(CircuitBreakerTest, ResetCloses) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 1;
    auto breaker                = make(config);
    call(breaker, false);

    breaker.reset();
    EXPECT_EQ(breaker.state(), CircuitState::CLOSED);
    EXPECT_TRUE(breaker.allow().is_success());
}

TEST_F(CircuitBreakerTest, ConcurrentOutcomes) {
    CircuitBreakerConfig config;
    config.consecutive_failures = 0;
    config.failure_ratio        = 0.0;
    auto breaker                = make(config);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&breaker] {
            for (int i = 0; i < 500; ++i) {
                auto admission = breaker.allow();
                if (admission) {
                    admission.value()(i % 2 == 0);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto stats = breaker.stats();
    EXPECT_EQ(stats.allowed, 4000u);
    EXPECT_EQ(stats.successes + stats.failures, 4000u);
}
