/**
 * @file circuit_breaker.cpp
 * @brief Rolling-window circuit breaker
 */

#include <restful/common/circuit_breaker.hpp>
#include <restful/common/debug.hpp>

#include <atomic>
#include <memory>

namespace restful::common {

using namespace debug;

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config, NowFunc now)
    : name_(std::move(name)), config_(config), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
    if (config_.window_size == 0) {
        config_.window_size = 1;
    }
    if (config_.half_open_max_calls == 0) {
        config_.half_open_max_calls = 1;
    }
}

Result<CompletionCallback> CircuitBreaker::allow() {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == CircuitState::OPEN && now_() - opened_at_ >= config_.cooldown) {
            transition(CircuitState::HALF_OPEN);
        }

        bool admit = false;
        switch (state_) {
            case CircuitState::CLOSED:
                admit = true;
                break;
            case CircuitState::HALF_OPEN:
                if (half_open_in_flight_ < config_.half_open_max_calls) {
                    ++half_open_in_flight_;
                    admit = true;
                }
                break;
            case CircuitState::OPEN:
                break;
        }

        if (!admit) {
            ++stats_.rejected;
            return err<CompletionCallback>(ErrorCode::CIRCUIT_OPEN,
                                           "circuit breaker '" + name_ + "' is " +
                                               std::string(circuit_state_name(state_)));
        }
        ++stats_.allowed;
        generation = generation_;
    }

    auto reported = std::make_shared<std::atomic<bool>>(false);
    return CompletionCallback([this, generation, reported](bool success) {
        if (!reported->exchange(true)) {
            on_complete(success, generation);
        }
    });
}

void CircuitBreaker::on_complete(bool success, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (success) {
        ++stats_.successes;
    } else {
        ++stats_.failures;
    }

    if (generation != generation_) {
        return;
    }

    switch (state_) {
        case CircuitState::HALF_OPEN:
            if (half_open_in_flight_ > 0) {
                --half_open_in_flight_;
            }
            transition(success ? CircuitState::CLOSED : CircuitState::OPEN);
            return;

        case CircuitState::CLOSED:
            window_.push_back(!success);
            if (!success) {
                ++window_failures_;
                ++consecutive_failures_;
            } else {
                consecutive_failures_ = 0;
            }
            while (window_.size() > config_.window_size) {
                if (window_.front()) {
                    --window_failures_;
                }
                window_.pop_front();
            }
            if (should_trip()) {
                transition(CircuitState::OPEN);
            }
            return;

        case CircuitState::OPEN:
            return;
    }
}

bool CircuitBreaker::should_trip() const {
    if (config_.consecutive_failures > 0 && consecutive_failures_ >= config_.consecutive_failures) {
        return true;
    }
    if (config_.failure_ratio > 0.0 && window_.size() >= config_.min_requests &&
        !window_.empty()) {
        double ratio = static_cast<double>(window_failures_) / static_cast<double>(window_.size());
        return ratio >= config_.failure_ratio;
    }
    return false;
}

void CircuitBreaker::transition(CircuitState next) {
    CircuitState previous = state_;
    state_                = next;
    ++generation_;

    switch (next) {
        case CircuitState::OPEN:
            opened_at_ = now_();
            ++stats_.times_opened;
            half_open_in_flight_ = 0;
            RESTFUL_LOG_WARN(category::CIRCUIT,
                             "breaker '" << name_ << "' opened (was "
                                         << circuit_state_name(previous) << ")");
            break;
        case CircuitState::HALF_OPEN:
            half_open_in_flight_ = 0;
            RESTFUL_LOG_INFO(category::CIRCUIT, "breaker '" << name_ << "' half-open");
            break;
        case CircuitState::CLOSED:
            window_.clear();
            window_failures_      = 0;
            consecutive_failures_ = 0;
            half_open_in_flight_  = 0;
            RESTFUL_LOG_INFO(category::CIRCUIT, "breaker '" << name_ << "' closed");
            break;
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    transition(CircuitState::CLOSED);
}

}  // namespace restful::common
