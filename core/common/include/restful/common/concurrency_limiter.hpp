#pragma once

/**
 * @file concurrency_limiter.hpp
 * @brief Bounded in-flight limiter for retry traffic
 *
 * A counting limiter: at most `capacity` permits may be held at once.
 * Acquisition never blocks; a caller that cannot get a permit is expected
 * to give up (the request engine ends its retry loop and records a
 * retry-break metric). This keeps a flood of simultaneous retries against
 * an unhealthy target from being issued unbounded when no circuit breaker
 * guards it.
 *
 * - Lock-free CAS acquire/release
 * - Cache-line aligned statistics
 * - RAII permit guard
 */

#include <restful/common/platform.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace restful::common {

/**
 * @brief Concurrency limiter statistics
 */
struct ConcurrencyLimiterStats {
    alignas(RESTFUL_CACHE_LINE_SIZE) std::atomic<uint64_t> requests{0};
    alignas(RESTFUL_CACHE_LINE_SIZE) std::atomic<uint64_t> allowed{0};
    alignas(RESTFUL_CACHE_LINE_SIZE) std::atomic<uint64_t> rejected{0};

    double allow_rate() const noexcept {
        auto total = requests.load(std::memory_order_relaxed);
        auto ok    = allowed.load(std::memory_order_relaxed);
        return total > 0 ? static_cast<double>(ok) / total * 100.0 : 100.0;
    }

    void reset() noexcept {
        requests.store(0, std::memory_order_relaxed);
        allowed.store(0, std::memory_order_relaxed);
        rejected.store(0, std::memory_order_relaxed);
    }
};

class alignas(RESTFUL_CACHE_LINE_SIZE) ConcurrencyLimiter {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit ConcurrencyLimiter(size_t capacity = DEFAULT_CAPACITY) noexcept
        : capacity_(capacity) {}

    ConcurrencyLimiter(const ConcurrencyLimiter&)            = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * @brief Try to take `count` permits without blocking
     * @return true if the permits were taken
     */
    bool try_acquire(size_t count = 1) noexcept {
        stats_.requests.fetch_add(1, std::memory_order_relaxed);

        size_t current = in_flight_.load(std::memory_order_relaxed);
        while (current + count <= capacity_) {
            if (in_flight_.compare_exchange_weak(current, current + count,
                                                 std::memory_order_acquire,
                                                 std::memory_order_relaxed)) {
                stats_.allowed.fetch_add(1, std::memory_order_relaxed);
                return true;
            }
        }

        stats_.rejected.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    void release(size_t count = 1) noexcept {
        in_flight_.fetch_sub(count, std::memory_order_release);
    }

    size_t in_flight() const noexcept { return in_flight_.load(std::memory_order_relaxed); }
    size_t capacity() const noexcept { return capacity_; }

    const ConcurrencyLimiterStats& stats() const noexcept { return stats_; }
    void reset_stats() noexcept { stats_.reset(); }

private:
    const size_t capacity_;
    std::atomic<size_t> in_flight_{0};
    ConcurrencyLimiterStats stats_;
};

/**
 * @brief RAII permit; releases on destruction
 */
class ConcurrencyGuard {
public:
    ConcurrencyGuard(ConcurrencyGuard&& other) noexcept
        : limiter_(std::exchange(other.limiter_, nullptr)), count_(other.count_) {}

    ConcurrencyGuard& operator=(ConcurrencyGuard&& other) noexcept {
        if (this != &other) {
            reset();
            limiter_ = std::exchange(other.limiter_, nullptr);
            count_   = other.count_;
        }
        return *this;
    }

    ConcurrencyGuard(const ConcurrencyGuard&)            = delete;
    ConcurrencyGuard& operator=(const ConcurrencyGuard&) = delete;

    ~ConcurrencyGuard() { reset(); }

    static std::optional<ConcurrencyGuard> try_acquire(ConcurrencyLimiter& limiter,
                                                       size_t count = 1) {
        if (limiter.try_acquire(count)) {
            return ConcurrencyGuard(limiter, count);
        }
        return std::nullopt;
    }

    void reset() noexcept {
        if (limiter_) {
            limiter_->release(count_);
            limiter_ = nullptr;
        }
    }

private:
    ConcurrencyGuard(ConcurrencyLimiter& limiter, size_t count) noexcept
        : limiter_(&limiter), count_(count) {}

    ConcurrencyLimiter* limiter_;
    size_t count_;
};

}  // namespace restful::common
