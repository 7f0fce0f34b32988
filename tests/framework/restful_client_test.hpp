/**
 * @file restful_client_test.hpp
 * @brief Test harness for the request engine
 *
 * Provides:
 * - MockBackend: scripted IHTTPBackend recording every request
 * - LeaseTracker: counts connection leases handed out and how they ended
 * - RecordingMetricsPort: keeps every metric call for assertions
 * - ClientTestBase: fixture wiring those into ClientResources with a
 *   recorded sleeper and a controllable cache clock
 *
 * Usage:
 *   class MyTest : public restful::test::ClientTestBase {};
 *
 *   TEST_F(MyTest, Retries) {
 *       backend->push_response(make_response(503));
 *       auto builder = make_builder(config);
 *       auto response = builder.get("/items");
 *   }
 */

#pragma once

#include <restful/client/metrics_port.hpp>
#include <restful/client/request_builder.hpp>
#include <restful/common/error.hpp>
#include <restful/transport/http/connection_pool.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace restful::test {

namespace http = restful::transport::http;

// ============================================================================
// Response helpers
// ============================================================================

inline http::Response make_response(int status, std::string body = {},
                                    http::Headers headers = {}) {
    http::Response response;
    response.status_code = status;
    response.headers     = std::move(headers);
    response.body.assign(body.begin(), body.end());
    return response;
}

inline http::Response make_failure(common::ErrorCode code, std::string message = {}) {
    http::Response response;
    response.error = common::Error(code, message);
    return response;
}

// ============================================================================
// Connection leases
// ============================================================================

struct LeaseTracker {
    std::atomic<int> acquired{0};
    std::atomic<int> reused{0};
    std::atomic<int> closed{0};

    // Destroyed without an explicit release
    std::atomic<int> dropped{0};

    int outstanding() const { return acquired.load() - reused.load() - closed.load(); }
};

class MockLease : public http::ConnectionLease {
public:
    explicit MockLease(std::shared_ptr<LeaseTracker> tracker) : tracker_(std::move(tracker)) {
        tracker_->acquired++;
    }

    ~MockLease() override {
        if (!released_.load()) {
            tracker_->dropped++;
        }
    }

    void release(bool reusable) override {
        if (released_.exchange(true)) {
            return;
        }
        if (reusable) {
            tracker_->reused++;
        } else {
            tracker_->closed++;
        }
    }

    bool released() const noexcept override { return released_.load(); }

private:
    std::shared_ptr<LeaseTracker> tracker_;
    std::atomic<bool> released_{false};
};

// ============================================================================
// Mock backend
// ============================================================================

/**
 * Responses are served from the scripted queue first, then from the
 * handler, then as an empty 200. Successful responses carry a lease.
 */
class MockBackend : public http::IHTTPBackend {
public:
    using Handler = std::function<http::Response(const http::Request&)>;

    std::string_view name() const noexcept override { return "mock"; }

    void push_response(http::Response response) {
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(response));
    }

    void set_handler(Handler handler) {
        std::lock_guard lock(mutex_);
        handler_ = std::move(handler);
    }

    void set_latency(std::chrono::milliseconds latency) {
        std::lock_guard lock(mutex_);
        latency_ = latency;
    }

    http::Response execute(const http::Request& request) override {
        std::optional<http::Response> scripted;
        Handler handler;
        std::chrono::milliseconds latency{0};
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
            if (!script_.empty()) {
                scripted = std::move(script_.front());
                script_.pop_front();
            }
            handler = handler_;
            latency = latency_;
        }

        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }

        http::Response response = scripted ? std::move(*scripted)
                                  : handler ? handler(request)
                                            : make_response(200);
        if (!response.error) {
            response.lease = std::make_shared<MockLease>(tracker_);
        }
        return response;
    }

    void close_idle() override {}

    http::BackendStats stats() const override {
        http::BackendStats stats;
        stats.requests_sent = call_count();
        return stats;
    }

    void reset_stats() override {}

    size_t call_count() const {
        std::lock_guard lock(mutex_);
        return requests_.size();
    }

    std::vector<http::Request> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    http::Request request(size_t index) const {
        std::lock_guard lock(mutex_);
        return requests_.at(index);
    }

    const LeaseTracker& leases() const { return *tracker_; }

private:
    mutable std::mutex mutex_;
    std::deque<http::Response> script_;
    Handler handler_;
    std::chrono::milliseconds latency_{0};
    std::vector<http::Request> requests_;
    std::shared_ptr<LeaseTracker> tracker_ = std::make_shared<LeaseTracker>();
};

// ============================================================================
// Recording metrics port
// ============================================================================

class RecordingMetricsPort : public client::IMetricsPort {
public:
    struct Outcome {
        std::string target_id;
        std::string outcome;
        bool was_retry = false;
    };

    struct Sample {
        std::string name;
        double value = 0;
        client::Tags tags;
    };

    struct RecordedEvent {
        std::string name;
        std::map<std::string, std::string> attributes;
    };

    void record_call_outcome(std::string_view target_id, std::chrono::steady_clock::duration,
                             std::string_view outcome, bool was_retry) override {
        std::lock_guard lock(mutex_);
        outcomes_.push_back({std::string(target_id), std::string(outcome), was_retry});
    }

    void record_count(std::string_view name, double value, const client::Tags& tags) override {
        std::lock_guard lock(mutex_);
        counts_.push_back({std::string(name), value, tags});
    }

    void record_gauge(std::string_view name, double value, const client::Tags& tags) override {
        std::lock_guard lock(mutex_);
        gauges_.push_back({std::string(name), value, tags});
    }

    void record_timing(std::string_view name, double millis, const client::Tags& tags) override {
        std::lock_guard lock(mutex_);
        timings_.push_back({std::string(name), millis, tags});
    }

    void record_event(std::string_view name,
                      const std::map<std::string, std::string>& attributes) override {
        std::lock_guard lock(mutex_);
        events_.push_back({std::string(name), attributes});
    }

    std::vector<Outcome> outcomes() const {
        std::lock_guard lock(mutex_);
        return outcomes_;
    }

    std::vector<Sample> counts(std::string_view name) const {
        std::lock_guard lock(mutex_);
        return filter(counts_, name);
    }

    std::vector<Sample> timings(std::string_view name) const {
        std::lock_guard lock(mutex_);
        return filter(timings_, name);
    }

    std::vector<RecordedEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

private:
    static std::vector<Sample> filter(const std::vector<Sample>& samples, std::string_view name) {
        std::vector<Sample> out;
        for (const auto& sample : samples) {
            if (sample.name == name) {
                out.push_back(sample);
            }
        }
        return out;
    }

    mutable std::mutex mutex_;
    std::vector<Outcome> outcomes_;
    std::vector<Sample> counts_;
    std::vector<Sample> gauges_;
    std::vector<Sample> timings_;
    std::vector<RecordedEvent> events_;
};

// ============================================================================
// Fixture
// ============================================================================

class ClientTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<MockBackend>();
        metrics = std::make_shared<RecordingMetricsPort>();
        now     = client::Response::Clock::now();

        resources.cache = std::make_shared<client::ResourceCache>([this] { return now; });
        resources.pools =
            std::make_shared<http::PoolRegistry>([this](const http::TransportConfig& config) {
                pool_configs.push_back(config);
                return std::static_pointer_cast<http::IHTTPBackend>(backend);
            });
        resources.metrics       = metrics;
        resources.tracing       = std::make_shared<client::ContextTracingPort>();
        resources.retry_limiter = std::make_shared<common::ConcurrencyLimiter>();
        resources.sleep         = [this](std::chrono::milliseconds delay) {
            std::lock_guard lock(sleep_mutex_);
            sleeps.push_back(delay);
        };
    }

    client::RequestBuilder make_builder(client::RequestBuilderConfig config) {
        return client::RequestBuilder(std::move(config), resources);
    }

    std::vector<std::chrono::milliseconds> recorded_sleeps() {
        std::lock_guard lock(sleep_mutex_);
        return sleeps;
    }

    std::shared_ptr<MockBackend> backend;
    std::shared_ptr<RecordingMetricsPort> metrics;
    client::ClientResources resources;
    client::Response::TimePoint now;
    std::vector<http::TransportConfig> pool_configs;

private:
    std::mutex sleep_mutex_;
    std::vector<std::chrono::milliseconds> sleeps;
};

}  // namespace restful::test
