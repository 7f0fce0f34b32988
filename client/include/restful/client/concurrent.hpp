#pragma once

/**
 * @file concurrent.hpp
 * @brief Fork-join execution of independent requests
 *
 * Verb methods on Concurrent only queue work and hand back a
 * FutureResponse. join() starts one thread per queued request and returns
 * once every future is set.
 *
 * Usage:
 * @code
 * std::shared_ptr<FutureResponse> user, orders;
 * fork_join(builder, [&](Concurrent& c) {
 *     user   = c.get("/users/7");
 *     orders = c.get("/users/7/orders");
 * });
 * auto body = user->peek()->body_string();
 * @endcode
 */

#include "restful/client/request_builder.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace restful::client {

/**
 * @brief Write-once slot for the result of a queued request
 */
class FutureResponse {
public:
    FutureResponse() = default;

    FutureResponse(const FutureResponse&)            = delete;
    FutureResponse& operator=(const FutureResponse&) = delete;

    /**
     * @brief Result, or nullptr while the request has not completed
     */
    std::shared_ptr<const Response> peek() const noexcept {
        return ready_.load(std::memory_order_acquire) ? response_ : nullptr;
    }

    bool ready() const noexcept { return ready_.load(std::memory_order_acquire); }

    /**
     * @brief Store the result; only the first call has an effect
     * @return true if this call stored it
     */
    bool set(std::shared_ptr<const Response> response) {
        if (claimed_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
        response_ = std::move(response);
        ready_.store(true, std::memory_order_release);
        return true;
    }

private:
    std::shared_ptr<const Response> response_;
    std::atomic<bool> claimed_{false};
    std::atomic<bool> ready_{false};
};

class Concurrent {
public:
    explicit Concurrent(const RequestBuilder& builder) : builder_(builder) {}

    Concurrent(const Concurrent&)            = delete;
    Concurrent& operator=(const Concurrent&) = delete;

    std::shared_ptr<FutureResponse> execute(Method method, std::string url, RequestBody body = {},
                                            RequestOptions options = {});

    std::shared_ptr<FutureResponse> get(std::string url, RequestOptions options = {}) {
        return execute(Method::GET, std::move(url), {}, std::move(options));
    }

    std::shared_ptr<FutureResponse> post(std::string url, RequestBody body,
                                         RequestOptions options = {}) {
        return execute(Method::POST, std::move(url), std::move(body), std::move(options));
    }

    std::shared_ptr<FutureResponse> put(std::string url, RequestBody body,
                                        RequestOptions options = {}) {
        return execute(Method::PUT, std::move(url), std::move(body), std::move(options));
    }

    std::shared_ptr<FutureResponse> patch(std::string url, RequestBody body,
                                          RequestOptions options = {}) {
        return execute(Method::PATCH, std::move(url), std::move(body), std::move(options));
    }

    std::shared_ptr<FutureResponse> del(std::string url, RequestOptions options = {}) {
        return execute(Method::DELETE_, std::move(url), {}, std::move(options));
    }

    std::shared_ptr<FutureResponse> head(std::string url, RequestOptions options = {}) {
        return execute(Method::HEAD, std::move(url), {}, std::move(options));
    }

    std::shared_ptr<FutureResponse> options(std::string url, RequestOptions options = {}) {
        return execute(Method::OPTIONS, std::move(url), {}, std::move(options));
    }

    /**
     * @brief Run every queued request concurrently and wait for all of them
     *
     * The queue is empty afterwards; requests queued later need another
     * join().
     */
    void join();

    size_t pending() const;

private:
    const RequestBuilder& builder_;

    mutable std::mutex mutex_;
    std::vector<std::function<void()>> tasks_;
};

/**
 * @brief Queue requests with `fn`, then join them
 */
void fork_join(const RequestBuilder& builder, const std::function<void(Concurrent&)>& fn);

}  // namespace restful::client
