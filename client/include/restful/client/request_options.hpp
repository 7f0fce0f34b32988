#pragma once

/**
 * @file request_options.hpp
 * @brief Per-call additions to a request builder's defaults
 */

#include <restful/common/headers.hpp>
#include <restful/common/tracing.hpp>
#include <restful/transport/http/http_backend.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace restful::client {

/**
 * @brief Shared cancellation flag
 *
 * Copies share the flag; cancel() on any copy is seen by every request
 * carrying it, including one blocked in the transport.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

    transport::http::CancellationFlag flag() const noexcept { return flag_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct RequestOptions {
    using Clock = std::chrono::steady_clock;

    // Applied after the builder defaults; a name set here overrides them
    common::HeaderMap headers;

    std::optional<CancellationToken> cancellation;

    // Absolute deadline for the whole call, retries and their delays included
    std::optional<Clock::time_point> deadline;

    // Headers to forward on behalf of the inbound request being served
    std::optional<common::tracing::TraceContext> trace;

    RequestOptions& with_header(std::string name, std::string value) {
        headers[std::move(name)] = std::move(value);
        return *this;
    }

    RequestOptions& with_cancellation(CancellationToken token) {
        cancellation = std::move(token);
        return *this;
    }

    RequestOptions& with_deadline(Clock::time_point when) {
        deadline = when;
        return *this;
    }

    RequestOptions& with_timeout(std::chrono::milliseconds budget) {
        deadline = Clock::now() + budget;
        return *this;
    }

    RequestOptions& with_trace(common::tracing::TraceContext context) {
        trace = std::move(context);
        return *this;
    }

    bool is_cancelled() const noexcept { return cancellation && cancellation->is_cancelled(); }

    bool deadline_expired() const noexcept { return deadline && Clock::now() >= *deadline; }
};

}  // namespace restful::client
