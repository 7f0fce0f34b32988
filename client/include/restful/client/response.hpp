#pragma once

/**
 * @file response.hpp
 * @brief Result of a logical request
 *
 * A Response is immutable once handed to the caller, except for two flags
 * on copies held by the resource cache: needs_revalidation() flips when
 * the entry goes stale and from_cache() is set when the copy is served.
 * Both are atomics so concurrent readers of a shared cached copy are safe.
 */

#include <restful/common/error.hpp>
#include <restful/transport/http/http_backend.hpp>

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restful::client {

using Headers = transport::http::Headers;

class Response {
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    Response() = default;

    Response(const Response& other);
    Response& operator=(const Response& other);

    /**
     * @brief Response carrying only an error (no network exchange happened
     *        or the exchange failed)
     */
    static Response failure(common::Error error, int status_code = 0);

    //=========================================================================
    // HTTP
    //=========================================================================

    int status_code = 0;
    std::string status_message;
    Headers headers;
    std::vector<uint8_t> body;

    // Set when the request failed before a usable HTTP response existed,
    // or when the body could not be decoded
    std::optional<common::Error> error;

    //=========================================================================
    // Cache metadata
    //=========================================================================

    // Absolute expiry from Cache-Control max-age / s-maxage or Expires
    std::optional<TimePoint> ttl;
    std::optional<TimePoint> last_modified;
    std::string etag;

    //=========================================================================
    // Accessors
    //=========================================================================

    bool has_error() const noexcept { return error.has_value(); }

    bool is_success() const noexcept { return !error && status_code >= 200 && status_code < 300; }

    std::string_view header(std::string_view name) const {
        return common::header_value(headers, name);
    }

    std::string_view body_string() const noexcept {
        return std::string_view(reinterpret_cast<const char*>(body.data()), body.size());
    }

    /**
     * @brief Parse the body as JSON
     */
    common::Result<Json::Value> json() const;

    bool needs_revalidation() const noexcept {
        return revalidate_.load(std::memory_order_acquire);
    }

    void set_needs_revalidation(bool value) const noexcept {
        revalidate_.store(value, std::memory_order_release);
    }

    bool from_cache() const noexcept { return cache_hit_.load(std::memory_order_acquire); }

    void mark_from_cache() const noexcept { cache_hit_.store(true, std::memory_order_release); }

    /**
     * @brief True while the TTL has not elapsed and no revalidation is pending
     */
    bool is_fresh(TimePoint now = Clock::now()) const noexcept {
        return ttl && now < *ttl && !needs_revalidation();
    }

    bool has_validators() const noexcept { return last_modified.has_value() || !etag.empty(); }

private:
    mutable std::atomic<bool> revalidate_{false};
    mutable std::atomic<bool> cache_hit_{false};
};

}  // namespace restful::client
