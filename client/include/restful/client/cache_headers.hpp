#pragma once

/**
 * @file cache_headers.hpp
 * @brief Caching metadata derived from response headers
 *
 * TTL rules, in order:
 * 1. `Cache-Control` with `max-age=N` or `s-maxage=N`: a positive N sets
 *    the TTL to now + N seconds. When the directive is present `Expires`
 *    is never consulted, even if N is 0.
 * 2. Otherwise an `Expires` date in the future is the TTL.
 *
 * A response with validators (`ETag`, `Last-Modified`) but no TTL must be
 * revalidated before every reuse.
 */

#include "restful/client/response.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace restful::client {

struct CacheMetadata {
    std::optional<Response::TimePoint> ttl;
    std::optional<Response::TimePoint> last_modified;
    std::string etag;

    bool revalidate() const noexcept { return !ttl && (last_modified || !etag.empty()); }

    bool cacheable() const noexcept { return ttl || last_modified || !etag.empty(); }
};

CacheMetadata parse_cache_metadata(const Headers& headers,
                                   Response::TimePoint now = Response::Clock::now());

/**
 * @brief Copy metadata onto a response, including its revalidation flag
 */
void apply_cache_metadata(Response& response, const CacheMetadata& metadata);

}  // namespace restful::client
