#pragma once

/**
 * @file resource_cache.hpp
 * @brief Response cache keyed by request URL
 *
 * Keys are full request URLs (base URL + path); the verb is not part of
 * the key. Only read verbs are ever stored, by the request engine.
 *
 * Lookup outcomes:
 * - fresh entry: returned as is
 * - stale entry with an ETag or Last-Modified: flagged for revalidation
 *   and returned, so the caller can send a conditional request
 * - stale entry without validators: evicted, reported as a miss
 */

#include "restful/client/response.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace restful::client {

struct ResourceCacheStats {
    uint64_t hits          = 0;
    uint64_t stale_hits    = 0;
    uint64_t misses        = 0;
    uint64_t inserts       = 0;
    uint64_t replacements  = 0;
    uint64_t evictions     = 0;
};

class ResourceCache {
public:
    using NowFunc = std::function<Response::TimePoint()>;

    explicit ResourceCache(NowFunc now = {});

    ResourceCache(const ResourceCache&)            = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    std::shared_ptr<Response> get(const std::string& url);

    /**
     * @brief Store unless a fresh entry already exists for the URL
     *
     * A missing entry, or one that is expired or awaiting revalidation, is
     * replaced.
     * @return true if the response was stored
     */
    bool set_if_absent(const std::string& url, std::shared_ptr<Response> response);

    bool erase(const std::string& url);
    void clear();
    size_t size() const;

    ResourceCacheStats stats() const;

private:
    NowFunc now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Response>> entries_;

    struct Counters {
        std::atomic<uint64_t> hits{0};
        std::atomic<uint64_t> stale_hits{0};
        std::atomic<uint64_t> misses{0};
        std::atomic<uint64_t> inserts{0};
        std::atomic<uint64_t> replacements{0};
        std::atomic<uint64_t> evictions{0};
    } counters_;
};

}  // namespace restful::client
