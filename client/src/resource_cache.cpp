/**
 * @file resource_cache.cpp
 * @brief Resource cache implementation
 */

#include "restful/client/resource_cache.hpp"

#include <restful/common/debug.hpp>

#include <mutex>

namespace restful::client {

using namespace common::debug;

ResourceCache::ResourceCache(NowFunc now) : now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Response::Clock::now(); };
    }
}

std::shared_ptr<Response> ResourceCache::get(const std::string& url) {
    std::shared_ptr<Response> entry;
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(url);
        if (it == entries_.end()) {
            counters_.misses++;
            return nullptr;
        }
        entry = it->second;
    }

    if (entry->is_fresh(now_())) {
        counters_.hits++;
        return entry;
    }

    if (entry->has_validators()) {
        entry->set_needs_revalidation(true);
        counters_.stale_hits++;
        RESTFUL_LOG_TRACE(category::CACHE, "stale entry for " << url << ", revalidating");
        return entry;
    }

    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(url);
        // Another writer may have replaced it meanwhile
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
            counters_.evictions++;
        }
    }
    counters_.misses++;
    RESTFUL_LOG_TRACE(category::CACHE, "expired entry for " << url << " evicted");
    return nullptr;
}

bool ResourceCache::set_if_absent(const std::string& url, std::shared_ptr<Response> response) {
    if (!response) {
        return false;
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(url, response);
    if (inserted) {
        counters_.inserts++;
        return true;
    }

    if (it->second->is_fresh(now_())) {
        return false;
    }

    it->second = std::move(response);
    counters_.replacements++;
    return true;
}

bool ResourceCache::erase(const std::string& url) {
    std::unique_lock lock(mutex_);
    return entries_.erase(url) > 0;
}

void ResourceCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t ResourceCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

ResourceCacheStats ResourceCache::stats() const {
    ResourceCacheStats stats;
    stats.hits         = counters_.hits.load(std::memory_order_relaxed);
    stats.stale_hits   = counters_.stale_hits.load(std::memory_order_relaxed);
    stats.misses       = counters_.misses.load(std::memory_order_relaxed);
    stats.inserts      = counters_.inserts.load(std::memory_order_relaxed);
    stats.replacements = counters_.replacements.load(std::memory_order_relaxed);
    stats.evictions    = counters_.evictions.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace restful::client
