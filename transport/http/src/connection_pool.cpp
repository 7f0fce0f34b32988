/**
 * @file connection_pool.cpp
 * @brief Pool registry implementation
 */

#include "restful/transport/http/connection_pool.hpp"

#include "restful/transport/http/backends/curl_backend.hpp"
#include "restful/transport/http/http_utils.hpp"

#include <restful/common/debug.hpp>

namespace restful::transport::http {

using namespace common::debug;

std::shared_ptr<IHTTPBackend> create_curl_backend(const TransportConfig& config) {
    return std::make_shared<CurlBackend>(config);
}

PoolRegistry::PoolRegistry() : PoolRegistry(create_curl_backend) {}

PoolRegistry::PoolRegistry(BackendFactory factory) : factory_(std::move(factory)) {}

PoolHandle PoolRegistry::acquire(const PoolConfig& config) {
    std::string name = config.name.empty() ? std::string(DEFAULT_POOL_NAME) : config.name;

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[name];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        entry = slot;
    }

    PoolHandle handle;
    std::call_once(entry->once, [&] {
        PoolConfig effective = config;
        effective.name       = name;

        if (!effective.proxy_url.empty() && !parse_url(effective.proxy_url)) {
            RESTFUL_LOG_WARN(category::POOL, "pool '" << name << "': invalid proxy url '"
                                                      << effective.proxy_url
                                                      << "', using environment proxy");
            effective.proxy_url.clear();
        }

        entry->transport = factory_(effective);
        entry->config    = std::move(effective);
        entry->ready.store(true, std::memory_order_release);
        handle.created   = true;

        RESTFUL_LOG_INFO(category::POOL,
                         "pool '" << name << "' created (connect_timeout="
                                  << entry->config.connect_timeout.count()
                                  << "ms, response_timeout="
                                  << entry->config.response_timeout.count()
                                  << "ms, max_idle_per_host=" << entry->config.max_idle_per_host
                                  << (entry->config.proxy_url.empty() ? "" : ", proxy") << ")");
    });

    handle.transport = entry->transport;
    return handle;
}

std::shared_ptr<IHTTPBackend> PoolRegistry::find(std::string_view name) const {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name.empty() ? DEFAULT_POOL_NAME : name);
        if (it == entries_.end()) {
            return nullptr;
        }
        entry = it->second;
    }
    // Entry may still be under construction by another thread
    return entry->ready.load(std::memory_order_acquire) ? entry->transport : nullptr;
}

std::vector<std::string> PoolRegistry::pool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, _] : entries_) {
        names.push_back(name);
    }
    return names;
}

size_t PoolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void PoolRegistry::close_idle_all() {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, entry] : entries_) {
            entries.push_back(entry);
        }
    }
    for (const auto& entry : entries) {
        if (entry->ready.load(std::memory_order_acquire) && entry->transport) {
            entry->transport->close_idle();
        }
    }
}

}  // namespace restful::transport::http
