#pragma once

/**
 * @file connection_pool.hpp
 * @brief Named transports shared by every builder that uses the same pool
 *
 * A pool name maps to exactly one transport for the registry's lifetime.
 * The first caller for a name creates it with its configuration; later
 * callers get the same transport whatever configuration they pass.
 * Concurrent first calls for one name build the transport once.
 */

#include "http_backend.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace restful::transport::http {

using PoolConfig = TransportConfig;

/**
 * @brief Builds the transport for a new pool
 */
using BackendFactory = std::function<std::shared_ptr<IHTTPBackend>(const TransportConfig&)>;

/**
 * @brief Default factory producing libcurl transports
 */
std::shared_ptr<IHTTPBackend> create_curl_backend(const TransportConfig& config);

struct PoolHandle {
    std::shared_ptr<IHTTPBackend> transport;

    // True for exactly one caller per pool name: the one that created it
    bool created = false;
};

class PoolRegistry {
public:
    static constexpr std::string_view DEFAULT_POOL_NAME = "pool_default";

    PoolRegistry();
    explicit PoolRegistry(BackendFactory factory);

    PoolRegistry(const PoolRegistry&)            = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    /**
     * @brief Get or lazily create the transport for `config.name`
     *
     * An empty name selects DEFAULT_POOL_NAME. A proxy URL that does not
     * parse is ignored in favor of the environment proxy.
     */
    PoolHandle acquire(const PoolConfig& config);

    std::shared_ptr<IHTTPBackend> get_transport(const PoolConfig& config) {
        return acquire(config).transport;
    }

    /**
     * @brief Existing transport for a name, nullptr when never created
     */
    std::shared_ptr<IHTTPBackend> find(std::string_view name) const;

    std::vector<std::string> pool_names() const;
    size_t size() const;

    void close_idle_all();

private:
    struct Entry {
        std::once_flag once;
        PoolConfig config;
        std::shared_ptr<IHTTPBackend> transport;
        std::atomic<bool> ready{false};
    };

    BackendFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>, std::less<>> entries_;
};

}  // namespace restful::transport::http
