#pragma once

/**
 * @file curl_backend.hpp
 * @brief Production transport on top of libcurl easy handles
 *
 * Each backend keeps a bounded stack of idle easy handles; a handle holds
 * its connection open between transfers. Every response carries a lease on
 * the handle it used. Cancellation and deadlines are checked from the
 * transfer progress callback, and per-phase timings come from
 * curl_easy_getinfo.
 */

#include "../http_backend.hpp"

#include <memory>

namespace restful::transport::http {

class CurlBackend : public IHTTPBackend {
public:
    explicit CurlBackend(TransportConfig config = {});
    ~CurlBackend() override;

    CurlBackend(const CurlBackend&)            = delete;
    CurlBackend& operator=(const CurlBackend&) = delete;

    std::string_view name() const noexcept override { return "libcurl"; }

    Response execute(const Request& request) override;

    void close_idle() override;

    BackendStats stats() const override;
    void reset_stats() override;

    /// Version string reported by curl_version()
    static std::string_view version() noexcept;

    const TransportConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace restful::transport::http
