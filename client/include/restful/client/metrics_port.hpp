#pragma once

/**
 * @file metrics_port.hpp
 * @brief Outbound metrics interface used by the request engine
 *
 * The engine reports through IMetricsPort only; which backend receives
 * the data is the application's choice. RegistryMetricsPort feeds the
 * in-process MetricRegistry (Prometheus export), NullMetricsPort drops
 * everything.
 */

#include <restful/common/metrics.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace restful::client {

using Tags = std::map<std::string, std::string>;

// Metric and event names emitted by the request engine
namespace metric_names {
constexpr const char* API_CALL           = "restful.api_call";
constexpr const char* API_CALL_TIME      = "restful.api_call.time";
constexpr const char* RETRY_BREAK        = "restful.api_call.retry_break";
constexpr const char* FORWARDED_DIFF     = "platform.traffic.forwarded_header.diff";
constexpr const char* CONN_REQUEST       = "conn_request";
constexpr const char* CONN_GOT           = "conn_got";
constexpr const char* CONN_NEW           = "conn_new";
constexpr const char* CONN_PUT_IDLE      = "conn_put_idle";
constexpr const char* DNS_TIME           = "toolkit.http.dns.time";
constexpr const char* TCP_CONNECT_TIME   = "toolkit.http.tcp_connect.time";
constexpr const char* TLS_HANDSHAKE_TIME = "toolkit.http.tls_handshake.time";
constexpr const char* REQUEST_WRITTEN    = "toolkit.http.request_written.time";
constexpr const char* FIRST_BYTE         = "toolkit.http.response_first_byte.time";
constexpr const char* POOL_CONFIG_EVENT  = "RestClientApplicationConfigs";
}  // namespace metric_names

class IMetricsPort {
public:
    virtual ~IMetricsPort() = default;

    /**
     * @brief One network attempt finished
     * @param outcome status code as text, or "error"
     */
    virtual void record_call_outcome(std::string_view target_id,
                                     std::chrono::steady_clock::duration elapsed,
                                     std::string_view outcome, bool was_retry) = 0;

    virtual void record_count(std::string_view name, double value, const Tags& tags) = 0;

    virtual void record_gauge(std::string_view name, double value, const Tags& tags) = 0;

    /**
     * @brief A duration sample in milliseconds
     */
    virtual void record_timing(std::string_view name, double millis, const Tags& tags) = 0;

    virtual void record_event(std::string_view name,
                              const std::map<std::string, std::string>& attributes) = 0;
};

class NullMetricsPort : public IMetricsPort {
public:
    void record_call_outcome(std::string_view, std::chrono::steady_clock::duration,
                             std::string_view, bool) override {}
    void record_count(std::string_view, double, const Tags&) override {}
    void record_gauge(std::string_view, double, const Tags&) override {}
    void record_timing(std::string_view, double, const Tags&) override {}
    void record_event(std::string_view, const std::map<std::string, std::string>&) override {}
};

class RegistryMetricsPort : public IMetricsPort {
public:
    explicit RegistryMetricsPort(
        common::metrics::MetricRegistry& registry = common::metrics::MetricRegistry::instance())
        : registry_(registry) {}

    void record_call_outcome(std::string_view target_id,
                             std::chrono::steady_clock::duration elapsed,
                             std::string_view outcome, bool was_retry) override;

    void record_count(std::string_view name, double value, const Tags& tags) override;
    void record_gauge(std::string_view name, double value, const Tags& tags) override;
    void record_timing(std::string_view name, double millis, const Tags& tags) override;
    void record_event(std::string_view name,
                      const std::map<std::string, std::string>& attributes) override;

    common::metrics::MetricRegistry& registry() noexcept { return registry_; }

private:
    common::metrics::MetricRegistry& registry_;
};

}  // namespace restful::client
