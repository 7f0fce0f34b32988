/**
 * @file metrics_port.cpp
 * @brief MetricRegistry-backed metrics port
 */

#include "restful/client/metrics_port.hpp"

namespace restful::client {

using common::metrics::Histogram;

void RegistryMetricsPort::record_call_outcome(std::string_view target_id,
                                              std::chrono::steady_clock::duration elapsed,
                                              std::string_view outcome, bool was_retry) {
    common::metrics::Labels labels{{"target_id", std::string(target_id)},
                                   {"status", std::string(outcome)},
                                   {"retry", was_retry ? "true" : "false"}};
    registry_.counter(metric_names::API_CALL, labels).inc();

    double millis = std::chrono::duration<double, std::milli>(elapsed).count();
    registry_
        .histogram(metric_names::API_CALL_TIME, Histogram::LATENCY_MS_BUCKETS,
                   {{"target_id", std::string(target_id)}})
        .observe(millis);
}

void RegistryMetricsPort::record_count(std::string_view name, double value, const Tags& tags) {
    registry_.counter(std::string(name), tags).inc(value);
}

void RegistryMetricsPort::record_gauge(std::string_view name, double value, const Tags& tags) {
    registry_.gauge(std::string(name), tags).set(value);
}

void RegistryMetricsPort::record_timing(std::string_view name, double millis, const Tags& tags) {
    registry_.histogram(std::string(name), Histogram::LATENCY_MS_BUCKETS, tags).observe(millis);
}

void RegistryMetricsPort::record_event(std::string_view name,
                                       const std::map<std::string, std::string>& attributes) {
    registry_.record_event(std::string(name), attributes);
}

}  // namespace restful::client
