#pragma once

/**
 * @file metrics.hpp
 * @brief In-process counters, gauges, histograms and events
 *
 * Updates are lock-free atomics; values are stored as fixed point with
 * 1e-6 resolution. MetricRegistry owns every series, hands out references
 * that stay valid for its lifetime and renders the Prometheus text format.
 * Dotted names such as "restful.api_call.time" are kept as given and only
 * sanitized on export.
 *
 * Usage:
 *   auto& registry = MetricRegistry::instance();
 *   registry.counter("conn_request", {{"target_id", "items"}}).inc();
 *   registry.histogram("restful.http.dns.time").observe(3.2);
 */

#include <restful/common/platform.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace restful::common::metrics {

using Labels = std::map<std::string, std::string>;

enum class MetricType { COUNTER, GAUGE, HISTOGRAM };

namespace detail {

constexpr double FIXED_POINT_SCALE = 1e6;

/// Prometheus metric and label names allow [a-zA-Z0-9_:]
inline std::string sanitize_name(std::string name) {
    for (auto& c : name) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '_' || c == ':';
        if (!allowed) {
            c = '_';
        }
    }
    return name;
}

inline std::string escape_label_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c;
        }
    }
    return out;
}

/// `{k="v",...}` with @p extra appended inside the braces; empty when nothing to show
inline std::string label_block(const Labels& labels, const std::string& extra = {}) {
    if (labels.empty() && extra.empty()) {
        return {};
    }
    std::string out = "{";
    for (const auto& [key, value] : labels) {
        if (out.size() > 1) {
            out += ',';
        }
        out += sanitize_name(key) + "=\"" + escape_label_value(value) + "\"";
    }
    if (!extra.empty()) {
        if (out.size() > 1) {
            out += ',';
        }
        out += extra;
    }
    out += '}';
    return out;
}

inline std::string format_value(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(6);
    oss << value;
    return oss.str();
}

inline int64_t to_fixed(double value) noexcept {
    return static_cast<int64_t>(value * FIXED_POINT_SCALE);
}

inline double from_fixed(int64_t value) noexcept {
    return static_cast<double>(value) / FIXED_POINT_SCALE;
}

}  // namespace detail

constexpr std::string_view type_name(MetricType type) noexcept {
    switch (type) {
        case MetricType::COUNTER:   return "counter";
        case MetricType::GAUGE:     return "gauge";
        case MetricType::HISTOGRAM: return "histogram";
    }
    return "untyped";
}

//=============================================================================
// Series
//=============================================================================

/**
 * @brief One named, labelled series
 */
class Metric {
public:
    Metric(std::string name, Labels labels) : name_(std::move(name)), labels_(std::move(labels)) {}
    virtual ~Metric() = default;

    virtual MetricType type() const noexcept = 0;
    virtual void reset() noexcept            = 0;

    /// Sample lines only, without the `# TYPE` header
    virtual void write_samples(std::ostream& out) const = 0;

    const std::string& name() const noexcept { return name_; }
    const Labels& labels() const noexcept { return labels_; }

    /// Complete exposition of this series alone
    std::string prometheus_format() const {
        std::ostringstream oss;
        oss << "# TYPE " << detail::sanitize_name(name_) << ' ' << type_name(type()) << '\n';
        write_samples(oss);
        return oss.str();
    }

private:
    std::string name_;
    Labels labels_;
};

class alignas(RESTFUL_CACHE_LINE_SIZE) Counter : public Metric {
public:
    explicit Counter(std::string name, Labels labels = {})
        : Metric(std::move(name), std::move(labels)) {}

    static constexpr MetricType KIND = MetricType::COUNTER;

    MetricType type() const noexcept override { return KIND; }

    void inc() noexcept { value_.fetch_add(detail::to_fixed(1.0), std::memory_order_relaxed); }

    /// Negative deltas are ignored
    void inc(double delta) noexcept {
        if (delta > 0) {
            value_.fetch_add(detail::to_fixed(delta), std::memory_order_relaxed);
        }
    }

    double value() const noexcept {
        return detail::from_fixed(value_.load(std::memory_order_relaxed));
    }

    void reset() noexcept override { value_.store(0, std::memory_order_relaxed); }

    void write_samples(std::ostream& out) const override {
        out << detail::sanitize_name(name()) << detail::label_block(labels()) << ' '
            << detail::format_value(value()) << '\n';
    }

private:
    std::atomic<int64_t> value_{0};
};

class alignas(RESTFUL_CACHE_LINE_SIZE) Gauge : public Metric {
public:
    explicit Gauge(std::string name, Labels labels = {})
        : Metric(std::move(name), std::move(labels)) {}

    static constexpr MetricType KIND = MetricType::GAUGE;

    MetricType type() const noexcept override { return KIND; }

    void set(double value) noexcept {
        value_.store(detail::to_fixed(value), std::memory_order_relaxed);
    }
    void inc(double delta = 1.0) noexcept {
        value_.fetch_add(detail::to_fixed(delta), std::memory_order_relaxed);
    }
    void dec(double delta = 1.0) noexcept { inc(-delta); }

    double value() const noexcept {
        return detail::from_fixed(value_.load(std::memory_order_relaxed));
    }

    void reset() noexcept override { value_.store(0, std::memory_order_relaxed); }

    void write_samples(std::ostream& out) const override {
        out << detail::sanitize_name(name()) << detail::label_block(labels()) << ' '
            << detail::format_value(value()) << '\n';
    }

private:
    std::atomic<int64_t> value_{0};
};

/**
 * @brief Histogram with cumulative buckets
 *
 * bucket_count(i) is the number of observations <= bounds()[i]; the last
 * index is the +Inf bucket and always equals count().
 */
class Histogram : public Metric {
public:
    /// Milliseconds, from a cached DNS answer up to a slow upstream
    static const std::vector<double> LATENCY_MS_BUCKETS;

    explicit Histogram(std::string name, std::vector<double> bounds = LATENCY_MS_BUCKETS,
                       Labels labels = {})
        : Metric(std::move(name), std::move(labels)),
          bounds_(std::move(bounds)),
          cumulative_(bounds_.size() + 1) {
        std::sort(bounds_.begin(), bounds_.end());
    }

    static constexpr MetricType KIND = MetricType::HISTOGRAM;

    MetricType type() const noexcept override { return KIND; }

    void observe(double value) noexcept {
        auto first = static_cast<size_t>(
            std::lower_bound(bounds_.begin(), bounds_.end(), value) - bounds_.begin());
        for (size_t i = first; i < cumulative_.size(); ++i) {
            cumulative_[i].fetch_add(1, std::memory_order_relaxed);
        }
        sum_.fetch_add(detail::to_fixed(value), std::memory_order_relaxed);
    }

    uint64_t count() const noexcept { return bucket_count(bounds_.size()); }
    double sum() const noexcept { return detail::from_fixed(sum_.load(std::memory_order_relaxed)); }
    const std::vector<double>& bounds() const noexcept { return bounds_; }

    uint64_t bucket_count(size_t index) const noexcept {
        return index < cumulative_.size() ? cumulative_[index].load(std::memory_order_relaxed) : 0;
    }

    void reset() noexcept override {
        for (auto& bucket : cumulative_) {
            bucket.store(0, std::memory_order_relaxed);
        }
        sum_.store(0, std::memory_order_relaxed);
    }

    void write_samples(std::ostream& out) const override {
        const auto family = detail::sanitize_name(name());
        for (size_t i = 0; i < cumulative_.size(); ++i) {
            std::ostringstream le;
            le << "le=\"";
            if (i == bounds_.size()) {
                le << "+Inf";
            } else {
                le << bounds_[i];
            }
            le << '"';
            out << family << "_bucket" << detail::label_block(labels(), le.str()) << ' '
                << bucket_count(i) << '\n';
        }
        const auto block = detail::label_block(labels());
        out << family << "_sum" << block << ' ' << detail::format_value(sum()) << '\n';
        out << family << "_count" << block << ' ' << count() << '\n';
    }

private:
    std::vector<double> bounds_;
    std::vector<std::atomic<uint64_t>> cumulative_;
    std::atomic<int64_t> sum_{0};
};

inline const std::vector<double> Histogram::LATENCY_MS_BUCKETS = {
    1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

//=============================================================================
// Events
//=============================================================================

struct Event {
    std::string name;
    std::map<std::string, std::string> attributes;
    std::chrono::system_clock::time_point timestamp;
};

//=============================================================================
// Registry
//=============================================================================

/**
 * @brief Owns every series and the most recent events
 *
 * Registries are independent of each other; instance() is the process-wide
 * default for callers that do not wire their own. A name identifies one
 * family: series of the same name share a single `# TYPE` line on export.
 */
class MetricRegistry {
public:
    static constexpr size_t MAX_EVENTS = 1024;

    MetricRegistry() = default;

    MetricRegistry(const MetricRegistry&)            = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    static MetricRegistry& instance() {
        static MetricRegistry registry;
        return registry;
    }

    Counter& counter(const std::string& name, const Labels& labels = {}) {
        return find_or_add<Counter>(name, labels, [&] { return std::make_unique<Counter>(name, labels); });
    }

    Gauge& gauge(const std::string& name, const Labels& labels = {}) {
        return find_or_add<Gauge>(name, labels, [&] { return std::make_unique<Gauge>(name, labels); });
    }

    /// @p bounds only matter for the call that creates the series
    Histogram& histogram(const std::string& name,
                         const std::vector<double>& bounds = Histogram::LATENCY_MS_BUCKETS,
                         const Labels& labels              = {}) {
        return find_or_add<Histogram>(
            name, labels, [&] { return std::make_unique<Histogram>(name, bounds, labels); });
    }

    /// Oldest events are dropped beyond MAX_EVENTS
    void record_event(std::string name, std::map<std::string, std::string> attributes) {
        std::lock_guard lock(events_mutex_);
        events_.push_back(
            Event{std::move(name), std::move(attributes), std::chrono::system_clock::now()});
        while (events_.size() > MAX_EVENTS) {
            events_.pop_front();
        }
    }

    std::vector<Event> events() const {
        std::lock_guard lock(events_mutex_);
        return {events_.begin(), events_.end()};
    }

    std::string prometheus_export() const {
        std::ostringstream out;
        std::shared_lock lock(mutex_);
        const std::string* family = nullptr;
        for (const auto& [key, metric] : series_) {
            if (family == nullptr || *family != key.first) {
                family = &key.first;
                out << "# TYPE " << detail::sanitize_name(key.first) << ' '
                    << type_name(metric->type()) << '\n';
            }
            metric->write_samples(out);
        }
        return out.str();
    }

    void reset_all() {
        {
            std::shared_lock lock(mutex_);
            for (auto& [_, metric] : series_) {
                metric->reset();
            }
        }
        std::lock_guard lock(events_mutex_);
        events_.clear();
    }

    size_t metric_count() const {
        std::shared_lock lock(mutex_);
        return series_.size();
    }

private:
    using SeriesKey = std::pair<std::string, Labels>;

    template <typename M, typename Make>
    M& find_or_add(const std::string& name, const Labels& labels, Make&& make) {
        SeriesKey key{name, labels};
        {
            std::shared_lock read(mutex_);
            if (auto it = series_.find(key); it != series_.end()) {
                return checked<M>(name, *it->second);
            }
        }
        std::unique_lock write(mutex_);
        auto [it, inserted] = series_.try_emplace(std::move(key));
        if (inserted) {
            it->second = make();
        }
        return checked<M>(name, *it->second);
    }

    template <typename M>
    static M& checked(const std::string& name, Metric& metric) {
        if (metric.type() != M::KIND) {
            throw std::invalid_argument("metric '" + name + "' is already a " +
                                        std::string(type_name(metric.type())));
        }
        return static_cast<M&>(metric);
    }

    mutable std::shared_mutex mutex_;
    std::map<SeriesKey, std::unique_ptr<Metric>> series_;

    mutable std::mutex events_mutex_;
    std::deque<Event> events_;
};

}  // namespace restful::common::metrics
