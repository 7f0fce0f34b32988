#pragma once

/**
 * @file debug.hpp
 * @brief Logging for the restful client
 *
 * All client components log through RESTFUL_LOG_* with one of the
 * categories below. Messages are stream expressions and are only formatted
 * when the level is enabled for the category. A RequestLogScope stamps
 * every record written on its thread with the id of the call in progress.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace restful::common::debug {

enum class LogLevel : uint8_t { TRACE = 0, DEBUG, INFO, WARN, ERROR, OFF };

RESTFUL_API std::string_view level_name(LogLevel level) noexcept;
RESTFUL_API char level_char(LogLevel level) noexcept;

/**
 * @brief Case-insensitive level name; also accepts WARNING, ERR and NONE
 *
 * Unrecognised input yields INFO.
 */
RESTFUL_API LogLevel parse_log_level(std::string_view name) noexcept;

namespace category {
constexpr std::string_view GENERAL   = "general";
constexpr std::string_view TRANSPORT = "transport";
constexpr std::string_view POOL      = "pool";
constexpr std::string_view CACHE     = "cache";
constexpr std::string_view RETRY     = "retry";
constexpr std::string_view CIRCUIT   = "circuit";
constexpr std::string_view CONFIG    = "config";
constexpr std::string_view METRICS   = "metrics";
}  // namespace category

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id = 0;
    std::string request_id;  ///< empty outside a RequestLogScope
};

// ============================================================================
// SINKS
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

struct ConsoleFormat {
    bool colors     = true;  ///< only honoured when the stream is a terminal
    bool timestamps = true;
    bool thread_ids = false;
    bool locations  = false;
};

/**
 * @brief One console line for @p record, without the trailing newline
 *
 * Layout: `2026-01-31T09:15:02.041Z W [retry] [req:7f3a] message (file:line)`.
 * Timestamps are UTC.
 */
RESTFUL_API std::string format_line(const LogRecord& record, const ConsoleFormat& format);

/**
 * @brief Writes INFO and below to stdout, WARN and above to stderr
 */
class RESTFUL_API ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(ConsoleFormat format = {});

    void write(const LogRecord& record) override;
    void flush() override;

private:
    ConsoleFormat format_;
    bool stdout_colors_ = false;
    bool stderr_colors_ = false;
    std::mutex mutex_;
};

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    void write(const LogRecord& record) override {
        if (callback_) {
            callback_(record);
        }
    }

private:
    Callback callback_;
};

// ============================================================================
// FILTER AND LOGGER
// ============================================================================

/**
 * @brief Global minimum level plus per-category overrides
 *
 * An override applies only to what the global level already lets through.
 */
class RESTFUL_API LogFilter {
public:
    void set_level(LogLevel level) noexcept { global_level_.store(level); }
    LogLevel level() const noexcept { return global_level_.load(std::memory_order_relaxed); }

    void set_category_level(std::string_view category, LogLevel level);
    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /// Back to INFO with no overrides
    void reset() noexcept;

private:
    std::atomic<LogLevel> global_level_{LogLevel::INFO};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LogLevel> category_levels_;
};

/**
 * @brief Process-wide logger; starts with a single ConsoleSink
 */
class RESTFUL_API Logger {
public:
    static Logger& instance() noexcept;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }
    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = RESTFUL_CURRENT_LOCATION);

    void flush();

private:
    Logger();

    std::vector<std::shared_ptr<ILogSink>> sinks_snapshot() const;

    LogFilter filter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

/**
 * @brief Tags records logged on this thread with a request id until destroyed
 *
 * Scopes nest and restore the enclosing id on exit.
 */
class RESTFUL_API RequestLogScope {
public:
    explicit RequestLogScope(std::string request_id);
    ~RequestLogScope();

    RequestLogScope(const RequestLogScope&)            = delete;
    RequestLogScope& operator=(const RequestLogScope&) = delete;

    static const std::string& current_request_id() noexcept;

private:
    std::string previous_;
};

// ============================================================================
// MACROS
// ============================================================================

#define RESTFUL_LOG_ENABLED(level, cat)                      \
    ::restful::common::debug::Logger::instance().is_enabled( \
        ::restful::common::debug::LogLevel::level, cat)

#define RESTFUL_LOG_IMPL(level, cat, ...)                                                  \
    do {                                                                                   \
        auto& _restful_logger = ::restful::common::debug::Logger::instance();              \
        if (_restful_logger.is_enabled(::restful::common::debug::LogLevel::level, cat)) { \
            std::ostringstream _restful_oss;                                               \
            _restful_oss << __VA_ARGS__;                                                   \
            _restful_logger.log(::restful::common::debug::LogLevel::level, cat,            \
                                _restful_oss.str(), RESTFUL_CURRENT_LOCATION);             \
        }                                                                                  \
    } while (0)

#define RESTFUL_LOG_TRACE(cat, ...) RESTFUL_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define RESTFUL_LOG_DEBUG(cat, ...) RESTFUL_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define RESTFUL_LOG_INFO(cat, ...)  RESTFUL_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define RESTFUL_LOG_WARN(cat, ...)  RESTFUL_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define RESTFUL_LOG_ERROR(cat, ...) RESTFUL_LOG_IMPL(ERROR, cat, __VA_ARGS__)

/**
 * @brief Set the global level; RESTFUL_LOG_LEVEL in the environment wins
 */
RESTFUL_API void init_logging(LogLevel level = LogLevel::INFO);

RESTFUL_API void shutdown_logging();

}  // namespace restful::common::debug
