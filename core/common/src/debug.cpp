#include <restful/common/debug.hpp>
#include <restful/common/platform.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

#if defined(RESTFUL_OS_POSIX)
#include <unistd.h>
#endif

namespace restful::common::debug {

namespace {

thread_local std::string tls_request_id;

struct LevelInfo {
    std::string_view name;
    char letter;
    const char* color;
};

constexpr std::array<LevelInfo, 6> LEVELS = {{
    {"TRACE", 'T', "\033[90m"},
    {"DEBUG", 'D', "\033[36m"},
    {"INFO", 'I', "\033[32m"},
    {"WARN", 'W', "\033[33m"},
    {"ERROR", 'E', "\033[31m"},
    {"OFF", '?', ""},
}};

constexpr const char* RESET = "\033[0m";

const LevelInfo* info_for(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < LEVELS.size() ? &LEVELS[index] : nullptr;
}

bool is_terminal(FILE* stream) noexcept {
#if defined(RESTFUL_OS_POSIX)
    return isatty(fileno(stream)) != 0;
#else
    (void)stream;
    return !platform::get_env("WT_SESSION").empty();
#endif
}

std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis  = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())
                      .count() %
                  1000;
    std::tm utc{};
#if defined(RESTFUL_OS_WINDOWS)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                  utc.tm_sec, static_cast<int>(millis));
    return buffer;
}

}  // namespace

std::string_view level_name(LogLevel level) noexcept {
    const auto* info = info_for(level);
    return info ? info->name : "UNKNOWN";
}

char level_char(LogLevel level) noexcept {
    const auto* info = info_for(level);
    return info ? info->letter : '?';
}

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string upper(name);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    if (upper == "ERR") {
        return LogLevel::ERROR;
    }
    if (upper == "NONE") {
        return LogLevel::OFF;
    }
    for (size_t i = 0; i < LEVELS.size(); ++i) {
        if (upper == LEVELS[i].name) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::INFO;
}

//=============================================================================
// LogFilter
//=============================================================================

void LogFilter::set_category_level(std::string_view category, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_[std::string(category)] = level;
}

bool LogFilter::should_log(LogLevel level, std::string_view category) const noexcept {
    if (level == LogLevel::OFF || level < global_level_.load(std::memory_order_relaxed)) {
        return false;
    }
    if (category.empty()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = category_levels_.find(std::string(category));
    return it == category_levels_.end() || level >= it->second;
}

void LogFilter::reset() noexcept {
    global_level_.store(LogLevel::INFO, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

//=============================================================================
// Console output
//=============================================================================

std::string format_line(const LogRecord& record, const ConsoleFormat& format) {
    std::string line;
    line.reserve(record.message.size() + 64);

    if (format.timestamps) {
        line += utc_timestamp(record.timestamp);
        line += ' ';
    }
    line += level_char(record.level);
    if (!record.category.empty()) {
        line += " [";
        line += record.category;
        line += ']';
    }
    if (format.thread_ids) {
        char tid[24];
        std::snprintf(tid, sizeof(tid), " [T:%llx]",
                      static_cast<unsigned long long>(record.thread_id));
        line += tid;
    }
    if (!record.request_id.empty()) {
        line += " [req:" + record.request_id + "]";
    }
    line += ' ';
    line += record.message;
    if (format.locations && record.location.is_valid()) {
        line += " (" + std::string(record.location.file) + ":" +
                std::to_string(record.location.line) + ")";
    }
    return line;
}

ConsoleSink::ConsoleSink(ConsoleFormat format)
    : format_(format),
      stdout_colors_(format.colors && is_terminal(stdout)),
      stderr_colors_(format.colors && is_terminal(stderr)) {}

void ConsoleSink::write(const LogRecord& record) {
    const bool to_stderr = record.level >= LogLevel::WARN;
    const bool colored   = to_stderr ? stderr_colors_ : stdout_colors_;
    std::ostream& out    = to_stderr ? std::cerr : std::cout;

    std::string line = format_line(record, format_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (colored) {
        const auto* info = info_for(record.level);
        out << (info ? info->color : "") << line << RESET << '\n';
    } else {
        out << line << '\n';
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

//=============================================================================
// Logger
//=============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

std::vector<std::shared_ptr<ILogSink>> Logger::sinks_snapshot() const {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    return sinks_;
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 SourceLocation loc) {
    if (!filter_.should_log(level, category)) {
        return;
    }

    LogRecord record;
    record.level      = level;
    record.category   = category;
    record.message    = std::move(message);
    record.location   = loc;
    record.timestamp  = std::chrono::system_clock::now();
    record.thread_id  = platform::get_thread_id();
    record.request_id = tls_request_id;

    for (const auto& sink : sinks_snapshot()) {
        sink->write(record);
    }
}

void Logger::flush() {
    for (const auto& sink : sinks_snapshot()) {
        sink->flush();
    }
}

//=============================================================================
// RequestLogScope
//=============================================================================

RequestLogScope::RequestLogScope(std::string request_id)
    : previous_(std::exchange(tls_request_id, std::move(request_id))) {}

RequestLogScope::~RequestLogScope() {
    tls_request_id = std::move(previous_);
}

const std::string& RequestLogScope::current_request_id() noexcept {
    return tls_request_id;
}

//=============================================================================
// Initialization
//=============================================================================

void init_logging(LogLevel level) {
    auto from_env = platform::get_env("RESTFUL_LOG_LEVEL");
    Logger::instance().set_level(from_env.empty() ? level : parse_log_level(from_env));
}

void shutdown_logging() {
    auto& logger = Logger::instance();
    logger.flush();
    logger.clear_sinks();
}

}  // namespace restful::common::debug
