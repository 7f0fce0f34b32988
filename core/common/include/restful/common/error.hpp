#pragma once

/**
 * @file error.hpp
 * @brief Error codes, Error and Result<T> for the restful client
 *
 * Every failure the client can produce is an ErrorCode inside an Error,
 * carried by Result<T> or attached to a client Response. That covers local
 * construction problems, transport failures, circuit rejection,
 * decompression and configuration. Non-2xx HTTP statuses are not errors.
 */

#include "platform.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#if defined(RESTFUL_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace restful::common {

// ============================================================================
// ERROR CODES
// ============================================================================

/**
 * @brief High byte of an ErrorCode
 */
enum class ErrorCategory : uint8_t {
    GENERAL       = 0x00,
    IO            = 0x01,  ///< sockets, DNS, files
    PROTOCOL      = 0x02,  ///< HTTP framing, redirects, URLs
    RESOURCE      = 0x03,  ///< pools, limiters, breakers
    CONFIG        = 0x04,
    SECURITY      = 0x05,  ///< TLS
    SERIALIZATION = 0x08,  ///< body codecs, gzip
    VALIDATION    = 0x09,
};

/**
 * @brief Error codes, laid out as 0xCCEE (category, entry)
 */
enum class ErrorCode : uint32_t {
    SUCCESS             = 0x0000,
    UNKNOWN_ERROR       = 0x0001,
    INVALID_ARGUMENT    = 0x0003,
    INVALID_STATE       = 0x0004,
    OPERATION_CANCELLED = 0x0005,
    OPERATION_TIMEOUT   = 0x0006,
    NOT_FOUND           = 0x0008,

    CONNECTION_FAILED     = 0x0100,
    CONNECTION_REFUSED    = 0x0101,
    CONNECTION_RESET      = 0x0102,
    CONNECTION_TIMEOUT    = 0x0103,
    CONNECTION_CLOSED     = 0x0104,
    DNS_RESOLUTION_FAILED = 0x0107,
    READ_ERROR            = 0x0109,
    WRITE_ERROR           = 0x010A,
    IO_FILE_NOT_FOUND     = 0x0111,

    PROTOCOL_ERROR     = 0x0200,
    MALFORMED_URL      = 0x020C,
    REDIRECT_BLOCKED   = 0x020D,
    TOO_MANY_REDIRECTS = 0x020E,

    OUT_OF_MEMORY        = 0x0300,
    RESOURCE_EXHAUSTED   = 0x0305,
    RESOURCE_BUSY        = 0x0306,
    RESOURCE_UNAVAILABLE = 0x0307,
    CIRCUIT_OPEN         = 0x030D,

    CONFIG_INVALID            = 0x0400,
    CONFIG_PARSE_ERROR        = 0x0402,
    CONFIG_VALUE_OUT_OF_RANGE = 0x0403,
    CONFIG_TYPE_MISMATCH      = 0x0404,
    CONFIG_REQUIRED_MISSING   = 0x0405,
    CONFIG_FILE_NOT_FOUND     = 0x0406,

    CERTIFICATE_ERROR         = 0x0502,
    SECURITY_HANDSHAKE_FAILED = 0x050F,

    DESERIALIZE_FAILED = 0x0801,
    FORMAT_UNSUPPORTED = 0x0802,
    ENCODING_ERROR     = 0x0803,
    DECODING_ERROR     = 0x0804,

    VALIDATION_FAILED = 0x0900,
};

constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

RESTFUL_API std::string_view category_name(ErrorCategory category) noexcept;

/**
 * @brief Enumerator spelling of @p code, "UNKNOWN" for values outside the enum
 */
RESTFUL_API std::string_view error_name(ErrorCode code) noexcept;

// ============================================================================
// SOURCE LOCATION
// ============================================================================

struct SourceLocation {
    const char* file     = "";
    const char* function = "";
    uint32_t line        = 0;
    uint32_t column      = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_, uint32_t line_,
                             uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(RESTFUL_HAS_SOURCE_LOCATION)
    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc.file_name(), loc.function_name(), loc.line(), loc.column());
    }
#endif

    constexpr bool is_valid() const noexcept { return line > 0 && file[0] != '\0'; }
};

#if defined(RESTFUL_HAS_SOURCE_LOCATION)
    #define RESTFUL_CURRENT_LOCATION ::restful::common::SourceLocation::current()
#else
    #define RESTFUL_CURRENT_LOCATION \
        ::restful::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR
// ============================================================================

/**
 * @brief Error code plus message, origin, key/value context and an optional cause
 *
 * Copies are deep: each copy owns its own cause chain.
 */
class RESTFUL_API Error {
public:
    Error() = default;
    Error(ErrorCode code) : code_(code) {}
    Error(ErrorCode code, std::string message, SourceLocation loc = {})
        : code_(code), message_(std::move(message)), location_(loc) {}

    Error(const Error& other);
    Error& operator=(const Error& other);
    Error(Error&&) noexcept            = default;
    Error& operator=(Error&&) noexcept = default;

    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    const SourceLocation& location() const noexcept { return location_; }

    bool is_success() const noexcept { return common::is_success(code_); }
    bool is_error() const noexcept { return !is_success(); }
    explicit operator bool() const noexcept { return is_success(); }

    /// Multi-line report: "[Category] NAME (0xCCEE): message", origin, context, causes
    std::string to_string() const;

    /// Single line "NAME: message k=v (caused by ...)" for logs and responses
    std::string summary() const;

    Error& with_cause(Error cause);
    const Error* cause() const noexcept { return cause_.get(); }

    Error& with_context(std::string_view key, std::string_view value);
    const std::vector<std::pair<std::string, std::string>>& context() const noexcept {
        return context_;
    }

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::unique_ptr<Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT
// ============================================================================

template<typename T = void>
class Result;

template<>
class Result<void> {
public:
    Result() = default;
    Result(ErrorCode code) : error_(code) {}
    Result(ErrorCode code, std::string_view message, SourceLocation loc = RESTFUL_CURRENT_LOCATION)
        : error_(code, std::string(message), loc) {}
    Result(Error error) : error_(std::move(error)) {}

    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

private:
    Error error_;
};

/**
 * @brief A T on success, an Error otherwise
 *
 * value() must only be called on success; error() on success returns an
 * empty SUCCESS error.
 */
template<typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrorCode code) : state_(std::in_place_index<1>, code) {}
    Result(ErrorCode code, std::string_view message, SourceLocation loc = RESTFUL_CURRENT_LOCATION)
        : state_(std::in_place_index<1>, code, std::string(message), loc) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool is_success() const noexcept { return state_.index() == 0; }
    bool is_error() const noexcept { return !is_success(); }
    explicit operator bool() const noexcept { return is_success(); }

    T& value() & { return *std::get_if<0>(&state_); }
    const T& value() const& { return *std::get_if<0>(&state_); }
    T&& value() && { return std::move(*std::get_if<0>(&state_)); }

    T value_or(T fallback) const& { return is_success() ? value() : std::move(fallback); }
    T value_or(T fallback) && {
        return is_success() ? std::move(*std::get_if<0>(&state_)) : std::move(fallback);
    }

    ErrorCode code() const noexcept { return is_success() ? ErrorCode::SUCCESS : error().code(); }
    const Error& error() const noexcept {
        static const Error none;
        const Error* e = std::get_if<1>(&state_);
        return e ? *e : none;
    }
    const std::string& message() const noexcept { return error().message(); }

    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>()))> {
        if (is_success()) {
            return func(value());
        }
        return error();
    }

    template<typename F>
    auto map(F&& func) && -> Result<decltype(func(std::declval<T&&>()))> {
        if (is_success()) {
            return func(std::move(*std::get_if<0>(&state_)));
        }
        return error();
    }

private:
    std::variant<T, Error> state_;
};

template<typename T>
Result<T> ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> ok() {
    return {};
}

template<typename T = void>
Result<T> err(ErrorCode code, std::string_view message = {},
              SourceLocation loc = RESTFUL_CURRENT_LOCATION) {
    return Result<T>(code, message, loc);
}

template<typename T = void>
Result<T> err(Error error) {
    return Result<T>(std::move(error));
}

// ============================================================================
// PROPAGATION
// ============================================================================

/// Return the result from the enclosing function when it holds an error
#define RESTFUL_TRY(expr)                                 \
    do {                                                  \
        auto _restful_result = (expr);                    \
        if (RESTFUL_UNLIKELY(_restful_result.is_error())) { \
            return _restful_result.error();               \
        }                                                 \
    } while (0)

/// Move the value of a successful result into @p var, or return its error
#define RESTFUL_TRY_ASSIGN(var, expr)                       \
    auto _restful_try_##var = (expr);                       \
    if (RESTFUL_UNLIKELY(_restful_try_##var.is_error())) {  \
        return _restful_try_##var.error();                  \
    }                                                       \
    var = std::move(_restful_try_##var).value()

}  // namespace restful::common
