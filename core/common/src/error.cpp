#include <restful/common/error.hpp>

#include <array>
#include <cstdio>
#include <sstream>

namespace restful::common {

namespace {

struct CodeName {
    ErrorCode code;
    std::string_view name;
};

#define RESTFUL_CODE_NAME(c) CodeName{ErrorCode::c, #c}

constexpr std::array CODE_NAMES = {
    RESTFUL_CODE_NAME(SUCCESS),
    RESTFUL_CODE_NAME(UNKNOWN_ERROR),
    RESTFUL_CODE_NAME(INVALID_ARGUMENT),
    RESTFUL_CODE_NAME(INVALID_STATE),
    RESTFUL_CODE_NAME(OPERATION_CANCELLED),
    RESTFUL_CODE_NAME(OPERATION_TIMEOUT),
    RESTFUL_CODE_NAME(NOT_FOUND),
    RESTFUL_CODE_NAME(CONNECTION_FAILED),
    RESTFUL_CODE_NAME(CONNECTION_REFUSED),
    RESTFUL_CODE_NAME(CONNECTION_RESET),
    RESTFUL_CODE_NAME(CONNECTION_TIMEOUT),
    RESTFUL_CODE_NAME(CONNECTION_CLOSED),
    RESTFUL_CODE_NAME(DNS_RESOLUTION_FAILED),
    RESTFUL_CODE_NAME(READ_ERROR),
    RESTFUL_CODE_NAME(WRITE_ERROR),
    RESTFUL_CODE_NAME(IO_FILE_NOT_FOUND),
    RESTFUL_CODE_NAME(PROTOCOL_ERROR),
    RESTFUL_CODE_NAME(MALFORMED_URL),
    RESTFUL_CODE_NAME(REDIRECT_BLOCKED),
    RESTFUL_CODE_NAME(TOO_MANY_REDIRECTS),
    RESTFUL_CODE_NAME(OUT_OF_MEMORY),
    RESTFUL_CODE_NAME(RESOURCE_EXHAUSTED),
    RESTFUL_CODE_NAME(RESOURCE_BUSY),
    RESTFUL_CODE_NAME(RESOURCE_UNAVAILABLE),
    RESTFUL_CODE_NAME(CIRCUIT_OPEN),
    RESTFUL_CODE_NAME(CONFIG_INVALID),
    RESTFUL_CODE_NAME(CONFIG_PARSE_ERROR),
    RESTFUL_CODE_NAME(CONFIG_VALUE_OUT_OF_RANGE),
    RESTFUL_CODE_NAME(CONFIG_TYPE_MISMATCH),
    RESTFUL_CODE_NAME(CONFIG_REQUIRED_MISSING),
    RESTFUL_CODE_NAME(CONFIG_FILE_NOT_FOUND),
    RESTFUL_CODE_NAME(CERTIFICATE_ERROR),
    RESTFUL_CODE_NAME(SECURITY_HANDSHAKE_FAILED),
    RESTFUL_CODE_NAME(DESERIALIZE_FAILED),
    RESTFUL_CODE_NAME(FORMAT_UNSUPPORTED),
    RESTFUL_CODE_NAME(ENCODING_ERROR),
    RESTFUL_CODE_NAME(DECODING_ERROR),
    RESTFUL_CODE_NAME(VALIDATION_FAILED),
};

#undef RESTFUL_CODE_NAME

}  // namespace

std::string_view category_name(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::GENERAL:       return "General";
        case ErrorCategory::IO:            return "I/O";
        case ErrorCategory::PROTOCOL:      return "Protocol";
        case ErrorCategory::RESOURCE:      return "Resource";
        case ErrorCategory::CONFIG:        return "Config";
        case ErrorCategory::SECURITY:      return "Security";
        case ErrorCategory::SERIALIZATION: return "Serialization";
        case ErrorCategory::VALIDATION:    return "Validation";
    }
    return "Unknown";
}

std::string_view error_name(ErrorCode code) noexcept {
    for (const auto& entry : CODE_NAMES) {
        if (entry.code == code) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

//=============================================================================
// Error
//=============================================================================

Error::Error(const Error& other)
    : code_(other.code_),
      message_(other.message_),
      location_(other.location_),
      cause_(other.cause_ ? std::make_unique<Error>(*other.cause_) : nullptr),
      context_(other.context_) {}

Error& Error::operator=(const Error& other) {
    if (this != &other) {
        Error copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Error& Error::with_cause(Error cause) {
    cause_ = std::make_unique<Error>(std::move(cause));
    return *this;
}

Error& Error::with_context(std::string_view key, std::string_view value) {
    context_.emplace_back(std::string(key), std::string(value));
    return *this;
}

std::string Error::to_string() const {
    char code_hex[8];
    std::snprintf(code_hex, sizeof(code_hex), "%04x", static_cast<unsigned>(code_));

    std::ostringstream oss;
    oss << "[" << category_name(category()) << "] " << error_name(code_) << " (0x" << code_hex
        << ")";
    if (!message_.empty()) {
        oss << ": " << message_;
    }
    if (location_.is_valid()) {
        oss << "\n    at " << location_.file << ":" << location_.line;
        if (location_.function[0] != '\0') {
            oss << " in " << location_.function;
        }
    }
    for (const auto& [key, value] : context_) {
        oss << "\n    " << key << ": " << value;
    }
    if (cause_) {
        oss << "\n  Caused by: " << cause_->to_string();
    }
    return oss.str();
}

std::string Error::summary() const {
    std::string out(error_name(code_));
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }
    for (const auto& [key, value] : context_) {
        out += " " + key + "=" + value;
    }
    if (cause_) {
        out += " (caused by " + cause_->summary() + ")";
    }
    return out;
}

}  // namespace restful::common
