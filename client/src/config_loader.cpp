/**
 * @file config_loader.cpp
 * @brief YAML client configuration loader
 */

#include "restful/client/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace restful::client {

using namespace common::debug;
using common::ErrorCode;

namespace {

/**
 * Raised while walking the document, turned into a Result at the loader
 * boundary
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

template<typename T>
T yaml_get(const YAML::Node& node, const std::string& key, T default_value) {
    if (!node[key]) {
        return default_value;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(ErrorCode::CONFIG_TYPE_MISMATCH,
                          "invalid value for '" + key + "': " + YAML::Dump(node[key]));
    }
}

std::chrono::milliseconds yaml_get_ms(const YAML::Node& node, const std::string& key,
                                      std::chrono::milliseconds default_value) {
    auto value = yaml_get<int64_t>(node, key, default_value.count());
    if (value < 0) {
        throw ConfigError(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                          "'" + key + "' must not be negative");
    }
    return std::chrono::milliseconds(value);
}

void expect_map(const YAML::Node& node, const std::string& section) {
    if (node && !node.IsMap()) {
        throw ConfigError(ErrorCode::CONFIG_INVALID, "'" + section + "' must be a mapping");
    }
}

ContentType parse_content_type(const std::string& name) {
    auto lower = common::to_lower(name);
    if (lower == "json") {
        return ContentType::JSON;
    }
    if (lower == "xml") {
        return ContentType::XML;
    }
    if (lower == "bytes") {
        return ContentType::BYTES;
    }
    throw ConfigError(ErrorCode::CONFIG_INVALID, "unknown content_type '" + name + "'");
}

RetryKind parse_retry_kind(const std::string& name) {
    auto lower = common::to_lower(name);
    if (lower == "none") {
        return RetryKind::NONE;
    }
    if (lower == "simple") {
        return RetryKind::SIMPLE;
    }
    if (lower == "backoff") {
        return RetryKind::BACKOFF;
    }
    throw ConfigError(ErrorCode::CONFIG_INVALID, "unknown retry type '" + name + "'");
}

void parse_pool(const YAML::Node& node, PoolSettings& pool) {
    expect_map(node, "pool");
    if (!node) {
        return;
    }
    pool.name              = yaml_get<std::string>(node, "name", pool.name);
    pool.max_idle_per_host = yaml_get<size_t>(node, "max_idle_per_host", pool.max_idle_per_host);
    pool.proxy_url         = yaml_get<std::string>(node, "proxy", pool.proxy_url);
    pool.verify_ssl        = yaml_get(node, "verify_ssl", pool.verify_ssl);
}

void parse_metrics(const YAML::Node& node, MetricsSettings& metrics) {
    expect_map(node, "metrics");
    if (!node) {
        return;
    }
    metrics.target_id = yaml_get<std::string>(node, "target_id", metrics.target_id);
    metrics.disable_api_call_metrics =
        yaml_get(node, "disable_api_call_metrics", metrics.disable_api_call_metrics);
    metrics.disable_connection_metrics =
        yaml_get(node, "disable_connection_metrics", metrics.disable_connection_metrics);
}

RetrySettings parse_retry(const YAML::Node& node) {
    RetrySettings retry;
    expect_map(node, "retry");
    if (!node) {
        return retry;
    }

    retry.kind        = parse_retry_kind(yaml_get<std::string>(node, "type", "simple"));
    retry.max_retries = yaml_get<uint32_t>(node, "max_retries", retry.max_retries);
    retry.delay       = yaml_get_ms(node, "delay_ms", retry.delay);
    retry.retry_on_server_error =
        yaml_get(node, "retry_on_server_error", retry.retry_on_server_error);
    retry.limiter_capacity = yaml_get<size_t>(node, "limiter_capacity", retry.limiter_capacity);

    retry.backoff.min_wait    = yaml_get_ms(node, "min_wait_ms", retry.backoff.min_wait);
    retry.backoff.max_wait    = yaml_get_ms(node, "max_wait_ms", retry.backoff.max_wait);
    retry.backoff.base        = yaml_get_ms(node, "base_ms", retry.backoff.base);
    retry.backoff.growth      = yaml_get<double>(node, "growth", retry.backoff.growth);
    retry.backoff.max_retries = retry.max_retries;
    retry.backoff.retry_on_server_error = retry.retry_on_server_error;

    if (retry.backoff.max_wait < retry.backoff.min_wait) {
        throw ConfigError(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                          "retry.max_wait_ms is below retry.min_wait_ms");
    }
    if (retry.limiter_capacity == 0) {
        throw ConfigError(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                          "retry.limiter_capacity must be positive");
    }
    return retry;
}

common::CircuitBreakerConfig parse_circuit_breaker(const YAML::Node& node) {
    common::CircuitBreakerConfig config;
    config.consecutive_failures =
        yaml_get<uint32_t>(node, "consecutive_failures", config.consecutive_failures);
    config.failure_ratio = yaml_get<double>(node, "failure_ratio", config.failure_ratio);
    config.window_size   = yaml_get<uint32_t>(node, "window_size", config.window_size);
    config.min_requests  = yaml_get<uint32_t>(node, "min_requests", config.min_requests);
    config.cooldown      = yaml_get_ms(node, "cooldown_ms", config.cooldown);
    config.half_open_max_calls =
        yaml_get<uint32_t>(node, "half_open_max_calls", config.half_open_max_calls);

    if (config.failure_ratio < 0.0 || config.failure_ratio > 1.0) {
        throw ConfigError(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                          "circuit_breaker.failure_ratio must be within [0, 1]");
    }
    if (config.window_size == 0 || config.half_open_max_calls == 0) {
        throw ConfigError(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                          "circuit_breaker window_size and half_open_max_calls must be positive");
    }
    return config;
}

ClientConfig parse_client_config(const YAML::Node& root) {
    ClientConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError(ErrorCode::CONFIG_INVALID, "configuration root must be a mapping");
    }

    auto& builder       = config.builder;
    builder.base_url    = yaml_get<std::string>(root, "base_url", "");
    builder.content_type =
        parse_content_type(yaml_get<std::string>(root, "content_type", "json"));
    builder.timeout             = yaml_get_ms(root, "timeout_ms", builder.timeout);
    builder.connect_timeout     = yaml_get_ms(root, "connect_timeout_ms", builder.connect_timeout);
    builder.disable_timeout     = yaml_get(root, "disable_timeout", builder.disable_timeout);
    builder.enable_cache        = yaml_get(root, "enable_cache", builder.enable_cache);
    builder.uncompress_response = yaml_get(root, "uncompress_response", builder.uncompress_response);
    builder.follow_redirect     = yaml_get(root, "follow_redirect", builder.follow_redirect);
    builder.user_agent          = yaml_get<std::string>(root, "user_agent", "");

    if (const auto headers = root["headers"]) {
        expect_map(headers, "headers");
        for (const auto& entry : headers) {
            builder.headers[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }

    if (const auto auth = root["basic_auth"]) {
        expect_map(auth, "basic_auth");
        BasicAuth basic;
        basic.username = yaml_get<std::string>(auth, "username", "");
        basic.password = yaml_get<std::string>(auth, "password", "");
        if (basic.username.empty()) {
            throw ConfigError(ErrorCode::CONFIG_REQUIRED_MISSING, "basic_auth.username is required");
        }
        builder.basic_auth = std::move(basic);
    }

    parse_pool(root["pool"], builder.pool);
    parse_metrics(root["metrics"], builder.metrics);
    config.retry = parse_retry(root["retry"]);

    if (const auto breaker = root["circuit_breaker"]) {
        expect_map(breaker, "circuit_breaker");
        config.circuit_breaker      = parse_circuit_breaker(breaker);
        config.circuit_breaker_name = yaml_get<std::string>(
            breaker, "name", builder.metrics.target_id.empty() ? builder.base_url
                                                               : builder.metrics.target_id);
    }

    if (const auto logging = root["logging"]) {
        expect_map(logging, "logging");
        if (logging["level"]) {
            config.log_level = parse_log_level(yaml_get<std::string>(logging, "level", "info"));
        }
    }
    return config;
}

}  // namespace

//=============================================================================
// ClientConfig
//=============================================================================

std::shared_ptr<const IRetryStrategy> ClientConfig::make_retry_strategy() const {
    switch (retry.kind) {
        case RetryKind::SIMPLE:
            return std::make_shared<SimpleRetryStrategy>(retry.max_retries, retry.delay,
                                                         retry.retry_on_server_error);
        case RetryKind::BACKOFF:
            return std::make_shared<BackoffRetryStrategy>(retry.backoff);
        case RetryKind::NONE:
        default:
            return nullptr;
    }
}

RequestBuilderConfig ClientConfig::make_builder_config() const {
    RequestBuilderConfig config = builder;
    config.retry_strategy       = make_retry_strategy();
    if (circuit_breaker) {
        config.circuit_breaker =
            std::make_shared<common::CircuitBreaker>(circuit_breaker_name, *circuit_breaker);
    }
    return config;
}

//=============================================================================
// ClientConfigLoader
//=============================================================================

common::Result<ClientConfig> ClientConfigLoader::load_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return common::err<ClientConfig>(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                         "configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return common::err<ClientConfig>(ErrorCode::IO_FILE_NOT_FOUND,
                                         "cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_string(buffer.str());
    if (result) {
        RESTFUL_LOG_INFO(category::CONFIG, "loaded client configuration from " << path.string());
    }
    return result;
}

common::Result<ClientConfig> ClientConfigLoader::load_string(std::string_view yaml) {
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        return parse_client_config(root);
    } catch (const ConfigError& e) {
        RESTFUL_LOG_WARN(category::CONFIG, "invalid client configuration: " << e.what());
        return common::err<ClientConfig>(e.code(), e.what());
    } catch (const YAML::BadConversion& e) {
        RESTFUL_LOG_WARN(category::CONFIG, "invalid client configuration: " << e.what());
        return common::err<ClientConfig>(ErrorCode::CONFIG_TYPE_MISMATCH, e.what());
    } catch (const YAML::Exception& e) {
        RESTFUL_LOG_WARN(category::CONFIG, "cannot parse client configuration: " << e.what());
        return common::err<ClientConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                         std::string("Parse error: ") + e.what());
    }
}

}  // namespace restful::client
