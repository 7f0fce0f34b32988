/**
 * @file request_builder.cpp
 * @brief Request engine implementation
 */

#include "restful/client/request_builder.hpp"

#include "restful/client/cache_headers.hpp"
#include "restful/client/config_event.hpp"
#include "restful/client/version.hpp"

#include <restful/common/debug.hpp>
#include <restful/transport/http/gzip.hpp>
#include <restful/transport/http/http_utils.hpp>

#include <mutex>
#include <thread>

namespace restful::client {

using namespace common::debug;
using common::ErrorCode;

namespace http = transport::http;

namespace {

constexpr std::string_view FORWARDED_DIFF_STACK = "restful-cpp";
constexpr std::string_view TECHNOLOGY_TAG       = "cpp";

std::string_view body_encoding(const Response& response) {
    auto encoding = common::trim(response.header("Content-Encoding"));
    if (encoding.empty()) {
        encoding = common::trim(response.header("Content-Type"));
    }
    return encoding;
}

double to_millis(http::TransferTiming::Duration duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

}  // namespace

//=============================================================================
// ClientResources
//=============================================================================

ClientResources ClientResources::create() {
    ClientResources resources;
    resources.cache         = std::make_shared<ResourceCache>();
    resources.pools         = std::make_shared<http::PoolRegistry>();
    resources.metrics       = std::make_shared<RegistryMetricsPort>();
    resources.tracing       = std::make_shared<ContextTracingPort>();
    resources.retry_limiter = std::make_shared<common::ConcurrencyLimiter>();
    return resources;
}

//=============================================================================
// RequestBuilder::Impl
//=============================================================================

class RequestBuilder::Impl {
public:
    Impl(RequestBuilderConfig config, ClientResources resources)
        : config_(std::move(config)), resources_(std::move(resources)) {
        if (!resources_.cache) {
            resources_.cache = std::make_shared<ResourceCache>();
        }
        if (!resources_.pools) {
            resources_.pools = std::make_shared<http::PoolRegistry>();
        }
        if (!resources_.metrics) {
            resources_.metrics = std::make_shared<RegistryMetricsPort>();
        }
        if (!resources_.tracing) {
            resources_.tracing = std::make_shared<ContextTracingPort>();
        }
        if (!resources_.retry_limiter) {
            resources_.retry_limiter = std::make_shared<common::ConcurrencyLimiter>();
        }
        if (!resources_.sleep) {
            resources_.sleep = [](std::chrono::milliseconds delay) {
                std::this_thread::sleep_for(delay);
            };
        }
    }

    std::shared_ptr<const Response> execute(Method method, const std::string& url,
                                            const RequestBody& body,
                                            const RequestOptions& options) const {
        std::optional<RequestLogScope> log_scope;
        if (options.trace) {
            auto request_id = options.trace->request_id();
            if (!request_id.empty()) {
                log_scope.emplace(std::move(request_id));
            }
        }

        common::CompletionCallback report;
        if (config_.circuit_breaker) {
            auto admission = config_.circuit_breaker->allow();
            if (!admission) {
                RESTFUL_LOG_DEBUG(category::CIRCUIT, "breaker '" << config_.circuit_breaker->name()
                                                                 << "' denied " << url);
                return std::make_shared<Response>(Response::failure(admission.error(), 500));
            }
            report = std::move(admission).value();
        }

        auto result = perform(method, url, body, options);

        if (report) {
            report(!result->error && result->status_code / 100 != 5);
        }
        return result;
    }

    std::chrono::milliseconds request_timeout() const noexcept {
        if (config_.disable_timeout) {
            return std::chrono::milliseconds(0);
        }
        return config_.timeout.count() > 0 ? config_.timeout : DEFAULT_TIMEOUT;
    }

    std::chrono::milliseconds connect_timeout() const noexcept {
        if (config_.disable_timeout) {
            return std::chrono::milliseconds(0);
        }
        return config_.connect_timeout.count() > 0 ? config_.connect_timeout
                                                   : DEFAULT_CONNECT_TIMEOUT;
    }

    std::string pool_name() const {
        return config_.pool.name.empty() ? std::string(http::PoolRegistry::DEFAULT_POOL_NAME)
                                         : config_.pool.name;
    }

    RetryMode retry_mode() const noexcept {
        return config_.circuit_breaker ? RetryMode::DIRECT : RetryMode::LIMITED;
    }

    const RequestBuilderConfig& config() const noexcept { return config_; }
    const ClientResources& resources() const noexcept { return resources_; }

private:
    std::shared_ptr<const Response> perform(Method method, const std::string& url,
                                            const RequestBody& body,
                                            const RequestOptions& options) const {
        const std::string full_url = config_.base_url + url;
        const bool use_cache       = config_.enable_cache && http::is_read_method(method);

        std::shared_ptr<Response> cached;
        if (use_cache) {
            cached = resources_.cache->get(full_url);
            if (cached) {
                cached->mark_from_cache();
                if (!cached->needs_revalidation()) {
                    RESTFUL_LOG_TRACE(category::CACHE, "cache hit for " << full_url);
                    return cached;
                }
            }
        }

        auto payload = encode_body(config_.content_type, body);
        if (!payload) {
            RESTFUL_LOG_WARN(category::GENERAL, "cannot encode body for " << full_url << ": "
                                                                         << payload.message());
            return std::make_shared<Response>(Response::failure(payload.error()));
        }

        auto backend = transport();
        if (!backend) {
            return std::make_shared<Response>(Response::failure(
                common::Error(ErrorCode::RESOURCE_UNAVAILABLE, "no transport for pool")
                    .with_context("pool", pool_name())));
        }

        http::Request request;
        request.method           = method;
        request.url              = full_url;
        request.body             = std::move(payload).value();
        request.connect_timeout  = connect_timeout();
        request.timeout          = connect_timeout() + request_timeout();
        request.deadline         = options.deadline;
        request.follow_redirects = config_.follow_redirect;
        if (options.cancellation) {
            request.cancelled = options.cancellation->flag();
        }
        request.headers = build_headers(method, cached.get(), options);

        http::Response exchange = attempt_loop(*backend, request);

        if (exchange.error) {
            RESTFUL_LOG_DEBUG(category::TRANSPORT, http::method_to_string(method)
                                                       << " " << full_url << " failed: "
                                                       << exchange.error->summary());
            return std::make_shared<Response>(Response::failure(std::move(*exchange.error)));
        }

        // The body has been read completely
        release_connection(exchange, true);

        if (config_.enable_cache && exchange.status_code == 304 && cached) {
            RESTFUL_LOG_TRACE(category::CACHE, "revalidated " << full_url);
            return cached;
        }

        auto result            = std::make_shared<Response>();
        result->status_code    = exchange.status_code;
        result->status_message = std::move(exchange.status_message);
        result->headers        = std::move(exchange.headers);
        result->body           = std::move(exchange.body);

        if (config_.uncompress_response && !result->body.empty() &&
            http::is_gzip_encoding(body_encoding(*result))) {
            auto inflated = http::gzip_decompress(result->body);
            if (inflated) {
                result->body = std::move(inflated).value();
            } else {
                RESTFUL_LOG_WARN(category::TRANSPORT, "cannot decompress body of " << full_url
                                                      << ": " << inflated.message());
                result->error = inflated.error();
            }
        }

        auto metadata = parse_cache_metadata(result->headers);
        apply_cache_metadata(*result, metadata);

        // The cache keeps its own copy; its flags change as the entry ages
        if (use_cache && metadata.cacheable()) {
            resources_.cache->set_if_absent(full_url, std::make_shared<Response>(*result));
        }
        return result;
    }

    http::Response attempt_loop(http::IHTTPBackend& backend, http::Request& request) const {
        const auto& metrics_cfg = config_.metrics;
        uint32_t attempt        = 0;

        while (true) {
            auto started          = std::chrono::steady_clock::now();
            http::Response answer = backend.execute(request);
            auto elapsed          = std::chrono::steady_clock::now() - started;

            if (!metrics_cfg.disable_api_call_metrics) {
                resources_.metrics->record_call_outcome(
                    metrics_cfg.target_id, elapsed,
                    answer.error ? std::string("error") : std::to_string(answer.status_code),
                    attempt > 0);
            }
            if (!metrics_cfg.disable_connection_metrics) {
                record_connection_metrics(answer);
            }

            if (!config_.retry_strategy || request.is_cancelled() || request.deadline_expired()) {
                return answer;
            }

            auto decision = config_.retry_strategy->should_retry(request, answer, attempt);
            if (!decision.retry) {
                return answer;
            }

            if (retry_mode() == RetryMode::DIRECT) {
                prepare_retry(answer, decision, request, attempt);
                continue;
            }

            auto permit = common::ConcurrencyGuard::try_acquire(*resources_.retry_limiter);
            if (!permit) {
                if (!metrics_cfg.disable_api_call_metrics) {
                    resources_.metrics->record_count(metric_names::RETRY_BREAK, 1,
                                                     {{"target_id", metrics_cfg.target_id}});
                }
                RESTFUL_LOG_WARN(category::RETRY, "retry limiter exhausted, giving up on "
                                                      << request.url << " after attempt "
                                                      << attempt + 1);
                return answer;
            }
            prepare_retry(answer, decision, request, attempt);
        }
    }

    void prepare_retry(http::Response& discarded, const RetryDecision& decision,
                       http::Request& request, uint32_t& attempt) const {
        // The transport has already read the body in full
        release_connection(discarded, true);

        RESTFUL_LOG_DEBUG(category::RETRY,
                          "retrying " << http::method_to_string(request.method) << " "
                                      << request.url << " in " << decision.delay.count()
                                      << "ms ("
                                      << (discarded.error ? discarded.error->summary()
                                                          : std::to_string(discarded.status_code))
                                      << ")");

        if (decision.delay.count() > 0) {
            resources_.sleep(decision.delay);
        }
        ++attempt;
        request.headers["X-Retry"] = std::to_string(attempt);
    }

    void release_connection(http::Response& response, bool reusable) const {
        if (!response.lease || response.lease->released()) {
            return;
        }
        response.lease->release(reusable);
        if (!config_.metrics.disable_connection_metrics) {
            resources_.metrics->record_count(metric_names::CONN_PUT_IDLE, 1,
                                             {{"target_id", config_.metrics.target_id},
                                              {"status", reusable ? "ok" : "fail"}});
        }
    }

    void record_connection_metrics(const http::Response& answer) const {
        auto& metrics         = *resources_.metrics;
        const auto& target_id = config_.metrics.target_id;
        const auto& timing    = answer.timing;

        metrics.record_count(metric_names::CONN_REQUEST, 1, {{"target_id", target_id}});

        // Nothing was connected
        if (answer.error && !timing.tcp_connect && !answer.connection_reused) {
            metrics.record_count(metric_names::CONN_NEW, 1,
                                 {{"target_id", target_id}, {"status", "fail"}});
            return;
        }

        metrics.record_count(metric_names::CONN_GOT, 1,
                             {{"target_id", target_id},
                              {"status", answer.connection_reused ? "reused" : "not_reused"}});
        if (!answer.connection_reused) {
            metrics.record_count(metric_names::CONN_NEW, 1,
                                 {{"target_id", target_id}, {"status", "ok"}});
        }

        Tags tags{{"target_id", target_id}, {"technology", std::string(TECHNOLOGY_TAG)}};
        auto timing_sample = [&](const char* name,
                                 const std::optional<http::TransferTiming::Duration>& phase) {
            if (phase) {
                metrics.record_timing(name, to_millis(*phase), tags);
            }
        };
        timing_sample(metric_names::DNS_TIME, timing.dns);
        timing_sample(metric_names::TCP_CONNECT_TIME, timing.tcp_connect);
        timing_sample(metric_names::TLS_HANDSHAKE_TIME, timing.tls_handshake);
        timing_sample(metric_names::REQUEST_WRITTEN, timing.request_written);
        timing_sample(metric_names::FIRST_BYTE, timing.first_byte);
    }

    /**
     * Header precedence, later wins: builder defaults, engine headers,
     * caller options. Forwarded trace headers never override.
     */
    Headers build_headers(Method method, const Response* cached,
                          const RequestOptions& options) const {
        Headers headers = config_.headers;
        if (!config_.enable_cache) {
            headers.erase("If-None-Match");
            headers.erase("If-Modified-Since");
        }

        headers["Connection"]    = "keep-alive";
        headers["Cache-Control"] = "no-cache";

        if (config_.basic_auth) {
            headers["Authorization"] =
                http::basic_auth_value(config_.basic_auth->username, config_.basic_auth->password);
        }

        headers["User-Agent"] =
            config_.user_agent.empty() ? std::string(DEFAULT_USER_AGENT) : config_.user_agent;

        auto mime = mime_type(config_.content_type);
        if (!mime.empty()) {
            headers["Accept"] = std::string(mime);
            if (http::is_content_method(method)) {
                headers["Content-Type"] = std::string(mime);
            }
        }

        if (cached && cached->needs_revalidation()) {
            if (!cached->etag.empty()) {
                headers["If-None-Match"] = cached->etag;
            } else if (cached->last_modified) {
                headers["If-Modified-Since"] = http::format_http_date(*cached->last_modified);
            }
        }

        headers["X-Socket-Timeout"] = std::to_string(request_timeout().count());
        headers["X-Rest-Pool-Name"] = pool_name();

        for (const auto& [name, value] : options.headers) {
            headers[name] = value;
        }

        if (options.trace) {
            for (const auto& [name, value] : resources_.tracing->forwarded_headers(*options.trace)) {
                auto existing = common::header_value(headers, name);
                if (!existing.empty() && existing != value) {
                    resources_.metrics->record_count(
                        metric_names::FORWARDED_DIFF, 1,
                        {{"stack", std::string(FORWARDED_DIFF_STACK)},
                         {"header", common::to_lower(name)}});
                    continue;
                }
                headers[name] = value;
            }
        }
        return headers;
    }

    std::shared_ptr<http::IHTTPBackend> transport() const {
        std::call_once(transport_once_, [this] {
            http::PoolConfig pool_config;
            pool_config.name              = pool_name();
            pool_config.connect_timeout   = connect_timeout();
            pool_config.response_timeout  = request_timeout();
            pool_config.max_idle_per_host = config_.pool.max_idle_per_host;
            pool_config.proxy_url         = config_.pool.proxy_url;
            pool_config.verify_ssl        = config_.pool.verify_ssl;

            auto handle = resources_.pools->acquire(pool_config);
            transport_  = std::move(handle.transport);

            if (handle.created) {
                resources_.metrics->record_event(
                    metric_names::POOL_CONFIG_EVENT,
                    build_pool_config_event(pool_config.name, request_timeout(),
                                            config_.retry_strategy.get()));
            }
        });
        return transport_;
    }

    RequestBuilderConfig config_;
    ClientResources resources_;

    mutable std::once_flag transport_once_;
    mutable std::shared_ptr<http::IHTTPBackend> transport_;
};

//=============================================================================
// RequestBuilder
//=============================================================================

RequestBuilder::RequestBuilder(RequestBuilderConfig config, ClientResources resources)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(resources))) {}

RequestBuilder::~RequestBuilder() = default;

RequestBuilder::RequestBuilder(RequestBuilder&&) noexcept            = default;
RequestBuilder& RequestBuilder::operator=(RequestBuilder&&) noexcept = default;

std::shared_ptr<const Response> RequestBuilder::execute(Method method, const std::string& url,
                                                        const RequestBody& body,
                                                        const RequestOptions& options) const {
    return impl_->execute(method, url, body, options);
}

const RequestBuilderConfig& RequestBuilder::config() const noexcept {
    return impl_->config();
}

const ClientResources& RequestBuilder::resources() const noexcept {
    return impl_->resources();
}

std::chrono::milliseconds RequestBuilder::request_timeout() const noexcept {
    return impl_->request_timeout();
}

std::chrono::milliseconds RequestBuilder::connect_timeout() const noexcept {
    return impl_->connect_timeout();
}

std::string RequestBuilder::pool_name() const {
    return impl_->pool_name();
}

RetryMode RequestBuilder::retry_mode() const noexcept {
    return impl_->retry_mode();
}

}  // namespace restful::client
