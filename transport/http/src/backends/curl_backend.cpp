/**
 * @file curl_backend.cpp
 * @brief libcurl HTTP backend implementation
 */

#include "restful/transport/http/backends/curl_backend.hpp"

#include <restful/common/debug.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace restful::transport::http {

using common::Error;
using common::ErrorCode;
using namespace common::debug;

//=============================================================================
// CURL Callbacks
//=============================================================================

namespace {

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            RESTFUL_LOG_ERROR(category::TRANSPORT,
                              "curl_global_init failed: " << curl_easy_strerror(rc));
        }
    });
}

struct TransferContext {
    const Request* request;
    Response* response;
    bool cancelled_by_caller = false;
    bool deadline_exceeded   = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx         = static_cast<TransferContext*>(userdata);
    size_t total_size = size * nmemb;
    auto* bytes       = reinterpret_cast<const uint8_t*>(ptr);
    ctx->response->body.insert(ctx->response->body.end(), bytes, bytes + total_size);
    return total_size;
}

size_t header_callback(char* buffer, size_t size, size_t nmemb, void* userdata) {
    auto* ctx         = static_cast<TransferContext*>(userdata);
    size_t total_size = size * nmemb;

    std::string_view line(buffer, total_size);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A status line starts a new header block (interim 1xx or a redirect hop)
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->response->headers.clear();
        auto code_pos = line.find(' ');
        auto text_pos = code_pos == std::string_view::npos ? code_pos : line.find(' ', code_pos + 1);
        ctx->response->status_message =
            text_pos == std::string_view::npos ? std::string() : std::string(line.substr(text_pos + 1));
        return total_size;
    }

    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        std::string name(common::trim(line.substr(0, colon)));
        std::string value(common::trim(line.substr(colon + 1)));

        auto& headers = ctx->response->headers;
        auto it       = headers.find(name);
        if (it == headers.end()) {
            headers.emplace(std::move(name), std::move(value));
        } else {
            it->second += ", ";
            it->second += value;
        }
    }

    return total_size;
}

int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->request->is_cancelled()) {
        ctx->cancelled_by_caller = true;
        return 1;
    }
    if (ctx->request->deadline_expired()) {
        ctx->deadline_exceeded = true;
        return 1;
    }
    return 0;
}

ErrorCode map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return ErrorCode::DNS_RESOLUTION_FAILED;
        case CURLE_COULDNT_CONNECT:
            return ErrorCode::CONNECTION_REFUSED;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::OPERATION_TIMEOUT;
        case CURLE_SSL_CONNECT_ERROR:
            return ErrorCode::SECURITY_HANDSHAKE_FAILED;
        case CURLE_PEER_FAILED_VERIFICATION:
            return ErrorCode::CERTIFICATE_ERROR;
        case CURLE_SEND_ERROR:
            return ErrorCode::WRITE_ERROR;
        case CURLE_RECV_ERROR:
            return ErrorCode::READ_ERROR;
        case CURLE_GOT_NOTHING:
            return ErrorCode::CONNECTION_CLOSED;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorCode::MALFORMED_URL;
        case CURLE_TOO_MANY_REDIRECTS:
            return ErrorCode::TOO_MANY_REDIRECTS;
        case CURLE_WEIRD_SERVER_REPLY:
            return ErrorCode::PROTOCOL_ERROR;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorCode::OPERATION_CANCELLED;
        case CURLE_OUT_OF_MEMORY:
            return ErrorCode::OUT_OF_MEMORY;
        default:
            return ErrorCode::CONNECTION_FAILED;
    }
}

std::optional<TransferTiming::Duration> phase(curl_off_t from, curl_off_t to) {
    if (to <= 0 || to < from) {
        return std::nullopt;
    }
    return TransferTiming::Duration(to - from);
}

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

//=============================================================================
// Handle Pool
//=============================================================================

/**
 * @brief Idle easy handles parked for reuse
 *
 * An easy handle owns its connection cache, so parking the handle keeps
 * its connection open. At most `max_idle` handles are parked; handles
 * returned beyond that, or returned as not reusable, are cleaned up and
 * their connections closed.
 */
class HandlePool {
public:
    explicit HandlePool(size_t max_idle) : max_idle_(max_idle) {}

    ~HandlePool() { close_idle(); }

    CURL* acquire() {
        CURL* handle = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                handle = idle_.back();
                idle_.pop_back();
            }
        }

        if (handle) {
            // Keeps live connections and the DNS cache
            curl_easy_reset(handle);
        } else {
            handle = curl_easy_init();
        }

        if (handle) {
            active_.fetch_add(1, std::memory_order_relaxed);
        }
        return handle;
    }

    void give_back(CURL* handle, bool reusable) {
        active_.fetch_sub(1, std::memory_order_relaxed);
        if (reusable) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (idle_.size() < max_idle_) {
                idle_.push_back(handle);
                return;
            }
        }
        curl_easy_cleanup(handle);
    }

    void close_idle() {
        std::vector<CURL*> handles;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handles.swap(idle_);
        }
        for (CURL* handle : handles) {
            curl_easy_cleanup(handle);
        }
    }

    size_t idle_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_.size();
    }

    size_t active_count() const noexcept { return active_.load(std::memory_order_relaxed); }

private:
    const size_t max_idle_;
    mutable std::mutex mutex_;
    std::vector<CURL*> idle_;
    std::atomic<size_t> active_{0};
};

class CurlLease final : public ConnectionLease {
public:
    CurlLease(std::shared_ptr<HandlePool> pool, CURL* handle)
        : pool_(std::move(pool)), handle_(handle) {}

    ~CurlLease() override { release(true); }

    void release(bool reusable) override {
        if (!released_.exchange(true, std::memory_order_acq_rel)) {
            pool_->give_back(handle_, reusable);
        }
    }

    bool released() const noexcept override { return released_.load(std::memory_order_acquire); }

private:
    std::shared_ptr<HandlePool> pool_;
    CURL* handle_;
    std::atomic<bool> released_{false};
};

}  // anonymous namespace

//=============================================================================
// CurlBackend Implementation
//=============================================================================

class CurlBackend::Impl {
public:
    explicit Impl(TransportConfig config)
        : config_(std::move(config)),
          pool_(std::make_shared<HandlePool>(config_.max_idle_per_host)) {
        ensure_curl_initialized();
    }

    Response execute(const Request& request) {
        Response response;

        if (request.is_cancelled()) {
            counters_.cancellations++;
            response.error = Error(ErrorCode::OPERATION_CANCELLED, "request cancelled before send",
                                   RESTFUL_CURRENT_LOCATION);
            return response;
        }

        CURL* curl = pool_->acquire();
        if (!curl) {
            counters_.errors++;
            response.error = Error(ErrorCode::RESOURCE_EXHAUSTED, "failed to initialize CURL",
                                   RESTFUL_CURRENT_LOCATION);
            return response;
        }
        auto lease = std::make_shared<CurlLease>(pool_, curl);

        TransferContext ctx{&request, &response};
        char error_buffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        // Setup method and body
        static const char EMPTY_BODY[] = "";
        const bool sends_body = is_content_method(request.method) || !request.body.empty();

        if (request.method == Method::HEAD) {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else if (request.method == Method::GET && !sends_body) {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }

        if (sends_body && request.method != Method::HEAD) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                             request.body.empty()
                                 ? EMPTY_BODY
                                 : reinterpret_cast<const char*>(request.body.data()));
        }

        if (request.method != Method::HEAD && request.method != Method::POST &&
            !(request.method == Method::GET && !sends_body)) {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST,
                             method_to_string(request.method).data());
        }

        // Setup headers
        curl_slist* raw_headers = nullptr;
        for (const auto& [name, value] : request.headers) {
            std::string header = name + ": " + value;
            if (curl_slist* next = curl_slist_append(raw_headers, header.c_str())) {
                raw_headers = next;
            }
        }
        // No 100-continue round trip on uploads
        if (curl_slist* next = curl_slist_append(raw_headers, "Expect:")) {
            raw_headers = next;
        }
        std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

        // Setup timeouts
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(
                             request.connect_timeout.value_or(config_.connect_timeout).count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.timeout.value_or(default_timeout()).count()));

        // Setup TLS
        if (config_.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        // Without an explicit proxy libcurl reads the *_proxy environment variables
        if (!config_.proxy_url.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
        }

        // Setup redirects
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));

        // Cancellation and deadline checks
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

        // Setup response callbacks
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);

        // Execute request
        counters_.requests_sent++;
        counters_.bytes_sent += request.body.size();

        CURLcode res = curl_easy_perform(curl);

        fill_timing(curl, response);

        if (res != CURLE_OK) {
            response.body.clear();
            response.error = make_error(res, ctx, response, error_buffer);
            counters_.errors++;
            lease->release(false);

            RESTFUL_LOG_DEBUG(category::TRANSPORT, method_to_string(request.method)
                                                       << " " << request.url << " failed: "
                                                       << response.error->summary());
            return response;
        }

        long status_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
        response.status_code = static_cast<int>(status_code);

        counters_.responses_received++;
        counters_.bytes_received += response.body.size();

        RESTFUL_LOG_DEBUG(category::TRANSPORT,
                          method_to_string(request.method)
                              << " " << request.url << " -> " << response.status_code << " ("
                              << response.timing.total.count() << "us"
                              << (response.connection_reused ? ", reused" : "") << ")");

        if (!request.follow_redirects && response.category() == StatusCategory::REDIRECTION &&
            !response.header("Location").empty()) {
            Error blocked(ErrorCode::REDIRECT_BLOCKED, "redirect attempt avoided",
                          RESTFUL_CURRENT_LOCATION);
            blocked.with_context("location", response.header("Location"));
            response.error = std::move(blocked);
            lease->release(true);
            return response;
        }

        response.lease = std::move(lease);
        return response;
    }

    std::chrono::milliseconds default_timeout() const noexcept {
        if (config_.response_timeout.count() == 0) {
            return std::chrono::milliseconds(0);
        }
        return config_.connect_timeout + config_.response_timeout;
    }

    void fill_timing(CURL* curl, Response& response) {
        curl_off_t namelookup = 0, connect = 0, appconnect = 0, pretransfer = 0,
                   starttransfer = 0, total = 0;
        long num_connects = 0;

        curl_easy_getinfo(curl, CURLINFO_NAMELOOKUP_TIME_T, &namelookup);
        curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME_T, &connect);
        curl_easy_getinfo(curl, CURLINFO_APPCONNECT_TIME_T, &appconnect);
        curl_easy_getinfo(curl, CURLINFO_PRETRANSFER_TIME_T, &pretransfer);
        curl_easy_getinfo(curl, CURLINFO_STARTTRANSFER_TIME_T, &starttransfer);
        curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME_T, &total);
        curl_easy_getinfo(curl, CURLINFO_NUM_CONNECTS, &num_connects);

        auto& timing = response.timing;
        response.connection_reused = num_connects == 0;

        if (response.connection_reused) {
            counters_.connections_reused++;
        } else {
            counters_.connections_opened++;
            timing.dns           = phase(0, namelookup);
            timing.tcp_connect   = phase(namelookup, connect);
            timing.tls_handshake = phase(connect, appconnect);
        }
        timing.request_written = phase(0, pretransfer);
        timing.first_byte      = phase(0, starttransfer);
        timing.total           = TransferTiming::Duration(total);
    }

    Error make_error(CURLcode res, const TransferContext& ctx, const Response& response,
                     const char* error_buffer) {
        if (ctx.cancelled_by_caller) {
            counters_.cancellations++;
            return Error(ErrorCode::OPERATION_CANCELLED, "request cancelled",
                         RESTFUL_CURRENT_LOCATION);
        }
        if (ctx.deadline_exceeded) {
            counters_.timeouts++;
            return Error(ErrorCode::OPERATION_TIMEOUT, "request deadline exceeded",
                         RESTFUL_CURRENT_LOCATION);
        }

        ErrorCode code = map_curl_error(res);
        if (res == CURLE_OPERATION_TIMEDOUT) {
            counters_.timeouts++;
            // Timed out before a connection was established
            if (!response.connection_reused && !response.timing.tcp_connect) {
                code = ErrorCode::CONNECTION_TIMEOUT;
            }
        }

        std::string message = curl_easy_strerror(res);
        if (error_buffer[0] != '\0') {
            message += ": ";
            message += error_buffer;
        }

        Error error(code, std::move(message), RESTFUL_CURRENT_LOCATION);
        error.with_context("curl_code", std::to_string(static_cast<int>(res)));
        return error;
    }

    BackendStats snapshot() const {
        BackendStats stats;
        stats.requests_sent      = counters_.requests_sent.load(std::memory_order_relaxed);
        stats.responses_received = counters_.responses_received.load(std::memory_order_relaxed);
        stats.errors             = counters_.errors.load(std::memory_order_relaxed);
        stats.timeouts           = counters_.timeouts.load(std::memory_order_relaxed);
        stats.cancellations      = counters_.cancellations.load(std::memory_order_relaxed);
        stats.connections_opened = counters_.connections_opened.load(std::memory_order_relaxed);
        stats.connections_reused = counters_.connections_reused.load(std::memory_order_relaxed);
        stats.bytes_sent         = counters_.bytes_sent.load(std::memory_order_relaxed);
        stats.bytes_received     = counters_.bytes_received.load(std::memory_order_relaxed);
        stats.active_leases      = pool_->active_count();
        stats.idle_connections   = pool_->idle_count();
        return stats;
    }

    void reset() {
        counters_.requests_sent      = 0;
        counters_.responses_received = 0;
        counters_.errors             = 0;
        counters_.timeouts           = 0;
        counters_.cancellations      = 0;
        counters_.connections_opened = 0;
        counters_.connections_reused = 0;
        counters_.bytes_sent         = 0;
        counters_.bytes_received     = 0;
    }

    TransportConfig config_;
    std::shared_ptr<HandlePool> pool_;

    struct Counters {
        std::atomic<uint64_t> requests_sent{0};
        std::atomic<uint64_t> responses_received{0};
        std::atomic<uint64_t> errors{0};
        std::atomic<uint64_t> timeouts{0};
        std::atomic<uint64_t> cancellations{0};
        std::atomic<uint64_t> connections_opened{0};
        std::atomic<uint64_t> connections_reused{0};
        std::atomic<uint64_t> bytes_sent{0};
        std::atomic<uint64_t> bytes_received{0};
    } counters_;
};

CurlBackend::CurlBackend(TransportConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

CurlBackend::~CurlBackend() = default;

std::string_view CurlBackend::version() noexcept {
    static const std::string version = curl_version();
    return version;
}

const TransportConfig& CurlBackend::config() const noexcept {
    return impl_->config_;
}

Response CurlBackend::execute(const Request& request) {
    return impl_->execute(request);
}

void CurlBackend::close_idle() {
    impl_->pool_->close_idle();
}

BackendStats CurlBackend::stats() const {
    return impl_->snapshot();
}

void CurlBackend::reset_stats() {
    impl_->reset();
}

}  // namespace restful::transport::http
