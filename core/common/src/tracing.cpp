#include <restful/common/tracing.hpp>

#include <chrono>
#include <cstdio>
#include <random>

namespace restful::common::tracing {

namespace {

std::mt19937_64& get_rng() {
    static thread_local std::mt19937_64 rng(
        std::random_device{}() ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()) ^
        platform::get_thread_id());
    return rng;
}

}  // anonymous namespace

std::string generate_request_id() {
    auto& rng   = get_rng();
    uint64_t hi = rng();
    uint64_t lo = rng();

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

TraceContext TraceContext::from_incoming_headers(const HeaderMap& incoming) {
    TraceContext ctx;

    std::string_view names = header_value(incoming, FORWARDED_NAMES_HEADER);
    while (!names.empty()) {
        auto comma            = names.find(',');
        std::string_view name = trim(names.substr(0, comma));
        names = comma == std::string_view::npos ? std::string_view{} : names.substr(comma + 1);

        if (name.empty()) {
            continue;
        }
        auto value = header_value(incoming, name);
        if (!value.empty()) {
            ctx.headers_[std::string(name)] = std::string(value);
        }
    }

    if (header_value(ctx.headers_, REQUEST_ID_HEADER).empty()) {
        ctx.headers_[std::string(REQUEST_ID_HEADER)] = generate_request_id();
    }
    return ctx;
}

TraceContext TraceContext::new_flow_starter() {
    TraceContext ctx;
    ctx.headers_[std::string(REQUEST_ID_HEADER)]   = generate_request_id();
    ctx.headers_[std::string(FLOW_STARTER_HEADER)] = "true";
    return ctx;
}

}  // namespace restful::common::tracing
