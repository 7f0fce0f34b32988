/**
 * @file cache_headers.cpp
 * @brief Cache-Control / Expires / ETag / Last-Modified parsing
 */

#include "restful/client/cache_headers.hpp"

#include <restful/transport/http/http_utils.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <regex>

namespace restful::client {

namespace {

const std::regex& max_age_pattern() {
    static const std::regex pattern(R"((?:max-age|s-maxage)=(\d+))");
    return pattern;
}

// Keeps now + TTL inside the clock's range
constexpr int64_t MAX_TTL_SECONDS = int64_t{100} * 365 * 24 * 3600;

}  // anonymous namespace

CacheMetadata parse_cache_metadata(const Headers& headers, Response::TimePoint now) {
    CacheMetadata metadata;

    std::string cache_control(common::header_value(headers, "Cache-Control"));
    std::smatch match;
    if (std::regex_search(cache_control, match, max_age_pattern())) {
        const std::string digits = match[1].str();
        int64_t seconds          = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), seconds);
        if (ec == std::errc{} && ptr == digits.data() + digits.size() && seconds > 0) {
            metadata.ttl = now + std::chrono::seconds(std::min(seconds, MAX_TTL_SECONDS));
        }
    } else if (auto expires = transport::http::parse_http_date(
                   common::header_value(headers, "Expires"));
               expires && *expires > now) {
        metadata.ttl = *expires;
    }

    metadata.last_modified =
        transport::http::parse_http_date(common::header_value(headers, "Last-Modified"));
    metadata.etag = std::string(common::header_value(headers, "ETag"));

    return metadata;
}

void apply_cache_metadata(Response& response, const CacheMetadata& metadata) {
    response.ttl           = metadata.ttl;
    response.last_modified = metadata.last_modified;
    response.etag          = metadata.etag;
    response.set_needs_revalidation(metadata.revalidate());
}

}  // namespace restful::client
