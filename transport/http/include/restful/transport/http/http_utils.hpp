#pragma once

/**
 * @file http_utils.hpp
 * @brief HTTP date, URL and credential helpers
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace restful::transport::http {

//=============================================================================
// HTTP Dates
//=============================================================================

/**
 * @brief Format as IMF-fixdate, e.g. "Mon, 02 Jan 2006 15:04:05 GMT"
 */
std::string format_http_date(std::chrono::system_clock::time_point time);

/**
 * @brief Parse an IMF-fixdate value
 * @return nullopt for any other layout or an out-of-range field
 */
std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value);

//=============================================================================
// Credentials
//=============================================================================

/**
 * @brief Standard (RFC 4648) base64 with padding
 */
std::string base64_encode(std::string_view input);

/**
 * @brief Value for an `Authorization` header using the Basic scheme
 */
std::string basic_auth_value(std::string_view username, std::string_view password);

//=============================================================================
// URLs
//=============================================================================

/**
 * @brief Parse URL into components
 */
struct URLComponents {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string path;
    std::string query;
};

std::optional<URLComponents> parse_url(std::string_view url);

}  // namespace restful::transport::http
