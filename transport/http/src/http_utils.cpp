/**
 * @file http_utils.cpp
 * @brief HTTP date, URL and credential helpers
 */

#include "restful/transport/http/http_utils.hpp"

#include <array>
#include <charconv>
#include <cstdio>

namespace restful::transport::http {

namespace {

constexpr std::array<const char*, 7> WEEKDAYS = {"Sun", "Mon", "Tue", "Wed",
                                                 "Thu", "Fri", "Sat"};

constexpr std::array<const char*, 12> MONTHS = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

constexpr const char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool parse_digits(std::string_view text, int& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

}  // anonymous namespace

//=============================================================================
// HTTP Dates
//=============================================================================

std::string format_http_date(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;

    auto secs = time_point_cast<seconds>(time);
    auto midnight = floor<days>(secs);
    year_month_day ymd{midnight};
    hh_mm_ss<seconds> tod{secs - midnight};
    weekday wd{midnight};

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s, %02u %s %04d %02d:%02d:%02d GMT",
                  WEEKDAYS[wd.c_encoding()], static_cast<unsigned>(ymd.day()),
                  MONTHS[static_cast<unsigned>(ymd.month()) - 1], static_cast<int>(ymd.year()),
                  static_cast<int>(tod.hours().count()), static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));
    return buffer;
}

std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value) {
    using namespace std::chrono;

    // "Mon, 02 Jan 2006 15:04:05 GMT"
    if (value.size() != 29 || value[3] != ',' || value[4] != ' ' || value[7] != ' ' ||
        value[11] != ' ' || value[16] != ' ' || value[19] != ':' || value[22] != ':' ||
        value.substr(25) != " GMT") {
        return std::nullopt;
    }

    bool weekday_known = false;
    for (const char* name : WEEKDAYS) {
        weekday_known = weekday_known || value.substr(0, 3) == name;
    }
    if (!weekday_known) {
        return std::nullopt;
    }

    unsigned month_index = 0;
    while (month_index < MONTHS.size() && value.substr(8, 3) != MONTHS[month_index]) {
        ++month_index;
    }
    if (month_index == MONTHS.size()) {
        return std::nullopt;
    }

    int day_num = 0, year_num = 0, hour = 0, minute = 0, second = 0;
    if (!parse_digits(value.substr(5, 2), day_num) || !parse_digits(value.substr(12, 4), year_num) ||
        !parse_digits(value.substr(17, 2), hour) || !parse_digits(value.substr(20, 2), minute) ||
        !parse_digits(value.substr(23, 2), second)) {
        return std::nullopt;
    }

    year_month_day ymd{year{year_num}, month{month_index + 1}, day{static_cast<unsigned>(day_num)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    return system_clock::time_point{sys_days{ymd} + hours{hour} + minutes{minute} +
                                    seconds{second}};
}

//=============================================================================
// Credentials
//=============================================================================

std::string base64_encode(std::string_view input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    size_t i                 = 0;
    const size_t full_chunks = (input.size() / 3) * 3;

    // Process 3 bytes at a time
    for (; i < full_chunks; i += 3) {
        uint32_t triple = (static_cast<uint32_t>(static_cast<uint8_t>(input[i])) << 16) |
                          (static_cast<uint32_t>(static_cast<uint8_t>(input[i + 1])) << 8) |
                          static_cast<uint32_t>(static_cast<uint8_t>(input[i + 2]));

        output.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        output.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);
        output.push_back(BASE64_ALPHABET[(triple >> 6) & 0x3F]);
        output.push_back(BASE64_ALPHABET[triple & 0x3F]);
    }

    // Handle remaining bytes
    if (i < input.size()) {
        uint32_t triple = static_cast<uint32_t>(static_cast<uint8_t>(input[i])) << 16;
        if (i + 1 < input.size()) {
            triple |= static_cast<uint32_t>(static_cast<uint8_t>(input[i + 1])) << 8;
        }

        output.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        output.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);

        if (i + 1 < input.size()) {
            output.push_back(BASE64_ALPHABET[(triple >> 6) & 0x3F]);
            output.push_back('=');
        } else {
            output.append("==");
        }
    }

    return output;
}

std::string basic_auth_value(std::string_view username, std::string_view password) {
    std::string credentials;
    credentials.reserve(username.size() + password.size() + 1);
    credentials.append(username);
    credentials.push_back(':');
    credentials.append(password);
    return "Basic " + base64_encode(credentials);
}

//=============================================================================
// URLs
//=============================================================================

std::optional<URLComponents> parse_url(std::string_view url) {
    URLComponents components;

    // Find scheme
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    components.scheme = std::string(url.substr(0, scheme_end));

    // Find host and port
    auto host_start = scheme_end + 3;
    auto path_start = url.find_first_of("/?", host_start);
    auto host_end   = (path_start != std::string_view::npos) ? path_start : url.size();

    std::string_view host_port = url.substr(host_start, host_end - host_start);
    if (host_port.empty()) {
        return std::nullopt;
    }

    auto colon = host_port.rfind(':');
    if (colon != std::string_view::npos && host_port.front() != '[') {
        // Not IPv6, has port
        int port = 0;
        if (!parse_digits(host_port.substr(colon + 1), port) || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        components.host = std::string(host_port.substr(0, colon));
        components.port = static_cast<uint16_t>(port);
    } else {
        components.host = std::string(host_port);
        // Default ports
        if (components.scheme == "http") {
            components.port = 80;
        } else if (components.scheme == "https") {
            components.port = 443;
        }
    }

    // Find path and query
    if (path_start != std::string_view::npos) {
        auto query_start = url.find('?', path_start);
        if (query_start != std::string_view::npos) {
            components.path  = std::string(url.substr(path_start, query_start - path_start));
            components.query = std::string(url.substr(query_start + 1));
        } else {
            components.path = std::string(url.substr(path_start));
        }
    }
    if (components.path.empty()) {
        components.path = "/";
    }

    return components;
}

}  // namespace restful::transport::http
