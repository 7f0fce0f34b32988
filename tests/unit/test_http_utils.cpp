/**
 * @file test_http_utils.cpp
 * @brief Unit tests for HTTP date, credential and URL helpers
 */

#include <restful/transport/http/http_utils.hpp>

#include <chrono>

#include <gtest/gtest.h>

using namespace restful::transport::http;
using namespace std::chrono;

// ============================================================================
// HTTP dates
// ============================================================================

TEST(HttpDateTest, FormatsImfFixdate) {
    auto time = sys_days{year{2006} / January / 2} + hours{15} + minutes{4} + seconds{5};
    EXPECT_EQ(format_http_date(time), "Mon, 02 Jan 2006 15:04:05 GMT");
}

TEST(HttpDateTest, ParsesImfFixdate) {
    auto parsed = parse_http_date("Sun, 06 Nov 1994 08:49:37 GMT");
    ASSERT_TRUE(parsed.has_value());

    auto expected = sys_days{year{1994} / November / 6} + hours{8} + minutes{49} + seconds{37};
    EXPECT_EQ(*parsed, expected);
}

TEST(HttpDateTest, FormatParseAgree) {
    auto time = time_point_cast<seconds>(system_clock::now());
    auto parsed = parse_http_date(format_http_date(time));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, time);
}

TEST(HttpDateTest, RejectsOtherFormats) {
    EXPECT_FALSE(parse_http_date("").has_value());
    EXPECT_FALSE(parse_http_date("Sunday, 06-Nov-94 08:49:37 GMT").has_value());
    EXPECT_FALSE(parse_http_date("Sun Nov  6 08:49:37 1994").has_value());
    EXPECT_FALSE(parse_http_date("Sun, 06 Nov 1994 08:49:37 UTC").has_value());
    EXPECT_FALSE(parse_http_date("Xyz, 06 Nov 1994 08:49:37 GMT").has_value());
    EXPECT_FALSE(parse_http_date("Sun, 06 Foo 1994 08:49:37 GMT").has_value());
    EXPECT_FALSE(parse_http_date("Sun, 31 Feb 1994 08:49:37 GMT").has_value());
    EXPECT_FALSE(parse_http_date("Sun, 06 Nov 1994 25:49:37 GMT").has_value());
}

// ============================================================================
// Credentials
// ============================================================================

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, BasicAuthValue) {
    EXPECT_EQ(basic_auth_value("user", "pass"), "Basic dXNlcjpwYXNz");
    EXPECT_EQ(basic_auth_value("Aladdin", "open sesame"), "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
}

// ============================================================================
// URLs
// ============================================================================

TEST(ParseUrlTest, FullUrl) {
    auto url = parse_url("https://api.example.com:8443/v1/items?limit=10");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "api.example.com");
    EXPECT_EQ(url->port, 8443);
    EXPECT_EQ(url->path, "/v1/items");
    EXPECT_EQ(url->query, "limit=10");
}

TEST(ParseUrlTest, DefaultPortsAndPath) {
    auto http_url = parse_url("http://example.com");
    ASSERT_TRUE(http_url.has_value());
    EXPECT_EQ(http_url->port, 80);
    EXPECT_EQ(http_url->path, "/");

    auto https_url = parse_url("https://example.com?x=1");
    ASSERT_TRUE(https_url.has_value());
    EXPECT_EQ(https_url->port, 443);
    EXPECT_EQ(https_url->path, "/");
    EXPECT_EQ(https_url->query, "x=1");
}

TEST(ParseUrlTest, ProxyUrl) {
    auto url = parse_url("http://proxy.internal:3128");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "proxy.internal");
    EXPECT_EQ(url->port, 3128);
}

TEST(ParseUrlTest, Invalid) {
    EXPECT_FALSE(parse_url("").has_value());
    EXPECT_FALSE(parse_url("example.com/path").has_value());
    EXPECT_FALSE(parse_url("://example.com").has_value());
    EXPECT_FALSE(parse_url("http://").has_value());
    EXPECT_FALSE(parse_url("http://example.com:0/").has_value());
    EXPECT_FALSE(parse_url("http://example.com:70000/").has_value());
    EXPECT_FALSE(parse_url("http://example.com:abc/").has_value());
}
