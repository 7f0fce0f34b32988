/**
 * @file test_tracing.cpp
 * @brief Unit tests for trace context construction and the tracing port
 */

#include <restful/client/tracing_port.hpp>
#include <restful/common/tracing.hpp>

#include <regex>
#include <set>
#include <string>

#include <gtest/gtest.h>

using namespace restful::common;
using namespace restful::common::tracing;

class TraceContextTest : public ::testing::Test {};

TEST_F(TraceContextTest, GeneratedIdIsUuidV4) {
    static const std::regex UUID_V4(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_request_id();
        EXPECT_TRUE(std::regex_match(id, UUID_V4)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST_F(TraceContextTest, CopiesListedHeaders) {
    HeaderMap incoming{{"X-Request-Id", "abc-123"},
                       {"X-Forwarded-Header-Names", "x-tenant, X-Client-Id"},
                       {"X-Tenant", "acme"},
                       {"X-Client-Id", "mobile"},
                       {"X-Not-Listed", "secret"}};

    auto ctx = TraceContext::from_incoming_headers(incoming);
    const auto& headers = ctx.forwarded_headers();

    EXPECT_EQ(header_value(headers, "x-tenant"), "acme");
    EXPECT_EQ(header_value(headers, "x-client-id"), "mobile");
    EXPECT_TRUE(header_value(headers, "x-not-listed").empty());
    EXPECT_FALSE(ctx.is_flow_starter());
}

TEST_F(TraceContextTest, ListedRequestIdIsKept) {
    HeaderMap incoming{{"x-request-id", "abc-123"},
                       {"x-forwarded-header-names", "x-request-id"}};

    auto ctx = TraceContext::from_incoming_headers(incoming);
    EXPECT_EQ(ctx.request_id(), "abc-123");
}

TEST_F(TraceContextTest, MissingRequestIdIsGenerated) {
    auto ctx = TraceContext::from_incoming_headers({});
    EXPECT_EQ(ctx.request_id().size(), 36u);
    EXPECT_EQ(ctx.forwarded_headers().size(), 1u);
}

TEST_F(TraceContextTest, FlowStarter) {
    auto ctx = TraceContext::new_flow_starter();
    EXPECT_TRUE(ctx.is_flow_starter());
    EXPECT_FALSE(ctx.request_id().empty());
}

TEST_F(TraceContextTest, ContextPortForwardsHeadersUnchanged) {
    TraceContext ctx;
    ctx.set("x-request-id", "r1").set("x-tenant", "acme");

    restful::client::ContextTracingPort port;
    auto forwarded = port.forwarded_headers(ctx);
    EXPECT_EQ(forwarded.size(), 2u);
    EXPECT_EQ(header_value(forwarded, "X-Tenant"), "acme");
}
