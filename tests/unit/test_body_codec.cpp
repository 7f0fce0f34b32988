/**
 * @file test_body_codec.cpp
 * @brief Unit tests for request body encoding and response decoding
 */

#include <restful/client/body_codec.hpp>
#include <restful/client/response.hpp>

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace restful::client;
using restful::common::ErrorCode;

namespace {

std::string text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace

// ============================================================================
// Content types
// ============================================================================

TEST(ContentTypeTest, Names) {
    EXPECT_EQ(content_type_name(ContentType::JSON), "json");
    EXPECT_EQ(content_type_name(ContentType::XML), "xml");
    EXPECT_EQ(content_type_name(ContentType::BYTES), "bytes");

    EXPECT_EQ(mime_type(ContentType::JSON), "application/json");
    EXPECT_EQ(mime_type(ContentType::XML), "application/xml");
    EXPECT_TRUE(mime_type(ContentType::BYTES).empty());
}

// ============================================================================
// Encoding
// ============================================================================

TEST(BodyCodecTest, EmptyBodyForEveryType) {
    for (auto type : {ContentType::JSON, ContentType::XML, ContentType::BYTES}) {
        auto encoded = encode_body(type, RequestBody{});
        ASSERT_TRUE(encoded.is_success());
        EXPECT_TRUE(encoded.value().empty());
    }
}

TEST(BodyCodecTest, RawBytesPassThrough) {
    std::vector<uint8_t> raw{0x00, 0xff, 0x10};
    for (auto type : {ContentType::JSON, ContentType::XML, ContentType::BYTES}) {
        auto encoded = encode_body(type, raw);
        ASSERT_TRUE(encoded.is_success());
        EXPECT_EQ(encoded.value(), raw);
    }
}

TEST(BodyCodecTest, JsonValueIsCompact) {
    Json::Value body;
    body["name"]  = "widget";
    body["count"] = 3;

    auto encoded = encode_body(ContentType::JSON, body);
    ASSERT_TRUE(encoded.is_success());
    EXPECT_EQ(text(encoded.value()), R"({"count":3,"name":"widget"})");
}

TEST(BodyCodecTest, JsonStringIsQuoted) {
    auto encoded = encode_body(ContentType::JSON, std::string("hello"));
    ASSERT_TRUE(encoded.is_success());
    EXPECT_EQ(text(encoded.value()), "\"hello\"");
}

TEST(BodyCodecTest, BytesRejectsStructuredBodies) {
    auto from_string = encode_body(ContentType::BYTES, std::string("hello"));
    ASSERT_TRUE(from_string.is_error());
    EXPECT_EQ(from_string.code(), ErrorCode::ENCODING_ERROR);

    auto from_json = encode_body(ContentType::BYTES, Json::Value(1));
    ASSERT_TRUE(from_json.is_error());
    EXPECT_EQ(from_json.code(), ErrorCode::ENCODING_ERROR);
}

TEST(BodyCodecTest, XmlStringIsSentVerbatim) {
    auto encoded = encode_body(ContentType::XML, std::string("<item id=\"1\"/>"));
    ASSERT_TRUE(encoded.is_success());
    EXPECT_EQ(text(encoded.value()), "<item id=\"1\"/>");
}

#ifdef RESTFUL_HAS_TINYXML2

TEST(BodyCodecTest, XmlFromJson) {
    Json::Value body;
    body["item"]["@id"]  = "7";
    body["item"]["name"] = "widget";
    body["item"]["tag"].append("a");
    body["item"]["tag"].append("b");

    auto encoded = encode_body(ContentType::XML, body);
    ASSERT_TRUE(encoded.is_success()) << encoded.message();
    EXPECT_EQ(text(encoded.value()),
              "<item id=\"7\"><name>widget</name><tag>a</tag><tag>b</tag></item>");
}

TEST(BodyCodecTest, XmlNeedsSingleRoot) {
    Json::Value body;
    body["a"] = 1;
    body["b"] = 2;

    auto encoded = encode_body(ContentType::XML, body);
    ASSERT_TRUE(encoded.is_error());
    EXPECT_EQ(encoded.code(), ErrorCode::ENCODING_ERROR);
}

#else

TEST(BodyCodecTest, XmlFromJsonUnsupported) {
    Json::Value body;
    body["item"]["name"] = "widget";

    auto encoded = encode_body(ContentType::XML, body);
    ASSERT_TRUE(encoded.is_error());
    EXPECT_EQ(encoded.code(), ErrorCode::FORMAT_UNSUPPORTED);
}

#endif

// ============================================================================
// Decoding
// ============================================================================

TEST(BodyCodecTest, DecodeJson) {
    auto decoded = decode_json(R"({"id": 42, "tags": ["a"]})");
    ASSERT_TRUE(decoded.is_success());
    EXPECT_EQ(decoded.value()["id"].asInt(), 42);
    EXPECT_EQ(decoded.value()["tags"][0].asString(), "a");
}

TEST(BodyCodecTest, DecodeInvalidJson) {
    auto decoded = decode_json("{not json");
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.code(), ErrorCode::DESERIALIZE_FAILED);
}

TEST(BodyCodecTest, ResponseJson) {
    Response response;
    response.status_code = 200;
    std::string body     = R"({"ok":true})";
    response.body.assign(body.begin(), body.end());

    auto json = response.json();
    ASSERT_TRUE(json.is_success());
    EXPECT_TRUE(json.value()["ok"].asBool());
}
