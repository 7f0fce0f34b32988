/**
 * @file test_gzip.cpp
 * @brief Unit tests for gzip body decoding
 */

#include <restful/transport/http/gzip.hpp>

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace restful::transport::http;
using restful::common::ErrorCode;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

TEST(GzipTest, EncodingNames) {
    EXPECT_TRUE(is_gzip_encoding("gzip"));
    EXPECT_TRUE(is_gzip_encoding("application/x-gzip"));
    EXPECT_FALSE(is_gzip_encoding("deflate"));
    EXPECT_FALSE(is_gzip_encoding("application/json"));
    EXPECT_FALSE(is_gzip_encoding(""));
}

TEST(GzipTest, DecompressesCompressedBody) {
    std::string text(10000, 'x');
    text += "tail";

    auto compressed = gzip_compress(bytes(text));
    ASSERT_TRUE(compressed.is_success());
    EXPECT_LT(compressed.value().size(), text.size());
    // gzip magic
    ASSERT_GE(compressed.value().size(), 2u);
    EXPECT_EQ(compressed.value()[0], 0x1f);
    EXPECT_EQ(compressed.value()[1], 0x8b);

    auto inflated = gzip_decompress(compressed.value());
    ASSERT_TRUE(inflated.is_success());
    EXPECT_EQ(inflated.value(), bytes(text));
}

TEST(GzipTest, EmptyInput) {
    auto inflated = gzip_decompress(std::vector<uint8_t>{});
    ASSERT_TRUE(inflated.is_success());
    EXPECT_TRUE(inflated.value().empty());
}

TEST(GzipTest, CorruptInputIsDecodingError) {
    auto inflated = gzip_decompress(bytes("definitely not gzip"));
    ASSERT_TRUE(inflated.is_error());
    EXPECT_EQ(inflated.code(), ErrorCode::DECODING_ERROR);
}

TEST(GzipTest, TruncatedInputIsDecodingError) {
    auto compressed = gzip_compress(bytes(std::string(4096, 'a')));
    ASSERT_TRUE(compressed.is_success());

    auto truncated = compressed.value();
    truncated.resize(truncated.size() / 2);

    auto inflated = gzip_decompress(truncated);
    ASSERT_TRUE(inflated.is_error());
    EXPECT_EQ(inflated.code(), ErrorCode::DECODING_ERROR);
}

TEST(GzipTest, ConcatenatedMembersDecodeAsOneBody) {
    auto head = gzip_compress(bytes("first member, "));
    auto tail = gzip_compress(bytes("second member"));
    ASSERT_TRUE(head.is_success());
    ASSERT_TRUE(tail.is_success());

    auto joined = head.value();
    joined.insert(joined.end(), tail.value().begin(), tail.value().end());

    auto inflated = gzip_decompress(joined);
    ASSERT_TRUE(inflated.is_success());
    EXPECT_EQ(inflated.value(), bytes("first member, second member"));
}

TEST(GzipTest, GarbageAfterMemberIsDecodingError) {
    auto compressed = gzip_compress(bytes("payload"));
    ASSERT_TRUE(compressed.is_success());

    auto padded = compressed.value();
    auto garbage = bytes("garbage");
    padded.insert(padded.end(), garbage.begin(), garbage.end());

    auto inflated = gzip_decompress(padded);
    ASSERT_TRUE(inflated.is_error());
    EXPECT_EQ(inflated.code(), ErrorCode::DECODING_ERROR);
}
