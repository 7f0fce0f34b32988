#pragma once

/**
 * @file gzip.hpp
 * @brief gzip (RFC 1952) payload compression via zlib
 */

#include <restful/common/error.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace restful::transport::http {

/**
 * @brief Content-Encoding / Content-Type values announcing a gzip body
 */
constexpr bool is_gzip_encoding(std::string_view encoding) noexcept {
    return encoding == "gzip" || encoding == "application/x-gzip";
}

/**
 * @brief Inflate a complete gzip stream
 * @return DECODING_ERROR on a corrupt or truncated stream
 */
common::Result<std::vector<uint8_t>> gzip_decompress(std::span<const uint8_t> input);

/**
 * @brief Deflate into a single gzip member
 */
common::Result<std::vector<uint8_t>> gzip_compress(std::span<const uint8_t> input, int level = 6);

}  // namespace restful::transport::http
