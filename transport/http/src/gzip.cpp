/**
 * @file gzip.cpp
 * @brief zlib-backed gzip helpers
 */

#include "restful/transport/http/gzip.hpp"

#include <zlib.h>

namespace restful::transport::http {

using common::ErrorCode;
using common::Result;

namespace {

constexpr size_t CHUNK_SIZE = 16 * 1024;

// windowBits + 16 selects the gzip wrapper
constexpr int GZIP_WINDOW_BITS = 15 + 16;

}  // anonymous namespace

Result<std::vector<uint8_t>> gzip_decompress(std::span<const uint8_t> input) {
    if (input.empty()) {
        return std::vector<uint8_t>{};
    }

    z_stream stream{};
    stream.next_in  = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());

    int ret = inflateInit2(&stream, GZIP_WINDOW_BITS);
    if (ret != Z_OK) {
        return common::err<std::vector<uint8_t>>(ErrorCode::DECODING_ERROR,
                                                 "gzip: inflateInit2 failed");
    }

    std::vector<uint8_t> output;
    output.reserve(input.size() * 4);

    while (true) {
        size_t offset = output.size();
        output.resize(offset + CHUNK_SIZE);
        stream.next_out  = output.data() + offset;
        stream.avail_out = static_cast<uInt>(CHUNK_SIZE);

        ret = inflate(&stream, Z_NO_FLUSH);
        output.resize(offset + (CHUNK_SIZE - stream.avail_out));

        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
            std::string message = "gzip: ";
            message += stream.msg ? stream.msg : "invalid stream";
            inflateEnd(&stream);
            return common::err<std::vector<uint8_t>>(ErrorCode::DECODING_ERROR, message);
        }
        // No progress possible with input exhausted: truncated stream
        if (ret == Z_BUF_ERROR || (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0)) {
            inflateEnd(&stream);
            return common::err<std::vector<uint8_t>>(ErrorCode::DECODING_ERROR,
                                                     "gzip: unexpected end of stream");
        }
        if (ret == Z_STREAM_END) {
            if (stream.avail_in == 0) {
                break;
            }
            // Concatenated members decode as one body
            inflateReset(&stream);
        }
    }

    inflateEnd(&stream);
    return output;
}

Result<std::vector<uint8_t>> gzip_compress(std::span<const uint8_t> input, int level) {
    uLong max_compressed_size = compressBound(static_cast<uLong>(input.size())) + 32;
    std::vector<uint8_t> compressed(max_compressed_size);

    z_stream stream{};
    stream.next_in   = const_cast<Bytef*>(input.data());
    stream.avail_in  = static_cast<uInt>(input.size());
    stream.next_out  = compressed.data();
    stream.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflateInit2(&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return common::err<std::vector<uint8_t>>(ErrorCode::ENCODING_ERROR,
                                                 "gzip: deflateInit2 failed");
    }

    ret = deflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        deflateEnd(&stream);
        return common::err<std::vector<uint8_t>>(ErrorCode::ENCODING_ERROR,
                                                 "gzip: deflate did not finish");
    }

    compressed.resize(stream.total_out);
    deflateEnd(&stream);
    return compressed;
}

}  // namespace restful::transport::http
