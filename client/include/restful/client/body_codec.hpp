#pragma once

/**
 * @file body_codec.hpp
 * @brief Request body marshalling per content type
 *
 * | Content type | Json::Value        | std::string          | bytes           |
 * |--------------|--------------------|----------------------|-----------------|
 * | JSON         | compact JSON       | JSON string literal  | sent as is      |
 * | XML          | XML document       | sent as is           | sent as is      |
 * | BYTES        | ENCODING_ERROR     | ENCODING_ERROR       | sent as is      |
 *
 * An XML document is written from a Json::Value object with exactly one
 * member, whose name becomes the root element. Nested objects become child
 * elements, arrays become repeated elements, keys starting with '@' become
 * attributes and a "#text" key becomes the element text.
 */

#include <restful/common/error.hpp>

#include <json/json.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace restful::client {

enum class ContentType : uint8_t { JSON, XML, BYTES };

constexpr std::string_view content_type_name(ContentType type) noexcept {
    switch (type) {
        case ContentType::JSON:
            return "json";
        case ContentType::XML:
            return "xml";
        case ContentType::BYTES:
            return "bytes";
        default:
            return "unknown";
    }
}

/**
 * @brief MIME type for Accept / Content-Type, empty for raw bytes
 */
constexpr std::string_view mime_type(ContentType type) noexcept {
    switch (type) {
        case ContentType::JSON:
            return "application/json";
        case ContentType::XML:
            return "application/xml";
        default:
            return {};
    }
}

using RequestBody = std::variant<std::monostate, std::vector<uint8_t>, std::string, Json::Value>;

/**
 * @brief Serialize a request body
 *
 * std::monostate yields an empty payload for every content type.
 */
common::Result<std::vector<uint8_t>> encode_body(ContentType type, const RequestBody& body);

common::Result<std::string> encode_json(const Json::Value& value);

/**
 * @brief Write a single-rooted Json::Value object as XML
 * @return FORMAT_UNSUPPORTED when built without tinyxml2
 */
common::Result<std::string> encode_xml(const Json::Value& value);

common::Result<Json::Value> decode_json(std::string_view text);

}  // namespace restful::client
