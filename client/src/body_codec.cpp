/**
 * @file body_codec.cpp
 * @brief JSON (jsoncpp) and XML (tinyxml2) request body encoders
 */

#include "restful/client/body_codec.hpp"

#include <memory>

#ifdef RESTFUL_HAS_TINYXML2
#include <tinyxml2.h>
#endif

namespace restful::client {

using common::ErrorCode;
using common::Result;

namespace {

std::vector<uint8_t> to_bytes(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

#ifdef RESTFUL_HAS_TINYXML2

std::string scalar_text(const Json::Value& value) {
    if (value.isNull()) {
        return {};
    }
    if (value.isBool()) {
        return value.asBool() ? "true" : "false";
    }
    return value.asString();
}

Result<void> write_element(tinyxml2::XMLDocument& doc, tinyxml2::XMLNode* parent,
                           const std::string& name, const Json::Value& value) {
    if (value.isArray()) {
        for (const auto& item : value) {
            if (item.isArray()) {
                return common::err(ErrorCode::ENCODING_ERROR,
                                   "xml: nested arrays under '" + name + "'");
            }
            RESTFUL_TRY(write_element(doc, parent, name, item));
        }
        return common::ok();
    }

    tinyxml2::XMLElement* element = doc.NewElement(name.c_str());
    parent->InsertEndChild(element);

    if (!value.isObject()) {
        std::string text = scalar_text(value);
        if (!text.empty()) {
            element->SetText(text.c_str());
        }
        return common::ok();
    }

    for (const auto& key : value.getMemberNames()) {
        const Json::Value& child = value[key];
        if (!key.empty() && key[0] == '@') {
            if (child.isObject() || child.isArray()) {
                return common::err(ErrorCode::ENCODING_ERROR,
                                   "xml: attribute '" + key + "' must be a scalar");
            }
            element->SetAttribute(key.c_str() + 1, scalar_text(child).c_str());
        } else if (key == "#text") {
            element->SetText(scalar_text(child).c_str());
        } else {
            RESTFUL_TRY(write_element(doc, element, key, child));
        }
    }
    return common::ok();
}

#endif  // RESTFUL_HAS_TINYXML2

}  // anonymous namespace

Result<std::string> encode_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"]    = true;
    return Json::writeString(builder, value);
}

Result<std::string> encode_xml(const Json::Value& value) {
#ifdef RESTFUL_HAS_TINYXML2
    if (!value.isObject() || value.size() != 1) {
        return common::err<std::string>(ErrorCode::ENCODING_ERROR,
                                        "xml: body must be an object with exactly one root member");
    }

    const std::string root = value.getMemberNames().front();
    if (root.empty() || root[0] == '@' || value[root].isArray()) {
        return common::err<std::string>(ErrorCode::ENCODING_ERROR,
                                        "xml: invalid root element '" + root + "'");
    }

    tinyxml2::XMLDocument doc;
    auto written = write_element(doc, &doc, root, value[root]);
    if (written.is_error()) {
        return common::err<std::string>(written.error());
    }

    tinyxml2::XMLPrinter printer(nullptr, true);
    doc.Print(&printer);
    return std::string(printer.CStr());
#else
    (void)value;
    return common::err<std::string>(ErrorCode::FORMAT_UNSUPPORTED,
                                    "xml: built without tinyxml2");
#endif
}

Result<std::vector<uint8_t>> encode_body(ContentType type, const RequestBody& body) {
    if (std::holds_alternative<std::monostate>(body)) {
        return std::vector<uint8_t>{};
    }
    if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&body)) {
        return *bytes;
    }

    try {
        switch (type) {
            case ContentType::JSON: {
                if (const auto* text = std::get_if<std::string>(&body)) {
                    auto encoded = encode_json(Json::Value(*text));
                    return encoded.map(to_bytes);
                }
                return encode_json(std::get<Json::Value>(body)).map(to_bytes);
            }

            case ContentType::XML: {
                if (const auto* text = std::get_if<std::string>(&body)) {
                    return to_bytes(*text);
                }
                return encode_xml(std::get<Json::Value>(body)).map(to_bytes);
            }

            case ContentType::BYTES:
                return common::err<std::vector<uint8_t>>(
                    ErrorCode::ENCODING_ERROR,
                    std::holds_alternative<std::string>(body)
                        ? "bytes: body is a string, not a byte vector"
                        : "bytes: body is a JSON value, not a byte vector");
        }
    } catch (const Json::Exception& e) {
        return common::err<std::vector<uint8_t>>(ErrorCode::ENCODING_ERROR, e.what());
    }

    return common::err<std::vector<uint8_t>>(ErrorCode::INVALID_ARGUMENT, "unknown content type");
}

Result<Json::Value> decode_json(std::string_view text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return common::err<Json::Value>(ErrorCode::DESERIALIZE_FAILED, "json: " + errors);
    }
    return root;
}

}  // namespace restful::client
