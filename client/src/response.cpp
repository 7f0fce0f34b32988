/**
 * @file response.cpp
 * @brief Response copy semantics and body helpers
 */

#include "restful/client/response.hpp"

#include "restful/client/body_codec.hpp"

namespace restful::client {

Response::Response(const Response& other)
    : status_code(other.status_code),
      status_message(other.status_message),
      headers(other.headers),
      body(other.body),
      error(other.error),
      ttl(other.ttl),
      last_modified(other.last_modified),
      etag(other.etag),
      revalidate_(other.needs_revalidation()),
      cache_hit_(other.from_cache()) {}

Response& Response::operator=(const Response& other) {
    if (this != &other) {
        status_code    = other.status_code;
        status_message = other.status_message;
        headers        = other.headers;
        body           = other.body;
        error          = other.error;
        ttl            = other.ttl;
        last_modified  = other.last_modified;
        etag           = other.etag;
        revalidate_.store(other.needs_revalidation(), std::memory_order_relaxed);
        cache_hit_.store(other.from_cache(), std::memory_order_relaxed);
    }
    return *this;
}

Response Response::failure(common::Error error, int status_code) {
    Response response;
    response.status_code = status_code;
    response.error       = std::move(error);
    return response;
}

common::Result<Json::Value> Response::json() const {
    if (error) {
        return common::err<Json::Value>(*error);
    }
    return decode_json(body_string());
}

}  // namespace restful::client
