#pragma once

/**
 * @file tracing.hpp
 * @brief Request-scoped trace context propagated on outgoing calls
 *
 * A TraceContext is the bag of headers a service must forward on every
 * outbound request made on behalf of one inbound request:
 * - `x-request-id`, generated as a UUIDv4 when the caller did not send one
 * - every header named in the inbound `x-forwarded-header-names` list
 * - `x-flow-starter: true` when the service itself starts the flow
 */

#include <restful/common/headers.hpp>
#include <restful/common/platform.hpp>

#include <string>
#include <string_view>

namespace restful::common::tracing {

constexpr std::string_view REQUEST_ID_HEADER      = "x-request-id";
constexpr std::string_view FLOW_STARTER_HEADER    = "x-flow-starter";
constexpr std::string_view FORWARDED_NAMES_HEADER = "x-forwarded-header-names";

/**
 * @brief Generate a random RFC 4122 version 4 UUID in canonical form
 */
RESTFUL_API std::string generate_request_id();

class TraceContext {
public:
    TraceContext() = default;

    /**
     * @brief Build the context for an inbound request
     */
    static TraceContext from_incoming_headers(const HeaderMap& incoming);

    /**
     * @brief Build a context for a flow this service originates
     */
    static TraceContext new_flow_starter();

    const HeaderMap& forwarded_headers() const noexcept { return headers_; }

    std::string request_id() const { return std::string(header_value(headers_, REQUEST_ID_HEADER)); }

    bool is_flow_starter() const { return header_value(headers_, FLOW_STARTER_HEADER) == "true"; }

    bool empty() const noexcept { return headers_.empty(); }

    TraceContext& set(std::string name, std::string value) {
        headers_[std::move(name)] = std::move(value);
        return *this;
    }

private:
    HeaderMap headers_;
};

}  // namespace restful::common::tracing
