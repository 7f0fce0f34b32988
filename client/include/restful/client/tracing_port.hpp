#pragma once

/**
 * @file tracing_port.hpp
 * @brief Source of headers forwarded on every outbound request
 */

#include <restful/common/headers.hpp>
#include <restful/common/tracing.hpp>

namespace restful::client {

class ITracingPort {
public:
    virtual ~ITracingPort() = default;

    virtual common::HeaderMap forwarded_headers(const common::tracing::TraceContext& context) const = 0;
};

/**
 * @brief Forwards the trace context headers unchanged
 */
class ContextTracingPort : public ITracingPort {
public:
    common::HeaderMap forwarded_headers(
        const common::tracing::TraceContext& context) const override {
        return context.forwarded_headers();
    }
};

}  // namespace restful::client
