/**
 * @file config_event.cpp
 * @brief Pool configuration event attributes
 */

#include "restful/client/config_event.hpp"

#include <restful/common/platform.hpp>

namespace restful::client {

namespace {

std::string param_or_empty(const std::map<std::string, std::string>& params, const char* key) {
    auto it = params.find(key);
    return it == params.end() ? std::string() : it->second;
}

}  // namespace

std::map<std::string, std::string> build_pool_config_event(std::string_view pool_name,
                                                           std::chrono::milliseconds socket_timeout,
                                                           const IRetryStrategy* strategy) {
    std::map<std::string, std::string> attributes{
        {"Application-Name", common::platform::get_env("APPLICATION")},
        {"Department-Name", common::platform::get_env("DEPT")},
        {"Scope-Name", common::platform::get_env("SCOPE")},
        {"Deploy-version", common::platform::get_env("VERSION")},
        {"X-Rest-Pool-Name", std::string(pool_name)},
        {"X-Socket-Timeout", std::to_string(socket_timeout.count())},
    };

    if (!strategy) {
        return attributes;
    }

    const auto* exposed = dynamic_cast<const IExposesParameters*>(strategy);
    if (!exposed) {
        attributes["X-Retry-Strategy-Name"] = std::string(CUSTOM_RETRY_STRATEGY_NAME);
        return attributes;
    }

    auto name   = exposed->strategy_name();
    auto params = exposed->parameters();
    attributes["X-Retry-Strategy-Name"] = std::string(name);

    if (name == SimpleRetryStrategy::NAME) {
        attributes["Max-Retries-Param"] = param_or_empty(params, "max_retries");
        attributes["Retry-Delay-Param"] = param_or_empty(params, "delay");
    } else if (name == BackoffRetryStrategy::NAME) {
        attributes["Min-Wait-Time-Param"] = param_or_empty(params, "min_wait");
        attributes["Max-Wait-Time-Param"] = param_or_empty(params, "max_wait");
    } else {
        for (const auto& [key, value] : params) {
            attributes[key + "-Param"] = value;
        }
    }
    return attributes;
}

}  // namespace restful::client
