#pragma once

/**
 * @file config_event.hpp
 * @brief Attributes of the event reported when a pool is first used
 *
 * Reported once per pool name under metric_names::POOL_CONFIG_EVENT:
 *
 * | Attribute             | Source                                   |
 * |-----------------------|------------------------------------------|
 * | Application-Name      | $APPLICATION                             |
 * | Department-Name       | $DEPT                                    |
 * | Scope-Name            | $SCOPE                                   |
 * | Deploy-version        | $VERSION                                 |
 * | X-Rest-Pool-Name      | pool name                                |
 * | X-Socket-Timeout      | request timeout in milliseconds          |
 * | X-Retry-Strategy-Name | strategy name, when a strategy is set    |
 *
 * Strategies exposing parameters add them as `*-Param` attributes.
 */

#include "restful/client/retry_strategy.hpp"

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace restful::client {

constexpr std::string_view CUSTOM_RETRY_STRATEGY_NAME = "customRetryStrategy";

std::map<std::string, std::string> build_pool_config_event(std::string_view pool_name,
                                                           std::chrono::milliseconds socket_timeout,
                                                           const IRetryStrategy* strategy);

}  // namespace restful::client
