#pragma once

/**
 * @file version.hpp
 * @brief Library version
 */

#define RESTFUL_VERSION_MAJOR 1
#define RESTFUL_VERSION_MINOR 4
#define RESTFUL_VERSION_PATCH 0
#define RESTFUL_VERSION_STRING "1.4.0"

namespace restful::client {

constexpr const char* VERSION = RESTFUL_VERSION_STRING;

// User-Agent sent when a builder does not configure one
constexpr const char* DEFAULT_USER_AGENT = "restful-cpp/" RESTFUL_VERSION_STRING;

}  // namespace restful::client
