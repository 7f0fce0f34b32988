#pragma once

/**
 * @file platform.hpp
 * @brief Compiler and OS detection plus the runtime queries the client uses
 *
 * The client targets C++20 on POSIX systems; Windows support is limited to
 * what the environment and thread helpers need.
 */

#include <cstdint>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER
// ============================================================================

#if defined(__clang__)
    #define RESTFUL_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define RESTFUL_COMPILER_GCC 1
#elif defined(_MSC_VER)
    #define RESTFUL_COMPILER_MSVC 1
#endif

// ============================================================================
// OPERATING SYSTEM
// ============================================================================

#if defined(_WIN32)
    #define RESTFUL_OS_WINDOWS 1
#elif defined(__APPLE__) && defined(__MACH__)
    #define RESTFUL_OS_MACOS 1
    #define RESTFUL_OS_POSIX 1
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__unix__)
    #define RESTFUL_OS_POSIX 1
#endif

// ============================================================================
// LANGUAGE FEATURES
// ============================================================================

#if __cplusplus >= 202002L
    #define RESTFUL_CPP_VERSION 20
#elif __cplusplus >= 201703L
    #define RESTFUL_CPP_VERSION 17
#else
    #define RESTFUL_CPP_VERSION 0
#endif

#if defined(__cpp_lib_source_location) || (RESTFUL_CPP_VERSION >= 20 && !defined(RESTFUL_COMPILER_MSVC))
    #define RESTFUL_HAS_SOURCE_LOCATION 1
#endif

#if defined(RESTFUL_COMPILER_GCC) || defined(RESTFUL_COMPILER_CLANG)
    #define RESTFUL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define RESTFUL_UNLIKELY(x) (x)
#endif

// Symbol visibility when built as a shared library
#if defined(RESTFUL_OS_WINDOWS)
    #if defined(RESTFUL_BUILDING_SHARED)
        #define RESTFUL_API __declspec(dllexport)
    #elif defined(RESTFUL_USING_SHARED)
        #define RESTFUL_API __declspec(dllimport)
    #else
        #define RESTFUL_API
    #endif
#elif defined(RESTFUL_BUILDING_SHARED)
    #define RESTFUL_API __attribute__((visibility("default")))
#else
    #define RESTFUL_API
#endif

// Padding unit for counters hammered from many request threads
#if defined(__arm__) || defined(_M_ARM)
    #define RESTFUL_CACHE_LINE_SIZE 32
#else
    #define RESTFUL_CACHE_LINE_SIZE 64
#endif

namespace restful::common::platform {

/**
 * @brief Numeric id of the calling thread, stable for its lifetime
 */
RESTFUL_API uint64_t get_thread_id() noexcept;

/**
 * @brief Environment variable value, empty when unset
 */
RESTFUL_API std::string get_env(std::string_view name);

RESTFUL_API std::string get_env_or(std::string_view name, std::string_view fallback);

RESTFUL_API bool set_env(std::string_view name, std::string_view value);
RESTFUL_API bool unset_env(std::string_view name);

}  // namespace restful::common::platform
