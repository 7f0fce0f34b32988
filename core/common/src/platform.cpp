#include <restful/common/platform.hpp>

#include <cstdlib>

#if defined(RESTFUL_OS_WINDOWS)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#elif defined(RESTFUL_OS_POSIX)
#include <pthread.h>
#endif

namespace restful::common::platform {

uint64_t get_thread_id() noexcept {
#if defined(RESTFUL_OS_WINDOWS)
    return static_cast<uint64_t>(GetCurrentThreadId());
#elif defined(RESTFUL_OS_MACOS)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(RESTFUL_OS_POSIX)
    return static_cast<uint64_t>(pthread_self());
#else
    return 0;
#endif
}

// ============================================================================
// Environment
// ============================================================================

std::string get_env(std::string_view name) {
    const std::string key(name);
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string{};
}

std::string get_env_or(std::string_view name, std::string_view fallback) {
    auto value = get_env(name);
    if (value.empty()) {
        return std::string(fallback);
    }
    return value;
}

bool set_env(std::string_view name, std::string_view value) {
    const std::string key(name);
    const std::string text(value);
#if defined(RESTFUL_OS_WINDOWS)
    return _putenv_s(key.c_str(), text.c_str()) == 0;
#else
    return ::setenv(key.c_str(), text.c_str(), 1) == 0;
#endif
}

bool unset_env(std::string_view name) {
    const std::string key(name);
#if defined(RESTFUL_OS_WINDOWS)
    return _putenv_s(key.c_str(), "") == 0;
#else
    return ::unsetenv(key.c_str()) == 0;
#endif
}

}  // namespace restful::common::platform
