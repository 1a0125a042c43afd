#pragma once

#include <cstdio>
#include <atomic>

#ifndef INTERCEPT_DEFAULT_LOG_LEVEL
 #define INTERCEPT_DEFAULT_LOG_LEVEL 0
#endif

namespace intercept {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in intercept.cpp and initialised from INTERCEPT_DEFAULT_LOG_LEVEL.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

}  // namespace intercept

#define INTERCEPT_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(intercept::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define INTERCEPT_LOG_ERROR(tag, fmt, ...) INTERCEPT_LOG(intercept::log_level::error, tag, fmt, ##__VA_ARGS__)
#define INTERCEPT_LOG_WARN(tag, fmt, ...)  INTERCEPT_LOG(intercept::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define INTERCEPT_LOG_INFO(tag, fmt, ...)  INTERCEPT_LOG(intercept::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define INTERCEPT_LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define INTERCEPT_LOG_DEBUG(tag, fmt, ...) INTERCEPT_LOG(intercept::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif
