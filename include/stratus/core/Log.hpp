#pragma once

#include <cstdio>
#include <string>

namespace stratus::log {

enum class Level : int {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERROR = 3,
    OFF   = 4
};

void setLevel(Level lvl);
Level level();

// Accepts debug/info/warn/error/off, case-insensitive. Unknown names leave
// the level unchanged and return false.
bool setLevel(const std::string& name);

const char* level_str(Level lvl) noexcept;

inline bool enabled(Level lvl) {
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

}

// =============================================================================
// LOGGING MACROS - single line to stderr, flushed
// =============================================================================
#define STRATUS_LOG(lvl, tag, fmt, ...) do { \
    if (::stratus::log::enabled(lvl)) { \
        std::fprintf(stderr, "[%s][%s] " fmt "\n", \
            tag, ::stratus::log::level_str(lvl), ##__VA_ARGS__); \
        std::fflush(stderr); \
    } \
} while (0)

#define STRATUS_LOG_DEBUG(tag, fmt, ...) STRATUS_LOG(::stratus::log::Level::DEBUG, tag, fmt, ##__VA_ARGS__)
#define STRATUS_LOG_INFO(tag, fmt, ...)  STRATUS_LOG(::stratus::log::Level::INFO,  tag, fmt, ##__VA_ARGS__)
#define STRATUS_LOG_WARN(tag, fmt, ...)  STRATUS_LOG(::stratus::log::Level::WARN,  tag, fmt, ##__VA_ARGS__)
#define STRATUS_LOG_ERROR(tag, fmt, ...) STRATUS_LOG(::stratus::log::Level::ERROR, tag, fmt, ##__VA_ARGS__)
