#pragma once

// Process-wide printf-style logger.
//
// Usage:
//   LOG_DISCOVERY(INFO, "Scan cycle %d started", cycle);
//   LOG_RESOLVE(WARN, "Directory unavailable for %s", device_id.c_str());
//
// Levels are ordered by verbosity: a message is written when its level is
// <= the global level and its category is enabled. Writes are serialized, so
// adapter threads and resolver workers may log concurrently.

#include <atomic>
#include <cstdio>

#ifdef _WIN32
// Windows headers define ERROR, which breaks LOG_*(ERROR, ...)
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace shyradar {

enum class LogLevel : int {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5,
};

struct LogCategories {
    bool discovery = true;
    bool resolve = true;
    bool layout = true;
    bool gesture = true;
    bool engine = true;
};

extern std::atomic<LogLevel> g_log_level;
extern LogCategories g_log_categories;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Redirect output (nullptr restores stderr). The caller keeps ownership of the FILE.
void setLogFile(FILE* file);

// Tag prefixed to every line, normally the local user id
void setLogStationTag(const char* tag);

const char* logLevelToString(LogLevel level);

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void log(LogLevel level, const char* category, const char* fmt, ...);

} // namespace shyradar

#define SHYRADAR_LOG_CATEGORY(flag, name, level, ...)                                  \
    do {                                                                               \
        if (::shyradar::g_log_level.load(std::memory_order_relaxed) >=                 \
                ::shyradar::LogLevel::level &&                                         \
            ::shyradar::g_log_categories.flag) {                                       \
            ::shyradar::log(::shyradar::LogLevel::level, name, __VA_ARGS__);           \
        }                                                                              \
    } while (0)

#define LOG_DISCOVERY(level, ...) SHYRADAR_LOG_CATEGORY(discovery, "DISC", level, __VA_ARGS__)
#define LOG_RESOLVE(level, ...)   SHYRADAR_LOG_CATEGORY(resolve, "RESOLVE", level, __VA_ARGS__)
#define LOG_LAYOUT(level, ...)    SHYRADAR_LOG_CATEGORY(layout, "LAYOUT", level, __VA_ARGS__)
#define LOG_GESTURE(level, ...)   SHYRADAR_LOG_CATEGORY(gesture, "GESTURE", level, __VA_ARGS__)
#define LOG_ENGINE(level, ...)    SHYRADAR_LOG_CATEGORY(engine, "ENGINE", level, __VA_ARGS__)
