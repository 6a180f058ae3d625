#include "shyradar/logging.hpp"
#include <chrono>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <string>

namespace shyradar {

std::atomic<LogLevel> g_log_level{LogLevel::INFO};
LogCategories g_log_categories;

namespace {

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;
std::string g_station_tag;

} // namespace

void setLogLevel(LogLevel level) {
    g_log_level.store(level);
}

LogLevel getLogLevel() {
    return g_log_level.load();
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

void setLogStationTag(const char* tag) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_station_tag = tag ? tag : "";
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::NONE:
        default:              return "NONE";
    }
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    if (level == LogLevel::NONE || g_log_level.load() < level) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm_now{};
#ifdef _WIN32
    localtime_s(&tm_now, &t);
#else
    localtime_r(&t, &tm_now);
#endif

    char ts[16];
    std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm_now);

    char msg[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;
    if (g_station_tag.empty()) {
        std::fprintf(out, "[%s.%03d][%s][%s] %s\n", ts, static_cast<int>(ms),
                     logLevelToString(level), category ? category : "-", msg);
    } else {
        std::fprintf(out, "[%s.%03d][%s][%s][%s] %s\n", ts, static_cast<int>(ms),
                     logLevelToString(level), g_station_tag.c_str(),
                     category ? category : "-", msg);
    }
    std::fflush(out);
}

} // namespace shyradar
