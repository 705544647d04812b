// =============================================================================
// recdock - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: RLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <atomic>
#include <thread>

namespace recdock::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(); }

// Accepts "trace", "debug", "info", "warn", "error", "fatal" (any case).
// Unknown names leave `out` untouched and return false.
inline bool parseLevel(const std::string& name, Level& out) {
    std::string n;
    for (char c : name) n += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    if (n == "trace") { out = Level::Trace; return true; }
    if (n == "debug") { out = Level::Debug; return true; }
    if (n == "info")  { out = Level::Info;  return true; }
    if (n == "warn" || n == "warning") { out = Level::Warn; return true; }
    if (n == "error") { out = Level::Error; return true; }
    if (n == "fatal") { out = Level::Fatal; return true; }
    return false;
}

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite: one log per session run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline unsigned long currentThreadTag() {
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    unsigned long tid = currentThreadTag();
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s [%s] [%s] (T%lu) %s\n", time_str, levelStr(level), tag, tid, msg);
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%lu) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

// Hex preview of the first `max_bytes` bytes, for frame dumps.
inline std::string hexPreview(const uint8_t* data, size_t len, size_t max_bytes = 32) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    size_t n = len < max_bytes ? len : max_bytes;
    out.reserve(n * 3);
    for (size_t i = 0; i < n; i++) {
        if (i) out += ' ';
        out += digits[(data[i] >> 4) & 0x0F];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace recdock::log

#define RLOG_TRACE(tag, fmt, ...) recdock::log::write(recdock::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define RLOG_DEBUG(tag, fmt, ...) recdock::log::write(recdock::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define RLOG_INFO(tag, fmt, ...)  recdock::log::write(recdock::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define RLOG_WARN(tag, fmt, ...)  recdock::log::write(recdock::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define RLOG_ERROR(tag, fmt, ...) recdock::log::write(recdock::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define RLOG_FATAL(tag, fmt, ...) recdock::log::write(recdock::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
