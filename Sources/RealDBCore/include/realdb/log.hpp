#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>
#include <optional>
#include <string>

namespace realdb {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide threshold, defined in RealDBCore/src/realdb.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

/// Parse "off", "error", "warn", "info" or "debug" (case-insensitive).
std::optional<log_level> parse_log_level(const std::string& name);

const char* to_string(log_level level);

/// Redirect log output. nullptr restores stderr. The caller keeps ownership.
void set_log_stream(std::FILE* stream);

/// Write one line, `2026-01-31T12:00:00Z WARN [tag] message`, in a single
/// write so lines from worker threads never interleave.
void log_write(log_level level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

}  // namespace realdb

#define REALDB_LOG(level, tag, fmt, ...) \
    do { \
        if (realdb::log_enabled(level)) { \
            realdb::log_write(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) REALDB_LOG(realdb::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  REALDB_LOG(realdb::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  REALDB_LOG(realdb::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) REALDB_LOG(realdb::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
