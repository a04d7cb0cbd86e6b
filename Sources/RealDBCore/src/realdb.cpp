#include "realdb/log.hpp"
#include <cctype>
#include <cstdarg>
#include <ctime>

namespace realdb {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::warn};

namespace {
std::atomic<std::FILE*> g_log_stream{nullptr};
}

std::optional<log_level> parse_log_level(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "off") return log_level::off;
    if (lower == "error") return log_level::error;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "info") return log_level::info;
    if (lower == "debug") return log_level::debug;
    return std::nullopt;
}

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off:   return "off";
        case log_level::error: return "error";
        case log_level::warn:  return "warn";
        case log_level::info:  return "info";
        case log_level::debug: return "debug";
    }
    return "unknown";
}

void set_log_stream(std::FILE* stream) {
    g_log_stream.store(stream, std::memory_order_relaxed);
}

void log_write(log_level level, const char* tag, const char* fmt, ...) {
    char stamp[32] = "";
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    if (gmtime_r(&now, &utc)) {
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &utc);
    }

    std::string label = to_string(level);
    for (char& c : label) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    char message[1024];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    if (n < 0) {
        message[0] = '\0';
    }

    std::string line = std::string(stamp) + " " + label + " [" + tag + "] " + message + "\n";
    std::FILE* out = g_log_stream.load(std::memory_order_relaxed);
    if (!out) out = stderr;
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
}

} // namespace realdb
