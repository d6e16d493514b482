// Header-only logger for the smblite core, printf-style, to stderr.
// SMBLITE_LOG selects the threshold: unset/0 = off, 1 or "info", "warn",
// "error", "debug". Read once per process.
#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

namespace smblite {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

inline LogLevel parseLogLevel(const char* v) {
    if (!v || !*v || std::strcmp(v, "0") == 0) return LogLevel::Off;
    if (std::strcmp(v, "error") == 0) return LogLevel::Error;
    if (std::strcmp(v, "warn") == 0) return LogLevel::Warn;
    if (std::strcmp(v, "debug") == 0) return LogLevel::Debug;
    return LogLevel::Info;
}

inline LogLevel logThreshold() {
    static const LogLevel level = parseLogLevel(std::getenv("SMBLITE_LOG"));
    return level;
}

inline bool logEnabled(LogLevel level) {
    return level != LogLevel::Off && (int)level <= (int)logThreshold();
}

inline void logf(const char* level, const char* fmt, ...) {
    char stamp[32] = {0};
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);

    // One fprintf per part; lines from concurrent callers may interleave.
    std::fprintf(stderr, "%s [smblite][%s] ", stamp, level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace smblite

#define SMBLITE_LOG_AT(lvl, tag, fmt, ...) \
    do { \
        if (smblite::logEnabled(smblite::LogLevel::lvl)) \
            smblite::logf(tag, fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGD(fmt, ...) SMBLITE_LOG_AT(Debug, "DEBUG", fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) SMBLITE_LOG_AT(Info, "INFO", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) SMBLITE_LOG_AT(Warn, "WARN", fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) SMBLITE_LOG_AT(Error, "ERROR", fmt, ##__VA_ARGS__)
