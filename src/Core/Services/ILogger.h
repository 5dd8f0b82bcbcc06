#pragma once
/**
 * @file ILogger.h
 * @brief Log entry layout and the service structs shared by the log pipeline.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Log severity levels, lowest first. */
enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

constexpr int LOG_TAG_MAX = 10;
constexpr int LOG_MSG_MAX = 160;

/**
 * @brief One queued log line.
 *
 * `ts_ms` is process uptime, `wall_ms` the UTC epoch at enqueue time. Sinks
 * format the wall clock so a late drain still prints when the line was logged.
 */
struct LogEntry {
    uint32_t ts_ms;
    int64_t wall_ms;
    LogLevel lvl;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief Consumer of drained entries (console, file...). */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Producer side of the hub; returns false when the entry was dropped. */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    void* ctx;
};

struct LogSinkRegistryService {
    bool (*add)(void* ctx, LogSinkService sink);
    int (*count)(void* ctx);
    LogSinkService (*get)(void* ctx, int index);
    void* ctx;
};

/** @brief Single-letter level marker used in formatted lines. */
static inline char logLevelChar(LogLevel lvl)
{
    switch (lvl) {
    case LogLevel::Debug: return 'D';
    case LogLevel::Info: return 'I';
    case LogLevel::Warn: return 'W';
    case LogLevel::Error: return 'E';
    default: return '?';
    }
}

/** @brief Map a numeric config value (0..3) to a level, clamping above Error. */
static inline LogLevel logLevelFromInt(int v)
{
    if (v <= 0) return LogLevel::Debug;
    if (v >= (int)LogLevel::Error) return LogLevel::Error;
    return (LogLevel)v;
}
