/**
 * @file Log.h
 * @brief Process-wide log front end feeding the registered hub.
 */
#pragma once

#include "Core/Services/ILogger.h"

namespace Log {
    /**
     * @brief Route every subsequent entry to `hub`. Pass nullptr to drop entries.
     */
    void setHub(const LogHubService* hub);

    const LogHubService* hub();

    /** @brief Entries below `lvl` are discarded before formatting. */
    void setMinLevel(LogLevel lvl);
    LogLevel minLevel();

    void logf(LogLevel lvl, const char* tag, const char* fmt, ...);

    void debug(const char* tag, const char* fmt, ...);
    void info(const char* tag, const char* fmt, ...);
    void warn(const char* tag, const char* fmt, ...);
    void error(const char* tag, const char* fmt, ...);
}

// Per-file LOGx macros live in Core/ModuleLog.h.
