/**
 * @file Log.cpp
 * @brief Implementation file.
 */
#include "Core/Log.h"
#include "Core/SystemClock.h"
#include <stdarg.h>
#include <stdio.h>

namespace {

const LogHubService* g_hub = nullptr;
LogLevel g_minLevel = LogLevel::Debug;

bool accepts_(LogLevel lvl)
{
    if (!g_hub || !g_hub->enqueue) return false;
    return (uint8_t)lvl >= (uint8_t)g_minLevel;
}

void enqueueVa_(LogLevel lvl, const char* tag, const char* fmt, va_list ap)
{
    if (!fmt || !accepts_(lvl)) return;

    LogEntry e{};
    e.ts_ms = SystemClock::uptimeMs();
    e.wall_ms = SystemClock::epochMs();
    e.lvl = lvl;
    snprintf(e.tag, sizeof(e.tag), "%s", (tag && tag[0] != '\0') ? tag : "-");
    vsnprintf(e.msg, sizeof(e.msg), fmt, ap);

    // A full hub drops the entry; there is nowhere better to report it.
    (void)g_hub->enqueue(g_hub->ctx, e);
}

}  // namespace

void Log::setHub(const LogHubService* hub) { g_hub = hub; }

const LogHubService* Log::hub() { return g_hub; }

void Log::setMinLevel(LogLevel lvl) { g_minLevel = lvl; }

LogLevel Log::minLevel() { return g_minLevel; }

void Log::logf(LogLevel lvl, const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    enqueueVa_(lvl, tag, fmt, ap);
    va_end(ap);
}

void Log::debug(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    enqueueVa_(LogLevel::Debug, tag, fmt, ap);
    va_end(ap);
}

void Log::info(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    enqueueVa_(LogLevel::Info, tag, fmt, ap);
    va_end(ap);
}

void Log::warn(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    enqueueVa_(LogLevel::Warn, tag, fmt, ap);
    va_end(ap);
}

void Log::error(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    enqueueVa_(LogLevel::Error, tag, fmt, ap);
    va_end(ap);
}
