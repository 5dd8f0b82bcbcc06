/**
 * @file LogConsoleSink.cpp
 * @brief Implementation file.
 */
#include "LogConsoleSink.h"

#include <time.h>

#include "Core/SystemClock.h"

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static const char* colorReset() { return "\x1b[0m"; }

void LogConsoleSink::format(const LogEntry& e, char* out, size_t outLen) const
{
    if (!out || outLen == 0) return;

    // Entries built by hand may carry no wall stamp.
    const int64_t wallMs = (e.wall_ms > 0) ? e.wall_ms : SystemClock::epochMs();
    const time_t secs = (time_t)(wallMs / 1000);
    struct tm t;
    localtime_r(&secs, &t);
    const unsigned ms = (unsigned)(wallMs % 1000);

    char ts[48];
    snprintf(ts, sizeof(ts),
             "%04d-%02d-%02d %02d:%02d:%02d.%03u",
             t.tm_year + 1900,
             t.tm_mon + 1,
             t.tm_mday,
             t.tm_hour,
             t.tm_min,
             t.tm_sec,
             ms);

    snprintf(out, outLen, "[%s][%c][%s] %s%s%s",
             ts,
             logLevelChar(e.lvl),
             e.tag,
             color_ ? lvlColor(e.lvl) : "",
             e.msg,
             color_ ? colorReset() : "");
}

void LogConsoleSink::write_(void* ctx, const LogEntry& e)
{
    LogConsoleSink* self = static_cast<LogConsoleSink*>(ctx);
    if (!self || !self->stream_) return;

    char line[LOG_MSG_MAX + 96];
    self->format(e, line, sizeof(line));
    fprintf(self->stream_, "%s\n", line);
}

bool LogConsoleSink::attach(const LogSinkRegistryService& sinks)
{
    if (!sinks.add) return false;

    LogSinkService sink{};
    sink.write = &LogConsoleSink::write_;
    sink.ctx = this;

    return sinks.add(sinks.ctx, sink);
}
