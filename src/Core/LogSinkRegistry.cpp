/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    if (n >= MAX_SINKS) return false;
    sinks[n++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    return n;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n) return LogSinkService{};
    return sinks[idx];
}

bool LogSinkRegistry::svcAdd_(void* ctx, LogSinkService sink) {
    if (!ctx) return false;
    return static_cast<LogSinkRegistry*>(ctx)->add(sink);
}

int LogSinkRegistry::svcCount_(void* ctx) {
    if (!ctx) return 0;
    return static_cast<LogSinkRegistry*>(ctx)->count();
}

LogSinkService LogSinkRegistry::svcGet_(void* ctx, int index) {
    if (!ctx) return LogSinkService{};
    return static_cast<LogSinkRegistry*>(ctx)->get(index);
}
