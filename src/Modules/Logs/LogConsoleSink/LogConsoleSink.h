#pragma once
/**
 * @file LogConsoleSink.h
 * @brief Console log sink (stderr by default, stdout carries emitted messages).
 */
#include <stdio.h>

#include "Core/Services/ILogger.h"

/**
 * @brief Writes `[YYYY-MM-DD HH:MM:SS.mmm][L][tag] msg` lines to a stream.
 */
class LogConsoleSink {
public:
    explicit LogConsoleSink(FILE* stream = stderr, bool color = true) : stream_(stream), color_(color) {}

    /** @brief Register this sink; the object must outlive the registry. */
    bool attach(const LogSinkRegistryService& sinks);

    void setColor(bool color) { color_ = color; }
    bool color() const { return color_; }

    /** @brief Format one entry without the trailing newline. */
    void format(const LogEntry& e, char* out, size_t outLen) const;

private:
    static void write_(void* ctx, const LogEntry& e);

    FILE* stream_ = stderr;
    bool color_ = true;
};
