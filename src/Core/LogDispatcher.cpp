/**
 * @file LogDispatcher.cpp
 * @brief Implementation file.
 */
#include "Core/LogDispatcher.h"

uint16_t LogDispatcher::drain(uint16_t maxEntries) {
    if (!sinks_ || !sinks_->count || !sinks_->get) return 0;

    uint16_t delivered = 0;
    LogEntry e;
    while (delivered < maxEntries && hub_.dequeue(e)) {
        const int n = sinks_->count(sinks_->ctx);
        for (int i = 0; i < n; ++i) {
            LogSinkService sink = sinks_->get(sinks_->ctx, i);
            if (sink.write) sink.write(sink.ctx, e);
        }
        ++delivered;
    }
    return delivered;
}
