#pragma once
/**
 * @file LogHub.h
 * @brief Central log ring buffer between producers and the dispatcher.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

/**
 * @brief Ring-based log hub for producers and consumers.
 *
 * Single-threaded: producers and the dispatcher run in the same control loop.
 */
class LogHub {
public:
    /** @brief Reset the ring and limit it to `queueLen` entries. */
    void init(uint16_t queueLen = Limits::LogQueueLen);

    /** @brief Enqueue a log entry (non-blocking, drops when full). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue the oldest log entry. */
    bool dequeue(LogEntry& out);

    /** @brief Entries dropped because the ring was full. */
    uint32_t dropped() const { return dropped_; }

    /** @brief Producer-side service bound to this hub. */
    const LogHubService* service() const { return &svc_; }

private:
    static bool svcEnqueue_(void* ctx, const LogEntry& e);

    LogEntry ring_[Limits::LogQueueLen]{};
    uint16_t cap_ = Limits::LogQueueLen;
    uint16_t head_ = 0;
    uint16_t count_ = 0;
    uint32_t dropped_ = 0;
    LogHubService svc_{&LogHub::svcEnqueue_, this};
};
