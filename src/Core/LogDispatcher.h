#pragma once
/**
 * @file LogDispatcher.h
 * @brief Forwards queued log entries from the hub to every registered sink.
 */
#include "Core/LogHub.h"

class LogDispatcher {
public:
    LogDispatcher(LogHub& hub, const LogSinkRegistryService* sinks) : hub_(hub), sinks_(sinks) {}

    /** @brief Deliver up to `maxEntries` queued entries; returns how many were delivered. */
    uint16_t drain(uint16_t maxEntries = Limits::LogQueueLen);

private:
    LogHub& hub_;
    const LogSinkRegistryService* sinks_ = nullptr;
};
