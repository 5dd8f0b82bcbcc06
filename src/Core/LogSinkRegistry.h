#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

/**
 * @brief Stores and enumerates registered log sinks.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink to the registry. */
    bool add(LogSinkService sink);
    /** @brief Number of registered sinks. */
    int count() const;
    /** @brief Get sink by index. */
    LogSinkService get(int idx) const;

    /** @brief Service view used by the dispatcher and sink installers. */
    const LogSinkRegistryService* service() const { return &svc_; }

private:
    static bool svcAdd_(void* ctx, LogSinkService sink);
    static int svcCount_(void* ctx);
    static LogSinkService svcGet_(void* ctx, int index);

    static constexpr int MAX_SINKS = Limits::MaxLogSinks;
    LogSinkService sinks[MAX_SINKS]{};
    int n = 0;
    LogSinkRegistryService svc_{&LogSinkRegistry::svcAdd_, &LogSinkRegistry::svcCount_,
                                &LogSinkRegistry::svcGet_, this};
};
