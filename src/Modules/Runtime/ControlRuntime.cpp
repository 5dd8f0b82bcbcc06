/**
 * @file ControlRuntime.cpp
 * @brief Implementation file.
 */
#include "ControlRuntime.h"

#include "Core/SystemClock.h"

#define LOG_TAG "Runtime"
#include "Core/ModuleLog.h"

void ControlRuntime::onLogLevelChanged_(void* ctx, const uint8_t& level)
{
    (void)ctx;
    Log::setMinLevel(logLevelFromInt(level));
}

bool ControlRuntime::registerConfig(ConfigStore& cfg)
{
    if (logLevelVar_.handlerCount == 0) {
        logLevelVar_.addHandler(&ControlRuntime::onLogLevelChanged_, this);
    }
    // Handlers only run on change, so the default level is applied here.
    Log::setMinLevel(logLevelFromInt(cfgData_.logLevel));
    return cfg.registerVar(intervalVar_) &&
           cfg.registerVar(idleSleepVar_) &&
           cfg.registerVar(historyLimitVar_) &&
           cfg.registerVar(logLevelVar_);
}

bool ControlRuntime::start(EpochMs nowMs)
{
    if (cfgData_.intervalMs <= 0) {
        LOGW("interval_ms=%ld invalid, using %ld",
             (long)cfgData_.intervalMs, (long)ControlDefaults::RuntimeIntervalMs);
        cfgData_.intervalMs = ControlDefaults::RuntimeIntervalMs;
    }
    if (cfgData_.idleSleepMs < 0) cfgData_.idleSleepMs = 0;

    const bool ok = group_.start(nowMs);
    started_ = true;
    nextExecMs_ = nowMs;
    LOGI("runtime started: %u controller(s), interval=%ldms",
         (unsigned)group_.count(), (long)cfgData_.intervalMs);
    if (logs_) logs_->drain();
    return ok;
}

size_t ControlRuntime::tick(EpochMs nowMs)
{
    size_t produced = 0;

    if (started_ && nowMs >= nextExecMs_) {
        ++tickCount_;
        produced = group_.poll(nowMs, batch_, Limits::Control::MaxControllers);
        lastBatchCount_ = produced;

        if (produced > 0 && emitter_) {
            // Emit failures are logged and counted by the emitter, never retried.
            (void)emitter_->emit(batch_, produced);
        }
        nextExecMs_ = nowMs + cfgData_.intervalMs;
    }

    if (logs_) logs_->drain();
    return produced;
}

bool ControlRuntime::run()
{
    if (!started_ && !start(SystemClock::epochMs())) {
        LOGE("start failed");
        if (logs_) logs_->drain();
        return false;
    }

    while (!stop_.load()) {
        tick(SystemClock::epochMs());
        SystemClock::sleepMs((uint32_t)cfgData_.idleSleepMs);
    }

    LOGI("runtime stopped after %lu tick(s)", (unsigned long)tickCount_);
    if (logs_) logs_->drain();
    return true;
}
