#pragma once
/**
 * @file ControlRuntime.h
 * @brief Sleep-based driving loop for a controller group.
 */
#include <stddef.h>
#include <stdint.h>
#include <atomic>

#include "Core/ConfigStore.h"
#include "Core/LogDispatcher.h"
#include "Core/SystemLimits.h"
#include "Domain/ControlDefaults.h"
#include "Modules/Control/ControllerGroup.h"
#include "Modules/Emitter/MessageEmitter.h"

/** @brief Values of the "runtime" config module. */
struct RuntimeConfig {
    int32_t intervalMs = ControlDefaults::RuntimeIntervalMs;
    int32_t idleSleepMs = ControlDefaults::IdleSleepMs;
    uint8_t historyLimit = ControlDefaults::HistoryLimit;
    uint8_t logLevel = (uint8_t)LogLevel::Info;
};

/**
 * @brief Polls the group every interval and forwards non-empty batches to the emitter.
 *
 * tick() is the unit of work and takes the time explicitly. run() loops on the
 * wall clock until requestStop().
 */
class ControlRuntime {
public:
    explicit ControlRuntime(ControllerGroup& group, LogDispatcher* logs = nullptr)
        : group_(group), logs_(logs) {}

    /** @brief Register the "runtime" module variables. */
    bool registerConfig(ConfigStore& cfg);
    const RuntimeConfig& config() const { return cfgData_; }

    void setEmitter(MessageEmitter* emitter) { emitter_ = emitter; }

    /** @brief Start every controller at `nowMs`; the first poll is due immediately. */
    bool start(EpochMs nowMs);
    bool isStarted() const { return started_; }

    /**
     * @brief Poll the group when due, emit the batch and drain logs.
     * @return number of messages produced by this tick.
     */
    size_t tick(EpochMs nowMs);

    /** @brief Start on the wall clock and loop until requestStop(). */
    bool run();

    /** @brief Ask run() to return; safe from a signal handler. */
    void requestStop() { stop_.store(true); }
    bool stopRequested() const { return stop_.load(); }

    EpochMs nextExecutionMs() const { return nextExecMs_; }
    size_t lastBatchCount() const { return lastBatchCount_; }
    const ControlMessage* lastBatch() const { return batch_; }
    uint32_t tickCount() const { return tickCount_; }

private:
    static void onLogLevelChanged_(void* ctx, const uint8_t& level);

    ControllerGroup& group_;
    LogDispatcher* logs_ = nullptr;
    MessageEmitter* emitter_ = nullptr;

    RuntimeConfig cfgData_{};
    ConfigVariable<int32_t,0> intervalVar_ {
        "interval_ms","runtime",ConfigType::Int32,&cfgData_.intervalMs,0
    };
    ConfigVariable<int32_t,0> idleSleepVar_ {
        "idle_sleep_ms","runtime",ConfigType::Int32,&cfgData_.idleSleepMs,0
    };
    ConfigVariable<uint8_t,0> historyLimitVar_ {
        "history_limit","runtime",ConfigType::UInt8,&cfgData_.historyLimit,0
    };
    ConfigVariable<uint8_t,1> logLevelVar_ {
        "log_level","runtime",ConfigType::UInt8,&cfgData_.logLevel,0
    };

    ControlMessage batch_[Limits::Control::MaxControllers];
    size_t lastBatchCount_ = 0;
    bool started_ = false;
    EpochMs nextExecMs_ = 0;
    uint32_t tickCount_ = 0;
    std::atomic<bool> stop_{false};
};
