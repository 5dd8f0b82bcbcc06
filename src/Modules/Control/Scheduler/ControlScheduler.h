#pragma once
/**
 * @file ControlScheduler.h
 * @brief Per-controller pending/fired event bookkeeping.
 */

#include <stdint.h>
#include <vector>

#include "Core/SystemLimits.h"
#include "Domain/ControlDefaults.h"
#include "Modules/Control/Engine/ControlEvent.h"

/**
 * @brief Owns one controller's pending events and a bounded fired history.
 *
 * Pending events keep insertion order and are never deduplicated. An event is
 * either pending or in history, never both.
 */
class ControlScheduler {
public:
    /** @brief Append a pending On event. */
    void scheduleOn(EpochMs timestampMs) { schedule_(ControlAction::On, timestampMs); }
    /** @brief Append a pending Off event. */
    void scheduleOff(EpochMs timestampMs) { schedule_(ControlAction::Off, timestampMs); }
    /** @brief Append a pending Read event. */
    void scheduleRead(EpochMs timestampMs) { schedule_(ControlAction::Read, timestampMs); }

    /**
     * @brief Fire at most one due event.
     *
     * Among due events the earliest timestamp wins, ties go to insertion order.
     * The fired event moves to history and is copied to `fired`.
     * @return false when nothing is due.
     */
    bool attemptExecution(EpochMs nowMs, ControlEvent& fired);

    bool hasFutureEvents() const { return !pending_.empty(); }
    size_t pendingCount() const { return pending_.size(); }
    const ControlEvent* pendingAt(size_t idx) const;

    /** @brief Limit retained history (0 disables retention, clamped to `Limits::Control::MaxHistory`). */
    void setHistoryLimit(uint16_t limit);
    uint16_t historyLimit() const { return historyLimit_; }

    /** @brief Retained fired events, oldest first. */
    uint16_t historyCount() const { return historyCount_; }
    const ControlEvent* historyAt(uint16_t idx) const;
    const ControlEvent* lastFired() const;

    /** @brief Attach a sampled value to the most recent retained fired event. */
    bool annotateLastFired(const char* value);

    /** @brief Every event ever fired, including those dropped from history. */
    uint32_t firedTotal() const { return firedTotal_; }

private:
    void schedule_(ControlAction action, EpochMs timestampMs);
    void pushHistory_(const ControlEvent& e);

    std::vector<ControlEvent> pending_;

    ControlEvent history_[Limits::Control::MaxHistory]{};
    uint16_t historyLimit_ = ControlDefaults::HistoryLimit;
    uint16_t historyHead_ = 0;
    uint16_t historyCount_ = 0;
    uint32_t firedTotal_ = 0;
};
