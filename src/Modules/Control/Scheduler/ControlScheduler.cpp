/**
 * @file ControlScheduler.cpp
 * @brief Implementation file.
 */

#include "ControlScheduler.h"

#include <cstddef>

void ControlScheduler::schedule_(ControlAction action, EpochMs timestampMs)
{
    pending_.emplace_back(action, timestampMs);
}

bool ControlScheduler::attemptExecution(EpochMs nowMs, ControlEvent& fired)
{
    size_t best = pending_.size();
    for (size_t i = 0; i < pending_.size(); ++i) {
        const ControlEvent& e = pending_[i];
        if (!e.shouldExecute(nowMs)) continue;
        // strict '<' keeps the first inserted among equal timestamps
        if (best == pending_.size() || e.timestampMs() < pending_[best].timestampMs()) best = i;
    }
    if (best == pending_.size()) return false;

    fired = pending_[best];
    pending_.erase(pending_.begin() + (std::ptrdiff_t)best);
    pushHistory_(fired);
    ++firedTotal_;
    return true;
}

const ControlEvent* ControlScheduler::pendingAt(size_t idx) const
{
    if (idx >= pending_.size()) return nullptr;
    return &pending_[idx];
}

void ControlScheduler::setHistoryLimit(uint16_t limit)
{
    if (limit > Limits::Control::MaxHistory) limit = Limits::Control::MaxHistory;
    // keep the newest entries that still fit
    while (historyCount_ > limit) {
        historyHead_ = (uint16_t)((historyHead_ + 1) % Limits::Control::MaxHistory);
        --historyCount_;
    }
    historyLimit_ = limit;
}

void ControlScheduler::pushHistory_(const ControlEvent& e)
{
    if (historyLimit_ == 0) return;
    if (historyCount_ >= historyLimit_) {
        historyHead_ = (uint16_t)((historyHead_ + 1) % Limits::Control::MaxHistory);
        --historyCount_;
    }
    const uint16_t slot = (uint16_t)((historyHead_ + historyCount_) % Limits::Control::MaxHistory);
    history_[slot] = e;
    ++historyCount_;
}

const ControlEvent* ControlScheduler::historyAt(uint16_t idx) const
{
    if (idx >= historyCount_) return nullptr;
    return &history_[(uint16_t)((historyHead_ + idx) % Limits::Control::MaxHistory)];
}

const ControlEvent* ControlScheduler::lastFired() const
{
    if (historyCount_ == 0) return nullptr;
    return historyAt((uint16_t)(historyCount_ - 1));
}

bool ControlScheduler::annotateLastFired(const char* value)
{
    if (historyCount_ == 0) return false;
    const uint16_t idx = (uint16_t)((historyHead_ + historyCount_ - 1) % Limits::Control::MaxHistory);
    history_[idx].setValue(value);
    return true;
}
