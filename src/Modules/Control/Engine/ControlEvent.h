#pragma once
/**
 * @file ControlEvent.h
 * @brief Scheduled action bound to a timestamp.
 */
#include <stddef.h>

#include "Core/SystemLimits.h"
#include "Core/Types/TimeOfDay.h"
#include "ControlAction.h"

/**
 * @brief One scheduled action.
 *
 * Created by ControlScheduler only. The optional value holds the sample that
 * was read when the event fired.
 */
class ControlEvent {
public:
    ControlEvent() = default;
    ControlEvent(ControlAction action, EpochMs timestampMs) : action_(action), timestampMs_(timestampMs) {}

    /** @brief Due check, non-strict: true for any `nowMs >= timestamp`. */
    bool shouldExecute(EpochMs nowMs) const { return timestampMs_ <= nowMs; }

    ControlAction action() const { return action_; }
    EpochMs timestampMs() const { return timestampMs_; }

    bool hasValue() const { return hasValue_; }
    const char* value() const { return hasValue_ ? value_ : nullptr; }
    void setValue(const char* value);

private:
    ControlAction action_ = ControlAction::Read;
    EpochMs timestampMs_ = 0;
    bool hasValue_ = false;
    char value_[Limits::Control::ValueBuf] = {0};
};
