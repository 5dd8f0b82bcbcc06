#pragma once
/**
 * @file ControlAction.h
 * @brief Closed set of schedulable controller intents.
 */
#include <stdint.h>

enum class ControlAction : uint8_t {
    Read = 0,  // input device should be sampled
    On,        // output device should be activated
    Off        // output device should be deactivated
};

static inline const char* controlActionStr(ControlAction a)
{
    switch (a) {
    case ControlAction::Read: return "read";
    case ControlAction::On: return "on";
    case ControlAction::Off: return "off";
    }
    return "?";
}
