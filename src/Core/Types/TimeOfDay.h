#pragma once
/**
 * @file TimeOfDay.h
 * @brief Wall-clock instant and time-of-day value types.
 */
#include <stdint.h>

/** @brief Milliseconds since the Unix epoch, UTC. */
using EpochMs = int64_t;

/** @brief Hour/minute/second within a UTC day. */
struct TimeOfDay {
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;

    constexpr int64_t toMs() const {
        return ((int64_t)hour * 3600 + (int64_t)minute * 60 + (int64_t)second) * 1000;
    }
};

inline bool operator==(const TimeOfDay& a, const TimeOfDay& b) {
    return a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}
