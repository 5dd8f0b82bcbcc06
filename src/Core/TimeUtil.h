#pragma once
/**
 * @file TimeUtil.h
 * @brief UTC calendar helpers for epoch milliseconds.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/Types/TimeOfDay.h"

namespace TimeUtil {

/** @brief Start of the UTC calendar day containing `t` (floor, also for negative epochs). */
EpochMs dayStartMs(EpochMs t);

/** @brief Milliseconds elapsed since the start of the UTC day containing `t`. */
int64_t timeOfDayMs(EpochMs t);

/** @brief Build an instant from a UTC calendar date and time (`month` and `day` are 1-based). */
EpochMs fromUtc(int year, int month, int day, int hour, int minute, int second, int millis = 0);

/**
 * @brief Parse "HH:MM" or "HH:MM:SS".
 * @return false on malformed input or out-of-range fields.
 */
bool parseTimeOfDay(const char* text, TimeOfDay& out);

/** @brief Format as ISO-8601 UTC with milliseconds, e.g. 2023-01-01T05:00:00.000Z. */
bool formatIso8601(EpochMs t, char* out, size_t outLen);

}  // namespace TimeUtil
