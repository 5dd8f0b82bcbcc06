#pragma once
/**
 * @file SystemClock.h
 * @brief Host clock helpers (uptime and wall-clock epoch).
 */
#include <stdint.h>

namespace SystemClock {
    /** @brief Milliseconds since process start (wraps like Arduino `millis()`). */
    uint32_t uptimeMs();

    /** @brief Wall-clock milliseconds since the Unix epoch (UTC). */
    int64_t epochMs();

    /** @brief Block the calling thread for `ms` milliseconds. */
    void sleepMs(uint32_t ms);
}
