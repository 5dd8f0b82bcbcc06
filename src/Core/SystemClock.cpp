/**
 * @file SystemClock.cpp
 * @brief Implementation file.
 */
#include "Core/SystemClock.h"
#include <chrono>
#include <thread>

namespace {
    const std::chrono::steady_clock::time_point g_boot = std::chrono::steady_clock::now();
}

uint32_t SystemClock::uptimeMs() {
    const auto dt = std::chrono::steady_clock::now() - g_boot;
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(dt).count();
}

int64_t SystemClock::epochMs() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

void SystemClock::sleepMs(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
