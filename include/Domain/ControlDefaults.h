#pragma once

#include <stdint.h>

namespace ControlDefaults {

constexpr int64_t MsPerSecond = 1000;
constexpr int64_t MsPerMinute = 60 * MsPerSecond;
constexpr int64_t MsPerHour = 60 * MsPerMinute;
constexpr int64_t MsPerDay = 24 * MsPerHour;

constexpr int32_t RuntimeIntervalMs = 1000;
constexpr int32_t IdleSleepMs = 100;
constexpr uint8_t HistoryLimit = 16;

constexpr float Threshold = 0.0f;
constexpr float Tolerance = 0.0f;
constexpr int64_t ReadIntervalMs = MsPerSecond;

}  // namespace ControlDefaults
