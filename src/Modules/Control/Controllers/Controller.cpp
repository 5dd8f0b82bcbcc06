/**
 * @file Controller.cpp
 * @brief Implementation file.
 */
#include "Controller.h"

#include <ctype.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

#define LOG_TAG "Ctrl"
#include "Core/ModuleLog.h"

Controller::Controller(const char* name, uint16_t historyLimit)
{
    setName(name);
    scheduler_.setHistoryLimit(historyLimit);
}

void Controller::setName(const char* name)
{
    if (!name) {
        name_[0] = '\0';
        return;
    }
    strncpy(name_, name, sizeof(name_) - 1);
    name_[sizeof(name_) - 1] = '\0';
}

bool Controller::start(EpochMs nowMs)
{
    if (started_) return true;
    arm_(nowMs);
    started_ = true;
    LOGD("%s(%s) armed, pending=%u", kind(), name_, (unsigned)scheduler_.pendingCount());
    return true;
}

PollStatus Controller::poll(EpochMs nowMs, ControlMessage& out)
{
    if (!started_) return fault_(ErrorCode::NotReady);

    ControlEvent fired;
    if (!scheduler_.attemptExecution(nowMs, fired)) return PollStatus::Idle;

    return onEvent_(fired, nowMs, out);
}

PollStatus Controller::fault_(ErrorCode code)
{
    lastError_ = code;
    return PollStatus::Fault;
}

bool Controller::parseReading_(const char* text, float& out)
{
    if (!text) return false;

    // Decimal only: strtof would also take hex ("0x1A").
    const char* p = text;
    while (isspace((unsigned char)*p)) ++p;
    if (*p == '+' || *p == '-') ++p;
    if (p[0] == '0' && (p[1] == 'x' || p[1] == 'X')) return false;

    char* end = nullptr;
    const float v = strtof(text, &end);
    if (end == text) return false;
    while (*end != '\0' && isspace((unsigned char)*end)) ++end;
    if (*end != '\0') return false;
    if (!isfinite(v)) return false;

    out = v;
    return true;
}
