#pragma once
/**
 * @file ControlMessage.h
 * @brief Log record produced when a controller action fires.
 */
#include <stddef.h>

#include "Core/SystemLimits.h"
#include "Core/Types/TimeOfDay.h"

/**
 * @brief Immutable message: controller name, content, timestamp, optional read state.
 *
 * Fields are fixed-size buffers; oversized inputs are truncated.
 */
class ControlMessage {
public:
    ControlMessage() = default;
    ControlMessage(const char* name, const char* content, EpochMs timestampMs, const char* readState = nullptr);

    const char* controllerName() const { return name_; }
    const char* content() const { return content_; }
    EpochMs timestampMs() const { return timestampMs_; }

    bool hasReadState() const { return hasReadState_; }
    const char* readState() const { return hasReadState_ ? readState_ : nullptr; }

    bool operator==(const ControlMessage& other) const;
    bool operator!=(const ControlMessage& other) const { return !(*this == other); }

private:
    char name_[Limits::Control::NameBuf] = {0};
    char content_[Limits::Control::ContentBuf] = {0};
    EpochMs timestampMs_ = 0;
    bool hasReadState_ = false;
    char readState_[Limits::Control::ValueBuf] = {0};
};
