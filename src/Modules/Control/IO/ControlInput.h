#pragma once
/**
 * @file ControlInput.h
 * @brief Input capability: reads a raw text sample and caches the last one.
 */
#include <stddef.h>

#include "Core/SystemLimits.h"

class ControlInput {
public:
    explicit ControlInput(const char* inputId);
    virtual ~ControlInput() = default;

    const char* id() const { return id_; }

    /**
     * @brief Sample the device and cache the value.
     * @return false when the driver failed; the cached state is left unchanged.
     */
    bool read(char* out, size_t outLen);

    /** @brief False until the first successful read. */
    bool hasState() const { return hasState_; }
    const char* state() const { return hasState_ ? state_ : nullptr; }

protected:
    virtual bool readRaw_(char* out, size_t outLen) = 0;

private:
    char id_[Limits::Control::NameBuf] = {0};
    bool hasState_ = false;
    char state_[Limits::Control::ValueBuf] = {0};
};
