#pragma once
/**
 * @file CachedInput.h
 * @brief Input that returns the latest pushed value.
 */
#include <string.h>

#include "ControlInput.h"

class CachedInput : public ControlInput {
public:
    explicit CachedInput(const char* inputId, const char* initial = nullptr) : ControlInput(inputId) {
        if (initial) update(initial);
    }

    void update(const char* value) {
        if (!value) return;
        strncpy(value_, value, sizeof(value_) - 1);
        value_[sizeof(value_) - 1] = '\0';
        valid_ = true;
    }

protected:
    bool readRaw_(char* out, size_t outLen) override {
        if (!valid_) return false;
        strncpy(out, value_, outLen - 1);
        out[outLen - 1] = '\0';
        return true;
    }

private:
    bool valid_ = false;
    char value_[Limits::Control::ValueBuf] = {0};
};
