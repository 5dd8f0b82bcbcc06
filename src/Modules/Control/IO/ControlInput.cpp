/**
 * @file ControlInput.cpp
 * @brief Implementation file.
 */
#include "ControlInput.h"
#include <string.h>

ControlInput::ControlInput(const char* inputId)
{
    if (inputId) {
        strncpy(id_, inputId, sizeof(id_) - 1);
        id_[sizeof(id_) - 1] = '\0';
    }
}

bool ControlInput::read(char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    char sample[Limits::Control::ValueBuf] = {0};
    if (!readRaw_(sample, sizeof(sample))) return false;
    sample[sizeof(sample) - 1] = '\0';

    memcpy(state_, sample, sizeof(state_));
    hasState_ = true;

    strncpy(out, sample, outLen - 1);
    out[outLen - 1] = '\0';
    return true;
}
