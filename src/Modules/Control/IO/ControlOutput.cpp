/**
 * @file ControlOutput.cpp
 * @brief Implementation file.
 */
#include "ControlOutput.h"
#include <string.h>

ControlOutput::ControlOutput(const char* outputId)
{
    if (outputId) {
        strncpy(id_, outputId, sizeof(id_) - 1);
        id_[sizeof(id_) - 1] = '\0';
    }
}

bool ControlOutput::command_(bool on)
{
    // state records the command, even if the driver rejects it
    state_ = on;
    hasState_ = true;
    return writeRaw_(on);
}
