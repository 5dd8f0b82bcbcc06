#pragma once
/**
 * @file LogOutput.h
 * @brief Output without hardware; commands are only logged.
 */

#include "ControlOutput.h"

class LogOutput : public ControlOutput {
public:
    explicit LogOutput(const char* outputId) : ControlOutput(outputId) {}

protected:
    bool writeRaw_(bool on) override;
};
