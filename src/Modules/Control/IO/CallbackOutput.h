#pragma once
/**
 * @file CallbackOutput.h
 * @brief Output backed by a user write function.
 */

#include "ControlOutput.h"

typedef bool (*OutputWriteFn)(void* ctx, bool on);

class CallbackOutput : public ControlOutput {
public:
    CallbackOutput(const char* outputId, OutputWriteFn writeFn, void* writeCtx);

protected:
    bool writeRaw_(bool on) override;

private:
    OutputWriteFn writeFn_ = nullptr;
    void* writeCtx_ = nullptr;
};
