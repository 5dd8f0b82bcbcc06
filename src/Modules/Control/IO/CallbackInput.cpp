/**
 * @file CallbackInput.cpp
 * @brief Implementation file.
 */

#include "CallbackInput.h"

CallbackInput::CallbackInput(const char* inputId, InputReadFn readFn, void* readCtx)
    : ControlInput(inputId), readFn_(readFn), readCtx_(readCtx)
{
}

bool CallbackInput::readRaw_(char* out, size_t outLen)
{
    if (!readFn_) return false;
    return readFn_(readCtx_, out, outLen);
}
