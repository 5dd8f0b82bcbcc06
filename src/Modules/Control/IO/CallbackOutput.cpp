/**
 * @file CallbackOutput.cpp
 * @brief Implementation file.
 */

#include "CallbackOutput.h"

CallbackOutput::CallbackOutput(const char* outputId, OutputWriteFn writeFn, void* writeCtx)
    : ControlOutput(outputId), writeFn_(writeFn), writeCtx_(writeCtx)
{
}

bool CallbackOutput::writeRaw_(bool on)
{
    // no driver attached: behaves as a sink that accepts every command
    if (!writeFn_) return true;
    return writeFn_(writeCtx_, on);
}
