#pragma once
/**
 * @file CallbackInput.h
 * @brief Input backed by a user read function.
 */

#include "ControlInput.h"

typedef bool (*InputReadFn)(void* ctx, char* out, size_t outLen);

class CallbackInput : public ControlInput {
public:
    CallbackInput(const char* inputId, InputReadFn readFn, void* readCtx);

protected:
    bool readRaw_(char* out, size_t outLen) override;

private:
    InputReadFn readFn_ = nullptr;
    void* readCtx_ = nullptr;
};
