#pragma once
/**
 * @file ControlOutput.h
 * @brief Output capability: binary actuator with last commanded state.
 */
#include "Core/SystemLimits.h"

class ControlOutput {
public:
    explicit ControlOutput(const char* outputId);
    virtual ~ControlOutput() = default;

    const char* id() const { return id_; }

    /** @brief Command the device on. Returns the driver result. */
    bool activate() { return command_(true); }
    /** @brief Command the device off. Returns the driver result. */
    bool deactivate() { return command_(false); }

    /** @brief False until the first command ("unset" is distinct from off). */
    bool hasState() const { return hasState_; }
    /** @brief Last commanded value; only meaningful when hasState(). */
    bool state() const { return state_; }

protected:
    virtual bool writeRaw_(bool on) = 0;

private:
    bool command_(bool on);

    char id_[Limits::Control::NameBuf] = {0};
    bool hasState_ = false;
    bool state_ = false;
};
