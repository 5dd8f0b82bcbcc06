#pragma once
/**
 * @file Controller.h
 * @brief Base interface for all controller state machines.
 */
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/Control/Engine/ControlMessage.h"
#include "Modules/Control/Scheduler/ControlScheduler.h"

/** @brief Outcome of one poll. */
enum class PollStatus : uint8_t {
    Idle = 0,  // nothing due
    Fired,     // an action ran, message written
    Fault      // an action was consumed but failed, see lastError()
};

/**
 * @brief Named state machine owning one scheduler.
 *
 * Two-phase: constructed idle, armed by start(). Polling before start() is a
 * NotReady fault.
 */
class Controller {
public:
    Controller(const char* name, uint16_t historyLimit);
    virtual ~Controller() = default;

    /** @brief Short type id ("threshold", "bidirectional", "timed"). */
    virtual const char* kind() const = 0;

    void setName(const char* name);
    /** @brief Controller name, empty string when unset. */
    const char* name() const { return name_; }
    bool hasName() const { return name_[0] != '\0'; }

    /** @brief Arm the first event relative to `nowMs`. No-op when already started. */
    bool start(EpochMs nowMs);
    bool isStarted() const { return started_; }

    /**
     * @brief Run the due action, if any.
     * @return Fired with `out` filled, Idle, or Fault (see lastError()).
     */
    PollStatus poll(EpochMs nowMs, ControlMessage& out);

    /** @brief Error of the last Fault returned by poll(). */
    ErrorCode lastError() const { return lastError_; }

    const ControlScheduler& scheduler() const { return scheduler_; }

protected:
    virtual void arm_(EpochMs nowMs) = 0;
    virtual PollStatus onEvent_(const ControlEvent& e, EpochMs nowMs, ControlMessage& out) = 0;

    PollStatus fault_(ErrorCode code);

    /** @brief Parse a numeric sensor sample; rejects trailing garbage and non-finite values. */
    static bool parseReading_(const char* text, float& out);

    ControlScheduler scheduler_;

private:
    char name_[Limits::Control::NameBuf] = {0};
    bool started_ = false;
    ErrorCode lastError_ = ErrorCode::NotReady;
};
