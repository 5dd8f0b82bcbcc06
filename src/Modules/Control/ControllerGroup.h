#pragma once
/**
 * @file ControllerGroup.h
 * @brief Insertion-ordered set of controllers polled as one unit.
 */
#include <stddef.h>
#include <stdint.h>
#include <memory>

#include "Core/SystemLimits.h"
#include "Modules/Control/Controllers/Controller.h"

class ControllerGroup {
public:
    /**
     * @brief Take ownership of a controller.
     * @return false when the controller is null or the group is full.
     */
    bool add(std::unique_ptr<Controller> controller);

    uint8_t count() const { return count_; }
    Controller* at(uint8_t idx);
    const Controller* at(uint8_t idx) const;
    /** @brief First controller with this name, nullptr if none. */
    Controller* find(const char* name);

    /** @brief Arm every member not yet started. */
    bool start(EpochMs nowMs);

    /**
     * @brief Poll every member once, in insertion order.
     *
     * Messages of the members that fired are written to `out` in that order.
     * A faulting member is logged and counted; the others are still polled.
     * @return number of messages written (at most `maxOut`).
     */
    size_t poll(EpochMs nowMs, ControlMessage* out, size_t maxOut);

    /** @brief Faults seen during the last poll(). */
    uint8_t lastFaultCount() const { return lastFaultCount_; }
    /** @brief Messages dropped during the last poll() because `out` was full. */
    uint8_t lastOverflowCount() const { return lastOverflowCount_; }

private:
    std::unique_ptr<Controller> controllers_[Limits::Control::MaxControllers];
    uint8_t count_ = 0;
    uint8_t lastFaultCount_ = 0;
    uint8_t lastOverflowCount_ = 0;
};
