#pragma once
/**
 * @file TimedOutputController.h
 * @brief Daily on/off window controller.
 */
#include <memory>

#include "Controller.h"
#include "Domain/ControlDefaults.h"
#include "Modules/Control/IO/ControlOutput.h"

struct TimedOutputConfig {
    const char* name = nullptr;
    TimeOfDay start{};
    int64_t durationMs = 0;
    uint16_t historyLimit = ControlDefaults::HistoryLimit;
};

/**
 * @brief Switches the output on at `start` (UTC) every day and off after `durationMs`.
 *
 * The window may cross midnight. Pending events alternate On/Off.
 */
class TimedOutputController : public Controller {
public:
    TimedOutputController(const TimedOutputConfig& cfg, std::unique_ptr<ControlOutput> output);

    const char* kind() const override { return "timed"; }

    const TimeOfDay& startTime() const { return start_; }
    int64_t durationMs() const { return durationMs_; }

    /** @brief Next start instant: today when the time of day is still before it, else tomorrow. */
    EpochMs nextStartAfter(EpochMs nowMs) const;

    const ControlOutput* output() const { return output_.get(); }

protected:
    void arm_(EpochMs nowMs) override;
    PollStatus onEvent_(const ControlEvent& e, EpochMs nowMs, ControlMessage& out) override;

private:
    TimeOfDay start_{};
    int64_t durationMs_ = 0;
    std::unique_ptr<ControlOutput> output_;
};
