#pragma once
/**
 * @file ThresholdController.h
 * @brief Single-output controller switching on a numeric threshold.
 */
#include <memory>

#include "Controller.h"
#include "Domain/ControlDefaults.h"
#include "Modules/Control/IO/ControlInput.h"
#include "Modules/Control/IO/ControlOutput.h"

struct ThresholdConfig {
    const char* name = nullptr;
    float threshold = ControlDefaults::Threshold;
    bool inverted = false;  // activate below the threshold instead of above
    int64_t intervalMs = ControlDefaults::ReadIntervalMs;
    uint16_t historyLimit = ControlDefaults::HistoryLimit;
};

/**
 * @brief Reads the input every interval; output on when above XOR inverted.
 *
 * Equality counts as below. The next read is armed at poll time + interval
 * whatever the outcome.
 */
class ThresholdController : public Controller {
public:
    ThresholdController(const ThresholdConfig& cfg,
                        std::unique_ptr<ControlInput> input,
                        std::unique_ptr<ControlOutput> output);

    const char* kind() const override { return "threshold"; }

    float threshold() const { return threshold_; }
    void setThreshold(float threshold) { threshold_ = threshold; }
    bool inverted() const { return inverted_; }
    void setInverted(bool inverted) { inverted_ = inverted; }
    int64_t interval() const { return intervalMs_; }

    const ControlInput* input() const { return input_.get(); }
    const ControlOutput* output() const { return output_.get(); }

protected:
    void arm_(EpochMs nowMs) override;
    PollStatus onEvent_(const ControlEvent& e, EpochMs nowMs, ControlMessage& out) override;

private:
    float threshold_ = ControlDefaults::Threshold;
    bool inverted_ = false;
    int64_t intervalMs_ = ControlDefaults::ReadIntervalMs;
    std::unique_ptr<ControlInput> input_;
    std::unique_ptr<ControlOutput> output_;
};
