#pragma once
/**
 * @file BidirectionalThresholdController.h
 * @brief Dual-output controller holding a value inside a tolerance band.
 */
#include <memory>

#include "Controller.h"
#include "Domain/ControlDefaults.h"
#include "Modules/Control/IO/ControlInput.h"
#include "Modules/Control/IO/ControlOutput.h"

struct BidirectionalThresholdConfig {
    const char* name = nullptr;
    float threshold = ControlDefaults::Threshold;
    float tolerance = ControlDefaults::Tolerance;
    int64_t intervalMs = ControlDefaults::ReadIntervalMs;
    uint16_t historyLimit = ControlDefaults::HistoryLimit;
};

/** @brief Zone entered by the last classified sample. */
enum class ToleranceZone : uint8_t {
    Below = 0,
    Within,
    Above
};

/**
 * @brief Reads the input every interval and drives one of two outputs.
 *
 * Above threshold+tolerance: decrease on, increase off.
 * Below threshold-tolerance: increase on, decrease off.
 * Otherwise both off. Evaluated on every read, no hysteresis memory.
 */
class BidirectionalThresholdController : public Controller {
public:
    BidirectionalThresholdController(const BidirectionalThresholdConfig& cfg,
                                     std::unique_ptr<ControlInput> input,
                                     std::unique_ptr<ControlOutput> increase,
                                     std::unique_ptr<ControlOutput> decrease);

    const char* kind() const override { return "bidirectional"; }

    float threshold() const { return threshold_; }
    void setThreshold(float threshold) { threshold_ = threshold; }
    float tolerance() const { return tolerance_; }
    void setTolerance(float tolerance) { tolerance_ = tolerance; }
    int64_t interval() const { return intervalMs_; }

    /** @brief Classify a value against the current band. */
    ToleranceZone classify(float value) const;

    const ControlInput* input() const { return input_.get(); }
    const ControlOutput* increaseOutput() const { return increase_.get(); }
    const ControlOutput* decreaseOutput() const { return decrease_.get(); }

protected:
    void arm_(EpochMs nowMs) override;
    PollStatus onEvent_(const ControlEvent& e, EpochMs nowMs, ControlMessage& out) override;

private:
    float threshold_ = ControlDefaults::Threshold;
    float tolerance_ = ControlDefaults::Tolerance;
    int64_t intervalMs_ = ControlDefaults::ReadIntervalMs;
    std::unique_ptr<ControlInput> input_;
    std::unique_ptr<ControlOutput> increase_;
    std::unique_ptr<ControlOutput> decrease_;
};
