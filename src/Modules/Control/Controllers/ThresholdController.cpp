/**
 * @file ThresholdController.cpp
 * @brief Implementation file.
 */
#include "ThresholdController.h"

#include <utility>

#define LOG_TAG "Thresh"
#include "Core/ModuleLog.h"

ThresholdController::ThresholdController(const ThresholdConfig& cfg,
                                         std::unique_ptr<ControlInput> input,
                                         std::unique_ptr<ControlOutput> output)
    : Controller(cfg.name, cfg.historyLimit),
      threshold_(cfg.threshold),
      inverted_(cfg.inverted),
      intervalMs_(cfg.intervalMs),
      input_(std::move(input)),
      output_(std::move(output))
{
}

void ThresholdController::arm_(EpochMs nowMs)
{
    scheduler_.scheduleRead(nowMs + intervalMs_);
}

PollStatus ThresholdController::onEvent_(const ControlEvent& e, EpochMs nowMs, ControlMessage& out)
{
    if (e.action() != ControlAction::Read) {
        LOGE("%s: unexpected action %s", name(), controlActionStr(e.action()));
        return fault_(ErrorCode::UnexpectedAction);
    }

    scheduler_.scheduleRead(nowMs + intervalMs_);

    char sample[Limits::Control::ValueBuf] = {0};
    if (!input_ || !input_->read(sample, sizeof(sample))) {
        return fault_(ErrorCode::IoError);
    }
    scheduler_.annotateLastFired(sample);

    float value = 0.0f;
    if (!parseReading_(sample, value)) {
        LOGD("%s: malformed sample '%s'", name(), sample);
        return fault_(ErrorCode::BadReading);
    }

    const bool above = value > threshold_;
    bool ok = false;
    if (output_) {
        ok = (above != inverted_) ? output_->activate() : output_->deactivate();
    }
    if (!ok) return fault_(ErrorCode::IoError);

    LOGD("%s: value=%.3f threshold=%.3f -> %s",
         name(), (double)value, (double)threshold_, (above != inverted_) ? "ON" : "OFF");

    out = ControlMessage(name(), above ? "Above Threshold" : "Below Threshold", nowMs, sample);
    return PollStatus::Fired;
}
