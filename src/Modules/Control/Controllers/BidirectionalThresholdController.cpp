/**
 * @file BidirectionalThresholdController.cpp
 * @brief Implementation file.
 */
#include "BidirectionalThresholdController.h"

#include <utility>

#define LOG_TAG "BiThresh"
#include "Core/ModuleLog.h"

static const char* zoneContent_(ToleranceZone zone)
{
    switch (zone) {
    case ToleranceZone::Above: return "Above Threshold";
    case ToleranceZone::Below: return "Below Threshold";
    case ToleranceZone::Within: return "Within Tolerance";
    default: return "Within Tolerance";
    }
}

BidirectionalThresholdController::BidirectionalThresholdController(
    const BidirectionalThresholdConfig& cfg,
    std::unique_ptr<ControlInput> input,
    std::unique_ptr<ControlOutput> increase,
    std::unique_ptr<ControlOutput> decrease)
    : Controller(cfg.name, cfg.historyLimit),
      threshold_(cfg.threshold),
      tolerance_(cfg.tolerance),
      intervalMs_(cfg.intervalMs),
      input_(std::move(input)),
      increase_(std::move(increase)),
      decrease_(std::move(decrease))
{
}

ToleranceZone BidirectionalThresholdController::classify(float value) const
{
    if (value > threshold_ + tolerance_) return ToleranceZone::Above;
    if (value < threshold_ - tolerance_) return ToleranceZone::Below;
    return ToleranceZone::Within;
}

void BidirectionalThresholdController::arm_(EpochMs nowMs)
{
    scheduler_.scheduleRead(nowMs + intervalMs_);
}

PollStatus BidirectionalThresholdController::onEvent_(const ControlEvent& e,
                                                      EpochMs nowMs,
                                                      ControlMessage& out)
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
    if (!increase_ || !decrease_) return fault_(ErrorCode::IoError);

    const ToleranceZone zone = classify(value);
    bool ok = true;
    switch (zone) {
    case ToleranceZone::Above:
        ok = increase_->deactivate() && ok;
        ok = decrease_->activate() && ok;
        break;
    case ToleranceZone::Below:
        ok = increase_->activate() && ok;
        ok = decrease_->deactivate() && ok;
        break;
    case ToleranceZone::Within:
    default:
        ok = increase_->deactivate() && ok;
        ok = decrease_->deactivate() && ok;
        break;
    }
    if (!ok) return fault_(ErrorCode::IoError);

    LOGD("%s: value=%.3f band=[%.3f..%.3f] -> %s",
         name(), (double)value,
         (double)(threshold_ - tolerance_), (double)(threshold_ + tolerance_),
         zoneContent_(zone));

    out = ControlMessage(name(), zoneContent_(zone), nowMs, sample);
    return PollStatus::Fired;
}
