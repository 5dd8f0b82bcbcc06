/**
 * @file TimedOutputController.cpp
 * @brief Implementation file.
 */
#include "TimedOutputController.h"

#include <utility>

#include "Core/TimeUtil.h"

#define LOG_TAG "Timed"
#include "Core/ModuleLog.h"

TimedOutputController::TimedOutputController(const TimedOutputConfig& cfg,
                                             std::unique_ptr<ControlOutput> output)
    : Controller(cfg.name, cfg.historyLimit),
      start_(cfg.start),
      durationMs_(cfg.durationMs),
      output_(std::move(output))
{
}

EpochMs TimedOutputController::nextStartAfter(EpochMs nowMs) const
{
    const EpochMs today = TimeUtil::dayStartMs(nowMs) + start_.toMs();
    if (TimeUtil::timeOfDayMs(nowMs) < start_.toMs()) return today;
    return today + ControlDefaults::MsPerDay;
}

void TimedOutputController::arm_(EpochMs nowMs)
{
    scheduler_.scheduleOn(nextStartAfter(nowMs));
}

PollStatus TimedOutputController::onEvent_(const ControlEvent& e, EpochMs nowMs, ControlMessage& out)
{
    if (e.action() == ControlAction::Read) {
        LOGE("%s: unexpected action %s", name(), controlActionStr(e.action()));
        return fault_(ErrorCode::UnexpectedAction);
    }

    if (e.action() == ControlAction::On) {
        // Off is anchored on the calendar day of the fire instant.
        scheduler_.scheduleOff(TimeUtil::dayStartMs(nowMs) + start_.toMs() + durationMs_);
        if (!output_ || !output_->activate()) return fault_(ErrorCode::IoError);
        LOGI("%s: output ON", name());
        out = ControlMessage(name(), "Activated", nowMs);
        return PollStatus::Fired;
    }

    scheduler_.scheduleOn(nextStartAfter(nowMs));
    if (!output_ || !output_->deactivate()) return fault_(ErrorCode::IoError);
    LOGI("%s: output OFF", name());
    out = ControlMessage(name(), "Deactivated", nowMs);
    return PollStatus::Fired;
}
