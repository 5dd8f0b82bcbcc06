/**
 * @file ControllerGroup.cpp
 * @brief Implementation file.
 */
#include "ControllerGroup.h"

#include <string.h>
#include <utility>

#define LOG_TAG "Group"
#include "Core/ModuleLog.h"

bool ControllerGroup::add(std::unique_ptr<Controller> controller)
{
    if (!controller) return false;
    if (count_ >= Limits::Control::MaxControllers) {
        LOGE("group full (%u), rejecting %s", (unsigned)Limits::Control::MaxControllers, controller->name());
        return false;
    }
    controllers_[count_++] = std::move(controller);
    return true;
}

Controller* ControllerGroup::at(uint8_t idx)
{
    if (idx >= count_) return nullptr;
    return controllers_[idx].get();
}

const Controller* ControllerGroup::at(uint8_t idx) const
{
    if (idx >= count_) return nullptr;
    return controllers_[idx].get();
}

Controller* ControllerGroup::find(const char* name)
{
    if (!name) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(controllers_[i]->name(), name) == 0) return controllers_[i].get();
    }
    return nullptr;
}

bool ControllerGroup::start(EpochMs nowMs)
{
    bool ok = true;
    for (uint8_t i = 0; i < count_; ++i) {
        if (controllers_[i]->isStarted()) continue;
        if (!controllers_[i]->start(nowMs)) {
            LOGE("start failed: %s", controllers_[i]->name());
            ok = false;
        }
    }
    LOGI("started %u controller(s)", (unsigned)count_);
    return ok;
}

size_t ControllerGroup::poll(EpochMs nowMs, ControlMessage* out, size_t maxOut)
{
    lastFaultCount_ = 0;
    lastOverflowCount_ = 0;
    size_t written = 0;

    for (uint8_t i = 0; i < count_; ++i) {
        Controller* c = controllers_[i].get();
        ControlMessage msg;
        const PollStatus st = c->poll(nowMs, msg);

        if (st == PollStatus::Fault) {
            ++lastFaultCount_;
            LOGW("%s(%s) fault: %s", c->kind(), c->name(), errorCodeStr(c->lastError()));
            continue;
        }
        if (st != PollStatus::Fired) continue;

        if (!out || written >= maxOut) {
            ++lastOverflowCount_;
            LOGW("message buffer full, dropping %s", c->name());
            continue;
        }
        out[written++] = msg;
    }
    return written;
}
