/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

void LogHub::init(uint16_t queueLen) {
    if (queueLen == 0 || queueLen > Limits::LogQueueLen) queueLen = Limits::LogQueueLen;
    cap_ = queueLen;
    head_ = 0;
    count_ = 0;
    dropped_ = 0;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (count_ >= cap_) {
        ++dropped_;
        return false;
    }
    ring_[(uint16_t)((head_ + count_) % cap_)] = e;
    ++count_;
    return true;
}

bool LogHub::dequeue(LogEntry& out) {
    if (count_ == 0) return false;
    out = ring_[head_];
    head_ = (uint16_t)((head_ + 1) % cap_);
    --count_;
    return true;
}

bool LogHub::svcEnqueue_(void* ctx, const LogEntry& e) {
    if (!ctx) return false;
    return static_cast<LogHub*>(ctx)->enqueue(e);
}
