#pragma once
/**
 * @file MessageEmitter.h
 * @brief Serializes message batches to JSON and hands them to a transport.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/Control/Engine/ControlMessage.h"
#include "MessageTransport.h"

/**
 * @brief JSON array of {"name","content","timestamp","read_state"} per batch.
 *
 * Delivery is fire-and-forget: a failed send is logged and counted, never retried.
 */
class MessageEmitter {
public:
    MessageEmitter() = default;
    explicit MessageEmitter(const MessageTransport& transport) : transport_(transport) {}

    void setTransport(const MessageTransport& transport) { transport_ = transport; }
    bool hasTransport() const { return transport_.send != nullptr; }

    /** @brief Serialize a batch without sending it. */
    bool serialize(const ControlMessage* msgs, size_t count, char* out, size_t outLen) const;

    /**
     * @brief Serialize and send a batch. An empty batch sends nothing.
     * @return false on serialization or transport failure.
     */
    bool emit(const ControlMessage* msgs, size_t count);

    uint32_t sentCount() const { return sentCount_; }
    uint32_t failedCount() const { return failedCount_; }
    /** @brief Code of the last failed emit; meaningful once failedCount() > 0. */
    ErrorCode lastError() const { return lastError_; }

private:
    MessageTransport transport_{};
    char payload_[Limits::Emitter::PayloadBuf] = {0};
    uint32_t sentCount_ = 0;
    uint32_t failedCount_ = 0;
    ErrorCode lastError_ = ErrorCode::Failed;
};
