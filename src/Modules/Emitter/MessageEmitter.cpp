/**
 * @file MessageEmitter.cpp
 * @brief Implementation file.
 */
#include "MessageEmitter.h"

#include <ArduinoJson.h>
#include <string.h>

#include "Core/ErrorCodes.h"
#include "Core/TimeUtil.h"

#define LOG_TAG "Emitter"
#include "Core/ModuleLog.h"

bool MessageEmitter::serialize(const ControlMessage* msgs, size_t count, char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;
    if (!msgs && count > 0) return false;

    StaticJsonDocument<Limits::Emitter::JsonBatchBuf> doc;
    JsonArray arr = doc.to<JsonArray>();

    for (size_t i = 0; i < count; ++i) {
        const ControlMessage& m = msgs[i];
        JsonObject o = arr.createNestedObject();
        if (o.isNull()) {
            LOGW("batch too large for JSON doc (%u messages)", (unsigned)count);
            return false;
        }

        char ts[32] = {0};
        if (!TimeUtil::formatIso8601(m.timestampMs(), ts, sizeof(ts))) return false;

        o["name"] = m.controllerName();
        o["content"] = m.content();
        o["timestamp"] = ts;  // char[] is copied into the document
        if (m.hasReadState()) {
            o["read_state"] = m.readState();
        } else {
            o["read_state"] = nullptr;
        }
    }

    if (doc.overflowed()) {
        LOGW("JSON doc overflowed");
        return false;
    }
    if (measureJson(doc) >= outLen) {
        LOGW("payload too large (%u bytes)", (unsigned)measureJson(doc));
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

bool MessageEmitter::emit(const ControlMessage* msgs, size_t count)
{
    if (count == 0) return true;

    if (!hasTransport()) {
        ++failedCount_;
        lastError_ = ErrorCode::EmitFailed;
        LOGW("emit: %s (no transport)", errorCodeStr(ErrorCode::EmitFailed));
        return false;
    }
    if (!serialize(msgs, count, payload_, sizeof(payload_))) {
        ++failedCount_;
        lastError_ = ErrorCode::EmitFailed;
        LOGW("emit: %s (serialize)", errorCodeStr(ErrorCode::EmitFailed));
        return false;
    }
    if (!transport_.send(transport_.ctx, payload_, strlen(payload_))) {
        ++failedCount_;
        lastError_ = ErrorCode::EmitFailed;
        LOGW("emit: %s (transport)", errorCodeStr(ErrorCode::EmitFailed));
        return false;
    }

    ++sentCount_;
    LOGD("emitted %u message(s)", (unsigned)count);
    return true;
}
