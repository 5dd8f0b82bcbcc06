/**
 * @file ControllerFactory.cpp
 * @brief Implementation file.
 */
#include "ControllerFactory.h"

#include <ArduinoJson.h>
#include <string.h>
#include <memory>
#include <utility>

#include "Core/TimeUtil.h"
#include "Modules/Control/Controllers/BidirectionalThresholdController.h"
#include "Modules/Control/Controllers/ThresholdController.h"
#include "Modules/Control/Controllers/TimedOutputController.h"
#include "Modules/Control/IO/CachedInput.h"
#include "Modules/Control/IO/FileInput.h"
#include "Modules/Control/IO/FileOutput.h"
#include "Modules/Control/IO/LogOutput.h"

#define LOG_TAG "CtrlFact"
#include "Core/ModuleLog.h"

namespace {

/** @brief Failure location and code while walking one entry. */
struct BuildError {
    ErrorCode code = ErrorCode::Failed;
    char where[64] = {0};
};

bool fail_(BuildError& e, ErrorCode code, size_t idx, const char* field)
{
    e.code = code;
    snprintf(e.where, sizeof(e.where), "controllers[%u].%s", (unsigned)idx, field ? field : "?");
    return false;
}

bool isNumber_(JsonVariantConst v)
{
    return v.is<float>() || v.is<double>() || v.is<int32_t>() || v.is<uint32_t>();
}

bool readRequiredFloat_(JsonObjectConst o, const char* key, float& out, size_t idx, BuildError& e)
{
    if (!o.containsKey(key)) return fail_(e, ErrorCode::MissingField, idx, key);
    JsonVariantConst v = o[key];
    if (!isNumber_(v)) return fail_(e, ErrorCode::InvalidType, idx, key);
    out = v.as<float>();
    return true;
}

bool readOptionalFloat_(JsonObjectConst o, const char* key, float& out, size_t idx, BuildError& e)
{
    if (!o.containsKey(key)) return true;
    JsonVariantConst v = o[key];
    if (!isNumber_(v)) return fail_(e, ErrorCode::InvalidType, idx, key);
    out = v.as<float>();
    return true;
}

bool readPositiveMs_(JsonObjectConst o, const char* key, bool required, int64_t& out, size_t idx, BuildError& e)
{
    if (!o.containsKey(key)) {
        if (required) return fail_(e, ErrorCode::MissingField, idx, key);
        return true;
    }
    JsonVariantConst v = o[key];
    if (!v.is<int64_t>()) return fail_(e, ErrorCode::InvalidType, idx, key);
    const int64_t ms = v.as<int64_t>();
    if (ms <= 0) return fail_(e, ErrorCode::InvalidInterval, idx, key);
    out = ms;
    return true;
}

std::unique_ptr<ControlInput> buildInput_(JsonObjectConst o, const char* ownerName, size_t idx, BuildError& e)
{
    if (!o.containsKey("input")) {
        fail_(e, ErrorCode::MissingField, idx, "input");
        return nullptr;
    }
    JsonVariantConst ioObj = o["input"];
    if (!ioObj.is<JsonObjectConst>()) {
        fail_(e, ErrorCode::InvalidType, idx, "input");
        return nullptr;
    }

    const char* kind = ioObj["kind"] | "";
    if (strcmp(kind, "file") == 0) {
        const char* path = ioObj["path"] | "";
        if (path[0] == '\0') {
            fail_(e, ErrorCode::MissingField, idx, "input.path");
            return nullptr;
        }
        JsonVariantConst scaleVar = ioObj["scale"];
        float scale = 1.0f;
        if (!scaleVar.isNull()) {
            if (!isNumber_(scaleVar)) {
                fail_(e, ErrorCode::InvalidType, idx, "input.scale");
                return nullptr;
            }
            scale = scaleVar.as<float>();
        }
        return std::unique_ptr<ControlInput>(new FileInput(ownerName, path, scale));
    }

    if (strcmp(kind, "constant") == 0) {
        JsonVariantConst value = ioObj["value"];
        char buf[Limits::Control::ValueBuf] = {0};
        if (value.is<const char*>()) {
            snprintf(buf, sizeof(buf), "%s", value.as<const char*>());
        } else if (isNumber_(value)) {
            snprintf(buf, sizeof(buf), "%g", value.as<double>());
        } else if (value.isNull()) {
            fail_(e, ErrorCode::MissingField, idx, "input.value");
            return nullptr;
        } else {
            fail_(e, ErrorCode::InvalidType, idx, "input.value");
            return nullptr;
        }
        return std::unique_ptr<ControlInput>(new CachedInput(ownerName, buf));
    }

    fail_(e, kind[0] == '\0' ? ErrorCode::MissingField : ErrorCode::InvalidType, idx, "input.kind");
    return nullptr;
}

std::unique_ptr<ControlOutput> buildOutput_(JsonObjectConst o, const char* key, const char* ownerName,
                                            size_t idx, BuildError& e)
{
    if (!o.containsKey(key)) {
        fail_(e, ErrorCode::MissingField, idx, key);
        return nullptr;
    }
    JsonVariantConst ioObj = o[key];
    if (!ioObj.is<JsonObjectConst>()) {
        fail_(e, ErrorCode::InvalidType, idx, key);
        return nullptr;
    }

    char id[Limits::Control::NameBuf];
    if (strcmp(key, "output") == 0) {
        snprintf(id, sizeof(id), "%s", ownerName);
    } else {
        snprintf(id, sizeof(id), "%s.%s", ownerName, key);
    }

    char field[24];
    const char* kind = ioObj["kind"] | "";
    if (strcmp(kind, "file") == 0) {
        const char* path = ioObj["path"] | "";
        if (path[0] == '\0') {
            snprintf(field, sizeof(field), "%s.path", key);
            fail_(e, ErrorCode::MissingField, idx, field);
            return nullptr;
        }
        return std::unique_ptr<ControlOutput>(new FileOutput(id, path));
    }
    if (strcmp(kind, "log") == 0) {
        return std::unique_ptr<ControlOutput>(new LogOutput(id));
    }

    snprintf(field, sizeof(field), "%s.kind", key);
    fail_(e, kind[0] == '\0' ? ErrorCode::MissingField : ErrorCode::InvalidType, idx, field);
    return nullptr;
}

std::unique_ptr<Controller> buildThreshold_(JsonObjectConst o, const char* name, uint16_t historyLimit,
                                            size_t idx, BuildError& e)
{
    ThresholdConfig cfg;
    cfg.name = name;
    cfg.historyLimit = historyLimit;
    if (!readRequiredFloat_(o, "threshold", cfg.threshold, idx, e)) return nullptr;
    if (o.containsKey("inverted")) {
        if (!o["inverted"].is<bool>()) {
            fail_(e, ErrorCode::InvalidType, idx, "inverted");
            return nullptr;
        }
        cfg.inverted = o["inverted"].as<bool>();
    }
    if (!readPositiveMs_(o, "interval_ms", false, cfg.intervalMs, idx, e)) return nullptr;

    std::unique_ptr<ControlInput> input = buildInput_(o, name, idx, e);
    if (!input) return nullptr;
    std::unique_ptr<ControlOutput> output = buildOutput_(o, "output", name, idx, e);
    if (!output) return nullptr;

    return std::unique_ptr<Controller>(
        new ThresholdController(cfg, std::move(input), std::move(output)));
}

std::unique_ptr<Controller> buildBidirectional_(JsonObjectConst o, const char* name, uint16_t historyLimit,
                                                size_t idx, BuildError& e)
{
    BidirectionalThresholdConfig cfg;
    cfg.name = name;
    cfg.historyLimit = historyLimit;
    if (!readRequiredFloat_(o, "threshold", cfg.threshold, idx, e)) return nullptr;
    if (!readOptionalFloat_(o, "tolerance", cfg.tolerance, idx, e)) return nullptr;
    if (cfg.tolerance < 0.0f) {
        fail_(e, ErrorCode::InvalidType, idx, "tolerance");
        return nullptr;
    }
    if (!readPositiveMs_(o, "interval_ms", false, cfg.intervalMs, idx, e)) return nullptr;

    std::unique_ptr<ControlInput> input = buildInput_(o, name, idx, e);
    if (!input) return nullptr;
    std::unique_ptr<ControlOutput> increase = buildOutput_(o, "increase", name, idx, e);
    if (!increase) return nullptr;
    std::unique_ptr<ControlOutput> decrease = buildOutput_(o, "decrease", name, idx, e);
    if (!decrease) return nullptr;

    return std::unique_ptr<Controller>(new BidirectionalThresholdController(
        cfg, std::move(input), std::move(increase), std::move(decrease)));
}

std::unique_ptr<Controller> buildTimed_(JsonObjectConst o, const char* name, uint16_t historyLimit,
                                        size_t idx, BuildError& e)
{
    TimedOutputConfig cfg;
    cfg.name = name;
    cfg.historyLimit = historyLimit;

    if (!o.containsKey("start")) {
        fail_(e, ErrorCode::MissingField, idx, "start");
        return nullptr;
    }
    if (!o["start"].is<const char*>()) {
        fail_(e, ErrorCode::InvalidType, idx, "start");
        return nullptr;
    }
    if (!TimeUtil::parseTimeOfDay(o["start"].as<const char*>(), cfg.start)) {
        fail_(e, ErrorCode::InvalidTimeOfDay, idx, "start");
        return nullptr;
    }
    if (!readPositiveMs_(o, "duration_ms", true, cfg.durationMs, idx, e)) return nullptr;

    std::unique_ptr<ControlOutput> output = buildOutput_(o, "output", name, idx, e);
    if (!output) return nullptr;

    return std::unique_ptr<Controller>(new TimedOutputController(cfg, std::move(output)));
}

std::unique_ptr<Controller> buildOne_(JsonVariantConst entry, uint16_t historyLimit, size_t idx, BuildError& e)
{
    if (!entry.is<JsonObjectConst>()) {
        fail_(e, ErrorCode::InvalidType, idx, "entry");
        return nullptr;
    }
    JsonObjectConst o = entry.as<JsonObjectConst>();

    if (!o.containsKey("type")) {
        fail_(e, ErrorCode::MissingField, idx, "type");
        return nullptr;
    }
    if (!o.containsKey("name")) {
        fail_(e, ErrorCode::MissingField, idx, "name");
        return nullptr;
    }
    if (!o["type"].is<const char*>()) {
        fail_(e, ErrorCode::InvalidType, idx, "type");
        return nullptr;
    }
    if (!o["name"].is<const char*>() || o["name"].as<const char*>()[0] == '\0') {
        fail_(e, ErrorCode::InvalidType, idx, "name");
        return nullptr;
    }

    const char* type = o["type"].as<const char*>();
    const char* name = o["name"].as<const char*>();

    if (strcmp(type, "threshold") == 0) return buildThreshold_(o, name, historyLimit, idx, e);
    if (strcmp(type, "bidirectional") == 0) return buildBidirectional_(o, name, historyLimit, idx, e);
    if (strcmp(type, "timed") == 0) return buildTimed_(o, name, historyLimit, idx, e);

    fail_(e, ErrorCode::InvalidType, idx, "type");
    return nullptr;
}

}  // namespace

bool ControllerFactory::buildFromJson(const char* json, ControllerGroup& group, char* err, size_t errLen)
{
    static StaticJsonDocument<Limits::JsonControllersBuf> doc;
    doc.clear();

    lastError_ = ErrorCode::Failed;
    lastWhere_[0] = '\0';

    auto reject = [&](ErrorCode code, const char* where) {
        lastError_ = code;
        snprintf(lastWhere_, sizeof(lastWhere_), "%s", where);
        if (err && errLen > 0) writeErrorJson(err, errLen, code, where);
        LOGE("config rejected: %s at %s", errorCodeStr(code), where);
        return false;
    };

    if (!json || json[0] == '\0') return reject(ErrorCode::BadConfigJson, "controllers");

    StaticJsonDocument<64> filter;
    filter["controllers"] = true;

    const DeserializationError derr = deserializeJson(doc, json, DeserializationOption::Filter(filter));
    if (derr) {
        LOGW("parse error: %s", derr.c_str());
        return reject(ErrorCode::BadConfigJson, "controllers");
    }
    if (!doc.is<JsonObjectConst>()) return reject(ErrorCode::BadConfigJson, "root");

    JsonVariantConst list = doc["controllers"];
    if (list.isNull()) return reject(ErrorCode::MissingField, "controllers");
    if (!list.is<JsonArrayConst>()) return reject(ErrorCode::InvalidType, "controllers");

    JsonArrayConst arr = list.as<JsonArrayConst>();
    const size_t total = arr.size();
    if (group.count() + total > Limits::Control::MaxControllers) {
        return reject(ErrorCode::GroupFull, "controllers");
    }

    std::unique_ptr<Controller> built[Limits::Control::MaxControllers];
    size_t n = 0;
    for (JsonVariantConst entry : arr) {
        BuildError e;
        built[n] = buildOne_(entry, historyLimit_, n, e);
        if (!built[n]) return reject(e.code, e.where);
        ++n;
    }

    for (size_t i = 0; i < n; ++i) {
        if (!group.add(std::move(built[i]))) return reject(ErrorCode::GroupFull, "controllers");
    }

    LOGI("built %u controller(s)", (unsigned)n);
    return true;
}
