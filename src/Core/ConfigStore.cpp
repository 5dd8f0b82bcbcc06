/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "ConfigStore.h"

#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

const ConfigMeta* ConfigStore::find_(const char* module, const char* name) const
{
    if (!module || !name) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        if (strcmp(m.module, module) == 0 && strcmp(m.name, name) == 0) return &m;
    }
    return nullptr;
}

bool ConfigStore::writeValue_(const ConfigMeta& m, char* out, size_t outLen, size_t& pos) const
{
    int n = 0;
    switch (m.type) {
        case ConfigType::Int32:
            n = snprintf(out + pos, outLen - pos, "%ld", (long)*(int32_t*)m.valuePtr);
            break;
        case ConfigType::UInt8:
            n = snprintf(out + pos, outLen - pos, "%u", (unsigned)*(uint8_t*)m.valuePtr);
            break;
        case ConfigType::Bool:
            n = snprintf(out + pos, outLen - pos, "%s", (*(bool*)m.valuePtr) ? "true" : "false");
            break;
        case ConfigType::Float:
            n = snprintf(out + pos, outLen - pos, "%.3f", (double)*(float*)m.valuePtr);
            break;
        case ConfigType::CharArray:
            n = snprintf(out + pos, outLen - pos, "\"%s\"", (const char*)m.valuePtr);
            break;
        default:
            n = snprintf(out + pos, outLen - pos, "null");
            break;
    }
    if (n <= 0) return false;
    pos += (size_t)n;
    return pos < outLen;
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    const char* modules[Limits::MaxConfigVars];
    const uint8_t moduleCount = listModules(modules, (uint8_t)Limits::MaxConfigVars);

    size_t pos = 0;
    out[pos++] = '{';
    bool ok = true;

    for (uint8_t i = 0; i < moduleCount && ok; ++i) {
        int n = snprintf(out + pos, outLen - pos, "%s\"%s\":", (i > 0) ? "," : "", modules[i]);
        if (n <= 0 || pos + (size_t)n >= outLen) { ok = false; break; }
        pos += (size_t)n;

        bool truncated = false;
        toJsonModule(modules[i], out + pos, outLen - pos, &truncated);
        if (truncated) { ok = false; break; }
        pos += strlen(out + pos);
    }

    if (ok && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
        return true;
    }

    Log::warn(LOG_TAG_CORE, "toJson: buffer too small (%u)", (unsigned)outLen);
    out[(pos < outLen) ? pos : outLen - 1] = '\0';
    return false;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (!out || outLen == 0) return false;
    if (!module || module[0] == '\0') {
        out[0] = '\0';
        return false;
    }

    size_t pos = 0;
    out[pos++] = '{';

    bool any = false;
    bool truncatedLocal = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;

        if (any) {
            if (pos + 1 >= outLen) { truncatedLocal = true; break; }
            out[pos++] = ',';
        }

        int n = snprintf(out + pos, outLen - pos, "\"%s\":", m.name ? m.name : "");
        if (n <= 0) break;
        pos += (size_t)n;
        if (pos >= outLen) { truncatedLocal = true; break; }

        if (!writeValue_(m, out, outLen, pos)) { truncatedLocal = true; break; }

        any = true;
    }

    if (!truncatedLocal && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        truncatedLocal = true;
        out[(pos < outLen) ? pos : outLen - 1] = '\0';
    }

    if (truncated) *truncated = truncatedLocal;
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;
    Log::debug(LOG_TAG_CORE, "applyJson: start");

    // Only registered keys are kept, the rest of the document is skipped while parsing.
    StaticJsonDocument<Limits::JsonConfigApplyBuf> filter;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        filter[m.module][m.name] = true;
    }

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    const DeserializationError err = deserializeJson(doc, json, DeserializationOption::Filter(filter));
    if (err) {
        Log::warn(LOG_TAG_CORE, "applyJson: parse error %s", err.c_str());
        return false;
    }
    if (!doc.is<JsonObjectConst>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: root is not an object");
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    bool allOk = true;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        JsonVariantConst mod = root[m.module];
        if (!mod.is<JsonObjectConst>()) continue;
        JsonVariantConst v = mod[m.name];
        if (v.isNull()) continue;

        bool changed = false;
        bool typeOk = true;

        switch (m.type) {
        case ConfigType::Int32: {
            if (!v.is<int32_t>()) { typeOk = false; break; }
            const int32_t nv = v.as<int32_t>();
            if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::UInt8: {
            if (!v.is<uint8_t>()) { typeOk = false; break; }
            const uint8_t nv = v.as<uint8_t>();
            if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Bool: {
            if (!v.is<bool>()) { typeOk = false; break; }
            const bool nv = v.as<bool>();
            if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Float: {
            if (!v.is<float>()) { typeOk = false; break; }
            const float nv = v.as<float>();
            if (*(float*)m.valuePtr != nv) { *(float*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::CharArray: {
            if (!v.is<const char*>() || m.size == 0) { typeOk = false; break; }
            const char* s = v.as<const char*>();
            size_t len = strlen(s);
            if (len >= m.size) len = m.size - 1;

            // compare before writing to avoid spurious notifications
            if (strncmp((char*)m.valuePtr, s, len) != 0 || ((char*)m.valuePtr)[len] != '\0') {
                memcpy(m.valuePtr, s, len);
                ((char*)m.valuePtr)[len] = '\0';
                changed = true;
            }
            break;
        }
        }

        if (!typeOk) {
            Log::warn(LOG_TAG_CORE, "applyJson: bad type for %s.%s", m.module, m.name);
            allOk = false;
            continue;
        }

        if (changed) {
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
            if (m.notify.fn) m.notify.fn(m.notify.var);
        }
    }
    Log::debug(LOG_TAG_CORE, "applyJson: done");
    return allOk;
}
