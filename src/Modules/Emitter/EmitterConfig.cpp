/**
 * @file EmitterConfig.cpp
 * @brief Implementation file.
 */
#include "EmitterConfig.h"

#include <string.h>

#define LOG_TAG "EmitCfg"
#include "Core/ModuleLog.h"

bool EmitterConfig::registerConfig(ConfigStore& cfg)
{
    return cfg.registerVar(enabledVar_) &&
           cfg.registerVar(transportVar_) &&
           cfg.registerVar(pathVar_) &&
           cfg.registerVar(urlVar_);
}

bool EmitterConfig::configure(MessageEmitter& emitter)
{
    if (strcmp(cfgData_.transport, "stdout") == 0) {
        emitter.setTransport(MessageTransports::stdoutTransport());
        LOGI("emitter -> stdout");
        return true;
    }

    if (strcmp(cfgData_.transport, "file") == 0) {
        if (cfgData_.path[0] == '\0') {
            LOGE("emitter: file transport needs a path");
            return false;
        }
        snprintf(fileTarget_.path, sizeof(fileTarget_.path), "%s", cfgData_.path);
        emitter.setTransport(MessageTransports::fileTransport(fileTarget_));
        LOGI("emitter -> %s", fileTarget_.path);
        return true;
    }

    if (strcmp(cfgData_.transport, "http") == 0) {
        if (cfgData_.url[0] == '\0') {
            LOGE("emitter: http transport needs a url");
            return false;
        }
        snprintf(httpTarget_.url, sizeof(httpTarget_.url), "%s", cfgData_.url);
        emitter.setTransport(MessageTransports::httpTransport(httpTarget_));
        LOGI("emitter -> POST %s", httpTarget_.url);
        return true;
    }

    LOGE("emitter: unknown transport '%s'", cfgData_.transport);
    return false;
}
