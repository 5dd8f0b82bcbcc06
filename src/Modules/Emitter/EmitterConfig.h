#pragma once
/**
 * @file EmitterConfig.h
 * @brief "emitter" config module and transport selection.
 */
#include "Core/ConfigStore.h"
#include "MessageEmitter.h"

struct EmitterConfigData {
    bool enabled = true;
    char transport[16] = "stdout";   // "stdout" | "file" | "http"
    char path[Limits::Control::PathBuf] = {0};
    char url[Limits::Emitter::UrlBuf] = {0};
};

class EmitterConfig {
public:
    /** @brief Register the emitter variables; false when the store rejects one. */
    bool registerConfig(ConfigStore& cfg);
    const EmitterConfigData& data() const { return cfgData_; }
    const MessageTransports::HttpTarget& httpTarget() const { return httpTarget_; }

    /**
     * @brief Bind `emitter` to the configured transport.
     * @return false for an unknown transport, a file transport without path
     *         or an http transport without url.
     */
    bool configure(MessageEmitter& emitter);

private:
    EmitterConfigData cfgData_{};
    MessageTransports::FileTarget fileTarget_{};
    MessageTransports::HttpTarget httpTarget_{};

    ConfigVariable<bool,0> enabledVar_ {
        "enabled","emitter",ConfigType::Bool,&cfgData_.enabled,0
    };
    ConfigVariable<char,0> transportVar_ {
        "transport","emitter",ConfigType::CharArray,(char*)cfgData_.transport,sizeof(cfgData_.transport)
    };
    ConfigVariable<char,0> pathVar_ {
        "path","emitter",ConfigType::CharArray,(char*)cfgData_.path,sizeof(cfgData_.path)
    };
    ConfigVariable<char,0> urlVar_ {
        "url","emitter",ConfigType::CharArray,(char*)cfgData_.url,sizeof(cfgData_.url)
    };
};
