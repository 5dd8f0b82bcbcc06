/**
 * @file main.cpp
 * @brief Host entry point and module wiring.
 */
#include <signal.h>
#include <stdio.h>
#include <string.h>

/// Load Core Functions
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/LogDispatcher.h"
#include "Core/ConfigStore.h"
#include "Core/SystemLimits.h"

/// Load Modules
#include "Modules/Logs/LogConsoleSink/LogConsoleSink.h"
#include "Modules/Control/ControllerGroup.h"
#include "Modules/Control/ControllerFactory.h"
#include "Modules/Emitter/EmitterConfig.h"
#include "Modules/Emitter/MessageEmitter.h"
#include "Modules/Runtime/ControlRuntime.h"

#define LOG_TAG "Main"
#include "Core/ModuleLog.h"

static LogHub          logHub;
static LogSinkRegistry logSinks;
static LogDispatcher   logDispatcher(logHub, logSinks.service());
static LogConsoleSink  consoleSink(stderr, true);

static ConfigStore       registry;
static ControllerGroup   group;
static ControllerFactory factory;
static MessageEmitter    emitter;
static EmitterConfig     emitterConfig;
static ControlRuntime    runtime(group, &logDispatcher);

static char configBuf[Limits::ConfigFileMax] = {0};

static void onSignal(int)
{
    runtime.requestStop();
}

static bool readConfigFile(const char* path)
{
    FILE* f = fopen(path, "rb");
    if (!f) {
        LOGE("cannot open config %s", path);
        return false;
    }

    const size_t n = fread(configBuf, 1, sizeof(configBuf) - 1, f);
    const bool readErr = ferror(f) != 0;
    const bool tooLarge = (n == sizeof(configBuf) - 1) && (fgetc(f) != EOF);
    fclose(f);

    if (readErr) {
        LOGE("read error on %s", path);
        return false;
    }
    if (tooLarge) {
        LOGE("config %s larger than %u bytes", path, (unsigned)(sizeof(configBuf) - 1));
        return false;
    }
    configBuf[n] = '\0';
    return true;
}

static int fail()
{
    logDispatcher.drain();
    return 1;
}

int main(int argc, char** argv)
{
    logHub.init(Limits::LogQueueLen);
    Log::setHub(logHub.service());
    if (!consoleSink.attach(*logSinks.service())) {
        fprintf(stderr, "console log sink not registered\n");
    }

    if (argc != 2) {
        fprintf(stderr, "usage: %s <config.json>\n", argc > 0 ? argv[0] : "equilibrium");
        return 1;
    }

    if (!runtime.registerConfig(registry) || !emitterConfig.registerConfig(registry)) {
        LOGE("config registry full");
        return fail();
    }

    if (!readConfigFile(argv[1])) return fail();
    if (!registry.applyJson(configBuf)) {
        LOGE("invalid runtime/emitter settings in %s", argv[1]);
        return fail();
    }

    char cfgJson[1024];
    if (registry.toJson(cfgJson, sizeof(cfgJson))) {
        LOGI("config: %s", cfgJson);
    }

    factory.setHistoryLimit(runtime.config().historyLimit);
    char err[160] = {0};
    if (!factory.buildFromJson(configBuf, group, err, sizeof(err))) {
        fprintf(stderr, "%s\n", err);
        return fail();
    }

    if (emitterConfig.data().enabled) {
        if (!emitterConfig.configure(emitter)) return fail();
        runtime.setEmitter(&emitter);
    }

    signal(SIGINT, onSignal);
    signal(SIGTERM, onSignal);

    if (!runtime.run()) return fail();

    if (logHub.dropped() > 0) {
        fprintf(stderr, "log entries dropped: %lu\n", (unsigned long)logHub.dropped());
    }
    return 0;
}
