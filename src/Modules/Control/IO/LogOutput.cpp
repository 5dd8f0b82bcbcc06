/**
 * @file LogOutput.cpp
 * @brief Implementation file.
 */

#include "LogOutput.h"

#define LOG_TAG "LogOut"
#include "Core/ModuleLog.h"

bool LogOutput::writeRaw_(bool on)
{
    LOGI("%s -> %s", id(), on ? "ON" : "OFF");
    return true;
}
