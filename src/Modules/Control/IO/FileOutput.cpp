/**
 * @file FileOutput.cpp
 * @brief Implementation file.
 */

#include "FileOutput.h"

#include <stdio.h>
#include <string.h>

#define LOG_TAG "FileOut"
#include "Core/ModuleLog.h"

FileOutput::FileOutput(const char* outputId, const char* path)
    : ControlOutput(outputId)
{
    if (path) {
        strncpy(path_, path, sizeof(path_) - 1);
        path_[sizeof(path_) - 1] = '\0';
    }
}

bool FileOutput::writeRaw_(bool on)
{
    FILE* f = fopen(path_, "w");
    if (!f) {
        LOGW("%s: cannot open %s", id(), path_);
        return false;
    }
    const bool ok = fputs(on ? "1\n" : "0\n", f) >= 0;
    const bool closed = fclose(f) == 0;
    if (!ok || !closed) {
        LOGW("%s: write failed on %s", id(), path_);
        return false;
    }
    return true;
}
