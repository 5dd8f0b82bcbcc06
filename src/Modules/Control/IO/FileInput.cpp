/**
 * @file FileInput.cpp
 * @brief Implementation file.
 */

#include "FileInput.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define LOG_TAG "FileIn"
#include "Core/ModuleLog.h"

FileInput::FileInput(const char* inputId, const char* path, float scale)
    : ControlInput(inputId), scale_(scale)
{
    if (path) {
        strncpy(path_, path, sizeof(path_) - 1);
        path_[sizeof(path_) - 1] = '\0';
    }
}

bool FileInput::readRaw_(char* out, size_t outLen)
{
    FILE* f = fopen(path_, "r");
    if (!f) {
        LOGW("%s: cannot open %s", id(), path_);
        return false;
    }

    char line[Limits::Control::ValueBuf] = {0};
    const bool got = fgets(line, sizeof(line), f) != nullptr;
    fclose(f);
    if (!got) {
        LOGW("%s: empty read from %s", id(), path_);
        return false;
    }

    size_t len = strlen(line);
    while (len > 0 && isspace((unsigned char)line[len - 1])) line[--len] = '\0';

    if (scale_ == 1.0f) {
        snprintf(out, outLen, "%s", line);
        return true;
    }

    // scaled inputs must be numeric; leave malformed text to the controller
    char* end = nullptr;
    const float raw = strtof(line, &end);
    if (end == line || *end != '\0') {
        snprintf(out, outLen, "%s", line);
        return true;
    }
    snprintf(out, outLen, "%.3f", (double)(raw * scale_));
    return true;
}
