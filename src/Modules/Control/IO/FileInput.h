#pragma once
/**
 * @file FileInput.h
 * @brief Input reading the first line of a file (sysfs/hwmon style).
 */

#include "ControlInput.h"

class FileInput : public ControlInput {
public:
    /**
     * @param scale Multiplier applied to numeric content (e.g. 0.001 for
     *              millidegree hwmon files). 1.0 passes the text through as-is.
     */
    FileInput(const char* inputId, const char* path, float scale = 1.0f);

    const char* path() const { return path_; }

protected:
    bool readRaw_(char* out, size_t outLen) override;

private:
    char path_[Limits::Control::PathBuf] = {0};
    float scale_ = 1.0f;
};
