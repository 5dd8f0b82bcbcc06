#pragma once
/**
 * @file FileOutput.h
 * @brief Output writing "1"/"0" to a file (sysfs GPIO style).
 */

#include "ControlOutput.h"

class FileOutput : public ControlOutput {
public:
    FileOutput(const char* outputId, const char* path);

    const char* path() const { return path_; }

protected:
    bool writeRaw_(bool on) override;

private:
    char path_[Limits::Control::PathBuf] = {0};
};
