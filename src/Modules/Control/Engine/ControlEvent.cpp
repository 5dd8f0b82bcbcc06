/**
 * @file ControlEvent.cpp
 * @brief Implementation file.
 */
#include "ControlEvent.h"
#include <string.h>

void ControlEvent::setValue(const char* value)
{
    if (!value) {
        hasValue_ = false;
        value_[0] = '\0';
        return;
    }
    strncpy(value_, value, sizeof(value_) - 1);
    value_[sizeof(value_) - 1] = '\0';
    hasValue_ = true;
}
