/**
 * @file ControlMessage.cpp
 * @brief Implementation file.
 */
#include "ControlMessage.h"
#include <string.h>

static void copyField(char* dst, size_t dstLen, const char* src)
{
    if (!src) src = "";
    strncpy(dst, src, dstLen - 1);
    dst[dstLen - 1] = '\0';
}

ControlMessage::ControlMessage(const char* name, const char* content, EpochMs timestampMs, const char* readState)
    : timestampMs_(timestampMs)
{
    copyField(name_, sizeof(name_), name);
    copyField(content_, sizeof(content_), content);
    if (readState) {
        copyField(readState_, sizeof(readState_), readState);
        hasReadState_ = true;
    }
}

bool ControlMessage::operator==(const ControlMessage& other) const
{
    if (timestampMs_ != other.timestampMs_) return false;
    if (hasReadState_ != other.hasReadState_) return false;
    if (strcmp(name_, other.name_) != 0) return false;
    if (strcmp(content_, other.content_) != 0) return false;
    return !hasReadState_ || strcmp(readState_, other.readState_) == 0;
}
