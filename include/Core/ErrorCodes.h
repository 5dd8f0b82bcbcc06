#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    NotReady = 0,
    BadReading,
    IoError,
    UnexpectedAction,
    BadConfigJson,
    MissingField,
    InvalidType,
    InvalidTimeOfDay,
    InvalidInterval,
    GroupFull,
    EmitFailed,
    Failed
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::BadReading: return "BadReading";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::UnexpectedAction: return "UnexpectedAction";
    case ErrorCode::BadConfigJson: return "BadConfigJson";
    case ErrorCode::MissingField: return "MissingField";
    case ErrorCode::InvalidType: return "InvalidType";
    case ErrorCode::InvalidTimeOfDay: return "InvalidTimeOfDay";
    case ErrorCode::InvalidInterval: return "InvalidInterval";
    case ErrorCode::GroupFull: return "GroupFull";
    case ErrorCode::EmitFailed: return "EmitFailed";
    case ErrorCode::Failed: return "Failed";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NotReady:
    case ErrorCode::BadReading:
    case ErrorCode::IoError:
    case ErrorCode::EmitFailed:
        return true;
    default:
        return false;
    }
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
