#pragma once
/**
 * @file MessageTransport.h
 * @brief Outbound sink for serialized message batches.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/SystemLimits.h"

/** @brief Delivers one payload; returns false when delivery failed. */
typedef bool (*MessageSendFn)(void* ctx, const char* payload, size_t len);

struct MessageTransport {
    MessageSendFn send = nullptr;
    void* ctx = nullptr;
};

namespace MessageTransports {

/** @brief One JSON document per line on stdout. */
MessageTransport stdoutTransport();

/** @brief Context of the append-to-file transport. */
struct FileTarget {
    char path[Limits::Control::PathBuf] = {0};
};

/** @brief Append each payload plus a newline to `target.path`. */
MessageTransport fileTransport(FileTarget& target);

/** @brief Context of the HTTP transport; `lastStatus` is 0 when no response arrived. */
struct HttpTarget {
    char url[Limits::Emitter::UrlBuf] = {0};
    long timeoutMs = Limits::Emitter::HttpTimeoutMs;
    long lastStatus = 0;
    uint32_t attempts = 0;
};

/**
 * @brief POST each payload as application/json to `target.url`.
 *
 * Any transfer error or non-2xx status counts as a failed send. One attempt per payload.
 */
MessageTransport httpTransport(HttpTarget& target);

}  // namespace MessageTransports
