#pragma once
/**
 * @file ControllerFactory.h
 * @brief Builds controllers and their IO from the "controllers" JSON array.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Domain/ControlDefaults.h"
#include "ControllerGroup.h"

/**
 * @brief JSON to controller translation.
 *
 * All-or-nothing: when any entry is rejected nothing is added to the group and
 * `err` holds `{"ok":false,"err":{"code","where","retryable"}}`.
 */
class ControllerFactory {
public:
    explicit ControllerFactory(uint16_t historyLimit = ControlDefaults::HistoryLimit) : historyLimit_(historyLimit) {}

    void setHistoryLimit(uint16_t limit) { historyLimit_ = limit; }
    uint16_t historyLimit() const { return historyLimit_; }

    /**
     * @brief Parse `{"controllers":[...]}` (other root keys are ignored) and add every entry to `group`.
     * @return false on the first rejected entry; the group is left unchanged.
     */
    bool buildFromJson(const char* json, ControllerGroup& group, char* err, size_t errLen);

    /** @brief Error of the last failed buildFromJson(). */
    ErrorCode lastError() const { return lastError_; }
    /** @brief Location of the last error, e.g. "controllers[1].threshold". */
    const char* lastErrorWhere() const { return lastWhere_; }

private:
    uint16_t historyLimit_ = ControlDefaults::HistoryLimit;
    ErrorCode lastError_ = ErrorCode::Failed;
    char lastWhere_[64] = {0};
};
