#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief Log ring length used by `LogHub` (`LogHub::init`). */
constexpr uint16_t LogQueueLen = 64;
/** @brief Maximum number of sinks stored in `LogSinkRegistry`. */
constexpr uint8_t MaxLogSinks = 4;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief JSON capacity for `ConfigStore::applyJson` root document. */
constexpr size_t JsonConfigApplyBuf = 2048;
/** @brief JSON capacity for the whole configuration file parsed by `ControllerFactory`. */
constexpr size_t JsonControllersBuf = 16384;
/** @brief Maximum configuration file size read by the host entry point. */
constexpr size_t ConfigFileMax = 16384;

/** @brief Control engine limits grouped by concern. */
namespace Control {

/** @brief Maximum number of controllers owned by one `ControllerGroup`. */
constexpr uint8_t MaxControllers = 32;
/** @brief Upper bound for per-scheduler fired history retention. */
constexpr uint16_t MaxHistory = 64;
/** @brief Controller name buffer (including terminator). */
constexpr size_t NameBuf = 32;
/** @brief Message content buffer (including terminator). */
constexpr size_t ContentBuf = 32;
/** @brief Sampled value buffer used by events, messages and inputs. */
constexpr size_t ValueBuf = 32;
/** @brief Filesystem path buffer for file-backed IO. */
constexpr size_t PathBuf = 128;

}  // namespace Control

/** @brief Message emitter limits. */
namespace Emitter {

/** @brief JSON capacity for one emitted batch (`MessageEmitter::emit`). */
constexpr size_t JsonBatchBuf = 8192;
/** @brief Serialized payload buffer handed to transports. */
constexpr size_t PayloadBuf = 8192;
/** @brief Endpoint URL buffer of the HTTP transport. */
constexpr size_t UrlBuf = 256;
/** @brief Whole-request timeout of one HTTP POST. */
constexpr long HttpTimeoutMs = 5000;

}  // namespace Emitter

}  // namespace Limits
