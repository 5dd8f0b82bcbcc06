#pragma once
/**
 * @file ConfigStore.h
 * @brief In-memory configuration store with JSON import/export.
 */

// ConfigStore = registry of typed variables grouped by module.
//
// - values live in the owning module, the store only keeps metadata
// - applyJson() takes a {module: {name: value}} patch and notifies the
//   handlers of every variable that changed

#include <cstdint>
#include <cstring>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/Log.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variable metadata and JSON import/export.
 */
class ConfigStore {
public:
    ConfigStore() = default;

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and notify handlers when it changed. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Set a char array config value and notify handlers when it changed. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    /** @brief Serialize all registered config as {module: {name: value}}. */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /**
     * @brief Apply JSON patch to registered config variables.
     *
     * Unknown modules and keys are ignored. A value of the wrong JSON type
     * leaves the variable unchanged and makes the call return false.
     */
    bool applyJson(const char* json);

    uint16_t count() const { return _metaCount; }

private:
    ConfigMeta _meta[Limits::MaxConfigVars];
    uint16_t _metaCount = 0;

    template<typename T, size_t H>
    static void notifyThunk_(void* var) { static_cast<ConfigVariable<T, H>*>(var)->notify(); }

    bool writeValue_(const ConfigMeta& m, char* out, size_t outLen, size_t& pos) const;
    const ConfigMeta* find_(const char* module, const char* name) const;
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= Limits::MaxConfigVars) {
        Log::warn(LOG_TAG_CORE, "config table full, dropping %s.%s",
                  var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return false;
    }
    if (find_(var.moduleName, var.jsonName)) {
        Log::warn(LOG_TAG_CORE, "duplicate config key %s.%s",
                  var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return false;
    }

    ConfigMeta& m = _meta[_metaCount++];

    m.module   = var.moduleName;
    m.name     = var.jsonName;
    m.type     = var.type;
    m.valuePtr = (void*)var.value;
    m.size     = var.size;
    m.notify   = {&ConfigStore::notifyThunk_<T, H>, (void*)&var};
    return true;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use set(var, const char*) for char arrays");
    if (!var.value) return false;

    if (*(var.value) == value) return true;
    *(var.value) = value;
    var.notify();
    return true;
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;

    memcpy(var.value, str, len);
    var.value[len] = '\0';
    var.notify();
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
