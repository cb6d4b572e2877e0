#pragma once
/**
 * @file ConfigStore.h
 * @brief Configuration store fed by a JSON file, dotenv files and the environment.
 */

// Load order (later wins):
// 1. compiled defaults held by the owning modules
// 2. JSON config file ({"module": {"name": value}})
// 3. dotenv files (never override variables already present in the environment)
// 4. process environment

#include <cstdint>
#include <cstring>
#include <cstdlib>

#include "ConfigTypes.h"
#include "Core/ErrorCodes.h"
#include "Core/Log.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Registry of module config variables with JSON file and environment import.
 *
 * Modules register their variables in `init()`; `ModuleManager` then calls
 * `loadPersistent()` once before any `onConfigLoaded()` hook runs.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore() = default;

    template<typename T>
    void registerVar(ConfigVariable<T>& var);

    /** @brief Set a typed value. Returns false when the variable has no storage. */
    template<typename T>
    bool set(ConfigVariable<T>& var, const T& value);

    /** @brief Copy `str` into a char array variable, truncated to its size. */
    bool set(ConfigVariable<char>& var, const char* str);

    /** @brief JSON config file read by loadPersistent(). Empty means none. */
    void setFilePath(const char* path);
    /** @brief Extra dotenv file read by loadPersistent() before the environment. */
    void addEnvFile(const char* path);

    /**
     * @brief Load file, dotenv files and environment into registered variables.
     * @return false only when an explicitly configured JSON file cannot be read or parsed.
     */
    bool loadPersistent();

    /** @brief Read a JSON config file and apply it (`NotFound`, `IoError`, `BadPayload`). */
    bool loadFile(const char* path, ErrorCode* err = nullptr);
    /** @brief Apply a JSON document to registered config variables. */
    bool applyJson(const char* json);
    /** @brief Apply environment overrides for variables carrying an env key. */
    uint8_t applyEnv();
    /** @brief Export KEY=VALUE lines of a dotenv file without overriding the environment. */
    static uint8_t loadEnvFile(const char* path);

    /** @brief Serialize a single module's config (flat object, secrets masked). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names in registration order. */
    uint8_t listModules(const char** out, uint8_t max) const;

private:
    ConfigMeta _meta[MAX_CONFIG_VARS];
    uint16_t _metaCount = 0;

    char _filePath[Limits::PathBuf] = {0};
    static constexpr uint8_t MAX_ENV_FILES = 4;
    char _envFiles[MAX_ENV_FILES][Limits::PathBuf] = {};
    uint8_t _envFileCount = 0;

    bool applyText_(ConfigMeta& m, const char* text);
};

template<typename T>
void ConfigStore::registerVar(ConfigVariable<T>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::warn(LOG_TAG_CORE, "config table full (%s.%s)",
                  var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return;
    }

    ConfigMeta& m = _meta[_metaCount++];
    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.envKey      = var.envKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
}

template<typename T>
bool ConfigStore::set(ConfigVariable<T>& var, const T& value)
{
    if (!var.value) return false;
    *(var.value) = value;
    return true;
}

inline bool ConfigStore::set(ConfigVariable<char>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;
    memcpy(var.value, str, len);
    var.value[len] = '\0';
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
