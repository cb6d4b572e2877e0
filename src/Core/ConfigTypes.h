#pragma once
/**
 * @file ConfigTypes.h
 * @brief Config variable declaration and registry metadata.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

/** @brief Runtime values are compiled defaults only; persistent ones read file and environment. */
enum class ConfigPersistence : uint8_t { Runtime, Persistent };

/** @brief Value types understood by the JSON and environment loaders. */
enum class ConfigType : uint8_t {
    Int32,
    Bool,
    CharArray
};

/**
 * @brief One configurable value owned by a module.
 *
 * `envKey` names the environment variable overriding the value (nullptr when
 * the value is file-only). `jsonName` and `moduleName` locate it in the JSON
 * config file as `{"<module>": {"<name>": value}}`. The module keeps the
 * storage; the store only holds a pointer to it.
 */
template<typename T>
struct ConfigVariable {
    const char* envKey;
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    ConfigPersistence persistence;
    uint16_t size; // buffer size for char[], 0 otherwise
};

/** @brief Type-erased registry row. */
struct ConfigMeta {
    const char* module;
    const char* name;
    const char* envKey;
    ConfigType type;
    ConfigPersistence persistence;
    void* valuePtr;
    uint16_t size;
};
