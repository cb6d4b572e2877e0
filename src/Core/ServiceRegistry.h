#pragma once
/**
 * @file ServiceRegistry.h
 * @brief Named service structs shared between modules.
 */
#include <stdint.h>
#include <cstring>

#include "Core/SystemLimits.h"

/**
 * @brief Maps string ids (`loghub`, `gpio`, `mqtt`...) to service structs.
 *
 * Filled during `init()` in dependency order, read-only afterwards.
 */
class ServiceRegistry {
public:
    /** @brief Register `service` under `id`. Fails on duplicates or a full table. */
    bool add(const char* id, const void* service);
    const void* getRaw(const char* id) const;

    template<typename T>
    const T* get(const char* id) const {
        return static_cast<const T*>(getRaw(id));
    }

    /** @brief Like get(), but logs an error naming `owner` when the service is missing. */
    template<typename T>
    const T* require(const char* id, const char* owner) const {
        const void* p = getRaw(id);
        if (!p) logMissing_(id, owner);
        return static_cast<const T*>(p);
    }

private:
    struct Entry {
        const char* id;
        const void* ptr;
    };

    Entry entries_[Limits::MaxServices]{};
    uint8_t count_ = 0;

    static void logMissing_(const char* id, const char* owner);
};
