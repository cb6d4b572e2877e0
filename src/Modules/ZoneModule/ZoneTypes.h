#pragma once
/**
 * @file ZoneTypes.h
 * @brief Zone data model shared by the zone engine components.
 */

#include <stdint.h>
#include <string.h>

#include "Core/SystemLimits.h"
#include "Domain/ZoneClass.h"

/** @brief Live state of one zone terminal. */
struct Zone {
    char key[Limits::Zones::KeyBuf] = {0};
    char name[Limits::Zones::NameBuf] = {0};
    uint8_t pin = 0;
    ZoneClass cls = ZoneClass::Opening;
    /// OPEN for inputs, ON for outputs
    bool value = false;
    bool pulseArmed = false;
    uint32_t pulseDeadlineMs = 0;
};

/** @brief Origin of a value update, checked against the zone behavior group. */
enum class ValueSource : uint8_t {
    Command,  ///< output write (router, pulse controller)
    Poll      ///< input sample (poll loop)
};

/** @brief Zone key to class mapping, as persisted. */
struct ZoneClassMap {
    struct Entry {
        char key[Limits::Zones::KeyBuf];
        ZoneClass cls;
    };

    Entry entries[Limits::Zones::MaxZones]{};
    uint8_t count = 0;

    /** @brief Insert or replace the class of `key`. */
    bool set(const char* key, ZoneClass cls)
    {
        if (!key || key[0] == '\0') return false;
        if (strlen(key) >= sizeof(entries[0].key)) return false;
        for (uint8_t i = 0; i < count; ++i) {
            if (strcmp(entries[i].key, key) == 0) {
                entries[i].cls = cls;
                return true;
            }
        }
        if (count >= Limits::Zones::MaxZones) return false;
        strncpy(entries[count].key, key, sizeof(entries[count].key) - 1);
        entries[count].key[sizeof(entries[count].key) - 1] = '\0';
        entries[count].cls = cls;
        ++count;
        return true;
    }

    bool find(const char* key, ZoneClass& out) const
    {
        if (!key) return false;
        for (uint8_t i = 0; i < count; ++i) {
            if (strcmp(entries[i].key, key) == 0) {
                out = entries[i].cls;
                return true;
            }
        }
        return false;
    }
};

static inline const char* zoneValueText(ZoneClass cls, bool value)
{
    if (isOutputClass(cls)) return value ? "ON" : "OFF";
    return value ? "OPEN" : "CLOSED";
}
