#pragma once
/**
 * @file ZoneClass.h
 * @brief Closed set of zone classes and their entity shape table.
 */

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <strings.h>

/** @brief Behavioral assignment of a zone. */
enum class ZoneClass : uint8_t {
    Door = 0,
    Window,
    Opening,
    OutputToggle,
    OutputTap
};

/** @brief Behavior group of a class: polled input or commanded output. */
enum class ZoneGroup : uint8_t { Input, Output };

/** @brief Home Assistant entity kind a class is announced as. */
enum class EntityKind : uint8_t { BinarySensor, Switch };

/** @brief One row of the class table. */
struct ZoneClassInfo {
    ZoneClass cls;
    const char* name;
    ZoneGroup group;
    EntityKind kind;
    const char* deviceClass;  ///< binary_sensor device_class, nullptr for outputs
    const char* icon;         ///< switch icon, nullptr for inputs
    bool momentary;
};

namespace ZoneClasses {

constexpr ZoneClassInfo Table[] = {
    {ZoneClass::Door,         "door",          ZoneGroup::Input,  EntityKind::BinarySensor, "door",    nullptr,                  false},
    {ZoneClass::Window,       "window",        ZoneGroup::Input,  EntityKind::BinarySensor, "window",  nullptr,                  false},
    {ZoneClass::Opening,      "opening",       ZoneGroup::Input,  EntityKind::BinarySensor, "opening", nullptr,                  false},
    {ZoneClass::OutputToggle, "output_toggle", ZoneGroup::Output, EntityKind::Switch,       nullptr,   "mdi:toggle-switch",      false},
    {ZoneClass::OutputTap,    "output_tap",    ZoneGroup::Output, EntityKind::Switch,       nullptr,   "mdi:gesture-tap-button", true},
};

constexpr uint8_t Count = (uint8_t)(sizeof(Table) / sizeof(Table[0]));

static_assert((uint8_t)ZoneClass::OutputTap + 1 == Count, "class table must cover every ZoneClass");

}  // namespace ZoneClasses

/** @brief True when `cls` is a member of the closed set. */
static inline bool isValidZoneClass(ZoneClass cls)
{
    return (uint8_t)cls < ZoneClasses::Count;
}

/** @brief Table row for `cls`, or nullptr when `cls` is out of range. */
static inline const ZoneClassInfo* zoneClassInfo(ZoneClass cls)
{
    if (!isValidZoneClass(cls)) return nullptr;
    return &ZoneClasses::Table[(uint8_t)cls];
}

/** @brief Wire name of `cls` (`door`, `output_tap`...), "?" when out of range. */
static inline const char* zoneClassName(ZoneClass cls)
{
    const ZoneClassInfo* info = zoneClassInfo(cls);
    return info ? info->name : "?";
}

/** @brief Parse a class name (surrounding blanks ignored, case-insensitive). */
static inline bool parseZoneClass(const char* text, ZoneClass& out)
{
    if (!text) return false;
    while (*text == ' ' || *text == '\t' || *text == '\r' || *text == '\n') ++text;
    size_t len = strlen(text);
    while (len > 0 && (text[len - 1] == ' ' || text[len - 1] == '\t' ||
                       text[len - 1] == '\r' || text[len - 1] == '\n')) {
        --len;
    }
    if (len == 0) return false;

    for (uint8_t i = 0; i < ZoneClasses::Count; ++i) {
        const char* name = ZoneClasses::Table[i].name;
        if (strlen(name) != len) continue;
        if (strncasecmp(text, name, len) == 0) {
            out = ZoneClasses::Table[i].cls;
            return true;
        }
    }
    return false;
}

/** @brief Discovery component for an entity kind. */
static inline const char* entityKindComponent(EntityKind kind)
{
    return (kind == EntityKind::Switch) ? "switch" : "binary_sensor";
}

static inline bool isOutputClass(ZoneClass cls)
{
    const ZoneClassInfo* info = zoneClassInfo(cls);
    return info && info->group == ZoneGroup::Output;
}

/** @brief True for classes whose ON is a timed pulse. */
static inline bool isMomentaryClass(ZoneClass cls)
{
    const ZoneClassInfo* info = zoneClassInfo(cls);
    return info && info->momentary;
}
