#pragma once
/**
 * @file MqttTopics.h
 * @brief MQTT topic layout shared by the zone engine and the MQTT module.
 */

#include <stddef.h>
#include <stdio.h>

namespace MqttTopics {

/** @brief Availability / Last Will suffix (`<host>/availability`). */
constexpr char SuffixAvailability[] = "availability";
/** @brief Input zone state suffix (`<host>_<zone>/state`). */
constexpr char SuffixZoneState[] = "state";
/** @brief Output zone state suffix (`<host>_<zone>/switch/state`). */
constexpr char SuffixSwitchState[] = "switch/state";
/** @brief Output zone command suffix (`<host>_<zone>/switch/set`). */
constexpr char SuffixSwitchSet[] = "switch/set";
/** @brief Zone selector object id (`<host>/zone_select/set|state`). */
constexpr char ZoneSelect[] = "zone_select";
/** @brief Class selector object id (`<host>/class_select/set|state`). */
constexpr char ClassSelect[] = "class_select";
/** @brief Selector command leaf. */
constexpr char LeafSet[] = "set";
/** @brief Selector state leaf. */
constexpr char LeafState[] = "state";

/** @brief Availability payloads. */
constexpr char Online[] = "online";
constexpr char Offline[] = "offline";

static inline bool fits_(int n, size_t len) { return n >= 0 && (size_t)n < len; }

/** @brief `<host>/availability`. */
static inline bool availability(char* out, size_t len, const char* host)
{
    return fits_(snprintf(out, len, "%s/%s", host, SuffixAvailability), len);
}

/** @brief `<host>_<zone>/state`. */
static inline bool zoneState(char* out, size_t len, const char* host, const char* zoneKey)
{
    return fits_(snprintf(out, len, "%s_%s/%s", host, zoneKey, SuffixZoneState), len);
}

/** @brief `<host>_<zone>/switch/state`. */
static inline bool switchState(char* out, size_t len, const char* host, const char* zoneKey)
{
    return fits_(snprintf(out, len, "%s_%s/%s", host, zoneKey, SuffixSwitchState), len);
}

/** @brief `<host>_<zone>/switch/set`. */
static inline bool switchSet(char* out, size_t len, const char* host, const char* zoneKey)
{
    return fits_(snprintf(out, len, "%s_%s/%s", host, zoneKey, SuffixSwitchSet), len);
}

/** @brief `<host>/<selector>/<leaf>`. */
static inline bool selector(char* out, size_t len, const char* host, const char* selectorId, const char* leaf)
{
    return fits_(snprintf(out, len, "%s/%s/%s", host, selectorId, leaf), len);
}

/** @brief `<prefix>/<component>/<host>/<object>/config`. */
static inline bool discoveryConfig(char* out, size_t len, const char* prefix, const char* component,
                                   const char* host, const char* objectId)
{
    return fits_(snprintf(out, len, "%s/%s/%s/%s/config", prefix, component, host, objectId), len);
}

}  // namespace MqttTopics
