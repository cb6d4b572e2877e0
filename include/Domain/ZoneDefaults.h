#pragma once
/**
 * @file ZoneDefaults.h
 * @brief Compiled defaults for zone behavior and discovery.
 */

#include <stdint.h>

namespace ZoneDefaults {

constexpr int32_t TapPulseMs = 500;
constexpr int32_t DebounceMs = 120;
constexpr int32_t PollIntervalMs = 50;

constexpr char DiscoveryPrefix[] = "homeassistant";
constexpr char Manufacturer[] = "Raspberry Pi";
constexpr char HostFallback[] = "monitor";

constexpr char ZonePlaceholder[] = "-- Select Zone --";
constexpr char ClassPlaceholder[] = "-- Select Class --";

constexpr char ZoneSelectIcon[] = "mdi:format-list-bulleted";
constexpr char ClassSelectIcon[] = "mdi:tag-outline";

constexpr char PersistFileSuffix[] = "_zones.json";

}  // namespace ZoneDefaults
