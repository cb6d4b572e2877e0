#pragma once

#include <stdint.h>

#include "Board/BoardPinMap.h"
#include "Domain/ZoneClass.h"

/** @brief Compiled-in provisioning of one zone terminal. */
struct ZoneDef {
    const char* key;
    const char* name;
    uint8_t pin;
    ZoneClass defaultClass;
};

namespace BoardLayout {

constexpr ZoneDef Zones[] = {
    {"zone1", "Zone 1", Board::Zone::Z1, ZoneClass::Opening},
    {"zone2", "Zone 2", Board::Zone::Z2, ZoneClass::Opening},
    {"zone3", "Zone 3", Board::Zone::Z3, ZoneClass::Opening},
    {"zone4", "Zone 4", Board::Zone::Z4, ZoneClass::Opening},
    {"zone5", "Zone 5", Board::Zone::Z5, ZoneClass::Opening},
    {"zone6", "Zone 6", Board::Zone::Z6, ZoneClass::Opening},
    {"zone7", "Zone 7", Board::Zone::Z7, ZoneClass::Opening},
    {"zone8", "Zone 8", Board::Zone::Z8, ZoneClass::Opening},
    {"zone9", "Zone 9", Board::Zone::Z9, ZoneClass::Opening},
    {"zone10", "Zone 10", Board::Zone::Z10, ZoneClass::Opening},
};

constexpr uint8_t ZoneCount = (uint8_t)(sizeof(Zones) / sizeof(Zones[0]));

}  // namespace BoardLayout
