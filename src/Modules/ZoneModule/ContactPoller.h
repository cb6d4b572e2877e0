#pragma once
/**
 * @file ContactPoller.h
 * @brief Debounced sampling of input zones.
 */

#include <stdint.h>

#include "Core/SystemLimits.h"
#include "Modules/IOModule/IODrivers/IODriver.h"

class ZoneRegistry;
class DiscoverySynchronizer;

/**
 * @brief Samples every input zone and publishes stable edges only.
 *
 * Wiring is pulled up: HIGH means the contact is open. A changed raw level
 * must hold for the debounce window before it replaces the zone value.
 * Output zones are never read.
 */
class ContactPoller {
public:
    ContactPoller(ZoneRegistry& registry, DiscoverySynchronizer& sync)
        : registry_(registry), sync_(sync) {}

    void setDriver(IDigitalIoDriver* driver) { driver_ = driver; }
    void setDebounceMs(uint32_t ms) { debounceMs_ = ms; }

    /** @brief Seed every input zone from the pins without publishing. */
    uint8_t prime(uint32_t nowMs);
    /** @brief Seed one zone (after it became an input) without publishing. */
    bool resample(const char* key, uint32_t nowMs);

    /** @brief One sampling pass. Returns the number of published edges. */
    uint8_t poll(uint32_t nowMs);

private:
    struct Track {
        bool valid = false;
        bool raw = false;
        uint32_t sinceMs = 0;
    };

    ZoneRegistry& registry_;
    DiscoverySynchronizer& sync_;
    IDigitalIoDriver* driver_ = nullptr;
    uint32_t debounceMs_ = 120;
    Track track_[Limits::Zones::MaxZones]{};
    uint32_t readErrors_ = 0;

    bool read_(uint8_t pin, bool& open);
    bool seed_(uint8_t index, uint32_t nowMs);
};
