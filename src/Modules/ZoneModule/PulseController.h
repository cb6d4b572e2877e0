#pragma once
/**
 * @file PulseController.h
 * @brief Output zone commands and the `output_tap` auto-off timers.
 */

#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Modules/IOModule/IODrivers/IODriver.h"

class ZoneRegistry;
class DiscoverySynchronizer;

/**
 * @brief Drives output pins on command and expires tap pulses.
 *
 * Deadlines live in `ZoneRegistry`, one per zone, so re-arming replaces the
 * previous deadline and an expiry re-checks the current class. All calls come
 * from the zone task.
 */
class PulseController {
public:
    PulseController(ZoneRegistry& registry, DiscoverySynchronizer& sync)
        : registry_(registry), sync_(sync) {}

    void setDriver(IDigitalIoDriver* driver) { driver_ = driver; }
    void setTapMs(uint32_t ms) { tapMs_ = ms; }
    uint32_t tapMs() const { return tapMs_; }

    /**
     * @brief Apply ON/OFF to an output zone and publish its state.
     *
     * `output_toggle` follows the command. `output_tap` ON drives HIGH and
     * (re)arms the deadline; OFF cancels it and drives LOW.
     */
    bool command(const char* key, bool on, uint32_t nowMs, ErrorCode* err = nullptr);

    /** @brief Drive expired tap pulses LOW. Returns the number of auto-offs. */
    uint8_t tick(uint32_t nowMs);

private:
    ZoneRegistry& registry_;
    DiscoverySynchronizer& sync_;
    IDigitalIoDriver* driver_ = nullptr;
    uint32_t tapMs_ = 500;

    bool drive_(const char* key, uint8_t pin, bool high, ErrorCode* err);
    void publish_(const char* key);
};
