#pragma once
/**
 * @file ZoneRegistry.h
 * @brief In-memory source of truth for zone identity, class, value and pulse deadline.
 */

#include <mutex>
#include <stdint.h>

#include "Board/BoardLayout.h"
#include "Core/ErrorCodes.h"
#include "Modules/ZoneModule/ZoneTypes.h"

/**
 * @brief Fixed table of zones created at startup.
 *
 * Every accessor takes the registry mutex, so a class change can never
 * interleave with a value update on the same zone. Zones are returned by
 * copy; callers never hold pointers into the table.
 */
class ZoneRegistry {
public:
    static constexpr uint8_t MAX_ZONES = Limits::Zones::MaxZones;

    /** @brief Replace the table with compiled definitions (default classes). */
    bool load(const ZoneDef* defs, uint8_t count);
    /** @brief Apply persisted classes. Unknown keys are skipped; returns applied count. */
    uint8_t applyOverrides(const ZoneClassMap& map);

    uint8_t count() const;

    bool get(const char* key, Zone& out, ErrorCode* err = nullptr) const;
    bool at(uint8_t index, Zone& out) const;

    /**
     * @brief Change the class of `key`. Clears any armed pulse.
     * @param prev receives the class before the change (may be null)
     */
    bool setClass(const char* key, ZoneClass cls, ZoneClass* prev = nullptr, ErrorCode* err = nullptr);

    /**
     * @brief Update the value of `key`.
     *
     * `Command` writes are accepted for output classes only and `Poll` updates
     * for input classes only; anything else fails with `WrongDirection`.
     * @param changed set when the stored value differs from the previous one
     */
    bool setValue(const char* key, bool value, ValueSource src, ErrorCode* err = nullptr, bool* changed = nullptr);

    /** @brief Copy all zones in provisioning order. Returns the copied count. */
    uint8_t snapshot(Zone* out, uint8_t max) const;
    /** @brief Current class of every zone. */
    void exportClasses(ZoneClassMap& out) const;

    /** @brief Arm (or re-arm) the auto-off deadline of an `output_tap` zone. */
    bool armPulse(const char* key, uint32_t deadlineMs, ErrorCode* err = nullptr);
    /** @brief Clear the pending deadline. Returns true when one was armed. */
    bool cancelPulse(const char* key);
    /**
     * @brief Collect and disarm zones whose deadline has passed.
     *
     * Zones no longer classed `output_tap` are disarmed without being reported.
     */
    uint8_t takeExpiredPulses(uint32_t nowMs, char (*keys)[Limits::Zones::KeyBuf], uint8_t max);
    /** @brief Earliest armed deadline, false when no pulse is armed. */
    bool nextPulseDeadline(uint32_t& deadlineMs) const;

private:
    mutable std::mutex mtx_;
    Zone zones_[MAX_ZONES]{};
    uint8_t count_ = 0;

    int findIndex_(const char* key) const;
};
