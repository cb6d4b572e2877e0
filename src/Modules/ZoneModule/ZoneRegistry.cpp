/**
 * @file ZoneRegistry.cpp
 * @brief Implementation file.
 */

#include "ZoneRegistry.h"

#include <string.h>

static bool deadlineReached(uint32_t nowMs, uint32_t deadlineMs)
{
    return (int32_t)(nowMs - deadlineMs) >= 0;
}

int ZoneRegistry::findIndex_(const char* key) const
{
    if (!key) return -1;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(zones_[i].key, key) == 0) return i;
    }
    return -1;
}

bool ZoneRegistry::load(const ZoneDef* defs, uint8_t count)
{
    if (!defs && count > 0) return false;
    if (count > MAX_ZONES) return false;

    std::lock_guard<std::mutex> lock(mtx_);
    count_ = 0;
    for (uint8_t i = 0; i < count; ++i) {
        const ZoneDef& d = defs[i];
        if (!d.key || strlen(d.key) >= sizeof(zones_[0].key)) return false;
        if (!isValidZoneClass(d.defaultClass)) return false;

        Zone z;
        strncpy(z.key, d.key, sizeof(z.key) - 1);
        strncpy(z.name, d.name ? d.name : d.key, sizeof(z.name) - 1);
        z.pin = d.pin;
        z.cls = d.defaultClass;
        zones_[count_++] = z;
    }
    return true;
}

uint8_t ZoneRegistry::applyOverrides(const ZoneClassMap& map)
{
    std::lock_guard<std::mutex> lock(mtx_);
    uint8_t applied = 0;
    for (uint8_t i = 0; i < map.count; ++i) {
        const int idx = findIndex_(map.entries[i].key);
        if (idx < 0) continue;
        if (!isValidZoneClass(map.entries[i].cls)) continue;
        zones_[idx].cls = map.entries[i].cls;
        zones_[idx].value = false;
        zones_[idx].pulseArmed = false;
        ++applied;
    }
    return applied;
}

uint8_t ZoneRegistry::count() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return count_;
}

bool ZoneRegistry::get(const char* key, Zone& out, ErrorCode* err) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    const int idx = findIndex_(key);
    if (idx < 0) return failWith(err, ErrorCode::NotFound);
    out = zones_[idx];
    return true;
}

bool ZoneRegistry::at(uint8_t index, Zone& out) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (index >= count_) return false;
    out = zones_[index];
    return true;
}

bool ZoneRegistry::setClass(const char* key, ZoneClass cls, ZoneClass* prev, ErrorCode* err)
{
    if (!isValidZoneClass(cls)) return failWith(err, ErrorCode::InvalidTransition);

    std::lock_guard<std::mutex> lock(mtx_);
    const int idx = findIndex_(key);
    if (idx < 0) return failWith(err, ErrorCode::NotFound);

    Zone& z = zones_[idx];
    if (prev) *prev = z.cls;
    if (z.cls == cls) return true;

    // Crossing groups re-drives the pin, so the old reading means nothing.
    if (isOutputClass(z.cls) != isOutputClass(cls)) z.value = false;
    z.cls = cls;
    z.pulseArmed = false;
    z.pulseDeadlineMs = 0;
    return true;
}

bool ZoneRegistry::setValue(const char* key, bool value, ValueSource src, ErrorCode* err, bool* changed)
{
    std::lock_guard<std::mutex> lock(mtx_);
    const int idx = findIndex_(key);
    if (idx < 0) return failWith(err, ErrorCode::NotFound);

    Zone& z = zones_[idx];
    const bool output = isOutputClass(z.cls);
    if (output != (src == ValueSource::Command)) return failWith(err, ErrorCode::WrongDirection);

    if (changed) *changed = (z.value != value);
    z.value = value;
    return true;
}

uint8_t ZoneRegistry::snapshot(Zone* out, uint8_t max) const
{
    if (!out) return 0;
    std::lock_guard<std::mutex> lock(mtx_);
    uint8_t n = 0;
    for (; n < count_ && n < max; ++n) out[n] = zones_[n];
    return n;
}

void ZoneRegistry::exportClasses(ZoneClassMap& out) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    out.count = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        (void)out.set(zones_[i].key, zones_[i].cls);
    }
}

bool ZoneRegistry::armPulse(const char* key, uint32_t deadlineMs, ErrorCode* err)
{
    std::lock_guard<std::mutex> lock(mtx_);
    const int idx = findIndex_(key);
    if (idx < 0) return failWith(err, ErrorCode::NotFound);

    Zone& z = zones_[idx];
    if (!isMomentaryClass(z.cls)) return failWith(err, ErrorCode::WrongDirection);

    z.pulseArmed = true;
    z.pulseDeadlineMs = deadlineMs;
    return true;
}

bool ZoneRegistry::cancelPulse(const char* key)
{
    std::lock_guard<std::mutex> lock(mtx_);
    const int idx = findIndex_(key);
    if (idx < 0) return false;

    Zone& z = zones_[idx];
    const bool wasArmed = z.pulseArmed;
    z.pulseArmed = false;
    z.pulseDeadlineMs = 0;
    return wasArmed;
}

uint8_t ZoneRegistry::takeExpiredPulses(uint32_t nowMs, char (*keys)[Limits::Zones::KeyBuf], uint8_t max)
{
    std::lock_guard<std::mutex> lock(mtx_);
    uint8_t n = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        Zone& z = zones_[i];
        if (!z.pulseArmed) continue;
        if (!isMomentaryClass(z.cls)) {
            z.pulseArmed = false;
            continue;
        }
        if (!deadlineReached(nowMs, z.pulseDeadlineMs)) continue;
        if (n >= max) break;

        z.pulseArmed = false;
        z.pulseDeadlineMs = 0;
        if (keys) {
            memcpy(keys[n], z.key, sizeof(z.key));
        }
        ++n;
    }
    return n;
}

bool ZoneRegistry::nextPulseDeadline(uint32_t& deadlineMs) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    bool found = false;
    for (uint8_t i = 0; i < count_; ++i) {
        const Zone& z = zones_[i];
        if (!z.pulseArmed) continue;
        if (!found || (int32_t)(z.pulseDeadlineMs - deadlineMs) < 0) {
            deadlineMs = z.pulseDeadlineMs;
            found = true;
        }
    }
    return found;
}
