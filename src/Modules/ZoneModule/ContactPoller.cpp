/**
 * @file ContactPoller.cpp
 * @brief Implementation file.
 */

#include "ContactPoller.h"
#include "Modules/Network/HADiscovery/DiscoverySynchronizer.h"
#include "Modules/ZoneModule/ZoneRegistry.h"
#include <string.h>

#define LOG_TAG "ContactP"
#include "Core/ModuleLog.h"

bool ContactPoller::read_(uint8_t pin, bool& open)
{
    if (!driver_) return false;
    bool high = false;
    if (!driver_->readDigital(pin, high)) {
        // One line per 100 failures is enough to show a dead line.
        if ((readErrors_++ % 100U) == 0) {
            LOGW("read pin %u failed (errors=%u)", (unsigned)pin, (unsigned)readErrors_);
        }
        return false;
    }
    open = high;
    return true;
}

bool ContactPoller::seed_(uint8_t index, uint32_t nowMs)
{
    Zone z;
    if (!registry_.at(index, z)) return false;
    Track& t = track_[index];
    t.valid = false;
    if (isOutputClass(z.cls)) return false;

    bool open = false;
    if (!read_(z.pin, open)) return false;
    if (!registry_.setValue(z.key, open, ValueSource::Poll)) return false;

    t.valid = true;
    t.raw = open;
    t.sinceMs = nowMs;
    return true;
}

uint8_t ContactPoller::prime(uint32_t nowMs)
{
    const uint8_t n = registry_.count();
    uint8_t seeded = 0;
    for (uint8_t i = 0; i < n && i < Limits::Zones::MaxZones; ++i) {
        if (seed_(i, nowMs)) ++seeded;
    }
    LOGI("inputs sampled (%u)", (unsigned)seeded);
    return seeded;
}

bool ContactPoller::resample(const char* key, uint32_t nowMs)
{
    const uint8_t n = registry_.count();
    for (uint8_t i = 0; i < n && i < Limits::Zones::MaxZones; ++i) {
        Zone z;
        if (!registry_.at(i, z)) return false;
        if (strcmp(z.key, key) == 0) return seed_(i, nowMs);
    }
    return false;
}

uint8_t ContactPoller::poll(uint32_t nowMs)
{
    const uint8_t n = registry_.count();
    uint8_t edges = 0;

    for (uint8_t i = 0; i < n && i < Limits::Zones::MaxZones; ++i) {
        Zone z;
        if (!registry_.at(i, z)) break;
        Track& t = track_[i];
        if (isOutputClass(z.cls)) {
            t.valid = false;
            continue;
        }

        bool open = false;
        if (!read_(z.pin, open)) continue;

        if (!t.valid || open != t.raw) {
            t.valid = true;
            t.raw = open;
            t.sinceMs = nowMs;
        }
        if (open == z.value) continue;
        if ((uint32_t)(nowMs - t.sinceMs) < debounceMs_) continue;

        bool changed = false;
        if (!registry_.setValue(z.key, open, ValueSource::Poll, nullptr, &changed)) continue;
        if (!changed) continue;

        z.value = open;
        LOGI("SENSOR_CHANGE %s -> %s", z.key, open ? "OPEN" : "CLOSED");
        if (!sync_.publishState(z)) {
            LOGD("%s: state publish deferred", z.key);
        }
        ++edges;
    }
    return edges;
}
