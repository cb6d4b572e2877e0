/**
 * @file PulseController.cpp
 * @brief Implementation file.
 */

#include "PulseController.h"
#include "Modules/Network/HADiscovery/DiscoverySynchronizer.h"
#include "Modules/ZoneModule/ZoneRegistry.h"

#define LOG_TAG "PulseCtl"
#include "Core/ModuleLog.h"

bool PulseController::drive_(const char* key, uint8_t pin, bool high, ErrorCode* err)
{
    if (!driver_) return failWith(err, ErrorCode::NotReady);
    if (!driver_->writeDigital(pin, high)) {
        LOGE("%s: write pin %u %s failed", key, (unsigned)pin, high ? "HIGH" : "LOW");
        return failWith(err, ErrorCode::IoError);
    }
    return true;
}

void PulseController::publish_(const char* key)
{
    Zone z;
    if (!registry_.get(key, z)) return;
    if (!sync_.publishState(z)) {
        LOGD("%s: state publish deferred", key);
    }
}

bool PulseController::command(const char* key, bool on, uint32_t nowMs, ErrorCode* err)
{
    Zone z;
    if (!registry_.get(key, z, err)) return false;
    if (!isOutputClass(z.cls)) return failWith(err, ErrorCode::WrongDirection);

    if (isMomentaryClass(z.cls)) {
        if (on) {
            if (!drive_(key, z.pin, true, err)) return false;
            if (!registry_.armPulse(key, nowMs + tapMs_, err)) return false;
            if (!registry_.setValue(key, true, ValueSource::Command, err)) return false;
            LOGI("OUTPUT_TAP %s -> PULSE %ums", key, (unsigned)tapMs_);
        } else {
            (void)registry_.cancelPulse(key);
            if (!drive_(key, z.pin, false, err)) return false;
            if (!registry_.setValue(key, false, ValueSource::Command, err)) return false;
            LOGI("OUTPUT_TAP %s -> OFF", key);
        }
    } else {
        if (!drive_(key, z.pin, on, err)) return false;
        if (!registry_.setValue(key, on, ValueSource::Command, err)) return false;
        LOGI("OUTPUT_TOGGLE %s -> %s", key, on ? "ON" : "OFF");
    }

    publish_(key);
    return true;
}

uint8_t PulseController::tick(uint32_t nowMs)
{
    char expired[Limits::Zones::MaxZones][Limits::Zones::KeyBuf];
    const uint8_t n = registry_.takeExpiredPulses(nowMs, expired, Limits::Zones::MaxZones);

    uint8_t done = 0;
    for (uint8_t i = 0; i < n; ++i) {
        const char* key = expired[i];
        Zone z;
        if (!registry_.get(key, z)) continue;
        if (!isMomentaryClass(z.cls)) continue;

        ErrorCode err = ErrorCode::IoError;
        if (!drive_(key, z.pin, false, &err)) {
            LOGW("OUTPUT_TAP %s auto-off failed (%s), retrying", key, errorCodeStr(err));
            (void)registry_.armPulse(key, nowMs + Limits::Zones::MaxIdleWaitMs);
            continue;
        }
        if (!registry_.setValue(key, false, ValueSource::Command, &err)) continue;
        LOGI("OUTPUT_TAP %s -> AUTO_OFF", key);
        publish_(key);
        ++done;
    }
    return done;
}
