/**
 * @file CommandRouter.cpp
 * @brief Implementation file.
 */

#include "CommandRouter.h"
#include "Core/MqttTopics.h"
#include "Domain/ZoneDefaults.h"
#include "Modules/Network/HADiscovery/DiscoverySynchronizer.h"
#include "Modules/ZoneModule/ContactPoller.h"
#include "Modules/ZoneModule/PulseController.h"
#include "Modules/ZoneModule/ZonePersistence.h"
#include "Modules/ZoneModule/ZoneRegistry.h"
#include <ctype.h>
#include <string.h>

#define LOG_TAG "CmdRoute"
#include "Core/ModuleLog.h"

enum class CaseFold : uint8_t { Keep, Upper, Lower };

static bool trimCopy(const char* in, char* out, size_t outLen, CaseFold fold)
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!in) return false;

    while (*in && isspace((unsigned char)*in)) ++in;
    size_t len = strlen(in);
    while (len > 0 && isspace((unsigned char)in[len - 1])) --len;
    if (len >= outLen) return false;

    for (size_t i = 0; i < len; ++i) {
        char c = in[i];
        if (fold == CaseFold::Upper) c = (char)toupper((unsigned char)c);
        else if (fold == CaseFold::Lower) c = (char)tolower((unsigned char)c);
        out[i] = c;
    }
    out[len] = '\0';
    return true;
}

static bool copyPayload(const char* payload, ZoneCommand& out, ErrorCode* err)
{
    const char* p = payload ? payload : "";
    if (strlen(p) >= sizeof(out.payload)) return failWith(err, ErrorCode::BadPayload);
    strncpy(out.payload, p, sizeof(out.payload) - 1);
    out.payload[sizeof(out.payload) - 1] = '\0';
    return true;
}

bool CommandRouter::parseTopic(const char* topic, const char* payload, ZoneCommand& out, ErrorCode* err) const
{
    if (!topic) return failWith(err, ErrorCode::UnknownTopic);

    char expected[Limits::TopicBuf] = {0};
    out = ZoneCommand{};

    if (MqttTopics::selector(expected, sizeof(expected), sync_.host(), MqttTopics::ZoneSelect, MqttTopics::LeafSet) &&
        strcmp(topic, expected) == 0) {
        out.kind = ZoneCommandKind::ZoneSelect;
        return copyPayload(payload, out, err);
    }
    if (MqttTopics::selector(expected, sizeof(expected), sync_.host(), MqttTopics::ClassSelect, MqttTopics::LeafSet) &&
        strcmp(topic, expected) == 0) {
        out.kind = ZoneCommandKind::ClassSelect;
        return copyPayload(payload, out, err);
    }

    const uint8_t n = registry_.count();
    for (uint8_t i = 0; i < n; ++i) {
        Zone z;
        if (!registry_.at(i, z)) break;
        if (!MqttTopics::switchSet(expected, sizeof(expected), sync_.host(), z.key)) continue;
        if (strcmp(topic, expected) != 0) continue;

        out.kind = ZoneCommandKind::SwitchSet;
        memcpy(out.zoneKey, z.key, sizeof(out.zoneKey));
        return copyPayload(payload, out, err);
    }

    return failWith(err, ErrorCode::UnknownTopic);
}

bool CommandRouter::handle(const ZoneCommand& cmd, uint32_t nowMs, ErrorCode* err)
{
    ErrorCode localErr = ErrorCode::BadPayload;
    bool ok = false;
    const char* what = "?";

    switch (cmd.kind) {
    case ZoneCommandKind::SwitchSet:
        what = "switch";
        ok = handleSwitch(cmd.zoneKey, cmd.payload, nowMs, &localErr);
        break;
    case ZoneCommandKind::ZoneSelect:
        what = "zone_select";
        ok = handleZoneSelect(cmd.payload, &localErr);
        break;
    case ZoneCommandKind::ClassSelect:
        what = "class_select";
        ok = handleClassSelect(cmd.payload, nowMs, &localErr);
        break;
    }

    if (!ok) {
        LOGW("%s command rejected (%s) zone=%s payload='%s'",
             what, errorCodeStr(localErr), cmd.zoneKey[0] ? cmd.zoneKey : "-", cmd.payload);
        return failWith(err, localErr);
    }
    return true;
}

bool CommandRouter::handleSwitch(const char* zoneKey, const char* payload, uint32_t nowMs, ErrorCode* err)
{
    Zone z;
    if (!registry_.get(zoneKey, z, err)) return false;
    if (!isOutputClass(z.cls)) return failWith(err, ErrorCode::WrongDirection);

    char word[8] = {0};
    if (!trimCopy(payload, word, sizeof(word), CaseFold::Upper)) return failWith(err, ErrorCode::BadPayload);

    bool on = false;
    if (strcmp(word, "ON") == 0) on = true;
    else if (strcmp(word, "OFF") == 0) on = false;
    else return failWith(err, ErrorCode::BadPayload);

    return pulses_.command(zoneKey, on, nowMs, err);
}

bool CommandRouter::handleZoneSelect(const char* payload, ErrorCode* err)
{
    char value[Limits::Zones::CommandPayload] = {0};
    if (!trimCopy(payload, value, sizeof(value), CaseFold::Keep)) return failWith(err, ErrorCode::BadPayload);

    if (value[0] == '\0' || strcmp(value, ZoneDefaults::ZonePlaceholder) == 0) {
        clearSelection();
        (void)sync_.publishSelectorState(MqttTopics::ZoneSelect, ZoneDefaults::ZonePlaceholder);
        (void)sync_.publishSelectorState(MqttTopics::ClassSelect, ZoneDefaults::ClassPlaceholder);
        return true;
    }

    Zone z;
    if (!registry_.get(value, z, err)) return false;

    memcpy(selected_, z.key, sizeof(selected_));
    LOGI("zone selected: %s (%s)", z.key, zoneClassName(z.cls));
    (void)sync_.publishSelectorState(MqttTopics::ZoneSelect, z.key);
    (void)sync_.publishSelectorState(MqttTopics::ClassSelect, zoneClassName(z.cls));
    return true;
}

bool CommandRouter::handleClassSelect(const char* payload, uint32_t nowMs, ErrorCode* err)
{
    char value[Limits::Zones::CommandPayload] = {0};
    if (!trimCopy(payload, value, sizeof(value), CaseFold::Keep)) return failWith(err, ErrorCode::BadPayload);

    if (value[0] == '\0' || strcmp(value, ZoneDefaults::ClassPlaceholder) == 0) {
        (void)sync_.publishSelectorState(MqttTopics::ClassSelect, ZoneDefaults::ClassPlaceholder);
        return true;
    }

    ZoneClass cls;
    if (!parseZoneClass(value, cls)) return failWith(err, ErrorCode::InvalidTransition);
    if (selected_[0] == '\0') return failWith(err, ErrorCode::NotReady);

    Zone before;
    if (!registry_.get(selected_, before, err)) return false;
    if (before.cls == cls) {
        (void)sync_.publishSelectorState(MqttTopics::ClassSelect, zoneClassName(cls));
        return true;
    }

    // 1) registry and pin
    ZoneClass prev = before.cls;
    if (!registry_.setClass(selected_, cls, &prev, err)) return false;

    bool pinTouched = false;
    const bool groupChanged = isOutputClass(prev) != isOutputClass(cls);
    if (groupChanged) {
        const PinDirection dir = isOutputClass(cls) ? PinDirection::Output : PinDirection::Input;
        if (!driver_ || !driver_->setDirection(before.pin, dir)) {
            LOGE("%s: pin %u direction change failed, keeping %s",
                 selected_, (unsigned)before.pin, zoneClassName(prev));
            restoreClass_(before, false, nowMs);
            return failWith(err, ErrorCode::IoError);
        }
        pinTouched = true;
        if (!isOutputClass(cls)) (void)poller_.resample(selected_, nowMs);
    } else if (isMomentaryClass(cls) && before.value) {
        // a momentary zone is never left ON without a pending auto-off
        if (!driver_ || !driver_->writeDigital(before.pin, false)) {
            LOGE("%s: pin %u release failed, keeping %s",
                 selected_, (unsigned)before.pin, zoneClassName(prev));
            restoreClass_(before, false, nowMs);
            return failWith(err, ErrorCode::IoError);
        }
        pinTouched = true;
        (void)registry_.setValue(selected_, false, ValueSource::Command);
        LOGI("OUTPUT_TAP %s -> OFF", selected_);
    }

    // 2) discovery view
    Zone after;
    if (!registry_.get(selected_, after, err)) return false;
    ErrorCode syncErr = ErrorCode::TransportError;
    bool retracted = false;
    if (!sync_.reclassify(after, prev, &syncErr, &retracted)) {
        if (!retracted) {
            LOGW("%s: old record still live (%s), keeping %s",
                 selected_, errorCodeStr(syncErr), zoneClassName(prev));
            restoreClass_(before, pinTouched, nowMs);
            return failWith(err, syncErr);
        }
        repairPending_ = true;
        LOGW("%s: discovery update incomplete (%s), repair scheduled", selected_, errorCodeStr(syncErr));
    }

    // 3) persistence
    ZoneClassMap map;
    registry_.exportClasses(map);
    ErrorCode saveErr = ErrorCode::PersistenceError;
    if (!store_.save(map, &saveErr)) {
        LOGE("%s: class %s active but not persisted (%s)",
             selected_, zoneClassName(cls), errorCodeStr(saveErr));
    }

    LOGI("ZONE_CLASS_SET %s: %s -> %s", selected_, zoneClassName(prev), zoneClassName(cls));
    (void)sync_.publishSelectorState(MqttTopics::ClassSelect, zoneClassName(cls));
    return true;
}

void CommandRouter::restoreClass_(const Zone& before, bool pinTouched, uint32_t nowMs)
{
    ZoneClass current = before.cls;
    if (!registry_.setClass(before.key, before.cls, &current)) {
        LOGE("%s: class rollback failed", before.key);
        return;
    }

    if (!pinTouched) {
        const ValueSource src = isOutputClass(before.cls) ? ValueSource::Command : ValueSource::Poll;
        (void)registry_.setValue(before.key, before.value, src);
        return;
    }

    if (isOutputClass(current) != isOutputClass(before.cls)) {
        const bool output = isOutputClass(before.cls);
        if (!driver_ || !driver_->setDirection(before.pin, output ? PinDirection::Output : PinDirection::Input)) {
            LOGE("%s: pin %u not restored as %s", before.key, (unsigned)before.pin, output ? "output" : "input");
            return;
        }
        if (!output) (void)poller_.resample(before.key, nowMs);
    }

    Zone now;
    if (registry_.get(before.key, now) && now.value != before.value) {
        (void)sync_.publishState(now);
    }
}
