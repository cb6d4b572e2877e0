/**
 * @file DiscoverySynchronizer.cpp
 * @brief Implementation file.
 */

#include "DiscoverySynchronizer.h"
#include "Core/MqttTopics.h"
#include "Domain/ZoneDefaults.h"
#include <stdarg.h>
#include <string.h>

#define LOG_TAG "HADiscov"
#include "Core/ModuleLog.h"

static bool formatChecked(char* out, size_t outLen, const char* fmt, ...)
{
    if (!out || outLen == 0 || !fmt) return false;
    va_list ap;
    va_start(ap, fmt);
    const int n = vsnprintf(out, outLen, fmt, ap);
    va_end(ap);
    return (n >= 0) && ((size_t)n < outLen);
}

static bool appendChecked(char* out, size_t outLen, size_t& used, const char* fmt, ...)
{
    if (used >= outLen) return false;
    va_list ap;
    va_start(ap, fmt);
    const int n = vsnprintf(out + used, outLen - used, fmt, ap);
    va_end(ap);
    if (n < 0 || (size_t)n >= outLen - used) return false;
    used += (size_t)n;
    return true;
}

static void copyField(char* dst, size_t dstLen, const char* src, const char* fallback)
{
    const char* v = (src && src[0] != '\0') ? src : fallback;
    strncpy(dst, v, dstLen - 1);
    dst[dstLen - 1] = '\0';
}

// Values pasted into JSON strings unescaped.
static bool jsonSafe(const char* s)
{
    if (!s) return true;
    for (; *s; ++s) {
        const unsigned char c = (unsigned char)*s;
        if (c < 0x20 || c == '"' || c == '\\') return false;
    }
    return true;
}

// Values used as MQTT topic levels.
static bool topicSafe(const char* s)
{
    if (!s) return true;
    for (; *s; ++s) {
        if (*s == '+' || *s == '#' || (unsigned char)*s < 0x20) return false;
    }
    return jsonSafe(s);
}

bool DiscoverySynchronizer::configure(const char* host, const char* discoveryPrefix, const char* manufacturer)
{
    bool ok = true;
    if (!topicSafe(discoveryPrefix)) {
        LOGW("discovery prefix '%s' rejected, using %s", discoveryPrefix, ZoneDefaults::DiscoveryPrefix);
        discoveryPrefix = nullptr;
        ok = false;
    }
    if (!jsonSafe(manufacturer)) {
        LOGW("manufacturer '%s' rejected, using %s", manufacturer, ZoneDefaults::Manufacturer);
        manufacturer = nullptr;
        ok = false;
    }

    copyField(host_, sizeof(host_), host, ZoneDefaults::HostFallback);
    copyField(prefix_, sizeof(prefix_), discoveryPrefix, ZoneDefaults::DiscoveryPrefix);
    copyField(manufacturer_, sizeof(manufacturer_), manufacturer, ZoneDefaults::Manufacturer);
    return ok;
}

bool DiscoverySynchronizer::buildDeviceBlock_(char* out, size_t outLen) const
{
    return formatChecked(out, outLen,
        "\"device\":{\"name\":\"%s\",\"identifiers\":[\"%s\"],\"manufacturer\":\"%s\",\"model\":\"GPIO IO (%s)\"}",
        host_, host_, manufacturer_, host_);
}

bool DiscoverySynchronizer::buildAvailabilityFields_(char* out, size_t outLen) const
{
    char availTopic[Limits::TopicBuf] = {0};
    if (!MqttTopics::availability(availTopic, sizeof(availTopic), host_)) return false;
    return formatChecked(out, outLen,
        "\"availability_topic\":\"%s\",\"payload_available\":\"%s\",\"payload_not_available\":\"%s\"",
        availTopic, MqttTopics::Online, MqttTopics::Offline);
}

bool DiscoverySynchronizer::zoneConfigTopic(const char* zoneKey, ZoneClass cls, char* out, size_t outLen) const
{
    const ZoneClassInfo* info = zoneClassInfo(cls);
    if (!zoneKey || !info) return false;
    return MqttTopics::discoveryConfig(out, outLen, prefix_, entityKindComponent(info->kind), host_, zoneKey);
}

bool DiscoverySynchronizer::zoneStateTopic(const Zone& z, char* out, size_t outLen) const
{
    if (isOutputClass(z.cls)) return MqttTopics::switchState(out, outLen, host_, z.key);
    return MqttTopics::zoneState(out, outLen, host_, z.key);
}

bool DiscoverySynchronizer::buildBinarySensorConfig(const Zone& z, char* out, size_t outLen) const
{
    const ZoneClassInfo* info = zoneClassInfo(z.cls);
    if (!info || info->kind != EntityKind::BinarySensor) return false;

    char stateTopic[Limits::TopicBuf] = {0};
    if (!MqttTopics::zoneState(stateTopic, sizeof(stateTopic), host_, z.key)) return false;
    char availabilityFields[256] = {0};
    if (!buildAvailabilityFields_(availabilityFields, sizeof(availabilityFields))) return false;
    char deviceBlock[256] = {0};
    if (!buildDeviceBlock_(deviceBlock, sizeof(deviceBlock))) return false;

    return formatChecked(out, outLen,
        "{\"name\":\"%s\",\"unique_id\":\"%s_%s_bin\",\"state_topic\":\"%s\",%s,"
        "\"payload_on\":\"OPEN\",\"payload_off\":\"CLOSED\",\"device_class\":\"%s\",%s}",
        z.name, host_, z.key, stateTopic, availabilityFields,
        info->deviceClass ? info->deviceClass : info->name, deviceBlock);
}

bool DiscoverySynchronizer::buildSwitchConfig(const Zone& z, char* out, size_t outLen) const
{
    const ZoneClassInfo* info = zoneClassInfo(z.cls);
    if (!info || info->kind != EntityKind::Switch) return false;

    char stateTopic[Limits::TopicBuf] = {0};
    if (!MqttTopics::switchState(stateTopic, sizeof(stateTopic), host_, z.key)) return false;
    char commandTopic[Limits::TopicBuf] = {0};
    if (!MqttTopics::switchSet(commandTopic, sizeof(commandTopic), host_, z.key)) return false;
    char availabilityFields[256] = {0};
    if (!buildAvailabilityFields_(availabilityFields, sizeof(availabilityFields))) return false;
    char deviceBlock[256] = {0};
    if (!buildDeviceBlock_(deviceBlock, sizeof(deviceBlock))) return false;

    return formatChecked(out, outLen,
        "{\"name\":\"%s\",\"unique_id\":\"%s_%s_sw\",\"state_topic\":\"%s\",\"command_topic\":\"%s\",%s,"
        "\"payload_on\":\"ON\",\"payload_off\":\"OFF\",\"state_on\":\"ON\",\"state_off\":\"OFF\","
        "\"icon\":\"%s\",%s}",
        z.name, host_, z.key, stateTopic, commandTopic, availabilityFields,
        info->icon ? info->icon : "mdi:toggle-switch", deviceBlock);
}

bool DiscoverySynchronizer::buildZoneSelectConfig(const Zone* zones, uint8_t count, char* out, size_t outLen) const
{
    if (!out || outLen == 0 || (!zones && count > 0)) return false;

    char setTopic[Limits::TopicBuf] = {0};
    char stateTopic[Limits::TopicBuf] = {0};
    if (!MqttTopics::selector(setTopic, sizeof(setTopic), host_, MqttTopics::ZoneSelect, MqttTopics::LeafSet)) return false;
    if (!MqttTopics::selector(stateTopic, sizeof(stateTopic), host_, MqttTopics::ZoneSelect, MqttTopics::LeafState)) return false;
    char availabilityFields[256] = {0};
    if (!buildAvailabilityFields_(availabilityFields, sizeof(availabilityFields))) return false;
    char deviceBlock[256] = {0};
    if (!buildDeviceBlock_(deviceBlock, sizeof(deviceBlock))) return false;

    size_t used = 0;
    if (!appendChecked(out, outLen, used,
            "{\"name\":\"%s Zone Select\",\"unique_id\":\"%s_%s\",\"command_topic\":\"%s\",\"state_topic\":\"%s\","
            "\"options\":[\"%s\"",
            host_, host_, MqttTopics::ZoneSelect, setTopic, stateTopic, ZoneDefaults::ZonePlaceholder)) {
        return false;
    }
    for (uint8_t i = 0; i < count; ++i) {
        if (!appendChecked(out, outLen, used, ",\"%s\"", zones[i].key)) return false;
    }
    return appendChecked(out, outLen, used, "],%s,\"icon\":\"%s\",%s}",
                         availabilityFields, ZoneDefaults::ZoneSelectIcon, deviceBlock);
}

bool DiscoverySynchronizer::buildClassSelectConfig(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    char setTopic[Limits::TopicBuf] = {0};
    char stateTopic[Limits::TopicBuf] = {0};
    if (!MqttTopics::selector(setTopic, sizeof(setTopic), host_, MqttTopics::ClassSelect, MqttTopics::LeafSet)) return false;
    if (!MqttTopics::selector(stateTopic, sizeof(stateTopic), host_, MqttTopics::ClassSelect, MqttTopics::LeafState)) return false;
    char availabilityFields[256] = {0};
    if (!buildAvailabilityFields_(availabilityFields, sizeof(availabilityFields))) return false;
    char deviceBlock[256] = {0};
    if (!buildDeviceBlock_(deviceBlock, sizeof(deviceBlock))) return false;

    size_t used = 0;
    if (!appendChecked(out, outLen, used,
            "{\"name\":\"%s Class Select\",\"unique_id\":\"%s_%s\",\"command_topic\":\"%s\",\"state_topic\":\"%s\","
            "\"options\":[\"%s\"",
            host_, host_, MqttTopics::ClassSelect, setTopic, stateTopic, ZoneDefaults::ClassPlaceholder)) {
        return false;
    }
    for (uint8_t i = 0; i < ZoneClasses::Count; ++i) {
        if (!appendChecked(out, outLen, used, ",\"%s\"", ZoneClasses::Table[i].name)) return false;
    }
    return appendChecked(out, outLen, used, "],%s,\"icon\":\"%s\",%s}",
                         availabilityFields, ZoneDefaults::ClassSelectIcon, deviceBlock);
}

bool DiscoverySynchronizer::publish_(const char* topic, const char* payload)
{
    if (!mqttSvc || !mqttSvc->publish) return false;
    return mqttSvc->publish(mqttSvc->ctx, topic, payload, 1, true);
}

bool DiscoverySynchronizer::publishZoneConfig(const Zone& z)
{
    if (!zoneConfigTopic(z.key, z.cls, topicBuf, sizeof(topicBuf))) {
        LOGW("HA config topic truncated zone=%s", z.key);
        return false;
    }

    const bool built = isOutputClass(z.cls)
        ? buildSwitchConfig(z, payloadBuf, sizeof(payloadBuf))
        : buildBinarySensorConfig(z, payloadBuf, sizeof(payloadBuf));
    if (!built) {
        LOGW("HA %s payload truncated zone=%s", zoneClassName(z.cls), z.key);
        return false;
    }
    return publish_(topicBuf, payloadBuf);
}

bool DiscoverySynchronizer::publishState(const Zone& z)
{
    if (!zoneStateTopic(z, topicBuf, sizeof(topicBuf))) {
        LOGW("state topic truncated zone=%s", z.key);
        return false;
    }
    return publish_(topicBuf, zoneValueText(z.cls, z.value));
}

bool DiscoverySynchronizer::retractZoneConfig(const char* zoneKey, EntityKind kind)
{
    if (!MqttTopics::discoveryConfig(topicBuf, sizeof(topicBuf), prefix_, entityKindComponent(kind), host_, zoneKey)) {
        LOGW("HA config topic truncated zone=%s", zoneKey ? zoneKey : "-");
        return false;
    }
    return publish_(topicBuf, "");
}

bool DiscoverySynchronizer::publishAll(const Zone* zones, uint8_t count)
{
    if (!zones && count > 0) return false;

    bool okAll = true;
    for (uint8_t i = 0; i < count; ++i) {
        const Zone& z = zones[i];
        const ZoneClassInfo* info = zoneClassInfo(z.cls);
        if (!info) {
            okAll = false;
            continue;
        }
        const EntityKind other = (info->kind == EntityKind::Switch) ? EntityKind::BinarySensor : EntityKind::Switch;
        if (!retractZoneConfig(z.key, other)) okAll = false;
        if (!publishZoneConfig(z)) okAll = false;
        if (!publishState(z)) okAll = false;
    }

    if (okAll) {
        LOGI("Home Assistant discovery published (zones=%u)", (unsigned)count);
    } else {
        LOGW("Home Assistant discovery publish incomplete");
    }
    return okAll;
}

bool DiscoverySynchronizer::reclassify(const Zone& zoneAfter, ZoneClass oldClass, ErrorCode* err, bool* retracted)
{
    if (retracted) *retracted = false;
    const ZoneClassInfo* oldInfo = zoneClassInfo(oldClass);
    if (!oldInfo) return failWith(err, ErrorCode::InvalidTransition);

    if (!retractZoneConfig(zoneAfter.key, oldInfo->kind)) {
        LOGW("%s: %s config not retracted, new config withheld",
             zoneAfter.key, entityKindComponent(oldInfo->kind));
        return failWith(err, ErrorCode::TransportError);
    }
    if (retracted) *retracted = true;

    bool ok = publishZoneConfig(zoneAfter);
    if (!publishState(zoneAfter)) ok = false;
    if (!ok) return failWith(err, ErrorCode::TransportError);
    return true;
}

bool DiscoverySynchronizer::publishSelectorState(const char* selectorId, const char* value)
{
    if (!selectorId || !value) return false;
    if (!MqttTopics::selector(topicBuf, sizeof(topicBuf), host_, selectorId, MqttTopics::LeafState)) {
        LOGW("selector topic truncated id=%s", selectorId);
        return false;
    }
    return publish_(topicBuf, value);
}

bool DiscoverySynchronizer::publishSelectors(const Zone* zones, uint8_t count)
{
    bool okAll = true;

    if (!buildZoneSelectConfig(zones, count, payloadBuf, sizeof(payloadBuf)) ||
        !MqttTopics::discoveryConfig(topicBuf, sizeof(topicBuf), prefix_, "select", host_, MqttTopics::ZoneSelect)) {
        LOGW("HA zone select payload truncated");
        okAll = false;
    } else if (!publish_(topicBuf, payloadBuf)) {
        okAll = false;
    }

    if (!buildClassSelectConfig(payloadBuf, sizeof(payloadBuf)) ||
        !MqttTopics::discoveryConfig(topicBuf, sizeof(topicBuf), prefix_, "select", host_, MqttTopics::ClassSelect)) {
        LOGW("HA class select payload truncated");
        okAll = false;
    } else if (!publish_(topicBuf, payloadBuf)) {
        okAll = false;
    }

    if (!publishSelectorState(MqttTopics::ZoneSelect, ZoneDefaults::ZonePlaceholder)) okAll = false;
    if (!publishSelectorState(MqttTopics::ClassSelect, ZoneDefaults::ClassPlaceholder)) okAll = false;
    return okAll;
}

bool DiscoverySynchronizer::retractAll(const Zone* zones, uint8_t count)
{
    if (!zones && count > 0) return false;

    bool okAll = true;
    for (uint8_t i = 0; i < count; ++i) {
        if (!retractZoneConfig(zones[i].key, EntityKind::BinarySensor)) okAll = false;
        if (!retractZoneConfig(zones[i].key, EntityKind::Switch)) okAll = false;
    }

    const char* selectors[] = { MqttTopics::ZoneSelect, MqttTopics::ClassSelect };
    for (const char* id : selectors) {
        if (!MqttTopics::discoveryConfig(topicBuf, sizeof(topicBuf), prefix_, "select", host_, id) ||
            !publish_(topicBuf, "")) {
            okAll = false;
        }
    }

    LOGI("Home Assistant discovery retracted (zones=%u ok=%d)", (unsigned)count, okAll ? 1 : 0);
    return okAll;
}
