#pragma once
/**
 * @file DiscoverySynchronizer.h
 * @brief Home Assistant discovery records for zones and selectors.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/Services/IMqtt.h"
#include "Core/SystemLimits.h"
#include "Modules/ZoneModule/ZoneTypes.h"

/**
 * @brief Translates zone classes into discovery records and moves zones between shapes.
 *
 * Every publish is QoS 1 and retained. An empty retained payload on a config
 * topic retracts the entity. Callers serialize access; the synchronizer keeps
 * scratch buffers and is not thread-safe on its own.
 */
class DiscoverySynchronizer {
public:
    explicit DiscoverySynchronizer(const MqttService* mqtt = nullptr) : mqttSvc(mqtt) {}

    void setMqtt(const MqttService* mqtt) { mqttSvc = mqtt; }

    /**
     * @brief Set identity used in topics and device block.
     * @return false when a value was unusable and its default was taken instead
     */
    bool configure(const char* host, const char* discoveryPrefix, const char* manufacturer);
    const char* host() const { return host_; }

    bool buildBinarySensorConfig(const Zone& z, char* out, size_t outLen) const;
    bool buildSwitchConfig(const Zone& z, char* out, size_t outLen) const;
    bool buildZoneSelectConfig(const Zone* zones, uint8_t count, char* out, size_t outLen) const;
    bool buildClassSelectConfig(char* out, size_t outLen) const;

    /** @brief Config topic of `zoneKey` for the entity kind of `cls`. */
    bool zoneConfigTopic(const char* zoneKey, ZoneClass cls, char* out, size_t outLen) const;
    /** @brief State topic of a zone in its current class. */
    bool zoneStateTopic(const Zone& z, char* out, size_t outLen) const;

    /** @brief Publish the discovery config matching the zone's current class. */
    bool publishZoneConfig(const Zone& z);
    /** @brief Publish the retained state (`OPEN/CLOSED` or `ON/OFF`). */
    bool publishState(const Zone& z);
    /** @brief Publish an empty retained payload on the `kind` config topic of a zone. */
    bool retractZoneConfig(const char* zoneKey, EntityKind kind);

    /**
     * @brief Full re-publication of every zone.
     *
     * For each zone the config of the other entity kind is retracted first, so a
     * record left behind by an interrupted reclassification is cleared, then
     * the current config and state are published.
     */
    bool publishAll(const Zone* zones, uint8_t count);

    /**
     * @brief Move one zone from `oldClass` to its current class.
     *
     * Retracts the config of the old entity kind (always, even when the kind
     * is unchanged), then publishes the new config, then the state. Nothing is
     * published when the retraction is refused, so the old record stays the
     * only live one.
     *
     * @param err `TransportError` when a publish was refused
     * @param retracted set once the old record is gone (may be null)
     */
    bool reclassify(const Zone& zoneAfter, ZoneClass oldClass,
                    ErrorCode* err = nullptr, bool* retracted = nullptr);

    /** @brief Publish both selector configs and reset their states to placeholders. */
    bool publishSelectors(const Zone* zones, uint8_t count);
    /** @brief Publish `<host>/<selector>/state`. */
    bool publishSelectorState(const char* selectorId, const char* value);

    /** @brief Retract every zone config of both kinds and both selectors. */
    bool retractAll(const Zone* zones, uint8_t count);

private:
    const MqttService* mqttSvc = nullptr;

    char host_[Limits::HostBuf] = {0};
    char prefix_[64] = {0};
    char manufacturer_[64] = {0};

    char topicBuf[Limits::TopicBuf] = {0};
    char payloadBuf[Limits::Zones::DiscoveryPayloadBuf] = {0};

    bool publish_(const char* topic, const char* payload);
    bool buildDeviceBlock_(char* out, size_t outLen) const;
    bool buildAvailabilityFields_(char* out, size_t outLen) const;
};
