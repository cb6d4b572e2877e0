#pragma once
/**
 * @file IMqtt.h
 * @brief MQTT service interface.
 */

#include <stddef.h>

/** @brief Handler invoked on the MQTT task for a subscribed topic. */
typedef void (*MqttMessageHandler)(void* ctx, const char* topic, const char* payload);

/** @brief Service wrapper for publish/subscribe via MQTTModule. */
struct MqttService {
    /** @brief Queue a publish. Returns false when the broker link is down. */
    bool (*publish)(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    /** @brief Register an exact-topic subscription, replayed on every reconnect. */
    bool (*subscribe)(void* ctx, const char* topic, int qos, MqttMessageHandler handler, void* handlerCtx);
    bool (*isConnected)(void* ctx);
    /** @brief Topic carrying `online`/`offline`, also used as last-will. Set before the first connect. */
    bool (*setAvailabilityTopic)(void* ctx, const char* topic);
    void* ctx;
};
