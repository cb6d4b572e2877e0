#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief Log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint16_t LogQueueLen = 256;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief Maximum size in bytes of the JSON config file read by `ConfigStore::loadFile`. */
constexpr size_t ConfigFileMax = 8192;
/** @brief JSON capacity for the config document parsed by `ConfigStore::applyJson`. */
constexpr size_t JsonConfigApplyBuf = 4096;
/** @brief Capacity of `ServiceRegistry`. */
constexpr uint8_t MaxServices = 8;
/** @brief Host slug buffer length (`<host>` in every topic). */
constexpr size_t HostBuf = 40;
/** @brief Generic MQTT topic buffer length. */
constexpr size_t TopicBuf = 160;
/** @brief Filesystem path buffer length (persistence, log files, config file). */
constexpr size_t PathBuf = 256;

/** @brief MQTT-specific limits grouped by concern to keep `SystemLimits` readable. */
namespace Mqtt {

/** @brief MQTT static capacities (queues, tables). */
namespace Capacity {
/** @brief RX queue length for inbound MQTT messages in `MQTTModule`. */
constexpr uint8_t RxQueueLen = 32;
/** @brief Maximum number of topic subscriptions kept by `MQTTModule` for re-subscribe on connect. */
constexpr uint8_t MaxSubscriptions = 24;
/** @brief TX queue length for outbound publishes drained by `MQTTModule::loop`. */
constexpr uint8_t TxQueueLen = 64;
}  // namespace Capacity

/** @brief MQTT default configuration values. */
namespace Defaults {
/** @brief Default MQTT broker port used by `MQTTConfig::port` in `MQTTModule`. */
constexpr int32_t Port = 1883;
/** @brief Default MQTT keepalive in seconds. */
constexpr int32_t KeepAliveS = 30;
}  // namespace Defaults

/** @brief MQTT string/payload buffer sizes. */
namespace Buffers {
/** @brief MQTT config buffer length for `MQTTConfig::host` in `MQTTModule`. */
constexpr size_t Host = 64;
/** @brief MQTT config buffer length for `MQTTConfig::user` in `MQTTModule`. */
constexpr size_t User = 32;
/** @brief MQTT config buffer length for `MQTTConfig::pass` in `MQTTModule`. */
constexpr size_t Pass = 64;
/** @brief RX topic buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxTopic = 128;
/** @brief RX payload buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxPayload = 384;
/** @brief TX topic buffer length inside `MQTTModule::TxMsg`. */
constexpr size_t TxTopic = 160;
/** @brief TX payload buffer length inside `MQTTModule::TxMsg` (largest discovery payload). */
constexpr size_t TxPayload = 1024;
/** @brief Client id buffer length. */
constexpr size_t ClientId = 64;
}  // namespace Buffers

/** @brief MQTT timing constants (runtime behavior). */
namespace Timing {
/** @brief Delay in ms while MQTT is disabled or waiting in `MQTTModule::loop`. */
constexpr uint32_t IdleDelayMs = 50;
/** @brief MQTT connection timeout in ms before forcing reconnect in `MQTTModule::loop`. */
constexpr uint32_t ConnectTimeoutMs = 10000;
/** @brief Network wait in ms handed to `mosquitto_loop` on each `MQTTModule::loop` pass. */
constexpr int LoopTimeoutMs = 20;
/** @brief Time in ms given to the broker to flush `offline` before disconnect on shutdown. */
constexpr uint32_t OfflineFlushMs = 200;
}  // namespace Timing

/** @brief MQTT reconnect backoff profile. */
namespace Backoff {
/** @brief Minimum MQTT reconnect backoff in ms (`MQTTModule` error-wait state). */
constexpr uint32_t MinMs = 2000;
/** @brief MQTT reconnect backoff step #1 threshold in ms. */
constexpr uint32_t Step1Ms = 5000;
/** @brief MQTT reconnect backoff step #2 threshold in ms. */
constexpr uint32_t Step2Ms = 10000;
/** @brief MQTT reconnect backoff step #3 threshold in ms. */
constexpr uint32_t Step3Ms = 30000;
/** @brief MQTT reconnect backoff step #4 threshold in ms. */
constexpr uint32_t Step4Ms = 60000;
/** @brief Maximum MQTT reconnect backoff in ms. */
constexpr uint32_t MaxMs = 300000;
/** @brief Random jitter percentage applied to MQTT reconnect backoff delay. */
constexpr uint8_t JitterPct = 15;
}  // namespace Backoff

}  // namespace Mqtt

/** @brief Zone engine capacities and buffers. */
namespace Zones {
/** @brief Maximum number of zones handled by `ZoneRegistry`. */
constexpr uint8_t MaxZones = 16;
/** @brief Zone key buffer length (`zone1`..`zoneN`). */
constexpr size_t KeyBuf = 12;
/** @brief Zone display name buffer length. */
constexpr size_t NameBuf = 24;
/** @brief Inbound command queue length consumed by `ZoneModule::loop`. */
constexpr uint8_t CommandQueueLen = 32;
/** @brief Inbound command payload buffer length. */
constexpr size_t CommandPayload = 64;
/** @brief Discovery payload buffer length in `DiscoverySynchronizer`. */
constexpr size_t DiscoveryPayloadBuf = 1024;
/** @brief JSON capacity for the persisted zone class mapping. */
constexpr size_t JsonPersistBuf = 1536;
/** @brief Maximum persisted mapping file size read by `ZonePersistence::load`. */
constexpr size_t PersistFileMax = 4096;
/** @brief Upper bound in ms for one idle wait of `ZoneModule::loop`. */
constexpr uint32_t MaxIdleWaitMs = 100;
/** @brief Delay between attempts to repair an incomplete discovery update. */
constexpr uint32_t RepairRetryMs = 5000;
}  // namespace Zones

/** @brief Rotating file log sink limits. */
namespace LogFile {
/** @brief Default rotation threshold in bytes. */
constexpr int32_t DefaultMaxBytes = 2000000;
/** @brief Default number of rotated backups kept. */
constexpr int32_t DefaultBackups = 5;
/** @brief Upper bound on rotated backups. */
constexpr int32_t MaxBackups = 20;
}  // namespace LogFile

/** @brief Time given to the broker in `--cleanup` mode before giving up. */
constexpr uint32_t CleanupTimeoutMs = 10000;

}  // namespace Limits
