#pragma once
/**
 * @file ZoneModule.h
 * @brief Zone engine module: registry, pulses, polling, discovery and commands.
 */

#include "Core/BoundedQueue.h"
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Domain/ZoneDefaults.h"
#include "Modules/IOModule/IOScheduler/IOScheduler.h"
#include "Modules/Network/HADiscovery/DiscoverySynchronizer.h"
#include "Modules/ZoneModule/CommandRouter.h"
#include "Modules/ZoneModule/ContactPoller.h"
#include "Modules/ZoneModule/PulseController.h"
#include "Modules/ZoneModule/ZonePersistence.h"
#include "Modules/ZoneModule/ZoneRegistry.h"
#include <atomic>

struct ZoneModuleConfig {
    char host[Limits::HostBuf] = "";
    int32_t tapMs = ZoneDefaults::TapPulseMs;
    int32_t debounceMs = ZoneDefaults::DebounceMs;
    int32_t pollMs = ZoneDefaults::PollIntervalMs;
    char stateDir[Limits::PathBuf] = "";
};

struct HaDiscoveryConfig {
    char discoveryPrefix[64] = "homeassistant";
    char manufacturer[64] = "Raspberry Pi";
};

/**
 * @brief Active module owning every zone.
 *
 * MQTT callbacks only parse the topic and queue a `ZoneCommand`; the module
 * thread is the single writer of zone state. Each broker (re)connect triggers
 * a full discovery sync.
 */
class ZoneModule : public Module {
public:
    ZoneModule();

    const char* moduleId() const override { return "zones"; }
    const char* taskName() const override { return "zones"; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "gpio";
        if (i == 2) return "mqtt";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Resolve identity, load classes and configure every pin. */
    bool onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief The command queue wait paces the loop. */
    uint32_t taskDelayMs() const override { return 0; }

    /** @brief Retract every discovery record once connected instead of serving zones. */
    void setCleanupMode(bool on) { cleanupMode_ = on; }
    bool cleanupDone() const { return cleanupDone_.load(); }
    /** @brief Set when startup failed on pin configuration. */
    bool pinSetupFailed() const { return pinSetupFailed_; }

    const char* host() const { return hostId_; }
    const ZoneRegistry& registry() const { return registry_; }

private:
    ZoneModuleConfig cfgData{};
    HaDiscoveryConfig haCfg{};
    char hostId_[Limits::HostBuf] = {0};

    const MqttService* mqttSvc = nullptr;
    const GpioService* gpioSvc = nullptr;

    ZoneRegistry registry_;
    ZonePersistence store_;
    DiscoverySynchronizer sync_;
    PulseController pulses_;
    ContactPoller poller_;
    CommandRouter router_;
    IOScheduler scheduler_;

    BoundedQueue<ZoneCommand, Limits::Zones::CommandQueueLen> cmdQ_;
    std::atomic<uint32_t> cmdDropCount_{0};

    bool cleanupMode_ = false;
    std::atomic<bool> cleanupDone_{false};
    bool pinSetupFailed_ = false;
    bool wasConnected_ = false;
    uint32_t repairDueMs_ = 0;

    ConfigVariable<char> hostVar {
        "ZONELINK_HOST","host","zones",ConfigType::CharArray,
        (char*)cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<int32_t> tapMsVar {
        nullptr,"tap_ms","zones",ConfigType::Int32,
        &cfgData.tapMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> debounceMsVar {
        nullptr,"debounce_ms","zones",ConfigType::Int32,
        &cfgData.debounceMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> pollMsVar {
        nullptr,"poll_ms","zones",ConfigType::Int32,
        &cfgData.pollMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> stateDirVar {
        "ZONELINK_STATE_DIR","state_dir","zones",ConfigType::CharArray,
        (char*)cfgData.stateDir,ConfigPersistence::Persistent,sizeof(cfgData.stateDir)
    };
    ConfigVariable<char> prefixVar {
        "HA_DISCOVERY_PREFIX","discovery_prefix","ha",ConfigType::CharArray,
        (char*)haCfg.discoveryPrefix,ConfigPersistence::Persistent,sizeof(haCfg.discoveryPrefix)
    };
    ConfigVariable<char> manufacturerVar {
        nullptr,"manufacturer","ha",ConfigType::CharArray,
        (char*)haCfg.manufacturer,ConfigPersistence::Persistent,sizeof(haCfg.manufacturer)
    };

    bool configurePins_();
    bool subscribeAll_();
    void fullSync_();
    bool repairDiscovery_();
    void runCleanup_();
    uint32_t idleWaitMs_(uint32_t nowMs) const;

    static void onMqttMessage(void* ctx, const char* topic, const char* payload);
    static void pollJob(void* ctx, uint32_t nowMs);
};
