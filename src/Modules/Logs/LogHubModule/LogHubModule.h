#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"

/**
 * @brief Passive module wiring log hub and sink registry services.
 */
class LogHubModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "loghub"; }

    /** @brief Initialize log hub and register services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply the configured minimum level. */
    bool onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Entries dropped by the hub since start. */
    uint32_t dropped() const { return hub.dropped(); }

private:
    LogHub hub;
    LogHubService hubSvc{};

    LogSinkRegistry sinks;
    LogSinkRegistryService sinksSvc{};

    char levelName[8] = "info";
    ConfigVariable<char> levelVar {
        "ZONELINK_LOG_LEVEL","level","log",ConfigType::CharArray,
        (char*)levelName,ConfigPersistence::Persistent,sizeof(levelName)
    };
};
