#pragma once
/**
 * @file LogConsoleSinkModule.h
 * @brief Console (stderr) log sink module.
 */
#include "Core/Module.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that writes log entries to stderr.
 */
class LogConsoleSinkModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.sink.console"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register config and the console sink. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

    bool enabled = true;
    bool color = false;

private:
    ConfigVariable<bool> enabledVar {
        "ZONELINK_LOG_CONSOLE","console","log",ConfigType::Bool,
        &enabled,ConfigPersistence::Persistent,0
    };
};
