#pragma once
/**
 * @file IOModule.h
 * @brief GPIO access module exposing the digital driver as a service.
 */

#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Modules/IOModule/IODrivers/GpioChipDriver.h"
#include <memory>

struct IOModuleConfig {
    char chip[Limits::PathBuf] = "/dev/gpiochip0";
    char consumer[32] = "zonelink";
};

class IOModule : public ModulePassive {
public:
    const char* moduleId() const override { return "gpio"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Open the GPIO chip. Returning false stops startup (GPIO unavailable). */
    bool onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    IDigitalIoDriver* driver() { return driver_.get(); }
    /** @brief Set when the chip could not be opened. */
    bool gpioFailed() const { return gpioFailed_; }

private:
    IOModuleConfig cfgData_{};
    std::unique_ptr<GpioChipDriver> driver_;
    GpioService gpioSvc_{ nullptr };
    bool gpioFailed_ = false;

    ConfigVariable<char> chipVar_ {
        "GPIO_CHIP","chip","gpio",ConfigType::CharArray,
        (char*)cfgData_.chip,ConfigPersistence::Persistent,sizeof(cfgData_.chip)
    };
    ConfigVariable<char> consumerVar_ {
        nullptr,"consumer","gpio",ConfigType::CharArray,
        (char*)cfgData_.consumer,ConfigPersistence::Persistent,sizeof(cfgData_.consumer)
    };
};
