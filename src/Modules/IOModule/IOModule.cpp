/**
 * @file IOModule.cpp
 * @brief Implementation file.
 */
#define LOG_TAG "IOModule"
#include "IOModule.h"
#include "Core/ModuleLog.h"

void IOModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(chipVar_);
    cfg.registerVar(consumerVar_);

    /// driver is filled once the chip path is known
    if (!services.add("gpio", &gpioSvc_)) {
        LOGE("gpio service registration failed");
    }
    LOGI("I/O config registered");
}

bool IOModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    driver_.reset(new GpioChipDriver("gpiochip", cfgData_.chip, cfgData_.consumer));
    if (!driver_->begin()) {
        LOGE("GPIO unavailable on %s", cfgData_.chip);
        driver_.reset();
        gpioFailed_ = true;
        return false;
    }
    gpioSvc_.driver = driver_.get();
    LOGI("GPIO ready on %s", cfgData_.chip);
    return true;
}
