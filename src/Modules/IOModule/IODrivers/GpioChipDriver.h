#pragma once
/**
 * @file GpioChipDriver.h
 * @brief Linux GPIO character device driver (uAPI v2).
 */

#include <stdint.h>
#include <mutex>
#include "Core/SystemLimits.h"
#include "Modules/IOModule/IODrivers/IODriver.h"

/**
 * @brief Drives BCM-numbered lines of one gpiochip through line requests.
 *
 * Each pin owns one line request fd; direction changes reconfigure it in place.
 */
class GpioChipDriver : public IDigitalIoDriver {
public:
    static constexpr uint8_t MaxLines = 64;

    GpioChipDriver(const char* driverId, const char* chipPath, const char* consumer);
    ~GpioChipDriver() override;

    GpioChipDriver(const GpioChipDriver&) = delete;
    GpioChipDriver& operator=(const GpioChipDriver&) = delete;

    const char* id() const override { return driverId_; }
    /** @brief Open the chip device. */
    bool begin() override;

    bool setDirection(uint8_t pin, PinDirection dir) override;
    bool readDigital(uint8_t pin, bool& high) override;
    bool writeDigital(uint8_t pin, bool high) override;

    /** @brief Release every line and close the chip. */
    void end();

private:
    const char* driverId_ = nullptr;
    char chipPath_[Limits::PathBuf] = {0};
    char consumer_[32] = {0};

    std::mutex mtx_;
    int chipFd_ = -1;
    int lineFd_[MaxLines];
    bool isOutput_[MaxLines]{};

    bool requestLine_(uint8_t pin, PinDirection dir);
    bool reconfigureLine_(uint8_t pin, PinDirection dir);
};
