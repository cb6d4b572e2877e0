#pragma once
/**
 * @file IODriver.h
 * @brief Base interface for IO drivers.
 */

#include <stdint.h>

class IODriver {
public:
    virtual ~IODriver() = default;
    virtual const char* id() const = 0;
    virtual bool begin() = 0;
};

/** @brief Line direction requested from a digital driver. */
enum class PinDirection : uint8_t { Input, Output };

/**
 * @brief Pin-addressed digital IO.
 *
 * Inputs are configured with the pull-up enabled, so an open contact reads
 * HIGH. A line switched to output starts LOW.
 */
class IDigitalIoDriver : public IODriver {
public:
    virtual bool setDirection(uint8_t pin, PinDirection dir) = 0;
    virtual bool readDigital(uint8_t pin, bool& high) = 0;
    virtual bool writeDigital(uint8_t pin, bool high) = 0;
};
