#pragma once
/**
 * @file IIO.h
 * @brief I/O helper service interfaces.
 */
#include <stdint.h>

class IDigitalIoDriver;

/** @brief Digital GPIO access exposed by IOModule. */
struct GpioService {
    IDigitalIoDriver* driver;
};
