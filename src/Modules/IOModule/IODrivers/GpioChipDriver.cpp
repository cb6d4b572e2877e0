/**
 * @file GpioChipDriver.cpp
 * @brief Implementation file.
 */

#include "GpioChipDriver.h"
#include "Core/Log.h"
#include <errno.h>
#include <fcntl.h>
#include <linux/gpio.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#define LOG_TAG_GPIO "GpioChip"

static void fillLineConfig(gpio_v2_line_config& cfg, PinDirection dir)
{
    memset(&cfg, 0, sizeof(cfg));
    if (dir == PinDirection::Output) {
        cfg.flags = GPIO_V2_LINE_FLAG_OUTPUT;
        cfg.num_attrs = 1;
        cfg.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
        cfg.attrs[0].attr.values = 0;  // start LOW
        cfg.attrs[0].mask = 1;
    } else {
        cfg.flags = GPIO_V2_LINE_FLAG_INPUT | GPIO_V2_LINE_FLAG_BIAS_PULL_UP;
    }
}

GpioChipDriver::GpioChipDriver(const char* driverId, const char* chipPath, const char* consumer)
    : driverId_(driverId)
{
    snprintf(chipPath_, sizeof(chipPath_), "%s", chipPath ? chipPath : "");
    snprintf(consumer_, sizeof(consumer_), "%s", consumer ? consumer : "");
    for (uint8_t i = 0; i < MaxLines; ++i) lineFd_[i] = -1;
}

GpioChipDriver::~GpioChipDriver()
{
    end();
}

bool GpioChipDriver::begin()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (chipFd_ >= 0) return true;

    chipFd_ = open(chipPath_, O_RDWR | O_CLOEXEC);
    if (chipFd_ < 0) {
        Log::error(LOG_TAG_GPIO, "open %s failed: %s", chipPath_, strerror(errno));
        return false;
    }

    gpiochip_info info;
    memset(&info, 0, sizeof(info));
    if (ioctl(chipFd_, GPIO_GET_CHIPINFO_IOCTL, &info) == 0) {
        Log::info(LOG_TAG_GPIO, "%s: %s (%s) lines=%u", chipPath_, info.name, info.label, (unsigned)info.lines);
    } else {
        Log::warn(LOG_TAG_GPIO, "%s: chip info unavailable (%s)", chipPath_, strerror(errno));
    }
    return true;
}

void GpioChipDriver::end()
{
    std::lock_guard<std::mutex> lock(mtx_);
    for (uint8_t i = 0; i < MaxLines; ++i) {
        if (lineFd_[i] >= 0) {
            close(lineFd_[i]);
            lineFd_[i] = -1;
        }
        isOutput_[i] = false;
    }
    if (chipFd_ >= 0) {
        close(chipFd_);
        chipFd_ = -1;
    }
}

bool GpioChipDriver::requestLine_(uint8_t pin, PinDirection dir)
{
    gpio_v2_line_request req;
    memset(&req, 0, sizeof(req));
    req.offsets[0] = pin;
    req.num_lines = 1;
    snprintf(req.consumer, sizeof(req.consumer), "%s", consumer_);
    fillLineConfig(req.config, dir);

    if (ioctl(chipFd_, GPIO_V2_GET_LINE_IOCTL, &req) != 0) {
        Log::error(LOG_TAG_GPIO, "request line %u failed: %s", (unsigned)pin, strerror(errno));
        return false;
    }
    lineFd_[pin] = req.fd;
    return true;
}

bool GpioChipDriver::reconfigureLine_(uint8_t pin, PinDirection dir)
{
    gpio_v2_line_config cfg;
    fillLineConfig(cfg, dir);
    if (ioctl(lineFd_[pin], GPIO_V2_LINE_SET_CONFIG_IOCTL, &cfg) != 0) {
        Log::error(LOG_TAG_GPIO, "reconfigure line %u failed: %s", (unsigned)pin, strerror(errno));
        return false;
    }
    return true;
}

bool GpioChipDriver::setDirection(uint8_t pin, PinDirection dir)
{
    if (pin >= MaxLines) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    if (chipFd_ < 0) return false;

    const bool ok = (lineFd_[pin] >= 0) ? reconfigureLine_(pin, dir) : requestLine_(pin, dir);
    if (!ok) return false;

    isOutput_[pin] = (dir == PinDirection::Output);
    Log::debug(LOG_TAG_GPIO, "line %u -> %s", (unsigned)pin, isOutput_[pin] ? "output" : "input");
    return true;
}

bool GpioChipDriver::readDigital(uint8_t pin, bool& high)
{
    if (pin >= MaxLines) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    if (lineFd_[pin] < 0) return false;

    gpio_v2_line_values vals;
    memset(&vals, 0, sizeof(vals));
    vals.mask = 1;
    if (ioctl(lineFd_[pin], GPIO_V2_LINE_GET_VALUES_IOCTL, &vals) != 0) {
        Log::warn(LOG_TAG_GPIO, "read line %u failed: %s", (unsigned)pin, strerror(errno));
        return false;
    }
    high = (vals.bits & 1ULL) != 0;
    return true;
}

bool GpioChipDriver::writeDigital(uint8_t pin, bool high)
{
    if (pin >= MaxLines) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    if (lineFd_[pin] < 0 || !isOutput_[pin]) return false;

    gpio_v2_line_values vals;
    memset(&vals, 0, sizeof(vals));
    vals.mask = 1;
    vals.bits = high ? 1ULL : 0ULL;
    if (ioctl(lineFd_[pin], GPIO_V2_LINE_SET_VALUES_IOCTL, &vals) != 0) {
        Log::warn(LOG_TAG_GPIO, "write line %u failed: %s", (unsigned)pin, strerror(errno));
        return false;
    }
    return true;
}
