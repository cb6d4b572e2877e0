/**
 * @file SystemClock.cpp
 * @brief Implementation file.
 */
#include "Core/SystemClock.h"
#include <chrono>
#include <thread>
#include <stdio.h>
#include <time.h>

namespace {
    const std::chrono::steady_clock::time_point g_start = std::chrono::steady_clock::now();
}

uint32_t millis() {
    const auto elapsed = std::chrono::steady_clock::now() - g_start;
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

void delayMs(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

bool formatLocalTime(char* out, size_t outLen) {
    if (!out || outLen == 0) return false;

    struct timespec now;
    if (clock_gettime(CLOCK_REALTIME, &now) != 0) {
        out[0] = '\0';
        return false;
    }
    struct tm t;
    localtime_r(&now.tv_sec, &t);

    const int n = snprintf(out, outLen, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                           t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                           t.tm_hour, t.tm_min, t.tm_sec,
                           (long)(now.tv_nsec / 1000000L));
    return n > 0 && (size_t)n < outLen;
}
