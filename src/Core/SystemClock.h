#pragma once
/**
 * @file SystemClock.h
 * @brief Monotonic millisecond clock and sleep helpers.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief Milliseconds since process start (monotonic, wraps after ~49 days). */
uint32_t millis();

/** @brief Sleep the calling thread for `ms` milliseconds. */
void delayMs(uint32_t ms);

/** @brief Local wall clock as `YYYY-MM-DD HH:MM:SS.mmm`. */
bool formatLocalTime(char* out, size_t outLen);
