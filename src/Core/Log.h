/**
 * @file Log.h
 * @brief Global log helper for core and modules.
 */
#pragma once

#include "Core/Services/ILogger.h"
#include <stddef.h>

namespace Log {
    /**
     * @brief Set the global log hub service.
     */
    void setHub(const LogHubService* hub);

    /**
     * @brief Get the current global log hub service.
     */
    const LogHubService* hub();

    /** @brief Drop entries below `lvl` before they reach the hub. */
    void setMinLevel(LogLevel lvl);

    /**
     * @brief Log a formatted message with a given level.
     */
    void logf(LogLevel lvl, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    /** @brief Convenience: Debug log. */
    void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    /** @brief Convenience: Info log. */
    void info(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    /** @brief Convenience: Warning log. */
    void warn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    /** @brief Convenience: Error log. */
    void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    /**
     * @brief `snprintf` that warns under `tag` with the call site when the output is truncated.
     * @return the `vsnprintf` result
     */
    int formatChecked(const char* tag, const char* file, int line, char* out, size_t outLen,
                      const char* fmt, ...) __attribute__((format(printf, 6, 7)));
}

// Macros are provided by Core/ModuleLog.h to keep Module.h neutral.
