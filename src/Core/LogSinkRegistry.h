#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Fixed table of log sinks filled by the sink modules at init.
 */
#include "Core/Services/ILogger.h"
#include <mutex>

class LogSinkRegistry {
public:
    static constexpr int MAX_SINKS = 4;

    /** @brief Append a sink. Fails when the table is full or `write` is null. */
    bool add(LogSinkService sink);
    int count() const;
    /** @brief Copy up to `max` sinks under one lock. Returns the copied count. */
    int snapshot(LogSinkService* out, int max) const;

private:
    mutable std::mutex mtx_;
    LogSinkService sinks_[MAX_SINKS]{};
    int count_ = 0;
};
