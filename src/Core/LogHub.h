#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/BoundedQueue.h"
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"
#include <atomic>

/**
 * @brief Queue-based log hub for producers and consumers.
 */
class LogHub {
public:
    /** @brief Enqueue a log entry (non-blocking, dropped when full). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitMs). */
    bool dequeue(LogEntry& out, uint32_t waitMs);
    /** @brief Entries dropped because the queue was full. */
    uint32_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    BoundedQueue<LogEntry, Limits::LogQueueLen> q;
    std::atomic<uint32_t> dropped_{0};
};
