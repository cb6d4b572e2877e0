/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

bool LogHub::enqueue(const LogEntry& e) {
    if (q.send(e)) return true;
    dropped_.fetch_add(1U, std::memory_order_relaxed);
    return false;
}

bool LogHub::dequeue(LogEntry& out, uint32_t waitMs) {
    return q.receive(out, waitMs);
}
