/**
 * @file IOScheduler.cpp
 * @brief Implementation file.
 */

#include "IOScheduler.h"

bool IOScheduler::add(const IOScheduledJob& job)
{
    if (!job.id || !job.fn) return false;
    if (count_ >= IO_SCHED_MAX_JOBS) return false;
    jobs_[count_++] = job;
    return true;
}

uint8_t IOScheduler::tick(uint32_t nowMs)
{
    uint8_t runs = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        IOScheduledJob& j = jobs_[i];
        if (!j.fn || j.periodMs == 0) continue;

        if ((uint32_t)(nowMs - j.lastRunMs) < j.periodMs) continue;

        j.fn(j.ctx, nowMs);
        j.lastRunMs = nowMs;
        ++runs;
    }
    return runs;
}

uint32_t IOScheduler::msUntilNext(uint32_t nowMs, uint32_t cap) const
{
    uint32_t best = cap;
    for (uint8_t i = 0; i < count_; ++i) {
        const IOScheduledJob& j = jobs_[i];
        if (!j.fn || j.periodMs == 0) continue;

        const uint32_t elapsed = nowMs - j.lastRunMs;
        if (elapsed >= j.periodMs) return 0;
        const uint32_t left = j.periodMs - elapsed;
        if (left < best) best = left;
    }
    return best;
}
