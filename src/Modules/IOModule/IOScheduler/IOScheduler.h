#pragma once
/**
 * @file IOScheduler.h
 * @brief Fixed-size cooperative scheduler for periodic IO jobs.
 */

#include <stdint.h>

constexpr uint8_t IO_SCHED_MAX_JOBS = 4;

typedef void (*IOScheduledFn)(void* ctx, uint32_t nowMs);

struct IOScheduledJob {
    const char* id = nullptr;
    uint32_t periodMs = 1000;
    uint32_t lastRunMs = 0;
    IOScheduledFn fn = nullptr;
    void* ctx = nullptr;
};

class IOScheduler {
public:
    bool add(const IOScheduledJob& job);
    /** @brief Run every job whose period elapsed. Returns the number of runs. */
    uint8_t tick(uint32_t nowMs);
    /** @brief Milliseconds until the next job is due (0 when overdue, `cap` when idle). */
    uint32_t msUntilNext(uint32_t nowMs, uint32_t cap) const;

private:
    IOScheduledJob jobs_[IO_SCHED_MAX_JOBS]{};
    uint8_t count_ = 0;
};
