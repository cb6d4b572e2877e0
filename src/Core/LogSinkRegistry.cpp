/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    if (count_ >= MAX_SINKS) return false;
    sinks_[count_++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return count_;
}

int LogSinkRegistry::snapshot(LogSinkService* out, int max) const {
    if (!out || max <= 0) return 0;
    std::lock_guard<std::mutex> lock(mtx_);
    const int n = (count_ < max) ? count_ : max;
    for (int i = 0; i < n; ++i) out[i] = sinks_[i];
    return n;
}
