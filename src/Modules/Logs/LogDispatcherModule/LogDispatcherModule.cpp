/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include "Core/SystemClock.h"

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto hubSvc = services.require<LogHubService>("loghub", moduleId());
    _sinkReg = services.require<LogSinkRegistryService>("logsinks", moduleId());

    /// the LogHub instance travels as the hub service ctx
    if (!hubSvc || !hubSvc->ctx || !_sinkReg) return;

    _hub = static_cast<LogHub*>(hubSvc->ctx);
}

void LogDispatcherModule::dispatch_(const LogEntry& e) {
    LogSinkService sinks[LogSinkRegistry::MAX_SINKS];
    const int n = _sinkReg->snapshot(_sinkReg->ctx, sinks, LogSinkRegistry::MAX_SINKS);
    for (int i = 0; i < n; ++i) {
        sinks[i].write(sinks[i].ctx, e);
    }
}

void LogDispatcherModule::loop() {
    if (!_hub || !_sinkReg) {
        delayMs(DequeueWaitMs);
        return;
    }

    LogEntry e;
    if (_hub->dequeue(e, DequeueWaitMs)) {
        dispatch_(e);
    }
}

void LogDispatcherModule::onStop() {
    flush();
}

void LogDispatcherModule::flush() {
    if (!_hub || !_sinkReg) return;

    LogEntry e;
    while (_hub->dequeue(e, 0)) {
        dispatch_(e);
    }
}
