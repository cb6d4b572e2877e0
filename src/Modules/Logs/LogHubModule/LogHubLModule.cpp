/**
 * @file LogHubLModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"
#include <stdio.h>
#include <strings.h>

static bool parseLevel(const char* s, LogLevel& out) {
    if (!s) return false;
    if (strcasecmp(s, "debug") == 0) { out = LogLevel::Debug; return true; }
    if (strcasecmp(s, "info") == 0)  { out = LogLevel::Info;  return true; }
    if (strcasecmp(s, "warn") == 0 || strcasecmp(s, "warning") == 0) { out = LogLevel::Warn; return true; }
    if (strcasecmp(s, "error") == 0) { out = LogLevel::Error; return true; }
    return false;
}

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(levelVar);

    /// expose loghub service
    hubSvc.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc.ctx = &hub;

    /// expose sink registry service
    sinksSvc.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc.snapshot = [](void* ctx, LogSinkService* out, int max) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->snapshot(out, max);
    };
    sinksSvc.ctx = &sinks;

    if (!services.add("loghub", &hubSvc) || !services.add("logsinks", &sinksSvc)) {
        fprintf(stderr, "loghub: service registration failed\n");
        return;
    }

    Log::setHub(&hubSvc);
}

bool LogHubModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    LogLevel lvl = LogLevel::Info;
    if (!parseLevel(levelName, lvl)) {
        Log::warn("LogHub", "unknown log level '%s', using info", levelName);
        lvl = LogLevel::Info;
    }
    Log::setMinLevel(lvl);
    return true;
}
